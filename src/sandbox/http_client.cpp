#include "mnemobox/sandbox/http_client.hpp"

#include "mnemobox/common/fs.hpp"

#include <curl/curl.h>

#include <cctype>

namespace mnemobox::sandbox {

namespace {

struct BodySink {
  std::string *output = nullptr;
  std::size_t limit = 0;
  bool truncated = false;
};

size_t write_callback(char *ptr, size_t size, size_t nmemb, void *userdata) {
  const auto total = size * nmemb;
  auto *sink = static_cast<BodySink *>(userdata);
  const std::size_t remaining =
      sink->limit > sink->output->size() ? sink->limit - sink->output->size() : 0;
  if (total > remaining) {
    sink->output->append(ptr, remaining);
    sink->truncated = true;
    // Returning a short count aborts the transfer.
    return remaining;
  }
  sink->output->append(ptr, total);
  return total;
}

size_t header_callback(char *buffer, size_t size, size_t nitems, void *userdata) {
  const auto total = size * nitems;
  std::string header(buffer, total);
  auto *headers = static_cast<std::unordered_map<std::string, std::string> *>(userdata);

  const auto separator = header.find(':');
  if (separator != std::string::npos) {
    const std::string key = common::to_lower(common::trim(header.substr(0, separator)));
    const std::string value = common::trim(header.substr(separator + 1));
    (*headers)[key] = value;
  }

  return total;
}

} // namespace

CurlHttpClient::CurlHttpClient() { curl_global_init(CURL_GLOBAL_DEFAULT); }

CurlHttpClient::~CurlHttpClient() { curl_global_cleanup(); }

HttpResponse CurlHttpClient::send(const HttpRequest &request) {
  HttpResponse response;

  CURL *curl = curl_easy_init();
  if (curl == nullptr) {
    response.network_error = true;
    response.network_error_message = "curl_easy_init failed";
    return response;
  }

  BodySink sink{.output = &response.body, .limit = request.max_response_bytes};

  curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout_ms));
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 0L);
  curl_easy_setopt(curl, CURLOPT_PROTOCOLS_STR, "http,https");
  curl_easy_setopt(curl, CURLOPT_PROXY, "");
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &sink);
  curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
  curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);
  curl_easy_setopt(curl, CURLOPT_USERAGENT, "mnemobox/0.1");

  const std::string method = common::to_lower(request.method);
  if (method == "head") {
    curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
  } else if (method != "get") {
    std::string upper = request.method;
    for (auto &ch : upper) {
      ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
    }
    curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, upper.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
  }

  struct curl_slist *resolve_list = nullptr;
  for (const auto &pin : request.resolve_pins) {
    resolve_list = curl_slist_append(resolve_list, pin.c_str());
  }
  if (resolve_list != nullptr) {
    curl_easy_setopt(curl, CURLOPT_RESOLVE, resolve_list);
  }

  const CURLcode code = curl_easy_perform(curl);
  response.truncated = sink.truncated;
  if (code != CURLE_OK && !(code == CURLE_WRITE_ERROR && sink.truncated)) {
    response.timeout = code == CURLE_OPERATION_TIMEDOUT;
    response.network_error = true;
    response.network_error_message = curl_easy_strerror(code);
  } else {
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    response.status = static_cast<std::uint16_t>(status);
  }

  if (resolve_list != nullptr) {
    curl_slist_free_all(resolve_list);
  }
  curl_easy_cleanup(curl);
  return response;
}

} // namespace mnemobox::sandbox
