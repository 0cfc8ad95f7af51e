#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace mnemobox::sandbox {

struct HttpRequest {
  std::string method = "GET";
  std::string url;
  std::string body;
  /// `host:port:address` entries handed to the resolver cache so the
  /// connection goes to the addresses that were vetted.
  std::vector<std::string> resolve_pins;
  std::uint64_t timeout_ms = 10000;
  std::size_t max_response_bytes = 1024 * 1024;
};

struct HttpResponse {
  std::uint16_t status = 0;
  std::string body;
  std::unordered_map<std::string, std::string> headers;
  bool truncated = false;
  bool timeout = false;
  bool network_error = false;
  std::string network_error_message;
};

class HttpClient {
public:
  virtual ~HttpClient() = default;
  [[nodiscard]] virtual HttpResponse send(const HttpRequest &request) = 0;
};

/// libcurl client. Redirects are never followed and proxies from the
/// environment are ignored: every hop must go through the gatekeeper.
class CurlHttpClient final : public HttpClient {
public:
  CurlHttpClient();
  ~CurlHttpClient() override;

  CurlHttpClient(const CurlHttpClient &) = delete;
  CurlHttpClient &operator=(const CurlHttpClient &) = delete;

  [[nodiscard]] HttpResponse send(const HttpRequest &request) override;
};

} // namespace mnemobox::sandbox
