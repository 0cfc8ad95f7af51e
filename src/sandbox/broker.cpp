#include "mnemobox/sandbox/broker.hpp"

#include "mnemobox/common/fs.hpp"
#include "mnemobox/common/json_util.hpp"

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <vector>

namespace mnemobox::sandbox {

namespace {

constexpr std::size_t kMaxFileBytes = 1024 * 1024;

BrokerStep reply(std::string line) {
  return BrokerStep{.reply = std::move(line), .violation = std::nullopt, .report = std::nullopt};
}

BrokerStep deny(const ViolationType type, std::string reason) {
  return BrokerStep{.reply = std::nullopt,
                    .violation = Violation{.type = type, .reason = std::move(reason)},
                    .report = std::nullopt};
}

std::string reply_ok() { return R"({"ok":true})"; }

std::string reply_value(const std::string &value) {
  return "{\"ok\":true,\"value\":" + common::json_quote(value) + "}";
}

bool method_supported(const std::string &method) {
  static const std::vector<std::string> kMethods = {"get",   "head",   "post",
                                                    "put",   "patch",  "delete"};
  return std::find(kMethods.begin(), kMethods.end(), common::to_lower(method)) != kMethods.end();
}

std::string resolve_pin(const NetworkTarget &target, const std::string &address) {
  const bool v6 = address.find(':') != std::string::npos;
  return target.url.host + ":" + std::to_string(target.url.port) + ":" +
         (v6 ? "[" + address + "]" : address);
}

} // namespace

std::string broker_reply_error(const std::string &message) {
  return "{\"ok\":false,\"error\":" + common::json_quote(message) + "}";
}

CapabilityBroker::CapabilityBroker(const PolicyConfig &policy,
                                   std::shared_ptr<HttpClient> http_client,
                                   MemoryQueryHandler memory_query, HostResolver resolver)
    : filesystem_(policy.filesystem()), network_(policy.network(), std::move(resolver)),
      http_client_(std::move(http_client)), memory_query_(std::move(memory_query)) {}

BrokerStep CapabilityBroker::handle(const std::string &line,
                                    const std::chrono::milliseconds time_left) {
  const std::string trimmed = common::trim(line);
  if (trimmed.empty() || trimmed.front() != '{' || trimmed.back() != '}') {
    return deny(ViolationType::CodeInjection, "Malformed runtime request");
  }

  const auto message = common::json_parse_flat(trimmed);
  const auto field = [&message](const std::string &key) {
    const auto it = message.find(key);
    return it == message.end() ? std::string() : it->second;
  };

  const std::string op = field("op");
  if (op == "fs.read") {
    return read_file(field("path"));
  }
  if (op == "fs.write") {
    return write_file(field("path"), field("data"));
  }
  if (op == "fs.delete") {
    return delete_file(field("path"));
  }
  if (op == "net.request") {
    return http_request(field("url"), field("method"), field("body"), time_left);
  }
  if (op == "memory.query") {
    return query_memory(field("query"));
  }
  if (op == "result") {
    RuntimeReport report;
    report.ok = field("status") == "ok";
    report.output = field("output");
    report.error_type = field("kind") == "syntax" ? ErrorType::Syntax : ErrorType::Runtime;
    report.message = field("message");
    report.stack = field("stack");
    return BrokerStep{.reply = std::nullopt, .violation = std::nullopt, .report = std::move(report)};
  }
  return deny(ViolationType::CodeInjection, "Unknown runtime request: " + op);
}

BrokerStep CapabilityBroker::read_file(const std::string &path) {
  const auto checked = filesystem_.check(path, AccessIntent::Read);
  if (!checked.ok()) {
    return deny(ViolationType::FilesystemAccess, "Filesystem read denied: " + checked.error());
  }

  std::error_code ec;
  const auto &target = checked.value();
  if (!std::filesystem::is_regular_file(target, ec)) {
    return reply(broker_reply_error("Not a readable file: " + path));
  }
  const auto size = std::filesystem::file_size(target, ec);
  if (ec || size > kMaxFileBytes) {
    return reply(broker_reply_error("File is too large to read: " + path));
  }
  const auto content = common::read_file(target);
  if (!content.ok()) {
    return reply(broker_reply_error(content.error()));
  }
  return reply(reply_value(content.value()));
}

BrokerStep CapabilityBroker::write_file(const std::string &path, const std::string &data) {
  std::error_code ec;
  const auto probe = filesystem_.check(path, AccessIntent::Read);
  const bool exists = probe.ok() && std::filesystem::exists(probe.value(), ec);
  const auto intent = exists ? AccessIntent::Write : AccessIntent::Create;

  const auto checked = filesystem_.check(path, intent);
  if (!checked.ok()) {
    return deny(ViolationType::FilesystemAccess, "Filesystem write denied: " + checked.error());
  }
  if (data.size() > kMaxFileBytes) {
    return reply(broker_reply_error("Write exceeds the maximum file size"));
  }
  if (const auto status = common::write_file(checked.value(), data); !status.ok()) {
    return reply(broker_reply_error(status.error()));
  }
  return reply(reply_ok());
}

BrokerStep CapabilityBroker::delete_file(const std::string &path) {
  const auto checked = filesystem_.check(path, AccessIntent::Delete);
  if (!checked.ok()) {
    return deny(ViolationType::FilesystemAccess, "Filesystem delete denied: " + checked.error());
  }
  std::error_code ec;
  if (std::filesystem::is_directory(checked.value(), ec)) {
    return reply(broker_reply_error("Refusing to delete a directory: " + path));
  }
  if (!std::filesystem::remove(checked.value(), ec)) {
    return reply(broker_reply_error(ec ? ec.message() : "No such file: " + path));
  }
  return reply(reply_ok());
}

BrokerStep CapabilityBroker::http_request(const std::string &url, const std::string &method,
                                          const std::string &body,
                                          const std::chrono::milliseconds time_left) {
  const auto checked = network_.check(url);
  if (!checked.ok()) {
    return deny(ViolationType::NetworkAccess, "Network request denied: " + checked.error());
  }
  const std::string verb = method.empty() ? "GET" : method;
  if (!method_supported(verb)) {
    return reply(broker_reply_error("Unsupported HTTP method: " + verb));
  }
  if (http_client_ == nullptr) {
    return reply(broker_reply_error("HTTP client unavailable"));
  }

  const auto &target = checked.value();
  HttpRequest request;
  request.method = verb;
  request.url = target.normalized_url;
  request.body = body;
  request.timeout_ms = static_cast<std::uint64_t>(std::max<std::int64_t>(time_left.count(), 1));
  for (const auto &address : target.resolved_addresses) {
    request.resolve_pins.push_back(resolve_pin(target, address));
  }

  const auto response = http_client_->send(request);
  if (response.network_error) {
    return reply(broker_reply_error("Request failed: " + response.network_error_message));
  }
  return reply("{\"ok\":true,\"status\":" + std::to_string(response.status) +
               ",\"value\":" + common::json_quote(response.body) + "}");
}

BrokerStep CapabilityBroker::query_memory(const std::string &query) {
  if (!memory_query_) {
    return reply(broker_reply_error("Memory query capability is not available"));
  }
  const auto result = memory_query_(query);
  if (!result.ok()) {
    return reply(broker_reply_error(result.error()));
  }
  return reply(reply_value(result.value()));
}

} // namespace mnemobox::sandbox
