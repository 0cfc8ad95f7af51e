#pragma once

#include "mnemobox/common/result.hpp"
#include "mnemobox/sandbox/filesystem_gatekeeper.hpp"
#include "mnemobox/sandbox/http_client.hpp"
#include "mnemobox/sandbox/network_gatekeeper.hpp"
#include "mnemobox/sandbox/policy.hpp"
#include "mnemobox/sandbox/types.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace mnemobox::sandbox {

/// Read-only memory lookup the embedding application may expose to snippets.
/// Receives the query text and returns JSON text.
using MemoryQueryHandler = std::function<common::Result<std::string>(const std::string &query)>;

/// Final message the runtime sends once the snippet settles.
struct RuntimeReport {
  bool ok = false;
  std::string output;
  ErrorType error_type = ErrorType::Runtime;
  std::string message;
  std::string stack;
};

/// Exactly one member is set.
struct BrokerStep {
  std::optional<std::string> reply;
  std::optional<Violation> violation;
  std::optional<RuntimeReport> report;
};

/// Host half of the runtime. Every file, network and memory access the
/// snippet makes arrives here as one JSON line and is checked against the
/// gatekeepers before the host performs it. One broker per execution.
class CapabilityBroker {
public:
  CapabilityBroker(const PolicyConfig &policy, std::shared_ptr<HttpClient> http_client,
                   MemoryQueryHandler memory_query, HostResolver resolver = nullptr);

  [[nodiscard]] BrokerStep handle(const std::string &line, std::chrono::milliseconds time_left);

  [[nodiscard]] std::uint32_t requests_made() const { return network_.requests_made(); }

private:
  [[nodiscard]] BrokerStep read_file(const std::string &path);
  [[nodiscard]] BrokerStep write_file(const std::string &path, const std::string &data);
  [[nodiscard]] BrokerStep delete_file(const std::string &path);
  [[nodiscard]] BrokerStep http_request(const std::string &url, const std::string &method,
                                        const std::string &body,
                                        std::chrono::milliseconds time_left);
  [[nodiscard]] BrokerStep query_memory(const std::string &query);

  FilesystemGatekeeper filesystem_;
  NetworkGatekeeper network_;
  std::shared_ptr<HttpClient> http_client_;
  MemoryQueryHandler memory_query_;
};

[[nodiscard]] std::string broker_reply_error(const std::string &message);

} // namespace mnemobox::sandbox
