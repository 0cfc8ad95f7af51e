#pragma once

#include "mnemobox/sandbox/broker.hpp"
#include "mnemobox/sandbox/http_client.hpp"
#include "mnemobox/sandbox/network_gatekeeper.hpp"
#include "mnemobox/sandbox/policy.hpp"
#include "mnemobox/sandbox/types.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace mnemobox::sandbox {

struct RawOutcome {
  enum class Kind { Completed, Failed, TimedOut, Violated, LaunchFailed };

  Kind kind = Kind::LaunchFailed;
  std::string output;
  std::string message;
  ErrorType error_type = ErrorType::Runtime;
  std::optional<Violation> violation;
  std::string captured_stdout;
  std::string captured_stderr;
  std::chrono::milliseconds elapsed{0};
};

class IProcessIsolator {
public:
  virtual ~IProcessIsolator() = default;

  /// Runs one attempt and returns only after the child has been reaped.
  [[nodiscard]] virtual RawOutcome run(const std::string &code, const ExecutionContext &context,
                                       const PolicyConfig &policy,
                                       std::chrono::steady_clock::time_point deadline) = 0;
};

struct IsolatorOptions {
  std::string runtime_path = "node";
  std::shared_ptr<HttpClient> http_client;
  MemoryQueryHandler memory_query;
  HostResolver resolver;
  std::size_t max_output_bytes = 1024 * 1024;
  /// Added to the memory limit for the address-space ceiling; the runtime
  /// reserves code and heap ranges up front.
  std::uint64_t address_space_overhead_bytes = 1024ULL * 1024ULL * 1024ULL;
};

class NodeProcessIsolator final : public IProcessIsolator {
public:
  explicit NodeProcessIsolator(IsolatorOptions options = {});

  [[nodiscard]] RawOutcome run(const std::string &code, const ExecutionContext &context,
                               const PolicyConfig &policy,
                               std::chrono::steady_clock::time_point deadline) override;

  [[nodiscard]] const IsolatorOptions &options() const { return options_; }

private:
  IsolatorOptions options_;
};

/// True when the configured runtime binary can be found and executed.
[[nodiscard]] bool runtime_available(const std::string &runtime_path = "node");

/// Niceness applied to the child for a CPU share in percent.
[[nodiscard]] int niceness_for_cpu_percent(std::uint32_t percent);

} // namespace mnemobox::sandbox
