#include "mnemobox/sandbox/types.hpp"

#include "mnemobox/common/json_util.hpp"

#include <sstream>
#include <type_traits>

namespace mnemobox::sandbox {

OutcomeKind outcome_kind(const ExecutionResult &result) {
  return std::visit(
      [](auto &&value) {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, Success>) {
          return OutcomeKind::Success;
        } else if constexpr (std::is_same_v<T, Error>) {
          return OutcomeKind::Error;
        } else if constexpr (std::is_same_v<T, Timeout>) {
          return OutcomeKind::Timeout;
        } else {
          static_assert(std::is_same_v<T, SecurityViolation>);
          return OutcomeKind::SecurityViolation;
        }
      },
      result);
}

std::string outcome_kind_to_string(const OutcomeKind kind) {
  switch (kind) {
  case OutcomeKind::Success:
    return "success";
  case OutcomeKind::Error:
    return "error";
  case OutcomeKind::Timeout:
    return "timeout";
  case OutcomeKind::SecurityViolation:
    return "security_violation";
  }
  return "error";
}

std::string violation_type_to_string(const ViolationType type) {
  switch (type) {
  case ViolationType::FilesystemAccess:
    return "filesystem_access";
  case ViolationType::NetworkAccess:
    return "network_access";
  case ViolationType::ProcessSpawn:
    return "process_spawn";
  case ViolationType::CodeInjection:
    return "code_injection";
  case ViolationType::ResourceExhaustion:
    return "resource_exhaustion";
  }
  return "code_injection";
}

std::string error_type_to_string(const ErrorType type) {
  return type == ErrorType::Syntax ? "syntax" : "runtime";
}

std::string to_json(const ExecutionResult &result) {
  std::ostringstream out;
  out << "{\"kind\":" << common::json_quote(outcome_kind_to_string(outcome_kind(result)));
  std::visit(
      [&out](auto &&value) {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, Success>) {
          out << ",\"output\":" << common::json_quote(value.output)
              << ",\"stdout\":" << common::json_quote(value.captured_stdout)
              << ",\"stderr\":" << common::json_quote(value.captured_stderr)
              << ",\"execution_time_ms\":" << value.execution_time.count();
        } else if constexpr (std::is_same_v<T, Error>) {
          out << ",\"message\":" << common::json_quote(value.message)
              << ",\"error_type\":" << common::json_quote(error_type_to_string(value.error_type))
              << ",\"stdout\":" << common::json_quote(value.captured_stdout)
              << ",\"stderr\":" << common::json_quote(value.captured_stderr);
        } else if constexpr (std::is_same_v<T, Timeout>) {
          out << ",\"elapsed_ms\":" << value.elapsed.count() << ",\"partial_output\":"
              << (value.partial_output.has_value() ? common::json_quote(*value.partial_output)
                                                   : std::string("null"));
        } else if constexpr (std::is_same_v<T, SecurityViolation>) {
          out << ",\"reason\":" << common::json_quote(value.reason) << ",\"violation_type\":"
              << common::json_quote(violation_type_to_string(value.violation_type));
        }
      },
      result);
  out << '}';
  return out.str();
}

} // namespace mnemobox::sandbox
