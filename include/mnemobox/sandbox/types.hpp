#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <variant>

namespace mnemobox::sandbox {

enum class ViolationType {
  FilesystemAccess,
  NetworkAccess,
  ProcessSpawn,
  CodeInjection,
  ResourceExhaustion,
};

enum class ErrorType { Syntax, Runtime };

struct Violation {
  ViolationType type = ViolationType::CodeInjection;
  std::string reason;
};

/// Caller-supplied input. `input` holds JSON text and is parsed inside the
/// runtime, so malformed input fails the execution rather than the host.
struct ExecutionContext {
  std::string task;
  std::string input = "null";
  std::map<std::string, std::string> metadata;
};

struct Success {
  std::string output;
  std::string captured_stdout;
  std::string captured_stderr;
  std::chrono::milliseconds execution_time{0};
};

struct Error {
  std::string message;
  ErrorType error_type = ErrorType::Runtime;
  std::string captured_stdout;
  std::string captured_stderr;
};

struct Timeout {
  std::chrono::milliseconds elapsed{0};
  std::optional<std::string> partial_output;
};

struct SecurityViolation {
  std::string reason;
  ViolationType violation_type = ViolationType::CodeInjection;
};

using ExecutionResult = std::variant<Success, Error, Timeout, SecurityViolation>;

enum class OutcomeKind { Success, Error, Timeout, SecurityViolation };

[[nodiscard]] OutcomeKind outcome_kind(const ExecutionResult &result);
[[nodiscard]] std::string outcome_kind_to_string(OutcomeKind kind);
[[nodiscard]] std::string violation_type_to_string(ViolationType type);
[[nodiscard]] std::string error_type_to_string(ErrorType type);

[[nodiscard]] std::string to_json(const ExecutionResult &result);

} // namespace mnemobox::sandbox
