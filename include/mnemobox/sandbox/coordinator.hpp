#pragma once

#include "mnemobox/observability/observer.hpp"
#include "mnemobox/sandbox/code_validator.hpp"
#include "mnemobox/sandbox/policy.hpp"
#include "mnemobox/sandbox/process_isolator.hpp"
#include "mnemobox/sandbox/slot_pool.hpp"
#include "mnemobox/sandbox/types.hpp"

#include <chrono>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mnemobox::sandbox {

enum class CoordinatorState {
  Idle,
  Validating,
  AwaitingSlot,
  Executing,
  Completed,
  TimedOut,
  Violated,
};

[[nodiscard]] std::string coordinator_state_to_string(CoordinatorState state);
[[nodiscard]] bool is_valid_transition(CoordinatorState from, CoordinatorState to);

/// Lifecycle of a single execute() call. Terminal states accept nothing.
class ExecutionStateMachine {
public:
  [[nodiscard]] CoordinatorState state() const { return history_.back(); }
  [[nodiscard]] bool terminal() const;
  [[nodiscard]] const std::vector<CoordinatorState> &history() const { return history_; }

  /// Throws std::logic_error when the transition is not allowed.
  void advance(CoordinatorState next);

private:
  std::vector<CoordinatorState> history_{CoordinatorState::Idle};
};

struct CoordinatorOptions {
  std::size_t max_concurrency = 20;
  /// Unset: callers wait for a slot as long as it takes.
  std::optional<std::chrono::milliseconds> slot_timeout;
  PolicyConfig default_policy = PolicyConfig::standard();
  /// Unset: events go to the process-wide observer, if any.
  std::shared_ptr<observability::IObserver> observer;
};

struct TracedExecution {
  ExecutionResult result;
  std::string execution_id;
  std::vector<CoordinatorState> states;
};

/// Entry point for running untrusted snippets. Validates, waits for one of
/// `max_concurrency` slots, and hands the snippet to the isolator under the
/// call's policy. Never throws and never leaves a child running on return.
class SandboxCoordinator {
public:
  explicit SandboxCoordinator(CoordinatorOptions options = {},
                              std::shared_ptr<IProcessIsolator> isolator = nullptr);

  SandboxCoordinator(const SandboxCoordinator &) = delete;
  SandboxCoordinator &operator=(const SandboxCoordinator &) = delete;

  [[nodiscard]] ExecutionResult execute(const std::string &code, const ExecutionContext &context);
  [[nodiscard]] ExecutionResult execute(const std::string &code, const ExecutionContext &context,
                                        const PolicyConfig &policy);
  [[nodiscard]] TracedExecution execute_traced(const std::string &code,
                                               const ExecutionContext &context,
                                               const PolicyConfig &policy);

  /// Runs on its own thread. The coordinator must outlive the future.
  [[nodiscard]] std::future<ExecutionResult>
  execute_async(std::string code, ExecutionContext context,
                std::optional<PolicyConfig> policy = std::nullopt);

  [[nodiscard]] std::size_t max_concurrency() const { return slots_.capacity(); }
  [[nodiscard]] std::size_t active_executions() const { return slots_.active(); }
  [[nodiscard]] std::size_t awaiting_slot() const { return slots_.waiting(); }
  [[nodiscard]] const PolicyConfig &default_policy() const { return options_.default_policy; }

private:
  void emit(const observability::ObserverEvent &event) const;
  void emit(const observability::ObserverMetric &metric) const;
  [[nodiscard]] ExecutionResult host_failure(const std::string &execution_id,
                                             const std::string &message) const;
  [[nodiscard]] ExecutionResult run_isolated(const std::string &execution_id,
                                             const std::string &code,
                                             const ExecutionContext &context,
                                             const PolicyConfig &policy,
                                             ExecutionStateMachine &machine);

  CoordinatorOptions options_;
  std::shared_ptr<IProcessIsolator> isolator_;
  CodeValidator validator_;
  SlotPool slots_;
};

} // namespace mnemobox::sandbox
