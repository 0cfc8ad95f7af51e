#include "mnemobox/sandbox/coordinator.hpp"

#include "mnemobox/common/crypto.hpp"
#include "mnemobox/observability/global.hpp"

#include <iostream>
#include <stdexcept>

namespace mnemobox::sandbox {

namespace {

using Clock = std::chrono::steady_clock;

constexpr std::size_t kExecutionIdBytes = 8;
constexpr const char *kHostFailurePrefix = "sandbox host failure: ";

std::chrono::milliseconds since(const Clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
}

std::optional<ViolationType> violation_of(const ExecutionResult &result) {
  if (const auto *violation = std::get_if<SecurityViolation>(&result)) {
    return violation->violation_type;
  }
  return std::nullopt;
}

} // namespace

std::string coordinator_state_to_string(const CoordinatorState state) {
  switch (state) {
  case CoordinatorState::Idle:
    return "idle";
  case CoordinatorState::Validating:
    return "validating";
  case CoordinatorState::AwaitingSlot:
    return "awaiting_slot";
  case CoordinatorState::Executing:
    return "executing";
  case CoordinatorState::Completed:
    return "completed";
  case CoordinatorState::TimedOut:
    return "timed_out";
  case CoordinatorState::Violated:
    return "violated";
  }
  return "unknown";
}

bool is_valid_transition(const CoordinatorState from, const CoordinatorState to) {
  switch (from) {
  case CoordinatorState::Idle:
    return to == CoordinatorState::Validating;
  case CoordinatorState::Validating:
    return to == CoordinatorState::AwaitingSlot || to == CoordinatorState::Violated;
  case CoordinatorState::AwaitingSlot:
    return to == CoordinatorState::Executing || to == CoordinatorState::TimedOut;
  case CoordinatorState::Executing:
    return to == CoordinatorState::Completed || to == CoordinatorState::TimedOut ||
           to == CoordinatorState::Violated;
  case CoordinatorState::Completed:
  case CoordinatorState::TimedOut:
  case CoordinatorState::Violated:
    return false;
  }
  return false;
}

bool ExecutionStateMachine::terminal() const {
  const auto current = state();
  return current == CoordinatorState::Completed || current == CoordinatorState::TimedOut ||
         current == CoordinatorState::Violated;
}

void ExecutionStateMachine::advance(const CoordinatorState next) {
  if (!is_valid_transition(state(), next)) {
    throw std::logic_error("invalid coordinator transition " + coordinator_state_to_string(state()) +
                           " -> " + coordinator_state_to_string(next));
  }
  history_.push_back(next);
}

SandboxCoordinator::SandboxCoordinator(CoordinatorOptions options,
                                       std::shared_ptr<IProcessIsolator> isolator)
    : options_(std::move(options)), isolator_(std::move(isolator)),
      slots_(options_.max_concurrency) {
  if (!isolator_) {
    isolator_ = std::make_shared<NodeProcessIsolator>();
  }
}

void SandboxCoordinator::emit(const observability::ObserverEvent &event) const {
  try {
    if (options_.observer) {
      options_.observer->record_event(event);
    } else {
      observability::record_event(event);
    }
  } catch (const std::exception &e) {
    std::cerr << "[WARN] observer failed to record event: " << e.what() << "\n";
  }
}

void SandboxCoordinator::emit(const observability::ObserverMetric &metric) const {
  try {
    if (options_.observer) {
      options_.observer->record_metric(metric);
    } else {
      observability::record_metric(metric);
    }
  } catch (const std::exception &e) {
    std::cerr << "[WARN] observer failed to record metric: " << e.what() << "\n";
  }
}

ExecutionResult SandboxCoordinator::host_failure(const std::string &execution_id,
                                                 const std::string &message) const {
  emit(observability::ErrorEvent{.component = "sandbox",
                                 .message = "execution " + execution_id + ": " + message});
  return Error{.message = kHostFailurePrefix + message,
               .error_type = ErrorType::Runtime,
               .captured_stdout = {},
               .captured_stderr = {}};
}

ExecutionResult SandboxCoordinator::execute(const std::string &code,
                                            const ExecutionContext &context) {
  return execute_traced(code, context, options_.default_policy).result;
}

ExecutionResult SandboxCoordinator::execute(const std::string &code,
                                            const ExecutionContext &context,
                                            const PolicyConfig &policy) {
  return execute_traced(code, context, policy).result;
}

std::future<ExecutionResult> SandboxCoordinator::execute_async(std::string code,
                                                               ExecutionContext context,
                                                               std::optional<PolicyConfig> policy) {
  return std::async(std::launch::async,
                    [this, code = std::move(code), context = std::move(context),
                     policy = std::move(policy)]() {
                      return execute_traced(code, context,
                                            policy.value_or(options_.default_policy))
                          .result;
                    });
}

TracedExecution SandboxCoordinator::execute_traced(const std::string &code,
                                                   const ExecutionContext &context,
                                                   const PolicyConfig &policy) {
  const auto started = Clock::now();
  TracedExecution traced{.result = Timeout{},
                         .execution_id = common::random_hex(kExecutionIdBytes),
                         .states = {}};
  ExecutionStateMachine machine;
  bool held_slot = false;
  bool host_failed = false;

  const auto finish = [&](ExecutionResult result) {
    traced.result = std::move(result);
    traced.states = machine.history();
    emit(observability::ExecutionFinishedEvent{.execution_id = traced.execution_id,
                                               .kind = outcome_kind(traced.result),
                                               .violation = violation_of(traced.result),
                                               .duration = since(started),
                                               .held_slot = held_slot,
                                               .host_failure = host_failed});
    return std::move(traced);
  };

  try {
    machine.advance(CoordinatorState::Validating);
    emit(observability::ExecutionStartedEvent{.execution_id = traced.execution_id,
                                              .task = context.task,
                                              .code_sha256 = common::sha256_hex(code)});
    if (auto violation = validator_.validate(code); violation.has_value()) {
      machine.advance(CoordinatorState::Violated);
      return finish(SecurityViolation{.reason = std::move(violation->reason),
                                      .violation_type = violation->type});
    }

    machine.advance(CoordinatorState::AwaitingSlot);
    emit(observability::SlotRequestedEvent{.execution_id = traced.execution_id});
    const auto wait_started = Clock::now();
    SlotLease lease = slots_.acquire(options_.slot_timeout);
    const auto waited = since(wait_started);
    emit(observability::SlotAcquiredEvent{
        .execution_id = traced.execution_id, .wait = waited, .acquired = lease.held()});
    if (!lease.held()) {
      machine.advance(CoordinatorState::TimedOut);
      return finish(Timeout{.elapsed = waited, .partial_output = std::nullopt});
    }

    held_slot = true;
    machine.advance(CoordinatorState::Executing);
    emit(observability::ConcurrencyMetric{.active = slots_.active(), .awaiting = slots_.waiting()});

    const auto executing_started = Clock::now();
    ExecutionResult result = run_isolated(traced.execution_id, code, context, policy, machine);
    host_failed = std::holds_alternative<Error>(result) &&
                  std::get<Error>(result).message.rfind(kHostFailurePrefix, 0) == 0;
    emit(observability::ExecutionLatencyMetric{.latency = since(executing_started)});
    // The lease goes back only after the finished event, so observers never
    // see more holders than there are slots.
    return finish(std::move(result));
  } catch (const std::exception &e) {
    host_failed = true;
    return finish(host_failure(traced.execution_id, e.what()));
  }
}

ExecutionResult SandboxCoordinator::run_isolated(const std::string &execution_id,
                                                 const std::string &code,
                                                 const ExecutionContext &context,
                                                 const PolicyConfig &policy,
                                                 ExecutionStateMachine &machine) {
  const auto deadline = Clock::now() + policy.limits().max_execution_time;
  RawOutcome raw;
  try {
    raw = isolator_->run(code, context, policy, deadline);
  } catch (const std::exception &e) {
    machine.advance(CoordinatorState::Completed);
    return host_failure(execution_id, std::string("isolator raised: ") + e.what());
  }

  switch (raw.kind) {
  case RawOutcome::Kind::Completed:
    machine.advance(CoordinatorState::Completed);
    return Success{.output = std::move(raw.output),
                   .captured_stdout = std::move(raw.captured_stdout),
                   .captured_stderr = std::move(raw.captured_stderr),
                   .execution_time = raw.elapsed};
  case RawOutcome::Kind::Failed:
    machine.advance(CoordinatorState::Completed);
    return Error{.message = std::move(raw.message),
                 .error_type = raw.error_type,
                 .captured_stdout = std::move(raw.captured_stdout),
                 .captured_stderr = std::move(raw.captured_stderr)};
  case RawOutcome::Kind::TimedOut:
    machine.advance(CoordinatorState::TimedOut);
    return Timeout{.elapsed = raw.elapsed,
                   .partial_output = raw.captured_stdout.empty()
                                         ? std::nullopt
                                         : std::optional<std::string>(std::move(raw.captured_stdout))};
  case RawOutcome::Kind::Violated: {
    machine.advance(CoordinatorState::Violated);
    const Violation violation = raw.violation.value_or(
        Violation{.type = ViolationType::ResourceExhaustion, .reason = raw.message});
    return SecurityViolation{.reason = violation.reason, .violation_type = violation.type};
  }
  case RawOutcome::Kind::LaunchFailed:
    machine.advance(CoordinatorState::Completed);
    return host_failure(execution_id, raw.message);
  }

  machine.advance(CoordinatorState::Completed);
  return host_failure(execution_id, "isolator returned an unknown outcome");
}

} // namespace mnemobox::sandbox
