#pragma once

#include "mnemobox/sandbox/types.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace mnemobox::observability {

struct ExecutionStartedEvent {
  std::string execution_id;
  std::string task;
  std::string code_sha256;
};

struct SlotRequestedEvent {
  std::string execution_id;
};

/// `acquired` is false when the slot wait timed out.
struct SlotAcquiredEvent {
  std::string execution_id;
  std::chrono::milliseconds wait{0};
  bool acquired = true;
};

struct ExecutionFinishedEvent {
  std::string execution_id;
  sandbox::OutcomeKind kind = sandbox::OutcomeKind::Success;
  std::optional<sandbox::ViolationType> violation;
  std::chrono::milliseconds duration{0};
  bool held_slot = false;
  bool host_failure = false;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<ExecutionStartedEvent, SlotRequestedEvent, SlotAcquiredEvent,
                                   ExecutionFinishedEvent, ErrorEvent>;

struct ExecutionLatencyMetric {
  std::chrono::milliseconds latency{0};
};

struct ConcurrencyMetric {
  std::uint64_t active = 0;
  std::uint64_t awaiting = 0;
};

using ObserverMetric = std::variant<ExecutionLatencyMetric, ConcurrencyMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace mnemobox::observability
