#include "mnemobox/observability/log_observer.hpp"

#include <type_traits>

namespace mnemobox::observability {

namespace {

const char *level_tag(const LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "DEBUG";
  case LogLevel::Info:
    return "INFO";
  case LogLevel::Warn:
    return "WARN";
  case LogLevel::Error:
    return "ERROR";
  }
  return "INFO";
}

} // namespace

void LogObserver::write(const LogLevel level, const std::string &message) {
  if (level < min_level_) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  std::ostream &out = out_ != nullptr ? *out_ : std::cerr;
  out << "[" << level_tag(level) << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, ExecutionStartedEvent>) {
          write(LogLevel::Info, "execution.start id=" + evt.execution_id + " task=" + evt.task +
                                    " code_sha256=" + evt.code_sha256);
        } else if constexpr (std::is_same_v<T, SlotRequestedEvent>) {
          write(LogLevel::Debug, "slot.request id=" + evt.execution_id);
        } else if constexpr (std::is_same_v<T, SlotAcquiredEvent>) {
          write(evt.acquired ? LogLevel::Debug : LogLevel::Warn,
                "slot." + std::string(evt.acquired ? "acquired" : "timeout") +
                    " id=" + evt.execution_id + " wait_ms=" + std::to_string(evt.wait.count()));
        } else if constexpr (std::is_same_v<T, ExecutionFinishedEvent>) {
          std::string line = "execution.end id=" + evt.execution_id +
                             " outcome=" + sandbox::outcome_kind_to_string(evt.kind) +
                             " duration_ms=" + std::to_string(evt.duration.count());
          if (evt.violation.has_value()) {
            line += " violation=" + sandbox::violation_type_to_string(*evt.violation);
          }
          write(evt.kind == sandbox::OutcomeKind::SecurityViolation ? LogLevel::Warn
                                                                    : LogLevel::Info,
                line);
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          write(LogLevel::Error, evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, ExecutionLatencyMetric>) {
          write(LogLevel::Debug, "metric.execution_latency_ms=" + std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<T, ConcurrencyMetric>) {
          write(LogLevel::Debug, "metric.concurrency active=" + std::to_string(m.active) +
                                     " awaiting=" + std::to_string(m.awaiting));
        }
      },
      metric);
}

void LogObserver::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  (out_ != nullptr ? *out_ : std::cerr).flush();
}

} // namespace mnemobox::observability
