#include "mnemobox/observability/metrics_monitor.hpp"

#include "mnemobox/common/json_util.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <type_traits>

namespace mnemobox::observability {

namespace {

std::size_t kind_index(const sandbox::OutcomeKind kind) { return static_cast<std::size_t>(kind); }

void raise_peak(std::atomic<std::uint64_t> &peak, const std::uint64_t value) {
  std::uint64_t current = peak.load();
  while (value > current && !peak.compare_exchange_weak(current, value)) {
  }
}

void decrement_floor(std::atomic<std::uint64_t> &counter) {
  std::uint64_t current = counter.load();
  while (current > 0 && !counter.compare_exchange_weak(current, current - 1)) {
  }
}

} // namespace

void MetricsMonitor::count(const sandbox::OutcomeKind kind,
                           const std::chrono::milliseconds duration) {
  total_.fetch_add(1);
  by_kind_[kind_index(kind)].fetch_add(1);
  total_duration_ms_.fetch_add(static_cast<std::uint64_t>(std::max<long long>(0, duration.count())));
}

void MetricsMonitor::record(const sandbox::ExecutionResult &result) {
  std::chrono::milliseconds duration{0};
  if (const auto *success = std::get_if<sandbox::Success>(&result)) {
    duration = success->execution_time;
  } else if (const auto *timeout = std::get_if<sandbox::Timeout>(&result)) {
    duration = timeout->elapsed;
  }
  count(sandbox::outcome_kind(result), duration);
}

void MetricsMonitor::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, SlotRequestedEvent>) {
          awaiting_.fetch_add(1);
        } else if constexpr (std::is_same_v<T, SlotAcquiredEvent>) {
          decrement_floor(awaiting_);
          if (evt.acquired) {
            raise_peak(peak_, active_.fetch_add(1) + 1);
          }
        } else if constexpr (std::is_same_v<T, ExecutionFinishedEvent>) {
          if (evt.held_slot) {
            decrement_floor(active_);
          }
          if (evt.host_failure) {
            host_failures_.fetch_add(1);
          }
          count(evt.kind, evt.duration);
        }
      },
      event);
}

MetricsSnapshot MetricsMonitor::snapshot() const {
  MetricsSnapshot snapshot;
  snapshot.total = total_.load();
  for (const auto kind : {sandbox::OutcomeKind::Success, sandbox::OutcomeKind::Error,
                          sandbox::OutcomeKind::Timeout, sandbox::OutcomeKind::SecurityViolation}) {
    snapshot.by_outcome_kind[kind] = by_kind_[kind_index(kind)].load();
  }
  snapshot.current_concurrency = active_.load();
  snapshot.awaiting_slot = awaiting_.load();
  snapshot.peak_concurrency = peak_.load();
  snapshot.host_failures = host_failures_.load();
  if (snapshot.total > 0) {
    snapshot.average_execution_time =
        std::chrono::milliseconds(total_duration_ms_.load() / snapshot.total);
    snapshot.success_rate =
        static_cast<double>(snapshot.by_outcome_kind[sandbox::OutcomeKind::Success]) /
        static_cast<double>(snapshot.total);
  }
  return snapshot;
}

std::string MetricsSnapshot::to_json() const {
  std::ostringstream out;
  out << "{\"total\":" << total << ",\"by_outcome_kind\":{";
  bool first = true;
  for (const auto &[kind, count] : by_outcome_kind) {
    if (!first) {
      out << ",";
    }
    first = false;
    out << common::json_quote(sandbox::outcome_kind_to_string(kind)) << ":" << count;
  }
  out << "},\"current_concurrency\":" << current_concurrency
      << ",\"awaiting_slot\":" << awaiting_slot << ",\"peak_concurrency\":" << peak_concurrency
      << ",\"host_failures\":" << host_failures
      << ",\"average_execution_ms\":" << average_execution_time.count()
      << ",\"success_rate\":" << std::fixed << std::setprecision(4) << success_rate << "}";
  return out.str();
}

} // namespace mnemobox::observability
