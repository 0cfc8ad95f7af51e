#pragma once

#include "mnemobox/observability/observer.hpp"
#include "mnemobox/sandbox/types.hpp"

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <string>

namespace mnemobox::observability {

struct MetricsSnapshot {
  std::uint64_t total = 0;
  std::map<sandbox::OutcomeKind, std::uint64_t> by_outcome_kind;
  std::uint64_t current_concurrency = 0;
  std::uint64_t awaiting_slot = 0;
  std::uint64_t peak_concurrency = 0;
  std::uint64_t host_failures = 0;
  std::chrono::milliseconds average_execution_time{0};
  double success_rate = 0.0;

  [[nodiscard]] std::string to_json() const;
};

/// Counts coordinator outcomes. Observes only; nothing here feeds back into
/// execution.
class MetricsMonitor final : public IObserver {
public:
  void record(const sandbox::ExecutionResult &result);

  [[nodiscard]] MetricsSnapshot snapshot() const;

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &) override {}
  [[nodiscard]] std::string_view name() const override { return "metrics"; }

private:
  void count(sandbox::OutcomeKind kind, std::chrono::milliseconds duration);

  static constexpr std::size_t kOutcomeKinds = 4;

  std::atomic<std::uint64_t> total_{0};
  std::array<std::atomic<std::uint64_t>, kOutcomeKinds> by_kind_{};
  std::atomic<std::uint64_t> active_{0};
  std::atomic<std::uint64_t> awaiting_{0};
  std::atomic<std::uint64_t> peak_{0};
  std::atomic<std::uint64_t> host_failures_{0};
  std::atomic<std::uint64_t> total_duration_ms_{0};
};

} // namespace mnemobox::observability
