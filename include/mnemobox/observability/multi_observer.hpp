#pragma once

#include "mnemobox/observability/observer.hpp"

#include <memory>
#include <vector>

namespace mnemobox::observability {

/// Fans every event out to its members. Members are shared so a caller can
/// keep a handle on one (typically the MetricsMonitor) after adding it. A
/// member that throws is reported and skipped; the rest still see the event.
class MultiObserver final : public IObserver {
public:
  void add(std::shared_ptr<IObserver> observer);

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "multi"; }

  [[nodiscard]] std::size_t size() const { return observers_.size(); }

private:
  std::vector<std::shared_ptr<IObserver>> observers_;
};

} // namespace mnemobox::observability
