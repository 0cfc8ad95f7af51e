#include "mnemobox/observability/multi_observer.hpp"

#include <exception>
#include <iostream>

namespace mnemobox::observability {

namespace {

template <typename Fn> void each_contained(const std::vector<std::shared_ptr<IObserver>> &observers,
                                           const char *what, Fn &&fn) {
  for (const auto &observer : observers) {
    try {
      fn(*observer);
    } catch (const std::exception &e) {
      std::cerr << "[WARN] observer " << observer->name() << " failed to " << what << ": "
                << e.what() << "\n";
    }
  }
}

} // namespace

void MultiObserver::add(std::shared_ptr<IObserver> observer) {
  if (observer != nullptr) {
    observers_.push_back(std::move(observer));
  }
}

void MultiObserver::record_event(const ObserverEvent &event) {
  each_contained(observers_, "record event",
                 [&event](IObserver &observer) { observer.record_event(event); });
}

void MultiObserver::record_metric(const ObserverMetric &metric) {
  each_contained(observers_, "record metric",
                 [&metric](IObserver &observer) { observer.record_metric(metric); });
}

void MultiObserver::flush() {
  each_contained(observers_, "flush", [](IObserver &observer) { observer.flush(); });
}

} // namespace mnemobox::observability
