#include "mnemobox/observability/global.hpp"

#include <mutex>

namespace mnemobox::observability {

namespace {

std::mutex g_observer_mutex;
std::shared_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::shared_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

std::shared_ptr<IObserver> get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer;
}

void record_event(const ObserverEvent &event) {
  if (auto observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace mnemobox::observability
