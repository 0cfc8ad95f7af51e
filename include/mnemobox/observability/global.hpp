#pragma once

#include "mnemobox/observability/observer.hpp"

#include <memory>

namespace mnemobox::observability {

void set_global_observer(std::shared_ptr<IObserver> observer);
std::shared_ptr<IObserver> get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_error(const std::string &component, const std::string &message);

} // namespace mnemobox::observability
