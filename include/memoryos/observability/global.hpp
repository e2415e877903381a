#pragma once

#include "memoryos/observability/observer.hpp"

#include <memory>

namespace memoryos::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_error(const std::string &component, const std::string &message);

} // namespace memoryos::observability
