#pragma once

#include "fsgate/observability/observer.hpp"

#include <memory>

namespace fsgate::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_guard_decision(const std::string &operation, const std::string &stage,
                           const std::string &outcome, const std::string &path,
                           std::chrono::milliseconds duration);
void record_bytes_transferred(const std::string &operation, std::uint64_t bytes);
void record_rate_limit_rejection(const std::string &operation);
void record_error(const std::string &component, const std::string &message);

} // namespace fsgate::observability
