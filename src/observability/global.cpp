#include "fsgate/observability/global.hpp"

#include <mutex>

namespace fsgate::observability {

namespace {

std::mutex g_observer_mutex;
std::shared_ptr<IObserver> g_observer;

// Dispatch holds its own reference; a concurrent swap frees the old observer only
// after in-flight calls return.
std::shared_ptr<IObserver> observer_snapshot() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer;
}

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::shared_ptr<IObserver> replacement(std::move(observer));
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer.swap(replacement);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  if (const auto observer = observer_snapshot(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (const auto observer = observer_snapshot(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_guard_decision(const std::string &operation, const std::string &stage,
                           const std::string &outcome, const std::string &path,
                           const std::chrono::milliseconds duration) {
  record_event(GuardDecisionEvent{.operation = operation,
                                  .stage = stage,
                                  .outcome = outcome,
                                  .path = path,
                                  .duration = duration});
}

void record_bytes_transferred(const std::string &operation, const std::uint64_t bytes) {
  record_metric(BytesTransferredMetric{.operation = operation, .bytes = bytes});
}

void record_rate_limit_rejection(const std::string &operation) {
  record_metric(RateLimitRejectionMetric{.operation = operation});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace fsgate::observability
