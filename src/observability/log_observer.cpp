#include "fsgate/observability/log_observer.hpp"

#include <iostream>
#include <type_traits>

namespace fsgate::observability {

namespace {

void log_line(const std::string &level, const std::string &message) {
  std::cerr << "[" << level << "] " << message << "\n";
}

} // namespace

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, GuardDecisionEvent>) {
          log_line(evt.outcome == "ok" ? "INFO" : "WARN",
                   "guard." + evt.operation + " stage=" + evt.stage + " outcome=" + evt.outcome +
                       " path=" + evt.path +
                       " duration_ms=" + std::to_string(evt.duration.count()));
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, BytesTransferredMetric>) {
          log_line("DEBUG", "metric.bytes_transferred operation=" + m.operation +
                                " bytes=" + std::to_string(m.bytes));
        } else if constexpr (std::is_same_v<T, RateLimitRejectionMetric>) {
          log_line("DEBUG", "metric.rate_limit_rejection operation=" + m.operation);
        }
      },
      metric);
}

} // namespace fsgate::observability
