#pragma once

#include "fsgate/observability/observer.hpp"

namespace fsgate::observability {

/// Writes `[LEVEL] message` lines to stderr. Rejections log at WARN.
class LogObserver final : public IObserver {
public:
  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  [[nodiscard]] std::string_view name() const override { return "log"; }
};

} // namespace fsgate::observability
