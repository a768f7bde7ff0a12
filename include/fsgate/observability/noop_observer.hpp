#pragma once

#include "fsgate/observability/observer.hpp"

namespace fsgate::observability {

class NoopObserver final : public IObserver {
public:
  void record_event(const ObserverEvent &) override {}
  void record_metric(const ObserverMetric &) override {}
  [[nodiscard]] std::string_view name() const override { return "noop"; }
};

} // namespace fsgate::observability
