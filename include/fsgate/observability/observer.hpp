#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace fsgate::observability {

/// One guard-chain outcome. `stage` names the stage that decided ("rate", "size",
/// "extension", "containment", "io", "done").
struct GuardDecisionEvent {
  std::string operation;
  std::string stage;
  std::string outcome;
  std::string path;
  std::chrono::milliseconds duration{0};
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<GuardDecisionEvent, ErrorEvent>;

struct BytesTransferredMetric {
  std::string operation;
  std::uint64_t bytes = 0;
};

struct RateLimitRejectionMetric {
  std::string operation;
};

using ObserverMetric = std::variant<BytesTransferredMetric, RateLimitRejectionMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace fsgate::observability
