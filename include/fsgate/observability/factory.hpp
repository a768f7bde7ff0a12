#pragma once

#include "fsgate/config/schema.hpp"
#include "fsgate/observability/observer.hpp"

#include <memory>

namespace fsgate::observability {

[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace fsgate::observability
