#pragma once

#include "memoryos/config/schema.hpp"
#include "memoryos/observability/observer.hpp"

#include <memory>

namespace memoryos::observability {

/// Backends: "log", "log-debug", "none"/"noop", or a comma-separated list of those.
[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace memoryos::observability
