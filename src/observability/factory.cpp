#include "memoryos/observability/factory.hpp"

#include "memoryos/common/fs.hpp"
#include "memoryos/observability/log_observer.hpp"
#include "memoryos/observability/multi_observer.hpp"
#include "memoryos/observability/noop_observer.hpp"

#include <sstream>

namespace memoryos::observability {

namespace {

std::unique_ptr<IObserver> create_single(const std::string &backend) {
  if (backend == "log") {
    return std::make_unique<LogObserver>();
  }
  if (backend == "log-debug") {
    return std::make_unique<LogObserver>(true);
  }
  if (backend.empty() || backend == "none" || backend == "noop") {
    return std::make_unique<NoopObserver>();
  }
  return nullptr;
}

} // namespace

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const std::string backend = common::to_lower(common::trim(config.observability.backend));

  if (backend.find(',') != std::string::npos) {
    auto multi = std::make_unique<MultiObserver>();
    std::stringstream stream(backend);
    std::string part;
    while (std::getline(stream, part, ',')) {
      multi->add(create_single(common::trim(part)));
    }
    return multi;
  }

  if (auto observer = create_single(backend); observer != nullptr) {
    return observer;
  }
  // Unknown names still get a log sink so errors are not lost.
  return std::make_unique<LogObserver>();
}

} // namespace memoryos::observability
