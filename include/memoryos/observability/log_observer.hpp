#pragma once

#include "memoryos/observability/observer.hpp"

#include <mutex>

namespace memoryos::observability {

/// Writes one "[LEVEL] message" line per event to stderr.
class LogObserver final : public IObserver {
public:
  explicit LogObserver(bool include_debug = false) : include_debug_(include_debug) {}

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "log"; }

private:
  void log_line(std::string_view level, const std::string &message);

  bool include_debug_;
  std::mutex mutex_;
};

} // namespace memoryos::observability
