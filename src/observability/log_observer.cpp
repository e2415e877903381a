#include "memoryos/observability/log_observer.hpp"

#include <iostream>
#include <type_traits>

namespace memoryos::observability {

void LogObserver::log_line(std::string_view level, const std::string &message) {
  if (level == "DEBUG" && !include_debug_) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  std::cerr << "[" << level << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, ItemIngestedEvent>) {
          log_line("INFO", "ingest.ok id=" + evt.item_id + " type=" + evt.content_type +
                               " text_chunks=" + std::to_string(evt.text_chunks) +
                               " visual_chunks=" + std::to_string(evt.visual_chunks) +
                               " duration_ms=" + std::to_string(evt.duration.count()));
        } else if constexpr (std::is_same_v<T, DuplicateSkippedEvent>) {
          log_line("DEBUG", "ingest.duplicate id=" + evt.item_id);
        } else if constexpr (std::is_same_v<T, EncodingSkippedEvent>) {
          log_line("WARN", "ingest.skip_unit id=" + evt.item_id + " unit=" + evt.unit + ": " +
                               evt.reason);
        } else if constexpr (std::is_same_v<T, IngestRolledBackEvent>) {
          log_line("WARN", "ingest.rollback id=" + evt.item_id + ": " + evt.reason);
        } else if constexpr (std::is_same_v<T, SearchEvent>) {
          log_line("DEBUG", "search modality=" + evt.modality +
                                " results=" + std::to_string(evt.results) +
                                " duration_ms=" + std::to_string(evt.duration.count()));
        } else if constexpr (std::is_same_v<T, IndexFlushedEvent>) {
          log_line("INFO", "index.flush modality=" + evt.modality +
                               " entries=" + std::to_string(evt.entries));
        } else if constexpr (std::is_same_v<T, IndexCorruptEvent>) {
          log_line("ERROR", "index.corrupt modality=" + evt.modality + ": " + evt.reason);
        } else if constexpr (std::is_same_v<T, IndexReconciledEvent>) {
          log_line("INFO", "index.reconcile modality=" + evt.modality +
                               " entries=" + std::to_string(evt.entries));
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, IngestLatencyMetric>) {
          log_line("DEBUG", "metric.ingest_latency_ms=" + std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<T, SearchLatencyMetric>) {
          log_line("DEBUG", "metric.search_latency_ms=" + std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<T, IndexSizeMetric>) {
          log_line("DEBUG", "metric.index_size." + m.modality + "=" + std::to_string(m.size));
        }
      },
      metric);
}

void LogObserver::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::cerr.flush();
}

} // namespace memoryos::observability
