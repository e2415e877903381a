#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace memoryos::observability {

struct ItemIngestedEvent {
  std::string item_id;
  std::string content_type;
  std::size_t text_chunks = 0;
  std::size_t visual_chunks = 0;
  std::chrono::milliseconds duration{0};
};

struct DuplicateSkippedEvent {
  std::string item_id;
};

/// One routed unit failed to encode and was left out of the item.
struct EncodingSkippedEvent {
  std::string item_id;
  std::string unit;
  std::string reason;
};

struct IngestRolledBackEvent {
  std::string item_id;
  std::string reason;
};

struct SearchEvent {
  std::string modality;
  std::size_t results = 0;
  std::chrono::milliseconds duration{0};
};

struct IndexFlushedEvent {
  std::string modality;
  std::size_t entries = 0;
};

struct IndexCorruptEvent {
  std::string modality;
  std::string reason;
};

struct IndexReconciledEvent {
  std::string modality;
  std::size_t entries = 0;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent =
    std::variant<ItemIngestedEvent, DuplicateSkippedEvent, EncodingSkippedEvent,
                 IngestRolledBackEvent, SearchEvent, IndexFlushedEvent, IndexCorruptEvent,
                 IndexReconciledEvent, ErrorEvent>;

struct IngestLatencyMetric {
  std::chrono::milliseconds latency{0};
};

struct SearchLatencyMetric {
  std::chrono::milliseconds latency{0};
};

struct IndexSizeMetric {
  std::string modality;
  std::uint64_t size = 0;
};

using ObserverMetric = std::variant<IngestLatencyMetric, SearchLatencyMetric, IndexSizeMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace memoryos::observability
