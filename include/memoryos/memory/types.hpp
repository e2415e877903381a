#pragma once

#include "memoryos/common/result.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace memoryos::memory {

enum class ContentType {
  Text,
  Url,
  Image,
  File,
  CalendarEvent,
  BrowserHistory,
  Email,
  Audio,
};

enum class Source {
  Browser,
  Clipboard,
  GoogleCalendar,
  Gmail,
  Filesystem,
  Screenshot,
  Audio,
};

enum class Modality {
  Text,
  Visual,
};

enum class SearchModality {
  Text,
  Visual,
  Both,
};

[[nodiscard]] std::string to_string(ContentType type);
[[nodiscard]] std::string to_string(Source source);
[[nodiscard]] std::string to_string(Modality modality);
[[nodiscard]] std::string to_string(SearchModality modality);
[[nodiscard]] std::optional<ContentType> content_type_from_string(std::string_view value);
[[nodiscard]] std::optional<Source> source_from_string(std::string_view value);
[[nodiscard]] std::optional<Modality> modality_from_string(std::string_view value);
[[nodiscard]] std::optional<SearchModality> search_modality_from_string(std::string_view value);

/// Typed value of a collector-specific field.
using FieldValue = std::variant<std::string, std::int64_t, double, bool>;
using ExtensionFields = std::map<std::string, FieldValue>;

[[nodiscard]] std::string field_to_string(const FieldValue &value);
/// Text form of the field, or nullopt when absent or blank.
[[nodiscard]] std::optional<std::string> field_text(const ExtensionFields &fields,
                                                    const std::string &key);

struct MemoryItem {
  std::string id;
  std::string timestamp;
  ContentType content_type = ContentType::Text;
  Source source = Source::Clipboard;
  std::string content_preview;
  std::string raw_path;
  ExtensionFields fields;
};

struct TextSpan {
  std::string text;
  std::size_t start_offset = 0;
  std::size_t end_offset = 0;
};

struct FrameReference {
  std::string raw_path;
  std::uint32_t frame_index = 0;
  std::optional<std::int64_t> timestamp_ms;
};

using ChunkPayload = std::variant<TextSpan, FrameReference>;

struct Chunk {
  std::string id;
  std::string parent_id;
  std::uint32_t sequence_index = 0;
  Modality modality = Modality::Text;
  std::vector<float> embedding;
  ChunkPayload payload;
  std::optional<std::size_t> slot;
};

[[nodiscard]] std::string make_chunk_id(const std::string &parent_id, std::uint32_t sequence_index);

/// Text of a text chunk, empty for frame chunks.
[[nodiscard]] const std::string &chunk_text_of(const Chunk &chunk);

/// Equality on content_type/source and an inclusive timestamp range.
struct ItemFilter {
  std::optional<ContentType> content_type;
  std::optional<Source> source;
  std::optional<std::string> since;
  std::optional<std::string> until;
  std::optional<std::size_t> limit;

  [[nodiscard]] bool empty() const;
  [[nodiscard]] bool matches(const MemoryItem &item) const;
};

struct SearchHit {
  MemoryItem item;
  Chunk chunk;
  double score = 0.0;
  double distance = 0.0;
  Modality modality = Modality::Text;
};

[[nodiscard]] std::string now_rfc3339();

/// Normalizes an RFC3339 timestamp to "YYYY-MM-DDTHH:MM:SSZ" in UTC.
[[nodiscard]] common::Result<std::string> normalize_timestamp(std::string_view value);

/// Normalizes the since/until bounds of a filter to UTC. A date-only until covers the whole day.
[[nodiscard]] common::Result<ItemFilter> normalize_filter(const ItemFilter &filter);

} // namespace memoryos::memory
