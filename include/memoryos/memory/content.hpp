#pragma once

#include "memoryos/common/result.hpp"
#include "memoryos/memory/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace memoryos::memory {

struct TextContent {
  std::string text;
};

struct ImageContent {
  std::vector<std::uint8_t> bytes;
  std::optional<std::string> ocr_text;
};

struct TranscriptSegment {
  std::int64_t start_ms = 0;
  std::int64_t end_ms = 0;
  std::string text;
};

struct TranscriptContent {
  std::string text;
  std::vector<TranscriptSegment> segments;
};

struct DocumentContent {
  std::string title;
  std::string text;
};

/// Raw payload handed over by a collector alongside its record.
using RawContent = std::variant<TextContent, ImageContent, TranscriptContent, DocumentContent>;

struct ImagePayload {
  std::vector<std::uint8_t> bytes;
  FrameReference frame;
};

/// One embeddable unit of an item, before chunking.
struct RoutedUnit {
  Modality modality = Modality::Text;
  std::string label;
  std::variant<std::string, ImagePayload> payload;
};

[[nodiscard]] bool is_image_bearing(ContentType type);

/// Checks the timestamp and the fields each content_type requires.
[[nodiscard]] common::Status validate_item(const MemoryItem &item);

/// Searchable text built from the record itself, used when no raw content is supplied.
[[nodiscard]] std::string compose_searchable_text(const MemoryItem &item);

/// sha256 over source, content_type and normalized text (or the image bytes).
[[nodiscard]] std::string compute_item_id(const MemoryItem &item,
                                          const std::optional<RawContent> &content);

/// Maps an item and its content to (modality, payload) units. Blank text units are
/// dropped; an image payload with OCR text yields a visual unit followed by a text unit.
[[nodiscard]] common::Result<std::vector<RoutedUnit>>
route_content(const MemoryItem &item, std::optional<RawContent> content);

} // namespace memoryos::memory
