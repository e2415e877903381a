#include "memoryos/memory/content.hpp"

#include "memoryos/common/fs.hpp"
#include "memoryos/common/hash.hpp"

#include <initializer_list>
#include <type_traits>

namespace memoryos::memory {

namespace {

std::string first_field(const MemoryItem &item, std::initializer_list<const char *> keys) {
  for (const char *key : keys) {
    if (auto value = field_text(item.fields, key); value.has_value()) {
      return *value;
    }
  }
  return "";
}

void append_part(std::string &out, const std::string &part, const char *prefix = "") {
  if (part.empty()) {
    return;
  }
  if (!out.empty()) {
    out.push_back(' ');
  }
  out += prefix;
  out += part;
}

std::string transcript_text(const TranscriptContent &transcript) {
  if (!common::trim(transcript.text).empty()) {
    return transcript.text;
  }
  std::string joined;
  for (const auto &segment : transcript.segments) {
    append_part(joined, common::trim(segment.text));
  }
  return joined;
}

std::string document_text(const DocumentContent &document) {
  const std::string title = common::trim(document.title);
  if (title.empty()) {
    return document.text;
  }
  return title + "\n\n" + document.text;
}

// Primary text of the item, or empty for image payloads.
std::string primary_text(const MemoryItem &item, const std::optional<RawContent> &content) {
  if (!content.has_value()) {
    return compose_searchable_text(item);
  }
  return std::visit(
      [](const auto &value) -> std::string {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, TextContent>) {
          return value.text;
        } else if constexpr (std::is_same_v<T, TranscriptContent>) {
          return transcript_text(value);
        } else if constexpr (std::is_same_v<T, DocumentContent>) {
          return document_text(value);
        } else {
          return "";
        }
      },
      *content);
}

common::Status require_field(const MemoryItem &item, const char *key) {
  if (!field_text(item.fields, key).has_value()) {
    return common::Status::error(common::ErrorCode::InvalidArgument,
                                 to_string(item.content_type) + " item requires field '" + key +
                                     "'");
  }
  return common::Status::success();
}

} // namespace

bool is_image_bearing(const ContentType type) { return type == ContentType::Image; }

common::Status validate_item(const MemoryItem &item) {
  if (auto ts = normalize_timestamp(item.timestamp); !ts.ok()) {
    return ts.status();
  }

  switch (item.content_type) {
  case ContentType::Url:
  case ContentType::BrowserHistory:
    return require_field(item, "url");
  case ContentType::Email:
    return require_field(item, "subject");
  case ContentType::CalendarEvent:
    return require_field(item, "start");
  case ContentType::File:
    if (common::trim(item.raw_path).empty()) {
      return common::Status::error(common::ErrorCode::InvalidArgument,
                                   "file item requires raw_path");
    }
    return common::Status::success();
  case ContentType::Text:
  case ContentType::Image:
  case ContentType::Audio:
    return common::Status::success();
  }
  return common::Status::success();
}

std::string compose_searchable_text(const MemoryItem &item) {
  std::string text;
  switch (item.content_type) {
  case ContentType::CalendarEvent:
    for (const char *key : {"summary", "description", "location", "attendees", "start"}) {
      append_part(text, first_field(item, {key}));
    }
    break;
  case ContentType::Email:
    append_part(text, first_field(item, {"subject"}));
    append_part(text, first_field(item, {"from", "sender"}), "from ");
    append_part(text, first_field(item, {"to", "recipients"}), "to ");
    append_part(text, first_field(item, {"body", "body_preview", "snippet"}));
    break;
  case ContentType::Url:
  case ContentType::BrowserHistory:
    append_part(text, first_field(item, {"title"}));
    append_part(text, first_field(item, {"url"}));
    append_part(text, first_field(item, {"search_query"}));
    break;
  case ContentType::File:
    append_part(text, first_field(item, {"event_type", "event"}));
    append_part(text, first_field(item, {"filename"}));
    append_part(text, first_field(item, {"full_path", "path"}));
    break;
  case ContentType::Text:
  case ContentType::Image:
  case ContentType::Audio:
    break;
  }
  if (common::trim(text).empty()) {
    return item.content_preview;
  }
  return text;
}

std::string compute_item_id(const MemoryItem &item, const std::optional<RawContent> &content) {
  const std::string prefix = to_string(item.source) + "|";
  if (content.has_value()) {
    if (const auto *image = std::get_if<ImageContent>(&*content); image != nullptr) {
      return common::sha256_hex(prefix + "image|" + common::sha256_hex(image->bytes));
    }
  }

  std::string normalized = common::to_lower(common::collapse_whitespace(primary_text(item, content)));
  if (normalized.empty()) {
    normalized = item.raw_path + "|" + item.timestamp;
  }
  return common::sha256_hex(prefix + to_string(item.content_type) + "|" + normalized);
}

common::Result<std::vector<RoutedUnit>> route_content(const MemoryItem &item,
                                                      std::optional<RawContent> content) {
  using RouteResult = common::Result<std::vector<RoutedUnit>>;
  std::vector<RoutedUnit> units;

  auto add_text = [&units](std::string label, std::string text) {
    if (!common::trim(text).empty()) {
      units.push_back(RoutedUnit{.modality = Modality::Text,
                                 .label = std::move(label),
                                 .payload = std::move(text)});
    }
  };

  const bool image_item = is_image_bearing(item.content_type);
  if (!content.has_value()) {
    if (image_item) {
      return RouteResult::failure(common::ErrorCode::InvalidArgument,
                                  "image item " + item.id + " has no image payload");
    }
    add_text("record", compose_searchable_text(item));
    return RouteResult::success(std::move(units));
  }

  if (auto *image = std::get_if<ImageContent>(&*content); image != nullptr) {
    if (!image_item && item.content_type != ContentType::File) {
      return RouteResult::failure(common::ErrorCode::InvalidArgument,
                                  "image payload supplied for " + to_string(item.content_type) +
                                      " item");
    }
    units.push_back(RoutedUnit{
        .modality = Modality::Visual,
        .label = "image",
        .payload = ImagePayload{.bytes = std::move(image->bytes),
                                .frame = FrameReference{.raw_path = item.raw_path}},
    });
    if (image->ocr_text.has_value()) {
      add_text("ocr", *image->ocr_text);
    }
    return RouteResult::success(std::move(units));
  }

  if (image_item) {
    return RouteResult::failure(common::ErrorCode::InvalidArgument,
                                "image item " + item.id + " needs an image payload");
  }
  if (const auto *transcript = std::get_if<TranscriptContent>(&*content); transcript != nullptr) {
    add_text("transcript", transcript_text(*transcript));
  } else if (const auto *document = std::get_if<DocumentContent>(&*content);
             document != nullptr) {
    add_text("document", document_text(*document));
  } else {
    add_text("text", std::get<TextContent>(*content).text);
  }
  return RouteResult::success(std::move(units));
}

} // namespace memoryos::memory
