#include "memoryos/memory/types.hpp"

#include "memoryos/common/fs.hpp"

#include <charconv>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <type_traits>

namespace memoryos::memory {

namespace {

bool read_int(std::string_view text, const std::size_t pos, const std::size_t width, int &out) {
  if (pos + width > text.size()) {
    return false;
  }
  const char *first = text.data() + pos;
  const char *last = first + width;
  auto [ptr, ec] = std::from_chars(first, last, out);
  return ec == std::errc() && ptr == last;
}

std::string format_utc(const std::time_t t) {
  std::tm tm{};
  gmtime_r(&t, &tm);
  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  return out.str();
}

} // namespace

std::string to_string(const ContentType type) {
  switch (type) {
  case ContentType::Text:
    return "text";
  case ContentType::Url:
    return "url";
  case ContentType::Image:
    return "image";
  case ContentType::File:
    return "file";
  case ContentType::CalendarEvent:
    return "calendar_event";
  case ContentType::BrowserHistory:
    return "browser_history";
  case ContentType::Email:
    return "email";
  case ContentType::Audio:
    return "audio";
  }
  return "text";
}

std::string to_string(const Source source) {
  switch (source) {
  case Source::Browser:
    return "browser";
  case Source::Clipboard:
    return "clipboard";
  case Source::GoogleCalendar:
    return "google_calendar";
  case Source::Gmail:
    return "gmail";
  case Source::Filesystem:
    return "filesystem";
  case Source::Screenshot:
    return "screenshot";
  case Source::Audio:
    return "audio";
  }
  return "clipboard";
}

std::string to_string(const Modality modality) {
  return modality == Modality::Visual ? "visual" : "text";
}

std::string to_string(const SearchModality modality) {
  switch (modality) {
  case SearchModality::Text:
    return "text";
  case SearchModality::Visual:
    return "visual";
  case SearchModality::Both:
    return "both";
  }
  return "text";
}

std::optional<ContentType> content_type_from_string(std::string_view value) {
  const std::string v = common::to_lower(common::trim(std::string(value)));
  if (v == "text") {
    return ContentType::Text;
  }
  if (v == "url") {
    return ContentType::Url;
  }
  if (v == "image") {
    return ContentType::Image;
  }
  if (v == "file") {
    return ContentType::File;
  }
  if (v == "calendar_event") {
    return ContentType::CalendarEvent;
  }
  if (v == "browser_history") {
    return ContentType::BrowserHistory;
  }
  if (v == "email") {
    return ContentType::Email;
  }
  if (v == "audio") {
    return ContentType::Audio;
  }
  return std::nullopt;
}

std::optional<Source> source_from_string(std::string_view value) {
  const std::string v = common::to_lower(common::trim(std::string(value)));
  if (v == "browser") {
    return Source::Browser;
  }
  if (v == "clipboard") {
    return Source::Clipboard;
  }
  if (v == "google_calendar") {
    return Source::GoogleCalendar;
  }
  if (v == "gmail") {
    return Source::Gmail;
  }
  if (v == "filesystem") {
    return Source::Filesystem;
  }
  if (v == "screenshot") {
    return Source::Screenshot;
  }
  if (v == "audio") {
    return Source::Audio;
  }
  return std::nullopt;
}

std::optional<Modality> modality_from_string(std::string_view value) {
  const std::string v = common::to_lower(common::trim(std::string(value)));
  if (v == "text") {
    return Modality::Text;
  }
  if (v == "visual") {
    return Modality::Visual;
  }
  return std::nullopt;
}

std::optional<SearchModality> search_modality_from_string(std::string_view value) {
  const std::string v = common::to_lower(common::trim(std::string(value)));
  if (v == "both") {
    return SearchModality::Both;
  }
  if (const auto single = modality_from_string(v); single.has_value()) {
    return *single == Modality::Visual ? SearchModality::Visual : SearchModality::Text;
  }
  return std::nullopt;
}

std::string field_to_string(const FieldValue &value) {
  return std::visit(
      [](const auto &v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) {
          return v;
        } else if constexpr (std::is_same_v<T, bool>) {
          return v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, double>) {
          std::ostringstream out;
          out << v;
          return out.str();
        } else {
          return std::to_string(v);
        }
      },
      value);
}

std::optional<std::string> field_text(const ExtensionFields &fields, const std::string &key) {
  const auto it = fields.find(key);
  if (it == fields.end()) {
    return std::nullopt;
  }
  std::string text = common::trim(field_to_string(it->second));
  if (text.empty()) {
    return std::nullopt;
  }
  return text;
}

std::string make_chunk_id(const std::string &parent_id, const std::uint32_t sequence_index) {
  return parent_id + "#" + std::to_string(sequence_index);
}

const std::string &chunk_text_of(const Chunk &chunk) {
  static const std::string kEmpty;
  if (const auto *span = std::get_if<TextSpan>(&chunk.payload); span != nullptr) {
    return span->text;
  }
  return kEmpty;
}

bool ItemFilter::empty() const {
  return !content_type.has_value() && !source.has_value() && !since.has_value() &&
         !until.has_value();
}

bool ItemFilter::matches(const MemoryItem &item) const {
  if (content_type.has_value() && item.content_type != *content_type) {
    return false;
  }
  if (source.has_value() && item.source != *source) {
    return false;
  }
  // Normalized timestamps compare lexicographically.
  if (since.has_value() && item.timestamp < *since) {
    return false;
  }
  if (until.has_value() && item.timestamp > *until) {
    return false;
  }
  return true;
}

std::string now_rfc3339() {
  return format_utc(std::chrono::system_clock::to_time_t(std::chrono::system_clock::now()));
}

common::Result<std::string> normalize_timestamp(std::string_view value) {
  const std::string text = common::trim(std::string(value));
  auto invalid = [&text]() {
    return common::Result<std::string>::failure(common::ErrorCode::InvalidArgument,
                                                "invalid timestamp: '" + text + "'");
  };

  std::tm tm{};
  int year = 0;
  int month = 0;
  int day = 0;
  if (!read_int(text, 0, 4, year) || text.size() < 10 || text[4] != '-' || text[7] != '-' ||
      !read_int(text, 5, 2, month) || !read_int(text, 8, 2, day)) {
    return invalid();
  }

  int hour = 0;
  int minute = 0;
  int second = 0;
  std::size_t pos = 10;
  if (pos < text.size()) {
    if ((text[pos] != 'T' && text[pos] != 't' && text[pos] != ' ') ||
        !read_int(text, pos + 1, 2, hour) || text.size() < pos + 6 || text[pos + 3] != ':' ||
        !read_int(text, pos + 4, 2, minute)) {
      return invalid();
    }
    pos += 6;
    if (pos < text.size() && text[pos] == ':') {
      if (!read_int(text, pos + 1, 2, second)) {
        return invalid();
      }
      pos += 3;
    }
    if (pos < text.size() && (text[pos] == '.' || text[pos] == ',')) {
      ++pos;
      while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
        ++pos;
      }
    }
  }

  long offset_seconds = 0;
  if (pos < text.size()) {
    const char zone = text[pos];
    if (zone == 'Z' || zone == 'z') {
      ++pos;
    } else if (zone == '+' || zone == '-') {
      int off_h = 0;
      int off_m = 0;
      if (!read_int(text, pos + 1, 2, off_h)) {
        return invalid();
      }
      std::size_t minute_pos = pos + 3;
      if (minute_pos < text.size() && text[minute_pos] == ':') {
        ++minute_pos;
      }
      if (!read_int(text, minute_pos, 2, off_m)) {
        return invalid();
      }
      offset_seconds = (off_h * 3600L + off_m * 60L) * (zone == '-' ? -1 : 1);
      pos = minute_pos + 2;
    }
  }
  if (pos != text.size()) {
    return invalid();
  }

  if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 ||
      second > 60) {
    return invalid();
  }

  tm.tm_year = year - 1900;
  tm.tm_mon = month - 1;
  tm.tm_mday = day;
  tm.tm_hour = hour;
  tm.tm_min = minute;
  tm.tm_sec = second;
  const std::time_t local = timegm(&tm);
  return common::Result<std::string>::success(format_utc(local - offset_seconds));
}

common::Result<ItemFilter> normalize_filter(const ItemFilter &filter) {
  ItemFilter normalized = filter;
  if (filter.since.has_value()) {
    auto since = normalize_timestamp(*filter.since);
    if (!since.ok()) {
      return common::Result<ItemFilter>::failure(common::ErrorCode::InvalidArgument,
                                                 "since: " + since.error());
    }
    normalized.since = since.value();
  }
  if (filter.until.has_value()) {
    std::string bound = common::trim(*filter.until);
    if (bound.size() == 10) {
      bound += "T23:59:59Z";
    }
    auto until = normalize_timestamp(bound);
    if (!until.ok()) {
      return common::Result<ItemFilter>::failure(common::ErrorCode::InvalidArgument,
                                                 "until: " + until.error());
    }
    normalized.until = until.value();
  }
  return common::Result<ItemFilter>::success(std::move(normalized));
}

} // namespace memoryos::memory
