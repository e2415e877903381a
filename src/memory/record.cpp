#include "memoryos/memory/record.hpp"

#include "memoryos/common/fs.hpp"
#include "memoryos/common/json_util.hpp"

#include <array>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <sstream>
#include <system_error>
#include <type_traits>

namespace memoryos::memory {

namespace {

std::optional<Source> parse_source(const std::string &value) {
  const std::string lowered = common::to_lower(common::trim(value));
  if (auto source = source_from_string(lowered); source.has_value()) {
    return source;
  }
  if (lowered == "file_system" || lowered == "files") {
    return Source::Filesystem;
  }
  if (lowered == "calendar") {
    return Source::GoogleCalendar;
  }
  if (lowered == "email" || lowered == "mail") {
    return Source::Gmail;
  }
  return std::nullopt;
}

std::optional<FieldValue> number_field(const std::string &raw) {
  const bool is_float = raw.find_first_of(".eE") != std::string::npos;
  if (!is_float) {
    std::int64_t value = 0;
    const auto *end = raw.data() + raw.size();
    auto [ptr, ec] = std::from_chars(raw.data(), end, value);
    if (ec == std::errc() && ptr == end) {
      return FieldValue{value};
    }
  }
  char *end = nullptr;
  const double value = std::strtod(raw.c_str(), &end);
  if (end == raw.c_str()) {
    return std::nullopt;
  }
  return FieldValue{value};
}

std::optional<FieldValue> member_to_field(const common::JsonMember &member) {
  switch (member.kind) {
  case common::JsonKind::String:
    return FieldValue{member.value};
  case common::JsonKind::Number:
    return number_field(member.value);
  case common::JsonKind::Bool:
    return FieldValue{member.value == "true"};
  case common::JsonKind::Null:
    return std::nullopt;
  case common::JsonKind::Array: {
    if (member.value.find_first_of("{[", 1) != std::string::npos) {
      return FieldValue{member.value};
    }
    const auto strings = common::json_parse_string_array(member.value);
    if (strings.empty()) {
      return FieldValue{member.value};
    }
    std::string joined;
    for (const auto &entry : strings) {
      if (!joined.empty()) {
        joined += ", ";
      }
      joined += entry;
    }
    return FieldValue{joined};
  }
  case common::JsonKind::Object:
    return FieldValue{member.value};
  }
  return std::nullopt;
}

bool ends_with(const std::string &value, const std::string &suffix) {
  return value.size() >= suffix.size() &&
         value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string format_double(const double value) {
  std::array<char, 64> buffer{};
  auto [ptr, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value);
  if (ec != std::errc()) {
    return "0.0";
  }
  std::string out(buffer.data(), ptr);
  if (out.find_first_of(".eE") == std::string::npos) {
    out += ".0";
  }
  return out;
}

void write_field(std::ostringstream &out, const FieldValue &value) {
  std::visit(
      [&out](const auto &v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) {
          out << '"' << common::json_escape(v) << '"';
        } else if constexpr (std::is_same_v<T, bool>) {
          out << (v ? "true" : "false");
        } else if constexpr (std::is_same_v<T, double>) {
          if (std::isfinite(v)) {
            out << format_double(v);
          } else {
            out << "null";
          }
        } else {
          out << v;
        }
      },
      value);
}

} // namespace

common::Result<MemoryItem> parse_record(const std::string &json) {
  using ItemResult = common::Result<MemoryItem>;
  const std::size_t start = common::json_skip_ws(json, 0);
  if (start >= json.size() || json[start] != '{') {
    return ItemResult::failure(common::ErrorCode::InvalidArgument, "record is not a JSON object");
  }

  MemoryItem item;
  bool has_timestamp = false;
  bool has_type = false;
  bool has_source = false;
  bool has_preview = false;

  for (const auto &member : common::json_parse_members(json)) {
    const std::string &key = member.key;
    if (key == "id") {
      item.id = common::trim(member.value);
    } else if (key == "timestamp") {
      item.timestamp = member.value;
      has_timestamp = true;
    } else if (key == "content_type") {
      auto type = content_type_from_string(common::to_lower(common::trim(member.value)));
      if (!type.has_value()) {
        return ItemResult::failure(common::ErrorCode::InvalidArgument,
                                   "unknown content_type '" + member.value + "'");
      }
      item.content_type = *type;
      has_type = true;
    } else if (key == "source") {
      auto source = parse_source(member.value);
      if (!source.has_value()) {
        return ItemResult::failure(common::ErrorCode::InvalidArgument,
                                   "unknown source '" + member.value + "'");
      }
      item.source = *source;
      has_source = true;
    } else if (key == "content_preview") {
      item.content_preview = member.kind == common::JsonKind::Null ? "" : member.value;
      has_preview = true;
    } else if (key == "file_path" || key == "raw_path") {
      if (member.kind == common::JsonKind::String) {
        item.raw_path = member.value;
      }
    } else if (member.kind == common::JsonKind::Object && ends_with(key, "_details")) {
      for (const auto &nested : common::json_parse_members(member.value)) {
        if (auto value = member_to_field(nested); value.has_value()) {
          item.fields[nested.key] = std::move(*value);
        }
      }
    } else if (auto value = member_to_field(member); value.has_value()) {
      item.fields[key] = std::move(*value);
    }
  }

  if (!has_timestamp || !has_type || !has_source || !has_preview) {
    return ItemResult::failure(
        common::ErrorCode::InvalidArgument,
        "record requires timestamp, content_type, source and content_preview");
  }
  return ItemResult::success(std::move(item));
}

ParsedRecords parse_records(const std::string &text) {
  ParsedRecords parsed;
  std::vector<std::string> objects;
  const std::size_t start = common::json_skip_ws(text, 0);
  if (start < text.size() && text[start] == '[') {
    objects = common::json_split_top_level_objects(text);
  } else {
    std::istringstream lines(text);
    std::string line;
    while (std::getline(lines, line)) {
      if (!common::trim(line).empty()) {
        objects.push_back(line);
      }
    }
  }

  for (std::size_t i = 0; i < objects.size(); ++i) {
    auto item = parse_record(objects[i]);
    if (!item.ok()) {
      parsed.errors.push_back("record " + std::to_string(i) + ": " + item.error());
      continue;
    }
    parsed.items.push_back(std::move(item.value()));
  }
  return parsed;
}

std::string fields_to_json(const ExtensionFields &fields) {
  std::ostringstream out;
  out << '{';
  bool first = true;
  for (const auto &[key, value] : fields) {
    if (!first) {
      out << ',';
    }
    first = false;
    out << '"' << common::json_escape(key) << "\":";
    write_field(out, value);
  }
  out << '}';
  return out.str();
}

ExtensionFields fields_from_json(const std::string &json) {
  ExtensionFields fields;
  for (const auto &member : common::json_parse_members(json)) {
    if (member.kind == common::JsonKind::Array || member.kind == common::JsonKind::Object) {
      fields[member.key] = member.value;
      continue;
    }
    if (auto value = member_to_field(member); value.has_value()) {
      fields[member.key] = std::move(*value);
    }
  }
  return fields;
}

std::string record_to_json(const MemoryItem &item) {
  std::ostringstream out;
  out << "{\"id\":\"" << common::json_escape(item.id) << "\",\"timestamp\":\""
      << common::json_escape(item.timestamp) << "\",\"content_type\":\""
      << to_string(item.content_type) << "\",\"source\":\"" << to_string(item.source)
      << "\",\"content_preview\":\"" << common::json_escape(item.content_preview) << '"';
  if (!item.raw_path.empty()) {
    out << ",\"file_path\":\"" << common::json_escape(item.raw_path) << '"';
  }
  if (!item.fields.empty()) {
    out << ",\"" << to_string(item.content_type) << "_details\":" << fields_to_json(item.fields);
  }
  out << '}';
  return out.str();
}

} // namespace memoryos::memory
