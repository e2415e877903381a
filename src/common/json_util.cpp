#include "memoryos/common/json_util.hpp"

#include <cctype>
#include <charconv>
#include <cstdlib>

namespace memoryos::common {

namespace {

void append_utf8(std::string &out, const unsigned int code_point) {
  if (code_point < 0x80) {
    out.push_back(static_cast<char>(code_point));
  } else if (code_point < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (code_point >> 6)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  } else if (code_point < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (code_point >> 12)));
    out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (code_point >> 18)));
    out.push_back(static_cast<char>(0x80 | ((code_point >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  }
}

bool parse_hex4(const std::string &raw, const std::size_t pos, unsigned int &out) {
  if (pos + 4 > raw.size()) {
    return false;
  }
  const auto *first = raw.data() + pos;
  auto [ptr, ec] = std::from_chars(first, first + 4, out, 16);
  return ec == std::errc() && ptr == first + 4;
}

std::size_t find_value_start(const std::string &json, const std::string &field) {
  const std::string quoted = "\"" + field + "\"";
  std::size_t key_pos = json.find(quoted);
  while (key_pos != std::string::npos) {
    const std::size_t after = json_skip_ws(json, key_pos + quoted.size());
    if (after < json.size() && json[after] == ':') {
      return json_skip_ws(json, after + 1);
    }
    key_pos = json.find(quoted, key_pos + 1);
  }
  return std::string::npos;
}

std::string get_nested(const std::string &json, const std::string &field, const char open_ch,
                       const char close_ch) {
  const std::size_t pos = find_value_start(json, field);
  if (pos == std::string::npos || pos >= json.size() || json[pos] != open_ch) {
    return "";
  }
  const auto end = json_find_matching_token(json, pos, open_ch, close_ch);
  if (end == std::string::npos) {
    return "";
  }
  return json.substr(pos, end - pos + 1);
}

std::size_t scan_scalar_end(const std::string &json, std::size_t pos) {
  while (pos < json.size() && json[pos] != ',' && json[pos] != '}' && json[pos] != ']' &&
         std::isspace(static_cast<unsigned char>(json[pos])) == 0) {
    ++pos;
  }
  return pos;
}

} // namespace

std::string json_escape(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size() + 8);
  for (const char ch : value) {
    switch (ch) {
    case '"':
      escaped += "\\\"";
      break;
    case '\\':
      escaped += "\\\\";
      break;
    case '\n':
      escaped += "\\n";
      break;
    case '\r':
      escaped += "\\r";
      break;
    case '\t':
      escaped += "\\t";
      break;
    default:
      if (static_cast<unsigned char>(ch) < 0x20) {
        static constexpr char kHex[] = "0123456789abcdef";
        escaped += "\\u00";
        escaped.push_back(kHex[(static_cast<unsigned char>(ch) >> 4) & 0x0F]);
        escaped.push_back(kHex[static_cast<unsigned char>(ch) & 0x0F]);
      } else {
        escaped.push_back(ch);
      }
      break;
    }
  }
  return escaped;
}

std::string json_unescape(const std::string &raw) {
  std::string out;
  out.reserve(raw.size());
  for (std::size_t i = 0; i < raw.size(); ++i) {
    const char ch = raw[i];
    if (ch != '\\' || i + 1 >= raw.size()) {
      out.push_back(ch);
      continue;
    }
    const char next = raw[++i];
    switch (next) {
    case 'n':
      out.push_back('\n');
      break;
    case 'r':
      out.push_back('\r');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'b':
      out.push_back('\b');
      break;
    case 'f':
      out.push_back('\f');
      break;
    case 'u': {
      unsigned int code = 0;
      if (!parse_hex4(raw, i + 1, code)) {
        out.push_back(next);
        break;
      }
      i += 4;
      unsigned int low = 0;
      if (code >= 0xD800 && code <= 0xDBFF && i + 2 < raw.size() && raw[i + 1] == '\\' &&
          raw[i + 2] == 'u' && parse_hex4(raw, i + 3, low) && low >= 0xDC00 && low <= 0xDFFF) {
        code = 0x10000 + ((code - 0xD800) << 10) + (low - 0xDC00);
        i += 6;
      }
      append_utf8(out, code);
      break;
    }
    default:
      out.push_back(next);
      break;
    }
  }
  return out;
}

std::size_t json_skip_ws(const std::string &text, std::size_t pos) {
  while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])) != 0) {
    ++pos;
  }
  return pos;
}

std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos) {
  bool escaped = false;
  for (std::size_t i = quote_pos + 1; i < json.size(); ++i) {
    const char ch = json[i];
    if (!escaped && ch == '"') {
      return i;
    }
    if (!escaped && ch == '\\') {
      escaped = true;
      continue;
    }
    escaped = false;
  }
  return std::string::npos;
}

std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                      const char open_ch, const char close_ch) {
  if (open_pos >= json.size() || json[open_pos] != open_ch) {
    return std::string::npos;
  }
  std::size_t depth = 0;
  bool in_string = false;
  bool escaped = false;
  for (std::size_t i = open_pos; i < json.size(); ++i) {
    const char ch = json[i];
    if (in_string) {
      if (!escaped && ch == '"') {
        in_string = false;
      } else if (!escaped && ch == '\\') {
        escaped = true;
        continue;
      }
      escaped = false;
      continue;
    }
    if (ch == '"') {
      in_string = true;
      escaped = false;
      continue;
    }
    if (ch == open_ch) {
      ++depth;
    } else if (ch == close_ch) {
      if (depth == 0) {
        return std::string::npos;
      }
      --depth;
      if (depth == 0) {
        return i;
      }
    }
  }
  return std::string::npos;
}

std::string json_get_string(const std::string &json, const std::string &field) {
  const std::size_t pos = find_value_start(json, field);
  if (pos == std::string::npos || pos >= json.size() || json[pos] != '"') {
    return "";
  }
  const auto end = json_find_string_end(json, pos);
  if (end == std::string::npos) {
    return "";
  }
  return json_unescape(json.substr(pos + 1, end - pos - 1));
}

std::string json_get_number(const std::string &json, const std::string &field) {
  const std::size_t pos = find_value_start(json, field);
  if (pos == std::string::npos || pos >= json.size() || json[pos] == '"') {
    return "";
  }
  const std::size_t end = scan_scalar_end(json, pos);
  return end > pos ? json.substr(pos, end - pos) : "";
}

std::string json_get_object(const std::string &json, const std::string &field) {
  return get_nested(json, field, '{', '}');
}

std::string json_get_array(const std::string &json, const std::string &field) {
  return get_nested(json, field, '[', ']');
}

std::optional<std::vector<double>> json_parse_number_array(const std::string &array_json) {
  std::size_t pos = json_skip_ws(array_json, 0);
  if (pos >= array_json.size() || array_json[pos] != '[') {
    return std::nullopt;
  }
  std::vector<double> values;
  ++pos;
  while (true) {
    pos = json_skip_ws(array_json, pos);
    if (pos >= array_json.size()) {
      return std::nullopt;
    }
    if (array_json[pos] == ']') {
      return values;
    }
    if (array_json[pos] == ',') {
      ++pos;
      continue;
    }
    const std::size_t end = scan_scalar_end(array_json, pos);
    const std::string token = array_json.substr(pos, end - pos);
    char *parse_end = nullptr;
    const double value = std::strtod(token.c_str(), &parse_end);
    if (token.empty() || parse_end != token.c_str() + token.size()) {
      return std::nullopt;
    }
    values.push_back(value);
    pos = end;
  }
}

std::vector<std::string> json_parse_string_array(const std::string &array_json) {
  std::vector<std::string> out;
  std::size_t pos = json_skip_ws(array_json, 0);
  if (pos >= array_json.size() || array_json[pos] != '[') {
    return out;
  }
  ++pos;
  while (pos < array_json.size()) {
    pos = json_skip_ws(array_json, pos);
    if (pos >= array_json.size() || array_json[pos] == ']') {
      break;
    }
    if (array_json[pos] == '"') {
      const auto end = json_find_string_end(array_json, pos);
      if (end == std::string::npos) {
        break;
      }
      out.push_back(json_unescape(array_json.substr(pos + 1, end - pos - 1)));
      pos = end + 1;
    } else {
      ++pos;
    }
  }
  return out;
}

std::vector<JsonMember> json_parse_members(const std::string &json) {
  std::vector<JsonMember> members;
  std::size_t pos = json_skip_ws(json, 0);
  if (pos >= json.size() || json[pos] != '{') {
    return members;
  }

  ++pos;
  while (pos < json.size()) {
    pos = json_skip_ws(json, pos);
    if (pos >= json.size() || json[pos] == '}') {
      break;
    }
    if (json[pos] == ',') {
      ++pos;
      continue;
    }
    if (json[pos] != '"') {
      break;
    }
    const auto key_end = json_find_string_end(json, pos);
    if (key_end == std::string::npos) {
      break;
    }
    JsonMember member;
    member.key = json_unescape(json.substr(pos + 1, key_end - pos - 1));

    pos = json_skip_ws(json, key_end + 1);
    if (pos >= json.size() || json[pos] != ':') {
      break;
    }
    pos = json_skip_ws(json, pos + 1);
    if (pos >= json.size()) {
      break;
    }

    const char lead = json[pos];
    if (lead == '"') {
      const auto val_end = json_find_string_end(json, pos);
      if (val_end == std::string::npos) {
        break;
      }
      member.value = json_unescape(json.substr(pos + 1, val_end - pos - 1));
      member.kind = JsonKind::String;
      pos = val_end + 1;
    } else if (lead == '{' || lead == '[') {
      const char close = lead == '{' ? '}' : ']';
      const auto end = json_find_matching_token(json, pos, lead, close);
      if (end == std::string::npos) {
        break;
      }
      member.value = json.substr(pos, end - pos + 1);
      member.kind = lead == '{' ? JsonKind::Object : JsonKind::Array;
      pos = end + 1;
    } else {
      const std::size_t end = scan_scalar_end(json, pos);
      member.value = json.substr(pos, end - pos);
      if (member.value == "true" || member.value == "false") {
        member.kind = JsonKind::Bool;
      } else if (member.value == "null") {
        member.kind = JsonKind::Null;
      } else {
        member.kind = JsonKind::Number;
      }
      pos = end;
    }
    members.push_back(std::move(member));
  }
  return members;
}

JsonFlatMap json_parse_flat(const std::string &json) {
  JsonFlatMap result;
  for (auto &member : json_parse_members(json)) {
    result[member.key] = std::move(member.value);
  }
  return result;
}

std::vector<std::string> json_split_top_level_objects(const std::string &array_json) {
  std::vector<std::string> out;
  const std::size_t open = json_skip_ws(array_json, 0);
  if (open >= array_json.size() || array_json[open] != '[') {
    return out;
  }

  bool in_string = false;
  bool escaped = false;
  std::size_t depth = 0;
  std::size_t current_start = std::string::npos;
  for (std::size_t i = open + 1; i < array_json.size(); ++i) {
    const char ch = array_json[i];
    if (in_string) {
      if (!escaped && ch == '"') {
        in_string = false;
      } else if (!escaped && ch == '\\') {
        escaped = true;
        continue;
      }
      escaped = false;
      continue;
    }
    if (ch == '"') {
      in_string = true;
      escaped = false;
      continue;
    }
    if (ch == '{') {
      if (depth == 0) {
        current_start = i;
      }
      ++depth;
      continue;
    }
    if (ch == '}') {
      if (depth == 0) {
        continue;
      }
      --depth;
      if (depth == 0 && current_start != std::string::npos) {
        out.push_back(array_json.substr(current_start, i - current_start + 1));
        current_start = std::string::npos;
      }
    }
  }
  return out;
}

} // namespace memoryos::common
