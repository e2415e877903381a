#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace memoryos::common {

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Unescape a JSON string body (\n, \t, \", \\, \/ and \uXXXX to UTF-8).
[[nodiscard]] std::string json_unescape(const std::string &raw);

[[nodiscard]] std::size_t json_skip_ws(const std::string &text, std::size_t pos);

/// Find the closing quote of a JSON string starting at quote_pos.
[[nodiscard]] std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos);

/// Find matching bracket/brace for nested JSON structures.
[[nodiscard]] std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                                    char open_ch, char close_ch);

/// Extract a string field value from a JSON document.
[[nodiscard]] std::string json_get_string(const std::string &json, const std::string &field);

/// Extract a numeric field value (as string) from a JSON document.
[[nodiscard]] std::string json_get_number(const std::string &json, const std::string &field);

/// Extract a nested JSON object field (including braces) from a JSON document.
[[nodiscard]] std::string json_get_object(const std::string &json, const std::string &field);

/// Extract a nested JSON array field (including brackets) from a JSON document.
[[nodiscard]] std::string json_get_array(const std::string &json, const std::string &field);

/// Parse `[1, 2.5, -3e-2]`. Returns nullopt on any non-numeric element.
[[nodiscard]] std::optional<std::vector<double>>
json_parse_number_array(const std::string &array_json);

/// Parse `["a", "b"]`, skipping non-string elements.
[[nodiscard]] std::vector<std::string> json_parse_string_array(const std::string &array_json);

enum class JsonKind { String, Number, Bool, Null, Object, Array };

struct JsonMember {
  std::string key;
  std::string value;
  JsonKind kind = JsonKind::String;
};

/// Top-level members of an object in document order. String values are unescaped;
/// objects, arrays, numbers and literals are kept as raw JSON text.
[[nodiscard]] std::vector<JsonMember> json_parse_members(const std::string &json);

using JsonFlatMap = std::unordered_map<std::string, std::string>;
[[nodiscard]] JsonFlatMap json_parse_flat(const std::string &json);

/// Split a JSON array of objects into individual object strings.
[[nodiscard]] std::vector<std::string> json_split_top_level_objects(const std::string &array_json);

} // namespace memoryos::common
