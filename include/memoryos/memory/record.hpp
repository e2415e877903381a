#pragma once

#include "memoryos/common/result.hpp"
#include "memoryos/memory/types.hpp"

#include <string>
#include <vector>

namespace memoryos::memory {

/// Parses one collector JSON record. Members other than the common ones land in
/// `fields`; members of nested "*_details" objects are lifted to the top level.
[[nodiscard]] common::Result<MemoryItem> parse_record(const std::string &json);

struct ParsedRecords {
  std::vector<MemoryItem> items;
  /// One message per record that failed to parse, prefixed with its position.
  std::vector<std::string> errors;
};

/// Accepts a JSON array of records, or newline-delimited records.
[[nodiscard]] ParsedRecords parse_records(const std::string &text);

[[nodiscard]] std::string record_to_json(const MemoryItem &item);

[[nodiscard]] std::string fields_to_json(const ExtensionFields &fields);
[[nodiscard]] ExtensionFields fields_from_json(const std::string &json);

} // namespace memoryos::memory
