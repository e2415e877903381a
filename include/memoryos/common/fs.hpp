#pragma once

#include "memoryos/common/result.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace memoryos::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] std::string to_lower(std::string value);
/// Collapses every whitespace run to one space and trims both ends.
[[nodiscard]] std::string collapse_whitespace(const std::string &input);
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
[[nodiscard]] std::string expand_path(std::string value);

[[nodiscard]] Result<std::string> read_file(const std::filesystem::path &path);
[[nodiscard]] Result<std::vector<std::uint8_t>> read_binary_file(const std::filesystem::path &path);
/// Writes to "<path>.tmp" and renames over path, so readers never see a torn file.
[[nodiscard]] Status write_file_atomic(const std::filesystem::path &path, const std::string &data);

} // namespace memoryos::common
