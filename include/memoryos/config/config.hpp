#pragma once

#include "memoryos/common/result.hpp"
#include "memoryos/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace memoryos::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
[[nodiscard]] bool config_exists();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();
[[nodiscard]] std::optional<std::filesystem::path> config_path_override();

/// Resolved, expanded data directory for the storage manager.
[[nodiscard]] std::filesystem::path data_dir(const Config &config);

[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] common::Result<Config> parse_config(const std::string &toml);
[[nodiscard]] common::Status save_config(const Config &config);

/// Returns warnings on success; hard errors fail.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

void apply_env_overrides(Config &config);

} // namespace memoryos::config
