#include "memoryos/config/config.hpp"

#include "memoryos/common/fs.hpp"
#include "memoryos/common/toml.hpp"

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace memoryos::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".memoryos";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("MEMORYOS_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::string strip_env_quotes(const std::string &raw) {
  std::string value = common::trim(raw);
  if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
      value.back() == value.front()) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

bool is_valid_env_name(const std::string &name) {
  if (name.empty()) {
    return false;
  }
  if (!(std::isalpha(static_cast<unsigned char>(name.front())) != 0 || name.front() == '_')) {
    return false;
  }
  for (const char ch : name) {
    if (!(std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '_')) {
      return false;
    }
  }
  return true;
}

void set_env_if_missing(const std::string &name, const std::string &value) {
  if (!is_valid_env_name(name)) {
    return;
  }
  if (const char *existing = std::getenv(name.c_str()); existing != nullptr && *existing != '\0') {
    return;
  }
  setenv(name.c_str(), value.c_str(), 0);
}

void load_dotenv_file(const std::filesystem::path &path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return;
  }

  std::ifstream file(path);
  std::string line;
  while (std::getline(file, line)) {
    std::string trimmed = common::trim(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }
    if (common::starts_with(trimmed, "export ")) {
      trimmed = common::trim(trimmed.substr(7));
    }
    const auto eq = trimmed.find('=');
    if (eq == std::string::npos) {
      continue;
    }
    set_env_if_missing(common::trim(trimmed.substr(0, eq)), strip_env_quotes(trimmed.substr(eq + 1)));
  }
}

void load_dotenv_files() {
  // Config dir .env wins over the working directory one.
  if (auto dir = config_dir(); dir.ok()) {
    load_dotenv_file(dir.value() / ".env");
  }
  std::error_code ec;
  const auto cwd = std::filesystem::current_path(ec);
  if (!ec) {
    load_dotenv_file(cwd / ".env");
  }
}

const char *env_value(const char *name) {
  const char *value = std::getenv(name);
  return value != nullptr && *value != '\0' ? value : nullptr;
}

std::string bool_to_toml(bool value) { return value ? "true" : "false"; }

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::ensure_dir(*override_path);
    }
    auto parent = override_path->parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure(
            common::ErrorCode::Io, "unable to resolve current directory");
      }
    }
    return common::ensure_dir(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.status());
  }
  return common::ensure_dir(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return cfg_dir;
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  return path.ok() && std::filesystem::exists(path.value());
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

std::optional<std::filesystem::path> config_path_override() {
  return resolved_config_path_override();
}

std::filesystem::path data_dir(const Config &config) {
  if (common::trim(config.storage.data_dir).empty()) {
    return std::filesystem::path(".");
  }
  return std::filesystem::path(common::expand_path(config.storage.data_dir));
}

void apply_env_overrides(Config &config) {
  if (const char *dir = env_value("MEMORYOS_DATA_DIR")) {
    config.storage.data_dir = dir;
  }
  if (const char *provider = env_value("MEMORYOS_TEXT_PROVIDER")) {
    config.embedding.text_provider = common::to_lower(provider);
  }
  if (const char *model = env_value("MEMORYOS_TEXT_MODEL")) {
    config.embedding.text_model = model;
  }
  if (const char *dims = env_value("MEMORYOS_TEXT_DIMENSIONS")) {
    std::size_t parsed = 0;
    const std::string raw = dims;
    auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), parsed);
    if (ec == std::errc() && ptr == raw.data() + raw.size()) {
      config.embedding.text_dimensions = parsed;
    }
  }
  if (const char *url = env_value("MEMORYOS_OLLAMA_URL")) {
    config.embedding.ollama_url = url;
  }
  if (const char *backend = env_value("MEMORYOS_OBSERVABILITY")) {
    config.observability.backend = backend;
  }
}

common::Result<Config> parse_config(const std::string &toml) {
  const auto parsed = common::parse_toml(toml);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.status());
  }
  const auto &doc = parsed.value();

  Config config;
  config.storage.data_dir = doc.get_string("storage.data_dir", config.storage.data_dir);
  config.storage.flush_every =
      static_cast<std::size_t>(doc.get_u64("storage.flush_every", config.storage.flush_every));
  config.storage.auto_reconcile =
      doc.get_bool("storage.auto_reconcile", config.storage.auto_reconcile);

  auto &embedding = config.embedding;
  embedding.text_provider =
      common::to_lower(doc.get_string("embedding.text_provider", embedding.text_provider));
  embedding.text_model = doc.get_string("embedding.text_model", embedding.text_model);
  embedding.text_dimensions = static_cast<std::size_t>(
      doc.get_u64("embedding.text_dimensions", embedding.text_dimensions));
  embedding.ollama_url = doc.get_string("embedding.ollama_url", embedding.ollama_url);
  embedding.timeout_ms =
      static_cast<std::size_t>(doc.get_u64("embedding.timeout_ms", embedding.timeout_ms));
  embedding.image_provider =
      common::to_lower(doc.get_string("embedding.image_provider", embedding.image_provider));
  embedding.visual_dimensions = static_cast<std::size_t>(
      doc.get_u64("embedding.visual_dimensions", embedding.visual_dimensions));
  embedding.cache_size =
      static_cast<std::size_t>(doc.get_u64("embedding.cache_size", embedding.cache_size));

  config.chunking.max_chars =
      static_cast<std::size_t>(doc.get_u64("chunking.max_chars", config.chunking.max_chars));
  config.chunking.overlap_chars = static_cast<std::size_t>(
      doc.get_u64("chunking.overlap_chars", config.chunking.overlap_chars));

  config.search.fan_out_factor = static_cast<std::size_t>(
      doc.get_u64("search.fan_out_factor", config.search.fan_out_factor));
  config.search.default_top_k = static_cast<std::size_t>(
      doc.get_u64("search.default_top_k", config.search.default_top_k));
  config.search.visual_min_score =
      doc.get_double("search.visual_min_score", config.search.visual_min_score);

  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);

  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  load_dotenv_files();

  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.status());
  }

  const auto path = cfg_path_result.value();
  Config config;
  if (std::filesystem::exists(path)) {
    auto content = common::read_file(path);
    if (!content.ok()) {
      return common::Result<Config>::failure(content.status());
    }
    auto parsed = parse_config(content.value());
    if (!parsed.ok()) {
      return common::Result<Config>::failure(parsed.code(), path.string() + ": " + parsed.error());
    }
    config = std::move(parsed.value());
  }

  apply_env_overrides(config);
  return common::Result<Config>::success(std::move(config));
}

common::Status save_config(const Config &config) {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return cfg_path_result.status();
  }
  const std::filesystem::path path = cfg_path_result.value();
  if (!path.parent_path().empty()) {
    if (auto ensured = common::ensure_dir(path.parent_path()); !ensured.ok()) {
      return ensured.status();
    }
  }

  std::ostringstream file;
  file << "[storage]\n";
  file << "data_dir = " << common::quote_toml_string(config.storage.data_dir) << "\n";
  file << "flush_every = " << config.storage.flush_every << "\n";
  file << "auto_reconcile = " << bool_to_toml(config.storage.auto_reconcile) << "\n";

  file << "\n[embedding]\n";
  file << "text_provider = " << common::quote_toml_string(config.embedding.text_provider) << "\n";
  file << "text_model = " << common::quote_toml_string(config.embedding.text_model) << "\n";
  file << "text_dimensions = " << config.embedding.text_dimensions << "\n";
  file << "ollama_url = " << common::quote_toml_string(config.embedding.ollama_url) << "\n";
  file << "timeout_ms = " << config.embedding.timeout_ms << "\n";
  file << "image_provider = " << common::quote_toml_string(config.embedding.image_provider)
       << "\n";
  file << "visual_dimensions = " << config.embedding.visual_dimensions << "\n";
  file << "cache_size = " << config.embedding.cache_size << "\n";

  file << "\n[chunking]\n";
  file << "max_chars = " << config.chunking.max_chars << "\n";
  file << "overlap_chars = " << config.chunking.overlap_chars << "\n";

  file << "\n[search]\n";
  file << "fan_out_factor = " << config.search.fan_out_factor << "\n";
  file << "default_top_k = " << config.search.default_top_k << "\n";
  file << "visual_min_score = " << config.search.visual_min_score << "\n";

  file << "\n[observability]\n";
  file << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";

  return common::write_file_atomic(path, file.str());
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  using ValidationResult = common::Result<std::vector<std::string>>;
  std::vector<std::string> warnings;

  const auto &embedding = config.embedding;
  if (embedding.text_provider != "local" && embedding.text_provider != "ollama") {
    return ValidationResult::failure(common::ErrorCode::InvalidArgument,
                                     "Unknown embedding.text_provider: " +
                                         embedding.text_provider);
  }
  if (embedding.image_provider != "local") {
    return ValidationResult::failure(common::ErrorCode::InvalidArgument,
                                     "Unknown embedding.image_provider: " +
                                         embedding.image_provider);
  }
  if (embedding.text_dimensions != 384 && embedding.text_dimensions != 1024) {
    return ValidationResult::failure(common::ErrorCode::InvalidArgument,
                                     "embedding.text_dimensions must be 384 or 1024");
  }
  if (embedding.visual_dimensions != 512) {
    return ValidationResult::failure(common::ErrorCode::InvalidArgument,
                                     "embedding.visual_dimensions must be 512");
  }
  if (embedding.text_provider == "ollama" && embedding.text_dimensions == 384) {
    warnings.push_back("ollama text models usually emit 1024-d vectors; text_dimensions is 384");
  }
  if (embedding.text_provider == "ollama" && common::trim(embedding.ollama_url).empty()) {
    return ValidationResult::failure(common::ErrorCode::InvalidArgument,
                                     "embedding.ollama_url is required for the ollama provider");
  }

  if (config.chunking.max_chars == 0) {
    return ValidationResult::failure(common::ErrorCode::InvalidArgument,
                                     "chunking.max_chars must be greater than zero");
  }
  if (config.chunking.overlap_chars >= config.chunking.max_chars) {
    return ValidationResult::failure(common::ErrorCode::InvalidArgument,
                                     "chunking.overlap_chars must be smaller than max_chars");
  }

  if (config.search.fan_out_factor == 0) {
    return ValidationResult::failure(common::ErrorCode::InvalidArgument,
                                     "search.fan_out_factor must be at least 1");
  }
  if (config.search.default_top_k == 0) {
    warnings.push_back("search.default_top_k is 0; searches without an explicit top_k return nothing");
  }
  if (config.search.visual_min_score < -1.0 || config.search.visual_min_score > 1.0) {
    return ValidationResult::failure(common::ErrorCode::InvalidArgument,
                                     "search.visual_min_score must be between -1.0 and 1.0");
  }

  if (common::trim(config.storage.data_dir).empty()) {
    warnings.push_back("storage.data_dir is empty; the current directory will be used");
  }

  return ValidationResult::success(std::move(warnings));
}

} // namespace memoryos::config
