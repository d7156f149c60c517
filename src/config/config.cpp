#include "memorybank/config/config.hpp"

#include "memorybank/common/fs.hpp"
#include "memorybank/common/toml.hpp"

#include <charconv>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>

namespace memorybank::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".memorybank";
constexpr const char *CONFIG_FILENAME = "config.toml";
constexpr const char *DEFAULT_STORE_DIR = "memory-bank";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return g_config_path_override;
  }
  if (const char *env = std::getenv("MEMORYBANK_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::string expand_config_value(const std::string &value) {
  if (value.find('$') == std::string::npos && value.find('~') == std::string::npos) {
    return value;
  }
  return common::expand_path(value);
}

std::string bool_to_toml(const bool value) { return value ? "true" : "false"; }

bool is_known_level(const std::string &level) {
  return level == "debug" || level == "info" || level == "warn" || level == "error";
}

bool is_known_backend(const std::string &backend) {
  return backend == "log" || backend == "none" || backend == "noop";
}

std::vector<std::string> split_backends(const std::string &value) {
  std::vector<std::string> out;
  std::stringstream stream(value);
  std::string item;
  while (std::getline(stream, item, ',')) {
    item = common::to_lower(common::trim(item));
    if (!item.empty()) {
      out.push_back(item);
    }
  }
  return out;
}

common::Status read_u64(const common::TomlDocument &doc, const std::string &key,
                        std::uint64_t &target) {
  if (!doc.has(key)) {
    return common::Status::success();
  }
  const auto value = doc.find_u64(key);
  if (!value.has_value()) {
    return common::Status::error(common::ErrorCode::ConfigError,
                                 key + " must be a non-negative integer");
  }
  target = *value;
  return common::Status::success();
}

common::Status read_u32(const common::TomlDocument &doc, const std::string &key,
                        std::uint32_t &target) {
  std::uint64_t value = target;
  auto status = read_u64(doc, key, value);
  if (!status.ok()) {
    return status;
  }
  if (value > std::numeric_limits<std::uint32_t>::max()) {
    return common::Status::error(common::ErrorCode::ConfigError,
                                 key + " is out of range: " + std::to_string(value));
  }
  target = static_cast<std::uint32_t>(value);
  return common::Status::success();
}

common::Status read_bool(const common::TomlDocument &doc, const std::string &key, bool &target) {
  if (!doc.has(key)) {
    return common::Status::success();
  }
  const auto value = doc.find_bool(key);
  if (!value.has_value()) {
    return common::Status::error(common::ErrorCode::ConfigError, key + " must be true or false");
  }
  target = *value;
  return common::Status::success();
}

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
            common::ErrorCode::ConfigError, "unable to resolve current directory", ec.message());
      }
    }
    return common::ensure_dir(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.details());
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
    return common::Result<std::filesystem::path>::failure(cfg_dir.details());
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  std::error_code ec;
  return path.ok() && std::filesystem::exists(path.value(), ec);
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

void apply_env_overrides(Config &config) {
  if (const char *root = std::getenv("MEMORYBANK_ROOT"); root != nullptr && *root != '\0') {
    config.store.root = common::expand_path(root);
  }

  if (const char *level = std::getenv("MEMORYBANK_LOG_LEVEL"); level != nullptr && *level != '\0') {
    config.observability.level = common::to_lower(common::trim(level));
  }

  if (const char *size = std::getenv("MEMORYBANK_CACHE_MAX_SIZE");
      size != nullptr && *size != '\0') {
    const std::string raw = common::trim(size);
    std::size_t parsed = 0;
    const auto *first = raw.data();
    const auto *last = first + raw.size();
    auto [ptr, ec] = std::from_chars(first, last, parsed);
    if (ec == std::errc() && ptr == last) {
      config.cache.max_size = parsed;
    }
  }
}

common::Result<Config> parse_config(const std::string &content) {
  const auto parsed = common::parse_toml(content);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.details());
  }
  const auto &doc = parsed.value();

  Config config;

  if (doc.has("store.root")) {
    config.store.root = expand_config_value(doc.get_string("store.root"));
  }

  std::uint64_t cache_size = config.cache.max_size;

  for (const auto &status :
       {read_u64(doc, "cache.max_size", cache_size),
        read_u64(doc, "cache.max_age_ms", config.cache.max_age_ms),
        read_bool(doc, "cache.enable_metrics", config.cache.enable_metrics),
        read_u32(doc, "retry.max_attempts", config.retry.max_attempts),
        read_u64(doc, "retry.base_delay_ms", config.retry.base_delay_ms),
        read_u64(doc, "retry.max_delay_ms", config.retry.max_delay_ms),
        read_bool(doc, "index.enabled", config.index.enabled),
        read_bool(doc, "index.persist", config.index.persist),
        read_u32(doc, "index.max_age_hours", config.index.max_age_hours),
        read_u64(doc, "streaming.size_threshold", config.streaming.size_threshold),
        read_u64(doc, "streaming.chunk_size", config.streaming.chunk_size),
        read_u64(doc, "streaming.timeout_ms", config.streaming.timeout_ms)}) {
    if (!status.ok()) {
      return common::Result<Config>::failure(status.details());
    }
  }
  config.cache.max_size = static_cast<std::size_t>(cache_size);

  if (doc.has("retry.backoff_factor")) {
    const auto factor = doc.find_double("retry.backoff_factor");
    if (!factor.has_value()) {
      return common::Result<Config>::failure(common::ErrorCode::ConfigError,
                                             "retry.backoff_factor must be a number");
    }
    config.retry.backoff_factor = *factor;
  }

  if (doc.has("index.path")) {
    config.index.path = doc.get_string("index.path");
  }
  if (doc.has("observability.backend")) {
    config.observability.backend = common::to_lower(doc.get_string("observability.backend"));
  }
  if (doc.has("observability.level")) {
    config.observability.level = common::to_lower(doc.get_string("observability.level"));
  }

  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.details());
  }

  const auto path = cfg_path_result.value();
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    Config config;
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  std::ifstream file(path);
  if (!file) {
    return common::Result<Config>::failure(common::ErrorCode::ConfigError,
                                           "Unable to open config file: " + path.string());
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  auto parsed = parse_config(buffer.str());
  if (!parsed.ok()) {
    return parsed;
  }

  Config config = std::move(parsed.value());
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
    std::error_code ensure_ec;
    std::filesystem::create_directories(path.parent_path(), ensure_ec);
    if (ensure_ec) {
      return common::Status::error(common::ErrorCode::ConfigError,
                                   "Failed to create config directory", ensure_ec.message());
    }
  }
  const std::filesystem::path tmp_path = path.string() + ".tmp";

  std::ofstream file(tmp_path, std::ios::trunc);
  if (!file) {
    return common::Status::error(common::ErrorCode::ConfigError,
                                 "Unable to write temporary config file");
  }

  file << "[store]\n";
  file << "root = " << common::quote_toml_string(config.store.root) << "\n";

  file << "\n[cache]\n";
  file << "max_size = " << config.cache.max_size << "\n";
  file << "max_age_ms = " << config.cache.max_age_ms << "\n";
  file << "enable_metrics = " << bool_to_toml(config.cache.enable_metrics) << "\n";

  file << "\n[retry]\n";
  file << "max_attempts = " << config.retry.max_attempts << "\n";
  file << "base_delay_ms = " << config.retry.base_delay_ms << "\n";
  file << "max_delay_ms = " << config.retry.max_delay_ms << "\n";
  file << "backoff_factor = " << config.retry.backoff_factor << "\n";

  file << "\n[index]\n";
  file << "enabled = " << bool_to_toml(config.index.enabled) << "\n";
  file << "persist = " << bool_to_toml(config.index.persist) << "\n";
  file << "path = " << common::quote_toml_string(config.index.path) << "\n";
  file << "max_age_hours = " << config.index.max_age_hours << "\n";

  file << "\n[streaming]\n";
  file << "size_threshold = " << config.streaming.size_threshold << "\n";
  file << "chunk_size = " << config.streaming.chunk_size << "\n";
  file << "timeout_ms = " << config.streaming.timeout_ms << "\n";

  file << "\n[observability]\n";
  file << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";
  file << "level = " << common::quote_toml_string(config.observability.level) << "\n";

  file.close();
  if (!file) {
    return common::Status::error(common::ErrorCode::ConfigError,
                                 "Failed writing temporary config file");
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, path, ec);
  if (ec) {
    std::filesystem::remove(tmp_path, ec);
    return common::Status::error(common::ErrorCode::ConfigError,
                                 "Failed to atomically replace config", ec.message());
  }

  return common::Status::success();
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  using Warnings = common::Result<std::vector<std::string>>;
  std::vector<std::string> warnings;

  if (config.cache.max_size == 0) {
    return Warnings::failure(common::ErrorCode::ConfigError, "cache.max_size must be at least 1");
  }
  if (config.cache.max_age_ms == 0) {
    warnings.push_back("cache.max_age_ms is 0; every access will reload from disk");
  }

  if (config.retry.max_attempts == 0) {
    return Warnings::failure(common::ErrorCode::ConfigError,
                             "retry.max_attempts must be at least 1");
  }
  if (config.retry.backoff_factor < 1.0) {
    return Warnings::failure(common::ErrorCode::ConfigError,
                             "retry.backoff_factor must be >= 1.0");
  }
  if (config.retry.max_delay_ms < config.retry.base_delay_ms) {
    warnings.push_back("retry.max_delay_ms is below retry.base_delay_ms; delays are capped");
  }

  if (config.index.enabled) {
    const std::filesystem::path index_path(config.index.path);
    if (config.index.path.empty()) {
      return Warnings::failure(common::ErrorCode::ConfigError, "index.path must not be empty");
    }
    if (index_path.is_absolute() || config.index.path.find("..") != std::string::npos) {
      return Warnings::failure(common::ErrorCode::ConfigError,
                               "index.path must stay inside the store root: " + config.index.path);
    }
  } else if (config.index.persist) {
    warnings.push_back("index.persist has no effect while index.enabled is false");
  }

  if (config.streaming.chunk_size == 0) {
    return Warnings::failure(common::ErrorCode::ConfigError,
                             "streaming.chunk_size must be at least 1");
  }
  if (config.streaming.timeout_ms == 0) {
    return Warnings::failure(common::ErrorCode::ConfigError,
                             "streaming.timeout_ms must be at least 1");
  }
  if (config.streaming.chunk_size > config.streaming.size_threshold) {
    warnings.push_back("streaming.chunk_size exceeds streaming.size_threshold; streamed files "
                       "arrive in a single chunk");
  }

  const auto backends = split_backends(config.observability.backend);
  if (backends.empty()) {
    return Warnings::failure(common::ErrorCode::ConfigError,
                             "observability.backend must not be empty");
  }
  for (const auto &backend : backends) {
    if (!is_known_backend(backend)) {
      return Warnings::failure(common::ErrorCode::ConfigError,
                               "Invalid observability.backend: " + backend);
    }
  }
  if (!is_known_level(config.observability.level)) {
    return Warnings::failure(common::ErrorCode::ConfigError,
                             "Invalid observability.level: " + config.observability.level);
  }

  return Warnings::success(std::move(warnings));
}

common::Result<std::filesystem::path> resolve_store_root(const Config &config) {
  std::filesystem::path root = config.store.root.empty()
                                   ? std::filesystem::path(DEFAULT_STORE_DIR)
                                   : std::filesystem::path(expand_config_value(config.store.root));
  if (root.is_relative()) {
    std::error_code ec;
    const auto cwd = std::filesystem::current_path(ec);
    if (ec) {
      return common::Result<std::filesystem::path>::failure(
          common::ErrorCode::ConfigError, "unable to resolve current directory", ec.message());
    }
    root = cwd / root;
  }
  root = root.lexically_normal();
  if (root.filename().empty() && root.has_relative_path()) {
    root = root.parent_path();
  }
  return common::Result<std::filesystem::path>::success(root);
}

} // namespace memorybank::config
