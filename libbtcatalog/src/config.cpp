/**
 * @file config.cpp
 * @brief Configuration management implementation
 */

#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <set>
#include <sstream>
#include <string>

#include <pwd.h>
#include <unistd.h>

#include <nlohmann/json.hpp>

#include "btcatalog/config.h"
#include "btcatalog/naming.h"
#include "btcatalog/scan_source.h"

namespace fs = ::std::filesystem;

namespace btcatalog {

// ============================================================================
// CatalogConfig Methods
// ============================================================================

std::vector<std::string> CatalogConfig::default_source_priority() {
  return {SOURCE_BLE, SOURCE_CLASSIC, SOURCE_PLATFORM_REGISTRY};
}

void CatalogConfig::load_defaults() {
  default_duration_seconds = 5.0;
  grace_period_ms = 2000;
  source_priority = default_source_priority();
  enabled_sources.clear();
  concurrent = true;

  enrich = true;
  lookup_tables_path.clear();

  adapter.clear();

  log_level = "info";
  log_file.clear();
}

Result<void> CatalogConfig::validate() const {
  if (!std::isfinite(default_duration_seconds) ||
      default_duration_seconds <= 0.0) {
    return Error(ErrorCode::ConfigError,
                 "Default duration must be a positive number of seconds");
  }

  if (grace_period_ms < 0) {
    return Error(ErrorCode::ConfigError, "Grace period cannot be negative");
  }
  if (grace_period_ms > MAX_GRACE_PERIOD_MS) {
    return Error(ErrorCode::ConfigError, "Grace period exceeds one minute",
                 std::to_string(grace_period_ms));
  }

  std::set<std::string> seen;
  for (const auto &id : source_priority) {
    if (id.empty()) {
      return Error(ErrorCode::ConfigError,
                   "Source priority contains an empty entry");
    }
    if (!seen.insert(id).second) {
      return Error(ErrorCode::ConfigError,
                   "Source priority lists a source twice", id);
    }
  }

  for (const auto &id : enabled_sources) {
    if (id.empty()) {
      return Error(ErrorCode::ConfigError,
                   "Enabled sources contains an empty entry");
    }
  }

  if (!log::parse_level(log_level)) {
    return Error(ErrorCode::ConfigError, "Unknown log level", log_level);
  }

  return Result<void>::ok();
}

void CatalogConfig::apply_environment() {
  const char *level = std::getenv("BTCATALOG_LOG_LEVEL");
  if (level && log::parse_level(level)) {
    log_level = level;
  }

  const char *debug = std::getenv("BTCATALOG_DEBUG");
  if (debug) {
    std::string value = to_lower(trim(debug));
    if (value == "true" || value == "1" || value == "yes") {
      log_level = "debug";
    }
  }
}

log::LogConfig CatalogConfig::log_config() const {
  log::LogConfig config;
  config.level = log_level;
  config.file = log_file.string();
  return config;
}

fs::path CatalogConfig::get_default_config_dir() {
  // Linux: Use XDG_CONFIG_HOME or ~/.config
  const char *xdg_config = std::getenv("XDG_CONFIG_HOME");
  if (xdg_config && *xdg_config) {
    return fs::path(xdg_config) / "btcatalog";
  }

  const char *home = std::getenv("HOME");
  if (!home) {
    struct passwd *pw = getpwuid(getuid());
    if (pw) {
      home = pw->pw_dir;
    }
  }
  if (home) {
    return fs::path(home) / ".config" / "btcatalog";
  }

  return fs::path("/tmp/btcatalog");
}

// ============================================================================
// JSON Conversion
// ============================================================================

Result<CatalogConfig> parse_config(const std::string &json_text) {
  nlohmann::json j;
  try {
    j = nlohmann::json::parse(json_text);
  } catch (const nlohmann::json::parse_error &e) {
    return Error(ErrorCode::ConfigParseError, "Malformed configuration JSON",
                 e.what());
  }

  if (!j.is_object()) {
    return Error(ErrorCode::ConfigParseError,
                 "Configuration root must be an object");
  }

  CatalogConfig config;
  config.load_defaults();

  try {
    if (j.contains("default_duration_seconds")) {
      config.default_duration_seconds =
          j.at("default_duration_seconds").get<double>();
    }
    if (j.contains("grace_period_ms")) {
      config.grace_period_ms = j.at("grace_period_ms").get<int64_t>();
    }
    if (j.contains("source_priority")) {
      config.source_priority =
          j.at("source_priority").get<std::vector<std::string>>();
    }
    if (j.contains("enabled_sources")) {
      config.enabled_sources =
          j.at("enabled_sources").get<std::vector<std::string>>();
    }
    if (j.contains("concurrent")) {
      config.concurrent = j.at("concurrent").get<bool>();
    }
    if (j.contains("enrich")) {
      config.enrich = j.at("enrich").get<bool>();
    }
    if (j.contains("lookup_tables_path")) {
      config.lookup_tables_path =
          j.at("lookup_tables_path").get<std::string>();
    }
    if (j.contains("adapter")) {
      config.adapter = j.at("adapter").get<std::string>();
    }
    if (j.contains("log_level")) {
      config.log_level = j.at("log_level").get<std::string>();
    }
    if (j.contains("log_file")) {
      config.log_file = j.at("log_file").get<std::string>();
    }
  } catch (const nlohmann::json::exception &e) {
    return Error(ErrorCode::ConfigParseError,
                 "Configuration field has the wrong type", e.what());
  }

  return config;
}

std::string config_to_json(const CatalogConfig &config) {
  nlohmann::json j;
  j["default_duration_seconds"] = config.default_duration_seconds;
  j["grace_period_ms"] = config.grace_period_ms;
  j["source_priority"] = config.source_priority;
  j["enabled_sources"] = config.enabled_sources;
  j["concurrent"] = config.concurrent;
  j["enrich"] = config.enrich;
  j["lookup_tables_path"] = config.lookup_tables_path.string();
  j["adapter"] = config.adapter;
  j["log_level"] = config.log_level;
  j["log_file"] = config.log_file.string();
  return j.dump(4);
}

// ============================================================================
// ConfigManager Implementation
// ============================================================================

class ConfigManager::Impl {
public:
  CatalogConfig config;
  fs::path config_path;
  std::mutex mutex;

  Result<void> load_locked();
  Result<void> save_locked();
};

Result<void> ConfigManager::Impl::load_locked() {
  std::error_code ec;
  if (!fs::exists(config_path, ec)) {
    config.load_defaults();
    return Result<void>::ok();
  }

  std::ifstream in(config_path);
  if (!in) {
    return Error(ErrorCode::FileReadError, "Cannot open configuration file",
                 config_path.string());
  }

  std::ostringstream contents;
  contents << in.rdbuf();

  auto parsed = parse_config(contents.str());
  if (parsed.is_error()) {
    parsed.error().location = config_path.string();
    return parsed.error();
  }

  auto validation = parsed.value().validate();
  if (validation.is_error()) {
    validation.error().location = config_path.string();
    return validation;
  }

  config = std::move(parsed).value();
  return Result<void>::ok();
}

Result<void> ConfigManager::Impl::save_locked() {
  auto dir = config_path.parent_path();
  if (!dir.empty()) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
      return Error(ErrorCode::FileWriteError,
                   "Cannot create configuration directory",
                   dir.string() + ": " + ec.message());
    }
  }

  std::ofstream out(config_path, std::ios::trunc);
  if (!out) {
    return Error(ErrorCode::FileWriteError, "Cannot write configuration file",
                 config_path.string());
  }
  out << config_to_json(config) << '\n';
  if (!out) {
    return Error(ErrorCode::FileWriteError, "Failed writing configuration",
                 config_path.string());
  }
  return Result<void>::ok();
}

ConfigManager::ConfigManager() : impl_(std::make_unique<Impl>()) {
  impl_->config.load_defaults();
  impl_->config_path = CatalogConfig::get_default_config_dir() / "config.json";
}

ConfigManager::~ConfigManager() = default;

Result<void> ConfigManager::init(const fs::path &config_path) {
  std::lock_guard<std::mutex> lock(impl_->mutex);

  if (config_path.empty()) {
    impl_->config_path =
        CatalogConfig::get_default_config_dir() / "config.json";
  } else {
    impl_->config_path = config_path;
  }

  BTCATALOG_TRY(impl_->load_locked());
  impl_->config.apply_environment();
  return Result<void>::ok();
}

const CatalogConfig &ConfigManager::get() const { return impl_->config; }

CatalogConfig &ConfigManager::get_mutable() { return impl_->config; }

const fs::path &ConfigManager::config_path() const {
  return impl_->config_path;
}

Result<void> ConfigManager::set(const CatalogConfig &config) {
  auto validation = config.validate();
  if (validation.is_error()) {
    return validation;
  }

  std::lock_guard<std::mutex> lock(impl_->mutex);
  impl_->config = config;
  return Result<void>::ok();
}

Result<void> ConfigManager::load() {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  return impl_->load_locked();
}

Result<void> ConfigManager::save() {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  return impl_->save_locked();
}

void ConfigManager::reset_defaults() {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  impl_->config.load_defaults();
}

Result<void> ConfigManager::set_default_duration(double seconds) {
  if (!std::isfinite(seconds) || seconds <= 0.0) {
    return Error(ErrorCode::InvalidArgument,
                 "Duration must be a positive number of seconds");
  }

  std::lock_guard<std::mutex> lock(impl_->mutex);
  impl_->config.default_duration_seconds = seconds;
  return impl_->save_locked();
}

Result<void>
ConfigManager::set_source_priority(const std::vector<std::string> &priority) {
  CatalogConfig candidate = get();
  candidate.source_priority = priority;
  BTCATALOG_TRY(candidate.validate());

  std::lock_guard<std::mutex> lock(impl_->mutex);
  impl_->config.source_priority = priority;
  return impl_->save_locked();
}

} // namespace btcatalog
