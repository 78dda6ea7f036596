/**
 * @file config.h
 * @brief User configuration for btcatalog
 */

#ifndef BTCATALOG_CONFIG_H
#define BTCATALOG_CONFIG_H

#include "error.h"
#include "log.h"
#include "platform.h"
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace btcatalog {

// ============================================================================
// Catalog Configuration
// ============================================================================

/// Largest grace period validate() accepts
constexpr int64_t MAX_GRACE_PERIOD_MS = 60000;

/**
 * @brief Complete configuration for discovery and aggregation
 */
struct CatalogConfig {
  // ========================================================================
  // Scanning
  // ========================================================================

  /// Scan duration used when a request does not name one
  double default_duration_seconds = 5.0;

  /// Extra time a source gets beyond the scan duration
  int64_t grace_period_ms = 2000;

  /// Merge priority, highest first. Unlisted sources rank after these.
  std::vector<std::string> source_priority = default_source_priority();

  /// Sources to run by default (empty = every registered source)
  std::vector<std::string> enabled_sources;

  /// Run sources concurrently by default
  bool concurrent = true;

  // ========================================================================
  // Enrichment
  // ========================================================================

  /// Run the enrichment pass after merging
  bool enrich = true;

  /// Versioned JSON lookup tables (empty = built-in tables)
  std::filesystem::path lookup_tables_path;

  // ========================================================================
  // Platform
  // ========================================================================

  /// BlueZ adapter name ("hci0"), empty for the first adapter found
  std::string adapter;

  // ========================================================================
  // Logging
  // ========================================================================

  std::string log_level = "info";
  std::filesystem::path log_file;

  // ========================================================================
  // Methods
  // ========================================================================

  /// Reset every field to its default
  void load_defaults();

  /// Validate configuration
  Result<void> validate() const;

  /// Apply BTCATALOG_LOG_LEVEL and BTCATALOG_DEBUG from the environment
  void apply_environment();

  /// Logging settings derived from this configuration
  log::LogConfig log_config() const;

  /// $XDG_CONFIG_HOME/btcatalog, falling back to ~/.config/btcatalog
  static std::filesystem::path get_default_config_dir();

  /// Default source priority: ble, classic, platform-registry
  static std::vector<std::string> default_source_priority();
};

/// Parse a JSON document; missing keys keep their defaults
BTCATALOG_API Result<CatalogConfig> parse_config(const std::string &json_text);

/// Render a configuration as pretty-printed JSON
BTCATALOG_API std::string config_to_json(const CatalogConfig &config);

// ============================================================================
// Configuration Manager
// ============================================================================

/**
 * @brief Manages loading, saving, and validating configuration
 */
class BTCATALOG_API ConfigManager {
public:
  ConfigManager();
  ~ConfigManager();

  // Non-copyable
  ConfigManager(const ConfigManager &) = delete;
  ConfigManager &operator=(const ConfigManager &) = delete;

  // ========================================================================
  // Initialization
  // ========================================================================

  /**
   * @brief Initialize with config file path
   * @param config_path Path to config file (default location if empty)
   * @return Success, or the error of an existing but unreadable file
   *
   * A missing file leaves the defaults in place. Environment overrides are
   * applied after loading.
   */
  Result<void> init(const std::filesystem::path &config_path = {});

  // ========================================================================
  // Configuration Access
  // ========================================================================

  const CatalogConfig &get() const;

  /**
   * @brief Get mutable configuration reference
   *
   * After modifying, call save() to persist changes.
   */
  CatalogConfig &get_mutable();

  /// Replace the configuration after validating it
  Result<void> set(const CatalogConfig &config);

  const std::filesystem::path &config_path() const;

  // ========================================================================
  // Persistence
  // ========================================================================

  /// Load configuration from file
  Result<void> load();

  /// Save configuration to file, creating its directory if needed
  Result<void> save();

  /// Reset to defaults
  void reset_defaults();

  // ========================================================================
  // Individual Settings
  // ========================================================================

  Result<void> set_default_duration(double seconds);
  Result<void> set_source_priority(const std::vector<std::string> &priority);

private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace btcatalog

#endif // BTCATALOG_CONFIG_H
