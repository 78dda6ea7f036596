/**
 * @file btcatalog.h
 * @brief Main btcatalog API Header
 *
 * btcatalog - Multi-source Bluetooth device catalog
 *
 * Runs several Bluetooth scan sources (BLE discovery, classic inquiry, the
 * adapter's registry of known devices), merges what they report into one
 * record per physical device and enriches the records with vendor and
 * manufacturer names.
 *
 * Quick Start:
 * @code
 *   #include <btcatalog/btcatalog.h>
 *
 *   btcatalog::Catalog catalog;
 *   catalog.init(config);
 *
 *   auto result = catalog.scan(btcatalog::ScanPreset::Fast);
 *   if (result) {
 *       std::cout << btcatalog::to_json(result.value()) << std::endl;
 *   }
 * @endcode
 */

#ifndef BTCATALOG_BTCATALOG_H
#define BTCATALOG_BTCATALOG_H

// Core headers (in dependency order)
#include "error.h"
#include "platform.h"
#include "types.h"

// Feature modules (in dependency order)
#include "address.h"
#include "aggregator.h"
#include "config.h"
#include "device_class.h"
#include "enrichment.h"
#include "log.h"
#include "lookup_tables.h"
#include "merger.h"
#include "naming.h"
#include "scan_request.h"
#include "scan_source.h"
#include "serialization.h"

#include <memory>

namespace btcatalog {

// ============================================================================
// Version Information
// ============================================================================

constexpr int VERSION_MAJOR = 1;
constexpr int VERSION_MINOR = 0;
constexpr int VERSION_PATCH = 0;
constexpr const char *VERSION_STRING = "1.0.0";

/**
 * @brief Get version information
 */
struct VersionInfo {
  int major = VERSION_MAJOR;
  int minor = VERSION_MINOR;
  int patch = VERSION_PATCH;
  const char *version_string = VERSION_STRING;
  const char *build_date = __DATE__;
  const char *build_time = __TIME__;
};

BTCATALOG_API VersionInfo get_version();

// ============================================================================
// Startup Helpers
// ============================================================================

/**
 * @brief Lookup tables named by the configuration
 *
 * Built-in tables when lookup_tables_path is empty.
 */
BTCATALOG_API Result<LookupTables>
load_lookup_tables(const CatalogConfig &config);

/**
 * @brief Registry holding the BlueZ sources
 *
 * Registers ble, classic and platform-registry on the configured adapter.
 */
BTCATALOG_API Result<SourceRegistry>
create_default_registry(const CatalogConfig &config);

// ============================================================================
// Catalog
// ============================================================================

/**
 * @brief Owns the lookup tables, sources and aggregator of one process
 */
class BTCATALOG_API Catalog {
public:
  Catalog();
  ~Catalog();

  // Non-copyable
  Catalog(const Catalog &) = delete;
  Catalog &operator=(const Catalog &) = delete;

  /**
   * @brief Initialize with the BlueZ sources
   * @param config Validated configuration
   */
  Result<void> init(const CatalogConfig &config);

  /**
   * @brief Initialize with caller-provided sources
   */
  Result<void> init(const CatalogConfig &config, SourceRegistry sources);

  bool is_initialized() const;

  /// Run one aggregation
  Result<AggregationResult> scan(const ScanRequest &request) const;

  /// Run one aggregation with a preset request
  Result<AggregationResult> scan(ScanPreset preset) const;

  const CatalogConfig &config() const;
  const LookupTables &lookup_tables() const;
  const SourceRegistry &sources() const;

private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace btcatalog

#endif // BTCATALOG_BTCATALOG_H
