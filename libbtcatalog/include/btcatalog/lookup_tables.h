/**
 * @file lookup_tables.h
 * @brief Static manufacturer and MAC-prefix tables used by enrichment
 *
 * The tables are data, not logic: a built-in snapshot ships with the
 * library and a newer one can be loaded from a versioned JSON file:
 *
 * @code
 *   {
 *     "version": "2024.1",
 *     "manufacturers": { "76": "Apple, Inc." },
 *     "prefixes": {
 *       "14:0C:76": { "company": "Freebox SA", "device_type": "Freebox",
 *                     "model": "Freebox Player", "friendly_name": "Freebox Player" }
 *     }
 *   }
 * @endcode
 *
 * Tables are built once at startup and never mutated afterwards.
 */

#ifndef BTCATALOG_LOOKUP_TABLES_H
#define BTCATALOG_LOOKUP_TABLES_H

#include "error.h"
#include "platform.h"
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace btcatalog {

/**
 * @brief What a MAC prefix tells us about a device
 */
struct VendorHint {
  std::string company;
  std::string device_type; // Category: "Mobile", "Audio", "Freebox", ...
  std::string model;
  std::string friendly_name;
};

/**
 * @brief Read-only lookup tables
 */
class BTCATALOG_API LookupTables {
public:
  LookupTables() = default;

  /// Snapshot compiled into the library
  static LookupTables builtin();

  /// Load a versioned JSON table file
  static Result<LookupTables> load(const std::filesystem::path &path);

  /// Parse a JSON document (same format as load())
  static Result<LookupTables> parse(const std::string &json_text);

  /// Bluetooth SIG company identifier to name
  std::optional<std::string> company_name(uint16_t company_id) const;

  /// Hint for the address's OUI, nullopt for opaque identifiers or misses
  std::optional<VendorHint> vendor_hint(const std::string &address) const;

  const std::string &version() const { return version_; }
  size_t manufacturer_count() const { return manufacturers_.size(); }
  size_t prefix_count() const { return prefixes_.size(); }

  void add_manufacturer(uint16_t company_id, std::string name);
  void add_prefix(const std::string &prefix, VendorHint hint);
  void set_version(std::string version) { version_ = std::move(version); }

private:
  std::string version_;
  std::map<uint16_t, std::string> manufacturers_;
  std::map<std::string, VendorHint> prefixes_; // Keyed by "AA:BB:CC"
};

} // namespace btcatalog

#endif // BTCATALOG_LOOKUP_TABLES_H
