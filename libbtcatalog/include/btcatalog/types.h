/**
 * @file types.h
 * @brief Core type definitions for btcatalog
 */

#ifndef BTCATALOG_TYPES_H
#define BTCATALOG_TYPES_H

#include "error.h"
#include "platform.h"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace btcatalog {

// ============================================================================
// Basic Types
// ============================================================================

using Byte = uint8_t;
using Bytes = std::vector<Byte>;

/// Byte blobs keyed by a string (company id in decimal, service UUID)
using KeyedBytes = std::map<std::string, Bytes>;

// ============================================================================
// Attributes
// ============================================================================

/**
 * @brief One typed value of the schema-less attribute bag
 *
 * Alternative order is part of the JSON contract (see serialization.h).
 */
using AttributeValue =
    std::variant<bool, int64_t, std::string, std::vector<int64_t>,
                 std::vector<std::string>, Bytes, KeyedBytes>;

/// Attributes are kept sorted by key so serialized output is stable
using AttributeMap = std::map<std::string, AttributeValue>;

/// Well-known attribute keys
namespace attr {
constexpr const char *MANUFACTURER_DATA = "manufacturer_data";
constexpr const char *SERVICE_UUIDS = "service_uuids";
constexpr const char *SERVICE_DATA = "service_data";
constexpr const char *TX_POWER = "tx_power";
constexpr const char *APPEARANCE = "appearance";
constexpr const char *ADDRESS_TYPE = "address_type";
constexpr const char *PAIRED = "paired";
constexpr const char *DEVICE_CLASS = "device_class";
constexpr const char *MAJOR_DEVICE_CLASS = "major_device_class";
constexpr const char *MINOR_DEVICE_CLASS = "minor_device_class";
constexpr const char *SERVICE_CLASSES = "service_classes";
constexpr const char *ALTERNATE_NAMES = "alternate_names";
constexpr const char *OBJECT_PATH = "object_path";
} // namespace attr

/**
 * @brief Check whether an attribute value carries no information
 *
 * Empty strings, lists, byte blobs and keyed maps are empty. Booleans and
 * integers never are.
 */
BTCATALOG_API bool attribute_is_empty(const AttributeValue &value);

/// Short human-readable rendering, used in logs
BTCATALOG_API std::string attribute_to_string(const AttributeValue &value);

/// Get a typed attribute, nullptr if missing or of another type
template <typename T>
const T *find_attribute(const AttributeMap &attributes,
                        const std::string &key) {
  auto it = attributes.find(key);
  if (it == attributes.end()) {
    return nullptr;
  }
  return std::get_if<T>(&it->second);
}

// ============================================================================
// Observations and Devices
// ============================================================================

/// Name given to devices nobody has named yet
constexpr const char *PLACEHOLDER_NAME = "Unknown";

/// True for empty names and the placeholder
BTCATALOG_API bool is_placeholder_name(const std::string &name);

/**
 * @brief One sighting of a device from one scan source
 */
struct RawObservation {
  std::string source_id;
  std::string raw_address;
  std::optional<std::string> display_name;
  std::optional<int> signal_strength; // RSSI, dBm
  AttributeMap attributes;
};

/**
 * @brief Results of the enrichment pass
 */
struct DerivedInfo {
  std::optional<std::string> company_name;
  std::optional<std::string> vendor;
  std::optional<std::string> friendly_name;
  std::optional<std::string> category;
  std::optional<std::string> device_type; // "BLE", "Classic", "BLE+Classic"
};

/**
 * @brief Deduplicated device record built from one or more observations
 */
struct CanonicalDevice {
  std::string canonical_id;
  std::string address;
  std::string name = PLACEHOLDER_NAME;
  std::optional<int> signal_strength;
  AttributeMap attributes;

  /// Source ids in first-seen order, no duplicates
  std::vector<std::string> detection_sources;

  /// Every raw identifier folded into this record, in arrival order
  std::vector<std::string> merged_from;

  /// Populated by EnrichmentPipeline only
  std::optional<DerivedInfo> derived;

  /// Priority rank of the source that set signal_strength
  std::optional<int> signal_rank;

  bool has_source(const std::string &source_id) const;
};

/**
 * @brief Per-call envelope returned by the Aggregator
 */
struct AggregationResult {
  /// Devices in first-seen order (after the name filter)
  std::vector<CanonicalDevice> devices;

  /// Sources that failed entirely
  std::map<std::string, Error> source_errors;

  /// Devices built before the name filter was applied
  size_t total = 0;

  std::chrono::milliseconds elapsed{0};
};

} // namespace btcatalog

#endif // BTCATALOG_TYPES_H
