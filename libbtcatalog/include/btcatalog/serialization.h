/**
 * @file serialization.h
 * @brief JSON rendering of catalogs and devices
 *
 * Attribute values map to JSON as follows: bool and integers as-is, strings
 * as strings, lists as arrays, byte blobs as lower-case hex strings, and
 * keyed byte maps as objects of hex strings.
 */

#ifndef BTCATALOG_SERIALIZATION_H
#define BTCATALOG_SERIALIZATION_H

#include "error.h"
#include "platform.h"
#include "types.h"
#include <string>

#include <nlohmann/json.hpp>

namespace btcatalog {

struct JsonOptions {
  /// Strongest signal first; devices without a signal go last
  bool sort_by_signal = false;

  /// Include the "derived" block of enriched devices
  bool include_derived = true;

  /// Spaces per indent level, negative for compact output
  int indent = 2;
};

BTCATALOG_API std::string bytes_to_hex(const Bytes &bytes);

BTCATALOG_API nlohmann::json attribute_to_json(const AttributeValue &value);

BTCATALOG_API nlohmann::json device_to_json(const CanonicalDevice &device,
                                            const JsonOptions &options = {});

BTCATALOG_API nlohmann::json error_to_json(const Error &error);

BTCATALOG_API nlohmann::json result_to_json(const AggregationResult &result,
                                            const JsonOptions &options = {});

/// result_to_json() dumped with options.indent
BTCATALOG_API std::string to_json(const AggregationResult &result,
                                  const JsonOptions &options = {});

} // namespace btcatalog

#endif // BTCATALOG_SERIALIZATION_H
