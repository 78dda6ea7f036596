/**
 * @file scan_request.h
 * @brief Scan request, boundary normalization and presets
 */

#ifndef BTCATALOG_SCAN_REQUEST_H
#define BTCATALOG_SCAN_REQUEST_H

#include "config.h"
#include "error.h"
#include "platform.h"
#include "scan_source.h"
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace btcatalog {

/**
 * @brief One aggregation call
 */
struct ScanRequest {
  /// Scan duration in seconds, must be positive and finite
  double duration_seconds = 5.0;

  /// Case-insensitive substring filter on the final device name
  std::optional<std::string> filter_name;

  /// Sources to run (empty = every registered source)
  std::vector<std::string> sources;

  bool concurrent = true;

  /// Absolute deadline for the whole call
  std::optional<std::chrono::steady_clock::time_point> deadline;

  std::chrono::milliseconds duration() const;
};

/**
 * @brief Canned request shapes
 */
enum class ScanPreset {
  Standard, // Configured duration and sources
  Fast,     // 3 seconds, concurrent
  Thorough  // 10 seconds, every registered source
};

constexpr double FAST_SCAN_SECONDS = 3.0;
constexpr double THOROUGH_SCAN_SECONDS = 10.0;

/// Upper bound accepted by validate_request()
constexpr double MAX_SCAN_SECONDS = 3600.0;

/**
 * @brief Map null-like filter values to "no filter"
 *
 * Empty and whitespace-only strings, and the tokens "null", "none" and
 * "string" in any case, become nullopt. Other values are trimmed.
 */
BTCATALOG_API std::optional<std::string>
normalize_filter_name(const std::optional<std::string> &filter_name);

/**
 * @brief Reject malformed requests before any source starts
 *
 * InvalidArgument for a bad or over-long duration or an empty source set,
 * UnknownSource for an id the registry does not know.
 */
BTCATALOG_API Result<void> validate_request(const ScanRequest &request,
                                            const SourceRegistry &registry);

/// Request built from configuration defaults
BTCATALOG_API ScanRequest make_request(const CatalogConfig &config);

/// Request for a preset
BTCATALOG_API ScanRequest make_preset_request(ScanPreset preset,
                                              const CatalogConfig &config);

BTCATALOG_API const char *scan_preset_name(ScanPreset preset);

/// Parse "standard", "fast" or "thorough"
BTCATALOG_API std::optional<ScanPreset> parse_scan_preset(const std::string &name);

} // namespace btcatalog

#endif // BTCATALOG_SCAN_REQUEST_H
