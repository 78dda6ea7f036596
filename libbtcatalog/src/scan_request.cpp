/**
 * @file scan_request.cpp
 * @brief Request validation and presets
 */

#include "btcatalog/scan_request.h"
#include "btcatalog/naming.h"
#include <cmath>

namespace btcatalog {

std::chrono::milliseconds ScanRequest::duration() const {
  return std::chrono::milliseconds(
      static_cast<int64_t>(std::llround(duration_seconds * 1000.0)));
}

std::optional<std::string>
normalize_filter_name(const std::optional<std::string> &filter_name) {
  if (!filter_name) {
    return std::nullopt;
  }

  std::string value = trim(*filter_name);
  if (value.empty()) {
    return std::nullopt;
  }

  std::string lowered = to_lower(value);
  if (lowered == "null" || lowered == "none" || lowered == "string") {
    return std::nullopt;
  }

  return value;
}

Result<void> validate_request(const ScanRequest &request,
                              const SourceRegistry &registry) {
  if (!std::isfinite(request.duration_seconds) ||
      request.duration_seconds <= 0.0) {
    return Error(ErrorCode::InvalidArgument,
                 "Duration must be a positive number of seconds",
                 std::to_string(request.duration_seconds));
  }

  if (request.duration_seconds > MAX_SCAN_SECONDS) {
    return Error(ErrorCode::InvalidArgument, "Duration exceeds one hour",
                 std::to_string(request.duration_seconds));
  }

  if (request.duration().count() <= 0) {
    return Error(ErrorCode::InvalidArgument,
                 "Duration is shorter than one millisecond");
  }

  for (const auto &id : request.sources) {
    if (!registry.contains(id)) {
      return Error(ErrorCode::UnknownSource, "Unknown scan source", id);
    }
  }

  if (request.sources.empty() && registry.empty()) {
    return Error(ErrorCode::InvalidArgument, "No scan sources to run");
  }

  return Result<void>::ok();
}

ScanRequest make_request(const CatalogConfig &config) {
  ScanRequest request;
  request.duration_seconds = config.default_duration_seconds;
  request.sources = config.enabled_sources;
  request.concurrent = config.concurrent;
  return request;
}

ScanRequest make_preset_request(ScanPreset preset,
                                const CatalogConfig &config) {
  ScanRequest request = make_request(config);

  switch (preset) {
  case ScanPreset::Standard:
    break;
  case ScanPreset::Fast:
    request.duration_seconds = FAST_SCAN_SECONDS;
    request.concurrent = true;
    break;
  case ScanPreset::Thorough:
    request.duration_seconds = THOROUGH_SCAN_SECONDS;
    request.sources.clear();
    break;
  }

  return request;
}

const char *scan_preset_name(ScanPreset preset) {
  switch (preset) {
  case ScanPreset::Standard:
    return "standard";
  case ScanPreset::Fast:
    return "fast";
  case ScanPreset::Thorough:
    return "thorough";
  }
  return "unknown";
}

std::optional<ScanPreset> parse_scan_preset(const std::string &name) {
  std::string lowered = to_lower(trim(name));
  if (lowered == "standard")
    return ScanPreset::Standard;
  if (lowered == "fast")
    return ScanPreset::Fast;
  if (lowered == "thorough")
    return ScanPreset::Thorough;
  return std::nullopt;
}

} // namespace btcatalog
