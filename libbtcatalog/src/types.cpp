/**
 * @file types.cpp
 * @brief Core type implementations
 */

#include "btcatalog/types.h"
#include <algorithm>
#include <iomanip>
#include <sstream>
#include <type_traits>

namespace btcatalog {

namespace {

std::string hex_dump(const Bytes &bytes) {
  std::ostringstream oss;
  oss << std::hex << std::uppercase << std::setfill('0');
  for (size_t i = 0; i < bytes.size(); ++i) {
    if (i > 0) {
      oss << ' ';
    }
    oss << std::setw(2) << static_cast<int>(bytes[i]);
  }
  return oss.str();
}

} // namespace

// ============================================================================
// Attributes
// ============================================================================

bool attribute_is_empty(const AttributeValue &value) {
  return std::visit(
      [](const auto &v) -> bool {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, bool> || std::is_same_v<T, int64_t>) {
          return false;
        } else {
          return v.empty();
        }
      },
      value);
}

std::string attribute_to_string(const AttributeValue &value) {
  return std::visit(
      [](const auto &v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, bool>) {
          return v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int64_t>) {
          return std::to_string(v);
        } else if constexpr (std::is_same_v<T, std::string>) {
          return v;
        } else if constexpr (std::is_same_v<T, std::vector<int64_t>>) {
          std::ostringstream oss;
          oss << '[';
          for (size_t i = 0; i < v.size(); ++i) {
            oss << (i > 0 ? ", " : "") << v[i];
          }
          oss << ']';
          return oss.str();
        } else if constexpr (std::is_same_v<T, std::vector<std::string>>) {
          std::ostringstream oss;
          oss << '[';
          for (size_t i = 0; i < v.size(); ++i) {
            oss << (i > 0 ? ", " : "") << v[i];
          }
          oss << ']';
          return oss.str();
        } else if constexpr (std::is_same_v<T, Bytes>) {
          return hex_dump(v);
        } else {
          std::ostringstream oss;
          oss << '{';
          bool first = true;
          for (const auto &[key, bytes] : v) {
            oss << (first ? "" : ", ") << key << ": " << hex_dump(bytes);
            first = false;
          }
          oss << '}';
          return oss.str();
        }
      },
      value);
}

// ============================================================================
// Devices
// ============================================================================

bool is_placeholder_name(const std::string &name) {
  return name.empty() || name == PLACEHOLDER_NAME;
}

bool CanonicalDevice::has_source(const std::string &source_id) const {
  return std::find(detection_sources.begin(), detection_sources.end(),
                   source_id) != detection_sources.end();
}

} // namespace btcatalog
