/**
 * @file serialization.cpp
 * @brief JSON rendering implementation
 */

#include "btcatalog/serialization.h"
#include <algorithm>
#include <type_traits>

namespace btcatalog {

std::string bytes_to_hex(const Bytes &bytes) {
  static const char digits[] = "0123456789abcdef";
  std::string hex;
  hex.reserve(bytes.size() * 2);
  for (Byte b : bytes) {
    hex += digits[b >> 4];
    hex += digits[b & 0x0F];
  }
  return hex;
}

nlohmann::json attribute_to_json(const AttributeValue &value) {
  return std::visit(
      [](const auto &v) -> nlohmann::json {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, Bytes>) {
          return bytes_to_hex(v);
        } else if constexpr (std::is_same_v<T, KeyedBytes>) {
          nlohmann::json object = nlohmann::json::object();
          for (const auto &[key, bytes] : v) {
            object[key] = bytes_to_hex(bytes);
          }
          return object;
        } else {
          return nlohmann::json(v);
        }
      },
      value);
}

namespace {

nlohmann::json optional_string(const std::optional<std::string> &value) {
  return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

} // namespace

nlohmann::json device_to_json(const CanonicalDevice &device,
                              const JsonOptions &options) {
  nlohmann::json j;
  j["canonical_id"] = device.canonical_id;
  j["address"] = device.address;
  j["name"] = device.name;
  j["signal_strength"] = device.signal_strength
                             ? nlohmann::json(*device.signal_strength)
                             : nlohmann::json(nullptr);
  j["detection_sources"] = device.detection_sources;
  j["merged_from"] = device.merged_from;

  nlohmann::json attributes = nlohmann::json::object();
  for (const auto &[key, value] : device.attributes) {
    attributes[key] = attribute_to_json(value);
  }
  j["attributes"] = std::move(attributes);

  if (options.include_derived && device.derived) {
    const auto &d = *device.derived;
    j["derived"] = {{"company_name", optional_string(d.company_name)},
                    {"vendor", optional_string(d.vendor)},
                    {"friendly_name", optional_string(d.friendly_name)},
                    {"category", optional_string(d.category)},
                    {"device_type", optional_string(d.device_type)}};
  }

  return j;
}

nlohmann::json error_to_json(const Error &error) {
  nlohmann::json j;
  j["code"] = error_code_name(error.code);
  j["message"] = error.message.empty() ? error_code_description(error.code)
                                       : error.message;
  if (!error.details.empty()) {
    j["details"] = error.details;
  }
  return j;
}

nlohmann::json result_to_json(const AggregationResult &result,
                              const JsonOptions &options) {
  std::vector<const CanonicalDevice *> order;
  order.reserve(result.devices.size());
  for (const auto &device : result.devices) {
    order.push_back(&device);
  }

  if (options.sort_by_signal) {
    std::stable_sort(order.begin(), order.end(),
                     [](const CanonicalDevice *a, const CanonicalDevice *b) {
                       if (!a->signal_strength || !b->signal_strength) {
                         return a->signal_strength.has_value() &&
                                !b->signal_strength.has_value();
                       }
                       return *a->signal_strength > *b->signal_strength;
                     });
  }

  nlohmann::json devices = nlohmann::json::array();
  for (const auto *device : order) {
    devices.push_back(device_to_json(*device, options));
  }

  nlohmann::json errors = nlohmann::json::object();
  for (const auto &[id, error] : result.source_errors) {
    errors[id] = error_to_json(error);
  }

  nlohmann::json j;
  j["devices"] = std::move(devices);
  j["count"] = result.devices.size();
  j["total"] = result.total;
  j["source_errors"] = std::move(errors);
  j["elapsed_ms"] = result.elapsed.count();
  return j;
}

std::string to_json(const AggregationResult &result,
                    const JsonOptions &options) {
  // Names reported by devices are not guaranteed to be valid UTF-8
  return result_to_json(result, options)
      .dump(options.indent, ' ', false,
            nlohmann::json::error_handler_t::replace);
}

} // namespace btcatalog
