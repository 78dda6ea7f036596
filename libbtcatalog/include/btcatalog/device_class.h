/**
 * @file device_class.h
 * @brief Classic Bluetooth Class of Device (CoD) decoding
 */

#ifndef BTCATALOG_DEVICE_CLASS_H
#define BTCATALOG_DEVICE_CLASS_H

#include "platform.h"
#include <cstdint>
#include <string>
#include <vector>

namespace btcatalog {

/**
 * @brief Human-readable view of a 24-bit Class of Device
 */
struct DeviceClassInfo {
  std::string major;                        // "Phone", "Audio/Video", ...
  std::string minor;                        // Raw minor bits, "0x0c"
  std::vector<std::string> service_classes; // "Audio", "Telephony", ...
};

/**
 * @brief Split a CoD into major class, minor bits and service classes
 *
 * Unknown major values are rendered as "Unknown (<n>)".
 */
BTCATALOG_API DeviceClassInfo decode_device_class(uint32_t device_class);

/// Name of a major device class value (bits 8-12)
BTCATALOG_API std::string major_device_class_name(uint32_t major);

} // namespace btcatalog

#endif // BTCATALOG_DEVICE_CLASS_H
