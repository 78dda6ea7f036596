/**
 * @file device_class.cpp
 * @brief Class of Device decoding
 */

#include "btcatalog/device_class.h"
#include <cstdio>

namespace btcatalog {

namespace {

constexpr uint32_t MAJOR_CLASS_MASK = 0x1F00;
constexpr uint32_t MINOR_CLASS_MASK = 0xFF;
constexpr uint32_t SERVICE_CLASS_MASK = 0xFFE000;
constexpr int SERVICE_CLASS_BITS = 11;

const char *service_class_name(int bit) {
  switch (bit) {
  case 0:
    return "Limited Discoverable Mode";
  case 1:
  case 2:
    return "Reserved";
  case 3:
    return "Positioning";
  case 4:
    return "Networking";
  case 5:
    return "Rendering";
  case 6:
    return "Capturing";
  case 7:
    return "Object Transfer";
  case 8:
    return "Audio";
  case 9:
    return "Telephony";
  case 10:
    return "Information";
  default:
    return nullptr;
  }
}

} // namespace

std::string major_device_class_name(uint32_t major) {
  switch (major) {
  case 0:
    return "Miscellaneous";
  case 1:
    return "Computer";
  case 2:
    return "Phone";
  case 3:
    return "LAN/Network Access Point";
  case 4:
    return "Audio/Video";
  case 5:
    return "Peripheral";
  case 6:
    return "Imaging";
  case 7:
    return "Wearable";
  case 8:
    return "Toy";
  case 9:
    return "Health";
  case 31:
    return "Uncategorized";
  default:
    return "Unknown (" + std::to_string(major) + ")";
  }
}

DeviceClassInfo decode_device_class(uint32_t device_class) {
  DeviceClassInfo info;

  uint32_t major = (device_class & MAJOR_CLASS_MASK) >> 8;
  uint32_t minor = device_class & MINOR_CLASS_MASK;
  uint32_t services = (device_class & SERVICE_CLASS_MASK) >> 13;

  info.major = major_device_class_name(major);

  char buf[8];
  snprintf(buf, sizeof(buf), "0x%02x", minor);
  info.minor = buf;

  for (int bit = 0; bit < SERVICE_CLASS_BITS; ++bit) {
    if (services & (1u << bit)) {
      info.service_classes.emplace_back(service_class_name(bit));
    }
  }

  return info;
}

} // namespace btcatalog
