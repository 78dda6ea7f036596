/**
 * @file bluez_scan.cpp
 * @brief BlueZ scan sources over D-Bus
 */

#include "bluez_scan.h"
#include "btcatalog/device_class.h"
#include "btcatalog/log.h"
#include "btcatalog/naming.h"

namespace btcatalog {
namespace platform {

namespace {

bool property_is_true(const PropertyMap &props, const char *name) {
  const auto *value = find_attribute<bool>(props, name);
  return value && *value;
}

bool has_property(const PropertyMap &props, const char *name) {
  return props.find(name) != props.end();
}

Result<void> stop_discovery(DBusConnection *conn,
                            const std::string &adapter_path) {
  auto result = call_method(conn, BLUEZ_SERVICE, adapter_path.c_str(),
                            BLUEZ_ADAPTER_IFACE, "StopDiscovery",
                            BLUEZ_CALL_TIMEOUT_MS);

  if (result.is_error()) {
    // Not discovering is not an error
    if (result.error().message.find("No discovery started") !=
        std::string::npos) {
      return Result<void>::ok();
    }
    return result.error();
  }

  return Result<void>::ok();
}

Result<void> set_discovery_filter(DBusConnection *conn,
                                  const std::string &adapter_path,
                                  const std::string &transport) {
  DBusMessageWrapper msg(dbus_message_new_method_call(
      BLUEZ_SERVICE, adapter_path.c_str(), BLUEZ_ADAPTER_IFACE,
      "SetDiscoveryFilter"));
  if (!msg) {
    return Error(ErrorCode::PlatformError, "Failed to create D-Bus message");
  }

  DBusMessageIter iter;
  dbus_message_iter_init_append(msg.get(), &iter);
  if (!append_string_dict(&iter, {{"Transport", transport}})) {
    return Error(ErrorCode::PlatformError, "Failed to build discovery filter");
  }

  auto reply = send_and_wait(conn, msg.get(), BLUEZ_CALL_TIMEOUT_MS);
  if (reply.is_error()) {
    return reply.error();
  }
  return Result<void>::ok();
}

} // namespace

// ============================================================================
// Adapter and Device Decoding
// ============================================================================

Result<BlueZAdapter> find_adapter(const ManagedObjects &objects,
                                  const std::string &name) {
  for (const auto &[path, interfaces] : objects) {
    auto iface = interfaces.find(BLUEZ_ADAPTER_IFACE);
    if (iface == interfaces.end()) {
      continue;
    }

    if (!name.empty()) {
      auto slash = path.rfind('/');
      std::string leaf = slash == std::string::npos ? path : path.substr(slash + 1);
      if (leaf != name) {
        continue;
      }
    }

    BlueZAdapter adapter;
    adapter.object_path = path;
    const auto &props = iface->second;
    if (const auto *address = find_attribute<std::string>(props, "Address")) {
      adapter.address = *address;
    }
    if (const auto *alias = find_attribute<std::string>(props, "Name")) {
      adapter.name = *alias;
    }
    adapter.powered = property_is_true(props, "Powered");
    return adapter;
  }

  if (!name.empty()) {
    return Error(ErrorCode::HardwareNotAvailable,
                 "Bluetooth adapter not found", name);
  }
  return Error(ErrorCode::HardwareNotAvailable, "No Bluetooth adapter found");
}

std::optional<RawObservation> device_to_observation(const std::string &source_id,
                                                    const std::string &path,
                                                    const PropertyMap &props) {
  RawObservation obs;
  obs.source_id = source_id;

  const auto *address = find_attribute<std::string>(props, "Address");
  if (address && !address->empty()) {
    obs.raw_address = *address;
  } else if (!path.empty()) {
    // No address exposed: the object path is an opaque identifier
    obs.raw_address = path;
  } else {
    return std::nullopt;
  }

  if (const auto *name = find_attribute<std::string>(props, "Name")) {
    if (!trim(*name).empty()) {
      obs.display_name = *name;
    }
  }

  if (const auto *rssi = find_attribute<int64_t>(props, "RSSI")) {
    obs.signal_strength = static_cast<int>(*rssi);
  }

  auto &attrs = obs.attributes;
  if (const auto *data = find_attribute<KeyedBytes>(props, "ManufacturerData")) {
    attrs[attr::MANUFACTURER_DATA] = *data;
  }
  if (const auto *data = find_attribute<KeyedBytes>(props, "ServiceData")) {
    attrs[attr::SERVICE_DATA] = *data;
  }
  if (const auto *uuids =
          find_attribute<std::vector<std::string>>(props, "UUIDs")) {
    attrs[attr::SERVICE_UUIDS] = *uuids;
  }
  if (const auto *tx = find_attribute<int64_t>(props, "TxPower")) {
    attrs[attr::TX_POWER] = *tx;
  }
  if (const auto *appearance = find_attribute<int64_t>(props, "Appearance")) {
    attrs[attr::APPEARANCE] = *appearance;
  }
  if (const auto *type = find_attribute<std::string>(props, "AddressType")) {
    attrs[attr::ADDRESS_TYPE] = *type;
  }
  if (const auto *paired = find_attribute<bool>(props, "Paired")) {
    attrs[attr::PAIRED] = *paired;
  }
  if (const auto *cod = find_attribute<int64_t>(props, "Class")) {
    auto info = decode_device_class(static_cast<uint32_t>(*cod));
    attrs[attr::DEVICE_CLASS] = *cod;
    attrs[attr::MAJOR_DEVICE_CLASS] = info.major;
    attrs[attr::MINOR_DEVICE_CLASS] = info.minor;
    attrs[attr::SERVICE_CLASSES] = info.service_classes;
  }
  if (!path.empty()) {
    attrs[attr::OBJECT_PATH] = path;
  }

  return obs;
}

// ============================================================================
// Source Filters
// ============================================================================

bool BlueZLeSource::accepts(const PropertyMap &props) const {
  if (!has_property(props, "RSSI")) {
    return false;
  }
  const auto *type = find_attribute<std::string>(props, "AddressType");
  return !has_property(props, "Class") || (type && *type == "random");
}

bool BlueZClassicSource::accepts(const PropertyMap &props) const {
  return has_property(props, "RSSI") && has_property(props, "Class");
}

bool BlueZRegistrySource::accepts(const PropertyMap &props) const {
  return property_is_true(props, "Paired") || property_is_true(props, "Trusted");
}

// ============================================================================
// BlueZSource
// ============================================================================

BlueZSource::BlueZSource(BlueZSourceOptions options)
    : options_(std::move(options)) {}

Result<void> BlueZSource::run_discovery(DBusConnection *conn,
                                        const BlueZAdapter &adapter,
                                        std::chrono::milliseconds duration,
                                        const CancellationToken &cancel) {
  auto filter = set_discovery_filter(conn, adapter.object_path, transport());
  if (filter.is_error()) {
    // Older BlueZ versions lack filters; discovery then covers both transports
    log::get()->warn("[{}] SetDiscoveryFilter failed: {}", id(),
                     filter.error().to_string());
  }

  auto started = call_method(conn, BLUEZ_SERVICE, adapter.object_path.c_str(),
                             BLUEZ_ADAPTER_IFACE, "StartDiscovery",
                             BLUEZ_CALL_TIMEOUT_MS);
  if (started.is_error()) {
    const Error &err = started.error();
    if (err.message.find("InProgress") == std::string::npos) {
      if (err.code != ErrorCode::PlatformError) {
        return err;
      }
      return Error(discovery_error(), "Cannot start discovery", err.message);
    }
  }

  log::get()->debug("[{}] Discovering on {} for {} ms", id(),
                    adapter.object_path, duration.count());
  bool cancelled = cancel.wait_for(duration);

  auto stopped = stop_discovery(conn, adapter.object_path);
  if (stopped.is_error()) {
    log::get()->warn("[{}] StopDiscovery failed: {}", id(),
                     stopped.error().to_string());
  }

  if (cancelled) {
    return Error(ErrorCode::Cancelled, "Scan cancelled", id());
  }
  return Result<void>::ok();
}

Result<std::vector<RawObservation>>
BlueZSource::observe(std::chrono::milliseconds duration,
                     const std::optional<std::string> &filter_name,
                     const CancellationToken &cancel) {
  auto bus = open_private_system_bus();
  if (bus.is_error()) {
    return bus.error();
  }
  DBusConnection *conn = bus.value().get();

  auto objects = get_managed_objects(conn, BLUEZ_SERVICE, BLUEZ_CALL_TIMEOUT_MS);
  if (objects.is_error()) {
    return objects.error();
  }

  auto adapter = find_adapter(objects.value(), options_.adapter);
  if (adapter.is_error()) {
    return adapter.error();
  }
  if (!adapter.value().powered) {
    return Error(ErrorCode::BluetoothOff, "Bluetooth adapter is powered off",
                 adapter.value().object_path);
  }

  if (!transport().empty()) {
    BTCATALOG_TRY(run_discovery(conn, adapter.value(), duration, cancel));

    objects = get_managed_objects(conn, BLUEZ_SERVICE, BLUEZ_CALL_TIMEOUT_MS);
    if (objects.is_error()) {
      return objects.error();
    }
  }

  std::string prefix = adapter.value().object_path + "/";
  std::vector<RawObservation> observations;

  for (const auto &[path, interfaces] : objects.value()) {
    if (path.compare(0, prefix.size(), prefix) != 0) {
      continue;
    }
    auto device = interfaces.find(BLUEZ_DEVICE_IFACE);
    if (device == interfaces.end() || !accepts(device->second)) {
      continue;
    }

    auto obs = device_to_observation(id(), path, device->second);
    if (!obs) {
      continue;
    }

    if (options_.prefilter_names && filter_name) {
      std::string name = obs->display_name.value_or(PLACEHOLDER_NAME);
      if (!name_matches(name, *filter_name)) {
        continue;
      }
    }

    observations.push_back(std::move(*obs));
  }

  log::get()->debug("[{}] {} device(s) observed", id(), observations.size());
  return observations;
}

} // namespace platform
} // namespace btcatalog
