/**
 * @file bluez_scan.h
 * @brief BlueZ-backed scan sources
 *
 * Three sources share one D-Bus code path:
 *  - "ble": LE discovery, devices without a Class of Device or with a
 *    random address
 *  - "classic": BR/EDR discovery, devices with a Class of Device
 *  - "platform-registry": devices BlueZ already knows as paired or trusted
 */

#ifndef BTCATALOG_PLATFORM_LINUX_BLUEZ_SCAN_H
#define BTCATALOG_PLATFORM_LINUX_BLUEZ_SCAN_H

#include "btcatalog/scan_source.h"
#include "dbus_helpers.h"
#include <string>

namespace btcatalog {
namespace platform {

// BlueZ D-Bus constants
constexpr const char *BLUEZ_SERVICE = "org.bluez";
constexpr const char *BLUEZ_ADAPTER_IFACE = "org.bluez.Adapter1";
constexpr const char *BLUEZ_DEVICE_IFACE = "org.bluez.Device1";

/// Timeout of a single D-Bus call
constexpr int BLUEZ_CALL_TIMEOUT_MS = 5000;

/**
 * @brief BlueZ adapter state
 */
struct BlueZAdapter {
  std::string object_path; // e.g., "/org/bluez/hci0"
  std::string address;     // MAC address
  std::string name;        // Adapter name
  bool powered = false;    // Is adapter powered on
};

/**
 * @brief Settings shared by the BlueZ sources
 */
struct BlueZSourceOptions {
  /// Adapter name ("hci0"), empty for the first adapter found
  std::string adapter;

  /// Drop devices whose raw name does not match the request filter
  bool prefilter_names = false;
};

/**
 * @brief Find an adapter among BlueZ's managed objects
 * @param name Adapter name, empty for the first one
 */
Result<BlueZAdapter> find_adapter(const ManagedObjects &objects,
                                  const std::string &name);

/**
 * @brief Convert a Device1 property map to an observation
 * @return nullopt when the device has neither Address nor object path
 */
std::optional<RawObservation> device_to_observation(const std::string &source_id,
                                                    const std::string &path,
                                                    const PropertyMap &props);

/**
 * @brief Common code of the BlueZ sources
 */
class BlueZSource : public ScanSource {
public:
  explicit BlueZSource(BlueZSourceOptions options);

  Result<std::vector<RawObservation>>
  observe(std::chrono::milliseconds duration,
          const std::optional<std::string> &filter_name,
          const CancellationToken &cancel) override;

protected:
  /// Discovery transport ("le", "bredr"), empty to skip discovery
  virtual std::string transport() const = 0;

  /// Whether a Device1 object belongs to this source's results
  virtual bool accepts(const PropertyMap &props) const = 0;

  /// Error code used when discovery cannot be started
  virtual ErrorCode discovery_error() const = 0;

private:
  Result<void> run_discovery(DBusConnection *conn, const BlueZAdapter &adapter,
                             std::chrono::milliseconds duration,
                             const CancellationToken &cancel);

  BlueZSourceOptions options_;
};

class BlueZLeSource : public BlueZSource {
public:
  using BlueZSource::BlueZSource;
  std::string id() const override { return SOURCE_BLE; }

protected:
  std::string transport() const override { return "le"; }
  bool accepts(const PropertyMap &props) const override;
  ErrorCode discovery_error() const override { return ErrorCode::BleScanFailed; }
};

class BlueZClassicSource : public BlueZSource {
public:
  using BlueZSource::BlueZSource;
  std::string id() const override { return SOURCE_CLASSIC; }

protected:
  std::string transport() const override { return "bredr"; }
  bool accepts(const PropertyMap &props) const override;
  ErrorCode discovery_error() const override { return ErrorCode::InquiryFailed; }
};

class BlueZRegistrySource : public BlueZSource {
public:
  using BlueZSource::BlueZSource;
  std::string id() const override { return SOURCE_PLATFORM_REGISTRY; }

protected:
  std::string transport() const override { return {}; }
  bool accepts(const PropertyMap &props) const override;
  ErrorCode discovery_error() const override { return ErrorCode::SourceFailed; }
};

} // namespace platform
} // namespace btcatalog

#endif // BTCATALOG_PLATFORM_LINUX_BLUEZ_SCAN_H
