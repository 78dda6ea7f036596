/**
 * @file test_bluez_decoding.cpp
 * @brief Unit tests for BlueZ property decoding
 *
 * Messages are built locally with libdbus, no bus connection is needed.
 */

#include "platform/linux/bluez_scan.h"
#include <gtest/gtest.h>

using namespace btcatalog;
using namespace btcatalog::platform;

namespace {

/**
 * @brief Builds an a{sv} dictionary inside a detached signal message
 */
class PropertyWriter {
public:
  PropertyWriter()
      : msg_(dbus_message_new_signal("/test", "org.btcatalog.Test", "Props")) {
    dbus_message_iter_init_append(msg_.get(), &root_);
    dbus_message_iter_open_container(&root_, DBUS_TYPE_ARRAY, "{sv}", &dict_);
  }

  void add_string(const char *key, const char *value) {
    DBusMessageIter variant;
    open(key, "s", &variant);
    dbus_message_iter_append_basic(&variant, DBUS_TYPE_STRING, &value);
    close(&variant);
  }

  void add_int16(const char *key, dbus_int16_t value) {
    DBusMessageIter variant;
    open(key, "n", &variant);
    dbus_message_iter_append_basic(&variant, DBUS_TYPE_INT16, &value);
    close(&variant);
  }

  void add_uint32(const char *key, dbus_uint32_t value) {
    DBusMessageIter variant;
    open(key, "u", &variant);
    dbus_message_iter_append_basic(&variant, DBUS_TYPE_UINT32, &value);
    close(&variant);
  }

  void add_bool(const char *key, bool value) {
    dbus_bool_t b = value ? TRUE : FALSE;
    DBusMessageIter variant;
    open(key, "b", &variant);
    dbus_message_iter_append_basic(&variant, DBUS_TYPE_BOOLEAN, &b);
    close(&variant);
  }

  void add_strings(const char *key, const std::vector<const char *> &values) {
    DBusMessageIter variant, array;
    open(key, "as", &variant);
    dbus_message_iter_open_container(&variant, DBUS_TYPE_ARRAY, "s", &array);
    for (const char *value : values) {
      dbus_message_iter_append_basic(&array, DBUS_TYPE_STRING, &value);
    }
    dbus_message_iter_close_container(&variant, &array);
    close(&variant);
  }

  /// ManufacturerData layout: a{qv} with ay values
  void add_manufacturer_data(const char *key, dbus_uint16_t company,
                             const Bytes &payload) {
    DBusMessageIter variant, array, entry, inner;
    open(key, "a{qv}", &variant);
    dbus_message_iter_open_container(&variant, DBUS_TYPE_ARRAY, "{qv}", &array);
    dbus_message_iter_open_container(&array, DBUS_TYPE_DICT_ENTRY, nullptr,
                                     &entry);
    dbus_message_iter_append_basic(&entry, DBUS_TYPE_UINT16, &company);
    dbus_message_iter_open_container(&entry, DBUS_TYPE_VARIANT, "ay", &inner);
    append_bytes(&inner, payload);
    dbus_message_iter_close_container(&entry, &inner);
    dbus_message_iter_close_container(&array, &entry);
    dbus_message_iter_close_container(&variant, &array);
    close(&variant);
  }

  /// Unsupported type, must be skipped
  void add_double(const char *key, double value) {
    DBusMessageIter variant;
    open(key, "d", &variant);
    dbus_message_iter_append_basic(&variant, DBUS_TYPE_DOUBLE, &value);
    close(&variant);
  }

  PropertyMap read() {
    dbus_message_iter_close_container(&root_, &dict_);
    DBusMessageIter iter;
    dbus_message_iter_init(msg_.get(), &iter);
    return read_properties(&iter);
  }

private:
  void open(const char *key, const char *signature, DBusMessageIter *variant) {
    dbus_message_iter_open_container(&dict_, DBUS_TYPE_DICT_ENTRY, nullptr,
                                     &entry_);
    dbus_message_iter_append_basic(&entry_, DBUS_TYPE_STRING, &key);
    dbus_message_iter_open_container(&entry_, DBUS_TYPE_VARIANT, signature,
                                     variant);
  }

  void close(DBusMessageIter *variant) {
    dbus_message_iter_close_container(&entry_, variant);
    dbus_message_iter_close_container(&dict_, &entry_);
  }

  static void append_bytes(DBusMessageIter *iter, const Bytes &payload) {
    DBusMessageIter array;
    dbus_message_iter_open_container(iter, DBUS_TYPE_ARRAY, "y", &array);
    const unsigned char *data = payload.data();
    dbus_message_iter_append_fixed_array(&array, DBUS_TYPE_BYTE, &data,
                                         static_cast<int>(payload.size()));
    dbus_message_iter_close_container(iter, &array);
  }

  DBusMessageWrapper msg_;
  DBusMessageIter root_;
  DBusMessageIter dict_;
  DBusMessageIter entry_;
};

// Expose the protected device filters
class LeProbe : public BlueZLeSource {
public:
  LeProbe() : BlueZLeSource(BlueZSourceOptions{}) {}
  using BlueZLeSource::accepts;
};

class ClassicProbe : public BlueZClassicSource {
public:
  ClassicProbe() : BlueZClassicSource(BlueZSourceOptions{}) {}
  using BlueZClassicSource::accepts;
};

class RegistryProbe : public BlueZRegistrySource {
public:
  RegistryProbe() : BlueZRegistrySource(BlueZSourceOptions{}) {}
  using BlueZRegistrySource::accepts;
};

} // namespace

// ============================================================================
// Property decoding
// ============================================================================

TEST(BlueZDecodingTest, ReadsBasicProperties) {
  PropertyWriter writer;
  writer.add_string("Address", "70:FC:8F:01:02:03");
  writer.add_int16("RSSI", -58);
  writer.add_uint32("Class", 0x240404);
  writer.add_bool("Paired", true);
  writer.add_strings("UUIDs", {"0000110b-0000-1000-8000-00805f9b34fb"});

  auto props = writer.read();

  EXPECT_EQ(*find_attribute<std::string>(props, "Address"),
            "70:FC:8F:01:02:03");
  EXPECT_EQ(*find_attribute<int64_t>(props, "RSSI"), -58);
  EXPECT_EQ(*find_attribute<int64_t>(props, "Class"), 0x240404);
  EXPECT_TRUE(*find_attribute<bool>(props, "Paired"));
  ASSERT_NE(find_attribute<std::vector<std::string>>(props, "UUIDs"), nullptr);
  EXPECT_EQ(find_attribute<std::vector<std::string>>(props, "UUIDs")->size(),
            1u);
}

TEST(BlueZDecodingTest, ReadsManufacturerData) {
  PropertyWriter writer;
  writer.add_manufacturer_data("ManufacturerData", 0x004C, {0x02, 0x15, 0xAA});

  auto props = writer.read();
  const auto *data = find_attribute<KeyedBytes>(props, "ManufacturerData");
  ASSERT_NE(data, nullptr);
  ASSERT_EQ(data->count("76"), 1u);
  EXPECT_EQ(data->at("76"), (Bytes{0x02, 0x15, 0xAA}));
}

TEST(BlueZDecodingTest, SkipsUnsupportedTypes) {
  PropertyWriter writer;
  writer.add_double("Weird", 1.5);
  writer.add_string("Name", "Speaker");

  auto props = writer.read();
  EXPECT_EQ(props.count("Weird"), 0u);
  EXPECT_EQ(props.count("Name"), 1u);
}

// ============================================================================
// Observations
// ============================================================================

TEST(BlueZDecodingTest, DeviceToObservation) {
  PropertyWriter writer;
  writer.add_string("Address", "70:FC:8F:01:02:03");
  writer.add_string("Name", "Freebox Server");
  writer.add_string("AddressType", "public");
  writer.add_int16("RSSI", -61);
  writer.add_uint32("Class", 0x240404);
  writer.add_manufacturer_data("ManufacturerData", 0x0075, {0x01});

  auto obs = device_to_observation("classic", "/org/bluez/hci0/dev_70_FC_8F_01_02_03",
                                   writer.read());

  ASSERT_TRUE(obs.has_value());
  EXPECT_EQ(obs->source_id, "classic");
  EXPECT_EQ(obs->raw_address, "70:FC:8F:01:02:03");
  EXPECT_EQ(obs->display_name, "Freebox Server");
  EXPECT_EQ(obs->signal_strength, -61);

  const auto &attrs = obs->attributes;
  EXPECT_EQ(*find_attribute<std::string>(attrs, attr::ADDRESS_TYPE), "public");
  EXPECT_EQ(*find_attribute<int64_t>(attrs, attr::DEVICE_CLASS), 0x240404);
  EXPECT_EQ(*find_attribute<std::string>(attrs, attr::MAJOR_DEVICE_CLASS),
            "Audio/Video");
  EXPECT_EQ(*find_attribute<std::string>(attrs, attr::MINOR_DEVICE_CLASS),
            "0x04");
  EXPECT_EQ(*find_attribute<std::vector<std::string>>(attrs,
                                                      attr::SERVICE_CLASSES),
            (std::vector<std::string>{"Rendering", "Audio"}));
  EXPECT_EQ(*find_attribute<std::string>(attrs, attr::OBJECT_PATH),
            "/org/bluez/hci0/dev_70_FC_8F_01_02_03");
  EXPECT_EQ(find_attribute<KeyedBytes>(attrs, attr::MANUFACTURER_DATA)->at("117"),
            Bytes{0x01});
}

TEST(BlueZDecodingTest, BlankNameIsNotReported) {
  PropertyMap props;
  props["Address"] = std::string("11:22:33:44:55:66");
  props["Name"] = std::string("   ");

  auto obs = device_to_observation("ble", "", props);
  ASSERT_TRUE(obs.has_value());
  EXPECT_FALSE(obs->display_name.has_value());
  EXPECT_FALSE(obs->signal_strength.has_value());
  EXPECT_EQ(obs->attributes.count(attr::OBJECT_PATH), 0u);
}

TEST(BlueZDecodingTest, ObjectPathIsFallbackIdentifier) {
  PropertyMap props;
  props["RSSI"] = int64_t{-90};

  auto obs = device_to_observation("ble", "/org/bluez/hci0/dev_x", props);
  ASSERT_TRUE(obs.has_value());
  EXPECT_EQ(obs->raw_address, "/org/bluez/hci0/dev_x");

  EXPECT_FALSE(device_to_observation("ble", "", props).has_value());
}

// ============================================================================
// Adapters
// ============================================================================

TEST(BlueZDecodingTest, FindAdapter) {
  ManagedObjects objects;
  objects["/org/bluez/hci0"][BLUEZ_ADAPTER_IFACE] = {
      {"Address", std::string("00:1A:7D:DA:71:13")},
      {"Name", std::string("laptop")},
      {"Powered", true}};
  objects["/org/bluez/hci1"][BLUEZ_ADAPTER_IFACE] = {{"Powered", false}};
  objects["/org/bluez/hci0/dev_x"][BLUEZ_DEVICE_IFACE] = {};

  auto first = find_adapter(objects, "");
  ASSERT_TRUE(first.is_ok());
  EXPECT_EQ(first.value().object_path, "/org/bluez/hci0");
  EXPECT_EQ(first.value().address, "00:1A:7D:DA:71:13");
  EXPECT_TRUE(first.value().powered);

  auto named = find_adapter(objects, "hci1");
  ASSERT_TRUE(named.is_ok());
  EXPECT_FALSE(named.value().powered);

  auto missing = find_adapter(objects, "hci7");
  ASSERT_TRUE(missing.is_error());
  EXPECT_EQ(missing.error().code, ErrorCode::HardwareNotAvailable);

  EXPECT_TRUE(find_adapter(ManagedObjects{}, "").is_error());
}

// ============================================================================
// Source filters
// ============================================================================

TEST(BlueZDecodingTest, SourcesSplitDevicesByTransport) {
  PropertyMap le{{"RSSI", int64_t{-50}}, {"AddressType", std::string("random")}};
  PropertyMap classic{{"RSSI", int64_t{-50}}, {"Class", int64_t{0x5A020C}}};
  PropertyMap dual{{"RSSI", int64_t{-50}},
                   {"Class", int64_t{0x5A020C}},
                   {"AddressType", std::string("random")}};
  PropertyMap stale{{"Paired", true}};

  LeProbe ble;
  ClassicProbe bredr;
  RegistryProbe known;

  EXPECT_TRUE(ble.accepts(le));
  EXPECT_FALSE(ble.accepts(classic));
  EXPECT_TRUE(ble.accepts(dual));
  EXPECT_FALSE(ble.accepts(stale));

  EXPECT_FALSE(bredr.accepts(le));
  EXPECT_TRUE(bredr.accepts(classic));
  EXPECT_TRUE(bredr.accepts(dual));

  EXPECT_TRUE(known.accepts(stale));
  EXPECT_TRUE(known.accepts(PropertyMap{{"Trusted", true}}));
  EXPECT_FALSE(known.accepts(le));
}

TEST(BlueZDecodingTest, SourceIds) {
  EXPECT_EQ(LeProbe().id(), SOURCE_BLE);
  EXPECT_EQ(ClassicProbe().id(), SOURCE_CLASSIC);
  EXPECT_EQ(RegistryProbe().id(), SOURCE_PLATFORM_REGISTRY);
}
