/**
 * @file dbus_helpers.h
 * @brief D-Bus utility functions for the BlueZ scan sources
 *
 * RAII wrappers around libdbus objects plus decoding of the variant-typed
 * property dictionaries returned by org.freedesktop.DBus.ObjectManager.
 */

#ifndef BTCATALOG_PLATFORM_LINUX_DBUS_HELPERS_H
#define BTCATALOG_PLATFORM_LINUX_DBUS_HELPERS_H

#include "btcatalog/error.h"
#include "btcatalog/types.h"
#include <cstring>
#include <dbus/dbus.h>
#include <map>
#include <optional>
#include <string>

namespace btcatalog {
namespace platform {

/// Properties of one interface, decoded into attribute values
using PropertyMap = std::map<std::string, AttributeValue>;

/// Interface name to properties
using InterfaceMap = std::map<std::string, PropertyMap>;

/// Object path to interfaces, as returned by GetManagedObjects
using ManagedObjects = std::map<std::string, InterfaceMap>;

// ============================================================================
// D-Bus Connection RAII Wrapper
// ============================================================================

/**
 * @brief RAII wrapper for DBusConnection
 *
 * Private connections are closed before the last reference is dropped.
 */
class DBusConnectionWrapper {
public:
  DBusConnectionWrapper() = default;

  explicit DBusConnectionWrapper(DBusConnection *conn, bool is_private = false)
      : conn_(conn), private_(is_private) {}

  ~DBusConnectionWrapper() { reset(); }

  // Move-only
  DBusConnectionWrapper(DBusConnectionWrapper &&other) noexcept
      : conn_(other.conn_), private_(other.private_) {
    other.conn_ = nullptr;
  }

  DBusConnectionWrapper &operator=(DBusConnectionWrapper &&other) noexcept {
    if (this != &other) {
      reset();
      conn_ = other.conn_;
      private_ = other.private_;
      other.conn_ = nullptr;
    }
    return *this;
  }

  DBusConnectionWrapper(const DBusConnectionWrapper &) = delete;
  DBusConnectionWrapper &operator=(const DBusConnectionWrapper &) = delete;

  DBusConnection *get() const { return conn_; }
  operator bool() const { return conn_ != nullptr; }

private:
  void reset() {
    if (conn_) {
      if (private_) {
        dbus_connection_close(conn_);
      }
      dbus_connection_unref(conn_);
      conn_ = nullptr;
    }
  }

  DBusConnection *conn_ = nullptr;
  bool private_ = false;
};

// ============================================================================
// D-Bus Message RAII Wrapper
// ============================================================================

/**
 * @brief RAII wrapper for DBusMessage
 */
class DBusMessageWrapper {
public:
  DBusMessageWrapper() = default;

  explicit DBusMessageWrapper(DBusMessage *msg) : msg_(msg) {}

  ~DBusMessageWrapper() {
    if (msg_) {
      dbus_message_unref(msg_);
    }
  }

  // Move-only
  DBusMessageWrapper(DBusMessageWrapper &&other) noexcept : msg_(other.msg_) {
    other.msg_ = nullptr;
  }

  DBusMessageWrapper &operator=(DBusMessageWrapper &&other) noexcept {
    if (this != &other) {
      if (msg_) {
        dbus_message_unref(msg_);
      }
      msg_ = other.msg_;
      other.msg_ = nullptr;
    }
    return *this;
  }

  DBusMessageWrapper(const DBusMessageWrapper &) = delete;
  DBusMessageWrapper &operator=(const DBusMessageWrapper &) = delete;

  DBusMessage *get() const { return msg_; }
  operator bool() const { return msg_ != nullptr; }

private:
  DBusMessage *msg_ = nullptr;
};

// ============================================================================
// D-Bus Error Helper
// ============================================================================

/**
 * @brief Convert DBusError to a btcatalog Error
 *
 * The D-Bus error name is kept at the start of the message.
 */
inline Error dbus_error_to_btcatalog(const DBusError &err) {
  if (!dbus_error_is_set(&err)) {
    return Error(ErrorCode::PlatformError, "D-Bus call failed");
  }

  std::string name = err.name ? std::string(err.name) : "D-Bus error";
  std::string message = name;
  if (err.message) {
    message += ": ";
    message += err.message;
  }

  ErrorCode code = ErrorCode::PlatformError;
  if (name == "org.bluez.Error.NotReady") {
    code = ErrorCode::BluetoothOff;
  } else if (name == "org.bluez.Error.NotAuthorized" ||
             name == DBUS_ERROR_ACCESS_DENIED) {
    code = ErrorCode::PermissionDenied;
  } else if (name == DBUS_ERROR_SERVICE_UNKNOWN ||
             name == DBUS_ERROR_NAME_HAS_NO_OWNER) {
    code = ErrorCode::ServiceUnavailable;
  } else if (name == DBUS_ERROR_NO_REPLY || name == DBUS_ERROR_TIMEOUT) {
    code = ErrorCode::Timeout;
  }

  return Error(code, message);
}

/**
 * @brief RAII wrapper for DBusError
 */
class DBusErrorWrapper {
public:
  DBusErrorWrapper() { dbus_error_init(&err_); }
  ~DBusErrorWrapper() { dbus_error_free(&err_); }

  DBusErrorWrapper(const DBusErrorWrapper &) = delete;
  DBusErrorWrapper &operator=(const DBusErrorWrapper &) = delete;

  DBusError *get() { return &err_; }
  bool is_set() const { return dbus_error_is_set(&err_); }
  Error to_error() const { return dbus_error_to_btcatalog(err_); }

private:
  DBusError err_;
};

// ============================================================================
// Connections and Calls
// ============================================================================

/**
 * @brief Open a private connection to the system bus
 *
 * Each scan source owns its connection, so concurrent sources never share
 * libdbus state and BlueZ sees them as separate discovery clients.
 */
inline Result<DBusConnectionWrapper> open_private_system_bus() {
  dbus_threads_init_default();

  DBusErrorWrapper error;
  DBusConnection *conn = dbus_bus_get_private(DBUS_BUS_SYSTEM, error.get());

  if (!conn || error.is_set()) {
    Error err = error.to_error();
    if (err.code == ErrorCode::PlatformError) {
      err.code = ErrorCode::ServiceUnavailable;
    }
    return err;
  }

  dbus_connection_set_exit_on_disconnect(conn, FALSE);
  return DBusConnectionWrapper(conn, true);
}

/**
 * @brief Send a prepared method call and wait for its reply
 */
inline Result<DBusMessageWrapper> send_and_wait(DBusConnection *conn,
                                                DBusMessage *msg,
                                                int timeout_ms) {
  DBusErrorWrapper error;
  DBusMessage *reply = dbus_connection_send_with_reply_and_block(
      conn, msg, timeout_ms, error.get());

  if (!reply || error.is_set()) {
    return error.to_error();
  }

  return DBusMessageWrapper(reply);
}

/**
 * @brief Call a D-Bus method without arguments and get the reply
 * @param timeout_ms Timeout in milliseconds (-1 for default)
 */
inline Result<DBusMessageWrapper>
call_method(DBusConnection *conn, const char *dest, const char *path,
            const char *iface, const char *method, int timeout_ms = -1) {
  DBusMessageWrapper msg(
      dbus_message_new_method_call(dest, path, iface, method));

  if (!msg) {
    return Error(ErrorCode::PlatformError, "Failed to create D-Bus message");
  }

  return send_and_wait(conn, msg.get(), timeout_ms);
}

/**
 * @brief Append an a{sv} dictionary of string values
 */
inline bool append_string_dict(DBusMessageIter *iter,
                               const std::map<std::string, std::string> &dict) {
  DBusMessageIter array_iter;
  if (!dbus_message_iter_open_container(iter, DBUS_TYPE_ARRAY, "{sv}",
                                        &array_iter)) {
    return false;
  }

  for (const auto &[key, value] : dict) {
    DBusMessageIter entry_iter, variant_iter;
    const char *key_str = key.c_str();
    const char *value_str = value.c_str();

    dbus_message_iter_open_container(&array_iter, DBUS_TYPE_DICT_ENTRY,
                                     nullptr, &entry_iter);
    dbus_message_iter_append_basic(&entry_iter, DBUS_TYPE_STRING, &key_str);
    dbus_message_iter_open_container(&entry_iter, DBUS_TYPE_VARIANT,
                                     DBUS_TYPE_STRING_AS_STRING, &variant_iter);
    dbus_message_iter_append_basic(&variant_iter, DBUS_TYPE_STRING,
                                   &value_str);
    dbus_message_iter_close_container(&entry_iter, &variant_iter);
    dbus_message_iter_close_container(&array_iter, &entry_iter);
  }

  return dbus_message_iter_close_container(iter, &array_iter);
}

// ============================================================================
// Variant Decoding
// ============================================================================

/// Read a basic integer of any width as int64
inline std::optional<int64_t> read_integer(DBusMessageIter *iter) {
  switch (dbus_message_iter_get_arg_type(iter)) {
  case DBUS_TYPE_BYTE: {
    unsigned char v = 0;
    dbus_message_iter_get_basic(iter, &v);
    return v;
  }
  case DBUS_TYPE_INT16: {
    dbus_int16_t v = 0;
    dbus_message_iter_get_basic(iter, &v);
    return v;
  }
  case DBUS_TYPE_UINT16: {
    dbus_uint16_t v = 0;
    dbus_message_iter_get_basic(iter, &v);
    return v;
  }
  case DBUS_TYPE_INT32: {
    dbus_int32_t v = 0;
    dbus_message_iter_get_basic(iter, &v);
    return v;
  }
  case DBUS_TYPE_UINT32: {
    dbus_uint32_t v = 0;
    dbus_message_iter_get_basic(iter, &v);
    return v;
  }
  case DBUS_TYPE_INT64: {
    dbus_int64_t v = 0;
    dbus_message_iter_get_basic(iter, &v);
    return static_cast<int64_t>(v);
  }
  case DBUS_TYPE_UINT64: {
    dbus_uint64_t v = 0;
    dbus_message_iter_get_basic(iter, &v);
    return static_cast<int64_t>(v);
  }
  default:
    return std::nullopt;
  }
}

/// Read a byte array (ay), possibly wrapped in a variant
inline std::optional<Bytes> read_bytes(DBusMessageIter *iter) {
  DBusMessageIter inner;
  if (dbus_message_iter_get_arg_type(iter) == DBUS_TYPE_VARIANT) {
    dbus_message_iter_recurse(iter, &inner);
    return read_bytes(&inner);
  }

  if (dbus_message_iter_get_arg_type(iter) != DBUS_TYPE_ARRAY ||
      dbus_message_iter_get_element_type(iter) != DBUS_TYPE_BYTE) {
    return std::nullopt;
  }

  DBusMessageIter array_iter;
  dbus_message_iter_recurse(iter, &array_iter);
  const unsigned char *data = nullptr;
  int length = 0;
  dbus_message_iter_get_fixed_array(&array_iter, &data, &length);
  if (!data || length <= 0) {
    return Bytes();
  }
  return Bytes(data, data + length);
}

/**
 * @brief Decode the value of a variant into an attribute value
 *
 * Supports strings and object paths, booleans, integers, string arrays,
 * byte arrays, and dictionaries of byte arrays keyed by uint16 or string
 * (ManufacturerData, ServiceData). Other types yield nullopt.
 */
inline std::optional<AttributeValue> read_variant(DBusMessageIter *variant) {
  DBusMessageIter iter;
  if (dbus_message_iter_get_arg_type(variant) == DBUS_TYPE_VARIANT) {
    dbus_message_iter_recurse(variant, &iter);
  } else {
    iter = *variant;
  }

  int type = dbus_message_iter_get_arg_type(&iter);

  if (type == DBUS_TYPE_STRING || type == DBUS_TYPE_OBJECT_PATH) {
    const char *value = nullptr;
    dbus_message_iter_get_basic(&iter, &value);
    return AttributeValue(std::string(value ? value : ""));
  }

  if (type == DBUS_TYPE_BOOLEAN) {
    dbus_bool_t value = FALSE;
    dbus_message_iter_get_basic(&iter, &value);
    return AttributeValue(value == TRUE);
  }

  if (auto integer = read_integer(&iter)) {
    return AttributeValue(*integer);
  }

  if (type != DBUS_TYPE_ARRAY) {
    return std::nullopt;
  }

  int element = dbus_message_iter_get_element_type(&iter);

  if (element == DBUS_TYPE_BYTE) {
    auto bytes = read_bytes(&iter);
    if (!bytes) {
      return std::nullopt;
    }
    return AttributeValue(std::move(*bytes));
  }

  DBusMessageIter array_iter;
  dbus_message_iter_recurse(&iter, &array_iter);

  if (element == DBUS_TYPE_STRING || element == DBUS_TYPE_OBJECT_PATH) {
    std::vector<std::string> values;
    while (dbus_message_iter_get_arg_type(&array_iter) == element) {
      const char *value = nullptr;
      dbus_message_iter_get_basic(&array_iter, &value);
      values.emplace_back(value ? value : "");
      dbus_message_iter_next(&array_iter);
    }
    return AttributeValue(std::move(values));
  }

  if (element == DBUS_TYPE_DICT_ENTRY) {
    KeyedBytes keyed;
    while (dbus_message_iter_get_arg_type(&array_iter) ==
           DBUS_TYPE_DICT_ENTRY) {
      DBusMessageIter entry_iter;
      dbus_message_iter_recurse(&array_iter, &entry_iter);

      std::string key;
      if (dbus_message_iter_get_arg_type(&entry_iter) == DBUS_TYPE_STRING) {
        const char *value = nullptr;
        dbus_message_iter_get_basic(&entry_iter, &value);
        key = value ? value : "";
      } else if (auto id = read_integer(&entry_iter)) {
        key = std::to_string(*id);
      } else {
        return std::nullopt;
      }

      dbus_message_iter_next(&entry_iter);
      auto bytes = read_bytes(&entry_iter);
      if (!bytes) {
        return std::nullopt;
      }
      keyed[key] = std::move(*bytes);
      dbus_message_iter_next(&array_iter);
    }
    return AttributeValue(std::move(keyed));
  }

  return std::nullopt;
}

/**
 * @brief Decode an a{sv} property dictionary
 *
 * Properties of unsupported types are skipped.
 */
inline PropertyMap read_properties(DBusMessageIter *dict) {
  PropertyMap properties;
  if (dbus_message_iter_get_arg_type(dict) != DBUS_TYPE_ARRAY) {
    return properties;
  }

  DBusMessageIter array_iter;
  dbus_message_iter_recurse(dict, &array_iter);

  while (dbus_message_iter_get_arg_type(&array_iter) == DBUS_TYPE_DICT_ENTRY) {
    DBusMessageIter entry_iter;
    dbus_message_iter_recurse(&array_iter, &entry_iter);

    const char *name = nullptr;
    dbus_message_iter_get_basic(&entry_iter, &name);
    dbus_message_iter_next(&entry_iter);

    if (name) {
      auto value = read_variant(&entry_iter);
      if (value) {
        properties.emplace(name, std::move(*value));
      }
    }
    dbus_message_iter_next(&array_iter);
  }

  return properties;
}

/**
 * @brief Call ObjectManager.GetManagedObjects and decode the reply
 */
inline Result<ManagedObjects> get_managed_objects(DBusConnection *conn,
                                                  const char *dest,
                                                  int timeout_ms = -1) {
  auto reply = call_method(conn, dest, "/",
                           "org.freedesktop.DBus.ObjectManager",
                           "GetManagedObjects", timeout_ms);
  if (reply.is_error()) {
    return reply.error();
  }

  DBusMessageIter iter, objects_iter;
  if (!dbus_message_iter_init(reply.value().get(), &iter) ||
      dbus_message_iter_get_arg_type(&iter) != DBUS_TYPE_ARRAY) {
    return Error(ErrorCode::PlatformError,
                 "Unexpected GetManagedObjects reply format");
  }

  ManagedObjects objects;
  dbus_message_iter_recurse(&iter, &objects_iter);

  while (dbus_message_iter_get_arg_type(&objects_iter) ==
         DBUS_TYPE_DICT_ENTRY) {
    DBusMessageIter object_iter;
    dbus_message_iter_recurse(&objects_iter, &object_iter);

    const char *path = nullptr;
    dbus_message_iter_get_basic(&object_iter, &path);
    dbus_message_iter_next(&object_iter);

    if (path &&
        dbus_message_iter_get_arg_type(&object_iter) == DBUS_TYPE_ARRAY) {
      InterfaceMap interfaces;
      DBusMessageIter ifaces_iter;
      dbus_message_iter_recurse(&object_iter, &ifaces_iter);

      while (dbus_message_iter_get_arg_type(&ifaces_iter) ==
             DBUS_TYPE_DICT_ENTRY) {
        DBusMessageIter iface_entry;
        dbus_message_iter_recurse(&ifaces_iter, &iface_entry);

        const char *iface = nullptr;
        dbus_message_iter_get_basic(&iface_entry, &iface);
        dbus_message_iter_next(&iface_entry);

        if (iface) {
          interfaces.emplace(iface, read_properties(&iface_entry));
        }
        dbus_message_iter_next(&ifaces_iter);
      }

      objects.emplace(path, std::move(interfaces));
    }

    dbus_message_iter_next(&objects_iter);
  }

  return objects;
}

} // namespace platform
} // namespace btcatalog

#endif // BTCATALOG_PLATFORM_LINUX_DBUS_HELPERS_H
