/**
 * @file address.h
 * @brief Canonical form of Bluetooth device addresses
 *
 * Scan sources report addresses in whatever format their backend uses
 * ("aa:bb:cc:dd:ee:ff", "AABBCCDDEEFF", "AA-BB-CC-DD-EE-FF",
 * "aabb.ccdd.eeff"). normalize_address() reduces all of them to
 * "AA:BB:CC:DD:EE:FF" so observations of one radio compare equal.
 *
 * Identifiers that do not reduce to exactly 12 hex digits (opaque platform
 * handles) are passed through unchanged and flagged as not normalizable.
 */

#ifndef BTCATALOG_ADDRESS_H
#define BTCATALOG_ADDRESS_H

#include "platform.h"
#include <optional>
#include <string>

namespace btcatalog {

/// Number of hex digits in a 48-bit address
constexpr size_t ADDRESS_HEX_DIGITS = 12;

/// Separator used in the canonical form
constexpr char ADDRESS_SEPARATOR = ':';

/**
 * @brief Output of normalize_address()
 */
struct NormalizedAddress {
  /// Canonical form, or the untouched input when not normalizable
  std::string value;

  /// False for opaque identifiers (never merged across sources)
  bool normalizable = false;
};

/**
 * @brief Canonicalize a raw address
 *
 * Drops every non-alphanumeric character, upper-cases the rest and, when
 * exactly 12 hex digits remain, re-inserts ':' every two characters.
 * Idempotent: normalize_address(normalize_address(x).value) == normalize_address(x).
 */
BTCATALOG_API NormalizedAddress normalize_address(const std::string &raw);

/// Shorthand for normalize_address(raw).value
BTCATALOG_API std::string canonical_address(const std::string &raw);

/// True if raw reduces to a 48-bit address
BTCATALOG_API bool is_normalizable_address(const std::string &raw);

/**
 * @brief Organizationally unique prefix ("AA:BB:CC")
 * @return nullopt for identifiers that are not normalizable
 */
BTCATALOG_API std::optional<std::string> oui_prefix(const std::string &address);

/// Last 8 characters of an address ("DD:EE:FF" with separators)
BTCATALOG_API std::string address_suffix(const std::string &address);

} // namespace btcatalog

#endif // BTCATALOG_ADDRESS_H
