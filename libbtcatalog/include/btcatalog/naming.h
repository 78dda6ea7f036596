/**
 * @file naming.h
 * @brief Device name helpers shared by the merger, enrichment and filter
 */

#ifndef BTCATALOG_NAMING_H
#define BTCATALOG_NAMING_H

#include "platform.h"
#include <string>

namespace btcatalog {

/**
 * @brief Decode names reported as decimal ASCII codes
 *
 * Some Windows/BlueZ paths expose names as "105 80 104 111 110 101 0".
 * Decoding stops at the first 0 and keeps printable characters only. The
 * input is returned unchanged unless the result has at least two characters
 * and one letter.
 */
BTCATALOG_API std::string decode_ascii_name(const std::string &encoded);

/// True when decode_ascii_name() would change the name
BTCATALOG_API bool is_ascii_encoded_name(const std::string &name);

/// ASCII lower-case copy
BTCATALOG_API std::string to_lower(std::string text);

/// Trim ASCII whitespace on both ends
BTCATALOG_API std::string trim(const std::string &text);

/**
 * @brief Case-insensitive substring match used by the name filter
 *
 * An empty needle matches everything.
 */
BTCATALOG_API bool name_matches(const std::string &name,
                                const std::string &needle);

} // namespace btcatalog

#endif // BTCATALOG_NAMING_H
