/**
 * @file address.cpp
 * @brief Address normalization
 */

#include "btcatalog/address.h"
#include <cctype>

namespace btcatalog {

NormalizedAddress normalize_address(const std::string &raw) {
  std::string digits;
  digits.reserve(raw.size());

  for (char c : raw) {
    unsigned char uc = static_cast<unsigned char>(c);
    if (std::isalnum(uc)) {
      digits.push_back(static_cast<char>(std::toupper(uc)));
    }
  }

  if (digits.size() != ADDRESS_HEX_DIGITS) {
    return NormalizedAddress{raw, false};
  }
  for (char c : digits) {
    if (!std::isxdigit(static_cast<unsigned char>(c))) {
      return NormalizedAddress{raw, false};
    }
  }

  std::string canonical;
  canonical.reserve(ADDRESS_HEX_DIGITS + ADDRESS_HEX_DIGITS / 2 - 1);
  for (size_t i = 0; i < ADDRESS_HEX_DIGITS; i += 2) {
    if (i > 0) {
      canonical.push_back(ADDRESS_SEPARATOR);
    }
    canonical.append(digits, i, 2);
  }

  return NormalizedAddress{canonical, true};
}

std::string canonical_address(const std::string &raw) {
  return normalize_address(raw).value;
}

bool is_normalizable_address(const std::string &raw) {
  return normalize_address(raw).normalizable;
}

std::optional<std::string> oui_prefix(const std::string &address) {
  auto normalized = normalize_address(address);
  if (!normalized.normalizable) {
    return std::nullopt;
  }
  return normalized.value.substr(0, 8);
}

std::string address_suffix(const std::string &address) {
  if (address.size() <= 8) {
    return address;
  }
  return address.substr(address.size() - 8);
}

} // namespace btcatalog
