/**
 * @file naming.cpp
 * @brief Device name helpers
 */

#include "btcatalog/naming.h"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <vector>

namespace btcatalog {

std::string decode_ascii_name(const std::string &encoded) {
  if (encoded.empty()) {
    return encoded;
  }

  for (char c : encoded) {
    unsigned char uc = static_cast<unsigned char>(c);
    if (!std::isdigit(uc) && !std::isspace(uc)) {
      return encoded;
    }
  }

  std::istringstream iss(encoded);
  std::string token;
  std::string decoded;
  while (iss >> token) {
    // Codes above 3 digits cannot be ASCII
    if (token.size() > 3) {
      return encoded;
    }
    int code = std::stoi(token);
    if (code == 0) {
      break;
    }
    if (code >= 32 && code <= 126) {
      decoded.push_back(static_cast<char>(code));
    }
  }

  bool has_alpha = std::any_of(decoded.begin(), decoded.end(), [](char c) {
    return std::isalpha(static_cast<unsigned char>(c)) != 0;
  });

  if (decoded.size() >= 2 && has_alpha) {
    return decoded;
  }
  return encoded;
}

bool is_ascii_encoded_name(const std::string &name) {
  return decode_ascii_name(name) != name;
}

std::string to_lower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return text;
}

std::string trim(const std::string &text) {
  auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
  auto begin = std::find_if_not(text.begin(), text.end(), is_space);
  auto end = std::find_if_not(text.rbegin(), text.rend(), is_space).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

bool name_matches(const std::string &name, const std::string &needle) {
  if (needle.empty()) {
    return true;
  }
  return to_lower(name).find(to_lower(needle)) != std::string::npos;
}

} // namespace btcatalog
