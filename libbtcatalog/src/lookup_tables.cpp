/**
 * @file lookup_tables.cpp
 * @brief Lookup table access and JSON loading
 */

#include "btcatalog/lookup_tables.h"
#include "btcatalog/address.h"
#include "btcatalog/log.h"
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>

namespace fs = std::filesystem;

namespace btcatalog {

std::optional<std::string> LookupTables::company_name(uint16_t company_id) const {
  auto it = manufacturers_.find(company_id);
  if (it == manufacturers_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<VendorHint>
LookupTables::vendor_hint(const std::string &address) const {
  auto prefix = oui_prefix(address);
  if (!prefix) {
    return std::nullopt;
  }
  auto it = prefixes_.find(*prefix);
  if (it == prefixes_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void LookupTables::add_manufacturer(uint16_t company_id, std::string name) {
  manufacturers_[company_id] = std::move(name);
}

void LookupTables::add_prefix(const std::string &prefix, VendorHint hint) {
  // Prefixes are stored as the first three octets of a canonical address
  std::string key = canonical_address(prefix + ":00:00:00").substr(0, 8);
  prefixes_[key] = std::move(hint);
}

// ============================================================================
// JSON Loading
// ============================================================================

Result<LookupTables> LookupTables::parse(const std::string &json_text) {
  nlohmann::json doc;
  try {
    doc = nlohmann::json::parse(json_text);
  } catch (const nlohmann::json::parse_error &e) {
    return Error(ErrorCode::LookupTableError, "Malformed lookup table JSON",
                 e.what());
  }

  if (!doc.is_object()) {
    return Error(ErrorCode::LookupTableError,
                 "Lookup table root must be an object");
  }

  LookupTables tables;
  try {
    tables.version_ = doc.value("version", std::string());

    if (doc.contains("manufacturers")) {
      for (const auto &[key, value] : doc.at("manufacturers").items()) {
        // Keys are decimal ids or "0x"-prefixed hex ids
        bool hex = key.size() > 2 && key[0] == '0' &&
                   (key[1] == 'x' || key[1] == 'X');
        size_t parsed = 0;
        unsigned long id = std::stoul(key, &parsed, hex ? 16 : 10);
        if (parsed != key.size()) {
          return Error(ErrorCode::LookupTableError,
                       "Invalid company identifier", key);
        }
        if (id > 0xFFFF) {
          return Error(ErrorCode::LookupTableError,
                       "Company identifier out of range", key);
        }
        tables.add_manufacturer(static_cast<uint16_t>(id),
                                value.get<std::string>());
      }
    }

    if (doc.contains("prefixes")) {
      for (const auto &[key, value] : doc.at("prefixes").items()) {
        if (!is_normalizable_address(key + ":00:00:00")) {
          return Error(ErrorCode::LookupTableError, "Invalid MAC prefix", key);
        }
        VendorHint hint;
        hint.company = value.value("company", std::string());
        hint.device_type = value.value("device_type", std::string());
        hint.model = value.value("model", std::string());
        hint.friendly_name = value.value("friendly_name", std::string());
        tables.add_prefix(key, std::move(hint));
      }
    }
  } catch (const nlohmann::json::exception &e) {
    return Error(ErrorCode::LookupTableError, "Unexpected lookup table layout",
                 e.what());
  } catch (const std::logic_error &e) {
    return Error(ErrorCode::LookupTableError, "Invalid company identifier",
                 e.what());
  }

  return tables;
}

Result<LookupTables> LookupTables::load(const fs::path &path) {
  std::error_code ec;
  if (!fs::exists(path, ec)) {
    return Error(ErrorCode::FileNotFound, "Lookup table file not found",
                 path.string());
  }

  std::ifstream in(path);
  if (!in) {
    return Error(ErrorCode::FileReadError, "Cannot open lookup table file",
                 path.string());
  }

  std::ostringstream contents;
  contents << in.rdbuf();

  auto result = parse(contents.str());
  if (result.is_error()) {
    result.error().location = path.string();
    return result;
  }

  log::get()->info("Loaded lookup tables '{}' ({} manufacturers, {} prefixes)",
                   result.value().version(),
                   result.value().manufacturer_count(),
                   result.value().prefix_count());
  return result;
}

} // namespace btcatalog
