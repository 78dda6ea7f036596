/**
 * @file enrichment.cpp
 * @brief Enrichment pipeline implementation
 */

#include "btcatalog/enrichment.h"
#include "btcatalog/address.h"
#include "btcatalog/naming.h"
#include "btcatalog/scan_source.h"
#include <set>
#include <stdexcept>

namespace btcatalog {

EnrichmentPipeline::EnrichmentPipeline(const LookupTables &tables)
    : tables_(tables) {
  transport_labels_[SOURCE_BLE] = "BLE";
  transport_labels_[SOURCE_CLASSIC] = "Classic";
  transport_labels_[SOURCE_PLATFORM_REGISTRY] = "Registry";
}

void EnrichmentPipeline::set_transport_label(const std::string &source_id,
                                             std::string label) {
  transport_labels_[source_id] = std::move(label);
}

std::optional<std::string>
EnrichmentPipeline::manufacturer_company(const CanonicalDevice &device) const {
  const auto *data =
      find_attribute<KeyedBytes>(device.attributes, attr::MANUFACTURER_DATA);
  if (!data) {
    return std::nullopt;
  }

  // Keys are decimal company ids; the lowest known id wins
  std::set<uint16_t> ids;
  for (const auto &entry : *data) {
    size_t parsed = 0;
    unsigned long id = 0;
    try {
      id = std::stoul(entry.first, &parsed, 10);
    } catch (const std::logic_error &) {
      continue;
    }
    if (parsed != entry.first.size() || id > 0xFFFF) {
      continue;
    }
    ids.insert(static_cast<uint16_t>(id));
  }

  for (uint16_t id : ids) {
    auto company = tables_.company_name(id);
    if (company) {
      return company;
    }
  }
  return std::nullopt;
}

std::string EnrichmentPipeline::friendly_name(const CanonicalDevice &device) const {
  if (is_ascii_encoded_name(device.name)) {
    return decode_ascii_name(device.name);
  }

  if (!is_placeholder_name(device.name)) {
    return device.name;
  }

  auto hint = tables_.vendor_hint(device.address);
  if (hint && !hint->friendly_name.empty()) {
    return hint->friendly_name;
  }

  std::string suffix = address_suffix(device.address);

  auto company = manufacturer_company(device);
  if (company) {
    return *company + " Device (" + suffix + ")";
  }

  return "BT Device " + suffix;
}

std::optional<std::string>
EnrichmentPipeline::transport_type(const CanonicalDevice &device) const {
  std::set<std::string> labels;
  for (const auto &source : device.detection_sources) {
    auto it = transport_labels_.find(source);
    labels.insert(it != transport_labels_.end() ? it->second : source);
  }
  if (labels.empty()) {
    return std::nullopt;
  }

  std::string joined;
  for (const auto &label : labels) {
    if (!joined.empty()) {
      joined += '+';
    }
    joined += label;
  }
  return joined;
}

CanonicalDevice EnrichmentPipeline::enrich(CanonicalDevice device) const {
  DerivedInfo derived;

  auto hint = tables_.vendor_hint(device.address);
  if (hint) {
    if (!hint->company.empty()) {
      derived.vendor = hint->company;
    }
    if (!hint->device_type.empty()) {
      derived.category = hint->device_type;
    }
  }

  derived.company_name = manufacturer_company(device);
  if (!derived.company_name && derived.vendor) {
    derived.company_name = derived.vendor;
  }

  if (!derived.category) {
    const auto *major = find_attribute<std::string>(device.attributes,
                                                    attr::MAJOR_DEVICE_CLASS);
    if (major && !major->empty()) {
      derived.category = *major;
    }
  }

  derived.device_type = transport_type(device);
  derived.friendly_name = friendly_name(device);

  if (is_placeholder_name(device.name) && !derived.friendly_name->empty()) {
    device.name = *derived.friendly_name;
  }

  device.derived = std::move(derived);
  return device;
}

} // namespace btcatalog
