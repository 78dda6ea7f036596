/**
 * @file merger.cpp
 * @brief Record merger implementation
 */

#include "btcatalog/merger.h"
#include "btcatalog/address.h"
#include "btcatalog/naming.h"
#include <algorithm>
#include <type_traits>

namespace btcatalog {

namespace {

template <typename T>
bool append_missing(std::vector<T> &target, const std::vector<T> &source) {
  bool changed = false;
  for (const auto &item : source) {
    if (std::find(target.begin(), target.end(), item) == target.end()) {
      target.push_back(item);
      changed = true;
    }
  }
  return changed;
}

/// Name carried by an observation after trimming and ASCII decoding
std::string observed_name(const RawObservation &incoming) {
  if (!incoming.display_name) {
    return {};
  }
  return decode_ascii_name(trim(*incoming.display_name));
}

} // namespace

// ============================================================================
// Attribute Merge
// ============================================================================

bool merge_attribute(AttributeValue &existing, const AttributeValue &incoming) {
  if (attribute_is_empty(incoming)) {
    return false;
  }
  if (attribute_is_empty(existing)) {
    existing = incoming;
    return true;
  }
  if (existing.index() != incoming.index()) {
    // Type conflict: the earlier (higher priority) value stays
    return false;
  }

  return std::visit(
      [&incoming](auto &current) -> bool {
        using T = std::decay_t<decltype(current)>;
        const auto &other = std::get<T>(incoming);

        if constexpr (std::is_same_v<T, std::vector<std::string>> ||
                      std::is_same_v<T, std::vector<int64_t>>) {
          return append_missing(current, other);
        } else if constexpr (std::is_same_v<T, KeyedBytes>) {
          bool changed = false;
          for (const auto &[key, bytes] : other) {
            auto it = current.find(key);
            if (it == current.end()) {
              current.emplace(key, bytes);
              changed = true;
            } else if (it->second.empty() && !bytes.empty()) {
              it->second = bytes;
              changed = true;
            }
          }
          return changed;
        } else {
          // Scalars: existing non-empty value is kept
          BTCATALOG_UNUSED(other);
          return false;
        }
      },
      existing);
}

// ============================================================================
// RecordMerger
// ============================================================================

CanonicalDevice RecordMerger::merge(std::optional<CanonicalDevice> existing,
                                    const RawObservation &incoming,
                                    int source_rank) const {
  if (!existing) {
    return create(incoming, source_rank);
  }

  CanonicalDevice device = std::move(*existing);
  merge_into(device, incoming, source_rank);
  return device;
}

CanonicalDevice RecordMerger::create(const RawObservation &incoming,
                                     int source_rank) const {
  CanonicalDevice device;
  auto normalized = normalize_address(incoming.raw_address);
  device.canonical_id = normalized.value;
  device.address = normalized.value;

  merge_into(device, incoming, source_rank);
  return device;
}

void RecordMerger::merge_into(CanonicalDevice &device,
                              const RawObservation &incoming,
                              int source_rank) const {
  merge_name(device, incoming);
  merge_signal(device, incoming, source_rank);
  merge_attributes(device, incoming);
  record_provenance(device, incoming);
}

void RecordMerger::merge_name(CanonicalDevice &device,
                              const RawObservation &incoming) const {
  std::string name = observed_name(incoming);

  if (is_placeholder_name(name)) {
    if (device.name.empty()) {
      device.name = PLACEHOLDER_NAME;
    }
    return;
  }

  if (is_placeholder_name(device.name)) {
    device.name = name;
    return;
  }

  if (name == device.name) {
    return;
  }

  // Two real names: first-seen stays primary, the other is kept aside
  AttributeValue alternates = std::vector<std::string>{name};
  auto it = device.attributes.find(attr::ALTERNATE_NAMES);
  if (it == device.attributes.end()) {
    device.attributes.emplace(attr::ALTERNATE_NAMES, std::move(alternates));
  } else {
    merge_attribute(it->second, alternates);
  }
}

void RecordMerger::merge_signal(CanonicalDevice &device,
                                const RawObservation &incoming,
                                int source_rank) const {
  if (!incoming.signal_strength) {
    return;
  }

  bool take = !device.signal_strength || !device.signal_rank ||
              source_rank <= *device.signal_rank;
  if (take) {
    device.signal_strength = incoming.signal_strength;
    device.signal_rank = source_rank;
  }
}

void RecordMerger::merge_attributes(CanonicalDevice &device,
                                    const RawObservation &incoming) const {
  for (const auto &[key, value] : incoming.attributes) {
    auto it = device.attributes.find(key);
    if (it == device.attributes.end()) {
      if (!attribute_is_empty(value)) {
        device.attributes.emplace(key, value);
      }
      continue;
    }
    merge_attribute(it->second, value);
  }
}

void RecordMerger::record_provenance(CanonicalDevice &device,
                                     const RawObservation &incoming) const {
  if (!device.has_source(incoming.source_id)) {
    device.detection_sources.push_back(incoming.source_id);
  }
  device.merged_from.push_back(incoming.raw_address);
}

} // namespace btcatalog
