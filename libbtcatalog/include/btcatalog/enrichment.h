/**
 * @file enrichment.h
 * @brief Post-merge derivation of human-friendly device attributes
 *
 * Enrichment runs once per finalized device. It only fills
 * CanonicalDevice::derived and, while the name is still the placeholder,
 * replaces the name with the synthesized friendly name. Identity fields
 * (canonical_id, address, detection_sources, merged_from) are never touched,
 * so the pass can be skipped entirely without changing the catalog's shape.
 */

#ifndef BTCATALOG_ENRICHMENT_H
#define BTCATALOG_ENRICHMENT_H

#include "lookup_tables.h"
#include "platform.h"
#include "types.h"
#include <map>
#include <string>

namespace btcatalog {

class BTCATALOG_API EnrichmentPipeline {
public:
  /// Tables must outlive the pipeline
  explicit EnrichmentPipeline(const LookupTables &tables);

  /**
   * @brief Derive secondary attributes for one device
   *
   * A lookup miss is a no-op, never an error.
   */
  CanonicalDevice enrich(CanonicalDevice device) const;

  /// Company name for the lowest known decimal id in manufacturer_data
  std::optional<std::string>
  manufacturer_company(const CanonicalDevice &device) const;

  /// Friendly label built from name, prefix hint and manufacturer
  std::string friendly_name(const CanonicalDevice &device) const;

  /// "BLE", "Classic", "BLE+Classic", ... from detection_sources
  std::optional<std::string> transport_type(const CanonicalDevice &device) const;

  /// Override the transport label of a source id ("ble" -> "BLE")
  void set_transport_label(const std::string &source_id, std::string label);

private:
  const LookupTables &tables_;
  std::map<std::string, std::string> transport_labels_;
};

} // namespace btcatalog

#endif // BTCATALOG_ENRICHMENT_H
