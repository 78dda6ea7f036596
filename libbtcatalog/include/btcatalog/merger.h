/**
 * @file merger.h
 * @brief Folding raw observations into canonical device records
 *
 * The merger decides, field by field, which of two partial views of the same
 * device survives. The rules:
 *
 * - Fill, never overwrite: an incoming value only replaces an absent, empty
 *   or placeholder value. A later empty value never clears a known one.
 * - Names: a real name beats "Unknown". When two sources disagree the
 *   first-seen name stays primary and the other goes to "alternate_names".
 * - Signal strength follows source priority (lower rank wins, equal rank
 *   means the latest value wins).
 * - String and integer lists are unioned in order, keyed byte maps are
 *   filled key by key.
 * - Provenance: detection_sources is a set-union, merged_from logs every
 *   raw identifier, duplicates included.
 *
 * The outcome depends on call order. Callers must serialize merges.
 */

#ifndef BTCATALOG_MERGER_H
#define BTCATALOG_MERGER_H

#include "platform.h"
#include "types.h"
#include <optional>

namespace btcatalog {

/**
 * @brief Merge one attribute value into another
 * @return True if existing was modified
 */
BTCATALOG_API bool merge_attribute(AttributeValue &existing,
                                   const AttributeValue &incoming);

/**
 * @brief Stateless record merger
 */
class BTCATALOG_API RecordMerger {
public:
  /**
   * @brief Fold an observation into a device record
   * @param existing Record built so far, nullopt to create a new one
   * @param incoming Observation believed to describe the same device
   * @param source_rank Priority of incoming.source_id (0 = highest)
   * @return The updated record
   */
  CanonicalDevice merge(std::optional<CanonicalDevice> existing,
                        const RawObservation &incoming,
                        int source_rank) const;

  /**
   * @brief In-place variant used by the aggregator's fold loop
   */
  void merge_into(CanonicalDevice &device, const RawObservation &incoming,
                  int source_rank) const;

  /// Create a record from a first observation
  CanonicalDevice create(const RawObservation &incoming,
                         int source_rank) const;

private:
  void merge_name(CanonicalDevice &device, const RawObservation &incoming) const;
  void merge_signal(CanonicalDevice &device, const RawObservation &incoming,
                    int source_rank) const;
  void merge_attributes(CanonicalDevice &device,
                        const RawObservation &incoming) const;
  void record_provenance(CanonicalDevice &device,
                         const RawObservation &incoming) const;
};

} // namespace btcatalog

#endif // BTCATALOG_MERGER_H
