/**
 * @file aggregator.h
 * @brief Multi-source discovery aggregation
 *
 * The Aggregator runs the requested scan sources (concurrently or one at a
 * time), waits for all of them to settle or time out, and then folds their
 * observations into canonical device records on the calling thread. A source
 * that fails or overruns its budget is reported in source_errors and never
 * affects the other sources.
 */

#ifndef BTCATALOG_AGGREGATOR_H
#define BTCATALOG_AGGREGATOR_H

#include "config.h"
#include "enrichment.h"
#include "error.h"
#include "platform.h"
#include "scan_request.h"
#include "scan_source.h"
#include "types.h"
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace btcatalog {

/**
 * @brief Tunables of the aggregation engine
 */
struct AggregatorOptions {
  /// Time a source may run beyond the scan duration
  std::chrono::milliseconds grace_period{2000};

  /// Merge priority, highest first
  std::vector<std::string> source_priority =
      CatalogConfig::default_source_priority();

  /// Run the enrichment pass
  bool enrich = true;

  static AggregatorOptions from_config(const CatalogConfig &config);
};

/**
 * @brief Fan-out/fan-in orchestrator for scan sources
 *
 * Registry and enrichment pipeline must outlive the aggregator.
 */
class BTCATALOG_API Aggregator {
public:
  Aggregator(const SourceRegistry &registry,
             const EnrichmentPipeline &enrichment,
             AggregatorOptions options = {});
  ~Aggregator();

  // Non-copyable
  Aggregator(const Aggregator &) = delete;
  Aggregator &operator=(const Aggregator &) = delete;

  /**
   * @brief Run one aggregation
   * @return The catalog, or a validation error, or TotalFailure when every
   *         source failed and no device was produced
   */
  Result<AggregationResult> aggregate(const ScanRequest &request) const;

  /**
   * @brief Order in which the given sources are folded
   *
   * Sources named in the priority list come first in that order, the rest
   * follow in the given order. Duplicates are dropped.
   */
  std::vector<std::string>
  fold_order(const std::vector<std::string> &sources) const;

  const AggregatorOptions &options() const;

private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace btcatalog

#endif // BTCATALOG_AGGREGATOR_H
