/**
 * @file btcatalog.cpp
 * @brief Catalog facade and startup helpers
 */

#include "btcatalog/btcatalog.h"
#include "platform/linux/bluez_scan.h"

namespace btcatalog {

VersionInfo get_version() { return VersionInfo{}; }

// ============================================================================
// Startup Helpers
// ============================================================================

Result<LookupTables> load_lookup_tables(const CatalogConfig &config) {
  if (config.lookup_tables_path.empty()) {
    return LookupTables::builtin();
  }
  return LookupTables::load(config.lookup_tables_path);
}

Result<SourceRegistry> create_default_registry(const CatalogConfig &config) {
  platform::BlueZSourceOptions options;
  options.adapter = config.adapter;

  SourceRegistry registry;
  BTCATALOG_TRY(
      registry.add(std::make_shared<platform::BlueZLeSource>(options)));
  BTCATALOG_TRY(
      registry.add(std::make_shared<platform::BlueZClassicSource>(options)));
  BTCATALOG_TRY(
      registry.add(std::make_shared<platform::BlueZRegistrySource>(options)));
  return registry;
}

// ============================================================================
// Catalog Implementation
// ============================================================================

class Catalog::Impl {
public:
  CatalogConfig config;
  LookupTables tables;
  SourceRegistry sources;
  std::unique_ptr<EnrichmentPipeline> enrichment;
  std::unique_ptr<Aggregator> aggregator;
};

Catalog::Catalog() : impl_(std::make_unique<Impl>()) {
  impl_->config.load_defaults();
}

Catalog::~Catalog() = default;

Result<void> Catalog::init(const CatalogConfig &config) {
  auto sources = create_default_registry(config);
  if (sources.is_error()) {
    return sources.error();
  }
  return init(config, std::move(sources).value());
}

Result<void> Catalog::init(const CatalogConfig &config,
                           SourceRegistry sources) {
  BTCATALOG_TRY(config.validate());

  auto tables = load_lookup_tables(config);
  if (tables.is_error()) {
    return tables.error();
  }

  // Rebuild in place: the aggregator keeps references into impl_
  impl_->aggregator.reset();
  impl_->enrichment.reset();

  impl_->config = config;
  impl_->tables = std::move(tables).value();
  impl_->sources = std::move(sources);
  impl_->enrichment = std::make_unique<EnrichmentPipeline>(impl_->tables);
  impl_->aggregator = std::make_unique<Aggregator>(
      impl_->sources, *impl_->enrichment,
      AggregatorOptions::from_config(impl_->config));

  log::get()->debug("Catalog ready: {} source(s), lookup tables '{}'",
                    impl_->sources.size(), impl_->tables.version());
  return Result<void>::ok();
}

bool Catalog::is_initialized() const { return impl_->aggregator != nullptr; }

Result<AggregationResult> Catalog::scan(const ScanRequest &request) const {
  if (!impl_->aggregator) {
    return Error(ErrorCode::InvalidState, "Catalog is not initialized");
  }
  return impl_->aggregator->aggregate(request);
}

Result<AggregationResult> Catalog::scan(ScanPreset preset) const {
  return scan(make_preset_request(preset, impl_->config));
}

const CatalogConfig &Catalog::config() const { return impl_->config; }

const LookupTables &Catalog::lookup_tables() const { return impl_->tables; }

const SourceRegistry &Catalog::sources() const { return impl_->sources; }

} // namespace btcatalog
