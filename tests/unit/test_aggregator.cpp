/**
 * @file test_aggregator.cpp
 * @brief Unit tests for the aggregation orchestrator
 */

#include "fake_source.h"

#include <btcatalog/aggregator.h>
#include <gtest/gtest.h>

#include <stdexcept>
#include <thread>

using namespace btcatalog;
using namespace std::chrono_literals;
using btcatalog::test::add_fake;

class AggregatorTest : public ::testing::Test {
protected:
  SourceRegistry registry;
  LookupTables tables;
  std::unique_ptr<EnrichmentPipeline> enrichment;
  AggregatorOptions options;

  void SetUp() override {
    tables.set_version("test");
    tables.add_manufacturer(0x004C, "Apple, Inc.");
    enrichment = std::make_unique<EnrichmentPipeline>(tables);
    options.grace_period = 50ms;
  }

  ScanRequest quick_request(std::vector<std::string> sources = {}) {
    ScanRequest request;
    request.duration_seconds = 0.01;
    request.sources = std::move(sources);
    return request;
  }

  static const CanonicalDevice *find(const AggregationResult &result,
                                     const std::string &canonical_id) {
    for (const auto &device : result.devices) {
      if (device.canonical_id == canonical_id) {
        return &device;
      }
    }
    return nullptr;
  }

  /// Wait for a detached fake to observe its cancellation
  static bool eventually_cancelled(const test::FakeSource &source) {
    for (int i = 0; i < 200 && !source.was_cancelled(); ++i) {
      std::this_thread::sleep_for(5ms);
    }
    return source.was_cancelled();
  }
};

// ============================================================================
// Merging across sources
// ============================================================================

TEST_F(AggregatorTest, SameDeviceFromTwoSourcesIsOneRecord) {
  add_fake(registry, "ble")->add("aa:bb:cc:dd:ee:ff", "", -60);
  add_fake(registry, "classic")->add("AABBCCDDEEFF", "My Phone", -72);

  Aggregator aggregator(registry, *enrichment, options);
  auto result = aggregator.aggregate(quick_request());

  ASSERT_TRUE(result.is_ok()) << result.error().to_string();
  ASSERT_EQ(result.value().devices.size(), 1u);
  EXPECT_EQ(result.value().total, 1u);
  EXPECT_TRUE(result.value().source_errors.empty());

  const auto &device = result.value().devices.front();
  EXPECT_EQ(device.canonical_id, "AA:BB:CC:DD:EE:FF");
  EXPECT_EQ(device.name, "My Phone");
  EXPECT_EQ(device.signal_strength, -60);
  EXPECT_EQ(device.detection_sources,
            (std::vector<std::string>{"ble", "classic"}));
  EXPECT_EQ(device.merged_from,
            (std::vector<std::string>{"aa:bb:cc:dd:ee:ff", "AABBCCDDEEFF"}));
}

TEST_F(AggregatorTest, PriorityDecidesSignalRegardlessOfRegistrationOrder) {
  add_fake(registry, "classic")->add("AABBCCDDEEFF", "Speaker", -40);
  add_fake(registry, "ble")->add("aa:bb:cc:dd:ee:ff", "", -75);

  Aggregator aggregator(registry, *enrichment, options);
  auto result = aggregator.aggregate(quick_request());

  ASSERT_TRUE(result.is_ok());
  ASSERT_EQ(result.value().devices.size(), 1u);
  EXPECT_EQ(result.value().devices.front().signal_strength, -75);
  EXPECT_EQ(result.value().devices.front().detection_sources,
            (std::vector<std::string>{"ble", "classic"}));
}

TEST_F(AggregatorTest, FoldIgnoresCompletionOrder) {
  options.grace_period = 5s;
  add_fake(registry, "ble")->delay(30ms).add("AA:BB:CC:DD:EE:FF", "Alpha", -50);
  add_fake(registry, "classic")->add("aabbccddeeff", "Beta", -80);

  Aggregator aggregator(registry, *enrichment, options);
  auto result = aggregator.aggregate(quick_request());

  ASSERT_TRUE(result.is_ok()) << result.error().to_string();
  EXPECT_TRUE(result.value().source_errors.empty());
  ASSERT_EQ(result.value().devices.size(), 1u);

  // classic finished first, ble still wins on priority
  const auto &device = result.value().devices.front();
  EXPECT_EQ(device.name, "Alpha");
  auto alternates =
      find_attribute<std::vector<std::string>>(device.attributes,
                                               attr::ALTERNATE_NAMES);
  ASSERT_NE(alternates, nullptr);
  EXPECT_EQ(*alternates, std::vector<std::string>{"Beta"});
  EXPECT_EQ(device.signal_strength, -50);
  EXPECT_EQ(device.detection_sources,
            (std::vector<std::string>{"ble", "classic"}));
  EXPECT_EQ(device.merged_from,
            (std::vector<std::string>{"AA:BB:CC:DD:EE:FF", "aabbccddeeff"}));
}

TEST_F(AggregatorTest, SourceIdIsStampedByAggregator) {
  auto fake = add_fake(registry, "ble");
  fake->add("11:22:33:44:55:66");

  Aggregator aggregator(registry, *enrichment, options);
  auto result = aggregator.aggregate(quick_request());

  ASSERT_TRUE(result.is_ok());
  EXPECT_TRUE(result.value().devices.front().has_source("ble"));
}

TEST_F(AggregatorTest, OpaqueIdentifiersStaySeparateAcrossSources) {
  options.source_priority = {};
  add_fake(registry, "a")->add("handle-1", "First");
  add_fake(registry, "b")->add("handle-1", "Second");

  Aggregator aggregator(registry, *enrichment, options);
  auto result = aggregator.aggregate(quick_request());

  ASSERT_TRUE(result.is_ok());
  ASSERT_EQ(result.value().devices.size(), 2u);
  ASSERT_NE(find(result.value(), "handle-1"), nullptr);
  ASSERT_NE(find(result.value(), "handle-1@b"), nullptr);
  EXPECT_EQ(find(result.value(), "handle-1@b")->name, "Second");
}

TEST_F(AggregatorTest, OpaqueIdentifierMergesWithinOneSource) {
  add_fake(registry, "ble")
      ->add("/org/bluez/hci0/dev_x", "", -80)
      .add("/org/bluez/hci0/dev_x", "Tag", -70);

  Aggregator aggregator(registry, *enrichment, options);
  auto result = aggregator.aggregate(quick_request());

  ASSERT_TRUE(result.is_ok());
  ASSERT_EQ(result.value().devices.size(), 1u);
  EXPECT_EQ(result.value().devices.front().name, "Tag");
  EXPECT_EQ(result.value().devices.front().signal_strength, -70);
}

TEST_F(AggregatorTest, ObservationsWithoutIdentifierAreDropped) {
  add_fake(registry, "ble")->add("").add("11:22:33:44:55:66");

  Aggregator aggregator(registry, *enrichment, options);
  auto result = aggregator.aggregate(quick_request());

  ASSERT_TRUE(result.is_ok());
  EXPECT_EQ(result.value().devices.size(), 1u);
}

// ============================================================================
// Failures
// ============================================================================

TEST_F(AggregatorTest, PartialFailureKeepsOtherSources) {
  add_fake(registry, "ble")->add("11:22:33:44:55:66", "Watch");
  add_fake(registry, "classic")->fail(ErrorCode::InquiryFailed, "adapter busy");
  add_fake(registry, "platform-registry")->add("AA:AA:AA:AA:AA:AA", "Mouse");

  Aggregator aggregator(registry, *enrichment, options);
  auto result = aggregator.aggregate(quick_request());

  ASSERT_TRUE(result.is_ok()) << result.error().to_string();
  EXPECT_EQ(result.value().devices.size(), 2u);
  ASSERT_EQ(result.value().source_errors.size(), 1u);
  EXPECT_EQ(result.value().source_errors.at("classic").code,
            ErrorCode::InquiryFailed);
}

TEST_F(AggregatorTest, EveryFailingSourceIsTotalFailure) {
  add_fake(registry, "ble")->fail(ErrorCode::BluetoothOff, "radio off");
  add_fake(registry, "classic")->fail(ErrorCode::InquiryFailed, "busy");

  Aggregator aggregator(registry, *enrichment, options);
  auto result = aggregator.aggregate(quick_request());

  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().code, ErrorCode::TotalFailure);
  EXPECT_NE(result.error().details.find("ble"), std::string::npos);
  EXPECT_NE(result.error().details.find("classic"), std::string::npos);
}

TEST_F(AggregatorTest, EmptyButHealthyScanIsSuccess) {
  add_fake(registry, "ble");
  add_fake(registry, "classic")->fail(ErrorCode::InquiryFailed);

  Aggregator aggregator(registry, *enrichment, options);
  auto result = aggregator.aggregate(quick_request());

  ASSERT_TRUE(result.is_ok());
  EXPECT_TRUE(result.value().devices.empty());
  EXPECT_EQ(result.value().source_errors.size(), 1u);
}

class ThrowingSource : public ScanSource {
public:
  std::string id() const override { return "thrower"; }

  Result<std::vector<RawObservation>>
  observe(std::chrono::milliseconds, const std::optional<std::string> &,
          const CancellationToken &) override {
    throw std::runtime_error("driver exploded");
  }
};

TEST_F(AggregatorTest, ThrowingSourceBecomesSourceFailure) {
  ASSERT_TRUE(registry.add(std::make_shared<ThrowingSource>()).is_ok());
  add_fake(registry, "ble")->add("11:22:33:44:55:66");

  Aggregator aggregator(registry, *enrichment, options);
  auto result = aggregator.aggregate(quick_request());

  ASSERT_TRUE(result.is_ok());
  ASSERT_EQ(result.value().source_errors.count("thrower"), 1u);
  EXPECT_EQ(result.value().source_errors.at("thrower").code,
            ErrorCode::SourceFailed);
  EXPECT_EQ(result.value().source_errors.at("thrower").details,
            "driver exploded");
}

// ============================================================================
// Time budgets
// ============================================================================

TEST_F(AggregatorTest, SlowSourceTimesOutAndIsCancelled) {
  add_fake(registry, "ble")->add("11:22:33:44:55:66", "Fast");
  auto slow = add_fake(registry, "classic");
  slow->delay(10s).add("AA:AA:AA:AA:AA:AA", "Slow");

  Aggregator aggregator(registry, *enrichment, options);
  auto started = std::chrono::steady_clock::now();
  auto result = aggregator.aggregate(quick_request());
  auto elapsed = std::chrono::steady_clock::now() - started;

  ASSERT_TRUE(result.is_ok());
  EXPECT_LT(elapsed, 5s);
  ASSERT_EQ(result.value().devices.size(), 1u);
  EXPECT_EQ(result.value().devices.front().name, "Fast");
  EXPECT_EQ(result.value().source_errors.at("classic").code,
            ErrorCode::SourceTimeout);
  EXPECT_TRUE(eventually_cancelled(*slow));
}

TEST_F(AggregatorTest, DeadlineCapsTheBudget) {
  options.grace_period = 10s;
  auto slow = add_fake(registry, "ble");
  slow->delay(10s);

  Aggregator aggregator(registry, *enrichment, options);
  auto request = quick_request();
  request.deadline = std::chrono::steady_clock::now() + 50ms;

  auto started = std::chrono::steady_clock::now();
  auto result = aggregator.aggregate(request);

  EXPECT_LT(std::chrono::steady_clock::now() - started, 5s);
  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().code, ErrorCode::TotalFailure);
  EXPECT_TRUE(eventually_cancelled(*slow));
}

TEST_F(AggregatorTest, SourcesReceiveDurationAndFilter) {
  auto fake = add_fake(registry, "ble");
  fake->add("11:22:33:44:55:66", "Phone");

  Aggregator aggregator(registry, *enrichment, options);
  auto request = quick_request();
  request.duration_seconds = 0.25;
  request.filter_name = "  phone ";

  ASSERT_TRUE(aggregator.aggregate(request).is_ok());
  EXPECT_EQ(fake->calls(), 1);
  EXPECT_EQ(fake->last_duration(), 250ms);
  EXPECT_EQ(fake->last_filter(), "phone");
}

// ============================================================================
// Sequential mode
// ============================================================================

TEST_F(AggregatorTest, SequentialModeRunsEverySource) {
  auto ble = add_fake(registry, "ble");
  ble->add("aa:bb:cc:dd:ee:ff", "", -50);
  auto classic = add_fake(registry, "classic");
  classic->add("AA-BB-CC-DD-EE-FF", "Laptop", -65);

  Aggregator aggregator(registry, *enrichment, options);
  auto request = quick_request();
  request.concurrent = false;

  auto result = aggregator.aggregate(request);
  ASSERT_TRUE(result.is_ok());
  EXPECT_EQ(ble->calls(), 1);
  EXPECT_EQ(classic->calls(), 1);
  ASSERT_EQ(result.value().devices.size(), 1u);
  EXPECT_EQ(result.value().devices.front().name, "Laptop");
  EXPECT_EQ(result.value().devices.front().signal_strength, -50);
}

TEST_F(AggregatorTest, SequentialSkipsSourcesAfterDeadline) {
  options.grace_period = 0ms;
  auto first = add_fake(registry, "ble");
  first->delay(10s);
  auto second = add_fake(registry, "classic");
  second->add("11:22:33:44:55:66");

  Aggregator aggregator(registry, *enrichment, options);
  auto request = quick_request();
  request.duration_seconds = 0.2;
  request.concurrent = false;
  request.deadline = std::chrono::steady_clock::now() + 30ms;

  auto result = aggregator.aggregate(request);
  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().code, ErrorCode::TotalFailure);
  EXPECT_EQ(second->calls(), 0);
}

// ============================================================================
// Filtering and enrichment
// ============================================================================

TEST_F(AggregatorTest, FilterAppliesToFinalNames) {
  add_fake(registry, "ble")
      ->add("11:22:33:44:55:66", "My Phone")
      .add("AA:AA:AA:AA:AA:AA", "Speaker");

  Aggregator aggregator(registry, *enrichment, options);
  auto request = quick_request();
  request.filter_name = "PHONE";

  auto result = aggregator.aggregate(request);
  ASSERT_TRUE(result.is_ok());
  ASSERT_EQ(result.value().devices.size(), 1u);
  EXPECT_EQ(result.value().devices.front().name, "My Phone");
  EXPECT_EQ(result.value().total, 2u);
}

TEST_F(AggregatorTest, FilterSeesNameFromLowerPrioritySource) {
  add_fake(registry, "ble")->add("11:22:33:44:55:66", "", -40);
  add_fake(registry, "classic")->add("112233445566", "My Phone", -70);

  Aggregator aggregator(registry, *enrichment, options);
  auto request = quick_request();
  request.filter_name = "phone";

  auto result = aggregator.aggregate(request);
  ASSERT_TRUE(result.is_ok());
  ASSERT_EQ(result.value().devices.size(), 1u);
}

TEST_F(AggregatorTest, NullLikeFilterMeansNoFilter) {
  add_fake(registry, "ble")
      ->add("11:22:33:44:55:66", "My Phone")
      .add("AA:AA:AA:AA:AA:AA", "Speaker");

  Aggregator aggregator(registry, *enrichment, options);
  auto request = quick_request();
  request.filter_name = "null";

  auto result = aggregator.aggregate(request);
  ASSERT_TRUE(result.is_ok());
  EXPECT_EQ(result.value().devices.size(), 2u);
}

TEST_F(AggregatorTest, EnrichmentRunsWhenEnabled) {
  AttributeMap attributes;
  attributes[attr::MANUFACTURER_DATA] = KeyedBytes{{"76", {0x10}}};
  add_fake(registry, "ble")->add("11:22:33:44:55:66", "", -50, attributes);

  Aggregator aggregator(registry, *enrichment, options);
  auto result = aggregator.aggregate(quick_request());

  ASSERT_TRUE(result.is_ok());
  const auto &device = result.value().devices.front();
  ASSERT_TRUE(device.derived.has_value());
  EXPECT_EQ(device.derived->company_name, "Apple, Inc.");
  EXPECT_EQ(device.name, "Apple, Inc. Device (44:55:66)");
}

TEST_F(AggregatorTest, EnrichmentCanBeDisabled) {
  options.enrich = false;
  add_fake(registry, "ble")->add("11:22:33:44:55:66");

  Aggregator aggregator(registry, *enrichment, options);
  auto result = aggregator.aggregate(quick_request());

  ASSERT_TRUE(result.is_ok());
  EXPECT_FALSE(result.value().devices.front().derived.has_value());
  EXPECT_EQ(result.value().devices.front().name, PLACEHOLDER_NAME);
}

// ============================================================================
// Validation and ordering
// ============================================================================

TEST_F(AggregatorTest, InvalidRequestsRunNoSource) {
  auto fake = add_fake(registry, "ble");
  Aggregator aggregator(registry, *enrichment, options);

  auto bad_duration = quick_request();
  bad_duration.duration_seconds = -1.0;
  auto result = aggregator.aggregate(bad_duration);
  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().code, ErrorCode::InvalidArgument);

  auto unknown = quick_request({"ble", "sonar"});
  result = aggregator.aggregate(unknown);
  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().code, ErrorCode::UnknownSource);

  EXPECT_EQ(fake->calls(), 0);
}

TEST_F(AggregatorTest, OutOfRangeGracePeriodIsRejected) {
  auto fake = add_fake(registry, "ble");
  fake->add("11:22:33:44:55:66");

  options.grace_period = std::chrono::milliseconds(MAX_GRACE_PERIOD_MS + 1);
  Aggregator oversized(registry, *enrichment, options);
  auto result = oversized.aggregate(quick_request());
  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().code, ErrorCode::InvalidArgument);

  options.grace_period = std::chrono::milliseconds(-1);
  Aggregator negative(registry, *enrichment, options);
  EXPECT_TRUE(negative.aggregate(quick_request()).is_error());
  EXPECT_EQ(fake->calls(), 0);

  options.grace_period = std::chrono::milliseconds(MAX_GRACE_PERIOD_MS);
  Aggregator largest(registry, *enrichment, options);
  EXPECT_TRUE(largest.aggregate(quick_request()).is_ok());
}

TEST_F(AggregatorTest, OnlyRequestedSourcesRun) {
  auto ble = add_fake(registry, "ble");
  auto classic = add_fake(registry, "classic");
  ble->add("11:22:33:44:55:66");

  Aggregator aggregator(registry, *enrichment, options);
  ASSERT_TRUE(aggregator.aggregate(quick_request({"ble"})).is_ok());
  EXPECT_EQ(ble->calls(), 1);
  EXPECT_EQ(classic->calls(), 0);
}

TEST_F(AggregatorTest, FoldOrderFollowsPriority) {
  options.source_priority = {"ble", "classic", "platform-registry"};
  Aggregator aggregator(registry, *enrichment, options);

  EXPECT_EQ(aggregator.fold_order({"mock", "platform-registry", "ble", "ble"}),
            (std::vector<std::string>{"ble", "platform-registry", "mock"}));
  EXPECT_EQ(aggregator.fold_order({"x", "y"}),
            (std::vector<std::string>{"x", "y"}));
}

TEST_F(AggregatorTest, OptionsFromConfig) {
  CatalogConfig config;
  config.grace_period_ms = 750;
  config.source_priority = {"classic", "ble"};
  config.enrich = false;

  auto from = AggregatorOptions::from_config(config);
  EXPECT_EQ(from.grace_period, 750ms);
  EXPECT_EQ(from.source_priority,
            (std::vector<std::string>{"classic", "ble"}));
  EXPECT_FALSE(from.enrich);
}
