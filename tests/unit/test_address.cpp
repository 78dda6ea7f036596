/**
 * @file test_address.cpp
 * @brief Unit tests for address normalization
 */

#include <btcatalog/address.h>
#include <gtest/gtest.h>

using namespace btcatalog;

// ============================================================================
// normalize_address
// ============================================================================

TEST(AddressTest, FormatsConvergeToOneCanonicalForm) {
  const char *inputs[] = {"AA-BB-CC-DD-EE-FF", "aabbccddeeff",
                          "AA:BB:CC:DD:EE:FF", "aa:bb:cc:dd:ee:ff",
                          "aabb.ccdd.eeff",    " Aa:bB:cC:Dd:eE:Ff "};

  for (const char *input : inputs) {
    auto normalized = normalize_address(input);
    EXPECT_TRUE(normalized.normalizable) << input;
    EXPECT_EQ(normalized.value, "AA:BB:CC:DD:EE:FF") << input;
  }
}

TEST(AddressTest, NormalizationIsIdempotent) {
  std::string once = canonical_address("0a-1b-2c-3d-4e-5f");
  EXPECT_EQ(once, "0A:1B:2C:3D:4E:5F");
  EXPECT_EQ(canonical_address(once), once);
  EXPECT_EQ(canonical_address(canonical_address(once)), once);
}

TEST(AddressTest, OpaqueIdentifiersAreReturnedUnchanged) {
  const std::string opaque[] = {
      "", "not-an-address", "AA:BB:CC:DD:EE", "AA:BB:CC:DD:EE:FF:00",
      "GG:HH:II:JJ:KK:LL", "/org/bluez/hci0/dev_AA_BB_CC_DD_EE_FF",
      "{4f3a1c2e-0000-1000-8000-00805f9b34fb}"};

  for (const auto &input : opaque) {
    auto normalized = normalize_address(input);
    EXPECT_FALSE(normalized.normalizable) << input;
    EXPECT_EQ(normalized.value, input);
  }
}

TEST(AddressTest, IsNormalizable) {
  EXPECT_TRUE(is_normalizable_address("001122334455"));
  EXPECT_FALSE(is_normalizable_address("0011223344"));
  EXPECT_FALSE(is_normalizable_address(""));
}

// ============================================================================
// Prefix and suffix
// ============================================================================

TEST(AddressTest, OuiPrefix) {
  auto prefix = oui_prefix("14-0c-76-12-34-56");
  ASSERT_TRUE(prefix.has_value());
  EXPECT_EQ(*prefix, "14:0C:76");

  EXPECT_FALSE(oui_prefix("opaque-handle").has_value());
}

TEST(AddressTest, AddressSuffix) {
  EXPECT_EQ(address_suffix("AA:BB:CC:DD:EE:FF"), "DD:EE:FF");
  EXPECT_EQ(address_suffix("short"), "short");
}
