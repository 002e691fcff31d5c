// =============================================================================
// capability_cache_test.cpp
// =============================================================================
// Unit tests for warden::CapabilityCache.
//
// Validates:
//   - A timed-out probe is cached as Unknown with the short TTL
//   - Supported / Unsupported results carry the long TTL
//   - A rejected probe maps to Unsupported
//   - resolve() serves fresh records from cache and re-probes stale ones
//   - refreshExpired() re-probes only what has expired
//   - Disabled probing assumes support without touching the venue
// =============================================================================

#include "test_support.hpp"

#include <gtest/gtest.h>

using warden::domain::CapabilityValue;
using warden::domain::kCapabilityPlanOrders;

class CapabilityCacheTest : public ::testing::Test {
 protected:
  CapabilityCacheTest()
      : clock(warden::test::kStartMs),
        paper(clock),
        executor(paper, warden::test::fastExecutor()),
        cache(executor, clock, warden::CapabilityConfig{}) {}

  warden::SimulationTimeProvider clock;
  warden::PaperExchangeGateway paper;
  warden::RateLimitedExecutor executor;
  warden::CapabilityCache cache;
};

// -----------------------------------------------------------------------------
// 1. Timeout -> Unknown, expires after unknown_ttl (30 s).
// -----------------------------------------------------------------------------
TEST_F(CapabilityCacheTest, TimeoutIsUnknownWithShortTtl) {
  paper.setCapabilityTimeout(kCapabilityPlanOrders, true);

  auto record = cache.resolve(kCapabilityPlanOrders);

  EXPECT_EQ(record.value, CapabilityValue::Unknown);
  EXPECT_EQ(record.reason, "timeout");
  EXPECT_EQ(record.expires_at_ms - record.probed_at_ms, 30'000);
}

// -----------------------------------------------------------------------------
// 2. Supported results live for long_ttl (300 s).
// -----------------------------------------------------------------------------
TEST_F(CapabilityCacheTest, SupportedUsesLongTtl) {
  auto record = cache.resolve(kCapabilityPlanOrders);

  EXPECT_EQ(record.value, CapabilityValue::Supported);
  EXPECT_EQ(record.expires_at_ms - record.probed_at_ms, 300'000);
}

TEST_F(CapabilityCacheTest, RejectedProbeIsUnsupported) {
  paper.failNext("probe_capability", 1,
                 warden::PaperExchangeGateway::FailureKind::Permanent);

  auto record = cache.probe(kCapabilityPlanOrders);

  EXPECT_EQ(record.value, CapabilityValue::Unsupported);
  EXPECT_EQ(record.reason, "probe_rejected");
}

TEST_F(CapabilityCacheTest, VenueReportedUnsupported) {
  paper.setCapability(kCapabilityPlanOrders,
                      {CapabilityValue::Unsupported, "endpoint_not_found"});

  auto record = cache.resolve(kCapabilityPlanOrders);

  EXPECT_EQ(record.value, CapabilityValue::Unsupported);
  EXPECT_EQ(record.reason, "endpoint_not_found");
}

// -----------------------------------------------------------------------------
// 3. Fresh records are served from cache; stale ones are re-probed and can
//    change value.
// -----------------------------------------------------------------------------
TEST_F(CapabilityCacheTest, ResolveCachesUntilExpiry) {
  paper.setCapabilityTimeout(kCapabilityPlanOrders, true);
  cache.resolve(kCapabilityPlanOrders);
  EXPECT_EQ(paper.callCount("probe_capability"), 1u);

  clock.advance_by(10'000);
  auto cached = cache.resolve(kCapabilityPlanOrders);
  EXPECT_EQ(cached.value, CapabilityValue::Unknown);
  EXPECT_EQ(paper.callCount("probe_capability"), 1u);

  paper.setCapabilityTimeout(kCapabilityPlanOrders, false);
  clock.advance_by(25'000);
  auto fresh = cache.resolve(kCapabilityPlanOrders);
  EXPECT_EQ(fresh.value, CapabilityValue::Supported);
  EXPECT_EQ(paper.callCount("probe_capability"), 2u);
}

// -----------------------------------------------------------------------------
// 4. refreshExpired() touches expired records only.
// -----------------------------------------------------------------------------
TEST_F(CapabilityCacheTest, RefreshExpiredReprobes) {
  cache.resolve(kCapabilityPlanOrders);
  EXPECT_EQ(cache.refreshExpired(), 0u);

  clock.advance_by(301'000);
  EXPECT_EQ(cache.refreshExpired(), 1u);
  EXPECT_EQ(paper.callCount("probe_capability"), 2u);

  auto record = cache.cached(kCapabilityPlanOrders);
  ASSERT_TRUE(record.has_value());
  EXPECT_TRUE(record->isFresh(clock.now_ms()));
  EXPECT_EQ(cache.snapshot().size(), 1u);
}

// -----------------------------------------------------------------------------
// 5. With probing disabled the venue is never asked.
// -----------------------------------------------------------------------------
TEST(CapabilityCacheDisabledTest, AssumesSupport) {
  warden::SimulationTimeProvider clock(warden::test::kStartMs);
  warden::PaperExchangeGateway paper(clock);
  warden::RateLimitedExecutor executor(paper, warden::test::fastExecutor());
  warden::CapabilityConfig config;
  config.probing_enabled = false;
  warden::CapabilityCache cache(executor, clock, config);

  auto record = cache.resolve(kCapabilityPlanOrders);

  EXPECT_EQ(record.value, CapabilityValue::Supported);
  EXPECT_EQ(record.reason, "probing_disabled");
  EXPECT_EQ(paper.callCount("probe_capability"), 0u);
  EXPECT_FALSE(cache.cached("unknown_kind").has_value());
}
