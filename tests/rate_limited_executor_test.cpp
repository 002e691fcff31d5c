// =============================================================================
// rate_limited_executor_test.cpp
// =============================================================================
// Unit tests for warden::RateLimitedExecutor, BackoffPolicy and TokenBucket.
//
// Validates:
//   - Transient failures are retried and the eventual result returned
//   - Permanent failures are rethrown at once, without retry
//   - Exhausted retries surface RetriesExhaustedError with the timeout flag
//   - Every failed attempt reaches the error listener
//   - Capability probes get exactly one attempt
//   - A placement that times out after landing is found, not re-sent
//   - A placement is re-sent only when the venue has no such order
//   - Rate-limited placements retry without a lookup
//   - Backoff doubles per attempt and is capped
//   - The token bucket refuses calls once the burst is spent
// =============================================================================

#include "test_support.hpp"

#include "warden/exchange/backoff_policy.hpp"
#include "warden/exchange/exchange_error.hpp"
#include "warden/exchange/token_bucket.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <optional>
#include <string>
#include <vector>

using Failure = warden::PaperExchangeGateway::FailureKind;

namespace {

// Forwards to the paper venue, but reports the first `lost_acks` successful
// placements as timeouts: the order exists, the caller never hears so.
class LostAckGateway final : public warden::IExchangeGateway {
 public:
  LostAckGateway(warden::PaperExchangeGateway& venue, int lost_acks)
      : venue_(venue), lost_acks_(lost_acks) {}

  warden::domain::AccountSnapshot getBalance() override {
    return venue_.getBalance();
  }
  std::vector<warden::domain::ExchangePosition> getPositions() override {
    return venue_.getPositions();
  }
  std::vector<warden::domain::Order> getOpenOrders() override {
    return venue_.getOpenOrders();
  }
  warden::domain::Order placeOrder(
      const warden::domain::OrderSpec& spec) override {
    warden::domain::Order order = venue_.placeOrder(spec);
    if (lost_acks_ > 0) {
      --lost_acks_;
      throw warden::ExchangeTimeoutError("place_order", "response lost");
    }
    return order;
  }
  void cancelOrder(const std::string& symbol,
                   const std::string& order_id) override {
    venue_.cancelOrder(symbol, order_id);
  }
  std::optional<warden::domain::Order> findOrder(
      const std::string& symbol, const std::string& client_order_id) override {
    return venue_.findOrder(symbol, client_order_id);
  }
  void setLeverage(
      const std::string& symbol, int leverage,
      std::optional<warden::domain::PositionSide> hold_side) override {
    venue_.setLeverage(symbol, leverage, hold_side);
  }
  warden::domain::SymbolRules getSymbolRules(
      const std::string& symbol) override {
    return venue_.getSymbolRules(symbol);
  }
  warden::domain::ProbeResult probeCapability(
      const std::string& kind) override {
    return venue_.probeCapability(kind);
  }
  double getPrice(const std::string& symbol) override {
    return venue_.getPrice(symbol);
  }

 private:
  warden::PaperExchangeGateway& venue_;
  int lost_acks_;
};

warden::domain::OrderSpec marketEntry(const std::string& client_order_id) {
  warden::domain::OrderSpec spec;
  spec.client_order_id = client_order_id;
  spec.symbol = "BTCUSDT";
  spec.side = warden::domain::OrderSide::Buy;
  spec.kind = warden::domain::OrderKind::Entry;
  spec.type = warden::domain::OrderType::Market;
  spec.quantity = 1.0;
  return spec;
}

}  // namespace

class RateLimitedExecutorTest : public ::testing::Test {
 protected:
  RateLimitedExecutorTest()
      : clock(warden::test::kStartMs),
        paper(clock),
        executor(paper, warden::test::fastExecutor()) {}

  warden::SimulationTimeProvider clock;
  warden::PaperExchangeGateway paper;
  warden::RateLimitedExecutor executor;
};

// -----------------------------------------------------------------------------
// 1. Two transient failures, then success on the third attempt.
// -----------------------------------------------------------------------------
TEST_F(RateLimitedExecutorTest, TransientFailuresAreRetried) {
  paper.failNext("get_balance", 2, Failure::Transient);

  auto balance = executor.getBalance();

  EXPECT_DOUBLE_EQ(balance.equity, 1000.0);
  EXPECT_EQ(paper.callCount("get_balance"), 3u);
  EXPECT_EQ(executor.callCount(), 3u);
  EXPECT_EQ(executor.errorCount(), 2u);
  EXPECT_EQ(executor.retryCount(), 2u);
}

// -----------------------------------------------------------------------------
// 2. A permanent rejection is never retried.
// -----------------------------------------------------------------------------
TEST_F(RateLimitedExecutorTest, PermanentFailureNotRetried) {
  paper.failNext("set_leverage", 1, Failure::Permanent);

  EXPECT_THROW(executor.setLeverage("BTCUSDT", 5, std::nullopt),
               warden::PermanentExchangeError);
  EXPECT_EQ(paper.callCount("set_leverage"), 1u);
  EXPECT_EQ(executor.retryCount(), 0u);
  EXPECT_EQ(executor.errorCount(), 1u);
}

// -----------------------------------------------------------------------------
// 3. Three timeouts in a row exhaust the budget; the flag says why.
// -----------------------------------------------------------------------------
TEST_F(RateLimitedExecutorTest, ExhaustedRetriesReportTimeout) {
  paper.failNext("get_open_orders", 3, Failure::Timeout);

  try {
    executor.getOpenOrders();
    FAIL() << "expected RetriesExhaustedError";
  } catch (const warden::RetriesExhaustedError& e) {
    EXPECT_EQ(e.attempts(), 3);
    EXPECT_TRUE(e.timedOut());
    EXPECT_EQ(e.operation(), "get_open_orders");
  }
  EXPECT_EQ(paper.callCount("get_open_orders"), 3u);
}

TEST_F(RateLimitedExecutorTest, ExhaustedRetriesWithoutTimeout) {
  paper.failNext("get_positions", 3, Failure::RateLimit);

  try {
    executor.getPositions();
    FAIL() << "expected RetriesExhaustedError";
  } catch (const warden::RetriesExhaustedError& e) {
    EXPECT_FALSE(e.timedOut());
  }
}

// -----------------------------------------------------------------------------
// 4. The listener sees each failed attempt with its operation name.
// -----------------------------------------------------------------------------
TEST_F(RateLimitedExecutorTest, ErrorListenerSeesEveryFailure) {
  std::vector<std::string> operations;
  executor.setErrorListener(
      [&operations](const std::string& op, const std::string&) {
        operations.push_back(op);
      });

  paper.failNext("place_order", 1, Failure::Transient);
  warden::domain::OrderSpec spec;
  spec.client_order_id = "c-1";
  spec.symbol = "BTCUSDT";
  spec.quantity = 0.1;
  paper.setPrice("BTCUSDT", 100.0);

  auto order = executor.placeOrder(spec);

  EXPECT_EQ(order.status, warden::domain::OrderStatus::Filled);
  ASSERT_EQ(operations.size(), 1u);
  EXPECT_EQ(operations[0], "place_order");
}

// -----------------------------------------------------------------------------
// 5. A probe that times out is not retried: one call, Unknown upstream.
// -----------------------------------------------------------------------------
TEST_F(RateLimitedExecutorTest, ProbeGetsSingleAttempt) {
  paper.setCapabilityTimeout(warden::domain::kCapabilityPlanOrders, true);

  try {
    executor.probeCapability(warden::domain::kCapabilityPlanOrders);
    FAIL() << "expected RetriesExhaustedError";
  } catch (const warden::RetriesExhaustedError& e) {
    EXPECT_EQ(e.attempts(), 1);
    EXPECT_TRUE(e.timedOut());
  }
  EXPECT_EQ(paper.callCount("probe_capability"), 1u);
}

// -----------------------------------------------------------------------------
// 6. Placements: never re-sent while the first one may have landed.
// -----------------------------------------------------------------------------
TEST_F(RateLimitedExecutorTest, PlacementTimeoutAfterLandingIsNotResent) {
  paper.setPrice("BTCUSDT", 100.0);
  LostAckGateway lossy(paper, 1);
  warden::RateLimitedExecutor gate(lossy, warden::test::fastExecutor());

  auto order = gate.placeOrder(marketEntry("entry-1"));

  EXPECT_EQ(order.spec.client_order_id, "entry-1");
  EXPECT_EQ(order.status, warden::domain::OrderStatus::Filled);
  EXPECT_EQ(paper.placeCount(warden::domain::OrderKind::Entry), 1u);
  EXPECT_EQ(paper.callCount("place_order"), 1u);
  EXPECT_EQ(paper.callCount("find_order"), 1u);
  auto position = paper.position("BTCUSDT");
  ASSERT_TRUE(position.has_value());
  EXPECT_DOUBLE_EQ(position->size, 1.0);
}

TEST_F(RateLimitedExecutorTest, PlacementResentWhenVenueHasNoOrder) {
  paper.setPrice("BTCUSDT", 100.0);
  paper.failNext("place_order", 1, Failure::Timeout);

  auto order = executor.placeOrder(marketEntry("entry-2"));

  EXPECT_EQ(order.status, warden::domain::OrderStatus::Filled);
  EXPECT_EQ(paper.placeCount(warden::domain::OrderKind::Entry), 1u);
  EXPECT_EQ(paper.callCount("place_order"), 2u);
  EXPECT_EQ(paper.callCount("find_order"), 1u);
  EXPECT_DOUBLE_EQ(paper.position("BTCUSDT")->size, 1.0);
}

TEST_F(RateLimitedExecutorTest, RateLimitedPlacementRetriesWithoutLookup) {
  paper.setPrice("BTCUSDT", 100.0);
  paper.failNext("place_order", 2, Failure::RateLimit);

  executor.placeOrder(marketEntry("entry-3"));

  EXPECT_EQ(paper.callCount("place_order"), 3u);
  EXPECT_EQ(paper.callCount("find_order"), 0u);
  EXPECT_EQ(paper.placeCount(), 1u);
}

TEST_F(RateLimitedExecutorTest, PlacementStaysUnconfirmedWhenLookupFails) {
  paper.setPrice("BTCUSDT", 100.0);
  paper.failNext("place_order", 1, Failure::Transient);
  paper.failNext("find_order", 3, Failure::Transient);

  try {
    executor.placeOrder(marketEntry("entry-4"));
    FAIL() << "expected UnconfirmedOrderError";
  } catch (const warden::UnconfirmedOrderError& e) {
    EXPECT_EQ(e.attempts(), 1);
    EXPECT_FALSE(e.timedOut());
  }
  EXPECT_EQ(paper.callCount("place_order"), 1u);
  EXPECT_EQ(paper.placeCount(), 0u);
}

// -----------------------------------------------------------------------------
// 7. Backoff: base * 2^n, capped; zero jitter gives the nominal delay.
// -----------------------------------------------------------------------------
TEST(BackoffPolicyTest, DoublesAndCaps) {
  warden::BackoffPolicy policy(std::chrono::milliseconds(250),
                               std::chrono::milliseconds(8000), 0.0);

  EXPECT_EQ(policy.nominalDelayFor(0).count(), 250);
  EXPECT_EQ(policy.nominalDelayFor(1).count(), 500);
  EXPECT_EQ(policy.nominalDelayFor(3).count(), 2000);
  EXPECT_EQ(policy.nominalDelayFor(10).count(), 8000);
  EXPECT_EQ(policy.delayFor(2).count(), 1000);
}

TEST(BackoffPolicyTest, JitterStaysWithinRatio) {
  warden::BackoffPolicy policy(std::chrono::milliseconds(1000),
                               std::chrono::milliseconds(8000), 0.1);
  for (int i = 0; i < 50; ++i) {
    auto delay = policy.delayFor(0).count();
    EXPECT_GE(delay, 900);
    EXPECT_LE(delay, 1100);
  }
}

// -----------------------------------------------------------------------------
// 8. Burst capacity is honoured by tryAcquire().
// -----------------------------------------------------------------------------
TEST(TokenBucketTest, BurstThenRefuse) {
  warden::TokenBucket bucket(0.001, 3.0);

  EXPECT_TRUE(bucket.tryAcquire());
  EXPECT_TRUE(bucket.tryAcquire());
  EXPECT_TRUE(bucket.tryAcquire());
  EXPECT_FALSE(bucket.tryAcquire());
  EXPECT_LT(bucket.available(), 1.0);
}
