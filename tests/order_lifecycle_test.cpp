// =============================================================================
// order_lifecycle_test.cpp
// =============================================================================
// Unit tests for warden::OrderLifecycleManager and warden::StopLossManager,
// driven against PaperExchangeGateway.
//
// Validates:
//   - Partial entry fills are protected at the filled size, then resized
//   - Market entries place the trigger stop and split take-profits
//   - Unknown / unsupported plan-order capability falls back to a local guard
//   - Local guard crossing issues a protective close and counts a stop-loss
//   - Break-even move: profit threshold, buffered price, retry + escalation
//   - Close instructions differ between one-way and hedge accounts
//   - Dry run records the plan without any exchange write
//   - Reduce, close and the panic sweep (including untracked positions and
//     closes that fail)
//   - A filled trigger stop closes the record as STOP_LOSS_FILLED
//
// Design: each test builds its own LifecycleHarness; the simulated clock
// starts at test::kStartMs and only moves when a test advances it.
// =============================================================================

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using warden::domain::OrderKind;
using warden::domain::OrderType;
using warden::domain::PositionSide;
using warden::domain::PositionState;
using warden::domain::StopLossMode;

class OrderLifecycleTest : public ::testing::Test {
 protected:
  warden::test::LifecycleHarness h;
};

// -----------------------------------------------------------------------------
// 1. A resting limit entry that fills 60% gets a stop for 0.6 first; the
//    remaining fill replaces it with a stop covering the full 1.0.
// -----------------------------------------------------------------------------
TEST_F(OrderLifecycleTest, PartialFillProtectedThenResized) {
  auto plan = h.plan("BTCUSDT", PositionSide::Long, 1.0, 99.0, 98.0);
  auto placed = h.lifecycle.submitPlan(plan);
  ASSERT_TRUE(placed.ok);
  EXPECT_EQ(placed.code, "PLACED");
  const std::string entry_id = placed.detail;

  auto pending = h.book.openFor("BTCUSDT");
  ASSERT_TRUE(pending.has_value());
  EXPECT_EQ(pending->state, PositionState::PendingEntry);
  EXPECT_EQ(h.paper.leverageFor("BTCUSDT"), 5);
  EXPECT_EQ(h.paper.placeCount(OrderKind::StopLoss), 0u);

  h.paper.fillOrder(entry_id, 0.6, 99.0);
  h.lifecycle.syncWithExchange();

  auto partial = h.book.openFor("BTCUSDT");
  ASSERT_TRUE(partial.has_value());
  EXPECT_EQ(partial->state, PositionState::PartiallyFilled);
  EXPECT_NEAR(partial->size, 0.6, 1e-9);
  EXPECT_NEAR(partial->stop_order_size, 0.6, 1e-9);
  auto stops = h.placed(OrderKind::StopLoss);
  ASSERT_EQ(stops.size(), 1u);
  EXPECT_NEAR(stops[0].spec.quantity, 0.6, 1e-9);
  EXPECT_DOUBLE_EQ(stops[0].spec.trigger_price, 98.0);
  EXPECT_TRUE(stops[0].spec.reduce_only);

  h.paper.fillOrder(entry_id, 0.4, 99.0);
  h.lifecycle.syncWithExchange();

  auto full = h.book.openFor("BTCUSDT");
  ASSERT_TRUE(full.has_value());
  EXPECT_EQ(full->state, PositionState::FilledProtected);
  EXPECT_NEAR(full->size, 1.0, 1e-9);
  EXPECT_NEAR(full->stop_order_size, 1.0, 1e-9);

  stops = h.placed(OrderKind::StopLoss);
  ASSERT_EQ(stops.size(), 2u);
  EXPECT_NEAR(stops[1].spec.quantity, 1.0, 1e-9);
  EXPECT_EQ(h.paper.cancelCount(), 1u);
  auto old_stop = h.paper.order(stops[0].order_id);
  ASSERT_TRUE(old_stop.has_value());
  EXPECT_EQ(old_stop->status, warden::domain::OrderStatus::Canceled);
}

// -----------------------------------------------------------------------------
// 2. A market entry fills on placement: stop and take-profits follow at once.
// -----------------------------------------------------------------------------
TEST_F(OrderLifecycleTest, MarketEntryPlacesStopAndTakeProfits) {
  auto plan = h.plan("BTCUSDT", PositionSide::Long, 0.5, 100.0, 99.0,
                     OrderType::Market);
  plan.take_profits = {{102.0, 0.25}, {104.0, 0.25}};

  auto result = h.lifecycle.submitPlan(plan);
  ASSERT_TRUE(result.ok);

  auto pos = h.book.openFor("BTCUSDT");
  ASSERT_TRUE(pos.has_value());
  EXPECT_EQ(pos->state, PositionState::FilledProtected);
  EXPECT_EQ(pos->stop_mode, StopLossMode::Trigger);
  EXPECT_FALSE(pos->stop_order_id.empty());
  EXPECT_EQ(pos->take_profit_order_ids.size(), 2u);

  auto tps = h.placed(OrderKind::TakeProfit);
  ASSERT_EQ(tps.size(), 2u);
  EXPECT_EQ(tps[0].spec.type, OrderType::Limit);
  EXPECT_NEAR(tps[0].spec.quantity, 0.25, 1e-9);
  EXPECT_NEAR(tps[0].spec.price, 102.0, 1e-9);
  EXPECT_EQ(tps[0].spec.side, warden::domain::OrderSide::Sell);

  // Ledger carries the attempt/result audit for the entry.
  auto attempts = h.ledger.entriesForKey(plan.entry.client_order_id);
  ASSERT_GE(attempts.size(), 2u);
  EXPECT_EQ(attempts[0].kind, warden::LedgerKind::OrderAttempt);
  EXPECT_EQ(attempts[1].kind, warden::LedgerKind::OrderResult);
  EXPECT_TRUE(h.ledger.protectionFor("BTCUSDT").has_value());
}

// -----------------------------------------------------------------------------
// 3. A probe that times out means Unknown: no trigger order is placed, a
//    local guard protects the position and a fallback notice goes out.
// -----------------------------------------------------------------------------
TEST_F(OrderLifecycleTest, ProbeTimeoutArmsLocalGuard) {
  h.paper.setCapabilityTimeout(warden::domain::kCapabilityPlanOrders, true);

  auto plan = h.plan("BTCUSDT", PositionSide::Long, 0.5, 100.0, 99.0,
                     OrderType::Market);
  ASSERT_TRUE(h.lifecycle.submitPlan(plan).ok);

  EXPECT_EQ(h.paper.placeCount(OrderKind::StopLoss), 0u);
  auto pos = h.book.openFor("BTCUSDT");
  ASSERT_TRUE(pos.has_value());
  EXPECT_TRUE(pos->guard.armed);
  EXPECT_DOUBLE_EQ(pos->guard.trigger_price, 99.0);
  EXPECT_EQ(pos->stop_mode, StopLossMode::LocalGuard);
  EXPECT_EQ(pos->state, PositionState::FilledProtected);
  EXPECT_TRUE(h.sink.hasCode("PLAN_ORDER_FALLBACK"));

  auto record = h.capabilities.cached(warden::domain::kCapabilityPlanOrders);
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->value, warden::domain::CapabilityValue::Unknown);
  EXPECT_EQ(record->reason, "timeout");
  EXPECT_FALSE(h.stops.sessionFallback());
}

// -----------------------------------------------------------------------------
// 4. An unsupported endpoint switches the whole session to local guards.
// -----------------------------------------------------------------------------
TEST_F(OrderLifecycleTest, UnsupportedPlanOrdersFallBackForSession) {
  h.paper.setCapability(warden::domain::kCapabilityPlanOrders,
                        {warden::domain::CapabilityValue::Unsupported,
                         "endpoint_not_found"});

  auto plan = h.plan("BTCUSDT", PositionSide::Short, 0.5, 100.0, 101.0,
                     OrderType::Market);
  ASSERT_TRUE(h.lifecycle.submitPlan(plan).ok);

  EXPECT_TRUE(h.stops.sessionFallback());
  EXPECT_EQ(h.stops.resolveMode("ETHUSDT"), StopLossMode::LocalGuard);
  EXPECT_EQ(h.paper.placeCount(OrderKind::StopLoss), 0u);
}

// -----------------------------------------------------------------------------
// 5. Crossing the guard price closes the position and counts a stop-loss.
// -----------------------------------------------------------------------------
TEST_F(OrderLifecycleTest, LocalGuardCrossingClosesPosition) {
  h.paper.setCapabilityTimeout(warden::domain::kCapabilityPlanOrders, true);
  auto plan = h.plan("BTCUSDT", PositionSide::Long, 0.5, 100.0, 99.0,
                     OrderType::Market);
  ASSERT_TRUE(h.lifecycle.submitPlan(plan).ok);

  // Above the guard: nothing happens.
  EXPECT_EQ(h.lifecycle.processLocalGuards({{"BTCUSDT", 99.5}}), 0);

  h.paper.setPrice("BTCUSDT", 98.9);
  EXPECT_EQ(h.lifecycle.processLocalGuards({{"BTCUSDT", 98.9}}), 1);

  EXPECT_FALSE(h.book.openFor("BTCUSDT").has_value());
  EXPECT_FALSE(h.paper.position("BTCUSDT").has_value());
  auto closes = h.placed(OrderKind::Close);
  ASSERT_EQ(closes.size(), 1u);
  EXPECT_TRUE(closes[0].spec.reduce_only);
  EXPECT_NEAR(closes[0].spec.quantity, 0.5, 1e-9);
  EXPECT_EQ(h.cooldowns.stopLossStreak(), 1);
  EXPECT_TRUE(h.sink.hasCode("LOCAL_GUARD_TRIGGERED"));
}

// -----------------------------------------------------------------------------
// 6. Break-even waits for the profit threshold, then moves the stop to
//    entry + buffer (100 * 1.0005 = 100.05) and is idempotent afterwards.
// -----------------------------------------------------------------------------
TEST_F(OrderLifecycleTest, MoveStopToBreakEven) {
  auto plan = h.plan("BTCUSDT", PositionSide::Long, 1.0, 100.0, 99.0,
                     OrderType::Market);
  ASSERT_TRUE(h.lifecycle.submitPlan(plan).ok);

  h.prices.update("BTCUSDT", 100.3, h.clock.now_ms(),
                  warden::PriceSource::Streaming);
  auto early = h.lifecycle.moveStopToBreakEven("BTCUSDT");
  EXPECT_FALSE(early.ok);
  EXPECT_EQ(early.code, "BE_NOT_REACHED");

  h.prices.update("BTCUSDT", 100.6, h.clock.now_ms(),
                  warden::PriceSource::Streaming);
  auto moved = h.lifecycle.moveStopToBreakEven("BTCUSDT");
  ASSERT_TRUE(moved.ok);
  EXPECT_EQ(moved.code, "MOVED_TO_BREAK_EVEN");

  auto pos = h.book.openFor("BTCUSDT");
  ASSERT_TRUE(pos.has_value());
  EXPECT_TRUE(pos->break_even_done);
  EXPECT_FALSE(pos->protection_pending);
  EXPECT_EQ(pos->state, PositionState::Managing);
  EXPECT_NEAR(pos->stop_price, 100.05, 1e-6);

  auto stops = h.placed(OrderKind::StopLoss);
  ASSERT_EQ(stops.size(), 2u);
  EXPECT_NEAR(stops[1].spec.trigger_price, 100.05, 1e-6);
  EXPECT_EQ(pos->stop_order_id, stops[1].order_id);

  auto again = h.lifecycle.moveStopToBreakEven("BTCUSDT");
  EXPECT_TRUE(again.ok);
  EXPECT_EQ(again.code, "ALREADY_AT_BREAK_EVEN");
  EXPECT_EQ(h.paper.placeCount(OrderKind::StopLoss), 2u);
}

// -----------------------------------------------------------------------------
// 7. When every replacement attempt fails the move escalates as a
//    PROTECTION_FAILURE; the position stays covered by a local guard.
// -----------------------------------------------------------------------------
TEST_F(OrderLifecycleTest, BreakEvenFailureEscalates) {
  std::vector<std::string> escalations;
  h.lifecycle.setEscalationHandler(
      [&escalations](const std::string& code, const std::string&,
                     const std::string&) { escalations.push_back(code); });

  auto plan = h.plan("BTCUSDT", PositionSide::Long, 1.0, 100.0, 99.0,
                     OrderType::Market);
  ASSERT_TRUE(h.lifecycle.submitPlan(plan).ok);
  h.prices.update("BTCUSDT", 101.0, h.clock.now_ms(),
                  warden::PriceSource::Streaming);

  h.paper.failNext("place_order", 3,
                   warden::PaperExchangeGateway::FailureKind::Permanent);
  auto result = h.lifecycle.moveStopToBreakEven("BTCUSDT");

  EXPECT_FALSE(result.ok);
  EXPECT_EQ(result.code, "PROTECTION_FAILURE");
  ASSERT_EQ(escalations.size(), 1u);
  EXPECT_EQ(escalations[0], "PROTECTION_FAILURE");

  auto pos = h.book.openFor("BTCUSDT");
  ASSERT_TRUE(pos.has_value());
  EXPECT_TRUE(pos->guard.armed);
  EXPECT_TRUE(warden::domain::hasProtection(*pos));
  EXPECT_FALSE(pos->break_even_done);
}

// -----------------------------------------------------------------------------
// 8. One-way accounts close with reduce_only; hedge accounts with an
//    explicit close side and hold side.
// -----------------------------------------------------------------------------
TEST(CloseInstructionTest, OneWayAndHedgeDiffer) {
  warden::domain::Position pos;
  pos.symbol = "BTCUSDT";
  pos.side = PositionSide::Long;
  pos.hold_side = PositionSide::Long;
  pos.size = 1.0;

  warden::test::LifecycleHarness one_way;
  auto a = one_way.stops.makeCloseInstruction(pos, OrderKind::Close,
                                              OrderType::Market, 1.0);
  EXPECT_TRUE(a.reduce_only);
  EXPECT_FALSE(a.close_side);
  EXPECT_EQ(a.side, warden::domain::OrderSide::Sell);

  warden::ExecutionConfig hedge_config;
  hedge_config.account_mode = warden::domain::AccountMode::Hedge;
  warden::test::LifecycleHarness hedge(hedge_config);
  auto b = hedge.stops.makeCloseInstruction(pos, OrderKind::Close,
                                            OrderType::Market, 1.0);
  EXPECT_FALSE(b.reduce_only);
  EXPECT_TRUE(b.close_side);
  ASSERT_TRUE(b.hold_side.has_value());
  EXPECT_EQ(*b.hold_side, PositionSide::Long);
  EXPECT_EQ(b.side, warden::domain::OrderSide::Sell);
  EXPECT_NE(a.client_order_id, "");
}

// -----------------------------------------------------------------------------
// 9. Dry run: the plan is recorded and announced, nothing is written.
// -----------------------------------------------------------------------------
TEST(DryRunLifecycleTest, RecordsWithoutExchangeWrites) {
  warden::ExecutionConfig config;
  config.dry_run = true;
  warden::test::LifecycleHarness h(config);

  auto plan = h.plan("BTCUSDT", PositionSide::Long, 0.5, 100.0, 99.0);
  auto result = h.lifecycle.submitPlan(plan);

  EXPECT_TRUE(result.ok);
  EXPECT_EQ(result.code, "DRY_RUN");
  EXPECT_EQ(h.paper.writeCallCount(), 0u);
  EXPECT_EQ(h.book.exposureCount(), 0);
  auto record = h.book.get(plan.plan_id);
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->state, PositionState::PendingManual);
  EXPECT_TRUE(h.sink.hasCode("DRY_RUN"));
}

// -----------------------------------------------------------------------------
// 10. Entry failures: leverage first, then a rejected order.
// -----------------------------------------------------------------------------
TEST_F(OrderLifecycleTest, LeverageFailureStopsBeforeEntry) {
  h.paper.failNext("set_leverage", 1,
                   warden::PaperExchangeGateway::FailureKind::Permanent);
  auto result =
      h.lifecycle.submitPlan(h.plan("BTCUSDT", PositionSide::Long, 0.5, 99.0, 98.0));
  EXPECT_FALSE(result.ok);
  EXPECT_EQ(result.code, "LEVERAGE_FAILED");
  EXPECT_EQ(h.paper.placeCount(), 0u);
  EXPECT_EQ(h.book.exposureCount(), 0);
}

TEST_F(OrderLifecycleTest, RejectedEntryMarksPositionRejected) {
  h.paper.failNext("place_order", 1,
                   warden::PaperExchangeGateway::FailureKind::Permanent);
  auto plan = h.plan("BTCUSDT", PositionSide::Long, 0.5, 99.0, 98.0);
  auto result = h.lifecycle.submitPlan(plan);
  EXPECT_FALSE(result.ok);
  EXPECT_EQ(result.code, "ENTRY_REJECTED");
  auto record = h.book.get(plan.plan_id);
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->state, PositionState::Rejected);
}

TEST_F(OrderLifecycleTest, SecondPlanForSameSymbolRefused) {
  ASSERT_TRUE(h.lifecycle
                  .submitPlan(h.plan("BTCUSDT", PositionSide::Long, 0.5, 99.0, 98.0))
                  .ok);
  auto second =
      h.lifecycle.submitPlan(h.plan("BTCUSDT", PositionSide::Long, 0.5, 99.0, 98.0));
  EXPECT_FALSE(second.ok);
  EXPECT_EQ(second.code, "POSITION_ALREADY_OPEN");
  EXPECT_EQ(h.paper.placeCount(OrderKind::Entry), 1u);
}

// -----------------------------------------------------------------------------
// 11. Reduce 50% halves the position and resizes the stop.
// -----------------------------------------------------------------------------
TEST_F(OrderLifecycleTest, ReduceResizesStop) {
  ASSERT_TRUE(h.lifecycle
                  .submitPlan(h.plan("BTCUSDT", PositionSide::Long, 1.0, 100.0,
                                     99.0, OrderType::Market))
                  .ok);

  auto result = h.lifecycle.reducePosition("BTCUSDT", 50.0);
  ASSERT_TRUE(result.ok);
  EXPECT_EQ(result.code, "REDUCED");

  auto pos = h.book.openFor("BTCUSDT");
  ASSERT_TRUE(pos.has_value());
  EXPECT_NEAR(pos->size, 0.5, 1e-9);
  EXPECT_NEAR(pos->stop_order_size, 0.5, 1e-9);
  auto live = h.paper.position("BTCUSDT");
  ASSERT_TRUE(live.has_value());
  EXPECT_NEAR(live->size, 0.5, 1e-9);

  EXPECT_EQ(h.lifecycle.reducePosition("BTCUSDT", 0.0).code, "INVALID_ACTION");
  EXPECT_EQ(h.lifecycle.reducePosition("ETHUSDT", 10.0).code,
            "NO_OPEN_POSITION");
}

// -----------------------------------------------------------------------------
// 12. Close flattens the venue position and retires the local record.
// -----------------------------------------------------------------------------
TEST_F(OrderLifecycleTest, CloseFlattensPosition) {
  ASSERT_TRUE(h.lifecycle
                  .submitPlan(h.plan("BTCUSDT", PositionSide::Long, 1.0, 100.0,
                                     99.0, OrderType::Market))
                  .ok);

  auto result = h.lifecycle.closePosition("BTCUSDT", "MANAGE_CLOSE");
  ASSERT_TRUE(result.ok);
  EXPECT_EQ(result.code, "CLOSED");
  ASSERT_TRUE(result.position.has_value());
  EXPECT_EQ(result.position->state, PositionState::Closed);
  EXPECT_FALSE(h.paper.position("BTCUSDT").has_value());
  EXPECT_TRUE(h.paper.getOpenOrders().empty());
  EXPECT_FALSE(h.ledger.protectionFor("BTCUSDT").has_value());
  EXPECT_EQ(h.cooldowns.stopLossStreak(), 0);
}

// -----------------------------------------------------------------------------
// 13. The panic sweep closes tracked and untracked exchange positions.
// -----------------------------------------------------------------------------
TEST_F(OrderLifecycleTest, PanicCloseAllIncludesUntracked) {
  ASSERT_TRUE(h.lifecycle
                  .submitPlan(h.plan("BTCUSDT", PositionSide::Long, 1.0, 100.0,
                                     99.0, OrderType::Market))
                  .ok);

  warden::domain::ExchangePosition stray;
  stray.symbol = "ETHUSDT";
  stray.side = PositionSide::Short;
  stray.size = 2.0;
  stray.entry_price = 50.0;
  h.paper.setPosition(stray);
  h.paper.setPrice("ETHUSDT", 50.0);

  auto report = h.lifecycle.panicCloseAll();
  EXPECT_EQ(report.attempted, 2);
  EXPECT_EQ(report.unresolved, 0);
  EXPECT_EQ(h.paper.placeCount(OrderKind::Close), 2u);
  EXPECT_FALSE(h.paper.position("BTCUSDT").has_value());
  EXPECT_FALSE(h.paper.position("ETHUSDT").has_value());
  EXPECT_EQ(h.book.exposureCount(), 0);
}

TEST_F(OrderLifecycleTest, PanicCloseReportsFailedClose) {
  ASSERT_TRUE(h.lifecycle
                  .submitPlan(h.plan("BTCUSDT", PositionSide::Long, 1.0, 100.0,
                                     99.0, OrderType::Market))
                  .ok);
  h.paper.failNext("place_order", 1,
                   warden::PaperExchangeGateway::FailureKind::Permanent);

  auto report = h.lifecycle.panicCloseAll();

  EXPECT_EQ(report.attempted, 1);
  EXPECT_EQ(report.unresolved, 1);
  EXPECT_TRUE(h.paper.position("BTCUSDT").has_value());
  auto pos = h.book.openFor("BTCUSDT");
  ASSERT_TRUE(pos.has_value());
  EXPECT_EQ(pos->state, PositionState::Closing);
  EXPECT_TRUE(h.sink.hasCode("CLOSE_FAILED"));

  auto retry = h.lifecycle.panicCloseAll();
  EXPECT_EQ(retry.unresolved, 0);
  EXPECT_FALSE(h.paper.position("BTCUSDT").has_value());
}

// -----------------------------------------------------------------------------
// 14. A trigger stop that fills on the venue closes the record as a
//     stop-loss, so consecutive stop-outs build the streak.
// -----------------------------------------------------------------------------
TEST_F(OrderLifecycleTest, FilledTriggerStopsCountTowardStreak) {
  for (int i = 0; i < 3; ++i) {
    h.paper.setPrice("BTCUSDT", 100.0);
    auto plan = h.plan("BTCUSDT", PositionSide::Long, 1.0, 100.0, 99.0,
                       OrderType::Market);
    ASSERT_TRUE(h.lifecycle.submitPlan(plan).ok);
    auto open = h.book.get(plan.plan_id);
    ASSERT_TRUE(open.has_value());
    ASSERT_EQ(open->stop_mode, StopLossMode::Trigger);
    ASSERT_FALSE(open->stop_order_id.empty());

    h.paper.setPrice("BTCUSDT", 98.9);
    ASSERT_FALSE(h.paper.position("BTCUSDT").has_value());
    EXPECT_EQ(h.paper.order(open->stop_order_id)->status,
              warden::domain::OrderStatus::Filled);

    h.lifecycle.syncWithExchange();

    auto closed = h.book.get(plan.plan_id);
    ASSERT_TRUE(closed.has_value());
    EXPECT_EQ(closed->state, PositionState::Closed);
    EXPECT_EQ(h.cooldowns.stopLossStreak(), i + 1);
  }

  EXPECT_TRUE(h.sink.hasCode("STOP_LOSS_FILLED"));
  EXPECT_TRUE(
      h.cooldowns.stopLossCooldownUntil(h.clock.now_ms()).has_value());
}

TEST_F(OrderLifecycleTest, CanceledStopIsNotAStopLoss) {
  auto plan = h.plan("BTCUSDT", PositionSide::Long, 1.0, 100.0, 99.0,
                     OrderType::Market);
  ASSERT_TRUE(h.lifecycle.submitPlan(plan).ok);
  auto open = h.book.get(plan.plan_id);
  ASSERT_TRUE(open.has_value());

  // Flattened and its stop pulled outside the engine.
  h.paper.cancelOrder("BTCUSDT", open->stop_order_id);
  h.paper.removePosition("BTCUSDT");

  EXPECT_EQ(h.lifecycle.flatCloseReasonLocked(*open), "POSITION_GONE");
  h.lifecycle.syncWithExchange();

  // Not closed by the sync; reconciliation reports it as POSITION_GONE.
  EXPECT_NE(h.book.get(plan.plan_id)->state, PositionState::Closed);
  EXPECT_EQ(h.cooldowns.stopLossStreak(), 0);
}
