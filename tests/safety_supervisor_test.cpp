// =============================================================================
// safety_supervisor_test.cpp
// =============================================================================
// Unit tests for warden::SafetySupervisor and warden::KillSwitch.
//
// Validates:
//   - Drawdown, margin ratio, API error burst and protection-failure count
//     each move NORMAL -> SAFE_MODE with a stable reason code
//   - Breaker-driven SAFE_MODE only leaves via operatorReset()
//   - PANIC_CLOSE runs the installed sweep once and cannot step down to
//     SAFE_MODE; a failing, missing or incomplete sweep keeps the flag raised
//   - Kill switch sources: file, environment, stored ledger flag; a cleared
//     switch releases a SAFE_MODE it caused alone
//   - Liquidation distance and missing stop-loss age trigger protective
//     closes, issued once per symbol while the position persists
//   - The last recorded mode is restored from the ledger on construction
//
// Design: the supervisor is built in each test after the config is tuned.
// The kill-switch file lives in the gtest temp dir and is removed around
// every test.
// =============================================================================

#include "warden/safety/kill_switch.hpp"
#include "warden/safety/safety_supervisor.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

using warden::KillSwitch;
using warden::KillSwitchLevel;
using warden::SafetySupervisor;
using warden::domain::SafetyMode;

namespace {

constexpr const char* kEnvVar = "WARDEN_TEST_KILL_SWITCH";

bool hasReason(const warden::domain::SafetyState& state,
               const std::string& reason) {
  for (const auto& r : state.reasons) {
    if (r == reason) {
      return true;
    }
  }
  return false;
}

}  // namespace

class SafetySupervisorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    kill_file = ::testing::TempDir() + "warden_kill_" +
                ::testing::UnitTest::GetInstance()->current_test_info()->name();
    std::remove(kill_file.c_str());
    unsetenv(kEnvVar);
    config.kill_switch_file = kill_file;
    config.kill_switch_env = kEnvVar;
  }

  void TearDown() override {
    std::remove(kill_file.c_str());
    unsetenv(kEnvVar);
  }

  SafetySupervisor& start() {
    kill_switch = std::make_unique<KillSwitch>(
        config.kill_switch_file, config.kill_switch_env, ledger);
    supervisor = std::make_unique<SafetySupervisor>(config, *kill_switch,
                                                    ledger, sink, clock);
    supervisor->setProtectiveClose(
        [this](const std::string& symbol, const std::string& reason) {
          closes.emplace_back(symbol, reason);
        });
    return *supervisor;
  }

  void writeKillFile(const std::string& content) {
    std::ofstream out(kill_file);
    out << content;
  }

  void evaluateIdle() { supervisor->evaluate(std::nullopt, {}, {}); }

  warden::SimulationTimeProvider clock{warden::test::kStartMs};
  warden::Ledger ledger{"", clock};
  warden::test::RecordingSink sink;
  warden::SafetyConfig config;
  std::string kill_file;
  std::unique_ptr<KillSwitch> kill_switch;
  std::unique_ptr<SafetySupervisor> supervisor;
  std::vector<std::pair<std::string, std::string>> closes;
};

// -----------------------------------------------------------------------------
// 1. Fresh supervisor.
// -----------------------------------------------------------------------------
TEST_F(SafetySupervisorTest, StartsNormal) {
  auto& s = start();
  evaluateIdle();

  auto state = s.snapshot();
  EXPECT_EQ(state.mode, SafetyMode::Normal);
  EXPECT_EQ(state.version, 0u);
  EXPECT_TRUE(state.reasons.empty());
  EXPECT_TRUE(s.history().empty());
  EXPECT_FALSE(s.panicRequested());
}

// -----------------------------------------------------------------------------
// 2. Breakers.
// -----------------------------------------------------------------------------
TEST_F(SafetySupervisorTest, DrawdownFromPeakTripsSafeMode) {
  auto& s = start();
  s.observeEquity(1000.0);
  s.observeEquity(900.0);
  EXPECT_EQ(s.snapshot().mode, SafetyMode::Normal);

  s.observeEquity(840.0);

  auto state = s.snapshot();
  EXPECT_EQ(state.mode, SafetyMode::SafeMode);
  ASSERT_EQ(state.reasons.size(), 1u);
  EXPECT_EQ(state.reasons[0], "DRAWDOWN_BREAKER");
  EXPECT_EQ(state.version, 1u);
  EXPECT_DOUBLE_EQ(s.peakEquity().value_or(0.0), 1000.0);

  auto history = s.history();
  ASSERT_EQ(history.size(), 1u);
  EXPECT_EQ(history[0].from, SafetyMode::Normal);
  EXPECT_EQ(history[0].to, SafetyMode::SafeMode);
  EXPECT_EQ(history[0].timestamp_ms, warden::test::kStartMs);

  auto events = sink.events();
  ASSERT_EQ(events.size(), 1u);
  const auto* published = std::get_if<warden::SafetyTransitionEvent>(&events[0]);
  ASSERT_NE(published, nullptr);
  EXPECT_EQ(published->transition.reason, "DRAWDOWN_BREAKER");

  auto recorded = ledger.entriesForKey("safety");
  ASSERT_EQ(recorded.size(), 1u);
  EXPECT_EQ(recorded[0].payload.at("to").get<std::string>(), "SAFE_MODE");
}

TEST_F(SafetySupervisorTest, MarginRatioThenSecondReason) {
  auto& s = start();
  warden::domain::AccountSnapshot account;
  account.equity = 1000.0;
  account.margin_ratio = 0.85;

  s.evaluate(account, {}, {});
  EXPECT_EQ(s.snapshot().mode, SafetyMode::SafeMode);
  EXPECT_TRUE(hasReason(s.snapshot(), "MARGIN_RATIO"));

  // Already in SAFE_MODE: the reason is added without a new version.
  s.observeEquity(800.0);
  auto state = s.snapshot();
  EXPECT_TRUE(hasReason(state, "DRAWDOWN_BREAKER"));
  EXPECT_EQ(state.version, 1u);
  EXPECT_EQ(s.history().size(), 1u);
}

TEST_F(SafetySupervisorTest, ApiErrorBurstWithinWindow) {
  config.api_error_burst = 3;
  config.api_error_window_seconds = 60.0;
  auto& s = start();

  s.recordApiError("place_order", "timeout");
  s.recordApiError("place_order", "timeout");
  clock.advance_by(61'000);
  s.recordApiError("get_positions", "503");
  EXPECT_EQ(s.snapshot().mode, SafetyMode::Normal);
  EXPECT_EQ(s.apiErrorsInWindow(), 1);

  s.recordApiError("get_positions", "503");
  s.recordApiError("get_positions", "503");
  EXPECT_EQ(s.apiErrorsInWindow(), 3);
  EXPECT_EQ(s.snapshot().mode, SafetyMode::SafeMode);
  EXPECT_TRUE(hasReason(s.snapshot(), "API_ERROR_BURST"));
}

TEST_F(SafetySupervisorTest, ProtectionFailuresCounted) {
  config.max_protection_failures = 3;
  auto& s = start();

  s.reportEscalation("ENTRY_REJECTED", "BTCUSDT", "not counted");
  s.reportEscalation("PROTECTION_FAILURE", "BTCUSDT", "stop rejected");
  s.reportEscalation("PROTECTION_FAILURE", "ETHUSDT", "stop rejected");
  EXPECT_EQ(s.snapshot().mode, SafetyMode::Normal);

  s.reportEscalation("CLOSE_FAILED", "ETHUSDT", "close rejected");
  EXPECT_EQ(s.snapshot().mode, SafetyMode::SafeMode);
  EXPECT_TRUE(hasReason(s.snapshot(), "PROTECTION_FAILURES"));
  EXPECT_EQ(ledger.entriesForKey("escalation").size(), 4u);
}

// -----------------------------------------------------------------------------
// 3. Leaving SAFE_MODE.
// -----------------------------------------------------------------------------
TEST_F(SafetySupervisorTest, BreakerSafeModeNeedsOperatorReset) {
  auto& s = start();
  EXPECT_TRUE(s.requestSafeMode("OPERATOR", "cli"));
  EXPECT_FALSE(s.requestSafeMode("OPERATOR", "cli"));

  evaluateIdle();
  EXPECT_EQ(s.snapshot().mode, SafetyMode::SafeMode);

  EXPECT_TRUE(s.operatorReset("cli"));
  auto state = s.snapshot();
  EXPECT_EQ(state.mode, SafetyMode::Normal);
  EXPECT_TRUE(state.reasons.empty());
  EXPECT_EQ(state.version, 2u);
  EXPECT_EQ(s.history().back().reason, "OPERATOR_RESET");
}

// -----------------------------------------------------------------------------
// 4. PANIC_CLOSE and the sweep.
// -----------------------------------------------------------------------------
TEST_F(SafetySupervisorTest, PanicRunsSweepOnce) {
  auto& s = start();
  int sweeps = 0;
  s.setPanicSweep([&] {
    EXPECT_TRUE(s.panicFlag().load());
    ++sweeps;
    return warden::PanicSweepResult{2, 0};
  });

  EXPECT_TRUE(s.requestPanic("OPERATOR", "cli"));
  EXPECT_EQ(sweeps, 1);
  EXPECT_FALSE(s.panicRequested());
  EXPECT_EQ(s.snapshot().mode, SafetyMode::PanicClose);

  // No stepping down to SAFE_MODE, no second sweep.
  EXPECT_FALSE(s.requestSafeMode("MARGIN_RATIO", "test"));
  EXPECT_FALSE(s.requestPanic("OPERATOR", "cli"));
  evaluateIdle();
  EXPECT_EQ(sweeps, 1);
  EXPECT_EQ(s.snapshot().mode, SafetyMode::PanicClose);

  auto sweep_entries = ledger.entriesForKey("panic_sweep");
  ASSERT_EQ(sweep_entries.size(), 1u);
  EXPECT_EQ(sweep_entries[0].payload.at("closes").get<int>(), 2);

  EXPECT_TRUE(s.operatorReset("cli"));
  EXPECT_EQ(s.snapshot().mode, SafetyMode::Normal);
}

TEST_F(SafetySupervisorTest, MissingSweepKeepsFlagRaised) {
  auto& s = start();
  s.requestPanic("OPERATOR", "cli");
  EXPECT_TRUE(s.panicRequested());

  int sweeps = 0;
  s.setPanicSweep([&] { return warden::PanicSweepResult{++sweeps, 0}; });
  evaluateIdle();

  EXPECT_EQ(sweeps, 1);
  EXPECT_FALSE(s.panicRequested());
}

TEST_F(SafetySupervisorTest, FailedSweepRetriedOnNextEvaluation) {
  auto& s = start();
  int sweeps = 0;
  s.setPanicSweep([&]() -> warden::PanicSweepResult {
    if (++sweeps == 1) {
      throw std::runtime_error("venue unreachable");
    }
    return {};
  });

  s.requestPanic("OPERATOR", "cli");
  EXPECT_TRUE(s.panicRequested());

  evaluateIdle();
  EXPECT_EQ(sweeps, 2);
  EXPECT_FALSE(s.panicRequested());
}

TEST_F(SafetySupervisorTest, UnresolvedSweepKeepsFlagRaised) {
  auto& s = start();
  int sweeps = 0;
  s.setPanicSweep([&] {
    ++sweeps;
    return warden::PanicSweepResult{1, sweeps < 3 ? 1 : 0};
  });

  s.requestPanic("OPERATOR", "cli");
  EXPECT_TRUE(s.panicRequested());

  evaluateIdle();
  EXPECT_EQ(sweeps, 2);
  EXPECT_TRUE(s.panicRequested());

  evaluateIdle();
  EXPECT_EQ(sweeps, 3);
  EXPECT_FALSE(s.panicRequested());

  evaluateIdle();
  EXPECT_EQ(sweeps, 3);

  auto entries = ledger.entriesForKey("panic_sweep");
  ASSERT_EQ(entries.size(), 3u);
  EXPECT_EQ(entries[0].payload.at("unresolved").get<int>(), 1);
  EXPECT_EQ(entries[2].payload.at("unresolved").get<int>(), 0);
}

// -----------------------------------------------------------------------------
// 5. Kill switch.
// -----------------------------------------------------------------------------
TEST_F(SafetySupervisorTest, KillSwitchFileEngagesAndClears) {
  auto& s = start();
  writeKillFile("");

  evaluateIdle();
  auto state = s.snapshot();
  EXPECT_EQ(state.mode, SafetyMode::SafeMode);
  ASSERT_EQ(state.reasons.size(), 1u);
  EXPECT_EQ(state.reasons[0], "KILL_SWITCH");
  EXPECT_EQ(s.history().back().source, "kill_switch:file");

  std::remove(kill_file.c_str());
  evaluateIdle();
  EXPECT_EQ(s.snapshot().mode, SafetyMode::Normal);
  EXPECT_EQ(s.history().back().reason, "KILL_SWITCH_CLEARED");
}

TEST_F(SafetySupervisorTest, KillSwitchDoesNotReleaseOtherReasons) {
  auto& s = start();
  writeKillFile("safe");
  evaluateIdle();
  s.observeEquity(1000.0);
  s.observeEquity(500.0);
  EXPECT_TRUE(hasReason(s.snapshot(), "DRAWDOWN_BREAKER"));

  std::remove(kill_file.c_str());
  evaluateIdle();
  EXPECT_EQ(s.snapshot().mode, SafetyMode::SafeMode);
}

TEST_F(SafetySupervisorTest, KillSwitchFilePanic) {
  auto& s = start();
  writeKillFile(" PANIC\n");
  evaluateIdle();
  EXPECT_EQ(s.snapshot().mode, SafetyMode::PanicClose);
}

TEST_F(SafetySupervisorTest, KillSwitchFromEnvironment) {
  auto& s = start();
  setenv(kEnvVar, "nonsense", 1);
  evaluateIdle();
  EXPECT_EQ(s.snapshot().mode, SafetyMode::Normal);

  setenv(kEnvVar, "TRUE", 1);
  evaluateIdle();
  EXPECT_EQ(s.snapshot().mode, SafetyMode::SafeMode);
  EXPECT_EQ(s.history().back().source, "kill_switch:env");
}

TEST_F(SafetySupervisorTest, KillSwitchFromStoredFlag) {
  start();
  ledger.setStoredKillSwitch("panic");

  auto reading = kill_switch->read();
  EXPECT_EQ(reading.level, KillSwitchLevel::Panic);
  EXPECT_EQ(reading.source, "stored");

  // The file wins over the stored flag.
  writeKillFile("");
  reading = kill_switch->read();
  EXPECT_EQ(reading.level, KillSwitchLevel::Safe);
  EXPECT_EQ(reading.source, "file");
}

TEST(KillSwitchParseTest, FlagsAndFileContent) {
  EXPECT_EQ(KillSwitch::parseFlag("1"), KillSwitchLevel::Safe);
  EXPECT_EQ(KillSwitch::parseFlag(" Safe_Mode "), KillSwitchLevel::Safe);
  EXPECT_EQ(KillSwitch::parseFlag("2"), KillSwitchLevel::Panic);
  EXPECT_EQ(KillSwitch::parseFlag("0"), KillSwitchLevel::None);
  EXPECT_EQ(KillSwitch::parseFlag(""), KillSwitchLevel::None);
  EXPECT_EQ(KillSwitch::parseFileContent(""), KillSwitchLevel::Safe);
  EXPECT_EQ(KillSwitch::parseFileContent("panic_close\n"),
            KillSwitchLevel::Panic);
  EXPECT_STREQ(warden::toString(KillSwitchLevel::Panic), "PANIC_CLOSE");
}

// -----------------------------------------------------------------------------
// 6. Position checks.
// -----------------------------------------------------------------------------
TEST_F(SafetySupervisorTest, LiquidationDistanceClosesOncePerPosition) {
  auto& s = start();
  warden::domain::ExchangePosition risky;
  risky.symbol = "BTCUSDT";
  risky.side = warden::domain::PositionSide::Long;
  risky.size = 1.0;
  risky.mark_price = 100.0;
  risky.liquidation_price = 97.0;

  s.evaluate(std::nullopt, {risky}, {});
  s.evaluate(std::nullopt, {risky}, {});
  ASSERT_EQ(closes.size(), 1u);
  EXPECT_EQ(closes[0].first, "BTCUSDT");
  EXPECT_EQ(closes[0].second, "LIQUIDATION_DISTANCE");
  EXPECT_TRUE(sink.hasCode("LIQUIDATION_DISTANCE"));
  EXPECT_EQ(s.snapshot().mode, SafetyMode::Normal);

  // Once the position is gone the symbol can be closed again.
  s.evaluate(std::nullopt, {}, {});
  s.evaluate(std::nullopt, {risky}, {});
  EXPECT_EQ(closes.size(), 2u);

  risky.liquidation_price = 80.0;
  s.evaluate(std::nullopt, {}, {});
  s.evaluate(std::nullopt, {risky}, {});
  EXPECT_EQ(closes.size(), 2u);
}

TEST_F(SafetySupervisorTest, StopLossMissingTooLong) {
  auto& s = start();
  warden::domain::Position bare;
  bare.symbol = "BTCUSDT";
  bare.side = warden::domain::PositionSide::Long;
  bare.size = 1.0;
  bare.state = warden::domain::PositionState::FilledProtected;
  bare.unprotected_since_ms = clock.now_ms();

  s.evaluate(std::nullopt, {}, {bare});
  EXPECT_EQ(s.missingStopLossCount(), 1);
  EXPECT_TRUE(closes.empty());
  EXPECT_EQ(s.snapshot().mode, SafetyMode::Normal);

  clock.advance_by(10'000);
  s.evaluate(std::nullopt, {}, {bare});
  ASSERT_EQ(closes.size(), 1u);
  EXPECT_EQ(closes[0].second, "SL_MISSING_TIMEOUT");
  EXPECT_EQ(s.snapshot().mode, SafetyMode::SafeMode);
  EXPECT_TRUE(hasReason(s.snapshot(), "SL_MISSING_TIMEOUT"));
}

TEST_F(SafetySupervisorTest, StopLossMissingWithoutEmergencyClose) {
  config.emergency_close_if_sl_missing = false;
  auto& s = start();
  warden::domain::Position bare;
  bare.symbol = "ETHUSDT";
  bare.size = 2.0;
  bare.state = warden::domain::PositionState::PartiallyFilled;
  bare.unprotected_since_ms = clock.now_ms() - 60'000;

  s.evaluate(std::nullopt, {}, {bare});
  EXPECT_TRUE(closes.empty());
  EXPECT_EQ(s.snapshot().mode, SafetyMode::SafeMode);

  // A guarded position is not counted.
  bare.guard.armed = true;
  s.evaluate(std::nullopt, {}, {bare});
  EXPECT_EQ(s.missingStopLossCount(), 0);
}

// -----------------------------------------------------------------------------
// 7. Restart.
// -----------------------------------------------------------------------------
TEST_F(SafetySupervisorTest, RestoresModeFromLedger) {
  start().requestSafeMode("DRAWDOWN_BREAKER", "test");
  supervisor.reset();

  auto& restored = start();
  auto state = restored.snapshot();
  EXPECT_EQ(state.mode, SafetyMode::SafeMode);
  EXPECT_EQ(state.version, 1u);
  EXPECT_TRUE(hasReason(state, "DRAWDOWN_BREAKER"));
}

TEST_F(SafetySupervisorTest, RestoredPanicRaisesSweepFlag) {
  start().requestPanic("OPERATOR", "cli");
  supervisor.reset();

  auto& restored = start();
  EXPECT_EQ(restored.snapshot().mode, SafetyMode::PanicClose);
  EXPECT_TRUE(restored.panicRequested());

  int sweeps = 0;
  restored.setPanicSweep(
      [&] { return warden::PanicSweepResult{++sweeps, 0}; });
  evaluateIdle();
  EXPECT_EQ(sweeps, 1);
}
