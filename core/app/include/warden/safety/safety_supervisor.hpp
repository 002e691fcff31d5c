#pragma once

#include "warden/domain/account.hpp"
#include "warden/domain/position.hpp"
#include "warden/domain/safety_state.hpp"
#include "warden/ledger/ledger.hpp"
#include "warden/notify/i_notification_sink.hpp"
#include "warden/safety/kill_switch.hpp"
#include "warden/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace warden {

// -----------------------------------------------------------------------------
// SafetyConfig: circuit breakers and kill switch sources
// -----------------------------------------------------------------------------
// Loaded from the "safety" section. Percent fields are stored as ratios.
// -----------------------------------------------------------------------------
struct SafetyConfig {
  double max_account_drawdown_pct{0.15};
  double max_margin_ratio{0.8};               // 0 disables the check
  double min_liquidation_distance_pct{0.05};  // 0 disables the check

  double max_time_without_sl_seconds{10.0};
  bool emergency_close_if_sl_missing{true};

  int api_error_burst{8};
  double api_error_window_seconds{60.0};

  // PROTECTION_FAILURE / CLOSE_FAILED escalations before SAFE_MODE.
  int max_protection_failures{3};

  std::string kill_switch_file{"./KILL_SWITCH"};
  std::string kill_switch_env{"TRADER_KILL_SWITCH"};
};

// Outcome of one panic sweep. unresolved counts positions the sweep could
// not confirm flat; the sweep runs again on every evaluation until it is 0.
struct PanicSweepResult {
  int closes{0};
  int unresolved{0};
};

// -----------------------------------------------------------------------------
// SafetySupervisor: owner of the process-wide SafetyState
// -----------------------------------------------------------------------------
//
// @brief  Evaluates kill switch, drawdown, margin, liquidation distance,
//         missing stop-loss age and API error bursts, and records every
//         resulting mode change as a versioned SafetyTransition.
//
// @details
// State machine:
//
//   NORMAL ──(any breaker / operator)──> SAFE_MODE ──> PANIC_CLOSE
//     ▲                                     │               │
//     └───── kill switch cleared ───────────┘               │
//     └───────────────────── operatorReset() ───────────────┘
//
//   SAFE_MODE returns to NORMAL on its own only when the kill switch was
//   its sole reason and the switch has cleared. Every other way out is
//   operatorReset().
//
// Reason codes (stable): KILL_SWITCH, DRAWDOWN_BREAKER, MARGIN_RATIO,
// API_ERROR_BURST, SL_MISSING_TIMEOUT, PROTECTION_FAILURES, OPERATOR.
//
// Panic sweep:
//   Entering PANIC_CLOSE raises panicFlag() and runs the installed sweep
//   once, on the thread that caused the transition. The flag stays raised
//   until the sweep returns; workers that hold symbol locks for long
//   (reconciliation) check it between symbols and yield. Callers must not
//   hold a symbol lock when they can cause a PANIC_CLOSE transition.
//
// Transitions are appended to the ledger (SAFETY_TRANSITION) and published
// as SafetyTransitionEvent. On construction the last recorded mode is
// restored, so a restart does not silently leave PANIC_CLOSE or a
// breaker-driven SAFE_MODE.
//
// Thread model: all public methods are thread-safe. Callbacks run outside
// the internal mutex.
// -----------------------------------------------------------------------------
class SafetySupervisor {
 public:
  using PanicSweep = std::function<PanicSweepResult()>;
  using ProtectiveClose =
      std::function<void(const std::string& symbol, const std::string& reason)>;

  SafetySupervisor(const SafetyConfig& config, const KillSwitch& kill_switch,
                   Ledger& ledger, INotificationSink& sink,
                   const ITimeProvider& clock);

  SafetySupervisor(const SafetySupervisor&) = delete;
  SafetySupervisor& operator=(const SafetySupervisor&) = delete;
  SafetySupervisor(SafetySupervisor&&) = delete;
  SafetySupervisor& operator=(SafetySupervisor&&) = delete;

  void setPanicSweep(PanicSweep sweep);
  void setProtectiveClose(ProtectiveClose close);

  domain::SafetyState snapshot() const;
  std::vector<domain::SafetyTransition> history() const;

  // One pass of every breaker. account is empty when the poller has not
  // produced a balance yet.
  void evaluate(const std::optional<domain::AccountSnapshot>& account,
                const std::vector<domain::ExchangePosition>& exchange_positions,
                const std::vector<domain::Position>& local_positions);

  void applyKillSwitch();
  void observeEquity(double equity);
  void observeMarginRatio(double margin_ratio);
  void recordApiError(const std::string& operation, const std::string& what);
  void reportEscalation(const std::string& code, const std::string& symbol,
                        const std::string& detail);

  bool requestSafeMode(const std::string& reason, const std::string& source);
  bool requestPanic(const std::string& reason, const std::string& source);
  bool operatorReset(const std::string& source);

  // Raised from the PANIC_CLOSE transition until a sweep leaves nothing
  // unresolved.
  const std::atomic<bool>& panicFlag() const { return sweep_pending_; }
  bool panicRequested() const { return sweep_pending_.load(); }

  std::optional<double> peakEquity() const;
  int apiErrorsInWindow() const;
  int missingStopLossCount() const { return missing_sl_.load(); }
  const SafetyConfig& config() const { return config_; }

 private:
  bool transition(domain::SafetyMode to, const std::string& reason,
                  const std::string& source, bool allow_recovery);
  void record(const domain::SafetyTransition& transition);
  void runPanicSweep();
  void restoreFromLedger();
  void protectiveClose(const std::string& symbol, const std::string& reason);

  const SafetyConfig config_;
  const KillSwitch& kill_switch_;
  Ledger& ledger_;
  INotificationSink& sink_;
  const ITimeProvider& clock_;

  mutable std::mutex mutex_;
  domain::SafetyState state_;
  std::vector<domain::SafetyTransition> history_;
  std::optional<double> peak_equity_;
  std::optional<double> last_equity_;
  std::deque<std::int64_t> api_errors_;
  int protection_failures_{0};
  std::set<std::string> closing_symbols_;
  PanicSweep panic_sweep_;
  ProtectiveClose protective_close_;

  std::atomic<bool> sweep_pending_{false};
  std::atomic<bool> sweeping_{false};
  std::atomic<int> missing_sl_{0};
};

}  // namespace warden
