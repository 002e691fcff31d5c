#include "warden/safety/safety_supervisor.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <iterator>

namespace warden {

namespace {

constexpr const char* kKillSwitchReason = "KILL_SWITCH";
constexpr const char* kProtectionFailureCodes[] = {"PROTECTION_FAILURE",
                                                   "CLOSE_FAILED"};

std::optional<domain::SafetyMode> parseSafetyMode(const std::string& text) {
  if (text == "NORMAL") return domain::SafetyMode::Normal;
  if (text == "SAFE_MODE") return domain::SafetyMode::SafeMode;
  if (text == "PANIC_CLOSE") return domain::SafetyMode::PanicClose;
  return std::nullopt;
}

}  // namespace

SafetySupervisor::SafetySupervisor(const SafetyConfig& config,
                                   const KillSwitch& kill_switch,
                                   Ledger& ledger, INotificationSink& sink,
                                   const ITimeProvider& clock)
    : config_(config),
      kill_switch_(kill_switch),
      ledger_(ledger),
      sink_(sink),
      clock_(clock) {
  restoreFromLedger();
}

void SafetySupervisor::setPanicSweep(PanicSweep sweep) {
  std::lock_guard lock(mutex_);
  panic_sweep_ = std::move(sweep);
}

void SafetySupervisor::setProtectiveClose(ProtectiveClose close) {
  std::lock_guard lock(mutex_);
  protective_close_ = std::move(close);
}

domain::SafetyState SafetySupervisor::snapshot() const {
  std::lock_guard lock(mutex_);
  return state_;
}

std::vector<domain::SafetyTransition> SafetySupervisor::history() const {
  std::lock_guard lock(mutex_);
  return history_;
}

// -----------------------------------------------------------------------------
// evaluate
// -----------------------------------------------------------------------------
void SafetySupervisor::evaluate(
    const std::optional<domain::AccountSnapshot>& account,
    const std::vector<domain::ExchangePosition>& exchange_positions,
    const std::vector<domain::Position>& local_positions) {
  applyKillSwitch();

  const int errors = apiErrorsInWindow();
  if (config_.api_error_burst > 0 && errors >= config_.api_error_burst) {
    requestSafeMode("API_ERROR_BURST",
                    std::to_string(errors) + " api errors in window");
  }

  if (account) {
    observeEquity(account->equity);
    observeMarginRatio(account->margin_ratio);
  }

  std::set<std::string> present;

  // Liquidation distance, measured on exchange truth.
  for (const auto& ep : exchange_positions) {
    if (ep.size <= 0.0) {
      continue;
    }
    present.insert(ep.symbol);
    if (config_.min_liquidation_distance_pct <= 0.0 ||
        ep.liquidation_price <= 0.0 || ep.mark_price <= 0.0) {
      continue;
    }
    const double distance =
        std::abs(ep.liquidation_price - ep.mark_price) / ep.mark_price;
    if (distance <= config_.min_liquidation_distance_pct) {
      std::cerr << "[SafetySupervisor] " << ep.symbol
                << " liquidation distance " << distance << " <= "
                << config_.min_liquidation_distance_pct << "\n";
      protectiveClose(ep.symbol, "LIQUIDATION_DISTANCE");
    }
  }

  // Stop-loss age on local records.
  const auto now = clock_.now_ms();
  const auto limit_ms =
      static_cast<std::int64_t>(config_.max_time_without_sl_seconds * 1000.0);
  int missing = 0;
  bool timed_out = false;
  for (const auto& pos : local_positions) {
    if (!domain::isOpen(pos)) {
      continue;
    }
    present.insert(pos.symbol);
    if (domain::hasProtection(pos) || !pos.unprotected_since_ms) {
      continue;
    }
    ++missing;
    if (now - *pos.unprotected_since_ms < limit_ms) {
      continue;
    }
    std::cerr << "[SafetySupervisor] " << pos.symbol << " without stop-loss for "
              << (now - *pos.unprotected_since_ms) << "ms\n";
    timed_out = true;
    if (config_.emergency_close_if_sl_missing) {
      protectiveClose(pos.symbol, "SL_MISSING_TIMEOUT");
    }
  }
  missing_sl_.store(missing);
  if (timed_out) {
    requestSafeMode("SL_MISSING_TIMEOUT", "safety_evaluation");
  }

  {
    std::lock_guard lock(mutex_);
    for (auto it = closing_symbols_.begin(); it != closing_symbols_.end();) {
      it = present.count(*it) ? std::next(it) : closing_symbols_.erase(it);
    }
  }

  runPanicSweep();
}

void SafetySupervisor::applyKillSwitch() {
  const KillSwitchReading reading = kill_switch_.read();
  const std::string source = "kill_switch:" + reading.source;

  switch (reading.level) {
    case KillSwitchLevel::Panic:
      requestPanic(kKillSwitchReason, source);
      return;
    case KillSwitchLevel::Safe:
      requestSafeMode(kKillSwitchReason, source);
      return;
    case KillSwitchLevel::None:
      break;
  }

  bool sole_reason = false;
  {
    std::lock_guard lock(mutex_);
    sole_reason = state_.mode == domain::SafetyMode::SafeMode &&
                  state_.reasons.size() == 1 &&
                  state_.reasons.front() == kKillSwitchReason;
  }
  if (sole_reason) {
    transition(domain::SafetyMode::Normal, "KILL_SWITCH_CLEARED",
               "kill_switch", true);
  }
}

void SafetySupervisor::observeEquity(double equity) {
  if (equity <= 0.0) {
    return;
  }
  double drawdown = 0.0;
  {
    std::lock_guard lock(mutex_);
    last_equity_ = equity;
    if (!peak_equity_ || equity > *peak_equity_) {
      peak_equity_ = equity;
    }
    drawdown = (*peak_equity_ - equity) / *peak_equity_;
  }
  if (drawdown > config_.max_account_drawdown_pct) {
    requestSafeMode("DRAWDOWN_BREAKER",
                    "drawdown " + std::to_string(drawdown));
  }
}

void SafetySupervisor::observeMarginRatio(double margin_ratio) {
  if (config_.max_margin_ratio > 0.0 && margin_ratio > config_.max_margin_ratio) {
    requestSafeMode("MARGIN_RATIO",
                    "margin ratio " + std::to_string(margin_ratio));
  }
}

void SafetySupervisor::recordApiError(const std::string& operation,
                                      const std::string& what) {
  std::cerr << "[SafetySupervisor] api error in " << operation << ": " << what
            << "\n";
  int count = 0;
  {
    std::lock_guard lock(mutex_);
    const auto now = clock_.now_ms();
    api_errors_.push_back(now);
    const auto window =
        static_cast<std::int64_t>(config_.api_error_window_seconds * 1000.0);
    while (!api_errors_.empty() && now - api_errors_.front() > window) {
      api_errors_.pop_front();
    }
    count = static_cast<int>(api_errors_.size());
  }
  if (config_.api_error_burst > 0 && count >= config_.api_error_burst) {
    requestSafeMode("API_ERROR_BURST",
                    std::to_string(count) + " api errors in window");
  }
}

void SafetySupervisor::reportEscalation(const std::string& code,
                                        const std::string& symbol,
                                        const std::string& detail) {
  const bool counted =
      std::find(std::begin(kProtectionFailureCodes),
                std::end(kProtectionFailureCodes),
                code) != std::end(kProtectionFailureCodes);
  ledger_.append(LedgerKind::SafetyTransition, "escalation",
                 {{"code", code}, {"symbol", symbol}, {"detail", detail}});
  if (!counted) {
    return;
  }

  int failures = 0;
  {
    std::lock_guard lock(mutex_);
    failures = ++protection_failures_;
  }
  std::cerr << "[SafetySupervisor] " << code << " " << symbol << " ("
            << failures << "/" << config_.max_protection_failures << ")\n";
  if (failures >= config_.max_protection_failures) {
    requestSafeMode("PROTECTION_FAILURES", code + " " + symbol);
  }
}

// -----------------------------------------------------------------------------
// Transitions
// -----------------------------------------------------------------------------
bool SafetySupervisor::requestSafeMode(const std::string& reason,
                                       const std::string& source) {
  return transition(domain::SafetyMode::SafeMode, reason, source, false);
}

bool SafetySupervisor::requestPanic(const std::string& reason,
                                    const std::string& source) {
  const bool changed =
      transition(domain::SafetyMode::PanicClose, reason, source, false);
  runPanicSweep();
  return changed;
}

bool SafetySupervisor::operatorReset(const std::string& source) {
  {
    std::lock_guard lock(mutex_);
    peak_equity_ = last_equity_;
    api_errors_.clear();
    protection_failures_ = 0;
    closing_symbols_.clear();
  }
  sweep_pending_.store(false);
  return transition(domain::SafetyMode::Normal, "OPERATOR_RESET", source, true);
}

bool SafetySupervisor::transition(domain::SafetyMode to,
                                  const std::string& reason,
                                  const std::string& source,
                                  bool allow_recovery) {
  using domain::SafetyMode;
  domain::SafetyTransition t;
  {
    std::lock_guard lock(mutex_);
    const SafetyMode from = state_.mode;

    if (from == to) {
      if (to != SafetyMode::Normal &&
          std::find(state_.reasons.begin(), state_.reasons.end(), reason) ==
              state_.reasons.end()) {
        state_.reasons.push_back(reason);
      }
      return false;
    }
    // Only an explicit recovery may step down.
    if (!allow_recovery &&
        (to == SafetyMode::Normal ||
         (from == SafetyMode::PanicClose && to == SafetyMode::SafeMode))) {
      return false;
    }
    if (allow_recovery && from == SafetyMode::PanicClose &&
        reason != "OPERATOR_RESET") {
      return false;
    }

    if (to == SafetyMode::Normal) {
      state_.reasons.clear();
    } else if (from == SafetyMode::Normal) {
      state_.reasons = {reason};
    } else {
      state_.reasons.push_back(reason);
    }
    state_.mode = to;
    state_.entered_at_ms = clock_.now_ms();
    ++state_.version;

    t.from = from;
    t.to = to;
    t.reason = reason;
    t.source = source;
    t.timestamp_ms = state_.entered_at_ms;
    t.version = state_.version;
    history_.push_back(t);

    if (to == SafetyMode::PanicClose) {
      sweep_pending_.store(true);
    }
  }
  record(t);
  return true;
}

void SafetySupervisor::record(const domain::SafetyTransition& t) {
  std::cerr << "[SafetySupervisor] " << domain::toString(t.from) << " -> "
            << domain::toString(t.to) << " reason=" << t.reason
            << " source=" << t.source << " v" << t.version << "\n";

  ledger_.append(LedgerKind::SafetyTransition, "safety",
                 {{"from", domain::toString(t.from)},
                  {"to", domain::toString(t.to)},
                  {"reason", t.reason},
                  {"source", t.source},
                  {"version", t.version}});
  sink_.publish(Event{SafetyTransitionEvent{t}});
}

void SafetySupervisor::runPanicSweep() {
  if (!sweep_pending_.load()) {
    return;
  }
  bool expected = false;
  if (!sweeping_.compare_exchange_strong(expected, true)) {
    return;  // Another thread is sweeping
  }

  PanicSweep sweep;
  {
    std::lock_guard lock(mutex_);
    sweep = panic_sweep_;
  }
  if (!sweep) {
    // Nothing installed yet; keep the flag raised for the next evaluation.
    sweeping_.store(false);
    return;
  }

  std::cerr << "[SafetySupervisor] PANIC sweep starting\n";
  PanicSweepResult result;
  try {
    result = sweep();
  } catch (const std::exception& e) {
    std::cerr << "[SafetySupervisor] PANIC sweep error: " << e.what() << "\n";
    ledger_.append(LedgerKind::SafetyTransition, "panic_sweep",
                   {{"error", e.what()}});
    sweeping_.store(false);
    return;  // Flag stays raised; the next evaluation retries
  }
  ledger_.append(LedgerKind::SafetyTransition, "panic_sweep",
                 {{"closes", result.closes},
                  {"unresolved", result.unresolved}});
  if (result.unresolved > 0) {
    std::cerr << "[SafetySupervisor] PANIC sweep left " << result.unresolved
              << " position(s) open; retrying on next evaluation\n";
    sweeping_.store(false);
    return;
  }
  std::cerr << "[SafetySupervisor] PANIC sweep done, " << result.closes
            << " closes\n";
  sweep_pending_.store(false);
  sweeping_.store(false);
}

void SafetySupervisor::protectiveClose(const std::string& symbol,
                                       const std::string& reason) {
  ProtectiveClose close;
  {
    std::lock_guard lock(mutex_);
    if (!closing_symbols_.insert(symbol).second) {
      return;  // Already issued while the position persists
    }
    close = protective_close_;
  }
  ledger_.append(LedgerKind::SafetyTransition, "protective_close",
                 {{"symbol", symbol}, {"reason", reason}});

  NotificationEvent event;
  event.kind = NotificationKind::ProtectiveClose;
  event.symbol = symbol;
  event.code = reason;
  event.message = "protective close requested";
  event.timestamp_ms = clock_.now_ms();
  sink_.notify(std::move(event));

  if (close) {
    close(symbol, reason);
  }
}

void SafetySupervisor::restoreFromLedger() {
  for (const auto& entry : ledger_.entriesOfKind(LedgerKind::SafetyTransition)) {
    if (entry.key != "safety" || !entry.payload.contains("to")) {
      continue;
    }
    auto mode = parseSafetyMode(entry.payload.value("to", ""));
    if (!mode) {
      continue;
    }
    state_.mode = *mode;
    state_.version = entry.payload.value("version", state_.version);
    state_.entered_at_ms = entry.ts_ms;
    const std::string reason = entry.payload.value("reason", "");
    if (*mode == domain::SafetyMode::Normal) {
      state_.reasons.clear();
    } else if (std::find(state_.reasons.begin(), state_.reasons.end(),
                         reason) == state_.reasons.end()) {
      state_.reasons.push_back(reason);
    }
  }
  if (state_.mode != domain::SafetyMode::Normal) {
    std::cerr << "[SafetySupervisor] restored "
              << domain::toString(state_.mode) << " v" << state_.version
              << " from ledger\n";
  }
  if (state_.mode == domain::SafetyMode::PanicClose) {
    sweep_pending_.store(true);
  }
}

std::optional<double> SafetySupervisor::peakEquity() const {
  std::lock_guard lock(mutex_);
  return peak_equity_;
}

int SafetySupervisor::apiErrorsInWindow() const {
  std::lock_guard lock(mutex_);
  const auto now = clock_.now_ms();
  const auto window =
      static_cast<std::int64_t>(config_.api_error_window_seconds * 1000.0);
  return static_cast<int>(std::count_if(
      api_errors_.begin(), api_errors_.end(),
      [&](std::int64_t ts) { return now - ts <= window; }));
}

}  // namespace warden
