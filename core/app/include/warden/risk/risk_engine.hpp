#pragma once

#include "warden/concurrent/id_generator.hpp"
#include "warden/domain/account.hpp"
#include "warden/domain/policy_config.hpp"
#include "warden/domain/risk_decision.hpp"
#include "warden/domain/safety_state.hpp"
#include "warden/domain/signal_intent.hpp"
#include "warden/domain/symbol_rules.hpp"
#include "warden/risk/cooldown_tracker.hpp"
#include "warden/time/i_time_provider.hpp"

#include <optional>

namespace warden {

// -----------------------------------------------------------------------------
// MarketContext
// -----------------------------------------------------------------------------
// Market-side inputs gathered by the caller before evaluation. rules is
// empty when the venue does not list the symbol; current_price is empty
// when no fresh price could be obtained.
// -----------------------------------------------------------------------------
struct MarketContext {
  std::optional<double> current_price;
  std::optional<domain::SymbolRules> rules;
  int open_positions{0};
};

// -----------------------------------------------------------------------------
// RiskEngine
// -----------------------------------------------------------------------------
//
// @brief  Turns an EntrySignal into a sized OrderPlan, a Rejection carrying
//         a stable reason code, or a PendingConfirmation.
//
// @details
// Checks run in a fixed order and the first failure wins:
//
//    1. SAFETY_GATE             no new entries outside NORMAL
//    2. STALE_SIGNAL            received_at older than max_signal_age_seconds
//    3. SYMBOL_BLACKLISTED, SYMBOL_NOT_ALLOWED, SYMBOL_NOT_TRADABLE,
//       INSUFFICIENT_LIQUIDITY, SIDE_NOT_ALLOWED
//    4. LOW_SIGNAL_QUALITY; low confidence with confirmation required
//       returns PendingConfirmation
//    5. SYMBOL_COOLDOWN, STOPLOSS_COOLDOWN
//    6. LEVERAGE_OVER_CAP       REJECT policy only; CAP clamps
//    7. MISSING_STOP_LOSS       no usable stop and none derivable
//    8. INVALID_PRICE, ENTRY_SLIPPAGE
//    9. MAX_OPEN_POSITIONS
//   10. INVALID_STOP, BELOW_MIN_QTY
//
// Sizing:
//   qty = account_risk_per_trade * equity / |entry - stop|
//   qty = min(qty, max_notional_per_trade / entry)
//   qty = floor(qty / qty_step) * qty_step
// A result below min_qty is rejected, never rounded up. Limit and stop
// prices are floored to price_step.
//
// A signal stop on the wrong side of the entry is treated as absent and
// replaced by default_stop_loss_pct when configured.
//
// Thread model:
//   Called from the signal loop only. Holds no mutable state of its own
//   apart from the id generator (atomic) and reads CooldownTracker, which
//   is internally locked.
//
// Ownership:
//   PolicyConfig is copied. CooldownTracker, IdGenerator and the clock are
//   referenced and owned by WardenEngine.
// -----------------------------------------------------------------------------
class RiskEngine {
 public:
  RiskEngine(const domain::PolicyConfig& policy,
             const CooldownTracker& cooldowns, IdGenerator& ids,
             const ITimeProvider& clock);

  RiskEngine(const RiskEngine&) = delete;
  RiskEngine& operator=(const RiskEngine&) = delete;
  RiskEngine(RiskEngine&&) = delete;
  RiskEngine& operator=(RiskEngine&&) = delete;

  domain::RiskDecision evaluate(const domain::SignalEnvelope& envelope,
                                const domain::EntrySignal& signal,
                                const domain::AccountSnapshot& account,
                                const domain::SafetyState& safety,
                                const MarketContext& market);

  // Shape check for follow-up instructions. Manage actions only reduce
  // risk, so they pass in every safety mode.
  std::optional<domain::Rejection> validateManage(
      const domain::ManageAction& action) const;

  const domain::PolicyConfig& policy() const { return policy_; }

 private:
  // Entry reference price for sizing: the configured point of the limit
  // range, or the current price for market entries.
  std::optional<double> entryReference(const domain::EntrySignal& signal,
                                       const MarketContext& market) const;

  // Signal stop when it sits on the losing side of entry, else the
  // default_stop_loss_pct derivation, else nothing.
  std::optional<double> resolveStop(const domain::EntrySignal& signal,
                                    double entry) const;

  std::vector<domain::TakeProfitLevel> buildTakeProfits(
      const domain::EntrySignal& signal, double entry, double quantity,
      const domain::SymbolRules& rules) const;

  domain::RiskDecision reject(const domain::EntrySignal& signal,
                              domain::RejectReason reason,
                              const std::string& detail) const;

  const domain::PolicyConfig policy_;
  const CooldownTracker& cooldowns_;
  IdGenerator& ids_;
  const ITimeProvider& clock_;
};

}  // namespace warden
