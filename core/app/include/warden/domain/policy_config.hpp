#pragma once

#include "warden/domain/order_plan.hpp"
#include "warden/domain/trade_side.hpp"

#include <optional>
#include <set>
#include <string>

namespace warden {
namespace domain {

enum class SymbolPolicy {
  Allowlist,
  AllowAll,
};

enum class LeveragePolicy {
  Cap,     // Clamp to max_leverage
  Reject,  // Refuse the signal outright
};

// Which reference point of the entry range sizes the position.
enum class EntryPriceSource {
  Mid,
  Low,
  High,
};

// -----------------------------------------------------------------------------
// PolicyConfig: risk and symbol policy consumed by RiskEngine
// -----------------------------------------------------------------------------
//
// @brief  Immutable collection of thresholds that decide whether a signal may
//         become a position and how large it may be.
//
// @details
// Loaded from the "risk" and "filters" sections of the JSON config by
// loadConfig() and copied by value into RiskEngine at construction.
//
// Ratios vs percents:
//   account_risk_per_trade, max_entry_slippage_pct, default_stop_loss_pct
//   and max_account_drawdown_pct are stored as ratios (0.01 == 1 %). The
//   loader accepts either notation, see ratioFromPercentOrRatio().
//
// Sizing:
//   qty = account_risk_per_trade * equity / |entry - stop|
//   then capped by max_notional_per_trade / entry and floored to qty_step.
//
// Thread model:
//   Plain value type. Copied into components; no shared mutable state.
// -----------------------------------------------------------------------------
struct PolicyConfig {
  // --- Sizing ---------------------------------------------------------------
  double account_risk_per_trade{0.005};
  double max_notional_per_trade{200.0};
  EntryPriceSource entry_price_source{EntryPriceSource::Mid};

  // --- Stop-loss ------------------------------------------------------------
  bool hard_stop_loss_required{true};
  std::optional<double> default_stop_loss_pct{0.01};
  StopLossMode stop_loss_mode{StopLossMode::Trigger};

  // --- Leverage -------------------------------------------------------------
  int max_leverage{10};
  int default_leverage{1};
  LeveragePolicy leverage_policy{LeveragePolicy::Cap};

  // --- Signal freshness and quality ------------------------------------------
  double max_signal_age_seconds{20.0};
  double min_signal_quality{0.0};
  double confidence_threshold{0.75};
  bool require_confirmation_below_threshold{false};

  // --- Entry ----------------------------------------------------------------
  double max_entry_slippage_pct{0.003};

  // --- Exposure -------------------------------------------------------------
  int max_open_positions{3};
  double cooldown_seconds{300.0};
  int stoploss_streak_limit{3};
  double stoploss_cooldown_seconds{3600.0};

  // --- Symbol policy --------------------------------------------------------
  SymbolPolicy symbol_policy{SymbolPolicy::Allowlist};
  std::set<std::string> symbol_allowlist;
  std::set<std::string> symbol_blacklist;
  bool require_exchange_symbol{true};
  std::optional<double> min_24h_volume;
  std::set<PositionSide> allowed_sides{PositionSide::Long, PositionSide::Short};
};

}  // namespace domain
}  // namespace warden
