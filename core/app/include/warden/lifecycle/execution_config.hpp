#pragma once

#include "warden/domain/account.hpp"
#include "warden/domain/order_plan.hpp"

namespace warden {

// -----------------------------------------------------------------------------
// ExecutionConfig: knobs for placement, protection and manage actions
// -----------------------------------------------------------------------------
// Loaded from the "execution" section. Percent fields are stored as ratios.
// -----------------------------------------------------------------------------
struct ExecutionConfig {
  domain::AccountMode account_mode{domain::AccountMode::OneWay};
  domain::StopLossMode stop_loss_mode{domain::StopLossMode::Trigger};
  bool dry_run{false};

  // Break-even move: requires this much open profit, then places the stop
  // at entry ± buffer.
  double break_even_trigger_pct{0.005};
  double break_even_buffer_pct{0.0005};
  int max_protection_retries{3};

  bool place_take_profits{true};

  // Relative trigger-price difference below which an existing stop is
  // considered to already sit at the desired level.
  double stop_price_tolerance{0.0001};

  // Stop distance used when an orphan is adopted and no stop is known.
  double orphan_stop_loss_pct{0.01};
};

}  // namespace warden
