#pragma once

#include "warden/domain/order.hpp"
#include "warden/domain/trade_side.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace warden {
namespace domain {

// -----------------------------------------------------------------------------
// StopLossMode
// -----------------------------------------------------------------------------
// Trigger: native exchange-side conditional order.
// LocalGuard: engine-side watch against the price feed. Weaker, because it
// depends on feed freshness and on the process being alive; every use of it
// is recorded as a degradation.
// -----------------------------------------------------------------------------
enum class StopLossMode {
  Trigger,
  LocalGuard,
};

struct TakeProfitLevel {
  double price{0.0};
  double quantity{0.0};
};

// -----------------------------------------------------------------------------
// OrderPlan
// -----------------------------------------------------------------------------
//
// @brief  Risk-approved, sized, exchange-ready specification derived from an
//         accepted EntrySignal.
//
// @details
// Produced only by RiskEngine::evaluate(). Ownership passes to the
// OrderLifecycleManager; after that only the filled size tracked on the
// Position changes, the plan itself is not edited.
//
// stop_mode is the configured preference. The lifecycle manager resolves
// the effective mode against the capability cache at placement time, so a
// plan built as Trigger may still end up protected by a local guard.
// -----------------------------------------------------------------------------
struct OrderPlan {
  std::string plan_id;
  std::string signal_id;
  std::string symbol;
  PositionSide side{PositionSide::Long};

  double quantity{0.0};
  int leverage{1};
  double entry_price{0.0};
  double stop_price{0.0};
  StopLossMode stop_mode{StopLossMode::Trigger};

  OrderSpec entry;
  std::vector<TakeProfitLevel> take_profits;

  double notional{0.0};
  double risk_amount{0.0};
  std::int64_t created_at_ms{0};
};

const char* toString(StopLossMode mode);

}  // namespace domain
}  // namespace warden
