#pragma once

#include "warden/domain/order_plan.hpp"
#include "warden/domain/trade_side.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace warden {
namespace domain {

// -----------------------------------------------------------------------------
// PositionState: per-position lifecycle
// -----------------------------------------------------------------------------
//
//   PendingEntry ──> PartiallyFilled ──> FilledProtected ──> Managing
//        │                  │                    │               │
//        │                  └──────────┬─────────┴───────────────┘
//        │                             ▼
//        │                          Closing ──> Closed
//        └──> Rejected
//
// PendingManual and PendingConfirmation are waiting states for plans that
// never reached the exchange (dry-run, operator confirmation required).
// Rejected, Closed are terminal.
// -----------------------------------------------------------------------------
enum class PositionState {
  PendingEntry,
  PartiallyFilled,
  FilledProtected,
  Managing,
  Closing,
  Closed,
  Rejected,
  PendingManual,
  PendingConfirmation,
};

// -----------------------------------------------------------------------------
// LocalGuard
// -----------------------------------------------------------------------------
// Synthetic stop watched by the engine against the price feed. A guard is
// "armed" when it counts as protection for the invariant check; it is
// disarmed once its close has been issued.
// -----------------------------------------------------------------------------
struct LocalGuard {
  double trigger_price{0.0};
  bool armed{false};
};

// -----------------------------------------------------------------------------
// Position: locally tracked position with its protection references
// -----------------------------------------------------------------------------
//
// @brief  Local intent-state for one symbol, owned by PositionBook and
//         mutated only under that symbol's lock.
//
// @details
// size is the quantity actually filled. intended_size is what the plan asked
// for; the two diverge during partial fills and the stop-loss always tracks
// size, never intended_size.
//
// Protection invariant: when size > 0 and the state is not terminal, either
// stop_order_id is set or guard.armed is true, except while
// protection_pending is raised (bounded cancel-then-replace window) or the
// reconciler has just detected a gap (unprotected_since_ms set).
//
// hold_side mirrors side for hedge accounts and drives the close
// instruction there; one-way accounts ignore it.
// -----------------------------------------------------------------------------
struct Position {
  std::string symbol;
  PositionSide side{PositionSide::Long};
  PositionSide hold_side{PositionSide::Long};
  PositionState state{PositionState::PendingEntry};

  double size{0.0};           // Filled quantity
  double intended_size{0.0};  // Quantity from the OrderPlan
  double average_entry{0.0};
  int leverage{1};

  std::string plan_id;
  std::string signal_id;
  std::string entry_order_id;

  // Protection
  StopLossMode stop_mode{StopLossMode::Trigger};
  double stop_price{0.0};
  std::string stop_order_id;
  double stop_order_size{0.0};   // Quantity the live stop order covers
  double stop_order_price{0.0};  // Trigger price of the live stop order
  LocalGuard guard;
  bool protection_pending{false};
  std::optional<std::int64_t> unprotected_since_ms;
  bool break_even_done{false};

  std::vector<TakeProfitLevel> take_profits;
  std::vector<std::string> take_profit_order_ids;
  bool take_profits_placed{false};

  std::int64_t opened_at_ms{0};
  std::int64_t updated_at_ms{0};
};

// -----------------------------------------------------------------------------
// ExchangePosition: exchange-reported truth for one symbol
// -----------------------------------------------------------------------------
struct ExchangePosition {
  std::string symbol;
  PositionSide side{PositionSide::Long};
  double size{0.0};
  double entry_price{0.0};
  double mark_price{0.0};
  double liquidation_price{0.0};  // 0 when the venue does not report one
  double unrealized_pnl{0.0};
};

const char* toString(PositionState state);

bool isTerminal(PositionState state);

// True when size is open and the position counts as exposure.
bool isOpen(const Position& position);

// True when the position carries a live stop order or an armed guard.
bool hasProtection(const Position& position);

}  // namespace domain
}  // namespace warden
