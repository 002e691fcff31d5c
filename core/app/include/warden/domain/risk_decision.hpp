#pragma once

#include "warden/domain/order_plan.hpp"

#include <string>
#include <variant>

namespace warden {
namespace domain {

// -----------------------------------------------------------------------------
// RejectReason
// -----------------------------------------------------------------------------
//
// @brief  Stable, machine-parseable cause of a policy rejection.
//
// @details
// The string returned by toString() is part of the external contract: it is
// written to the ledger, published as telemetry and asserted on by tests.
// Renaming an enumerator is fine; changing its string is a breaking change.
// -----------------------------------------------------------------------------
enum class RejectReason {
  SafetyGate,
  StaleSignal,
  SymbolBlacklisted,
  SymbolNotAllowed,
  SymbolNotTradable,
  InsufficientLiquidity,
  SideNotAllowed,
  LowSignalQuality,
  SymbolCooldown,
  StopLossCooldown,
  LeverageOverCap,
  MissingStopLoss,
  InvalidPrice,
  EntrySlippage,
  MaxOpenPositions,
  InvalidStop,
  BelowMinQty,
  DuplicateSignal,
  PositionAlreadyOpen,
  InvalidAction,
  NoOpenPosition,
  AccountUnavailable,
};

const char* toString(RejectReason reason);

struct Rejection {
  RejectReason reason{RejectReason::SafetyGate};
  std::string detail;
};

// Low-confidence extraction that policy says must be confirmed by a human.
// Notify-only: neither a rejection nor an execution.
struct PendingConfirmation {
  std::string signal_id;
  std::string symbol;
  double confidence{0.0};
  double threshold{0.0};
};

using RiskDecision = std::variant<OrderPlan, Rejection, PendingConfirmation>;

}  // namespace domain
}  // namespace warden
