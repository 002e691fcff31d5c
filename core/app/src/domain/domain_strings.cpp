#include "warden/domain/capability.hpp"
#include "warden/domain/order.hpp"
#include "warden/domain/order_plan.hpp"
#include "warden/domain/position.hpp"
#include "warden/domain/risk_decision.hpp"
#include "warden/domain/safety_state.hpp"
#include "warden/domain/signal_intent.hpp"

#include <algorithm>
#include <cctype>

namespace warden {
namespace domain {

std::optional<PositionSide> parsePositionSide(const std::string& text) {
  std::string upper = text;
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  if (upper == "LONG" || upper == "BUY") {
    return PositionSide::Long;
  }
  if (upper == "SHORT" || upper == "SELL") {
    return PositionSide::Short;
  }
  return std::nullopt;
}

const char* toString(ManageActionKind kind) {
  switch (kind) {
    case ManageActionKind::MoveStopToBreakEven: return "MOVE_SL_TO_BE";
    case ManageActionKind::Reduce:              return "REDUCE";
    case ManageActionKind::Close:               return "CLOSE";
    case ManageActionKind::SetTakeProfit:       return "SET_TP";
  }
  return "UNKNOWN";
}

const char* intentKindName(const SignalIntent& intent) {
  if (std::holds_alternative<EntrySignal>(intent)) {
    return "ENTRY_SIGNAL";
  }
  if (std::holds_alternative<ManageAction>(intent)) {
    return "MANAGE_ACTION";
  }
  return "NON_SIGNAL";
}

const char* toString(OrderStatus status) {
  using S = OrderStatus;
  switch (status) {
    case S::New:             return "New";
    case S::Submitted:       return "Submitted";
    case S::Accepted:        return "Accepted";
    case S::PartiallyFilled: return "PartiallyFilled";
    case S::Filled:          return "Filled";
    case S::Canceled:        return "Canceled";
    case S::Rejected:        return "Rejected";
    case S::Failed:          return "Failed";
  }
  return "Unknown";
}

const char* toString(OrderKind kind) {
  switch (kind) {
    case OrderKind::Entry:      return "ENTRY";
    case OrderKind::StopLoss:   return "STOP_LOSS";
    case OrderKind::TakeProfit: return "TAKE_PROFIT";
    case OrderKind::Close:      return "CLOSE";
  }
  return "UNKNOWN";
}

const char* toString(OrderType type) {
  switch (type) {
    case OrderType::Market:  return "MARKET";
    case OrderType::Limit:   return "LIMIT";
    case OrderType::Trigger: return "TRIGGER";
  }
  return "UNKNOWN";
}

const char* toString(StopLossMode mode) {
  switch (mode) {
    case StopLossMode::Trigger:    return "trigger";
    case StopLossMode::LocalGuard: return "local_guard";
  }
  return "unknown";
}

const char* toString(PositionState state) {
  using S = PositionState;
  switch (state) {
    case S::PendingEntry:        return "PENDING_ENTRY";
    case S::PartiallyFilled:     return "PARTIALLY_FILLED";
    case S::FilledProtected:     return "FILLED_PROTECTED";
    case S::Managing:            return "MANAGING";
    case S::Closing:             return "CLOSING";
    case S::Closed:              return "CLOSED";
    case S::Rejected:            return "REJECTED";
    case S::PendingManual:       return "PENDING_MANUAL";
    case S::PendingConfirmation: return "PENDING_CONFIRMATION";
  }
  return "UNKNOWN";
}

bool isTerminal(PositionState state) {
  return state == PositionState::Closed || state == PositionState::Rejected;
}

bool isOpen(const Position& position) {
  return position.size > 0.0 && !isTerminal(position.state);
}

bool hasProtection(const Position& position) {
  return !position.stop_order_id.empty() || position.guard.armed;
}

const char* toString(CapabilityValue value) {
  switch (value) {
    case CapabilityValue::Supported:   return "supported";
    case CapabilityValue::Unsupported: return "unsupported";
    case CapabilityValue::Unknown:     return "unknown";
  }
  return "unknown";
}

const char* toString(SafetyMode mode) {
  switch (mode) {
    case SafetyMode::Normal:     return "NORMAL";
    case SafetyMode::SafeMode:   return "SAFE_MODE";
    case SafetyMode::PanicClose: return "PANIC_CLOSE";
  }
  return "UNKNOWN";
}

const char* toString(RejectReason reason) {
  using R = RejectReason;
  switch (reason) {
    case R::SafetyGate:            return "SAFETY_GATE";
    case R::StaleSignal:           return "STALE_SIGNAL";
    case R::SymbolBlacklisted:     return "SYMBOL_BLACKLISTED";
    case R::SymbolNotAllowed:      return "SYMBOL_NOT_ALLOWED";
    case R::SymbolNotTradable:     return "SYMBOL_NOT_TRADABLE";
    case R::InsufficientLiquidity: return "INSUFFICIENT_LIQUIDITY";
    case R::SideNotAllowed:        return "SIDE_NOT_ALLOWED";
    case R::LowSignalQuality:      return "LOW_SIGNAL_QUALITY";
    case R::SymbolCooldown:        return "SYMBOL_COOLDOWN";
    case R::StopLossCooldown:      return "STOPLOSS_COOLDOWN";
    case R::LeverageOverCap:       return "LEVERAGE_OVER_CAP";
    case R::MissingStopLoss:       return "MISSING_STOP_LOSS";
    case R::InvalidPrice:          return "INVALID_PRICE";
    case R::EntrySlippage:         return "ENTRY_SLIPPAGE";
    case R::MaxOpenPositions:      return "MAX_OPEN_POSITIONS";
    case R::InvalidStop:           return "INVALID_STOP";
    case R::BelowMinQty:           return "BELOW_MIN_QTY";
    case R::DuplicateSignal:       return "DUPLICATE_SIGNAL";
    case R::PositionAlreadyOpen:   return "POSITION_ALREADY_OPEN";
    case R::InvalidAction:         return "INVALID_ACTION";
    case R::NoOpenPosition:        return "NO_OPEN_POSITION";
    case R::AccountUnavailable:    return "ACCOUNT_UNAVAILABLE";
  }
  return "UNKNOWN";
}

}  // namespace domain
}  // namespace warden
