#include "warden/lifecycle/stop_loss_manager.hpp"

#include "warden/exchange/exchange_error.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

namespace warden {

namespace {

constexpr double kQtyEpsilon = 1e-9;

const char* idPrefix(domain::OrderKind kind) {
  switch (kind) {
    case domain::OrderKind::Entry:      return "entry";
    case domain::OrderKind::StopLoss:   return "sl";
    case domain::OrderKind::TakeProfit: return "tp";
    case domain::OrderKind::Close:      return "close";
  }
  return "order";
}

}  // namespace

StopLossManager::StopLossManager(RateLimitedExecutor& executor,
                                 CapabilityCache& capabilities,
                                 OrderTracker& tracker, Ledger& ledger,
                                 INotificationSink& sink, IdGenerator& ids,
                                 const ITimeProvider& clock,
                                 const ExecutionConfig& config)
    : executor_(executor),
      capabilities_(capabilities),
      tracker_(tracker),
      ledger_(ledger),
      sink_(sink),
      ids_(ids),
      clock_(clock),
      config_(config) {}

// -----------------------------------------------------------------------------
// Mode selection
// -----------------------------------------------------------------------------
domain::StopLossMode StopLossManager::resolveMode(const std::string& symbol) {
  using domain::CapabilityValue;
  using domain::StopLossMode;

  if (config_.stop_loss_mode == StopLossMode::LocalGuard ||
      session_fallback_.load()) {
    return StopLossMode::LocalGuard;
  }

  const auto record = capabilities_.resolve(domain::kCapabilityPlanOrders);
  switch (record.value) {
    case CapabilityValue::Supported: {
      std::lock_guard lock(notified_mutex_);
      unknown_notified_.erase(symbol);
      return StopLossMode::Trigger;
    }
    case CapabilityValue::Unsupported:
      if (!session_fallback_.exchange(true)) {
        emitFallback(symbol, "PLAN_ORDER_FALLBACK",
                     "plan orders unsupported (" + record.reason +
                         "); local guard for the rest of the session");
      }
      return StopLossMode::LocalGuard;
    case CapabilityValue::Unknown: {
      bool first = false;
      {
        std::lock_guard lock(notified_mutex_);
        first = unknown_notified_.insert(symbol).second;
      }
      if (first) {
        emitFallback(symbol, "PLAN_ORDER_FALLBACK",
                     "plan order capability unknown (" + record.reason +
                         "); local guard until re-probe");
      }
      return StopLossMode::LocalGuard;
    }
  }
  return StopLossMode::LocalGuard;
}

// -----------------------------------------------------------------------------
// ensureStopLoss
// -----------------------------------------------------------------------------
ProtectionResult StopLossManager::ensureStopLoss(domain::Position& position,
                                                 const std::string& source) {
  if (position.size <= kQtyEpsilon) {
    removeStopLoss(position, "flat");
    return {true, position.stop_mode, "flat"};
  }
  if (position.stop_price <= 0.0) {
    std::cerr << "[StopLossManager] " << position.symbol
              << " has no valid stop price\n";
    return {false, position.stop_mode, "invalid_trigger_price"};
  }

  const domain::StopLossMode mode = resolveMode(position.symbol);

  if (stopMatches(position)) {
    position.guard.armed = false;
    position.protection_pending = false;
    position.unprotected_since_ms.reset();
    position.stop_mode = domain::StopLossMode::Trigger;
    return {true, domain::StopLossMode::Trigger, "already_covered"};
  }

  if (!position.stop_order_id.empty()) {
    position.protection_pending = true;
    if (!cancelOrder(position.symbol, position.stop_order_id, source)) {
      // The old order is still live and still protects part of the size.
      position.protection_pending = false;
      return {false, mode, "cancel_failed"};
    }
    tracker_.markCanceled(position.stop_order_id);
    position.stop_order_id.clear();
    position.stop_order_size = 0.0;
    position.stop_order_price = 0.0;
  }

  if (mode == domain::StopLossMode::LocalGuard) {
    return armGuard(position, source, "local_guard");
  }
  return placeTrigger(position, source);
}

bool StopLossManager::removeStopLoss(domain::Position& position,
                                     const std::string& reason) {
  position.guard.armed = false;
  position.protection_pending = false;

  if (!position.stop_order_id.empty()) {
    if (!cancelOrder(position.symbol, position.stop_order_id, reason)) {
      return false;
    }
    tracker_.markCanceled(position.stop_order_id);
    position.stop_order_id.clear();
    position.stop_order_size = 0.0;
    position.stop_order_price = 0.0;
  }
  recordProtection(position, reason);
  return true;
}

domain::OrderSpec StopLossManager::makeCloseInstruction(
    const domain::Position& position, domain::OrderKind kind,
    domain::OrderType type, double quantity) {
  domain::OrderSpec spec;
  spec.client_order_id = ids_.next(idPrefix(kind));
  spec.symbol = position.symbol;
  spec.side = domain::closeSide(position.side);
  spec.kind = kind;
  spec.type = type;
  spec.quantity = quantity;
  spec.leverage = position.leverage;

  if (config_.account_mode == domain::AccountMode::Hedge) {
    spec.close_side = true;
    spec.hold_side = position.hold_side;
  } else {
    spec.reduce_only = true;
  }
  return spec;
}

bool StopLossManager::guardCrossed(const domain::Position& position,
                                   double price) {
  if (!position.guard.armed || price <= 0.0) {
    return false;
  }
  if (position.side == domain::PositionSide::Long) {
    return price <= position.guard.trigger_price;
  }
  return price >= position.guard.trigger_price;
}

// -----------------------------------------------------------------------------
// Internals
// -----------------------------------------------------------------------------
bool StopLossManager::stopMatches(const domain::Position& position) const {
  if (position.stop_order_id.empty()) {
    return false;
  }
  if (std::abs(position.stop_order_size - position.size) > kQtyEpsilon) {
    return false;
  }
  const double tolerance =
      std::max(std::abs(position.stop_price), 1.0) * config_.stop_price_tolerance;
  return std::abs(position.stop_order_price - position.stop_price) <= tolerance;
}

bool StopLossManager::cancelOrder(const std::string& symbol,
                                  const std::string& order_id,
                                  const std::string& reason) {
  try {
    executor_.cancelOrder(symbol, order_id);
    std::cout << "[StopLossManager] " << symbol << " canceled stop "
              << order_id << " (" << reason << ")\n";
    return true;
  } catch (const PermanentExchangeError& e) {
    if (e.code() == 404) {
      std::cout << "[StopLossManager] " << symbol << " stop " << order_id
                << " already gone\n";
      return true;
    }
    std::cerr << "[StopLossManager] " << symbol << " cancel " << order_id
              << " rejected: " << e.what() << "\n";
  } catch (const RetriesExhaustedError& e) {
    std::cerr << "[StopLossManager] " << symbol << " cancel " << order_id
              << " failed: " << e.what() << "\n";
  }
  return false;
}

ProtectionResult StopLossManager::placeTrigger(domain::Position& position,
                                               const std::string& source) {
  domain::OrderSpec spec =
      makeCloseInstruction(position, domain::OrderKind::StopLoss,
                           domain::OrderType::Trigger, position.size);
  spec.trigger_price = position.stop_price;

  ledger_.append(LedgerKind::OrderAttempt, spec.client_order_id,
                 {{"symbol", position.symbol},
                  {"kind", domain::toString(spec.kind)},
                  {"quantity", spec.quantity},
                  {"trigger_price", spec.trigger_price},
                  {"source", source}});

  try {
    domain::Order order = executor_.placeOrder(spec);
    tracker_.track(order);

    position.stop_order_id = order.order_id;
    position.stop_order_size = spec.quantity;
    position.stop_order_price = spec.trigger_price;
    position.stop_mode = domain::StopLossMode::Trigger;
    position.guard.armed = false;
    position.protection_pending = false;
    position.unprotected_since_ms.reset();

    ledger_.append(LedgerKind::OrderResult, spec.client_order_id,
                   {{"symbol", position.symbol},
                    {"status", "accepted"},
                    {"order_id", order.order_id}});
    recordProtection(position, source);

    std::cout << "[StopLossManager] " << position.symbol << " stop "
              << order.order_id << " qty=" << spec.quantity
              << " trigger=" << spec.trigger_price << " (" << source << ")\n";
    return {true, domain::StopLossMode::Trigger, "placed"};
  } catch (const ExchangeError& e) {
    ledger_.append(LedgerKind::OrderResult, spec.client_order_id,
                   {{"symbol", position.symbol},
                    {"status", "failed"},
                    {"error", e.what()}});
    std::cerr << "[StopLossManager] " << position.symbol
              << " trigger placement failed: " << e.what() << "\n";

    ProtectionResult result =
        armGuard(position, source, "trigger_place_failed");
    emitFallback(position.symbol, "STOP_PLACE_FAILED",
                 std::string("trigger stop failed, local guard armed: ") +
                     e.what());
    result.ok = false;
    return result;
  }
}

ProtectionResult StopLossManager::armGuard(domain::Position& position,
                                           const std::string& source,
                                           const std::string& reason) {
  position.guard.trigger_price = position.stop_price;
  position.guard.armed = true;
  position.stop_mode = domain::StopLossMode::LocalGuard;
  position.protection_pending = false;
  position.unprotected_since_ms.reset();

  recordProtection(position, source);
  std::cout << "[StopLossManager] " << position.symbol
            << " local guard armed at " << position.guard.trigger_price
            << " (" << reason << ")\n";
  return {true, domain::StopLossMode::LocalGuard, reason};
}

void StopLossManager::recordProtection(const domain::Position& position,
                                       const std::string& source) {
  ledger_.append(LedgerKind::Protection, position.symbol,
                 {{"active", domain::hasProtection(position)},
                  {"mode", domain::toString(position.stop_mode)},
                  {"order_id", position.stop_order_id},
                  {"stop_price", position.stop_price},
                  {"size", position.size},
                  {"plan_id", position.plan_id},
                  {"source", source}});
}

void StopLossManager::emitFallback(const std::string& symbol,
                                   const std::string& code,
                                   const std::string& message) {
  std::cerr << "[StopLossManager] FALLBACK " << symbol << " " << code << ": "
            << message << "\n";
  ledger_.append(LedgerKind::Fallback, symbol,
                 {{"code", code}, {"message", message}});

  NotificationEvent event;
  event.kind = NotificationKind::Fallback;
  event.symbol = symbol;
  event.code = code;
  event.message = message;
  event.timestamp_ms = clock_.now_ms();
  sink_.notify(std::move(event));
}

}  // namespace warden
