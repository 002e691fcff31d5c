#include "warden/lifecycle/order_lifecycle_manager.hpp"

#include "warden/exchange/exchange_error.hpp"
#include "warden/risk/sizing.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <set>

namespace warden {

namespace {

constexpr double kQtyEpsilon = 1e-9;

domain::Position positionFromPlan(const domain::OrderPlan& plan,
                                  std::int64_t now_ms) {
  domain::Position pos;
  pos.symbol = plan.symbol;
  pos.side = plan.side;
  pos.hold_side = plan.side;
  pos.state = domain::PositionState::PendingEntry;
  pos.intended_size = plan.quantity;
  pos.average_entry = plan.entry_price;
  pos.leverage = plan.leverage;
  pos.plan_id = plan.plan_id;
  pos.signal_id = plan.signal_id;
  pos.stop_mode = plan.stop_mode;
  pos.stop_price = plan.stop_price;
  pos.take_profits = plan.take_profits;
  pos.opened_at_ms = now_ms;
  return pos;
}

bool stopLossReason(const std::string& reason) {
  return reason == "LOCAL_GUARD_TRIGGERED" || reason == "STOP_LOSS_FILLED";
}

}  // namespace

OrderLifecycleManager::OrderLifecycleManager(
    RateLimitedExecutor& executor, PositionBook& book, OrderTracker& tracker,
    StopLossManager& stops, SymbolLockTable& locks, SymbolRegistry& symbols,
    const PriceBook& prices, CooldownTracker& cooldowns, Ledger& ledger,
    INotificationSink& sink, const ITimeProvider& clock,
    const ExecutionConfig& config)
    : executor_(executor),
      book_(book),
      tracker_(tracker),
      stops_(stops),
      locks_(locks),
      symbols_(symbols),
      prices_(prices),
      cooldowns_(cooldowns),
      ledger_(ledger),
      sink_(sink),
      clock_(clock),
      config_(config) {}

void OrderLifecycleManager::setEscalationHandler(EscalationHandler handler) {
  std::lock_guard lock(escalation_mutex_);
  escalation_ = std::move(handler);
}

// -----------------------------------------------------------------------------
// submitPlan
// -----------------------------------------------------------------------------
LifecycleResult OrderLifecycleManager::submitPlan(
    const domain::OrderPlan& plan) {
  auto lock = locks_.lock(plan.symbol);

  if (auto existing = book_.openFor(plan.symbol)) {
    std::cerr << "[OrderLifecycleManager] " << plan.symbol
              << " already has live position " << existing->plan_id << "\n";
    return {false, "POSITION_ALREADY_OPEN", existing->plan_id, existing};
  }

  const auto now = clock_.now_ms();
  domain::Position pos = positionFromPlan(plan, now);

  if (config_.dry_run) {
    pos.state = domain::PositionState::PendingManual;
    book_.upsert(pos);
    ledger_.append(LedgerKind::OrderAttempt, plan.entry.client_order_id,
                   {{"symbol", plan.symbol},
                    {"plan_id", plan.plan_id},
                    {"quantity", plan.quantity},
                    {"dry_run", true}});
    notify(NotificationKind::NotifyOnly, plan.symbol, "DRY_RUN",
           "plan " + plan.plan_id + " recorded, not placed");
    return {true, "DRY_RUN", plan.plan_id, pos};
  }

  // Leverage first: an entry at the wrong leverage is a different risk.
  try {
    std::optional<domain::PositionSide> hold;
    if (config_.account_mode == domain::AccountMode::Hedge) {
      hold = plan.side;
    }
    executor_.setLeverage(plan.symbol, plan.leverage, hold);
  } catch (const ExchangeError& e) {
    pos.state = domain::PositionState::Rejected;
    book_.upsert(pos);
    ledger_.append(LedgerKind::OrderResult, plan.entry.client_order_id,
                   {{"symbol", plan.symbol},
                    {"status", "failed"},
                    {"stage", "set_leverage"},
                    {"error", e.what()}});
    notify(NotificationKind::Rejection, plan.symbol, "LEVERAGE_FAILED",
           e.what());
    return {false, "LEVERAGE_FAILED", e.what(), pos};
  }

  ledger_.append(LedgerKind::OrderAttempt, plan.entry.client_order_id,
                 {{"symbol", plan.symbol},
                  {"plan_id", plan.plan_id},
                  {"kind", domain::toString(plan.entry.kind)},
                  {"type", domain::toString(plan.entry.type)},
                  {"side", domain::toString(plan.entry.side)},
                  {"quantity", plan.entry.quantity},
                  {"price", plan.entry.price}});
  book_.upsert(pos);

  domain::Order order;
  try {
    order = executor_.placeOrder(plan.entry);
  } catch (const PermanentExchangeError& e) {
    pos.state = domain::PositionState::Rejected;
    book_.upsert(pos);
    ledger_.append(LedgerKind::OrderResult, plan.entry.client_order_id,
                   {{"symbol", plan.symbol},
                    {"status", "rejected"},
                    {"error", e.what()}});
    notify(NotificationKind::Rejection, plan.symbol, "ENTRY_REJECTED",
           e.what());
    return {false, "ENTRY_REJECTED", e.what(), pos};
  } catch (const RetriesExhaustedError& e) {
    // The entry may have landed anyway; reconciliation will see it as an
    // orphan if it did.
    pos.state = domain::PositionState::Rejected;
    book_.upsert(pos);
    ledger_.append(LedgerKind::OrderResult, plan.entry.client_order_id,
                   {{"symbol", plan.symbol},
                    {"status", "unconfirmed"},
                    {"error", e.what()}});
    escalate("ENTRY_UNCONFIRMED", plan.symbol, e.what());
    return {false, "ENTRY_UNCONFIRMED", e.what(), pos};
  }

  tracker_.track(order);
  pos.entry_order_id = order.order_id;
  cooldowns_.recordEntry(plan.symbol, now);
  ledger_.append(LedgerKind::OrderResult, plan.entry.client_order_id,
                 {{"symbol", plan.symbol},
                  {"status", domain::toString(order.status)},
                  {"order_id", order.order_id},
                  {"filled", order.filled_quantity}});

  if (order.filled_quantity > kQtyEpsilon) {
    applyEntryFillLocked(pos, order.filled_quantity, order.average_price,
                         OrderTracker::isTerminal(order.status));
  }
  book_.upsert(pos);

  std::cout << "[OrderLifecycleManager] " << plan.symbol << " entry "
            << order.order_id << " " << domain::toString(order.status)
            << " filled=" << order.filled_quantity << "/" << plan.quantity
            << "\n";
  return {true, "PLACED", order.order_id, pos};
}

LifecycleResult OrderLifecycleManager::onEntryFill(const std::string& symbol,
                                                   double filled_quantity,
                                                   double average_price) {
  auto lock = locks_.lock(symbol);
  auto pos = book_.openFor(symbol);
  if (!pos) {
    return {false, "NO_OPEN_POSITION", symbol, std::nullopt};
  }
  const bool final_fill = filled_quantity + kQtyEpsilon >= pos->intended_size;
  applyEntryFillLocked(*pos, filled_quantity, average_price, final_fill);
  book_.upsert(*pos);
  return {true, "FILL_APPLIED", symbol, pos};
}

// -----------------------------------------------------------------------------
// Manage actions
// -----------------------------------------------------------------------------
LifecycleResult OrderLifecycleManager::applyManageAction(
    const domain::ManageAction& action) {
  using domain::ManageActionKind;
  switch (action.kind) {
    case ManageActionKind::MoveStopToBreakEven:
      return moveStopToBreakEven(action.symbol);
    case ManageActionKind::Reduce:
      return reducePosition(action.symbol, action.reduce_pct.value_or(0.0));
    case ManageActionKind::Close:
      return closePosition(action.symbol, "MANAGE_CLOSE");
    case ManageActionKind::SetTakeProfit:
      return setTakeProfits(action.symbol, action.take_profits);
  }
  return {false, "INVALID_ACTION", action.symbol, std::nullopt};
}

LifecycleResult OrderLifecycleManager::moveStopToBreakEven(
    const std::string& symbol) {
  auto lock = locks_.lock(symbol);
  auto found = book_.openFor(symbol);
  if (!found || found->size <= kQtyEpsilon) {
    return {false, "NO_OPEN_POSITION", symbol, found};
  }
  domain::Position pos = *found;
  if (pos.break_even_done) {
    return {true, "ALREADY_AT_BREAK_EVEN", symbol, pos};
  }

  auto tick = prices_.latest(symbol);
  if (!tick || pos.average_entry <= 0.0) {
    return {false, "NO_PRICE", symbol, pos};
  }
  const double entry = pos.average_entry;
  const bool is_long = pos.side == domain::PositionSide::Long;
  const double profit =
      is_long ? (tick->price - entry) / entry : (entry - tick->price) / entry;
  if (profit < config_.break_even_trigger_pct) {
    return {false, "BE_NOT_REACHED",
            "profit=" + std::to_string(profit), pos};
  }

  const double raw = is_long ? entry * (1.0 + config_.break_even_buffer_pct)
                             : entry * (1.0 - config_.break_even_buffer_pct);
  const double be_price =
      sizing::floorToStep(raw, symbols_.priceStep(symbol));

  // Phase 1: record the intent before touching the live stop.
  pos.protection_pending = true;
  pos.stop_price = be_price;
  book_.upsert(pos);
  ledger_.append(LedgerKind::Protection, symbol,
                 {{"active", domain::hasProtection(pos)},
                  {"pending", true},
                  {"target_stop", be_price},
                  {"plan_id", pos.plan_id},
                  {"source", "move_sl_to_be"}});

  // Phase 2: replace and verify.
  const int attempts = std::max(1, config_.max_protection_retries);
  for (int attempt = 1; attempt <= attempts; ++attempt) {
    ProtectionResult result = stops_.ensureStopLoss(pos, "move_sl_to_be");
    if (result.ok && verifyStopLive(pos)) {
      pos.protection_pending = false;
      pos.break_even_done = true;
      pos.state = domain::PositionState::Managing;
      book_.upsert(pos);
      std::cout << "[OrderLifecycleManager] " << symbol
                << " stop moved to break-even " << be_price << "\n";
      return {true, "MOVED_TO_BREAK_EVEN", std::to_string(be_price), pos};
    }
    std::cerr << "[OrderLifecycleManager] " << symbol
              << " break-even attempt " << attempt << "/" << attempts
              << " failed (" << result.reason << ")\n";
    if (result.ok && !pos.stop_order_id.empty()) {
      // Placed but not seen live: forget it so the next attempt re-places.
      pos.stop_order_id.clear();
      pos.stop_order_size = 0.0;
      pos.stop_order_price = 0.0;
    }
    pos.protection_pending = true;
    book_.upsert(pos);
  }

  escalate("PROTECTION_FAILURE", symbol,
           "break-even move failed after " + std::to_string(attempts) +
               " attempts");
  return {false, "PROTECTION_FAILURE", symbol, pos};
}

LifecycleResult OrderLifecycleManager::reducePosition(const std::string& symbol,
                                                      double reduce_pct) {
  if (reduce_pct <= 0.0 || reduce_pct > 100.0) {
    return {false, "INVALID_ACTION", "reduce_pct outside (0, 100]",
            std::nullopt};
  }
  auto lock = locks_.lock(symbol);
  auto found = book_.openFor(symbol);
  if (!found || found->size <= kQtyEpsilon) {
    return {false, "NO_OPEN_POSITION", symbol, found};
  }
  domain::Position pos = *found;

  if (reduce_pct >= 100.0) {
    return closeLocked(pos, "MANAGE_REDUCE_100");
  }

  const double qty = sizing::floorToStep(pos.size * reduce_pct / 100.0,
                                         symbols_.qtyStep(symbol));
  if (qty <= kQtyEpsilon) {
    return {false, "REDUCE_SIZE_ZERO", symbol, pos};
  }

  domain::OrderSpec spec = stops_.makeCloseInstruction(
      pos, domain::OrderKind::Close, domain::OrderType::Market, qty);
  ledger_.append(LedgerKind::OrderAttempt, spec.client_order_id,
                 {{"symbol", symbol},
                  {"kind", "REDUCE"},
                  {"quantity", qty},
                  {"reduce_pct", reduce_pct}});

  domain::Order order;
  try {
    order = executor_.placeOrder(spec);
  } catch (const ExchangeError& e) {
    ledger_.append(LedgerKind::OrderResult, spec.client_order_id,
                   {{"symbol", symbol}, {"status", "failed"},
                    {"error", e.what()}});
    notify(NotificationKind::Escalation, symbol, "REDUCE_FAILED", e.what());
    return {false, "REDUCE_FAILED", e.what(), pos};
  }
  tracker_.track(order);
  ledger_.append(LedgerKind::OrderResult, spec.client_order_id,
                 {{"symbol", symbol},
                  {"status", domain::toString(order.status)},
                  {"order_id", order.order_id},
                  {"filled", order.filled_quantity}});

  pos.size = std::max(0.0, pos.size - order.filled_quantity);
  if (pos.size <= kQtyEpsilon) {
    markClosedLocked(pos, "MANAGE_REDUCE");
    return {true, "CLOSED", symbol, pos};
  }

  ledger_.append(LedgerKind::Fill, symbol,
                 {{"plan_id", pos.plan_id},
                  {"reduced", order.filled_quantity},
                  {"remaining", pos.size}});
  stops_.ensureStopLoss(pos, "reduce");
  pos.state = domain::PositionState::Managing;
  book_.upsert(pos);
  return {true, "REDUCED", std::to_string(order.filled_quantity), pos};
}

LifecycleResult OrderLifecycleManager::closePosition(const std::string& symbol,
                                                     const std::string& reason) {
  auto lock = locks_.lock(symbol);
  auto found = book_.openFor(symbol);
  if (!found) {
    return {false, "NO_OPEN_POSITION", symbol, std::nullopt};
  }
  domain::Position pos = *found;
  return closeLocked(pos, reason);
}

LifecycleResult OrderLifecycleManager::setTakeProfits(
    const std::string& symbol, const std::vector<double>& prices) {
  auto lock = locks_.lock(symbol);
  auto found = book_.openFor(symbol);
  if (!found) {
    return {false, "NO_OPEN_POSITION", symbol, std::nullopt};
  }
  domain::Position pos = *found;

  const bool is_long = pos.side == domain::PositionSide::Long;
  const double reference = pos.average_entry;
  std::vector<domain::TakeProfitLevel> levels;
  for (double price : prices) {
    if (price <= 0.0) {
      continue;
    }
    if (reference > 0.0 &&
        ((is_long && price <= reference) || (!is_long && price >= reference))) {
      continue;
    }
    levels.push_back(domain::TakeProfitLevel{price, 0.0});
  }
  if (levels.empty()) {
    return {false, "INVALID_ACTION", "no take-profit on the profit side", pos};
  }

  cancelTakeProfitsLocked(pos);
  pos.take_profits = levels;
  pos.take_profits_placed = false;
  if (pos.size > kQtyEpsilon) {
    placeTakeProfitsLocked(pos);
    pos.state = domain::PositionState::Managing;
  }
  book_.upsert(pos);
  return {true, "TAKE_PROFIT_SET", symbol, pos};
}

// -----------------------------------------------------------------------------
// Periodic
// -----------------------------------------------------------------------------
void OrderLifecycleManager::syncWithExchange() {
  const auto exchange_positions = executor_.getPositions();
  const auto open_orders = executor_.getOpenOrders();

  std::map<std::string, domain::ExchangePosition> by_symbol;
  for (const auto& ep : exchange_positions) {
    by_symbol[ep.symbol] = ep;
  }
  std::set<std::string> open_ids;
  for (const auto& order : open_orders) {
    open_ids.insert(order.order_id);
    tracker_.apply(order);
  }

  for (const auto& snapshot : book_.exposure()) {
    auto lock = locks_.lock(snapshot.symbol);
    auto current = book_.get(snapshot.plan_id);
    if (!current || !PositionBook::countsAsExposure(*current)) {
      continue;
    }
    domain::Position pos = *current;

    double live_size = 0.0;
    double live_entry = 0.0;
    auto it = by_symbol.find(pos.symbol);
    if (it != by_symbol.end() && it->second.side == pos.side) {
      live_size = it->second.size;
      live_entry = it->second.entry_price;
    }

    using S = domain::PositionState;
    if (pos.state == S::PendingEntry || pos.state == S::PartiallyFilled) {
      const bool entry_open = open_ids.count(pos.entry_order_id) > 0;
      if (live_size > pos.size + kQtyEpsilon || !entry_open) {
        applyEntryFillLocked(pos, live_size, live_entry, !entry_open);
        book_.upsert(pos);
      }
      continue;
    }

    if ((pos.state == S::FilledProtected || pos.state == S::Managing) &&
        live_size > kQtyEpsilon && live_size + kQtyEpsilon < pos.size) {
      std::cout << "[OrderLifecycleManager] " << pos.symbol
                << " size reduced on exchange " << pos.size << " -> "
                << live_size << "\n";
      ledger_.append(LedgerKind::Fill, pos.symbol,
                     {{"plan_id", pos.plan_id},
                      {"reduced", pos.size - live_size},
                      {"remaining", live_size}});
      pos.size = live_size;
      stops_.ensureStopLoss(pos, "size_sync");
      pos.state = S::Managing;
      book_.upsert(pos);
      continue;
    }

    // Flat with its stop no longer open: the stop most likely fired. Any
    // other disappearance is left to reconciliation.
    if ((pos.state == S::FilledProtected || pos.state == S::Managing) &&
        live_size <= kQtyEpsilon && !pos.stop_order_id.empty() &&
        open_ids.count(pos.stop_order_id) == 0 &&
        flatCloseReasonLocked(pos) == "STOP_LOSS_FILLED") {
      const std::string stop_id = pos.stop_order_id;
      markClosedLocked(pos, "STOP_LOSS_FILLED");
      notify(NotificationKind::ProtectiveClose, pos.symbol, "STOP_LOSS_FILLED",
             "stop " + stop_id + " filled; position " + pos.plan_id +
                 " closed");
    }
  }
}

int OrderLifecycleManager::processLocalGuards(
    const std::map<std::string, double>& prices) {
  int fired = 0;
  for (const auto& snapshot : book_.exposure()) {
    if (!snapshot.guard.armed) {
      continue;
    }
    auto price_it = prices.find(snapshot.symbol);
    if (price_it == prices.end() ||
        !StopLossManager::guardCrossed(snapshot, price_it->second)) {
      continue;
    }

    auto lock = locks_.lock(snapshot.symbol);
    auto current = book_.get(snapshot.plan_id);
    if (!current || !StopLossManager::guardCrossed(*current, price_it->second)) {
      continue;
    }
    domain::Position pos = *current;

    std::cerr << "[OrderLifecycleManager] LOCAL GUARD " << pos.symbol
              << " price=" << price_it->second
              << " guard=" << pos.guard.trigger_price << "\n";
    ledger_.append(LedgerKind::Protection, pos.symbol,
                   {{"active", true},
                    {"mode", "local_guard"},
                    {"triggered", true},
                    {"observed_price", price_it->second},
                    {"stop_price", pos.guard.trigger_price},
                    {"plan_id", pos.plan_id}});
    closeLocked(pos, "LOCAL_GUARD_TRIGGERED");
    ++fired;
  }
  return fired;
}

PanicCloseReport OrderLifecycleManager::panicCloseAll() {
  PanicCloseReport report;
  std::set<std::string> handled;

  for (const auto& snapshot : book_.exposure()) {
    auto lock = locks_.lock(snapshot.symbol);
    auto current = book_.get(snapshot.plan_id);
    if (!current || !PositionBook::countsAsExposure(*current)) {
      continue;
    }
    domain::Position pos = *current;
    handled.insert(pos.symbol);
    ++report.attempted;
    const LifecycleResult result = closeLocked(pos, "PANIC_CLOSE");
    if (!result.ok || result.code != "CLOSED") {
      ++report.unresolved;
    }
  }

  if (config_.dry_run) {
    return report;
  }

  try {
    for (const auto& ep : executor_.getPositions()) {
      if (ep.size <= kQtyEpsilon || handled.count(ep.symbol) > 0) {
        continue;
      }
      auto lock = locks_.lock(ep.symbol);
      ++report.attempted;
      if (!closeUntracked(ep)) {
        ++report.unresolved;
      }
    }
  } catch (const ExchangeError& e) {
    std::cerr << "[OrderLifecycleManager] panic sweep could not list "
                 "exchange positions: "
              << e.what() << "\n";
    ++report.unresolved;
  }
  return report;
}

// -----------------------------------------------------------------------------
// Close helpers (symbol lock held)
// -----------------------------------------------------------------------------
LifecycleResult OrderLifecycleManager::closeLocked(domain::Position& pos,
                                                   const std::string& reason) {
  // Nothing filled yet: pull the entry and finish.
  if (pos.size <= kQtyEpsilon) {
    if (!pos.entry_order_id.empty() && !config_.dry_run) {
      cancelQuietly(pos.symbol, pos.entry_order_id);
      tracker_.markCanceled(pos.entry_order_id);
    }
    markClosedLocked(pos, reason);
    return {true, "CLOSED", reason, pos};
  }

  if (config_.dry_run) {
    markClosedLocked(pos, reason);
    return {true, "CLOSED", reason, pos};
  }

  pos.state = domain::PositionState::Closing;
  book_.upsert(pos);
  cancelTakeProfitsLocked(pos);

  domain::OrderSpec spec = stops_.makeCloseInstruction(
      pos, domain::OrderKind::Close, domain::OrderType::Market, pos.size);
  ledger_.append(LedgerKind::OrderAttempt, spec.client_order_id,
                 {{"symbol", pos.symbol},
                  {"kind", "CLOSE"},
                  {"quantity", spec.quantity},
                  {"reason", reason}});

  domain::Order order;
  try {
    order = executor_.placeOrder(spec);
  } catch (const ExchangeError& e) {
    ledger_.append(LedgerKind::OrderResult, spec.client_order_id,
                   {{"symbol", pos.symbol}, {"status", "failed"},
                    {"error", e.what()}});
    book_.upsert(pos);
    escalate("CLOSE_FAILED", pos.symbol, e.what());
    return {false, "CLOSE_FAILED", e.what(), pos};
  }
  tracker_.track(order);
  ledger_.append(LedgerKind::OrderResult, spec.client_order_id,
                 {{"symbol", pos.symbol},
                  {"status", domain::toString(order.status)},
                  {"order_id", order.order_id},
                  {"filled", order.filled_quantity}});

  pos.size = std::max(0.0, pos.size - order.filled_quantity);
  if (pos.size <= kQtyEpsilon) {
    markClosedLocked(pos, reason);
    notify(NotificationKind::ProtectiveClose, pos.symbol, reason,
           "position " + pos.plan_id + " closed");
    return {true, "CLOSED", reason, pos};
  }

  // Close only partly filled: keep the remainder protected.
  stops_.ensureStopLoss(pos, "close_remainder");
  book_.upsert(pos);
  return {true, "CLOSING", reason, pos};
}

void OrderLifecycleManager::markClosedLocked(domain::Position& pos,
                                             const std::string& reason) {
  cancelTakeProfitsLocked(pos);
  if (!config_.dry_run) {
    stops_.removeStopLoss(pos, reason);
  }
  pos.guard.armed = false;
  pos.protection_pending = false;
  pos.unprotected_since_ms.reset();
  pos.size = 0.0;
  pos.state = domain::PositionState::Closed;

  if (stopLossReason(reason)) {
    cooldowns_.recordStopLoss(clock_.now_ms());
  } else if (reason != "ENTRY_UNFILLED") {
    cooldowns_.recordNonStopLossClose();
  }

  ledger_.append(LedgerKind::Fill, pos.symbol,
                 {{"plan_id", pos.plan_id},
                  {"closed", true},
                  {"reason", reason}});
  book_.upsert(pos);
  std::cout << "[OrderLifecycleManager] " << pos.symbol << " closed ("
            << reason << ")\n";
}

std::string OrderLifecycleManager::flatCloseReasonLocked(
    const domain::Position& pos) {
  if (pos.stop_order_id.empty() || config_.dry_run) {
    return "POSITION_GONE";
  }
  const auto tracked = tracker_.find(pos.stop_order_id);
  if (!tracked) {
    return "POSITION_GONE";
  }
  try {
    const auto venue =
        executor_.findOrder(pos.symbol, tracked->spec.client_order_id);
    if (!venue) {
      return "POSITION_GONE";
    }
    if (OrderTracker::isTerminal(venue->status)) {
      tracker_.apply(*venue);
    }
    if (venue->status == domain::OrderStatus::Filled ||
        venue->filled_quantity > kQtyEpsilon) {
      return "STOP_LOSS_FILLED";
    }
  } catch (const ExchangeError& e) {
    std::cerr << "[OrderLifecycleManager] " << pos.symbol << " stop "
              << pos.stop_order_id << " lookup failed: " << e.what() << "\n";
  }
  return "POSITION_GONE";
}

// -----------------------------------------------------------------------------
// Internals
// -----------------------------------------------------------------------------
void OrderLifecycleManager::applyEntryFillLocked(domain::Position& pos,
                                                 double filled_quantity,
                                                 double average_price,
                                                 bool entry_final) {
  using S = domain::PositionState;
  const auto now = clock_.now_ms();

  if (filled_quantity > pos.size + kQtyEpsilon) {
    pos.size = filled_quantity;
    if (average_price > 0.0) {
      pos.average_entry = average_price;
    }
    ledger_.append(LedgerKind::Fill, pos.symbol,
                   {{"plan_id", pos.plan_id},
                    {"filled", pos.size},
                    {"intended", pos.intended_size},
                    {"average_price", pos.average_entry}});
  }

  if (pos.size <= kQtyEpsilon) {
    if (entry_final) {
      std::cout << "[OrderLifecycleManager] " << pos.symbol
                << " entry ended without a fill\n";
      markClosedLocked(pos, "ENTRY_UNFILLED");
    }
    return;
  }

  const bool complete =
      entry_final || pos.size + kQtyEpsilon >= pos.intended_size;

  stops_.ensureStopLoss(pos, "entry_fill");
  if (!domain::hasProtection(pos)) {
    if (!pos.unprotected_since_ms) {
      pos.unprotected_since_ms = now;
    }
    notify(NotificationKind::Escalation, pos.symbol, "PROTECTION_MISSING",
           "filled size " + std::to_string(pos.size) + " has no stop");
  }

  if (pos.state == S::PendingEntry || pos.state == S::PartiallyFilled) {
    pos.state = complete && domain::hasProtection(pos) ? S::FilledProtected
                                                       : S::PartiallyFilled;
  }

  if (complete && config_.place_take_profits && !pos.take_profits_placed &&
      !pos.take_profits.empty()) {
    placeTakeProfitsLocked(pos);
  }
}

void OrderLifecycleManager::placeTakeProfitsLocked(domain::Position& pos) {
  if (pos.take_profits.empty() || pos.size <= kQtyEpsilon) {
    return;
  }
  const double step = symbols_.qtyStep(pos.symbol);
  const double per_level = sizing::floorToStep(
      pos.size / static_cast<double>(pos.take_profits.size()), step);
  if (per_level <= kQtyEpsilon) {
    notify(NotificationKind::Fallback, pos.symbol, "TP_SIZE_ZERO",
           "position too small to split across take-profit levels");
    pos.take_profits_placed = true;
    return;
  }

  const double price_step = symbols_.priceStep(pos.symbol);
  for (auto& level : pos.take_profits) {
    level.quantity = per_level;
    domain::OrderSpec spec = stops_.makeCloseInstruction(
        pos, domain::OrderKind::TakeProfit, domain::OrderType::Limit,
        per_level);
    spec.price = sizing::floorToStep(level.price, price_step);
    ledger_.append(LedgerKind::OrderAttempt, spec.client_order_id,
                   {{"symbol", pos.symbol},
                    {"kind", "TAKE_PROFIT"},
                    {"quantity", per_level},
                    {"price", spec.price}});
    try {
      domain::Order order = executor_.placeOrder(spec);
      tracker_.track(order);
      pos.take_profit_order_ids.push_back(order.order_id);
      ledger_.append(LedgerKind::OrderResult, spec.client_order_id,
                     {{"symbol", pos.symbol},
                      {"status", domain::toString(order.status)},
                      {"order_id", order.order_id}});
    } catch (const ExchangeError& e) {
      ledger_.append(LedgerKind::OrderResult, spec.client_order_id,
                     {{"symbol", pos.symbol}, {"status", "failed"},
                      {"error", e.what()}});
      notify(NotificationKind::Fallback, pos.symbol, "TP_PLACE_FAILED",
             e.what());
    }
  }
  pos.take_profits_placed = true;
}

void OrderLifecycleManager::cancelTakeProfitsLocked(domain::Position& pos) {
  if (config_.dry_run) {
    pos.take_profit_order_ids.clear();
    return;
  }
  for (const auto& id : pos.take_profit_order_ids) {
    if (cancelQuietly(pos.symbol, id)) {
      tracker_.markCanceled(id);
    }
  }
  pos.take_profit_order_ids.clear();
}

bool OrderLifecycleManager::cancelQuietly(const std::string& symbol,
                                          const std::string& order_id) {
  try {
    executor_.cancelOrder(symbol, order_id);
    return true;
  } catch (const PermanentExchangeError& e) {
    if (e.code() == 404) {
      return true;  // Already filled or canceled
    }
    std::cerr << "[OrderLifecycleManager] cancel " << order_id
              << " rejected: " << e.what() << "\n";
  } catch (const RetriesExhaustedError& e) {
    std::cerr << "[OrderLifecycleManager] cancel " << order_id
              << " failed: " << e.what() << "\n";
  }
  return false;
}

bool OrderLifecycleManager::verifyStopLive(const domain::Position& pos) {
  if (pos.stop_order_id.empty()) {
    return pos.guard.armed;
  }
  try {
    for (const auto& order : executor_.getOpenOrders()) {
      if (order.order_id == pos.stop_order_id) {
        return true;
      }
    }
  } catch (const ExchangeError& e) {
    std::cerr << "[OrderLifecycleManager] verify " << pos.symbol
              << " failed: " << e.what() << "\n";
  }
  return false;
}

bool OrderLifecycleManager::closeUntracked(
    const domain::ExchangePosition& ep) {
  domain::Position pos;
  pos.symbol = ep.symbol;
  pos.side = ep.side;
  pos.hold_side = ep.side;
  pos.size = ep.size;

  domain::OrderSpec spec = stops_.makeCloseInstruction(
      pos, domain::OrderKind::Close, domain::OrderType::Market, ep.size);
  ledger_.append(LedgerKind::OrderAttempt, spec.client_order_id,
                 {{"symbol", ep.symbol},
                  {"kind", "CLOSE"},
                  {"quantity", ep.size},
                  {"reason", "PANIC_CLOSE_UNTRACKED"}});
  try {
    domain::Order order = executor_.placeOrder(spec);
    tracker_.track(order);
    notify(NotificationKind::ProtectiveClose, ep.symbol, "PANIC_CLOSE",
           "untracked exchange position closed");
    return order.filled_quantity + kQtyEpsilon >= ep.size;
  } catch (const ExchangeError& e) {
    escalate("CLOSE_FAILED", ep.symbol, e.what());
  }
  return false;
}

void OrderLifecycleManager::escalate(const std::string& code,
                                     const std::string& symbol,
                                     const std::string& detail) {
  std::cerr << "[OrderLifecycleManager] ESCALATE " << code << " " << symbol
            << ": " << detail << "\n";
  notify(NotificationKind::Escalation, symbol, code, detail);

  EscalationHandler handler;
  {
    std::lock_guard lock(escalation_mutex_);
    handler = escalation_;
  }
  if (handler) {
    handler(code, symbol, detail);
  }
}

void OrderLifecycleManager::notify(NotificationKind kind,
                                   const std::string& symbol,
                                   const std::string& code,
                                   const std::string& message) {
  NotificationEvent event;
  event.kind = kind;
  event.symbol = symbol;
  event.code = code;
  event.message = message;
  event.timestamp_ms = clock_.now_ms();
  sink_.notify(std::move(event));
}

}  // namespace warden
