#include "warden/risk/risk_engine.hpp"

#include "warden/risk/sizing.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <sstream>

namespace warden {

using domain::RejectReason;

RiskEngine::RiskEngine(const domain::PolicyConfig& policy,
                       const CooldownTracker& cooldowns, IdGenerator& ids,
                       const ITimeProvider& clock)
    : policy_(policy), cooldowns_(cooldowns), ids_(ids), clock_(clock) {}

domain::RiskDecision RiskEngine::evaluate(
    const domain::SignalEnvelope& envelope, const domain::EntrySignal& signal,
    const domain::AccountSnapshot& account, const domain::SafetyState& safety,
    const MarketContext& market) {
  const std::int64_t now = clock_.now_ms();

  // 1. Safety gate
  if (!domain::allowsNewEntries(safety)) {
    return reject(signal, RejectReason::SafetyGate,
                  std::string("mode=") + domain::toString(safety.mode));
  }

  // 2. Signal age
  if (envelope.received_at_ms > 0) {
    double age_s = static_cast<double>(now - envelope.received_at_ms) / 1000.0;
    if (age_s > policy_.max_signal_age_seconds) {
      std::ostringstream detail;
      detail << "age=" << age_s << "s max=" << policy_.max_signal_age_seconds
             << "s";
      return reject(signal, RejectReason::StaleSignal, detail.str());
    }
  }

  // 3. Symbol policy
  if (policy_.symbol_blacklist.count(signal.symbol) > 0) {
    return reject(signal, RejectReason::SymbolBlacklisted, signal.symbol);
  }
  if (policy_.symbol_policy == domain::SymbolPolicy::Allowlist &&
      policy_.symbol_allowlist.count(signal.symbol) == 0) {
    return reject(signal, RejectReason::SymbolNotAllowed, signal.symbol);
  }
  if (policy_.require_exchange_symbol &&
      (!market.rules || !market.rules->tradable)) {
    return reject(signal, RejectReason::SymbolNotTradable, signal.symbol);
  }
  if (policy_.min_24h_volume) {
    if (!market.rules || !market.rules->volume_24h ||
        *market.rules->volume_24h < *policy_.min_24h_volume) {
      std::ostringstream detail;
      detail << "min_24h_volume=" << *policy_.min_24h_volume;
      return reject(signal, RejectReason::InsufficientLiquidity, detail.str());
    }
  }
  if (policy_.allowed_sides.count(signal.side) == 0) {
    return reject(signal, RejectReason::SideNotAllowed,
                  domain::toString(signal.side));
  }

  // 4. Quality and confidence
  if (signal.quality < policy_.min_signal_quality) {
    std::ostringstream detail;
    detail << "quality=" << signal.quality
           << " min=" << policy_.min_signal_quality;
    return reject(signal, RejectReason::LowSignalQuality, detail.str());
  }
  if (policy_.require_confirmation_below_threshold &&
      signal.confidence < policy_.confidence_threshold) {
    std::cout << "[RiskEngine] PENDING_CONFIRMATION " << signal.symbol
              << " confidence=" << signal.confidence << "\n";
    return domain::PendingConfirmation{envelope.signal_id, signal.symbol,
                                       signal.confidence,
                                       policy_.confidence_threshold};
  }

  // 5. Cooldowns
  if (cooldowns_.symbolCoolingDown(signal.symbol, now)) {
    return reject(signal, RejectReason::SymbolCooldown, signal.symbol);
  }
  if (auto until = cooldowns_.stopLossCooldownUntil(now)) {
    return reject(signal, RejectReason::StopLossCooldown,
                  "until=" + std::to_string(*until));
  }

  // 6. Leverage
  int leverage = std::max(1, signal.leverage.value_or(policy_.default_leverage));
  if (leverage > policy_.max_leverage) {
    if (policy_.leverage_policy == domain::LeveragePolicy::Reject) {
      return reject(signal, RejectReason::LeverageOverCap,
                    "requested=" + std::to_string(leverage) +
                        " max=" + std::to_string(policy_.max_leverage));
    }
    std::cout << "[RiskEngine] " << signal.symbol << " leverage capped "
              << leverage << " -> " << policy_.max_leverage << "\n";
    leverage = policy_.max_leverage;
  }

  // 7. Stop-loss presence
  auto entry = entryReference(signal, market);
  if (!entry || *entry <= 0.0) {
    return reject(signal, RejectReason::InvalidPrice, "no entry reference");
  }
  auto stop = resolveStop(signal, *entry);
  if (!stop) {
    if (policy_.hard_stop_loss_required) {
      return reject(signal, RejectReason::MissingStopLoss,
                    "no stop-loss and no default_stop_loss_pct");
    }
    return reject(signal, RejectReason::InvalidStop, "no usable stop-loss");
  }

  // 8. Price sanity and slippage
  if (!market.current_price || *market.current_price <= 0.0) {
    return reject(signal, RejectReason::InvalidPrice, "no current price");
  }
  if (signal.entry_type == domain::EntryType::Limit) {
    const double px = *market.current_price;
    double deviation = 0.0;
    if (px < signal.entry_low) {
      deviation = (signal.entry_low - px) / signal.entry_low;
    } else if (px > signal.entry_high) {
      deviation = (px - signal.entry_high) / signal.entry_high;
    }
    if (deviation > policy_.max_entry_slippage_pct) {
      std::ostringstream detail;
      detail << "deviation=" << deviation
             << " max=" << policy_.max_entry_slippage_pct;
      return reject(signal, RejectReason::EntrySlippage, detail.str());
    }
  }

  // 9. Exposure
  if (market.open_positions >= policy_.max_open_positions) {
    return reject(signal, RejectReason::MaxOpenPositions,
                  std::to_string(market.open_positions) + "/" +
                      std::to_string(policy_.max_open_positions));
  }

  // 10. Sizing
  const domain::SymbolRules rules =
      market.rules.value_or(domain::SymbolRules{signal.symbol});
  const double entry_price = sizing::floorToStep(*entry, rules.price_step);
  const double stop_price = sizing::floorToStep(*stop, rules.price_step);
  const double distance = std::abs(entry_price - stop_price);
  if (distance <= 0.0) {
    return reject(signal, RejectReason::InvalidStop, "zero stop distance");
  }

  if (account.equity <= 0.0) {
    return reject(signal, RejectReason::AccountUnavailable,
                  account.timestamp_ms == 0 ? "no account snapshot"
                                            : "equity is not positive");
  }
  double quantity = sizing::riskBasedQuantity(
      account.equity, policy_.account_risk_per_trade, entry_price, stop_price);
  if (policy_.max_notional_per_trade > 0.0) {
    quantity = std::min(quantity, policy_.max_notional_per_trade / entry_price);
  }
  quantity = sizing::floorToStep(quantity, rules.qty_step);
  if (quantity <= 0.0 || quantity < rules.min_qty) {
    std::ostringstream detail;
    detail << "qty=" << quantity << " min_qty=" << rules.min_qty;
    return reject(signal, RejectReason::BelowMinQty, detail.str());
  }

  domain::OrderPlan plan;
  plan.plan_id = ids_.next("plan");
  plan.signal_id = envelope.signal_id;
  plan.symbol = signal.symbol;
  plan.side = signal.side;
  plan.quantity = quantity;
  plan.leverage = leverage;
  plan.entry_price = entry_price;
  plan.stop_price = stop_price;
  plan.stop_mode = policy_.stop_loss_mode;
  plan.notional = quantity * entry_price;
  plan.risk_amount = quantity * distance;
  plan.created_at_ms = now;

  plan.entry.client_order_id = ids_.next("entry");
  plan.entry.symbol = signal.symbol;
  plan.entry.side = domain::entrySide(signal.side);
  plan.entry.kind = domain::OrderKind::Entry;
  plan.entry.type = signal.entry_type == domain::EntryType::Market
                        ? domain::OrderType::Market
                        : domain::OrderType::Limit;
  plan.entry.quantity = quantity;
  plan.entry.price =
      plan.entry.type == domain::OrderType::Limit ? entry_price : 0.0;
  plan.entry.hold_side = signal.side;
  plan.entry.leverage = leverage;

  plan.take_profits = buildTakeProfits(signal, entry_price, quantity, rules);

  std::cout << "[RiskEngine] PLAN " << plan.plan_id << " " << plan.symbol
            << " " << domain::toString(plan.side) << " qty=" << plan.quantity
            << " entry=" << plan.entry_price << " stop=" << plan.stop_price
            << " lev=" << plan.leverage << "\n";
  return plan;
}

std::optional<domain::Rejection> RiskEngine::validateManage(
    const domain::ManageAction& action) const {
  using domain::ManageActionKind;

  if (action.symbol.empty()) {
    return domain::Rejection{RejectReason::InvalidAction, "missing symbol"};
  }
  switch (action.kind) {
    case ManageActionKind::Reduce:
      if (!action.reduce_pct || *action.reduce_pct <= 0.0 ||
          *action.reduce_pct > 100.0) {
        return domain::Rejection{RejectReason::InvalidAction,
                                 "reduce_pct outside (0, 100]"};
      }
      break;
    case ManageActionKind::SetTakeProfit:
      if (action.take_profits.empty()) {
        return domain::Rejection{RejectReason::InvalidAction,
                                 "no take-profit levels"};
      }
      break;
    case ManageActionKind::MoveStopToBreakEven:
    case ManageActionKind::Close:
      break;
  }
  return std::nullopt;
}

std::optional<double> RiskEngine::entryReference(
    const domain::EntrySignal& signal, const MarketContext& market) const {
  if (signal.entry_type == domain::EntryType::Market) {
    if (market.current_price && *market.current_price > 0.0) {
      return market.current_price;
    }
    if (signal.entry_low > 0.0) {
      return signal.entry_low;
    }
    return std::nullopt;
  }

  if (signal.entry_low <= 0.0 || signal.entry_high <= 0.0) {
    return std::nullopt;
  }
  switch (policy_.entry_price_source) {
    case domain::EntryPriceSource::Low:
      return signal.entry_low;
    case domain::EntryPriceSource::High:
      return signal.entry_high;
    case domain::EntryPriceSource::Mid:
      break;
  }
  return (signal.entry_low + signal.entry_high) / 2.0;
}

std::optional<double> RiskEngine::resolveStop(const domain::EntrySignal& signal,
                                              double entry) const {
  const bool is_long = signal.side == domain::PositionSide::Long;

  if (signal.stop_loss && *signal.stop_loss > 0.0) {
    const double sl = *signal.stop_loss;
    if ((is_long && sl < entry) || (!is_long && sl > entry)) {
      return sl;
    }
    std::cerr << "[RiskEngine] " << signal.symbol << " stop-loss " << sl
              << " on wrong side of entry " << entry << "; ignoring\n";
  }

  if (policy_.default_stop_loss_pct && *policy_.default_stop_loss_pct > 0.0) {
    const double pct = *policy_.default_stop_loss_pct;
    return is_long ? entry * (1.0 - pct) : entry * (1.0 + pct);
  }
  return std::nullopt;
}

std::vector<domain::TakeProfitLevel> RiskEngine::buildTakeProfits(
    const domain::EntrySignal& signal, double entry, double quantity,
    const domain::SymbolRules& rules) const {
  const bool is_long = signal.side == domain::PositionSide::Long;

  std::vector<double> prices;
  for (double tp : signal.take_profits) {
    if ((is_long && tp > entry) || (!is_long && tp > 0.0 && tp < entry)) {
      prices.push_back(sizing::floorToStep(tp, rules.price_step));
    }
  }
  if (prices.empty()) {
    return {};
  }

  const double per_level = sizing::floorToStep(
      quantity / static_cast<double>(prices.size()), rules.qty_step);
  std::vector<domain::TakeProfitLevel> levels;
  if (per_level <= 0.0) {
    return levels;
  }
  for (double price : prices) {
    levels.push_back(domain::TakeProfitLevel{price, per_level});
  }
  return levels;
}

domain::RiskDecision RiskEngine::reject(const domain::EntrySignal& signal,
                                        RejectReason reason,
                                        const std::string& detail) const {
  std::cerr << "[RiskEngine] REJECT " << signal.symbol
            << " reason=" << domain::toString(reason) << " (" << detail
            << ")\n";
  return domain::Rejection{reason, detail};
}

}  // namespace warden
