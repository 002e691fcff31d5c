#include "warden/exchange/paper_exchange_gateway.hpp"
#include "warden/exchange/exchange_error.hpp"

#include <algorithm>
#include <iostream>

namespace warden {

namespace {

constexpr double kQtyEpsilon = 1e-12;

}  // namespace

PaperExchangeGateway::PaperExchangeGateway(const ITimeProvider& clock)
    : clock_(clock) {
  balance_.equity = 1000.0;
  balance_.available = 1000.0;
}

// -----------------------------------------------------------------------------
// IExchangeGateway
// -----------------------------------------------------------------------------
domain::AccountSnapshot PaperExchangeGateway::getBalance() {
  std::lock_guard lock(mutex_);
  countAndMaybeFail("get_balance");
  domain::AccountSnapshot snapshot = balance_;
  snapshot.timestamp_ms = clock_.now_ms();
  return snapshot;
}

std::vector<domain::ExchangePosition> PaperExchangeGateway::getPositions() {
  std::lock_guard lock(mutex_);
  countAndMaybeFail("get_positions");
  std::vector<domain::ExchangePosition> result;
  result.reserve(positions_.size());
  for (const auto& [symbol, pos] : positions_) {
    domain::ExchangePosition copy = pos;
    auto price_it = prices_.find(symbol);
    if (price_it != prices_.end()) {
      copy.mark_price = price_it->second;
    }
    result.push_back(copy);
  }
  return result;
}

std::vector<domain::Order> PaperExchangeGateway::getOpenOrders() {
  std::lock_guard lock(mutex_);
  countAndMaybeFail("get_open_orders");
  std::vector<domain::Order> result;
  for (const auto& [id, order] : orders_) {
    if (!isTerminal(order.status)) {
      result.push_back(order);
    }
  }
  return result;
}

domain::Order PaperExchangeGateway::placeOrder(const domain::OrderSpec& spec) {
  std::lock_guard lock(mutex_);
  countAndMaybeFail("place_order");

  if (spec.quantity <= 0.0) {
    throw PermanentExchangeError("place_order", "quantity must be positive",
                                 400);
  }

  domain::Order order;
  order.order_id = "paper-" + std::to_string(next_order_id_++);
  order.spec = spec;
  order.status = domain::OrderStatus::Accepted;
  placement_log_.push_back(order.order_id);

  auto& stored = orders_[order.order_id];
  stored = order;

  if (spec.type == domain::OrderType::Market && auto_fill_market_) {
    auto price_it = prices_.find(spec.symbol);
    double price = price_it != prices_.end() ? price_it->second : spec.price;
    applyFill(stored, spec.quantity, price);
  }

  return stored;
}

void PaperExchangeGateway::cancelOrder(const std::string& symbol,
                                       const std::string& order_id) {
  std::lock_guard lock(mutex_);
  countAndMaybeFail("cancel_order");

  auto it = orders_.find(order_id);
  if (it == orders_.end() || it->second.spec.symbol != symbol ||
      isTerminal(it->second.status)) {
    throw PermanentExchangeError("cancel_order",
                                 "order " + order_id + " not found", 404);
  }
  it->second.status = domain::OrderStatus::Canceled;
  ++cancel_count_;
}

std::optional<domain::Order> PaperExchangeGateway::findOrder(
    const std::string& symbol, const std::string& client_order_id) {
  std::lock_guard lock(mutex_);
  countAndMaybeFail("find_order");
  for (auto it = placement_log_.rbegin(); it != placement_log_.rend(); ++it) {
    const domain::Order& order = orders_.at(*it);
    if (order.spec.symbol == symbol &&
        order.spec.client_order_id == client_order_id) {
      return order;
    }
  }
  return std::nullopt;
}

void PaperExchangeGateway::setLeverage(
    const std::string& symbol, int leverage,
    std::optional<domain::PositionSide> /*hold_side*/) {
  std::lock_guard lock(mutex_);
  countAndMaybeFail("set_leverage");
  leverage_[symbol] = leverage;
}

domain::SymbolRules PaperExchangeGateway::getSymbolRules(
    const std::string& symbol) {
  std::lock_guard lock(mutex_);
  countAndMaybeFail("get_symbol_rules");
  auto it = rules_.find(symbol);
  if (it != rules_.end()) {
    return it->second;
  }
  domain::SymbolRules rules;
  rules.symbol = symbol;
  rules.qty_step = 0.001;
  rules.price_step = 0.01;
  rules.min_qty = 0.001;
  rules.tradable = true;
  return rules;
}

domain::ProbeResult PaperExchangeGateway::probeCapability(
    const std::string& kind) {
  std::lock_guard lock(mutex_);
  countAndMaybeFail("probe_capability");

  auto timeout_it = capability_timeouts_.find(kind);
  if (timeout_it != capability_timeouts_.end() && timeout_it->second) {
    throw ExchangeTimeoutError("probe_capability", "probe of " + kind +
                                                       " timed out");
  }
  auto it = capabilities_.find(kind);
  if (it != capabilities_.end()) {
    return it->second;
  }
  return domain::ProbeResult{domain::CapabilityValue::Supported, "ok"};
}

double PaperExchangeGateway::getPrice(const std::string& symbol) {
  std::lock_guard lock(mutex_);
  countAndMaybeFail("get_price");
  auto it = prices_.find(symbol);
  if (it == prices_.end()) {
    throw PermanentExchangeError("get_price", "no price for " + symbol, 404);
  }
  return it->second;
}

// -----------------------------------------------------------------------------
// Scripting
// -----------------------------------------------------------------------------
void PaperExchangeGateway::setBalance(const domain::AccountSnapshot& snapshot) {
  std::lock_guard lock(mutex_);
  balance_ = snapshot;
}

void PaperExchangeGateway::setSymbolRules(const domain::SymbolRules& rules) {
  std::lock_guard lock(mutex_);
  rules_[rules.symbol] = rules;
}

void PaperExchangeGateway::setPrice(const std::string& symbol, double price) {
  std::lock_guard lock(mutex_);
  prices_[symbol] = price;
  matchRestingOrders(symbol, price);
}

void PaperExchangeGateway::setCapability(const std::string& kind,
                                         domain::ProbeResult result) {
  std::lock_guard lock(mutex_);
  capabilities_[kind] = std::move(result);
}

void PaperExchangeGateway::setCapabilityTimeout(const std::string& kind,
                                                bool timeout) {
  std::lock_guard lock(mutex_);
  capability_timeouts_[kind] = timeout;
}

void PaperExchangeGateway::failNext(const std::string& operation, int count,
                                    FailureKind kind) {
  std::lock_guard lock(mutex_);
  auto& queue = failures_[operation];
  for (int i = 0; i < count; ++i) {
    queue.push_back(kind);
  }
}

void PaperExchangeGateway::setAutoFillMarket(bool enabled) {
  std::lock_guard lock(mutex_);
  auto_fill_market_ = enabled;
}

void PaperExchangeGateway::fillOrder(const std::string& order_id,
                                     double quantity, double price) {
  std::lock_guard lock(mutex_);
  auto it = orders_.find(order_id);
  if (it == orders_.end() || isTerminal(it->second.status)) {
    std::cerr << "[PaperExchangeGateway] fillOrder: no resting order "
              << order_id << "\n";
    return;
  }
  applyFill(it->second, quantity, price);
}

void PaperExchangeGateway::setPosition(
    const domain::ExchangePosition& position) {
  std::lock_guard lock(mutex_);
  positions_[position.symbol] = position;
}

void PaperExchangeGateway::removePosition(const std::string& symbol) {
  std::lock_guard lock(mutex_);
  positions_.erase(symbol);
}

// -----------------------------------------------------------------------------
// Inspection
// -----------------------------------------------------------------------------
std::vector<domain::Order> PaperExchangeGateway::placedOrders() const {
  std::lock_guard lock(mutex_);
  std::vector<domain::Order> result;
  result.reserve(placement_log_.size());
  for (const auto& id : placement_log_) {
    result.push_back(orders_.at(id));
  }
  return result;
}

std::size_t PaperExchangeGateway::placeCount() const {
  std::lock_guard lock(mutex_);
  return placement_log_.size();
}

std::size_t PaperExchangeGateway::placeCount(domain::OrderKind kind) const {
  std::lock_guard lock(mutex_);
  return static_cast<std::size_t>(
      std::count_if(placement_log_.begin(), placement_log_.end(),
                    [this, kind](const std::string& id) {
                      return orders_.at(id).spec.kind == kind;
                    }));
}

std::size_t PaperExchangeGateway::cancelCount() const {
  std::lock_guard lock(mutex_);
  return cancel_count_;
}

std::size_t PaperExchangeGateway::callCount(
    const std::string& operation) const {
  std::lock_guard lock(mutex_);
  auto it = call_counts_.find(operation);
  return it == call_counts_.end() ? 0 : it->second;
}

std::size_t PaperExchangeGateway::writeCallCount() const {
  std::lock_guard lock(mutex_);
  std::size_t total = 0;
  for (const char* op : {"place_order", "cancel_order", "set_leverage"}) {
    auto it = call_counts_.find(op);
    if (it != call_counts_.end()) {
      total += it->second;
    }
  }
  return total;
}

std::optional<domain::Order> PaperExchangeGateway::order(
    const std::string& order_id) const {
  std::lock_guard lock(mutex_);
  auto it = orders_.find(order_id);
  if (it == orders_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<domain::ExchangePosition> PaperExchangeGateway::position(
    const std::string& symbol) const {
  std::lock_guard lock(mutex_);
  auto it = positions_.find(symbol);
  if (it == positions_.end()) {
    return std::nullopt;
  }
  return it->second;
}

int PaperExchangeGateway::leverageFor(const std::string& symbol) const {
  std::lock_guard lock(mutex_);
  auto it = leverage_.find(symbol);
  return it == leverage_.end() ? 0 : it->second;
}

// -----------------------------------------------------------------------------
// Internals (mutex_ held by the caller)
// -----------------------------------------------------------------------------
void PaperExchangeGateway::countAndMaybeFail(const std::string& operation) {
  ++call_counts_[operation];

  auto it = failures_.find(operation);
  if (it == failures_.end() || it->second.empty()) {
    return;
  }
  FailureKind kind = it->second.front();
  it->second.pop_front();

  switch (kind) {
    case FailureKind::Transient:
      throw TransientExchangeError(operation, "simulated network error");
    case FailureKind::RateLimit:
      throw RateLimitError(operation, "simulated rate limit");
    case FailureKind::Timeout:
      throw ExchangeTimeoutError(operation, "simulated timeout");
    case FailureKind::Permanent:
      throw PermanentExchangeError(operation, "simulated rejection", 400);
  }
}

void PaperExchangeGateway::applyFill(domain::Order& order, double quantity,
                                     double price) {
  double remaining = order.spec.quantity - order.filled_quantity;
  double fill = std::min(quantity, remaining);
  if (fill <= kQtyEpsilon) {
    return;
  }

  double notional = order.average_price * order.filled_quantity + price * fill;
  order.filled_quantity += fill;
  order.average_price = notional / order.filled_quantity;
  order.status = order.filled_quantity + kQtyEpsilon >= order.spec.quantity
                     ? domain::OrderStatus::Filled
                     : domain::OrderStatus::PartiallyFilled;

  const std::string& symbol = order.spec.symbol;
  auto pos_it = positions_.find(symbol);

  if (!isReducing(order.spec)) {
    domain::PositionSide side = order.spec.side == domain::OrderSide::Buy
                                    ? domain::PositionSide::Long
                                    : domain::PositionSide::Short;
    if (pos_it == positions_.end()) {
      domain::ExchangePosition pos;
      pos.symbol = symbol;
      pos.side = side;
      pos.size = fill;
      pos.entry_price = price;
      positions_[symbol] = pos;
    } else {
      auto& pos = pos_it->second;
      double cost = pos.entry_price * pos.size + price * fill;
      pos.size += fill;
      pos.entry_price = cost / pos.size;
    }
    return;
  }

  if (pos_it == positions_.end()) {
    return;
  }
  pos_it->second.size -= fill;
  if (pos_it->second.size > kQtyEpsilon) {
    return;
  }

  // Flat: the venue drops the remaining reduce-only orders for the symbol.
  positions_.erase(pos_it);
  for (auto& [id, other] : orders_) {
    if (other.spec.symbol == symbol && id != order.order_id &&
        isReducing(other.spec) && !isTerminal(other.status)) {
      other.status = domain::OrderStatus::Canceled;
    }
  }
}

void PaperExchangeGateway::matchRestingOrders(const std::string& symbol,
                                              double price) {
  for (auto& [id, order] : orders_) {
    if (order.spec.symbol != symbol || isTerminal(order.status)) {
      continue;
    }
    const bool buy = order.spec.side == domain::OrderSide::Buy;
    bool crossed = false;
    switch (order.spec.type) {
      case domain::OrderType::Limit:
        crossed = buy ? price <= order.spec.price : price >= order.spec.price;
        break;
      case domain::OrderType::Trigger:
        crossed = buy ? price >= order.spec.trigger_price
                      : price <= order.spec.trigger_price;
        break;
      case domain::OrderType::Market:
        break;
    }
    if (crossed) {
      applyFill(order, order.spec.quantity - order.filled_quantity, price);
    }
  }
}

bool PaperExchangeGateway::isReducing(const domain::OrderSpec& spec) {
  return spec.reduce_only || spec.close_side;
}

bool PaperExchangeGateway::isTerminal(domain::OrderStatus status) {
  using S = domain::OrderStatus;
  return status == S::Filled || status == S::Canceled ||
         status == S::Rejected || status == S::Failed;
}

}  // namespace warden
