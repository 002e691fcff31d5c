#include "warden/exchange/rate_limited_executor.hpp"

namespace warden {

RateLimitedExecutor::RateLimitedExecutor(IExchangeGateway& gateway,
                                         const ExecutorConfig& config)
    : gateway_(gateway),
      config_(config),
      bucket_(config.rate_per_second, config.burst),
      backoff_(config.backoff_base, config.backoff_cap, config.jitter_ratio) {}

domain::AccountSnapshot RateLimitedExecutor::getBalance() {
  return run("get_balance", CallKind::Read,
             [this] { return gateway_.getBalance(); });
}

std::vector<domain::ExchangePosition> RateLimitedExecutor::getPositions() {
  return run("get_positions", CallKind::Read,
             [this] { return gateway_.getPositions(); });
}

std::vector<domain::Order> RateLimitedExecutor::getOpenOrders() {
  return run("get_open_orders", CallKind::Read,
             [this] { return gateway_.getOpenOrders(); });
}

domain::Order RateLimitedExecutor::placeOrder(const domain::OrderSpec& spec) {
  for (int attempt = 0;; ++attempt) {
    try {
      return run("place_order", CallKind::Placement,
                 [this, &spec] { return gateway_.placeOrder(spec); });
    } catch (const UnconfirmedOrderError& e) {
      if (spec.client_order_id.empty()) {
        throw;
      }

      std::optional<domain::Order> landed;
      bool lookup_failed = false;
      try {
        landed = findOrder(spec.symbol, spec.client_order_id);
      } catch (const ExchangeError& lookup) {
        std::cerr << "[RateLimitedExecutor] place_order " << spec.client_order_id
                  << " unconfirmed and lookup failed: " << lookup.what()
                  << "\n";
        lookup_failed = true;
      }
      if (lookup_failed) {
        throw;
      }

      if (landed) {
        std::cout << "[RateLimitedExecutor] place_order "
                  << spec.client_order_id << " landed as "
                  << landed->order_id << " despite: " << e.what() << "\n";
        return *landed;
      }
      if (attempt + 1 >= config_.max_attempts) {
        throw;
      }

      retries_.fetch_add(1);
      const auto delay = backoff_.delayFor(attempt);
      std::cerr << "[RateLimitedExecutor] place_order " << spec.client_order_id
                << " not on venue; re-sending in " << delay.count()
                << " ms\n";
      std::this_thread::sleep_for(delay);
    }
  }
}

std::optional<domain::Order> RateLimitedExecutor::findOrder(
    const std::string& symbol, const std::string& client_order_id) {
  return run("find_order", CallKind::Read, [this, &symbol, &client_order_id] {
    return gateway_.findOrder(symbol, client_order_id);
  });
}

void RateLimitedExecutor::cancelOrder(const std::string& symbol,
                                      const std::string& order_id) {
  run("cancel_order", CallKind::Write,
      [this, &symbol, &order_id] { gateway_.cancelOrder(symbol, order_id); });
}

void RateLimitedExecutor::setLeverage(
    const std::string& symbol, int leverage,
    std::optional<domain::PositionSide> hold_side) {
  run("set_leverage", CallKind::Write, [&] {
    gateway_.setLeverage(symbol, leverage, hold_side);
  });
}

domain::SymbolRules RateLimitedExecutor::getSymbolRules(
    const std::string& symbol) {
  return run("get_symbol_rules", CallKind::Read,
             [this, &symbol] { return gateway_.getSymbolRules(symbol); });
}

double RateLimitedExecutor::getPrice(const std::string& symbol) {
  return run("get_price", CallKind::Read,
             [this, &symbol] { return gateway_.getPrice(symbol); });
}

domain::ProbeResult RateLimitedExecutor::probeCapability(
    const std::string& kind) {
  return run(
      "probe_capability", CallKind::Read,
      [this, &kind] { return gateway_.probeCapability(kind); }, 1);
}

void RateLimitedExecutor::setErrorListener(ErrorListener listener) {
  std::lock_guard lock(listener_mutex_);
  error_listener_ = std::move(listener);
}

void RateLimitedExecutor::reportError(const std::string& operation,
                                      const std::string& what) {
  errors_.fetch_add(1);
  ErrorListener listener;
  {
    std::lock_guard lock(listener_mutex_);
    listener = error_listener_;
  }
  if (listener) {
    listener(operation, what);
  }
}

}  // namespace warden
