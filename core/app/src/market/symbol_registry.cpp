#include "warden/market/symbol_registry.hpp"

#include "warden/exchange/exchange_error.hpp"

#include <iostream>

namespace warden {

SymbolRegistry::SymbolRegistry(RateLimitedExecutor& executor,
                               const ITimeProvider& clock, std::int64_t ttl_ms)
    : executor_(executor), clock_(clock), ttl_ms_(ttl_ms) {}

std::optional<domain::SymbolRules> SymbolRegistry::rules(
    const std::string& symbol) {
  const auto now = clock_.now_ms();
  std::optional<domain::SymbolRules> stale;
  {
    std::lock_guard lock(mutex_);
    auto it = cache_.find(symbol);
    if (it != cache_.end()) {
      if (now - it->second.fetched_at_ms < ttl_ms_) {
        return it->second.rules;
      }
      stale = it->second.rules;
    }
  }

  Entry entry;
  entry.fetched_at_ms = now;
  try {
    entry.rules = executor_.getSymbolRules(symbol);
  } catch (const PermanentExchangeError& e) {
    std::cerr << "[SymbolRegistry] " << symbol << " not listed: " << e.what()
              << "\n";
  } catch (const RetriesExhaustedError& e) {
    std::cerr << "[SymbolRegistry] " << symbol << " rules unavailable: "
              << e.what() << "\n";
    return stale;
  }

  std::lock_guard lock(mutex_);
  cache_[symbol] = entry;
  return entry.rules;
}

double SymbolRegistry::qtyStep(const std::string& symbol) {
  auto r = rules(symbol);
  return r ? r->qty_step : 0.0;
}

double SymbolRegistry::priceStep(const std::string& symbol) {
  auto r = rules(symbol);
  return r ? r->price_step : 0.0;
}

void SymbolRegistry::put(const domain::SymbolRules& rules) {
  std::lock_guard lock(mutex_);
  cache_[rules.symbol] = Entry{rules, clock_.now_ms()};
}

}  // namespace warden
