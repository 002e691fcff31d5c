#pragma once

#include "warden/domain/symbol_rules.hpp"
#include "warden/exchange/rate_limited_executor.hpp"
#include "warden/time/i_time_provider.hpp"

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace warden {

// -----------------------------------------------------------------------------
// SymbolRegistry
// -----------------------------------------------------------------------------
// Caches getSymbolRules() answers for ttl_ms. A symbol the venue answers
// with a permanent error (not listed) is cached as absent for the same
// window, so the risk check reports SYMBOL_NOT_TRADABLE without hammering
// the venue. Transient failures are not cached and return the last known
// rules if any.
// -----------------------------------------------------------------------------
class SymbolRegistry {
 public:
  SymbolRegistry(RateLimitedExecutor& executor, const ITimeProvider& clock,
                 std::int64_t ttl_ms = 3'600'000);

  SymbolRegistry(const SymbolRegistry&) = delete;
  SymbolRegistry& operator=(const SymbolRegistry&) = delete;

  std::optional<domain::SymbolRules> rules(const std::string& symbol);

  // Step size for rounding; 0 when the symbol is unknown.
  double qtyStep(const std::string& symbol);
  double priceStep(const std::string& symbol);

  // Pre-seeds the cache (startup, tests).
  void put(const domain::SymbolRules& rules);

 private:
  struct Entry {
    std::optional<domain::SymbolRules> rules;
    std::int64_t fetched_at_ms{0};
  };

  RateLimitedExecutor& executor_;
  const ITimeProvider& clock_;
  const std::int64_t ttl_ms_;

  std::mutex mutex_;
  std::map<std::string, Entry> cache_;
};

}  // namespace warden
