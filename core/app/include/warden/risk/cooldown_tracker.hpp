#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace warden {

// -----------------------------------------------------------------------------
// CooldownTracker
// -----------------------------------------------------------------------------
// Remembers when each symbol was last entered and counts consecutive
// stop-outs across the account. Once the streak reaches the limit, entries
// are blocked until now + stoploss_cooldown; any non-stop-loss close
// resets the streak.
//
// Written by OrderLifecycleManager (entries, closes), read by RiskEngine.
// Internally locked.
// -----------------------------------------------------------------------------
class CooldownTracker {
 public:
  CooldownTracker(std::int64_t symbol_cooldown_ms, int stoploss_streak_limit,
                  std::int64_t stoploss_cooldown_ms);

  CooldownTracker(const CooldownTracker&) = delete;
  CooldownTracker& operator=(const CooldownTracker&) = delete;

  void recordEntry(const std::string& symbol, std::int64_t now_ms);
  void recordStopLoss(std::int64_t now_ms);
  void recordNonStopLossClose();

  bool symbolCoolingDown(const std::string& symbol, std::int64_t now_ms) const;

  // Set while the streak cooldown is active.
  std::optional<std::int64_t> stopLossCooldownUntil(std::int64_t now_ms) const;

  int stopLossStreak() const;

 private:
  const std::int64_t symbol_cooldown_ms_;
  const int stoploss_streak_limit_;
  const std::int64_t stoploss_cooldown_ms_;

  mutable std::mutex mutex_;
  std::map<std::string, std::int64_t> last_entry_ms_;
  int streak_{0};
  std::optional<std::int64_t> streak_cooldown_until_ms_;
};

}  // namespace warden
