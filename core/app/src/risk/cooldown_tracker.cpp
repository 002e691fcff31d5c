#include "warden/risk/cooldown_tracker.hpp"

#include <iostream>

namespace warden {

CooldownTracker::CooldownTracker(std::int64_t symbol_cooldown_ms,
                                 int stoploss_streak_limit,
                                 std::int64_t stoploss_cooldown_ms)
    : symbol_cooldown_ms_(symbol_cooldown_ms),
      stoploss_streak_limit_(stoploss_streak_limit),
      stoploss_cooldown_ms_(stoploss_cooldown_ms) {}

void CooldownTracker::recordEntry(const std::string& symbol,
                                  std::int64_t now_ms) {
  std::lock_guard lock(mutex_);
  last_entry_ms_[symbol] = now_ms;
}

void CooldownTracker::recordStopLoss(std::int64_t now_ms) {
  std::lock_guard lock(mutex_);
  ++streak_;
  if (stoploss_streak_limit_ > 0 && streak_ >= stoploss_streak_limit_) {
    streak_cooldown_until_ms_ = now_ms + stoploss_cooldown_ms_;
    std::cerr << "[CooldownTracker] " << streak_
              << " consecutive stop-outs; entries blocked until "
              << *streak_cooldown_until_ms_ << "\n";
  }
}

void CooldownTracker::recordNonStopLossClose() {
  std::lock_guard lock(mutex_);
  streak_ = 0;
}

bool CooldownTracker::symbolCoolingDown(const std::string& symbol,
                                        std::int64_t now_ms) const {
  std::lock_guard lock(mutex_);
  auto it = last_entry_ms_.find(symbol);
  if (it == last_entry_ms_.end()) {
    return false;
  }
  return now_ms - it->second < symbol_cooldown_ms_;
}

std::optional<std::int64_t> CooldownTracker::stopLossCooldownUntil(
    std::int64_t now_ms) const {
  std::lock_guard lock(mutex_);
  if (streak_cooldown_until_ms_ && now_ms < *streak_cooldown_until_ms_) {
    return streak_cooldown_until_ms_;
  }
  return std::nullopt;
}

int CooldownTracker::stopLossStreak() const {
  std::lock_guard lock(mutex_);
  return streak_;
}

}  // namespace warden
