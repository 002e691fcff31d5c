#pragma once

#include "warden/capability/capability_cache.hpp"
#include "warden/concurrent/id_generator.hpp"
#include "warden/domain/position.hpp"
#include "warden/exchange/rate_limited_executor.hpp"
#include "warden/ledger/ledger.hpp"
#include "warden/lifecycle/execution_config.hpp"
#include "warden/lifecycle/order_tracker.hpp"
#include "warden/notify/i_notification_sink.hpp"
#include "warden/time/i_time_provider.hpp"

#include <atomic>
#include <mutex>
#include <set>
#include <string>

namespace warden {

// Outcome of one ensureStopLoss() call.
struct ProtectionResult {
  bool ok{false};
  domain::StopLossMode mode{domain::StopLossMode::Trigger};
  std::string reason;
};

// -----------------------------------------------------------------------------
// StopLossManager: keeps one position's protective stop in line with it
// -----------------------------------------------------------------------------
//
// @brief  Places, resizes and re-prices stop-loss protection for a Position,
//         choosing between an exchange trigger order and a local guard.
//
// @details
// Mode selection (resolveMode):
//   configured LocalGuard              → LocalGuard.
//   configured Trigger, capability:
//     Supported                        → Trigger.
//     Unsupported                      → LocalGuard for the rest of the
//                                        session, PLAN_ORDER_FALLBACK emitted.
//     Unknown / expired and re-probe
//     still Unknown                    → LocalGuard until the short-TTL
//                                        re-probe answers; CAPABILITY_UNKNOWN
//                                        emitted. No trigger order is placed
//                                        against an unconfirmed capability.
//
// ensureStopLoss(position):
//   Desired state is "a stop for exactly position.size at position.stop_price".
//   An existing trigger order that already matches is left alone, so calling
//   it repeatedly is free. Otherwise the old order is canceled and a new one
//   placed; protection_pending is raised across that window. A cancel that
//   answers 404 means the order is already gone and counts as success.
//   If the trigger placement fails, a local guard is armed at the same level
//   so the position is never left bare, and the failure is reported.
//
// Close instruction (makeCloseInstruction):
//   One-way accounts: reduce_only. Hedge accounts: close_side + hold_side.
//
// Thread model:
//   Every method that takes a Position& must be called with that symbol's
//   SymbolLockTable lock held. Session fallback state is atomic / locked.
// -----------------------------------------------------------------------------
class StopLossManager {
 public:
  StopLossManager(RateLimitedExecutor& executor, CapabilityCache& capabilities,
                  OrderTracker& tracker, Ledger& ledger,
                  INotificationSink& sink, IdGenerator& ids,
                  const ITimeProvider& clock, const ExecutionConfig& config);

  StopLossManager(const StopLossManager&) = delete;
  StopLossManager& operator=(const StopLossManager&) = delete;
  StopLossManager(StopLossManager&&) = delete;
  StopLossManager& operator=(StopLossManager&&) = delete;

  domain::StopLossMode resolveMode(const std::string& symbol);

  ProtectionResult ensureStopLoss(domain::Position& position,
                                  const std::string& source);

  // Cancels the live stop order (if any) and disarms the guard. Returns
  // false only when a live order could not be confirmed gone.
  bool removeStopLoss(domain::Position& position, const std::string& reason);

  domain::OrderSpec makeCloseInstruction(const domain::Position& position,
                                         domain::OrderKind kind,
                                         domain::OrderType type,
                                         double quantity);

  // LONG fires at or below the guard, SHORT at or above.
  static bool guardCrossed(const domain::Position& position, double price);

  bool sessionFallback() const { return session_fallback_.load(); }

 private:
  bool stopMatches(const domain::Position& position) const;
  bool cancelOrder(const std::string& symbol, const std::string& order_id,
                   const std::string& reason);
  ProtectionResult placeTrigger(domain::Position& position,
                                const std::string& source);
  ProtectionResult armGuard(domain::Position& position,
                            const std::string& source,
                            const std::string& reason);
  void recordProtection(const domain::Position& position,
                        const std::string& source);
  void emitFallback(const std::string& symbol, const std::string& code,
                    const std::string& message);

  RateLimitedExecutor& executor_;
  CapabilityCache& capabilities_;
  OrderTracker& tracker_;
  Ledger& ledger_;
  INotificationSink& sink_;
  IdGenerator& ids_;
  const ITimeProvider& clock_;
  const ExecutionConfig config_;

  std::atomic<bool> session_fallback_{false};
  std::mutex notified_mutex_;
  std::set<std::string> unknown_notified_;
};

}  // namespace warden
