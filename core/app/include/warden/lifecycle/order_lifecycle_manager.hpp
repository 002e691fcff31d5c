#pragma once

#include "warden/concurrent/symbol_lock_table.hpp"
#include "warden/domain/order_plan.hpp"
#include "warden/domain/position.hpp"
#include "warden/domain/signal_intent.hpp"
#include "warden/exchange/rate_limited_executor.hpp"
#include "warden/ledger/ledger.hpp"
#include "warden/lifecycle/execution_config.hpp"
#include "warden/lifecycle/order_tracker.hpp"
#include "warden/lifecycle/position_book.hpp"
#include "warden/lifecycle/stop_loss_manager.hpp"
#include "warden/market/price_book.hpp"
#include "warden/market/symbol_registry.hpp"
#include "warden/notify/i_notification_sink.hpp"
#include "warden/risk/cooldown_tracker.hpp"
#include "warden/time/i_time_provider.hpp"

#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace warden {

// -----------------------------------------------------------------------------
// LifecycleResult
// -----------------------------------------------------------------------------
// code is stable and machine-parseable (PLACED, DRY_RUN, REDUCED, CLOSED,
// MOVED_TO_BREAK_EVEN, BE_NOT_REACHED, NO_OPEN_POSITION, PROTECTION_FAILURE,
// ...). position is the record after the operation when one exists.
// -----------------------------------------------------------------------------
struct LifecycleResult {
  bool ok{false};
  std::string code;
  std::string detail;
  std::optional<domain::Position> position;
};

// unresolved: closes that failed or only partly filled, plus one when the
// exchange positions could not be listed.
struct PanicCloseReport {
  int attempted{0};
  int unresolved{0};
};

// -----------------------------------------------------------------------------
// OrderLifecycleManager: from approved plan to closed position
// -----------------------------------------------------------------------------
//
// @brief  Owns every exchange write made on behalf of a position: leverage,
//         entry, stop-loss, take-profits, reductions and closes.
//
// @details
// Per-position state machine:
//
//   PENDING_ENTRY ─fill─> PARTIALLY_FILLED ─fill─> FILLED_PROTECTED
//        │                                              │
//        │                        manage action ──> MANAGING
//        │                                              │
//        └──(no fill, entry gone)──> CLOSED <── CLOSING <┘
//
// Dry-run plans go to PENDING_MANUAL and never touch the exchange.
//
// Protection follows the filled size, never the intended size: each fill
// (from placeOrder's immediate result, from syncWithExchange(), or from an
// explicit onEntryFill()) resizes the stop through StopLossManager. The
// take-profit ladder is placed once the entry is complete, split evenly
// across levels and floored to qty_step.
//
// Break-even move is two-phase: protection_pending is raised and persisted
// before the cancel, and cleared only after the replacement is seen live on
// the exchange. Each failed attempt is retried up to
// max_protection_retries; exhaustion escalates PROTECTION_FAILURE to the
// safety supervisor and leaves the flag raised for the reconciler.
//
// Concurrency:
//   Every public operation takes the symbol's lock from SymbolLockTable for
//   its full duration, including the exchange calls it makes. The *Locked
//   methods are for callers (ReconciliationEngine) that already hold it.
//
// Ownership:
//   References only; WardenEngine owns every collaborator.
// -----------------------------------------------------------------------------
class OrderLifecycleManager {
 public:
  using EscalationHandler =
      std::function<void(const std::string& code, const std::string& symbol,
                         const std::string& detail)>;

  OrderLifecycleManager(RateLimitedExecutor& executor, PositionBook& book,
                        OrderTracker& tracker, StopLossManager& stops,
                        SymbolLockTable& locks, SymbolRegistry& symbols,
                        const PriceBook& prices, CooldownTracker& cooldowns,
                        Ledger& ledger, INotificationSink& sink,
                        const ITimeProvider& clock,
                        const ExecutionConfig& config);

  OrderLifecycleManager(const OrderLifecycleManager&) = delete;
  OrderLifecycleManager& operator=(const OrderLifecycleManager&) = delete;
  OrderLifecycleManager(OrderLifecycleManager&&) = delete;
  OrderLifecycleManager& operator=(OrderLifecycleManager&&) = delete;

  void setEscalationHandler(EscalationHandler handler);

  // --- Signal path -----------------------------------------------------------
  LifecycleResult submitPlan(const domain::OrderPlan& plan);

  // filled_quantity is cumulative for the entry.
  LifecycleResult onEntryFill(const std::string& symbol,
                              double filled_quantity, double average_price);

  // --- Manage actions --------------------------------------------------------
  LifecycleResult applyManageAction(const domain::ManageAction& action);
  LifecycleResult moveStopToBreakEven(const std::string& symbol);
  LifecycleResult reducePosition(const std::string& symbol, double reduce_pct);
  LifecycleResult closePosition(const std::string& symbol,
                                const std::string& reason);
  LifecycleResult setTakeProfits(const std::string& symbol,
                                 const std::vector<double>& prices);

  // --- Periodic --------------------------------------------------------------
  // Pulls positions and open orders; applies entry fills and external size
  // reductions to local records, and closes records whose stop order
  // filled.
  void syncWithExchange();

  // Fires every armed guard crossed by its symbol's price. Returns the
  // number of protective closes issued.
  int processLocalGuards(const std::map<std::string, double>& prices);

  // One protective close per live position, local records and exchange
  // positions without one.
  PanicCloseReport panicCloseAll();

  // --- Caller holds the symbol lock -----------------------------------------
  LifecycleResult closeLocked(domain::Position& position,
                              const std::string& reason);
  void markClosedLocked(domain::Position& position, const std::string& reason);

  // Close reason for a record whose venue position is flat:
  // STOP_LOSS_FILLED when its stop order filled, POSITION_GONE otherwise.
  std::string flatCloseReasonLocked(const domain::Position& position);

  bool dryRun() const { return config_.dry_run; }
  const ExecutionConfig& config() const { return config_; }

 private:
  void applyEntryFillLocked(domain::Position& position, double filled_quantity,
                            double average_price, bool entry_final);
  void placeTakeProfitsLocked(domain::Position& position);
  void cancelTakeProfitsLocked(domain::Position& position);
  bool cancelQuietly(const std::string& symbol, const std::string& order_id);
  bool verifyStopLive(const domain::Position& position);
  bool closeUntracked(const domain::ExchangePosition& position);

  void escalate(const std::string& code, const std::string& symbol,
                const std::string& detail);
  void notify(NotificationKind kind, const std::string& symbol,
              const std::string& code, const std::string& message);

  RateLimitedExecutor& executor_;
  PositionBook& book_;
  OrderTracker& tracker_;
  StopLossManager& stops_;
  SymbolLockTable& locks_;
  SymbolRegistry& symbols_;
  const PriceBook& prices_;
  CooldownTracker& cooldowns_;
  Ledger& ledger_;
  INotificationSink& sink_;
  const ITimeProvider& clock_;
  const ExecutionConfig config_;

  std::mutex escalation_mutex_;
  EscalationHandler escalation_;
};

}  // namespace warden
