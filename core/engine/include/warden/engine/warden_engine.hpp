#pragma once

#include "warden/capability/capability_cache.hpp"
#include "warden/concurrent/event_loop_thread.hpp"
#include "warden/concurrent/id_generator.hpp"
#include "warden/concurrent/periodic_worker.hpp"
#include "warden/concurrent/symbol_lock_table.hpp"
#include "warden/config/app_config.hpp"
#include "warden/exchange/i_exchange_gateway.hpp"
#include "warden/exchange/rate_limited_executor.hpp"
#include "warden/gateway/price_feed_gateway.hpp"
#include "warden/gateway/signal_gateway.hpp"
#include "warden/ledger/ledger.hpp"
#include "warden/lifecycle/order_lifecycle_manager.hpp"
#include "warden/lifecycle/order_tracker.hpp"
#include "warden/lifecycle/position_book.hpp"
#include "warden/lifecycle/stop_loss_manager.hpp"
#include "warden/market/price_book.hpp"
#include "warden/market/symbol_registry.hpp"
#include "warden/network/ipc_server.hpp"
#include "warden/notify/i_notification_sink.hpp"
#include "warden/reconcile/reconciliation_engine.hpp"
#include "warden/risk/cooldown_tracker.hpp"
#include "warden/risk/risk_engine.hpp"
#include "warden/safety/kill_switch.hpp"
#include "warden/safety/safety_supervisor.hpp"
#include "warden/time/i_time_provider.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace warden {

// Result of one submitSignal() call. status is one of DUPLICATE,
// IGNORED_EDIT, NON_SIGNAL, REJECTED, PENDING_CONFIRMATION, EXECUTED,
// FAILED; code carries the reject reason or the lifecycle result code.
struct SignalOutcome {
  std::string status;
  std::string code;
  std::string detail;
};

struct ReadinessCheck {
  std::string name;
  bool ok{true};
  std::string detail;
};

struct EngineMetrics {
  std::optional<double> equity;
  std::optional<double> peak_equity;
  int open_positions{0};
  int missing_stop_loss{0};
  int api_errors_in_window{0};
  std::uint64_t exchange_calls{0};
  std::uint64_t exchange_errors{0};
  std::uint64_t signals_received{0};
  std::uint64_t reconcile_passes{0};
};

// -----------------------------------------------------------------------------
// HealthSnapshot: read-only view for the STATUS / READY commands
// -----------------------------------------------------------------------------
// ready is the AND of every check. A local-guard stop running on a polled
// price feed only fails readiness when require_streaming_for_local_guard is
// set; otherwise it is reported as a passing check with a detail string.
// -----------------------------------------------------------------------------
struct HealthSnapshot {
  domain::SafetyState safety;
  std::vector<domain::Position> positions;
  std::vector<domain::CapabilityRecord> capabilities;
  PriceSource price_source{PriceSource::None};
  bool stop_loss_fallback{false};
  bool ready{false};
  std::vector<ReadinessCheck> checks;
  EngineMetrics metrics;
};

nlohmann::json toJson(const HealthSnapshot& health);

// -----------------------------------------------------------------------------
// WardenEngine
// -----------------------------------------------------------------------------
//
// @brief  Orchestrator that owns every component, thread and socket and
//         wires the signal path, the periodic workers and the safety
//         callbacks together.
//
// @details
// Signal path:
//   SignalGateway (ZMQ SUB) → signal_loop_ → submitSignal()
//     1. ledger idempotency (signal_id, then message_id/version)
//     2. MESSAGE_RECEIVED and PARSE_RESULT entries
//     3. edits and non-signals are recorded and stop here
//     4. ManageAction → OrderLifecycleManager; EntrySignal → RiskEngine →
//        RISK_DECISION entry → OrderLifecycleManager::submitPlan()
//   The RISK_DECISION entry is written before any exchange call, so a
//   redelivered signal_id can never produce a second placement.
//
// Periodic workers (each a PeriodicWorker thread):
//   account       getBalance() → last account snapshot
//   order_sync    OrderLifecycleManager::syncWithExchange()
//   prices        stream or polled prices → processLocalGuards()
//   reconcile     ReconciliationEngine::reconcileOnce()
//   safety        SafetySupervisor::evaluate()
//   capability    CapabilityCache::refreshExpired()
// Every task is also callable directly (runAccountPoll() etc.), which is
// how tests drive the engine without threads.
//
// Safety wiring (constructor):
//   executor errors        → SafetySupervisor::recordApiError
//   lifecycle escalations  → SafetySupervisor::reportEscalation
//   panic sweep            → OrderLifecycleManager::panicCloseAll
//   protective close       → OrderLifecycleManager::closePosition
//   reconciler abort flag  → SafetySupervisor::panicFlag()
//
// Thread model:
//   Constructed and destroyed on the caller's thread. The constructor builds
//   every component but spawns nothing; start() launches the loops, workers,
//   gateways and IpcServer; stop() joins them in reverse order.
//   submitSignal(), executeCommand() and healthSnapshot() are safe from any
//   thread.
//
// Ownership:
//   WardenEngine
//    ├── ids_, locks_                 (value members)
//    ├── notify_loop_, signal_loop_   (EventLoopThread value members)
//    ├── sink_                        (QueueNotificationSink → notify_loop_)
//    ├── ledger_, executor_, ...      (unique_ptr, dependency order)
//    └── workers_, gateways, ipc      (unique_ptr, created in start())
//   The gateway and the clock are non-owning references and must outlive
//   the engine. Members are declared so that everything holding a
//   reference is destroyed before what it refers to.
// -----------------------------------------------------------------------------
class WardenEngine {
 public:
  WardenEngine(AppConfig config, IExchangeGateway& gateway,
               const ITimeProvider& clock);
  ~WardenEngine();

  WardenEngine(const WardenEngine&) = delete;
  WardenEngine& operator=(const WardenEngine&) = delete;
  WardenEngine(WardenEngine&&) = delete;
  WardenEngine& operator=(WardenEngine&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  //
  // @brief  Brings the engine online.
  //
  // @details
  // Startup sequence:
  //   1. Apply the kill switch, probe plan-order support (see
  //      runStartupProbe) and poll the account once.
  //   2. Startup reconciliation pass (failures are logged, not fatal).
  //   3. Start the notify and signal loops and subscribe their handlers.
  //   4. Start IpcServer, then the periodic workers.
  //   5. Start the price feed and signal gateways LAST, so every consumer
  //      is live before the first message arrives.
  //
  // Idempotent.
  // -------------------------------------------------------------------------
  void start();

  // Stops inflow first, then workers, IPC and finally the loops. Idempotent.
  void stop();

  bool running() const { return running_.load(); }

  // Queues a signal onto the signal loop (the SignalGateway path).
  void pushSignal(domain::SignalEnvelope envelope);

  // Processes one signal synchronously on the calling thread.
  SignalOutcome submitSignal(const domain::SignalEnvelope& envelope);

  // Worker tasks, one iteration each.
  void runAccountPoll();
  void runOrderSync();
  void runPriceRefresh();
  ReconciliationReport runReconcile();
  void runSafetyCheck();
  void runCapabilityRefresh();

  // Forced plan-order probe. Anything but Supported runs the stop-loss mode
  // selection once, so PLAN_ORDER_FALLBACK is announced before the first
  // position; Unsupported also enters SAFE_MODE when
  // capability.safe_mode_on_unsupported is set and stops are trigger orders.
  void runStartupProbe();

  HealthSnapshot healthSnapshot() const;

  // -------------------------------------------------------------------------
  // executeCommand(cmd)
  // -------------------------------------------------------------------------
  //
  // @brief  IPC command handler; returns a JSON response string.
  //
  // @details
  // Commands: PING, STATUS, READY, SAFE, PANIC, RESET, RECONCILE,
  // KILL_SWITCH <none|safe|panic>. Unknown commands return
  // {"status":"error"}. Invoked on the IPC thread.
  // -------------------------------------------------------------------------
  std::string executeCommand(const std::string& cmd);

  // Bus of the notify loop: every NotificationEvent, OrderUpdateEvent,
  // PositionUpdateEvent and SafetyTransitionEvent is published here.
  EventBus& notificationBus();

  Ledger& ledger() { return *ledger_; }
  PositionBook& positions() { return *book_; }
  PriceBook& prices() { return *prices_; }
  SafetySupervisor& safety() { return *supervisor_; }
  OrderLifecycleManager& lifecycle() { return *lifecycle_; }
  ReconciliationEngine& reconciler() { return *reconciler_; }
  const AppConfig& config() const { return config_; }

 private:
  SignalOutcome handleEntry(const domain::SignalEnvelope& envelope,
                            const domain::EntrySignal& signal);
  SignalOutcome handleManage(const domain::SignalEnvelope& envelope,
                             const domain::ManageAction& action);
  void recordDecision(const domain::SignalEnvelope& envelope,
                      const std::string& symbol, const std::string& decision,
                      const std::string& code, bool executed,
                      nlohmann::json extra = nlohmann::json::object());
  std::optional<double> currentPrice(const std::string& symbol);
  std::optional<domain::AccountSnapshot> lastAccount() const;
  void onWorkerError(const std::string& worker, const std::string& what);
  void startWorkers();
  void wakeSafetyIfPanicPending();

  const AppConfig config_;
  IExchangeGateway& gateway_;
  const ITimeProvider& clock_;

  IdGenerator ids_;
  SymbolLockTable locks_;

  // Declared before every component so that they are destroyed last.
  EventLoopThread notify_loop_{"notify"};
  EventLoopThread signal_loop_{"signal"};
  std::unique_ptr<QueueNotificationSink> sink_;

  std::unique_ptr<Ledger> ledger_;
  std::unique_ptr<RateLimitedExecutor> executor_;
  std::unique_ptr<CapabilityCache> capabilities_;
  std::unique_ptr<SymbolRegistry> symbols_;
  std::unique_ptr<PriceBook> prices_;
  std::unique_ptr<CooldownTracker> cooldowns_;
  std::unique_ptr<RiskEngine> risk_;
  std::unique_ptr<OrderTracker> tracker_;
  std::unique_ptr<PositionBook> book_;
  std::unique_ptr<StopLossManager> stops_;
  std::unique_ptr<OrderLifecycleManager> lifecycle_;
  std::unique_ptr<KillSwitch> kill_switch_;
  std::unique_ptr<SafetySupervisor> supervisor_;
  std::unique_ptr<ReconciliationEngine> reconciler_;

  std::unique_ptr<IpcServer> ipc_server_;
  std::vector<std::unique_ptr<PeriodicWorker>> workers_;
  std::unique_ptr<PriceFeedGateway> price_feed_;
  std::unique_ptr<SignalGateway> signal_gateway_;

  std::mutex signal_mutex_;  // Serializes submitSignal()

  mutable std::mutex account_mutex_;
  std::optional<domain::AccountSnapshot> last_account_;
  std::int64_t last_account_ms_{0};

  std::atomic<bool> polled_fallback_noted_{false};
  std::atomic<std::uint64_t> signals_received_{0};
  std::vector<EventBus::SubscriptionId> signal_subscriptions_;
  std::vector<EventBus::SubscriptionId> notify_subscriptions_;
  std::atomic<bool> running_{false};
};

}  // namespace warden
