#pragma once

#include "warden/concurrent/symbol_lock_table.hpp"
#include "warden/exchange/rate_limited_executor.hpp"
#include "warden/ledger/ledger.hpp"
#include "warden/lifecycle/order_lifecycle_manager.hpp"
#include "warden/lifecycle/position_book.hpp"
#include "warden/lifecycle/stop_loss_manager.hpp"
#include "warden/notify/i_notification_sink.hpp"
#include "warden/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <set>
#include <utility>
#include <string>
#include <vector>

namespace warden {

enum class FindingKind {
  MissingProtection,  // Open size with no live stop and no armed guard
  Orphan,             // Exchange position with no local record
  StopSizeMismatch,   // Live stop covers a different size than the position
  DuplicateRecord,    // More than one live local record for a symbol
  PositionGone,       // Local position the exchange no longer reports
  PendingProtection,  // protection_pending left over from an interrupted move
};

const char* toString(FindingKind kind);

struct ReconciliationFinding {
  FindingKind kind{FindingKind::MissingProtection};
  std::string symbol;
  std::string detail;
  bool repaired{false};
};

struct ReconciliationReport {
  std::vector<ReconciliationFinding> findings;
  int symbols_checked{0};
  int repairs{0};
  bool aborted{false};  // Yielded to a panic sweep
  std::int64_t started_at_ms{0};
  std::int64_t finished_at_ms{0};

  bool clean() const { return findings.empty() && !aborted; }
  int count(FindingKind kind) const;
};

struct ReconciliationConfig {
  // Orphans are notify-only unless the operator opts in to adoption.
  bool adopt_orphans{false};
  double orphan_stop_loss_pct{0.01};
};

// -----------------------------------------------------------------------------
// ReconciliationEngine: local intent vs. exchange truth
// -----------------------------------------------------------------------------
//
// @brief  One reconcileOnce() pass fetches exchange positions and open
//         orders, diffs them against PositionBook and repairs what is
//         unambiguous.
//
// @details
// Per symbol (under its SymbolLockTable lock):
//
//   local   exchange   action
//   -----   --------   -------------------------------------------------
//   none    open       ORPHAN: flag + notify; adopt and protect only when
//                      adopt_orphans is set.
//   open    none       POSITION_GONE: mark CLOSED, drop its protection.
//   open    open       size taken from the exchange; missing, mis-sized or
//                      pending protection re-placed via StopLossManager.
//   >1 live records    DUPLICATE_RECORD: flag only, oldest record is used.
//
// Idempotency: a pass with no drift issues no exchange write. Findings that
// persist across passes are ledgered and notified once, on first detection.
//
// Cancellation: abort_flag is checked before each symbol; when it is set
// the pass returns at once with aborted=true so the panic sweep gets the
// symbol locks.
//
// Errors: ExchangeError from the initial fetch propagates to the worker.
// Repair failures are reported as unrepaired findings.
// -----------------------------------------------------------------------------
class ReconciliationEngine {
 public:
  ReconciliationEngine(RateLimitedExecutor& executor, PositionBook& book,
                       OrderLifecycleManager& lifecycle,
                       StopLossManager& stops, SymbolLockTable& locks,
                       Ledger& ledger, INotificationSink& sink,
                       const ITimeProvider& clock,
                       const ReconciliationConfig& config,
                       const std::atomic<bool>& abort_flag);

  ReconciliationEngine(const ReconciliationEngine&) = delete;
  ReconciliationEngine& operator=(const ReconciliationEngine&) = delete;
  ReconciliationEngine(ReconciliationEngine&&) = delete;
  ReconciliationEngine& operator=(ReconciliationEngine&&) = delete;

  ReconciliationReport reconcileOnce();

  std::optional<ReconciliationReport> lastReport() const;
  std::uint64_t passCount() const { return passes_.load(); }

 private:
  void reconcileSymbol(const std::string& symbol,
                       const std::vector<domain::ExchangePosition>& positions,
                       const std::vector<domain::Order>& orders,
                       ReconciliationReport& report);
  void reconcileTracked(domain::Position& position,
                        const domain::ExchangePosition& live,
                        const std::vector<domain::Order>& orders,
                        ReconciliationReport& report);
  void handleOrphan(const domain::ExchangePosition& live,
                    const std::vector<domain::Order>& orders,
                    ReconciliationReport& report);

  void record(ReconciliationReport& report, ReconciliationFinding finding);
  bool firstSighting(FindingKind kind, const std::string& symbol);
  void clearSightings(const std::string& symbol);

  RateLimitedExecutor& executor_;
  PositionBook& book_;
  OrderLifecycleManager& lifecycle_;
  StopLossManager& stops_;
  SymbolLockTable& locks_;
  Ledger& ledger_;
  INotificationSink& sink_;
  const ITimeProvider& clock_;
  const ReconciliationConfig config_;
  const std::atomic<bool>& abort_flag_;

  // One pass at a time (periodic worker and the IPC RECONCILE command).
  std::mutex pass_mutex_;
  std::atomic<std::uint64_t> passes_{0};
  std::uint64_t adopted_{0};

  mutable std::mutex report_mutex_;
  std::optional<ReconciliationReport> last_report_;
  std::set<std::pair<FindingKind, std::string>> sightings_;
};

}  // namespace warden
