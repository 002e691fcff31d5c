#include "warden/reconcile/reconciliation_engine.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <sstream>

namespace warden {

namespace {

constexpr double kQtyEpsilon = 1e-9;

bool isStopOrder(const domain::Order& order) {
  return order.spec.kind == domain::OrderKind::StopLoss ||
         order.spec.type == domain::OrderType::Trigger;
}

const domain::Order* findOrder(const std::vector<domain::Order>& orders,
                               const std::string& order_id) {
  if (order_id.empty()) {
    return nullptr;
  }
  for (const auto& order : orders) {
    if (order.order_id == order_id) {
      return &order;
    }
  }
  return nullptr;
}

const domain::ExchangePosition* findLive(
    const std::vector<domain::ExchangePosition>& positions,
    const std::string& symbol, std::optional<domain::PositionSide> side) {
  for (const auto& ep : positions) {
    if (ep.symbol != symbol || ep.size <= kQtyEpsilon) {
      continue;
    }
    if (!side || ep.side == *side) {
      return &ep;
    }
  }
  return nullptr;
}

}  // namespace

const char* toString(FindingKind kind) {
  switch (kind) {
    case FindingKind::MissingProtection: return "MISSING_PROTECTION";
    case FindingKind::Orphan:            return "ORPHAN_POSITION";
    case FindingKind::StopSizeMismatch:  return "STOP_SIZE_MISMATCH";
    case FindingKind::DuplicateRecord:   return "DUPLICATE_RECORD";
    case FindingKind::PositionGone:      return "POSITION_GONE";
    case FindingKind::PendingProtection: return "PENDING_PROTECTION";
  }
  return "UNKNOWN";
}

int ReconciliationReport::count(FindingKind kind) const {
  return static_cast<int>(
      std::count_if(findings.begin(), findings.end(),
                    [kind](const auto& f) { return f.kind == kind; }));
}

ReconciliationEngine::ReconciliationEngine(
    RateLimitedExecutor& executor, PositionBook& book,
    OrderLifecycleManager& lifecycle, StopLossManager& stops,
    SymbolLockTable& locks, Ledger& ledger, INotificationSink& sink,
    const ITimeProvider& clock, const ReconciliationConfig& config,
    const std::atomic<bool>& abort_flag)
    : executor_(executor),
      book_(book),
      lifecycle_(lifecycle),
      stops_(stops),
      locks_(locks),
      ledger_(ledger),
      sink_(sink),
      clock_(clock),
      config_(config),
      abort_flag_(abort_flag) {}

// -----------------------------------------------------------------------------
// reconcileOnce
// -----------------------------------------------------------------------------
ReconciliationReport ReconciliationEngine::reconcileOnce() {
  std::lock_guard pass_lock(pass_mutex_);

  ReconciliationReport report;
  report.started_at_ms = clock_.now_ms();

  const auto positions = executor_.getPositions();
  const auto orders = executor_.getOpenOrders();

  std::set<std::string> symbols;
  for (const auto& pos : book_.exposure()) {
    symbols.insert(pos.symbol);
  }
  for (const auto& ep : positions) {
    if (ep.size > kQtyEpsilon) {
      symbols.insert(ep.symbol);
    }
  }

  for (const auto& symbol : symbols) {
    if (abort_flag_.load()) {
      std::cerr << "[ReconciliationEngine] yielding to panic sweep after "
                << report.symbols_checked << " symbols\n";
      report.aborted = true;
      break;
    }
    auto lock = locks_.lock(symbol);
    const std::size_t before = report.findings.size();
    reconcileSymbol(symbol, positions, orders, report);
    ++report.symbols_checked;
    if (report.findings.size() == before) {
      clearSightings(symbol);
    }
  }

  report.finished_at_ms = clock_.now_ms();
  ++passes_;

  if (!report.findings.empty()) {
    std::cout << "[ReconciliationEngine] pass " << passes_.load() << ": "
              << report.findings.size() << " findings, " << report.repairs
              << " repaired\n";
  }

  {
    std::lock_guard lock(report_mutex_);
    last_report_ = report;
  }
  return report;
}

std::optional<ReconciliationReport> ReconciliationEngine::lastReport() const {
  std::lock_guard lock(report_mutex_);
  return last_report_;
}

// -----------------------------------------------------------------------------
// Per symbol (lock held)
// -----------------------------------------------------------------------------
void ReconciliationEngine::reconcileSymbol(
    const std::string& symbol,
    const std::vector<domain::ExchangePosition>& positions,
    const std::vector<domain::Order>& orders, ReconciliationReport& report) {
  auto records = book_.recordsFor(symbol);

  if (records.size() > 1) {
    std::ostringstream detail;
    detail << records.size() << " live records:";
    for (const auto& r : records) {
      detail << " " << r.plan_id;
    }
    record(report, {FindingKind::DuplicateRecord, symbol, detail.str(), false});
  }

  if (records.empty()) {
    if (const auto* live = findLive(positions, symbol, std::nullopt)) {
      handleOrphan(*live, orders, report);
    }
    return;
  }

  domain::Position pos = records.front();
  const auto* live = findLive(positions, symbol, pos.side);

  if (live == nullptr) {
    using S = domain::PositionState;
    if (pos.size <= kQtyEpsilon || pos.state == S::Closing) {
      return;  // Entry still resting, or a close already in flight
    }
    if (pos.state == S::PartiallyFilled &&
        findOrder(orders, pos.entry_order_id) != nullptr) {
      return;
    }
    std::ostringstream detail;
    detail << "local size " << pos.size << " not reported by exchange";
    const std::string stop_id = pos.stop_order_id;
    const std::string reason = lifecycle_.flatCloseReasonLocked(pos);
    lifecycle_.markClosedLocked(pos, reason);
    if (reason == "STOP_LOSS_FILLED") {
      std::cout << "[ReconciliationEngine] " << symbol << " stop " << stop_id
                << " filled; record closed\n";
      return;
    }
    record(report, {FindingKind::PositionGone, symbol, detail.str(), true});
    ++report.repairs;
    return;
  }

  reconcileTracked(pos, *live, orders, report);
}

void ReconciliationEngine::reconcileTracked(
    domain::Position& pos, const domain::ExchangePosition& live,
    const std::vector<domain::Order>& orders, ReconciliationReport& report) {
  using S = domain::PositionState;
  bool changed = false;

  if (std::abs(pos.size - live.size) > kQtyEpsilon) {
    std::cout << "[ReconciliationEngine] " << pos.symbol << " size "
              << pos.size << " -> " << live.size << " (exchange)\n";
    pos.size = live.size;
    if (pos.average_entry <= 0.0) {
      pos.average_entry = live.entry_price;
    }
    if (pos.state == S::PendingEntry) {
      pos.state = S::PartiallyFilled;
    }
    changed = true;
  }

  // Refresh what the live stop actually covers.
  const domain::Order* stop = findOrder(orders, pos.stop_order_id);
  if (!pos.stop_order_id.empty() && stop == nullptr) {
    std::cerr << "[ReconciliationEngine] " << pos.symbol << " stop "
              << pos.stop_order_id << " no longer open\n";
    pos.stop_order_id.clear();
    pos.stop_order_size = 0.0;
    pos.stop_order_price = 0.0;
    changed = true;
  } else if (stop != nullptr) {
    pos.stop_order_size = stop->spec.quantity;
    pos.stop_order_price = stop->spec.trigger_price;
  }

  const bool pending = pos.protection_pending;
  const bool missing = !domain::hasProtection(pos);
  const bool mis_sized =
      stop != nullptr &&
      std::abs(stop->spec.quantity - pos.size) > kQtyEpsilon;

  if (!pending && !missing && !mis_sized) {
    if (changed) {
      book_.upsert(pos);
    }
    return;
  }

  ReconciliationFinding finding;
  finding.symbol = pos.symbol;
  std::ostringstream detail;
  if (pending) {
    finding.kind = FindingKind::PendingProtection;
    detail << "protection pending at stop " << pos.stop_price;
  } else if (missing) {
    finding.kind = FindingKind::MissingProtection;
    detail << "size " << pos.size << " without stop";
    if (!pos.unprotected_since_ms) {
      pos.unprotected_since_ms = clock_.now_ms();
    }
  } else {
    finding.kind = FindingKind::StopSizeMismatch;
    detail << "stop covers " << stop->spec.quantity << ", position is "
           << pos.size;
  }

  if (pos.stop_price <= 0.0 && pos.average_entry > 0.0) {
    // Nothing to protect against yet; fall back to the orphan distance.
    pos.stop_price = pos.side == domain::PositionSide::Long
                         ? pos.average_entry * (1.0 - config_.orphan_stop_loss_pct)
                         : pos.average_entry * (1.0 + config_.orphan_stop_loss_pct);
  }

  const ProtectionResult result = stops_.ensureStopLoss(pos, "reconcile");
  finding.repaired = result.ok && domain::hasProtection(pos);
  if (finding.repaired) {
    ++report.repairs;
    if (pos.state == S::PartiallyFilled &&
        pos.size + kQtyEpsilon >= pos.intended_size) {
      pos.state = S::FilledProtected;
    }
  } else {
    if (!pos.unprotected_since_ms && !domain::hasProtection(pos)) {
      pos.unprotected_since_ms = clock_.now_ms();
    }
    detail << " (repair failed: " << result.reason << ")";
  }
  finding.detail = detail.str();

  book_.upsert(pos);
  record(report, std::move(finding));
}

void ReconciliationEngine::handleOrphan(
    const domain::ExchangePosition& live,
    const std::vector<domain::Order>& orders, ReconciliationReport& report) {
  std::ostringstream detail;
  detail << domain::toString(live.side) << " " << live.size << " @ "
         << live.entry_price << " has no local record";

  if (!config_.adopt_orphans) {
    record(report, {FindingKind::Orphan, live.symbol, detail.str(), false});
    return;
  }

  const auto now = clock_.now_ms();
  domain::Position pos;
  pos.symbol = live.symbol;
  pos.side = live.side;
  pos.hold_side = live.side;
  pos.size = live.size;
  pos.intended_size = live.size;
  pos.average_entry = live.entry_price > 0.0 ? live.entry_price : live.mark_price;
  pos.plan_id = "adopted-" + live.symbol + "-" + std::to_string(++adopted_);
  pos.state = domain::PositionState::FilledProtected;
  pos.opened_at_ms = now;

  // Keep a stop the operator already placed, if there is one.
  for (const auto& order : orders) {
    if (order.spec.symbol == live.symbol && isStopOrder(order)) {
      pos.stop_order_id = order.order_id;
      pos.stop_order_size = order.spec.quantity;
      pos.stop_order_price = order.spec.trigger_price;
      pos.stop_price = order.spec.trigger_price;
      break;
    }
  }
  if (pos.stop_price <= 0.0) {
    const double pct = config_.orphan_stop_loss_pct;
    pos.stop_price = pos.side == domain::PositionSide::Long
                         ? pos.average_entry * (1.0 - pct)
                         : pos.average_entry * (1.0 + pct);
  }

  const ProtectionResult result = stops_.ensureStopLoss(pos, "adopt_orphan");
  const bool repaired = result.ok && domain::hasProtection(pos);
  if (!repaired) {
    pos.unprotected_since_ms = now;
    pos.state = domain::PositionState::PartiallyFilled;
  }
  book_.upsert(pos);

  detail << "; adopted as " << pos.plan_id;
  record(report, {FindingKind::Orphan, live.symbol, detail.str(), repaired});
  if (repaired) {
    ++report.repairs;
  }
}

// -----------------------------------------------------------------------------
// Reporting
// -----------------------------------------------------------------------------
void ReconciliationEngine::record(ReconciliationReport& report,
                                  ReconciliationFinding finding) {
  // Unrepaired findings that persist are reported on first sighting only.
  const bool announce =
      finding.repaired || firstSighting(finding.kind, finding.symbol);
  if (finding.repaired) {
    sightings_.erase({finding.kind, finding.symbol});
  }

  if (announce) {
    std::cerr << "[ReconciliationEngine] " << toString(finding.kind) << " "
              << finding.symbol << ": " << finding.detail
              << (finding.repaired ? " [repaired]" : "") << "\n";
    ledger_.append(LedgerKind::Reconciliation, finding.symbol,
                   {{"finding", toString(finding.kind)},
                    {"detail", finding.detail},
                    {"repaired", finding.repaired}});

    NotificationEvent event;
    event.kind = NotificationKind::Finding;
    event.symbol = finding.symbol;
    event.code = toString(finding.kind);
    event.message = finding.detail;
    event.timestamp_ms = clock_.now_ms();
    sink_.notify(std::move(event));
  }
  report.findings.push_back(std::move(finding));
}

bool ReconciliationEngine::firstSighting(FindingKind kind,
                                         const std::string& symbol) {
  return sightings_.insert({kind, symbol}).second;
}

void ReconciliationEngine::clearSightings(const std::string& symbol) {
  for (auto it = sightings_.begin(); it != sightings_.end();) {
    if (it->second == symbol) {
      it = sightings_.erase(it);
    } else {
      ++it;
    }
  }
}

}  // namespace warden
