#pragma once

// =============================================================================
// test_support.hpp
// =============================================================================
// Shared fixtures for the warden test suites.
//
//   RecordingSink     INotificationSink that keeps every notice and event in
//                     memory, so tests can assert on what operators would see.
//   fastExecutor()    ExecutorConfig with no pacing and 1 ms backoff.
//   LifecycleHarness  PaperExchangeGateway + the full lifecycle stack, wired
//                     the same way WardenEngine wires it.
// =============================================================================

#include "warden/capability/capability_cache.hpp"
#include "warden/concurrent/id_generator.hpp"
#include "warden/concurrent/symbol_lock_table.hpp"
#include "warden/exchange/paper_exchange_gateway.hpp"
#include "warden/exchange/rate_limited_executor.hpp"
#include "warden/ledger/ledger.hpp"
#include "warden/lifecycle/order_lifecycle_manager.hpp"
#include "warden/lifecycle/order_tracker.hpp"
#include "warden/lifecycle/position_book.hpp"
#include "warden/lifecycle/stop_loss_manager.hpp"
#include "warden/market/price_book.hpp"
#include "warden/market/symbol_registry.hpp"
#include "warden/notify/i_notification_sink.hpp"
#include "warden/risk/cooldown_tracker.hpp"
#include "warden/time/simulation_time_provider.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace warden {
namespace test {

constexpr std::int64_t kStartMs = 1'700'000'000'000;

class RecordingSink final : public INotificationSink {
 public:
  void notify(NotificationEvent event) override {
    std::lock_guard lock(mutex_);
    notices_.push_back(std::move(event));
  }

  void publish(Event event) override {
    std::lock_guard lock(mutex_);
    events_.push_back(std::move(event));
  }

  std::vector<NotificationEvent> notices() const {
    std::lock_guard lock(mutex_);
    return notices_;
  }

  std::vector<Event> events() const {
    std::lock_guard lock(mutex_);
    return events_;
  }

  bool hasCode(const std::string& code) const {
    std::lock_guard lock(mutex_);
    return std::any_of(notices_.begin(), notices_.end(),
                       [&](const NotificationEvent& e) { return e.code == code; });
  }

  std::size_t count(NotificationKind kind) const {
    std::lock_guard lock(mutex_);
    return static_cast<std::size_t>(
        std::count_if(notices_.begin(), notices_.end(),
                      [&](const NotificationEvent& e) { return e.kind == kind; }));
  }

 private:
  mutable std::mutex mutex_;
  std::vector<NotificationEvent> notices_;
  std::vector<Event> events_;
};

inline ExecutorConfig fastExecutor() {
  ExecutorConfig config;
  config.rate_per_second = 10000.0;
  config.burst = 10000.0;
  config.max_attempts = 3;
  config.backoff_base = std::chrono::milliseconds(1);
  config.backoff_cap = std::chrono::milliseconds(4);
  config.jitter_ratio = 0.0;
  return config;
}

// Lifecycle stack over the paper venue. Members are declared in dependency
// order; nothing here is movable.
struct LifecycleHarness {
  explicit LifecycleHarness(ExecutionConfig execution = {},
                            CapabilityConfig capability = {})
      : clock(kStartMs),
        paper(clock),
        executor(paper, fastExecutor()),
        ledger("", clock),
        capabilities(executor, clock, capability),
        symbols(executor, clock),
        prices(5000),
        cooldowns(300'000, 3, 3'600'000),
        tracker(sink, clock),
        book(sink, clock),
        stops(executor, capabilities, tracker, ledger, sink, ids, clock,
              execution),
        lifecycle(executor, book, tracker, stops, locks, symbols, prices,
                  cooldowns, ledger, sink, clock, execution) {
    paper.setPrice("BTCUSDT", 100.0);
  }

  // Plan for a LONG/SHORT entry as RiskEngine would produce it.
  domain::OrderPlan plan(const std::string& symbol, domain::PositionSide side,
                         double quantity, double entry, double stop,
                         domain::OrderType type = domain::OrderType::Limit) {
    domain::OrderPlan p;
    p.plan_id = ids.next("plan");
    p.signal_id = ids.next("sig");
    p.symbol = symbol;
    p.side = side;
    p.quantity = quantity;
    p.leverage = 5;
    p.entry_price = entry;
    p.stop_price = stop;
    p.entry.client_order_id = ids.next("entry");
    p.entry.symbol = symbol;
    p.entry.side = domain::entrySide(side);
    p.entry.kind = domain::OrderKind::Entry;
    p.entry.type = type;
    p.entry.quantity = quantity;
    p.entry.price = type == domain::OrderType::Limit ? entry : 0.0;
    p.entry.hold_side = side;
    p.entry.leverage = 5;
    return p;
  }

  std::vector<domain::Order> placed(domain::OrderKind kind) const {
    std::vector<domain::Order> out;
    for (const auto& o : paper.placedOrders()) {
      if (o.spec.kind == kind) {
        out.push_back(o);
      }
    }
    return out;
  }

  SimulationTimeProvider clock;
  PaperExchangeGateway paper;
  RateLimitedExecutor executor;
  Ledger ledger;
  RecordingSink sink;
  IdGenerator ids{"t"};
  SymbolLockTable locks;
  CapabilityCache capabilities;
  SymbolRegistry symbols;
  PriceBook prices;
  CooldownTracker cooldowns;
  OrderTracker tracker;
  PositionBook book;
  StopLossManager stops;
  OrderLifecycleManager lifecycle;
};

}  // namespace test
}  // namespace warden
