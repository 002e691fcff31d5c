#pragma once

#include "warden/domain/order.hpp"
#include "warden/domain/order_status.hpp"
#include "warden/notify/i_notification_sink.hpp"
#include "warden/time/i_time_provider.hpp"

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace warden {

// -----------------------------------------------------------------------------
// OrderTracker: order status state machine and active order book
// -----------------------------------------------------------------------------
//
// @brief  Tracks every order the engine placed from submission to terminal
//         state, enforcing legal status transitions and publishing an
//         OrderUpdateEvent for each one.
//
// @details
// Orders enter through track() with the snapshot returned by placeOrder().
// Later snapshots (from getOpenOrders() polling or from the paper venue)
// go through apply(), which validates the status change against the graph:
//
//   New ──> Submitted ──> Accepted ──> PartiallyFilled ──> Filled
//    │          │            │               │
//    └──────────┴────────────┴───────────────┴──> Canceled / Rejected / Failed
//
// Illegal transitions are logged and ignored; the order keeps its state.
// Repeating the current status with a larger fill is accepted (partial
// fills arrive as PartiallyFilled → PartiallyFilled).
//
// Terminal orders are dropped from the active map; their last snapshot is
// still published.
//
// Thread model:
//   Called from the signal loop, the reconciliation worker and the
//   lifecycle manager under symbol locks for different symbols, so the map
//   has its own mutex. The sink is invoked after the mutex is released.
// -----------------------------------------------------------------------------
class OrderTracker {
 public:
  OrderTracker(INotificationSink& sink, const ITimeProvider& clock);

  OrderTracker(const OrderTracker&) = delete;
  OrderTracker& operator=(const OrderTracker&) = delete;
  OrderTracker(OrderTracker&&) = delete;
  OrderTracker& operator=(OrderTracker&&) = delete;

  // Registers a freshly placed order.
  void track(const domain::Order& order);

  // Applies a newer exchange snapshot. Returns false when the order is
  // unknown or the transition is illegal.
  bool apply(const domain::Order& snapshot);

  // Marks an order canceled locally after a confirmed cancel.
  void markCanceled(const std::string& order_id);

  std::optional<domain::Order> find(const std::string& order_id) const;
  std::vector<domain::Order> active() const;
  std::vector<domain::Order> activeFor(const std::string& symbol) const;

  static bool transitionStatus(domain::OrderStatus current,
                               domain::OrderStatus next);
  static bool isTerminal(domain::OrderStatus status);

 private:
  void emit(const domain::Order& order, domain::OrderStatus previous);

  INotificationSink& sink_;
  const ITimeProvider& clock_;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, domain::Order> active_orders_;
};

}  // namespace warden
