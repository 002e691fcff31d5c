#include "warden/lifecycle/order_tracker.hpp"

#include "warden/events/order_update_event.hpp"

#include <iostream>

namespace warden {

OrderTracker::OrderTracker(INotificationSink& sink, const ITimeProvider& clock)
    : sink_(sink), clock_(clock) {}

// -----------------------------------------------------------------------------
// transitionStatus
// -----------------------------------------------------------------------------
bool OrderTracker::transitionStatus(domain::OrderStatus current,
                                    domain::OrderStatus next) {
  using S = domain::OrderStatus;
  switch (current) {
    case S::New:
      return next == S::Submitted ||
             next == S::Accepted ||
             next == S::PartiallyFilled ||
             next == S::Filled ||
             next == S::Rejected ||
             next == S::Failed;
    case S::Submitted:
      return next == S::Accepted ||
             next == S::PartiallyFilled ||
             next == S::Filled ||
             next == S::Canceled ||
             next == S::Rejected ||
             next == S::Failed;
    case S::Accepted:
      return next == S::Accepted ||
             next == S::PartiallyFilled ||
             next == S::Filled ||
             next == S::Canceled ||
             next == S::Rejected;
    case S::PartiallyFilled:
      return next == S::PartiallyFilled ||
             next == S::Filled ||
             next == S::Canceled;
    case S::Filled:
    case S::Canceled:
    case S::Rejected:
    case S::Failed:
      return false;
  }
  return false;
}

bool OrderTracker::isTerminal(domain::OrderStatus status) {
  using S = domain::OrderStatus;
  return status == S::Filled ||
         status == S::Canceled ||
         status == S::Rejected ||
         status == S::Failed;
}

void OrderTracker::track(const domain::Order& order) {
  {
    std::lock_guard lock(mutex_);
    if (!isTerminal(order.status)) {
      active_orders_[order.order_id] = order;
    }
  }
  emit(order, domain::OrderStatus::New);
}

bool OrderTracker::apply(const domain::Order& snapshot) {
  domain::Order updated;
  domain::OrderStatus previous = domain::OrderStatus::New;
  {
    std::lock_guard lock(mutex_);
    auto it = active_orders_.find(snapshot.order_id);
    if (it == active_orders_.end()) {
      return false;
    }

    domain::Order& order = it->second;
    previous = order.status;
    if (previous == snapshot.status &&
        snapshot.filled_quantity <= order.filled_quantity) {
      return true;  // Nothing new
    }
    if (!transitionStatus(previous, snapshot.status)) {
      std::cerr << "[OrderTracker] WARNING: illegal transition for order_id="
                << snapshot.order_id << " from "
                << domain::toString(previous) << " to "
                << domain::toString(snapshot.status) << ". Skipping.\n";
      return false;
    }

    order.status = snapshot.status;
    order.filled_quantity = snapshot.filled_quantity;
    order.average_price = snapshot.average_price;
    updated = order;

    if (isTerminal(order.status)) {
      active_orders_.erase(it);
    }
  }
  emit(updated, previous);
  return true;
}

void OrderTracker::markCanceled(const std::string& order_id) {
  domain::Order updated;
  domain::OrderStatus previous = domain::OrderStatus::New;
  {
    std::lock_guard lock(mutex_);
    auto it = active_orders_.find(order_id);
    if (it == active_orders_.end()) {
      return;
    }
    previous = it->second.status;
    it->second.status = domain::OrderStatus::Canceled;
    updated = it->second;
    active_orders_.erase(it);
  }
  emit(updated, previous);
}

std::optional<domain::Order> OrderTracker::find(
    const std::string& order_id) const {
  std::lock_guard lock(mutex_);
  auto it = active_orders_.find(order_id);
  if (it == active_orders_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<domain::Order> OrderTracker::active() const {
  std::lock_guard lock(mutex_);
  std::vector<domain::Order> result;
  result.reserve(active_orders_.size());
  for (const auto& [id, order] : active_orders_) {
    result.push_back(order);
  }
  return result;
}

std::vector<domain::Order> OrderTracker::activeFor(
    const std::string& symbol) const {
  std::lock_guard lock(mutex_);
  std::vector<domain::Order> result;
  for (const auto& [id, order] : active_orders_) {
    if (order.spec.symbol == symbol) {
      result.push_back(order);
    }
  }
  return result;
}

void OrderTracker::emit(const domain::Order& order,
                        domain::OrderStatus previous) {
  OrderUpdateEvent update;
  update.order = order;
  update.previous_status = previous;
  update.timestamp_ms = clock_.now_ms();
  sink_.publish(Event{update});
}

}  // namespace warden
