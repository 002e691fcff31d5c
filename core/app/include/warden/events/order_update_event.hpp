#pragma once

#include "warden/domain/order.hpp"
#include "warden/domain/order_status.hpp"

#include <cstdint>

namespace warden {

// -----------------------------------------------------------------------------
// OrderUpdateEvent
// -----------------------------------------------------------------------------
//
// @brief  Published by OrderTracker whenever a tracked order changes status.
//
// @details
// order is a snapshot taken after the transition; previous_status is the
// state it left. Subscribers (IPC telemetry, tests) observe the lifecycle
// without touching the tracker's internal map.
//
// Plain value type; safe to copy across threads inside the Event variant.
// -----------------------------------------------------------------------------
struct OrderUpdateEvent {
  domain::Order order;
  domain::OrderStatus previous_status{domain::OrderStatus::New};
  std::int64_t timestamp_ms{0};
};

}  // namespace warden
