#pragma once

#include "warden/events/notification_event.hpp"
#include "warden/events/order_update_event.hpp"
#include "warden/events/position_update_event.hpp"
#include "warden/events/safety_transition_event.hpp"
#include "warden/events/signal_event.hpp"

#include <variant>

namespace warden {

// -----------------------------------------------------------------------------
// Event (type alias)
// -----------------------------------------------------------------------------
// Responsibility: The single envelope carried by every EventBus and
// ThreadSafeQueue in the engine.
//
// Inbound:   SignalEvent (ingestion → signal loop).
// Outbound:  OrderUpdateEvent, PositionUpdateEvent, SafetyTransitionEvent,
//            NotificationEvent (core → notify loop → IPC telemetry).
//
// std::variant keeps dispatch type-safe: subscribers use the typed
// EventBus::subscribe<T>() overload, which filters with std::get_if.
// -----------------------------------------------------------------------------
using Event = std::variant<
    SignalEvent,
    OrderUpdateEvent,
    PositionUpdateEvent,
    SafetyTransitionEvent,
    NotificationEvent>;

}  // namespace warden
