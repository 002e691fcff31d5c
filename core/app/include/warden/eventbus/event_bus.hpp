#pragma once

#include "warden/events/event.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace warden {

// -----------------------------------------------------------------------------
// EventBus
// -----------------------------------------------------------------------------
// Responsibility: Publish-subscribe channel owned by each EventLoopThread.
// The signal loop's bus delivers SignalEvent to WardenEngine; the notify
// loop's bus fans NotificationEvent, OrderUpdateEvent, PositionUpdateEvent
// and SafetyTransitionEvent out to the IPC telemetry bridge and to any test
// subscriber.
//
// Thread model: subscribe, unsubscribe and publish are safe from any
// thread. Callbacks run synchronously on the publishing thread, outside
// the bus mutex, so a callback may itself publish or unsubscribe.
//
// The subscriber list is copy-on-write: subscribe/unsubscribe install a new
// immutable list, publish only takes a shared_ptr to the current one.
// Subscriptions change at startup and shutdown, publishes happen per event.
// -----------------------------------------------------------------------------
class EventBus {
 public:
  using GenericCallback = std::function<void(const Event&)>;
  using SubscriptionId = std::size_t;

  EventBus() = default;

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  // Registers a callback for every event regardless of alternative.
  SubscriptionId subscribe(GenericCallback callback);

  // Registers a callback that only fires when the event holds EventType.
  template <typename EventType>
  SubscriptionId subscribe(std::function<void(const EventType&)> callback);

  // After this returns the callback will not run for later publishes. A
  // publish already in flight on another thread may still invoke it once.
  void unsubscribe(SubscriptionId id);

  // Invokes every subscriber on the calling thread before returning.
  void publish(const Event& event);

  std::size_t subscriberCount() const;

 private:
  using SubscriberEntry = std::pair<SubscriptionId, GenericCallback>;
  using SubscriberList = std::vector<SubscriberEntry>;

  std::shared_ptr<const SubscriberList> snapshot() const;

  mutable std::mutex mutex_;
  SubscriptionId next_id_{0};
  std::shared_ptr<const SubscriberList> subscribers_{
      std::make_shared<const SubscriberList>()};
};

// Typed subscribe: wrap in a generic callback that filters with get_if.
template <typename EventType>
EventBus::SubscriptionId EventBus::subscribe(
    std::function<void(const EventType&)> callback) {
  GenericCallback wrapped = [cb = std::move(callback)](const Event& event) {
    if (const auto* ptr = std::get_if<EventType>(&event)) {
      cb(*ptr);
    }
  };
  return subscribe(std::move(wrapped));
}

}  // namespace warden
