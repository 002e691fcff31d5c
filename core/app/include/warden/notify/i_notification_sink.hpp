#pragma once

#include "warden/concurrent/event_loop_thread.hpp"
#include "warden/events/event.hpp"

namespace warden {

// -----------------------------------------------------------------------------
// INotificationSink: outbound operator notices and telemetry
// -----------------------------------------------------------------------------
//
// @brief  Fire-and-forget channel from the core to whoever is listening.
//
// @details
// notify() carries operator-facing notices (pending confirmations,
// fallbacks, findings, escalations). publish() carries state telemetry
// (order, position and safety updates). Implementations must never block
// the caller on delivery and must never throw back into it.
//
// Production wiring pushes both into the notify EventLoopThread, whose bus
// feeds the IPC PUB socket. Tests plug in a recording sink.
// -----------------------------------------------------------------------------
class INotificationSink {
 public:
  virtual ~INotificationSink() = default;

  virtual void notify(NotificationEvent event) = 0;
  virtual void publish(Event event) = 0;
};

// Enqueues into an EventLoopThread; delivery happens on that loop's thread.
class QueueNotificationSink final : public INotificationSink {
 public:
  explicit QueueNotificationSink(EventLoopThread& loop) : loop_(loop) {}

  void notify(NotificationEvent event) override {
    loop_.push(Event{std::move(event)});
  }

  void publish(Event event) override { loop_.push(std::move(event)); }

 private:
  EventLoopThread& loop_;
};

}  // namespace warden
