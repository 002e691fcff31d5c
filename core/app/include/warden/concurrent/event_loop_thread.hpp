#pragma once

#include "warden/concurrent/thread_safe_queue.hpp"
#include "warden/eventbus/event_bus.hpp"
#include "warden/events/event.hpp"

#include <atomic>
#include <string>
#include <thread>

namespace warden {

// -----------------------------------------------------------------------------
// EventLoopThread
// -----------------------------------------------------------------------------
//
// @brief  One worker thread draining a ThreadSafeQueue<Event> into an
//         EventBus, so every subscriber of that bus runs on this thread.
//
// @details
// WardenEngine owns two of these:
//
//   signal_loop: serializes inbound SignalEvents. Risk evaluation and plan
//               submission for one signal complete before the next one is
//               looked at, which keeps the ledger idempotency check and the
//               decision record atomic with respect to each other.
//   notify_loop: drains notifications and telemetry. Producers only push,
//               so a slow subscriber here never delays a core decision.
//
// Thread model: start()/stop() from the owning thread; push() from any.
// Ownership: owns its thread, queue and bus. Non-copyable, non-movable.
// -----------------------------------------------------------------------------
class EventLoopThread {
 public:
  explicit EventLoopThread(std::string name = "loop");

  // Stops and joins so the worker never outlives the queue and bus.
  ~EventLoopThread();

  EventLoopThread(const EventLoopThread&) = delete;
  EventLoopThread& operator=(const EventLoopThread&) = delete;
  EventLoopThread(EventLoopThread&&) = delete;
  EventLoopThread& operator=(EventLoopThread&&) = delete;

  // Idempotent.
  void start();

  // Signals the worker and joins it. Events queued before the call are
  // still dispatched. Idempotent; start() may be called again afterwards.
  void stop();

  void push(Event event) { queue_.push(std::move(event)); }

  EventBus& eventBus() { return bus_; }
  const EventBus& eventBus() const { return bus_; }

  const std::string& name() const { return name_; }

  // Number of events waiting to be dispatched.
  std::size_t backlog() const { return queue_.size(); }

 private:
  // pop_for() with a short timeout, so stop() is observed within one idle
  // period without busy-waiting.
  void run();
  void dispatch(const Event& event);

  const std::string name_;
  ThreadSafeQueue<Event> queue_;
  EventBus bus_;
  std::atomic<bool> running_{false};
  std::thread thread_;
};

}  // namespace warden
