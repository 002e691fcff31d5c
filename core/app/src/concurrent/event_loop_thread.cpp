#include "warden/concurrent/event_loop_thread.hpp"

#include <chrono>
#include <exception>
#include <iostream>

namespace warden {

namespace {

constexpr auto kIdleWaitTimeout = std::chrono::milliseconds(10);

}  // namespace

EventLoopThread::EventLoopThread(std::string name) : name_(std::move(name)) {}

EventLoopThread::~EventLoopThread() { stop(); }

void EventLoopThread::start() {
  if (thread_.joinable()) {
    return;
  }
  running_.store(true);
  thread_ = std::thread([this] { run(); });
}

void EventLoopThread::stop() {
  if (!thread_.joinable()) {
    return;
  }
  running_.store(false);
  thread_.join();
}

// -----------------------------------------------------------------------------
// run(): worker loop
// -----------------------------------------------------------------------------
void EventLoopThread::run() {
  while (running_.load()) {
    if (auto event = queue_.pop_for(kIdleWaitTimeout)) {
      dispatch(*event);
    }
  }

  // Final drain: events queued before stop() are still delivered.
  for (const auto& event : queue_.drain()) {
    dispatch(event);
  }
}

// A subscriber that throws must not take the loop down with it: the event is
// logged as failed and the loop carries on with the next one.
void EventLoopThread::dispatch(const Event& event) {
  try {
    bus_.publish(event);
  } catch (const std::exception& e) {
    std::cerr << "[EventLoopThread:" << name_ << "] subscriber threw: "
              << e.what() << "\n";
  }
}

}  // namespace warden
