#include "warden/concurrent/periodic_worker.hpp"

#include <exception>
#include <iostream>

namespace warden {

PeriodicWorker::PeriodicWorker(std::string name,
                               std::chrono::milliseconds interval, Task task,
                               ErrorCallback on_error)
    : name_(std::move(name)),
      interval_(interval),
      task_(std::move(task)),
      on_error_(std::move(on_error)) {}

PeriodicWorker::~PeriodicWorker() { stop(); }

void PeriodicWorker::start() {
  if (thread_.joinable()) {
    return;
  }
  running_.store(true);
  thread_ = std::thread([this] { run(); });
}

void PeriodicWorker::stop() {
  if (!thread_.joinable()) {
    return;
  }
  {
    std::lock_guard lock(mutex_);
    running_.store(false);
  }
  cv_.notify_all();
  thread_.join();
}

void PeriodicWorker::wake() {
  {
    std::lock_guard lock(mutex_);
    wake_requested_ = true;
  }
  cv_.notify_all();
}

void PeriodicWorker::run() {
  while (running_.load()) {
    try {
      task_();
    } catch (const std::exception& e) {
      std::cerr << "[PeriodicWorker:" << name_ << "] iteration failed: "
                << e.what() << "\n";
      if (on_error_) {
        on_error_(e.what());
      }
    }
    iterations_.fetch_add(1);

    std::unique_lock lock(mutex_);
    cv_.wait_for(lock, interval_,
                 [this] { return !running_.load() || wake_requested_; });
    wake_requested_ = false;
  }
}

}  // namespace warden
