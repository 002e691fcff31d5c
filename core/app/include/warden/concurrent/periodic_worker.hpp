#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace warden {

// -----------------------------------------------------------------------------
// PeriodicWorker
// -----------------------------------------------------------------------------
//
// @brief  Owns one thread that runs a task, sleeps for an interval, and
//         repeats until stopped.
//
// @details
// WardenEngine runs each independent polling concern on its own worker:
// account poller, price refresher / local-guard check, reconciliation,
// safety evaluation and capability refresh. Because each has its own
// thread, an exchange call that blocks on rate limiting or a slow response
// in one of them never delays the others.
//
// The sleep is a condition-variable wait, so stop() interrupts it
// immediately and wake() can pull the next iteration forward (used when a
// PANIC_CLOSE transition must be acted on within one interval).
//
// Failure handling: an exception escaping the task is caught, logged with
// the worker name and handed to the optional error callback (the engine
// counts it as an API error for the burst breaker). The worker keeps
// running.
//
// Thread model: start()/stop() from the owning thread; wake() from any.
// -----------------------------------------------------------------------------
class PeriodicWorker {
 public:
  using Task = std::function<void()>;
  using ErrorCallback = std::function<void(const std::string& what)>;

  PeriodicWorker(std::string name, std::chrono::milliseconds interval,
                 Task task, ErrorCallback on_error = nullptr);

  ~PeriodicWorker();

  PeriodicWorker(const PeriodicWorker&) = delete;
  PeriodicWorker& operator=(const PeriodicWorker&) = delete;
  PeriodicWorker(PeriodicWorker&&) = delete;
  PeriodicWorker& operator=(PeriodicWorker&&) = delete;

  // Spawns the thread; the first iteration runs immediately. Idempotent.
  void start();

  // Interrupts the sleep and joins. An iteration already running finishes
  // first. Idempotent.
  void stop();

  // Runs the next iteration without waiting for the interval to elapse.
  void wake();

  std::uint64_t iterations() const { return iterations_.load(); }
  const std::string& name() const { return name_; }

 private:
  void run();

  const std::string name_;
  const std::chrono::milliseconds interval_;
  Task task_;
  ErrorCallback on_error_;

  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> iterations_{0};
  bool wake_requested_{false};  // Guarded by mutex_
  std::mutex mutex_;
  std::condition_variable cv_;
  std::thread thread_;
};

}  // namespace warden
