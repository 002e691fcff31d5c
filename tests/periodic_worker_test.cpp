// =============================================================================
// periodic_worker_test.cpp
// =============================================================================
// Unit tests for warden::PeriodicWorker and warden::SymbolLockTable.
//
// Validates:
//   - The first iteration runs immediately after start()
//   - wake() runs the next iteration without waiting out the interval
//   - stop() interrupts the sleep; start()/stop() are idempotent
//   - A throwing task reaches the error callback and the worker keeps going
//   - Symbol locks exclude per symbol and never across symbols
//
// Threading model: every worker is stopped before assertions on counters
// that it could still change.
// =============================================================================

#include "warden/concurrent/periodic_worker.hpp"
#include "warden/concurrent/symbol_lock_table.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

constexpr std::chrono::milliseconds kLongInterval{60'000};

template <typename Pred>
bool waitFor(Pred pred, std::chrono::milliseconds timeout =
                            std::chrono::milliseconds(2000)) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  return pred();
}

}  // namespace

// -----------------------------------------------------------------------------
// 1. Scheduling.
// -----------------------------------------------------------------------------
TEST(PeriodicWorkerTest, FirstIterationRunsImmediately) {
  std::atomic<int> runs{0};
  warden::PeriodicWorker worker("first", kLongInterval,
                                [&runs] { runs.fetch_add(1); });
  EXPECT_EQ(worker.name(), "first");

  worker.start();
  worker.start();
  EXPECT_TRUE(waitFor([&] { return runs.load() == 1; }));

  const auto started = std::chrono::steady_clock::now();
  worker.stop();
  worker.stop();
  EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(5));
  EXPECT_EQ(runs.load(), 1);
  EXPECT_EQ(worker.iterations(), 1u);
}

TEST(PeriodicWorkerTest, WakeRunsNextIterationEarly) {
  std::atomic<int> runs{0};
  warden::PeriodicWorker worker("wake", kLongInterval,
                                [&runs] { runs.fetch_add(1); });

  worker.start();
  ASSERT_TRUE(waitFor([&] { return runs.load() == 1; }));

  worker.wake();
  EXPECT_TRUE(waitFor([&] { return runs.load() == 2; }));

  worker.wake();
  EXPECT_TRUE(waitFor([&] { return runs.load() == 3; }));
  worker.stop();
  EXPECT_EQ(runs.load(), 3);
}

TEST(PeriodicWorkerTest, WakeBeforeStartIsKept) {
  std::atomic<int> runs{0};
  warden::PeriodicWorker worker("early", kLongInterval,
                                [&runs] { runs.fetch_add(1); });

  worker.wake();
  worker.start();

  // The pending wake skips the first sleep.
  EXPECT_TRUE(waitFor([&] { return runs.load() == 2; }));
  worker.stop();
}

// -----------------------------------------------------------------------------
// 2. Failures.
// -----------------------------------------------------------------------------
TEST(PeriodicWorkerTest, ThrowingTaskReportsAndContinues) {
  std::atomic<int> runs{0};
  std::mutex mutex;
  std::vector<std::string> errors;

  warden::PeriodicWorker worker(
      "throwing", std::chrono::milliseconds(1),
      [&runs] {
        if (runs.fetch_add(1) == 0) {
          throw std::runtime_error("venue unreachable");
        }
      },
      [&](const std::string& what) {
        std::lock_guard lock(mutex);
        errors.push_back(what);
      });

  worker.start();
  EXPECT_TRUE(waitFor([&] { return runs.load() >= 3; }));
  worker.stop();

  ASSERT_EQ(errors.size(), 1u);
  EXPECT_EQ(errors[0], "venue unreachable");
  EXPECT_GE(worker.iterations(), 3u);
}

// -----------------------------------------------------------------------------
// 3. SymbolLockTable.
// -----------------------------------------------------------------------------
TEST(SymbolLockTableTest, SameSymbolWaitsOtherSymbolDoesNot) {
  warden::SymbolLockTable locks;
  auto held = locks.lock("BTCUSDT");
  ASSERT_TRUE(held.owns_lock());

  // A different symbol is available while BTCUSDT is held.
  auto other = std::async(std::launch::async, [&locks] {
    auto lock = locks.lock("ETHUSDT");
    return lock.owns_lock();
  });
  ASSERT_EQ(other.wait_for(std::chrono::seconds(2)), std::future_status::ready);
  EXPECT_TRUE(other.get());

  std::atomic<bool> acquired{false};
  std::thread waiter([&] {
    auto lock = locks.lock("BTCUSDT");
    acquired.store(true);
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  EXPECT_FALSE(acquired.load());

  held.unlock();
  waiter.join();
  EXPECT_TRUE(acquired.load());
}
