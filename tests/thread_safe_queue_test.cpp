// =============================================================================
// thread_safe_queue_test.cpp
// =============================================================================
// Unit tests for warden::ThreadSafeQueue<T>.
//
// Validates:
//   - FIFO ordering
//   - try_pop() / pop_for() on empty and non-empty queues
//   - Blocking pop() wakes on a push from another thread
//   - drain() takes everything in order and leaves the queue empty
//   - Move-only payloads (the queue never copies)
//   - No loss or duplication under multi-producer / multi-consumer load
//
// Threading model: every spawned thread is joined before assertions.
// =============================================================================

#include "warden/concurrent/thread_safe_queue.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

class ThreadSafeQueueTest : public ::testing::Test {
 protected:
  warden::ThreadSafeQueue<int> queue;
};

// -----------------------------------------------------------------------------
// 1. Ordering.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, FifoOrder) {
  EXPECT_TRUE(queue.empty());
  for (int i = 0; i < 50; ++i) {
    queue.push(i);
  }
  EXPECT_EQ(queue.size(), 50u);

  for (int i = 0; i < 50; ++i) {
    EXPECT_EQ(queue.pop(), i) << "FIFO violated at index " << i;
  }
  EXPECT_TRUE(queue.empty());
}

// -----------------------------------------------------------------------------
// 2. Non-blocking and bounded waits.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, TryPop) {
  EXPECT_FALSE(queue.try_pop().has_value());
  queue.push(7);
  auto item = queue.try_pop();
  ASSERT_TRUE(item.has_value());
  EXPECT_EQ(*item, 7);
}

TEST_F(ThreadSafeQueueTest, PopForTimesOutWhenEmpty) {
  const auto started = std::chrono::steady_clock::now();
  EXPECT_FALSE(queue.pop_for(std::chrono::milliseconds(20)).has_value());
  EXPECT_GE(std::chrono::steady_clock::now() - started,
            std::chrono::milliseconds(15));

  queue.push(3);
  auto item = queue.pop_for(std::chrono::milliseconds(20));
  ASSERT_TRUE(item.has_value());
  EXPECT_EQ(*item, 3);
}

TEST_F(ThreadSafeQueueTest, PopForWakesOnPush) {
  std::optional<int> received;
  std::thread consumer(
      [&] { received = queue.pop_for(std::chrono::seconds(2)); });

  std::this_thread::sleep_for(std::chrono::milliseconds(10));
  queue.push(11);
  consumer.join();

  ASSERT_TRUE(received.has_value());
  EXPECT_EQ(*received, 11);
}

// -----------------------------------------------------------------------------
// 3. Blocking pop.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, BlockingPopWaitsForPush) {
  std::atomic<int> received{-1};
  std::thread consumer([this, &received] { received.store(queue.pop()); });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  EXPECT_EQ(received.load(), -1);

  queue.push(77);
  consumer.join();
  EXPECT_EQ(received.load(), 77);
}

// -----------------------------------------------------------------------------
// 4. drain().
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, DrainTakesEverythingInOrder) {
  EXPECT_TRUE(queue.drain().empty());

  queue.push(1);
  queue.push(2);
  queue.push(3);
  auto items = queue.drain();

  ASSERT_EQ(items.size(), 3u);
  EXPECT_EQ(items.front(), 1);
  EXPECT_EQ(items.back(), 3);
  EXPECT_TRUE(queue.empty());
}

TEST(ThreadSafeQueueMoveOnlyTest, CarriesUniquePtr) {
  warden::ThreadSafeQueue<std::unique_ptr<std::string>> queue;
  queue.push(std::make_unique<std::string>("signal"));
  queue.push(std::make_unique<std::string>("notice"));

  auto first = queue.pop();
  ASSERT_NE(first, nullptr);
  EXPECT_EQ(*first, "signal");

  auto rest = queue.drain();
  ASSERT_EQ(rest.size(), 1u);
  EXPECT_EQ(*rest.front(), "notice");
}

// -----------------------------------------------------------------------------
// 5. Multi-producer / multi-consumer: every item popped exactly once.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, ConcurrentPushPop) {
  constexpr int kProducers = 4;
  constexpr int kConsumers = 4;
  constexpr int kItemsPerProducer = 1000;
  constexpr int kTotalItems = kProducers * kItemsPerProducer;

  std::vector<std::thread> producers;
  for (int p = 0; p < kProducers; ++p) {
    producers.emplace_back([this, p] {
      const int start = p * kItemsPerProducer;
      for (int i = start; i < start + kItemsPerProducer; ++i) {
        queue.push(i);
      }
    });
  }

  std::atomic<int> consumed{0};
  std::vector<std::vector<int>> per_consumer(kConsumers);
  std::vector<std::thread> consumers;
  for (int c = 0; c < kConsumers; ++c) {
    consumers.emplace_back([this, c, &consumed, &per_consumer] {
      while (consumed.load() < kTotalItems) {
        if (auto item = queue.pop_for(std::chrono::milliseconds(1))) {
          per_consumer[c].push_back(*item);
          consumed.fetch_add(1);
        }
      }
    });
  }

  for (auto& t : producers) t.join();
  for (auto& t : consumers) t.join();

  std::vector<int> all;
  for (const auto& v : per_consumer) {
    all.insert(all.end(), v.begin(), v.end());
  }
  std::sort(all.begin(), all.end());

  ASSERT_EQ(static_cast<int>(all.size()), kTotalItems);
  for (int i = 0; i < kTotalItems; ++i) {
    EXPECT_EQ(all[i], i) << "Missing or duplicate item at index " << i;
  }
}
