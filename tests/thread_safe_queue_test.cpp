// =============================================================================
// thread_safe_queue_test.cpp
// =============================================================================
// Unit tests for qfolio::ThreadSafeQueue<T>, the hand-off between the cycle
// thread and the AuditPublisher worker.
//
// Validates:
//   - FIFO ordering of serialized audit records
//   - try_pop() on empty and non-empty queues, size()
//   - pop_for() wakes on push and times out when nothing arrives
//   - A bounded queue evicts the oldest record and counts it
//   - No lost or duplicated records under concurrent producers/consumers
// =============================================================================

#include "qfolio/concurrent/thread_safe_queue.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <optional>
#include <string>
#include <thread>
#include <vector>

class ThreadSafeQueueTest : public ::testing::Test {
 protected:
  qfolio::ThreadSafeQueue<std::string> queue;

  static std::string record(int sequence) {
    return "{\"sequence\":" + std::to_string(sequence) + "}";
  }
};

// -----------------------------------------------------------------------------
// 1. A new queue is empty.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, EmptyOnConstruction) {
  EXPECT_TRUE(queue.empty());
  EXPECT_EQ(queue.size(), 0u);
}

// -----------------------------------------------------------------------------
// 2. Records come out in the order they were pushed.
// Why: Audit subscribers rebuild a cycle from the record order.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, PreservesRecordOrder) {
  for (int i = 1; i <= 50; ++i) {
    queue.push(record(i));
  }
  EXPECT_EQ(queue.size(), 50u);

  for (int i = 1; i <= 50; ++i) {
    EXPECT_EQ(queue.try_pop().value_or(""), record(i)) << "order broken at " << i;
  }
  EXPECT_TRUE(queue.empty());
}

// -----------------------------------------------------------------------------
// 3. try_pop() returns nullopt when empty and the front item otherwise.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, TryPopEmptyAndNonEmpty) {
  EXPECT_FALSE(queue.try_pop().has_value());

  queue.push(record(7));
  std::optional<std::string> item = queue.try_pop();
  ASSERT_TRUE(item.has_value());
  EXPECT_EQ(*item, record(7));
  EXPECT_FALSE(queue.try_pop().has_value());
}

// -----------------------------------------------------------------------------
// 4. pop_for() waits for a producer, and gives up after its timeout.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, TimedPopWaitsForPush) {
  EXPECT_FALSE(queue.pop_for(std::chrono::milliseconds(10)).has_value());

  std::atomic<bool> received{false};
  std::optional<std::string> value;

  std::thread consumer([this, &received, &value] {
    value = queue.pop_for(std::chrono::seconds(5));
    received.store(true);
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  EXPECT_FALSE(received.load());

  queue.push(record(1));
  consumer.join();

  EXPECT_TRUE(received.load());
  EXPECT_EQ(value.value_or(""), record(1));
}

// -----------------------------------------------------------------------------
// 5. A full bounded queue keeps the newest records.
//
// Why: a stalled subscriber must not grow the publisher's memory without
// bound; a live monitor wants the latest state.
// -----------------------------------------------------------------------------
TEST(BoundedThreadSafeQueueTest, EvictsOldestWhenFull) {
  qfolio::ThreadSafeQueue<int> bounded(3);
  EXPECT_EQ(bounded.capacity(), 3u);

  EXPECT_TRUE(bounded.push(1));
  EXPECT_TRUE(bounded.push(2));
  EXPECT_TRUE(bounded.push(3));
  EXPECT_FALSE(bounded.push(4));
  EXPECT_FALSE(bounded.push(5));

  EXPECT_EQ(bounded.size(), 3u);
  EXPECT_EQ(bounded.dropped(), 2u);
  EXPECT_EQ(bounded.try_pop().value_or(-1), 3);
  EXPECT_EQ(bounded.try_pop().value_or(-1), 4);
  EXPECT_EQ(bounded.try_pop().value_or(-1), 5);
  EXPECT_TRUE(bounded.empty());
}

// -----------------------------------------------------------------------------
// 6. Several producers and consumers: every record is taken exactly once.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, ConcurrentProducersAndConsumers) {
  constexpr int kProducers = 4;
  constexpr int kConsumers = 3;
  constexpr int kPerProducer = 500;
  constexpr int kTotal = kProducers * kPerProducer;

  std::vector<std::thread> producers;
  for (int p = 0; p < kProducers; ++p) {
    producers.emplace_back([this, p] {
      for (int i = 0; i < kPerProducer; ++i) {
        queue.push(record(p * kPerProducer + i));
      }
    });
  }

  std::atomic<int> consumed{0};
  std::vector<std::vector<std::string>> taken(kConsumers);
  std::vector<std::thread> consumers;
  for (int c = 0; c < kConsumers; ++c) {
    consumers.emplace_back([this, c, &consumed, &taken] {
      while (consumed.load() < kTotal) {
        if (auto item = queue.try_pop()) {
          taken[c].push_back(std::move(*item));
          consumed.fetch_add(1);
        } else {
          std::this_thread::yield();
        }
      }
    });
  }

  for (auto& t : producers) t.join();
  for (auto& t : consumers) t.join();

  std::vector<std::string> all;
  for (auto& v : taken) {
    all.insert(all.end(), v.begin(), v.end());
  }
  ASSERT_EQ(static_cast<int>(all.size()), kTotal);

  std::vector<std::string> expected;
  for (int i = 0; i < kTotal; ++i) {
    expected.push_back(record(i));
  }
  std::sort(all.begin(), all.end());
  std::sort(expected.begin(), expected.end());
  EXPECT_EQ(all, expected);
  EXPECT_TRUE(queue.empty());
}
