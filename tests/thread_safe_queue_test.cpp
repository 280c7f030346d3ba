// =============================================================================
// thread_safe_queue_test.cpp
// =============================================================================
// Unit tests for folio::ThreadSafeQueue<T>, instantiated with the Event
// variant that crosses the feed -> accounting loop boundary.
//
// Validates:
//   - FIFO delivery of events, including mixed alternatives
//   - try_pop() on empty and non-empty queues, size() bookkeeping
//   - Blocking pop() waking on a push from another thread
//   - No lost or duplicated events under several producers and consumers
//   - close(): pop() drains what is queued, then returns empty; reopen()
//     restores blocking
// =============================================================================

#include "folio/concurrent/thread_safe_queue.hpp"
#include "folio/events/event.hpp"

#include "test_fixtures.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <thread>
#include <variant>
#include <vector>

using namespace folio;

namespace {

Event tickWithSequence(std::uint64_t seq) {
  domain::QuoteTick tick = test::makeTick("AUDUSD.FXCM", "0.80501", "0.80505");
  tick.sequence_id = seq;
  return tick;
}

std::uint64_t sequenceOf(const Event& event) {
  return std::get<domain::QuoteTick>(event).sequence_id;
}

}  // namespace

class ThreadSafeQueueTest : public ::testing::Test {
 protected:
  ThreadSafeQueue<Event> queue;
};

// -----------------------------------------------------------------------------
// 1. A new queue is empty and try_pop() returns nothing.
// Why: The IPC thread polls telemetry with try_pop(); it must never block.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, EmptyOnConstruction) {
  EXPECT_TRUE(queue.empty());
  EXPECT_EQ(queue.size(), 0u);
  EXPECT_FALSE(queue.try_pop().has_value());
}

// -----------------------------------------------------------------------------
// 2. Events come out in the order they went in.
// Why: A fill must never overtake the quote that preceded it.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, FifoOrder) {
  constexpr std::uint64_t kCount = 50;
  for (std::uint64_t i = 0; i < kCount; ++i) {
    queue.push(tickWithSequence(i));
  }
  EXPECT_EQ(queue.size(), kCount);

  for (std::uint64_t i = 0; i < kCount; ++i) {
    EXPECT_EQ(sequenceOf(*queue.pop()), i) << "FIFO violated at index " << i;
  }
  EXPECT_TRUE(queue.empty());
}

// -----------------------------------------------------------------------------
// 3. Different alternatives of the variant keep their type and order.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, MixedEventKinds) {
  queue.push(test::makeAccountState("FXCM-001-SIMULATED", "USD", "1000000"));
  queue.push(test::makeFill("P-1", "AUDUSD.FXCM", domain::OrderSide::Buy,
                            "100000", "1.00000", "AUD", "USD"));
  queue.push(tickWithSequence(7));

  auto first = queue.try_pop();
  auto second = queue.try_pop();
  auto third = queue.try_pop();
  ASSERT_TRUE(first && second && third);

  EXPECT_TRUE(std::holds_alternative<AccountStateEvent>(*first));
  EXPECT_TRUE(std::holds_alternative<OrderFilledEvent>(*second));
  EXPECT_EQ(sequenceOf(*third), 7u);
  EXPECT_FALSE(queue.try_pop().has_value());
}

// -----------------------------------------------------------------------------
// 4. Blocking pop() waits until another thread pushes.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, BlockingPopWaitsForPush) {
  std::atomic<bool> received{false};
  std::uint64_t seq = 0;

  std::thread consumer([this, &received, &seq] {
    auto event = queue.pop();
    if (event) {
      seq = sequenceOf(*event);
    }
    received.store(true);
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  EXPECT_FALSE(received.load());

  queue.push(tickWithSequence(77));
  consumer.join();

  EXPECT_TRUE(received.load());
  EXPECT_EQ(seq, 77u);
}

// -----------------------------------------------------------------------------
// 5. Several producers and consumers: every event is popped exactly once.
// Why: The feed and IPC threads both push while the loop drains.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, ConcurrentPushPop) {
  constexpr int kProducers = 3;
  constexpr int kConsumers = 2;
  constexpr int kPerProducer = 500;
  constexpr int kTotal = kProducers * kPerProducer;

  std::vector<std::thread> producers;
  for (int p = 0; p < kProducers; ++p) {
    producers.emplace_back([this, p] {
      for (int i = 0; i < kPerProducer; ++i) {
        queue.push(tickWithSequence(
            static_cast<std::uint64_t>(p * kPerProducer + i)));
      }
    });
  }

  std::atomic<int> consumed{0};
  std::vector<std::vector<std::uint64_t>> seen(kConsumers);
  std::vector<std::thread> consumers;
  for (int c = 0; c < kConsumers; ++c) {
    consumers.emplace_back([this, c, &consumed, &seen] {
      while (consumed.load() < kTotal) {
        if (auto event = queue.try_pop()) {
          seen[c].push_back(sequenceOf(*event));
          consumed.fetch_add(1);
        } else {
          std::this_thread::yield();
        }
      }
    });
  }

  for (auto& t : producers) t.join();
  for (auto& t : consumers) t.join();

  std::vector<std::uint64_t> all;
  for (const auto& v : seen) {
    all.insert(all.end(), v.begin(), v.end());
  }
  std::sort(all.begin(), all.end());

  ASSERT_EQ(all.size(), static_cast<std::size_t>(kTotal));
  for (int i = 0; i < kTotal; ++i) {
    EXPECT_EQ(all[i], static_cast<std::uint64_t>(i));
  }
}

// -----------------------------------------------------------------------------
// 6. close() wakes a blocked consumer with an empty result.
// Why: EventLoopThread::stop() relies on this to end its worker.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, CloseWakesBlockedPop) {
  std::atomic<bool> returned{false};
  bool got_event = true;

  std::thread consumer([this, &returned, &got_event] {
    got_event = queue.pop().has_value();
    returned.store(true);
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  EXPECT_FALSE(returned.load());

  queue.close();
  consumer.join();

  EXPECT_TRUE(returned.load());
  EXPECT_FALSE(got_event);
  EXPECT_TRUE(queue.isClosed());
}

// -----------------------------------------------------------------------------
// 7. A closed queue still hands out everything queued before it reports
//    empty, and push() after close() is kept for the next consumer.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, ClosedQueueDrainsBeforeEmpty) {
  queue.push(tickWithSequence(1));
  queue.push(tickWithSequence(2));
  queue.close();
  queue.push(tickWithSequence(3));

  std::vector<std::uint64_t> drained;
  while (auto event = queue.pop()) {
    drained.push_back(sequenceOf(*event));
  }
  EXPECT_EQ(drained, (std::vector<std::uint64_t>{1, 2, 3}));

  queue.reopen();
  EXPECT_FALSE(queue.isClosed());
  queue.push(tickWithSequence(4));
  auto next = queue.pop();
  ASSERT_TRUE(next.has_value());
  EXPECT_EQ(sequenceOf(*next), 4u);
}
