#pragma once

#include "folio/concurrent/thread_safe_queue.hpp"
#include "folio/eventbus/event_bus.hpp"
#include "folio/events/event.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <thread>

namespace folio {

// -----------------------------------------------------------------------------
// EventLoopThread: the accounting loop
// -----------------------------------------------------------------------------
//
// @brief  One worker thread that drains a ThreadSafeQueue<Event> into an
//         EventBus, in push order.
//
// @details
// Every subscriber of eventBus() runs on the worker, so the PositionEngine
// and the Portfolio see fills, quotes and account states in arrival order and
// never concurrently with each other. This is the single writer of the
// accounting core.
//
// stop() closes the queue and joins: the worker first delivers every event
// pushed before stop(), so a fill that was accepted always reaches the
// PositionEngine and its Opened/Closed pair is published in full. Events
// pushed while the loop is stopped stay queued for the next start().
//
// Thread model:
//   start(), stop() from the owning thread; push() from any thread.
//   Subscribers run on the worker thread only.
// -----------------------------------------------------------------------------
class EventLoopThread {
 public:
  EventLoopThread() = default;
  ~EventLoopThread();

  EventLoopThread(const EventLoopThread&) = delete;
  EventLoopThread& operator=(const EventLoopThread&) = delete;
  EventLoopThread(EventLoopThread&&) = delete;
  EventLoopThread& operator=(EventLoopThread&&) = delete;

  // Idempotent.
  void start();

  // Drains the queue, then joins the worker. Idempotent.
  void stop();

  void push(Event event) { queue_.push(std::move(event)); }

  bool isRunning() const { return running_.load(); }
  std::size_t pending() const { return queue_.size(); }

  // Events delivered to the bus since construction.
  std::uint64_t dispatchedCount() const { return dispatched_.load(); }

  EventBus& eventBus() { return bus_; }
  const EventBus& eventBus() const { return bus_; }

 private:
  void run();

  ThreadSafeQueue<Event> queue_;
  EventBus bus_;

  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> dispatched_{0};
  std::thread thread_;
};

}  // namespace folio
