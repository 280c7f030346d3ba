#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace folio {

// -----------------------------------------------------------------------------
// ThreadSafeQueue<T>
// -----------------------------------------------------------------------------
//
// @brief  Unbounded multi-producer FIFO with a close() handshake for the
//         consumer.
//
// @details
// The feed thread, the IPC thread and test code push Events; the accounting
// loop pops them in arrival order. Telemetry takes the opposite direction
// (accounting loop -> IPC thread) through a second instance.
//
// Closing:
//   close() does not discard anything. pop() keeps returning queued items
//   and only returns std::nullopt once the queue is both closed and empty,
//   so a consumer that loops on pop() drains every event pushed before the
//   close. push() after close() is still accepted and stays queued for the
//   next consumer after reopen().
//
// Thread model: every method is safe from any thread. pop() blocks;
// try_pop() never does.
// -----------------------------------------------------------------------------
template <typename T>
class ThreadSafeQueue {
 public:
  ThreadSafeQueue() = default;

  ThreadSafeQueue(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue(ThreadSafeQueue&&) = delete;
  ThreadSafeQueue& operator=(ThreadSafeQueue&&) = delete;

  void push(T value) {
    {
      std::lock_guard lock(mutex_);
      items_.push_back(std::move(value));
    }
    ready_.notify_one();
  }

  // Blocks until an item is available or the queue is closed and drained.
  std::optional<T> pop() {
    std::unique_lock lock(mutex_);
    ready_.wait(lock, [this] { return !items_.empty() || closed_; });
    return takeFront();
  }

  std::optional<T> try_pop() {
    std::lock_guard lock(mutex_);
    return takeFront();
  }

  // Wakes every blocked pop(). Idempotent.
  void close() {
    {
      std::lock_guard lock(mutex_);
      closed_ = true;
    }
    ready_.notify_all();
  }

  void reopen() {
    std::lock_guard lock(mutex_);
    closed_ = false;
  }

  bool isClosed() const {
    std::lock_guard lock(mutex_);
    return closed_;
  }

  bool empty() const {
    std::lock_guard lock(mutex_);
    return items_.empty();
  }

  std::size_t size() const {
    std::lock_guard lock(mutex_);
    return items_.size();
  }

 private:
  // Caller holds mutex_.
  std::optional<T> takeFront() {
    if (items_.empty()) {
      return std::nullopt;
    }
    std::optional<T> value(std::move(items_.front()));
    items_.pop_front();
    return value;
  }

  mutable std::mutex mutex_;
  std::condition_variable ready_;
  std::deque<T> items_;
  bool closed_{false};
};

}  // namespace folio
