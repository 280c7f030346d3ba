#include "folio/concurrent/event_loop_thread.hpp"

#include <iostream>

namespace folio {

EventLoopThread::~EventLoopThread() { stop(); }

void EventLoopThread::start() {
  if (thread_.joinable()) {
    return;
  }
  queue_.reopen();
  running_.store(true);
  thread_ = std::thread([this] { run(); });
}

void EventLoopThread::stop() {
  if (!thread_.joinable()) {
    return;
  }
  std::size_t backlog = queue_.size();
  queue_.close();
  thread_.join();
  running_.store(false);

  if (backlog > 0) {
    std::cout << "[EventLoopThread] drained " << backlog
              << " pending event(s) before stopping.\n";
  }
}

// -----------------------------------------------------------------------------
// run(): blocking pop until the queue is closed and empty
// -----------------------------------------------------------------------------
void EventLoopThread::run() {
  while (auto event = queue_.pop()) {
    bus_.publish(*event);
    ++dispatched_;
  }
}

}  // namespace folio
