#pragma once

#include "folio/config/reference_data.hpp"
#include "folio/events/event.hpp"
#include "folio/gateway/feed_gateway.hpp"

#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace folio {

// -----------------------------------------------------------------------------
// FeedThread
// -----------------------------------------------------------------------------
// Runs a FeedGateway's recv loop on its own std::thread. The gateway (and its
// socket) is created in start() and destroyed in stop(), so a FeedThread that
// was never started opens no sockets.
//
// Thread model: start() and stop() from the owning thread. The sink is called
// on the feed thread and must be thread-safe (EventLoopThread::push is).
// -----------------------------------------------------------------------------
class FeedThread {
 public:
  using EventSink = std::function<void(Event)>;

  FeedThread(const CurrencyTable& currencies,
             const InstrumentTable& instruments, EventSink event_sink,
             std::string endpoint);
  ~FeedThread();

  FeedThread(const FeedThread&) = delete;
  FeedThread& operator=(const FeedThread&) = delete;
  FeedThread(FeedThread&&) = delete;
  FeedThread& operator=(FeedThread&&) = delete;

  void start();
  void stop();

  const std::string& endpoint() const { return endpoint_; }

 private:
  const CurrencyTable& currencies_;
  const InstrumentTable& instruments_;
  EventSink event_sink_;
  std::string endpoint_;

  std::unique_ptr<FeedGateway> gateway_;
  std::thread thread_;
};

}  // namespace folio
