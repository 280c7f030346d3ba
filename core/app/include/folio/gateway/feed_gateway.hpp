#pragma once

#include "folio/config/reference_data.hpp"
#include "folio/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <cstddef>
#include <functional>
#include <string>

namespace folio {

// -----------------------------------------------------------------------------
// FeedGateway: ZeroMQ SUB socket to Event
// -----------------------------------------------------------------------------
//
// @brief  Receives JSON messages (quotes, account states, fills) from an
//         upstream publisher, decodes them with the wire codec and hands each
//         Event to the sink.
//
// @details
// The sink is AccountingEngine::pushEvent, so the gateway never touches the
// Portfolio: it only enqueues, and the accounting loop applies the event in
// arrival order.
//
// A message that fails to decode is logged to std::cerr and skipped; the
// loop keeps running.
//
// Thread model:
//   run() blocks and is meant for a dedicated thread (FeedThread). stop() may
//   be called from any thread; run() notices within kRecvTimeoutMs.
//   handleMessage() is called by run() and directly by tests.
//
// Ownership:
//   The currency and instrument tables are borrowed and must outlive the
//   gateway. The ZMQ context and socket are owned.
// -----------------------------------------------------------------------------
class FeedGateway {
 public:
  using EventSink = std::function<void(Event)>;

  FeedGateway(const CurrencyTable& currencies,
              const InstrumentTable& instruments, EventSink event_sink,
              const std::string& endpoint = "tcp://127.0.0.1:5555");

  FeedGateway(const FeedGateway&) = delete;
  FeedGateway& operator=(const FeedGateway&) = delete;
  FeedGateway(FeedGateway&&) = delete;
  FeedGateway& operator=(FeedGateway&&) = delete;

  void run();
  void stop();

  // Decodes one payload and forwards it. Returns false if it was rejected.
  bool handleMessage(const std::string& payload);

  std::size_t acceptedCount() const { return accepted_.load(); }
  std::size_t rejectedCount() const { return rejected_.load(); }

 private:
  static constexpr int kRecvTimeoutMs = 100;

  const CurrencyTable& currencies_;
  const InstrumentTable& instruments_;
  EventSink event_sink_;

  zmq::context_t context_{1};
  zmq::socket_t socket_{context_, zmq::socket_type::sub};

  // Starts true so a stop() that lands before run() is not lost.
  std::atomic<bool> running_{true};
  std::atomic<std::size_t> accepted_{0};
  std::atomic<std::size_t> rejected_{0};
};

}  // namespace folio
