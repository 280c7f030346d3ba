#include "folio/gateway/feed_gateway.hpp"
#include "folio/codec/event_codec.hpp"
#include "folio/domain/errors.hpp"

#include <iostream>
#include <utility>

namespace folio {

FeedGateway::FeedGateway(const CurrencyTable& currencies,
                         const InstrumentTable& instruments,
                         EventSink event_sink, const std::string& endpoint)
    : currencies_(currencies),
      instruments_(instruments),
      event_sink_(std::move(event_sink)) {
  socket_.set(zmq::sockopt::subscribe, "");
  // Bounded recv so run() can observe stop().
  socket_.set(zmq::sockopt::rcvtimeo, kRecvTimeoutMs);
  socket_.connect(endpoint);
}

// -----------------------------------------------------------------------------
// run(): blocking recv loop
// -----------------------------------------------------------------------------
void FeedGateway::run() {
  while (running_.load()) {
    zmq::message_t msg;
    auto result = socket_.recv(msg, zmq::recv_flags::none);
    if (!result.has_value()) {
      continue;
    }
    handleMessage(msg.to_string());
  }
}

void FeedGateway::stop() { running_.store(false); }

bool FeedGateway::handleMessage(const std::string& payload) {
  try {
    event_sink_(decodeEvent(payload, currencies_, instruments_));
  } catch (const domain::CodecError& e) {
    ++rejected_;
    std::cerr << "[FeedGateway] WARNING: " << e.what()
              << " payload: " << payload << "\n";
    return false;
  }
  ++accepted_;
  return true;
}

}  // namespace folio
