#include "folio/network/feed_thread.hpp"

#include <iostream>
#include <utility>

namespace folio {

FeedThread::FeedThread(const CurrencyTable& currencies,
                       const InstrumentTable& instruments,
                       EventSink event_sink, std::string endpoint)
    : currencies_(currencies),
      instruments_(instruments),
      event_sink_(std::move(event_sink)),
      endpoint_(std::move(endpoint)) {}

FeedThread::~FeedThread() { stop(); }

void FeedThread::start() {
  if (thread_.joinable()) {
    return;
  }

  gateway_ = std::make_unique<FeedGateway>(currencies_, instruments_,
                                           event_sink_, endpoint_);

  thread_ = std::thread([this] {
    std::cout << "[FeedThread] listening on " << endpoint_ << "\n";
    gateway_->run();
    std::cout << "[FeedThread] recv loop exited.\n";
  });
}

void FeedThread::stop() {
  if (gateway_) {
    gateway_->stop();
  }
  if (thread_.joinable()) {
    thread_.join();
  }
  gateway_.reset();
}

}  // namespace folio
