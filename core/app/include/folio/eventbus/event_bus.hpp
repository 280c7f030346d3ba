#pragma once

#include "folio/events/event.hpp"

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace folio {

// -----------------------------------------------------------------------------
// EventBus
// -----------------------------------------------------------------------------
// Responsibility: Synchronous publish-subscribe over the Event variant. The
// PositionEngine, the Portfolio and the telemetry publisher are wired to each
// other only through a bus.
//
// Dispatch: subscribe<T>() registers for one Event alternative and is only
// looked at for events of that kind; subscribe() without a type sees every
// event. Within one publish, subscribers run in subscription order, whatever
// their kind, so a Portfolio subscribed before the telemetry bridge has
// always applied a PositionOpenedEvent before it is published outward.
//
// publishedCount<T>() counts the events of each kind that went through
// publish(), nested publishes included. The engine reports them in STATUS.
//
// Thread model: subscribe, unsubscribe and publish are safe from any thread.
// Callbacks run on the publishing thread before publish() returns. In the
// AccountingEngine that is always the accounting loop thread.
// -----------------------------------------------------------------------------
class EventBus {
 public:
  using GenericCallback = std::function<void(const Event&)>;
  using SubscriptionId = std::size_t;

  EventBus() = default;

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  // Receives every event.
  SubscriptionId subscribe(GenericCallback callback);

  // Receives only events holding EventType.
  template <typename EventType>
  SubscriptionId subscribe(std::function<void(const EventType&)> callback);

  // A callback already running for the current event may still complete.
  void unsubscribe(SubscriptionId id);

  // Snapshots the matching subscribers under the lock and invokes them
  // outside it, so a callback may publish or unsubscribe without
  // deadlocking.
  void publish(const Event& event);

  std::size_t subscriberCount() const;

  template <typename EventType>
  std::uint64_t publishedCount() const {
    return published_[eventKind<EventType>()].load();
  }

 private:
  // Matches every kind.
  static constexpr std::size_t kAnyKind = kEventKindCount;

  struct Subscriber {
    SubscriptionId id;
    std::size_t kind;
    GenericCallback callback;
  };

  SubscriptionId add(std::size_t kind, GenericCallback callback);

  mutable std::mutex mutex_;
  SubscriptionId next_id_{0};
  std::vector<Subscriber> subscribers_;
  std::array<std::atomic<std::uint64_t>, kEventKindCount> published_{};
};

inline EventBus::SubscriptionId EventBus::subscribe(GenericCallback callback) {
  return add(kAnyKind, std::move(callback));
}

template <typename EventType>
EventBus::SubscriptionId EventBus::subscribe(
    std::function<void(const EventType&)> callback) {
  return add(eventKind<EventType>(),
             [cb = std::move(callback)](const Event& event) {
               cb(std::get<EventType>(event));
             });
}

}  // namespace folio
