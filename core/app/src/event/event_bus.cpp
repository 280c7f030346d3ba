#include "folio/eventbus/event_bus.hpp"

#include <algorithm>

namespace folio {

EventBus::SubscriptionId EventBus::add(std::size_t kind,
                                       GenericCallback callback) {
  std::lock_guard lock(mutex_);
  SubscriptionId id = next_id_++;
  subscribers_.push_back(Subscriber{id, kind, std::move(callback)});
  return id;
}

void EventBus::unsubscribe(SubscriptionId id) {
  std::lock_guard lock(mutex_);
  auto it = std::find_if(subscribers_.begin(), subscribers_.end(),
                         [id](const Subscriber& s) { return s.id == id; });
  if (it != subscribers_.end()) {
    subscribers_.erase(it);
  }
}

void EventBus::publish(const Event& event) {
  const std::size_t kind = event.index();
  ++published_[kind];

  std::vector<GenericCallback> targets;
  {
    std::lock_guard lock(mutex_);
    for (const auto& s : subscribers_) {
      if (s.kind == kind || s.kind == kAnyKind) {
        targets.push_back(s.callback);
      }
    }
  }

  for (const auto& callback : targets) {
    callback(event);
  }
}

std::size_t EventBus::subscriberCount() const {
  std::lock_guard lock(mutex_);
  return subscribers_.size();
}

}  // namespace folio
