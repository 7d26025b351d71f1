#include "ledger/eventbus/event_bus.hpp"

namespace ledger {

EventBus::SubscriptionId EventBus::subscribe(GenericCallback callback) {
  std::lock_guard lock(mutex_);
  const SubscriptionId id = ++last_id_;
  subscribers_.emplace(id, std::move(callback));
  return id;
}

void EventBus::unsubscribe(SubscriptionId id) {
  std::lock_guard lock(mutex_);
  subscribers_.erase(id);
}

std::size_t EventBus::subscriberCount() const {
  std::lock_guard lock(mutex_);
  return subscribers_.size();
}

std::vector<EventBus::GenericCallback> EventBus::snapshot() const {
  std::lock_guard lock(mutex_);
  std::vector<GenericCallback> callbacks;
  callbacks.reserve(subscribers_.size());
  for (const auto& entry : subscribers_) {
    callbacks.push_back(entry.second);
  }
  return callbacks;
}

// -----------------------------------------------------------------------------
// publish(): delivery runs on the caller's thread, after the lock is dropped.
// An exception from a subscriber propagates to the publishing workflow and
// aborts its invocation; later subscribers do not see the event.
// -----------------------------------------------------------------------------
void EventBus::publish(const Event& event) {
  for (const GenericCallback& callback : snapshot()) {
    callback(event);
  }
}

}  // namespace ledger
