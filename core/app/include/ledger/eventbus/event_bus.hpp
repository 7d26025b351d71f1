#pragma once

#include "ledger/events/event.hpp"

#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <vector>

namespace ledger {

// -----------------------------------------------------------------------------
// EventBus
// -----------------------------------------------------------------------------
// Responsibility: Publish-subscribe channel for ledger events. Workflows
// publish an Event after every persisted transition; subscribers (audit
// logging, notification bridges, tests) observe the lifecycle without
// reading the record store.
//
// Delivery: synchronous, on the thread that calls publish(), inside the
// invocation that produced the event. A subscriber that calls back into a
// mutating engine operation is a nested invocation and is refused with
// ReentrancyDetected.
//
// Thread model: subscribe/unsubscribe/publish are mutex-protected so a
// monitoring thread may attach while the host is executing operations.
// -----------------------------------------------------------------------------
class EventBus {
 public:
  using GenericCallback = std::function<void(const Event&)>;

  // Returned by subscribe(); pass to unsubscribe() to remove. Ids start at 1,
  // so 0 never names a live subscription.
  using SubscriptionId = std::size_t;

  EventBus() = default;

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  // -------------------------------------------------------------------------
  // subscribe(GenericCallback)
  // -------------------------------------------------------------------------
  // What: Registers a callback invoked for every published event.
  // Output: SubscriptionId to use with unsubscribe().
  // -------------------------------------------------------------------------
  SubscriptionId subscribe(GenericCallback callback);

  // -------------------------------------------------------------------------
  // subscribe<EventType>(callback)
  // -------------------------------------------------------------------------
  // What: Registers a callback invoked only when the published event holds
  // an EventType (e.g. EscrowUpdateEvent).
  // -------------------------------------------------------------------------
  template <typename EventType>
  SubscriptionId subscribe(std::function<void(const EventType&)> callback);

  // Removes a subscription. Unknown ids are ignored.
  void unsubscribe(SubscriptionId id);

  // -------------------------------------------------------------------------
  // publish(event)
  // -------------------------------------------------------------------------
  // What: Invokes every registered callback with the event before
  // returning. The subscriber list is copied under the lock and callbacks
  // run without it, so a callback may subscribe, unsubscribe or publish.
  // -------------------------------------------------------------------------
  void publish(const Event& event);

  // Number of live subscriptions.
  std::size_t subscriberCount() const;

 private:
  // Callbacks in subscription order, copied out under the lock.
  std::vector<GenericCallback> snapshot() const;

  mutable std::mutex mutex_;  // Protects subscribers_ and last_id_
  SubscriptionId last_id_{0};
  std::map<SubscriptionId, GenericCallback> subscribers_;
};

// -----------------------------------------------------------------------------
// Template implementation: typed subscribe
// -----------------------------------------------------------------------------
// Wraps the typed callback in a generic one that filters with std::get_if.
// -----------------------------------------------------------------------------
template <typename EventType>
EventBus::SubscriptionId EventBus::subscribe(
    std::function<void(const EventType&)> callback) {
  GenericCallback wrapped = [cb = std::move(callback)](const Event& event) {
    if (const auto* ptr = std::get_if<EventType>(&event)) {
      cb(*ptr);
    }
  };
  return subscribe(std::move(wrapped));
}

}  // namespace ledger
