#pragma once

#include "lendflow/events/event.hpp"

#include <cstddef>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace lendflow {

// -----------------------------------------------------------------------------
// EventBus
// -----------------------------------------------------------------------------
// Responsibility: Publish-subscribe channel for conversation events. The
// orchestrators publish; console logging, the IPC telemetry bridge and tests
// subscribe.
//
// Thread model: subscribe, unsubscribe and publish are safe from any thread.
// Conversations processed on different threads share one bus. Callbacks run
// synchronously on the publishing thread, i.e. inside the turn that caused
// the event, so they must be short and must not call back into the
// ConversationManager for the same conversation.
// -----------------------------------------------------------------------------
class EventBus {
 public:
  // Receives every event; use std::get_if to pick types.
  using GenericCallback = std::function<void(const Event&)>;

  // Returned by subscribe(); pass to unsubscribe().
  using SubscriptionId = std::size_t;

  EventBus() = default;

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  // -------------------------------------------------------------------------
  // subscribe(GenericCallback)
  // -------------------------------------------------------------------------
  // Registers a callback for every published event.
  // Output: SubscriptionId for unsubscribe().
  // -------------------------------------------------------------------------
  SubscriptionId subscribe(GenericCallback callback);

  // -------------------------------------------------------------------------
  // subscribe<EventType>(callback)
  // -------------------------------------------------------------------------
  // Registers a callback that fires only when the event holds EventType,
  // e.g. subscribe<ConversationClosedEvent>(...).
  // -------------------------------------------------------------------------
  template <typename EventType>
  SubscriptionId subscribe(std::function<void(const EventType&)> callback);

  // -------------------------------------------------------------------------
  // unsubscribe(id)
  // -------------------------------------------------------------------------
  // Removes a subscription. A publish() already in flight on another thread
  // may still deliver its current event to the removed callback. Unknown ids
  // are ignored.
  // -------------------------------------------------------------------------
  void unsubscribe(SubscriptionId id);

  // -------------------------------------------------------------------------
  // publish(event)
  // -------------------------------------------------------------------------
  // Invokes every current subscriber with the event before returning. The
  // subscriber list is copied under the lock and the callbacks run without
  // it, so a callback may itself publish or unsubscribe. A callback that
  // throws std::exception is logged to stderr and the remaining subscribers
  // still run.
  // -------------------------------------------------------------------------
  void publish(const Event& event);

  std::size_t subscriberCount() const;

 private:
  using SubscriberEntry = std::pair<SubscriptionId, GenericCallback>;

  mutable std::mutex mutex_;      // Guards subscribers_ and next_id_
  SubscriptionId next_id_{0};
  std::vector<SubscriberEntry> subscribers_;
};

// -----------------------------------------------------------------------------
// Typed subscribe: wrap in a generic callback filtered by std::get_if
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

}  // namespace lendflow
