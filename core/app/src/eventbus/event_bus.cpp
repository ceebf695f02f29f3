#include "lendflow/eventbus/event_bus.hpp"

#include <algorithm>
#include <exception>
#include <iostream>
#include <string>
#include <variant>

namespace lendflow {

// -----------------------------------------------------------------------------
// subscribe(GenericCallback)
// -----------------------------------------------------------------------------
EventBus::SubscriptionId EventBus::subscribe(GenericCallback callback) {
  std::lock_guard lock(mutex_);
  SubscriptionId id = next_id_++;
  subscribers_.emplace_back(id, std::move(callback));
  return id;
}

// -----------------------------------------------------------------------------
// unsubscribe(id)
// -----------------------------------------------------------------------------
void EventBus::unsubscribe(SubscriptionId id) {
  std::lock_guard lock(mutex_);
  subscribers_.erase(
      std::remove_if(subscribers_.begin(), subscribers_.end(),
                     [id](const SubscriberEntry& e) { return e.first == id; }),
      subscribers_.end());
}

// -----------------------------------------------------------------------------
// publish(event): snapshot under the lock, dispatch outside it.
// A throwing subscriber is logged and skipped; the turn that published the
// event has already committed its state change.
// -----------------------------------------------------------------------------
void EventBus::publish(const Event& event) {
  std::vector<SubscriberEntry> snapshot;
  {
    std::lock_guard lock(mutex_);
    snapshot = subscribers_;
  }

  for (const auto& [id, callback] : snapshot) {
    try {
      callback(event);
    } catch (const std::exception& ex) {
      const std::string& conversation = std::visit(
          [](const auto& e) -> const std::string& { return e.conversation_id; },
          event);
      std::cerr << "[EventBus] subscriber " << id << " failed on conversation '"
                << conversation << "': " << ex.what() << '\n';
    }
  }
}

// -----------------------------------------------------------------------------
// subscriberCount()
// -----------------------------------------------------------------------------
std::size_t EventBus::subscriberCount() const {
  std::lock_guard lock(mutex_);
  return subscribers_.size();
}

}  // namespace lendflow
