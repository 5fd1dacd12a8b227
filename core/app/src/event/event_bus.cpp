#include "tradecalc/eventbus/event_bus.hpp"

#include <algorithm>
#include <exception>
#include <iostream>

namespace tradecalc {

EventBus::SubscriptionId EventBus::subscribe(GenericCallback callback) {
  std::lock_guard lock(mutex_);
  SubscriptionId id = next_id_++;
  subscribers_.emplace_back(id, std::move(callback));
  return id;
}

void EventBus::unsubscribe(SubscriptionId id) {
  std::lock_guard lock(mutex_);
  subscribers_.erase(
      std::remove_if(subscribers_.begin(), subscribers_.end(),
                     [id](const SubscriberEntry& e) { return e.first == id; }),
      subscribers_.end());
}

void EventBus::publish(const Event& event) {
  std::vector<SubscriberEntry> copy;

  {
    // Callbacks run without the lock so they can publish or unsubscribe.
    // A subscriber added during this publish does not see this event.
    std::lock_guard lock(mutex_);
    copy = subscribers_;
  }

  // One failing subscriber does not stop delivery to the rest.
  for (const auto& [id, callback] : copy) {
    try {
      callback(event);
    } catch (const std::exception& e) {
      std::cerr << "[EventBus] subscriber " << id
                << " threw while handling event #" << event.index() << ": "
                << e.what() << "\n";
    }
  }
}

std::size_t EventBus::subscriberCount() const {
  std::lock_guard lock(mutex_);
  return subscribers_.size();
}

}  // namespace tradecalc
