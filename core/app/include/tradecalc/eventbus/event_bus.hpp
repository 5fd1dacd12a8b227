#pragma once

#include "tradecalc/events/event.hpp"

#include <cstddef>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace tradecalc {

// -----------------------------------------------------------------------------
// EventBus
// -----------------------------------------------------------------------------
// Responsibility: In-process publish/subscribe channel. The notifier
// publishes TradeValuesChangedEvent here; the session's loop publishes the
// queued price ticks and user edits here for the notifier to consume.
//
// Thread model: subscribe, unsubscribe and publish are safe from any thread.
// Callbacks run synchronously on the thread that calls publish(), in
// subscription order. A callback may publish or unsubscribe re-entrantly.
// -----------------------------------------------------------------------------
class EventBus {
 public:
  using GenericCallback = std::function<void(const Event&)>;

  // Opaque id returned by subscribe(); pass to unsubscribe() to remove.
  using SubscriptionId = std::size_t;

  EventBus() = default;

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  // Registers a callback for every published event.
  SubscriptionId subscribe(GenericCallback callback);

  // Registers a callback that only fires when the event holds EventType.
  template <typename EventType>
  SubscriptionId subscribe(std::function<void(const EventType&)> callback);

  // Unknown ids are ignored. A publish() already in progress on another
  // thread may still invoke the removed callback once.
  void unsubscribe(SubscriptionId id);

  // Invokes every subscriber before returning. A std::exception thrown by a
  // subscriber is logged to std::cerr and the remaining subscribers still
  // run.
  void publish(const Event& event);

  std::size_t subscriberCount() const;

 private:
  using SubscriberEntry = std::pair<SubscriptionId, GenericCallback>;

  mutable std::mutex mutex_;      // Protects subscribers_ and next_id_
  SubscriptionId next_id_{0};
  std::vector<SubscriberEntry> subscribers_;
};

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

}  // namespace tradecalc
