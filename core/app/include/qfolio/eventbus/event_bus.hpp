#pragma once

#include "qfolio/events/event.hpp"

#include <cstddef>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace qfolio {

// -----------------------------------------------------------------------------
// EventBus
// -----------------------------------------------------------------------------
//
// @brief  In-process publish/subscribe channel for audit events.
//
// @details
// The selection pipeline, the rebalance orchestrator and the circuit breaker
// publish; the AuditRecorder (and tests) subscribe. Publishers never know who
// listens, which keeps the decision code free of persistence concerns.
//
// Dispatch is synchronous: publish() returns after every subscriber has run,
// on the publisher's thread. Records of a cycle therefore appear in exactly
// the order the decisions were made.
//
// A subscriber that throws std::exception is logged and counted in
// subscriberErrors(); the remaining subscribers still run and the exception
// never reaches the publisher, so an audit failure cannot abort a cycle
// half-way through its orders.
//
// Thread model:
//   subscribe/unsubscribe/publish are safe from any thread. The subscriber
//   list is copied under the lock and callbacks run unlocked, so a callback
//   may itself publish or unsubscribe.
// -----------------------------------------------------------------------------
class EventBus {
 public:
  using GenericCallback = std::function<void(const Event&)>;
  using SubscriptionId = std::size_t;

  EventBus() = default;

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  // -------------------------------------------------------------------------
  // subscribe(callback)
  // -------------------------------------------------------------------------
  // @brief  Registers a callback for every event kind.
  // @return Id for unsubscribe().
  // -------------------------------------------------------------------------
  SubscriptionId subscribe(GenericCallback callback);

  // -------------------------------------------------------------------------
  // subscribe<EventType>(callback)
  // -------------------------------------------------------------------------
  // @brief  Registers a callback that only sees events of EventType.
  //
  // @details
  // Wrapped into a GenericCallback that filters with std::get_if.
  // -------------------------------------------------------------------------
  template <typename EventType>
  SubscriptionId subscribe(std::function<void(const EventType&)> callback);

  // Removes a subscription. A publish() already in flight may still call it.
  void unsubscribe(SubscriptionId id);

  void publish(const Event& event);

  std::size_t subscriberCount() const;
  std::size_t subscriberErrors() const;

 private:
  using SubscriberEntry = std::pair<SubscriptionId, GenericCallback>;

  mutable std::mutex mutex_;
  SubscriptionId next_id_{0};
  std::vector<SubscriberEntry> subscribers_;
  std::size_t subscriber_errors_{0};
};

template <typename EventType>
EventBus::SubscriptionId EventBus::subscribe(
    std::function<void(const EventType&)> callback) {
  return subscribe(GenericCallback(
      [cb = std::move(callback)](const Event& event) {
        if (const auto* typed = std::get_if<EventType>(&event)) {
          cb(*typed);
        }
      }));
}

}  // namespace qfolio
