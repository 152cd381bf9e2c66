#include "qfolio/eventbus/event_bus.hpp"

#include <algorithm>
#include <exception>
#include <iostream>

namespace qfolio {

EventBus::SubscriptionId EventBus::subscribe(GenericCallback callback) {
  std::lock_guard lock(mutex_);
  const SubscriptionId id = next_id_++;
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

// -----------------------------------------------------------------------------
// publish(): snapshot the subscriber list, then dispatch without the lock
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
    } catch (const std::exception& e) {
      {
        std::lock_guard lock(mutex_);
        ++subscriber_errors_;
      }
      std::cerr << "[EventBus] subscriber " << id
                << " failed on event #" << event.index() << ": " << e.what()
                << "\n";
    }
  }
}

std::size_t EventBus::subscriberCount() const {
  std::lock_guard lock(mutex_);
  return subscribers_.size();
}

std::size_t EventBus::subscriberErrors() const {
  std::lock_guard lock(mutex_);
  return subscriber_errors_;
}

}  // namespace qfolio
