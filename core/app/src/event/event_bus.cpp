#include "warden/eventbus/event_bus.hpp"

#include <algorithm>

namespace warden {

EventBus::SubscriptionId EventBus::subscribe(GenericCallback callback) {
  std::lock_guard lock(mutex_);
  auto next = std::make_shared<SubscriberList>(*subscribers_);
  const SubscriptionId id = next_id_++;
  next->emplace_back(id, std::move(callback));
  subscribers_ = std::move(next);
  return id;
}

void EventBus::unsubscribe(SubscriptionId id) {
  std::lock_guard lock(mutex_);
  auto match = [id](const SubscriberEntry& e) { return e.first == id; };
  if (std::none_of(subscribers_->begin(), subscribers_->end(), match)) {
    return;
  }
  auto next = std::make_shared<SubscriberList>(*subscribers_);
  next->erase(std::remove_if(next->begin(), next->end(), match), next->end());
  subscribers_ = std::move(next);
}

void EventBus::publish(const Event& event) {
  // The list is immutable once installed, so it can be walked unlocked
  // while callbacks re-enter subscribe/unsubscribe/publish.
  const auto current = snapshot();
  for (const auto& [id, callback] : *current) {
    callback(event);
  }
}

std::size_t EventBus::subscriberCount() const { return snapshot()->size(); }

std::shared_ptr<const EventBus::SubscriberList> EventBus::snapshot() const {
  std::lock_guard lock(mutex_);
  return subscribers_;
}

}  // namespace warden
