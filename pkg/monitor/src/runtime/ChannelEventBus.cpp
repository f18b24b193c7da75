// Repository: LiveWatch
// Component: Channel Event Bus
// Copyright (c) 2026 LiveWatch

#include "livewatch/runtime/ChannelEventBus.hpp"

#include <vector>

#include "livewatch/util/Logger.hpp"

namespace livewatch::runtime {

using livewatch::util::LogWarn;

uint64_t ChannelEventBus::Subscribe(Subscriber subscriber) {
  std::lock_guard<std::mutex> lock(mutex_);
  const uint64_t id = next_id_++;
  subscribers_.emplace(id, std::move(subscriber));
  return id;
}

void ChannelEventBus::Unsubscribe(uint64_t subscription_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  subscribers_.erase(subscription_id);
}

void ChannelEventBus::Publish(const ChannelEvent& event) {
  std::vector<Subscriber> targets;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    targets.reserve(subscribers_.size());
    for (const auto& [id, subscriber] : subscribers_) targets.push_back(subscriber);
  }
  for (const auto& subscriber : targets) {
    try {
      subscriber(event);
    } catch (const std::exception& e) {
      LogWarn("EventBus", "SUBSCRIBER_FAILED").Field("error", e.what());
    } catch (...) {
      LogWarn("EventBus", "SUBSCRIBER_FAILED").Field("error", "unknown");
    }
  }
}

void ChannelEventBus::PublishUpdate(const model::ChannelState& state) {
  ChannelEvent event;
  event.type = ChannelEventType::kUpdated;
  event.state = state;
  Publish(event);
}

size_t ChannelEventBus::SubscriberCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return subscribers_.size();
}

}  // namespace livewatch::runtime
