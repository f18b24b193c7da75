// Repository: LiveWatch
// Component: Channel Event Bus
// Purpose: Fan-out of channel update events to subscribers (control-surface
//          streams, tests).
// Copyright (c) 2026 LiveWatch

#ifndef LIVEWATCH_RUNTIME_CHANNEL_EVENT_BUS_HPP_
#define LIVEWATCH_RUNTIME_CHANNEL_EVENT_BUS_HPP_

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>

#include "livewatch/model/ChannelTypes.hpp"

namespace livewatch::runtime {

enum class ChannelEventType {
  kUpdated = 0,
  kRemoved = 1,
};

struct ChannelEvent {
  ChannelEventType type = ChannelEventType::kUpdated;
  model::ChannelState state;
};

// Subscribers are called on the publishing thread, outside the bus lock.
// A subscriber that throws is logged and skipped.
class ChannelEventBus {
 public:
  using Subscriber = std::function<void(const ChannelEvent&)>;

  uint64_t Subscribe(Subscriber subscriber);
  void Unsubscribe(uint64_t subscription_id);

  void Publish(const ChannelEvent& event);
  void PublishUpdate(const model::ChannelState& state);

  size_t SubscriberCount() const;

 private:
  mutable std::mutex mutex_;
  std::map<uint64_t, Subscriber> subscribers_;
  uint64_t next_id_ = 1;
};

}  // namespace livewatch::runtime

#endif  // LIVEWATCH_RUNTIME_CHANNEL_EVENT_BUS_HPP_
