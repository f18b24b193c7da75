// Repository: LiveWatch
// Component: Status Stream Mailbox
// Purpose: Bounded per-subscriber buffer between the event bus and one
//          SubscribeUpdates stream.
// Copyright (c) 2026 LiveWatch

#ifndef LIVEWATCH_UPDATE_MAILBOX_H_
#define LIVEWATCH_UPDATE_MAILBOX_H_

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <vector>

#include "livewatch/runtime/ChannelEventBus.hpp"

namespace livewatch {
namespace control {

// A pending update for a channel is replaced by a newer one in place, so a
// slow reader sees the latest state of each channel. Removals are never
// coalesced. Past the limit the oldest entries are dropped and counted.
class UpdateMailbox {
 public:
  static constexpr size_t kDefaultLimit = 256;

  explicit UpdateMailbox(size_t limit = kDefaultLimit);

  UpdateMailbox(const UpdateMailbox&) = delete;
  UpdateMailbox& operator=(const UpdateMailbox&) = delete;

  void Push(const runtime::ChannelEvent& event);

  // Waits up to timeout for at least one event, then takes everything queued.
  std::vector<runtime::ChannelEvent> WaitAndDrain(std::chrono::milliseconds timeout);

  // Dropped since the last call.
  size_t TakeDropped();

  size_t Size() const;

 private:
  const size_t limit_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<runtime::ChannelEvent> events_;
  size_t dropped_ = 0;
};

}  // namespace control
}  // namespace livewatch

#endif  // LIVEWATCH_UPDATE_MAILBOX_H_
