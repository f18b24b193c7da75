// Repository: LiveWatch
// Component: Status Stream Mailbox
// Copyright (c) 2026 LiveWatch

#include "control/update_mailbox.h"

#include <stdexcept>

namespace livewatch {
namespace control {

UpdateMailbox::UpdateMailbox(size_t limit) : limit_(limit) {
  if (limit_ == 0) {
    throw std::invalid_argument("UpdateMailbox: limit must be positive");
  }
}

void UpdateMailbox::Push(const runtime::ChannelEvent& event) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    bool merged = false;
    if (event.type == runtime::ChannelEventType::kUpdated) {
      // Only the newest pending event for the id may absorb it, so an update
      // never jumps ahead of a removal.
      for (auto it = events_.rbegin(); it != events_.rend(); ++it) {
        if (it->state.id != event.state.id) continue;
        if (it->type == runtime::ChannelEventType::kUpdated) {
          it->state = event.state;
          merged = true;
        }
        break;
      }
    }
    if (!merged) {
      events_.push_back(event);
      while (events_.size() > limit_) {
        events_.pop_front();
        ++dropped_;
      }
    }
  }
  cv_.notify_one();
}

std::vector<runtime::ChannelEvent> UpdateMailbox::WaitAndDrain(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait_for(lock, timeout, [this] { return !events_.empty(); });
  std::vector<runtime::ChannelEvent> batch(events_.begin(), events_.end());
  events_.clear();
  return batch;
}

size_t UpdateMailbox::TakeDropped() {
  std::lock_guard<std::mutex> lock(mutex_);
  const size_t dropped = dropped_;
  dropped_ = 0;
  return dropped;
}

size_t UpdateMailbox::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return events_.size();
}

}  // namespace control
}  // namespace livewatch
