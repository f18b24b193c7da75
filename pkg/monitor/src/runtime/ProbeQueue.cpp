// Repository: LiveWatch
// Component: Probe Queue
// Copyright (c) 2026 LiveWatch

#include "livewatch/runtime/ProbeQueue.hpp"

namespace livewatch::runtime {

ProbeQueue::ProbeQueue(std::string name) : name_(std::move(name)) {}

bool ProbeQueue::Push(ChannelPtr channel) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) return false;
    items_.push_back(std::move(channel));
  }
  cv_.notify_one();
  return true;
}

ProbeQueue::ChannelPtr ProbeQueue::Pop() {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait(lock, [this] { return closed_ || !items_.empty(); });
  if (closed_) return nullptr;
  ChannelPtr channel = std::move(items_.front());
  items_.pop_front();
  return channel;
}

void ProbeQueue::Close() {
  std::deque<ChannelPtr> discarded;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    discarded.swap(items_);
  }
  cv_.notify_all();
  // Queued channels still hold the probe token; hand it back.
  for (const auto& channel : discarded) {
    channel->EndCheck();
  }
}

size_t ProbeQueue::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return items_.size();
}

bool ProbeQueue::Closed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

}  // namespace livewatch::runtime
