// Repository: LiveWatch
// Component: Channel
// Copyright (c) 2026 LiveWatch

#include "livewatch/model/Channel.hpp"

namespace livewatch::model {

Channel::Channel(ChannelState initial)
    : id_(initial.id), state_(std::move(initial)) {}

ChannelState Channel::Snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

bool Channel::TryBeginCheck() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_.is_checking) return false;
  state_.is_checking = true;
  return true;
}

void Channel::EndCheck() {
  std::lock_guard<std::mutex> lock(mutex_);
  state_.is_checking = false;
}

bool Channel::IsChecking() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_.is_checking;
}

bool Channel::IsMonitored() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_.config.monitor_enabled;
}

bool Channel::IsRecording() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_.is_recording;
}

}  // namespace livewatch::model
