// Repository: LiveWatch
// Component: Channel
// Purpose: Lock-guarded owner of one ChannelState. Shared by the registry,
//          the lane queues and the prober through std::shared_ptr.
// Copyright (c) 2026 LiveWatch

#ifndef LIVEWATCH_MODEL_CHANNEL_HPP_
#define LIVEWATCH_MODEL_CHANNEL_HPP_

#include <mutex>
#include <string>
#include <utility>

#include "livewatch/model/ChannelTypes.hpp"

namespace livewatch::model {

// Channel serializes every field access behind its own mutex. Multi-field
// transitions go through Mutate() so readers never see them half applied.
//
// is_checking is the probe-ownership token: TryBeginCheck() is the only way
// to take it and EndCheck() the only way to release it.
class Channel {
 public:
  explicit Channel(ChannelState initial);

  Channel(const Channel&) = delete;
  Channel& operator=(const Channel&) = delete;

  // Stable for the lifetime of the object.
  const std::string& id() const { return id_; }

  ChannelState Snapshot() const;

  bool TryBeginCheck();
  void EndCheck();

  bool IsChecking() const;
  bool IsMonitored() const;
  bool IsRecording() const;

  // Runs fn(ChannelState&) under the channel lock and returns its result.
  // fn must not call back into this Channel.
  template <typename Fn>
  decltype(auto) Mutate(Fn&& fn) {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::forward<Fn>(fn)(state_);
  }

 private:
  const std::string id_;
  mutable std::mutex mutex_;
  ChannelState state_;
};

}  // namespace livewatch::model

#endif  // LIVEWATCH_MODEL_CHANNEL_HPP_
