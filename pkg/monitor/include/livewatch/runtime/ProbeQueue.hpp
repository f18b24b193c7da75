// Repository: LiveWatch
// Component: Probe Queue
// Purpose: Blocking FIFO of channels awaiting a probe on one priority lane.
// Copyright (c) 2026 LiveWatch

#ifndef LIVEWATCH_RUNTIME_PROBE_QUEUE_HPP_
#define LIVEWATCH_RUNTIME_PROBE_QUEUE_HPP_

#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>

#include "livewatch/model/Channel.hpp"

namespace livewatch::runtime {

// Capacity is bounded by the registry size: a channel is pushed only after
// it won TryBeginCheck(), and is not pushed again until the probe releases it.
class ProbeQueue {
 public:
  using ChannelPtr = std::shared_ptr<model::Channel>;

  explicit ProbeQueue(std::string name);

  ProbeQueue(const ProbeQueue&) = delete;
  ProbeQueue& operator=(const ProbeQueue&) = delete;

  // Returns false when the queue is closed.
  bool Push(ChannelPtr channel);

  // Blocks until a channel is available. Returns nullptr once closed.
  ChannelPtr Pop();

  // Wakes all poppers; remaining entries are discarded and their probe
  // token released.
  void Close();

  size_t Size() const;
  bool Closed() const;
  const std::string& name() const { return name_; }

 private:
  const std::string name_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<ChannelPtr> items_;
  bool closed_ = false;
};

}  // namespace livewatch::runtime

#endif  // LIVEWATCH_RUNTIME_PROBE_QUEUE_HPP_
