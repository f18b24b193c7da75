// Repository: LiveWatch
// Component: Retry Worker
// Purpose: Background thread running follow-up checks for channels whose
//          recording just ended, so a briefly interrupted stream is picked
//          up again without waiting for the next cycle.
// Copyright (c) 2026 LiveWatch

#ifndef LIVEWATCH_RUNTIME_RETRY_WORKER_HPP_
#define LIVEWATCH_RUNTIME_RETRY_WORKER_HPP_

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>

#include "livewatch/runtime/Prober.hpp"

namespace livewatch::runtime {

class RetryWorker {
 public:
  using ChannelPtr = std::shared_ptr<model::Channel>;

  explicit RetryWorker(Prober& prober);
  ~RetryWorker();

  RetryWorker(const RetryWorker&) = delete;
  RetryWorker& operator=(const RetryWorker&) = delete;

  void Start();
  // Drops queued channels and joins the thread. The wait strategy must be
  // interrupted first when a retry delay may be in progress.
  void Stop();

  // Queues one CheckWithRetry for channel. A channel already queued is not
  // queued twice. Returns false once stopped.
  bool Enqueue(ChannelPtr channel);

  size_t Pending() const;
  uint64_t CompletedCount() const;

 private:
  void Loop();

  Prober& prober_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<ChannelPtr> queue_;
  std::set<std::string> queued_ids_;
  bool stop_ = false;
  uint64_t completed_ = 0;
  std::thread thread_;
};

}  // namespace livewatch::runtime

#endif  // LIVEWATCH_RUNTIME_RETRY_WORKER_HPP_
