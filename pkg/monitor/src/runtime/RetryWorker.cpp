// Repository: LiveWatch
// Component: Retry Worker
// Copyright (c) 2026 LiveWatch

#include "livewatch/runtime/RetryWorker.hpp"

#include "livewatch/util/Logger.hpp"

namespace livewatch::runtime {

using livewatch::util::LogDebug;
using livewatch::util::LogError;

RetryWorker::RetryWorker(Prober& prober) : prober_(prober) {}

RetryWorker::~RetryWorker() {
  Stop();
}

void RetryWorker::Start() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (thread_.joinable() || stop_) return;
  thread_ = std::thread(&RetryWorker::Loop, this);
}

void RetryWorker::Stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stop_ = true;
    queue_.clear();
    queued_ids_.clear();
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

bool RetryWorker::Enqueue(ChannelPtr channel) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stop_) return false;
    if (!queued_ids_.insert(channel->id()).second) return true;
    queue_.push_back(std::move(channel));
  }
  cv_.notify_one();
  return true;
}

size_t RetryWorker::Pending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

uint64_t RetryWorker::CompletedCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return completed_;
}

void RetryWorker::Loop() {
  while (true) {
    ChannelPtr channel;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      cv_.wait(lock, [this] { return stop_ || !queue_.empty(); });
      if (stop_) return;
      channel = std::move(queue_.front());
      queue_.pop_front();
      queued_ids_.erase(channel->id());
    }

    try {
      const ProbeOutcome outcome = prober_.CheckWithRetry(channel);
      LogDebug("RetryWorker", "DONE")
          .Field("id", channel->id())
          .Field("outcome", ProbeOutcomeToString(outcome));
    } catch (const std::exception& e) {
      LogError("RetryWorker", "CHECK_FAILED").Field("id", channel->id()).Field("error", e.what());
    } catch (...) {
      LogError("RetryWorker", "CHECK_FAILED").Field("id", channel->id()).Field("error", "unknown");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    ++completed_;
  }
}

}  // namespace livewatch::runtime
