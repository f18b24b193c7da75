// Repository: LiveWatch
// Component: Queue Worker Pool
// Copyright (c) 2026 LiveWatch

#include "livewatch/runtime/QueueWorkerPool.hpp"

#include <stdexcept>

#include "livewatch/util/Logger.hpp"

namespace livewatch::runtime {

using livewatch::model::ChannelState;
using livewatch::predict::Lane;
using livewatch::util::LogDebug;
using livewatch::util::LogError;

QueueWorkerPool::QueueWorkerPool(LaneQueues queues, Prober& prober,
                                 WorkerCounts workers_per_lane)
    : queues_(std::move(queues)), prober_(prober), workers_per_lane_(workers_per_lane) {
  for (size_t i = 0; i < queues_.size(); ++i) {
    if (!queues_[i]) throw std::invalid_argument("QueueWorkerPool: every lane needs a queue");
    if (workers_per_lane_[i] <= 0) {
      throw std::invalid_argument("QueueWorkerPool: every lane needs at least one worker");
    }
  }
}

QueueWorkerPool::~QueueWorkerPool() {
  Stop();
}

void QueueWorkerPool::Start() {
  if (started_) return;
  started_ = true;
  for (size_t lane = 0; lane < queues_.size(); ++lane) {
    for (int i = 0; i < workers_per_lane_[lane]; ++i) {
      threads_.emplace_back(&QueueWorkerPool::WorkerLoop, this, static_cast<Lane>(lane), i);
    }
  }
}

void QueueWorkerPool::Stop() {
  for (const auto& queue : queues_) {
    queue->Close();
  }
  for (auto& t : threads_) {
    if (t.joinable()) t.join();
  }
  threads_.clear();
}

void QueueWorkerPool::WorkerLoop(Lane lane, int worker_index) {
  const auto& queue = queues_[static_cast<size_t>(lane)];
  const char* lane_name = predict::LaneToString(lane);
  LogDebug("Worker", "STARTED").Field("lane", lane_name).Field("index", worker_index);

  while (auto channel = queue->Pop()) {
    try {
      const ChannelState s = channel->Snapshot();
      if (s.config.monitor_enabled && !s.is_recording) {
        probes_.fetch_add(1, std::memory_order_relaxed);
        prober_.Probe(channel);
      } else {
        // Removed, stopped or recording since dispatch.
        skips_.fetch_add(1, std::memory_order_relaxed);
        channel->EndCheck();
      }
    } catch (const std::exception& e) {
      failures_.fetch_add(1, std::memory_order_relaxed);
      LogError("Worker", "PROBE_FAILED")
          .Field("lane", lane_name)
          .Field("index", worker_index)
          .Field("id", channel->id())
          .Field("error", e.what());
    } catch (...) {
      failures_.fetch_add(1, std::memory_order_relaxed);
      LogError("Worker", "PROBE_FAILED")
          .Field("lane", lane_name)
          .Field("index", worker_index)
          .Field("id", channel->id())
          .Field("error", "unknown");
    }
  }

  LogDebug("Worker", "EXITED").Field("lane", lane_name).Field("index", worker_index);
}

}  // namespace livewatch::runtime
