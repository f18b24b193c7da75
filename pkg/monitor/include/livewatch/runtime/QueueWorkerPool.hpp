// Repository: LiveWatch
// Component: Queue Worker Pool
// Purpose: Fixed set of consumer threads per priority lane (default 1 fast,
//          2 medium, 1 slow), each popping channels and handing them to the
//          Prober.
// Copyright (c) 2026 LiveWatch

#ifndef LIVEWATCH_RUNTIME_QUEUE_WORKER_POOL_HPP_
#define LIVEWATCH_RUNTIME_QUEUE_WORKER_POOL_HPP_

#include <array>
#include <atomic>
#include <cstdint>
#include <thread>
#include <vector>

#include "livewatch/runtime/Dispatcher.hpp"
#include "livewatch/runtime/Prober.hpp"

namespace livewatch::runtime {

class QueueWorkerPool {
 public:
  using WorkerCounts = std::array<int, predict::kLaneCount>;

  QueueWorkerPool(LaneQueues queues, Prober& prober, WorkerCounts workers_per_lane);
  ~QueueWorkerPool();

  QueueWorkerPool(const QueueWorkerPool&) = delete;
  QueueWorkerPool& operator=(const QueueWorkerPool&) = delete;

  void Start();

  // Closes every lane queue and joins the workers. Idempotent.
  void Stop();

  size_t WorkerCount() const { return threads_.size(); }
  uint64_t ProbeCount() const { return probes_.load(std::memory_order_relaxed); }
  uint64_t SkipCount() const { return skips_.load(std::memory_order_relaxed); }
  uint64_t FailureCount() const { return failures_.load(std::memory_order_relaxed); }

 private:
  void WorkerLoop(predict::Lane lane, int worker_index);

  LaneQueues queues_;
  Prober& prober_;
  const WorkerCounts workers_per_lane_;
  std::vector<std::thread> threads_;
  bool started_ = false;

  std::atomic<uint64_t> probes_{0};
  std::atomic<uint64_t> skips_{0};
  std::atomic<uint64_t> failures_{0};
};

}  // namespace livewatch::runtime

#endif  // LIVEWATCH_RUNTIME_QUEUE_WORKER_POOL_HPP_
