// Repository: LiveWatch
// Component: Dispatcher
// Purpose: One scheduling cycle: score monitored channels, recompute their
//          polling interval, and route due channels into the lane queues.
// Copyright (c) 2026 LiveWatch

#ifndef LIVEWATCH_RUNTIME_DISPATCHER_HPP_
#define LIVEWATCH_RUNTIME_DISPATCHER_HPP_

#include <array>
#include <cstdint>
#include <functional>
#include <memory>
#include <random>
#include <string>

#include "livewatch/config/MonitorConfig.hpp"
#include "livewatch/predict/Predictor.hpp"
#include "livewatch/runtime/ChannelRegistry.hpp"
#include "livewatch/runtime/DiskSpaceGate.hpp"
#include "livewatch/runtime/ProbeQueue.hpp"
#include "time/ITimeSource.hpp"

namespace livewatch::runtime {

using LaneQueues = std::array<std::shared_ptr<ProbeQueue>, predict::kLaneCount>;

struct CycleSummary {
  std::array<int, predict::kLaneCount> dispatched{};
  std::array<int, predict::kLaneCount> busy{};
  int waiting = 0;
  int recording = 0;

  int TotalDispatched() const { return dispatched[0] + dispatched[1] + dispatched[2]; }
  int TotalBusy() const { return busy[0] + busy[1] + busy[2]; }
  int TotalActive() const { return TotalDispatched() + TotalBusy(); }

  // "disp=1F+0M+2S busy=0F+0M+0S waiting=3 recording=1"
  std::string ToString() const;
};

// Visits channels in descending (priority_score, random tiebreak) order so
// likely-live channels reach the lanes first. A channel is queued only after
// it wins TryBeginCheck(), which keeps it out of every queue until the probe
// releases it.
class Dispatcher {
 public:
  using SaveRequest = std::function<void()>;

  Dispatcher(const config::MonitorConfig& config,
             ChannelRegistry& registry,
             LaneQueues queues,
             DiskSpaceGate& disk_gate,
             std::shared_ptr<ITimeSource> time_source,
             SaveRequest request_save,
             uint32_t tiebreak_seed = std::random_device{}());

  Dispatcher(const Dispatcher&) = delete;
  Dispatcher& operator=(const Dispatcher&) = delete;

  CycleSummary RunCycle();

 private:
  const int32_t base_interval_seconds_;
  const int32_t notify_interval_seconds_;
  const model::EmaParams ema_;
  ChannelRegistry& registry_;
  LaneQueues queues_;
  DiskSpaceGate& disk_gate_;
  std::shared_ptr<ITimeSource> time_source_;
  SaveRequest request_save_;
  std::mt19937 rng_;
};

}  // namespace livewatch::runtime

#endif  // LIVEWATCH_RUNTIME_DISPATCHER_HPP_
