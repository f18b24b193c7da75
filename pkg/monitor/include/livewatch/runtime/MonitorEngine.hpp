// Repository: LiveWatch
// Component: Monitor Engine
// Purpose: Owns the scheduler runtime (registry, lanes, workers, prober,
//          heartbeat, retry worker, persistence) and exposes the channel
//          management operations used by the control surface.
// Copyright (c) 2026 LiveWatch

#ifndef LIVEWATCH_RUNTIME_MONITOR_ENGINE_HPP_
#define LIVEWATCH_RUNTIME_MONITOR_ENGINE_HPP_

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "livewatch/config/MonitorConfig.hpp"
#include "livewatch/io/IDiskSpaceGuard.hpp"
#include "livewatch/io/INotifier.hpp"
#include "livewatch/io/IStreamRecorder.hpp"
#include "livewatch/io/IStreamResolver.hpp"
#include "livewatch/model/ChannelTypes.hpp"
#include "livewatch/persist/DebouncedPersister.hpp"
#include "livewatch/persist/IPersistenceGateway.hpp"
#include "livewatch/runtime/ActiveRecorders.hpp"
#include "livewatch/runtime/ChannelEventBus.hpp"
#include "livewatch/runtime/ChannelRegistry.hpp"
#include "livewatch/runtime/Dispatcher.hpp"
#include "livewatch/runtime/DiskSpaceGate.hpp"
#include "livewatch/runtime/IWaitStrategy.hpp"
#include "livewatch/runtime/PlatformPermits.hpp"
#include "livewatch/runtime/Prober.hpp"
#include "livewatch/runtime/QueueWorkerPool.hpp"
#include "livewatch/runtime/RetryWorker.hpp"
#include "livewatch/util/IdGenerator.hpp"
#include "time/ITimeSource.hpp"

namespace livewatch::runtime {

struct EngineDependencies {
  std::shared_ptr<io::IStreamResolver> resolver;
  std::shared_ptr<io::IStreamRecorder> recorder;
  std::shared_ptr<io::INotifier> notifier;
  std::shared_ptr<io::IDiskSpaceGuard> disk_guard;
  std::shared_ptr<persist::IPersistenceGateway> store;
  std::shared_ptr<ITimeSource> time_source;
  std::shared_ptr<IWaitStrategy> wait;
  // Fixed seeds make dispatch order and jitter reproducible in tests.
  std::optional<uint32_t> seed;
};

// Lifecycle: construct → LoadChannels() → Start() → ... → Stop().
// Management calls are valid in every state; probes requested before
// Start() wait in the fast lane until the workers run.
class MonitorEngine {
 public:
  using ChannelPtr = std::shared_ptr<model::Channel>;

  // Validates config (std::invalid_argument) and requires every dependency.
  MonitorEngine(const config::MonitorConfig& config, EngineDependencies deps);
  ~MonitorEngine();

  MonitorEngine(const MonitorEngine&) = delete;
  MonitorEngine& operator=(const MonitorEngine&) = delete;

  // Registers every stored channel with runtime state reset. Returns the
  // number of channels loaded. Throws std::runtime_error from the store.
  size_t LoadChannels();

  // Starts lane workers, the retry worker and the heartbeat thread.
  void Start();
  // Starts only the lane and retry workers; cycles run through RunCycleNow().
  void StartWorkers();

  // Interrupts every wait, drains workers, stops active recordings and
  // flushes pending persistence. Idempotent.
  void Stop();

  CycleSummary RunCycleNow();

  // New channel with a generated id. Queues an immediate probe when the
  // configuration enables monitoring. Throws std::invalid_argument on an
  // empty URL.
  model::ChannelState AddChannel(const std::string& url, const model::ChannelConfig& config);

  // Disables monitoring, stops recording and unregisters. Returns the
  // number of ids that were registered.
  size_t RemoveChannels(const std::vector<std::string>& ids);

  // Applies patch. A monitor_enabled change goes through SetMonitoring().
  // Throws std::out_of_range for an unknown id.
  model::ChannelState UpdateChannel(const std::string& id, const model::ChannelPatch& patch);

  // ids empty means every channel. Returns the number of channels changed.
  size_t SetMonitoring(const std::vector<std::string>& ids, bool enabled);

  // Manual stop. False when the channel is unknown or not recording.
  bool StopRecording(const std::string& id);

  std::vector<model::ChannelState> ListChannels() const;
  std::optional<model::ChannelState> GetChannel(const std::string& id) const;

  // Current likelihood for a channel state, for status views.
  double LikelihoodOf(const model::ChannelState& state) const;
  int64_t NowUtcMs() const { return time_source_->NowUtcMs(); }

  ChannelEventBus& events() { return events_; }
  ChannelRegistry& registry() { return registry_; }
  Prober& prober() { return *prober_; }
  DiskSpaceGate& disk_gate() { return disk_gate_; }
  persist::DebouncedPersister& persister() { return *persister_; }
  const config::MonitorConfig& config() const { return config_; }

 private:
  void HeartbeatLoop();
  void RunCycleSafe();
  bool StartMonitoring(const ChannelPtr& channel);
  bool StopMonitoring(const ChannelPtr& channel);
  void RequestImmediateProbe(const ChannelPtr& channel);
  void StopAllRecordings();

  const config::MonitorConfig config_;
  EngineDependencies deps_;
  std::shared_ptr<ITimeSource> time_source_;
  std::shared_ptr<IWaitStrategy> wait_;

  ChannelRegistry registry_;
  ChannelEventBus events_;
  ActiveRecorders recorders_;
  PlatformPermits permits_;
  DiskSpaceGate disk_gate_;
  LaneQueues queues_;

  std::unique_ptr<util::IdGenerator> ids_;
  std::unique_ptr<persist::DebouncedPersister> persister_;
  std::unique_ptr<Prober> prober_;
  std::unique_ptr<Dispatcher> dispatcher_;
  std::unique_ptr<QueueWorkerPool> workers_;
  std::unique_ptr<RetryWorker> retry_worker_;

  std::mutex lifecycle_mutex_;
  std::mutex cycle_mutex_;
  std::thread heartbeat_thread_;
  bool workers_started_ = false;
  std::atomic<bool> stopped_{false};
};

}  // namespace livewatch::runtime

#endif  // LIVEWATCH_RUNTIME_MONITOR_ENGINE_HPP_
