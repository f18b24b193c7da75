// Repository: LiveWatch
// Component: Monitor Engine
// Copyright (c) 2026 LiveWatch

#include "livewatch/runtime/MonitorEngine.hpp"

#include <chrono>
#include <random>
#include <stdexcept>
#include <string>

#include "livewatch/predict/Predictor.hpp"
#include "livewatch/util/Logger.hpp"
#include "livewatch/util/Timestamp.hpp"
#include "livewatch/util/IdGenerator.hpp"

namespace livewatch::runtime {

using livewatch::model::ChannelState;
using livewatch::model::ChannelStatus;
using livewatch::util::LogDebug;
using livewatch::util::LogInfo;
using livewatch::util::LogWarn;
using livewatch::util::LogError;

namespace {

constexpr std::chrono::seconds kRecorderStopTimeout{5};

// Stored records carry no runtime state; every loaded channel starts idle.
void ResetRuntimeState(ChannelState& s, int32_t base_interval_seconds) {
  s.is_live = false;
  s.is_recording = false;
  s.is_checking = false;
  s.manually_stopped = false;
  s.force_stop = false;
  s.stopping_in_progress = false;
  s.notified_live_start = false;
  s.notified_live_end = false;
  s.status = s.config.monitor_enabled ? ChannelStatus::kMonitoring
                                      : ChannelStatus::kStoppedMonitoring;
  s.live_title.clear();
  s.detection_time_ms.reset();
  s.start_time_ms.reset();
  s.cumulative_duration_ms = 0;
  s.loop_interval_seconds = base_interval_seconds;
}

}  // namespace

MonitorEngine::MonitorEngine(const config::MonitorConfig& config, EngineDependencies deps)
    : config_(config),
      deps_(std::move(deps)),
      time_source_(deps_.time_source),
      wait_(deps_.wait),
      permits_(config.platform_max_concurrent_requests),
      disk_gate_(deps_.disk_guard, config.recording_space_threshold_gb, config.recording_dir),
      queues_{std::make_shared<ProbeQueue>("fast"),
              std::make_shared<ProbeQueue>("medium"),
              std::make_shared<ProbeQueue>("slow")} {
  config_.Validate();
  if (!deps_.resolver || !deps_.recorder || !deps_.notifier || !deps_.store ||
      !time_source_ || !wait_) {
    throw std::invalid_argument(
        "MonitorEngine: resolver, recorder, notifier, store, time source and wait strategy "
        "are required");
  }

  const uint32_t seed = deps_.seed.has_value() ? *deps_.seed : std::random_device{}();
  ids_ = std::make_unique<util::IdGenerator>(seed + 2ULL);

  persister_ = std::make_unique<persist::DebouncedPersister>(
      deps_.store, [this] { return registry_.SnapshotStates(); },
      std::chrono::milliseconds(config_.persist_debounce_ms));
  registry_.SetMutationListener([this] { persister_->RequestSave(); });

  Prober::Collaborators collaborators;
  collaborators.resolver = deps_.resolver;
  collaborators.recorder = deps_.recorder;
  collaborators.notifier = deps_.notifier;
  collaborators.time_source = time_source_;
  collaborators.wait = wait_;
  collaborators.registry = &registry_;
  collaborators.permits = &permits_;
  collaborators.disk_gate = &disk_gate_;
  collaborators.recorders = &recorders_;
  collaborators.events = &events_;
  collaborators.request_save = [this] { persister_->RequestSave(); };
  prober_ = std::make_unique<Prober>(config_, std::move(collaborators), seed);

  dispatcher_ = std::make_unique<Dispatcher>(config_, registry_, queues_, disk_gate_,
                                             time_source_,
                                             [this] { persister_->RequestSave(); }, seed + 1);
  workers_ = std::make_unique<QueueWorkerPool>(
      queues_, *prober_,
      QueueWorkerPool::WorkerCounts{config_.fast_workers, config_.medium_workers,
                                    config_.slow_workers});
  retry_worker_ = std::make_unique<RetryWorker>(*prober_);
  prober_->SetRetrySink([this](ChannelPtr channel) {
    if (!retry_worker_->Enqueue(std::move(channel))) {
      LogDebug("MonitorEngine", "RETRY_DROPPED").Field("reason", "stopped");
    }
  });
}

MonitorEngine::~MonitorEngine() {
  Stop();
}

size_t MonitorEngine::LoadChannels() {
  auto states = deps_.store->LoadAll();
  size_t loaded = 0;
  for (auto& state : states) {
    ResetRuntimeState(state, config_.loop_time_seconds);
    const std::string id = state.id;
    if (!registry_.Add(std::make_shared<model::Channel>(std::move(state)))) {
      LogWarn("MonitorEngine", "DUPLICATE_STORED_CHANNEL").Field("id", id);
      continue;
    }
    ++loaded;
  }
  LogInfo("MonitorEngine", "LOADED").Field("channels", loaded);
  return loaded;
}

void MonitorEngine::StartWorkers() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (workers_started_ || stopped_.load()) return;
  workers_->Start();
  retry_worker_->Start();
  workers_started_ = true;
  LogInfo("MonitorEngine", "WORKERS_STARTED").Field("count", workers_->WorkerCount());
}

void MonitorEngine::Start() {
  StartWorkers();
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (heartbeat_thread_.joinable() || stopped_.load()) return;
  heartbeat_thread_ = std::thread(&MonitorEngine::HeartbeatLoop, this);
}

void MonitorEngine::Stop() {
  if (stopped_.exchange(true)) return;
  LogInfo("MonitorEngine", "STOPPING");

  wait_->Interrupt();
  {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (heartbeat_thread_.joinable()) heartbeat_thread_.join();
  }
  workers_->Stop();
  retry_worker_->Stop();
  StopAllRecordings();

  if (!persister_->Flush()) {
    LogError("MonitorEngine", "FINAL_SAVE_FAILED");
  }
  LogInfo("MonitorEngine", "STOPPED");
}

void MonitorEngine::HeartbeatLoop() {
  LogInfo("MonitorEngine", "HEARTBEAT_STARTED")
      .Field("interval", std::to_string(config_.heartbeat_seconds) + "s");

  if (config_.check_on_startup) {
    RunCycleSafe();
  }
  while (wait_->SleepFor(std::chrono::seconds(config_.heartbeat_seconds))) {
    RunCycleSafe();
  }
  LogDebug("MonitorEngine", "HEARTBEAT_EXITED");
}

void MonitorEngine::RunCycleSafe() {
  try {
    RunCycleNow();
  } catch (const std::exception& e) {
    LogError("MonitorEngine", "CYCLE_FAILED").Field("error", e.what());
  } catch (...) {
    LogError("MonitorEngine", "CYCLE_FAILED").Field("error", "unknown");
  }
}

CycleSummary MonitorEngine::RunCycleNow() {
  std::lock_guard<std::mutex> lock(cycle_mutex_);
  return dispatcher_->RunCycle();
}

ChannelState MonitorEngine::AddChannel(const std::string& url,
                                       const model::ChannelConfig& config) {
  if (url.empty()) {
    throw std::invalid_argument("AddChannel: url must not be empty");
  }
  ChannelState state;
  state.id = ids_->NextUuid();
  state.url = url;
  state.config = config;
  if (state.config.streamer_name.empty()) {
    state.config.streamer_name = config_.default_streamer_name;
  }
  state.added_at = util::FormatLocalTimestamp(time_source_->NowUtcMs());
  state.loop_interval_seconds = config_.loop_time_seconds;
  state.status = config.monitor_enabled ? ChannelStatus::kChecking
                                        : ChannelStatus::kStoppedMonitoring;

  auto channel = std::make_shared<model::Channel>(state);
  if (!registry_.Add(channel)) {
    throw std::runtime_error("AddChannel: generated id collided: " + state.id);
  }
  LogInfo("MonitorEngine", "CHANNEL_ADDED").Field("id", state.id).Field("url", url);
  events_.PublishUpdate(state);

  if (config.monitor_enabled) {
    RequestImmediateProbe(channel);
  }
  return channel->Snapshot();
}

size_t MonitorEngine::RemoveChannels(const std::vector<std::string>& ids) {
  size_t removed = 0;
  for (const auto& id : ids) {
    auto channel = registry_.FindById(id);
    if (!channel) continue;

    // Any queued probe sees monitoring disabled and becomes a no-op.
    channel->Mutate([](ChannelState& s) {
      s.config.monitor_enabled = false;
      s.status = ChannelStatus::kStoppedMonitoring;
    });
    prober_->StopRecording(channel, true);
    if (!registry_.Remove(id)) continue;

    ChannelEvent event;
    event.type = ChannelEventType::kRemoved;
    event.state = channel->Snapshot();
    events_.Publish(event);
    LogInfo("MonitorEngine", "CHANNEL_REMOVED").Field("id", id);
    ++removed;
  }
  return removed;
}

ChannelState MonitorEngine::UpdateChannel(const std::string& id,
                                          const model::ChannelPatch& patch) {
  auto channel = registry_.FindById(id);
  if (!channel) {
    throw std::out_of_range("UpdateChannel: unknown channel " + id);
  }

  model::ChannelPatch config_patch = patch;
  config_patch.monitor_enabled.reset();
  channel->Mutate([&config_patch](ChannelState& s) { config_patch.ApplyTo(s); });

  if (patch.monitor_enabled.has_value()) {
    if (*patch.monitor_enabled) {
      StartMonitoring(channel);
    } else {
      StopMonitoring(channel);
    }
  }

  persister_->RequestSave();
  const ChannelState updated = channel->Snapshot();
  events_.PublishUpdate(updated);
  LogInfo("MonitorEngine", "CHANNEL_UPDATED").Field("id", id);
  return updated;
}

size_t MonitorEngine::SetMonitoring(const std::vector<std::string>& ids, bool enabled) {
  std::vector<ChannelPtr> targets;
  if (ids.empty()) {
    const auto all = registry_.All();
    targets.assign(all->begin(), all->end());
  } else {
    for (const auto& id : ids) {
      if (auto channel = registry_.FindById(id)) targets.push_back(std::move(channel));
    }
  }

  size_t changed = 0;
  for (const auto& channel : targets) {
    if (enabled ? StartMonitoring(channel) : StopMonitoring(channel)) ++changed;
  }
  persister_->RequestSave();

  LogInfo("MonitorEngine", enabled ? "MONITOR_START" : "MONITOR_STOP")
      .Field("requested", targets.size())
      .Field("changed", changed);
  return changed;
}

bool MonitorEngine::StartMonitoring(const ChannelPtr& channel) {
  const bool changed = channel->Mutate([](ChannelState& s) {
    if (s.config.monitor_enabled) return false;
    s.config.monitor_enabled = true;
    s.is_live = false;
    s.manually_stopped = false;
    s.status = ChannelStatus::kChecking;
    return true;
  });
  if (!changed) return false;
  events_.PublishUpdate(channel->Snapshot());
  RequestImmediateProbe(channel);
  return true;
}

bool MonitorEngine::StopMonitoring(const ChannelPtr& channel) {
  const bool changed = channel->Mutate([](ChannelState& s) {
    if (!s.config.monitor_enabled) return false;
    s.config.monitor_enabled = false;
    s.status = ChannelStatus::kStoppedMonitoring;
    return true;
  });
  if (!changed) return false;
  prober_->StopRecording(channel, true);
  // StopRecording leaves kNotRecording behind; monitoring-stopped wins.
  channel->Mutate([](ChannelState& s) { s.status = ChannelStatus::kStoppedMonitoring; });
  events_.PublishUpdate(channel->Snapshot());
  return true;
}

bool MonitorEngine::StopRecording(const std::string& id) {
  auto channel = registry_.FindById(id);
  if (!channel) return false;
  return prober_->StopRecording(channel, true);
}

void MonitorEngine::RequestImmediateProbe(const ChannelPtr& channel) {
  if (stopped_.load()) return;
  // A channel already checking or queued gets no second probe.
  if (!channel->TryBeginCheck()) return;
  const auto& fast = queues_[static_cast<size_t>(predict::Lane::kFast)];
  if (!fast->Push(channel)) {
    channel->EndCheck();
  }
}

void MonitorEngine::StopAllRecordings() {
  const auto channels = registry_.All();
  for (const auto& channel : *channels) {
    if (channel->IsRecording()) {
      prober_->StopRecording(channel, false);
    }
  }
  recorders_.RequestStopAll();
  for (const auto& id : recorders_.Ids()) {
    auto handle = recorders_.Take(id);
    if (handle && !handle->WaitStopped(kRecorderStopTimeout)) {
      LogWarn("MonitorEngine", "RECORDER_STOP_TIMEOUT").Field("id", id);
    }
  }
}

std::vector<ChannelState> MonitorEngine::ListChannels() const {
  return registry_.SnapshotStates();
}

std::optional<ChannelState> MonitorEngine::GetChannel(const std::string& id) const {
  auto channel = registry_.FindById(id);
  if (!channel) return std::nullopt;
  return channel->Snapshot();
}

double MonitorEngine::LikelihoodOf(const ChannelState& state) const {
  return predict::Predictor::Likelihood(state.stats, time_source_->LocalNow());
}

}  // namespace livewatch::runtime
