// Repository: LiveWatch
// Component: Prober
// Purpose: One liveness check for one channel: platform permit, jitter,
//          resolver call, learned-pattern update, session start/stop and
//          notification side effects. Also owns recording-session
//          bookkeeping (stop, finish, retry hand-off).
// Copyright (c) 2026 LiveWatch

#ifndef LIVEWATCH_RUNTIME_PROBER_HPP_
#define LIVEWATCH_RUNTIME_PROBER_HPP_

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <random>
#include <string>

#include "livewatch/config/MonitorConfig.hpp"
#include "livewatch/io/INotifier.hpp"
#include "livewatch/io/IStreamRecorder.hpp"
#include "livewatch/io/IStreamResolver.hpp"
#include "livewatch/model/Channel.hpp"
#include "livewatch/runtime/ActiveRecorders.hpp"
#include "livewatch/runtime/ChannelEventBus.hpp"
#include "livewatch/runtime/ChannelRegistry.hpp"
#include "livewatch/runtime/DiskSpaceGate.hpp"
#include "livewatch/runtime/IWaitStrategy.hpp"
#include "livewatch/runtime/PlatformPermits.hpp"
#include "time/ITimeSource.hpp"

namespace livewatch::runtime {

enum class ProbeOutcome {
  kSkippedRecording = 0,
  kSkippedActiveRecorder,
  kSkippedMonitoringDisabled,
  kScheduleWindowMiss,
  kResolutionError,
  kNotLive,
  kLiveRecordingStarted,
  kLiveNotifyOnly,
  kLiveRecordingSuppressed,  // Disk gate closed.
  kRecordingStartFailed,     // Recorder refused the session.
  kBusy,                     // Another probe holds the channel.
  kCancelled,                // Shutdown interrupted the jitter wait.
};

const char* ProbeOutcomeToString(ProbeOutcome outcome);

// Host of url, lowercased, without a leading "www.". "unknown" when the URL
// has no host.
std::string DerivePlatformKey(const std::string& url);

// Replaces [room_name], [time] and [title] in a push template.
std::string RenderPushTemplate(const std::string& tmpl,
                               const std::string& room_name,
                               const std::string& time,
                               const std::string& title);

class Prober {
 public:
  static constexpr const char* kDefaultPushTitle = "Live Status Notification";
  static constexpr const char* kDefaultStartContent =
      "[room_name] is live! Time: [time] Title: [title]";
  static constexpr const char* kDefaultEndContent =
      "[room_name] live stream has ended. Time: [time]";

  using ChannelPtr = std::shared_ptr<model::Channel>;
  using RetrySink = std::function<void(ChannelPtr)>;
  using SaveRequest = std::function<void()>;

  // Long-lived collaborators; every reference must outlive the Prober.
  struct Collaborators {
    std::shared_ptr<io::IStreamResolver> resolver;
    std::shared_ptr<io::IStreamRecorder> recorder;
    std::shared_ptr<io::INotifier> notifier;
    std::shared_ptr<ITimeSource> time_source;
    std::shared_ptr<IWaitStrategy> wait;
    ChannelRegistry* registry = nullptr;
    PlatformPermits* permits = nullptr;
    DiskSpaceGate* disk_gate = nullptr;
    ActiveRecorders* recorders = nullptr;
    ChannelEventBus* events = nullptr;
    SaveRequest request_save;
  };

  // Throws std::invalid_argument when a collaborator is missing.
  Prober(const config::MonitorConfig& config, Collaborators collaborators,
         uint32_t jitter_seed = std::random_device{}());

  Prober(const Prober&) = delete;
  Prober& operator=(const Prober&) = delete;

  // Where OnRecordingFinished() hands channels that deserve a retry check.
  // Without a sink no retry is scheduled.
  void SetRetrySink(RetrySink sink);

  // Runs one probe. The caller must already hold the channel's check token
  // (TryBeginCheck() succeeded); the token is released before returning,
  // whatever the outcome.
  ProbeOutcome Probe(const ChannelPtr& channel);

  // Takes the check token itself. kBusy when another probe holds it.
  ProbeOutcome ProbeNow(const ChannelPtr& channel);

  // Up to `retries` probes, `delay` apart, stopping early once a recording
  // starts or monitoring is disabled. Returns the last outcome.
  ProbeOutcome CheckWithRetry(const ChannelPtr& channel, int retries,
                              std::chrono::milliseconds delay);
  ProbeOutcome CheckWithRetry(const ChannelPtr& channel);

  // Ends the channel's recording session from the scheduler side. Returns
  // false when the channel was not recording.
  bool StopRecording(const ChannelPtr& channel, bool manually_stopped);

  // Recorder completion for session_token. Completions of a superseded
  // session are ignored.
  void OnRecordingFinished(const std::string& channel_id, uint64_t session_token);

 private:
  ProbeOutcome RunProbe(const ChannelPtr& channel, bool& state_dirty);
  ProbeOutcome HandleLive(const ChannelPtr& channel, const io::StreamInfo& info);
  ProbeOutcome StartSession(const ChannelPtr& channel, const io::StreamInfo& info);
  void HandleOffline(const ChannelPtr& channel, const io::StreamInfo& info);

  std::chrono::milliseconds NextJitter();
  bool PushEnabledFor(const model::ChannelState& state) const;
  void SendDesktopNotification(const std::string& title, const std::string& message);
  void SendPush(const std::string& title, const std::string& body);
  void Publish(const ChannelPtr& channel);

  const config::MonitorConfig config_;
  const model::EmaParams ema_;
  Collaborators c_;

  std::mutex rng_mutex_;
  std::mt19937 rng_;

  std::mutex retry_mutex_;
  RetrySink retry_sink_;
};

}  // namespace livewatch::runtime

#endif  // LIVEWATCH_RUNTIME_PROBER_HPP_
