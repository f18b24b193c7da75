// Repository: LiveWatch
// Component: Prober
// Copyright (c) 2026 LiveWatch

#include "livewatch/runtime/Prober.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string>

#include "livewatch/runtime/ScheduleWindow.hpp"
#include "livewatch/util/Logger.hpp"
#include "livewatch/util/Timestamp.hpp"

namespace livewatch::runtime {

using livewatch::model::ChannelState;
using livewatch::model::ChannelStatus;
using livewatch::util::LogDebug;
using livewatch::util::LogInfo;
using livewatch::util::LogWarn;
using livewatch::util::LogError;

namespace {

void ReplaceAll(std::string& text, const std::string& from, const std::string& to) {
  size_t pos = 0;
  while ((pos = text.find(from, pos)) != std::string::npos) {
    text.replace(pos, from.size(), to);
    pos += to.size();
  }
}

bool AdoptsAnchorName(const ChannelState& s, const std::string& default_name) {
  return s.config.streamer_name.empty() || s.config.streamer_name == default_name;
}

void CloseSessionTimers(ChannelState& s, int64_t now_ms) {
  if (s.start_time_ms.has_value()) {
    s.cumulative_duration_ms += std::max<int64_t>(0, now_ms - *s.start_time_ms);
    s.last_duration_ms = s.cumulative_duration_ms;
  }
  s.start_time_ms.reset();
  s.is_recording = false;
}

}  // namespace

const char* ProbeOutcomeToString(ProbeOutcome outcome) {
  switch (outcome) {
    case ProbeOutcome::kSkippedRecording: return "skipped_recording";
    case ProbeOutcome::kSkippedActiveRecorder: return "skipped_active_recorder";
    case ProbeOutcome::kSkippedMonitoringDisabled: return "skipped_monitoring_disabled";
    case ProbeOutcome::kScheduleWindowMiss: return "schedule_window_miss";
    case ProbeOutcome::kResolutionError: return "resolution_error";
    case ProbeOutcome::kNotLive: return "not_live";
    case ProbeOutcome::kLiveRecordingStarted: return "live_recording_started";
    case ProbeOutcome::kLiveNotifyOnly: return "live_notify_only";
    case ProbeOutcome::kLiveRecordingSuppressed: return "live_recording_suppressed";
    case ProbeOutcome::kRecordingStartFailed: return "recording_start_failed";
    case ProbeOutcome::kBusy: return "busy";
    case ProbeOutcome::kCancelled: return "cancelled";
  }
  return "unknown";
}

std::string DerivePlatformKey(const std::string& url) {
  std::string rest = url;
  const auto scheme = rest.find("://");
  if (scheme != std::string::npos) rest = rest.substr(scheme + 3);
  const auto end = rest.find_first_of("/?#");
  std::string host = rest.substr(0, end);
  const auto at = host.rfind('@');
  if (at != std::string::npos) host = host.substr(at + 1);
  const auto colon = host.find(':');
  if (colon != std::string::npos) host = host.substr(0, colon);
  std::transform(host.begin(), host.end(), host.begin(),
                 [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
  if (host.rfind("www.", 0) == 0) host = host.substr(4);
  return host.empty() ? "unknown" : host;
}

std::string RenderPushTemplate(const std::string& tmpl,
                               const std::string& room_name,
                               const std::string& time,
                               const std::string& title) {
  std::string out = tmpl;
  ReplaceAll(out, "[room_name]", room_name);
  ReplaceAll(out, "[time]", time);
  ReplaceAll(out, "[title]", title);
  return out;
}

Prober::Prober(const config::MonitorConfig& config, Collaborators collaborators,
               uint32_t jitter_seed)
    : config_(config),
      ema_{config.ema_alpha_active, config.ema_alpha_offline},
      c_(std::move(collaborators)),
      rng_(jitter_seed) {
  if (!c_.resolver || !c_.recorder || !c_.notifier || !c_.time_source || !c_.wait ||
      !c_.registry || !c_.permits || !c_.disk_gate || !c_.recorders || !c_.events) {
    throw std::invalid_argument("Prober: every collaborator is required");
  }
}

void Prober::SetRetrySink(RetrySink sink) {
  std::lock_guard<std::mutex> lock(retry_mutex_);
  retry_sink_ = std::move(sink);
}

ProbeOutcome Prober::ProbeNow(const ChannelPtr& channel) {
  if (!channel->TryBeginCheck()) {
    LogDebug("Prober", "BUSY").Field("id", channel->id());
    return ProbeOutcome::kBusy;
  }
  return Probe(channel);
}

ProbeOutcome Prober::Probe(const ChannelPtr& channel) {
  bool state_dirty = false;

  // Releases the check token on every path, then reports the final state.
  struct CheckRelease {
    Prober& prober;
    const ChannelPtr& channel;
    const bool& dirty;
    ~CheckRelease() {
      channel->EndCheck();
      try {
        if (dirty && prober.c_.request_save) prober.c_.request_save();
        prober.Publish(channel);
      } catch (const std::exception& e) {
        LogError("Prober", "RELEASE_FAILED").Field("id", channel->id()).Field("error", e.what());
      } catch (...) {
        LogError("Prober", "RELEASE_FAILED").Field("id", channel->id()).Field("error", "unknown");
      }
    }
  } release{*this, channel, state_dirty};

  const ProbeOutcome outcome = RunProbe(channel, state_dirty);

  LogDebug("Prober", "PROBE")
      .Field("id", channel->id())
      .Field("outcome", ProbeOutcomeToString(outcome));
  return outcome;
}

ProbeOutcome Prober::RunProbe(const ChannelPtr& channel, bool& state_dirty) {
  const std::string& id = channel->id();
  const ChannelState before = channel->Snapshot();

  if (before.is_recording) {
    return ProbeOutcome::kSkippedRecording;
  }
  if (c_.recorders->Contains(id)) {
    if (c_.recorders->IsActive(id)) {
      LogDebug("Prober", "SKIP_ACTIVE_RECORDER").Field("id", id);
      return ProbeOutcome::kSkippedActiveRecorder;
    }
    LogDebug("Prober", "PROCEED_STOPPING_RECORDER").Field("id", id);
  }
  if (!before.config.monitor_enabled) {
    channel->Mutate([](ChannelState& s) { s.status = ChannelStatus::kStoppedMonitoring; });
    return ProbeOutcome::kSkippedMonitoringDisabled;
  }

  const int64_t started_ms = c_.time_source->NowUtcMs();
  channel->Mutate([started_ms](ChannelState& s) {
    s.detection_time_ms = started_ms;
    s.status = ChannelStatus::kChecking;
  });
  Publish(channel);

  if (before.config.scheduled_recording) {
    const auto windows = ParseScheduleWindows(before.config.scheduled_start_time,
                                              before.config.monitor_hours);
    if (!InAnyWindow(windows, c_.time_source->LocalTimeAt(started_ms))) {
      channel->Mutate([](ChannelState& s) {
        s.status = ChannelStatus::kNotInScheduledWindow;
        s.is_live = false;
      });
      std::string spans;
      for (size_t i = 0; i < windows.size(); ++i) {
        if (i) spans += ',';
        spans += windows[i].ToString();
      }
      LogInfo("Prober", "OUT_OF_WINDOW").Field("id", id).Field("url", before.url).Field("windows", spans);
      return ProbeOutcome::kScheduleWindowMiss;
    }
  }

  std::string platform_key = before.platform_key;
  if (platform_key.empty()) {
    platform_key = DerivePlatformKey(before.url);
    channel->Mutate([&platform_key](ChannelState& s) {
      s.platform_key = platform_key;
      if (s.platform.empty()) s.platform = platform_key;
    });
    state_dirty = true;
  }

  io::StreamInfo info;
  {
    auto permit = c_.permits->Acquire(platform_key);
    if (!c_.wait->SleepFor(NextJitter())) {
      return ProbeOutcome::kCancelled;
    }
    try {
      info = c_.resolver->Resolve(before.url, platform_key);
    } catch (const std::exception& e) {
      info = io::StreamInfo{};
      info.error = e.what();
    }
  }

  if (!info.IsComplete()) {
    LogError("Prober", "RESOLVE_FAILED")
        .Field("id", id)
        .Field("url", before.url)
        .Field("error", info.error.value_or("missing anchor name"));
    channel->Mutate([](ChannelState& s) { s.status = ChannelStatus::kCheckError; });
    return ProbeOutcome::kResolutionError;
  }

  // Removal and stop-monitoring may have landed during the network call.
  if (!channel->IsMonitored()) {
    return ProbeOutcome::kSkippedMonitoringDisabled;
  }

  state_dirty = true;
  if (info.is_live) {
    return HandleLive(channel, info);
  }
  HandleOffline(channel, info);
  return ProbeOutcome::kNotLive;
}

ProbeOutcome Prober::HandleLive(const ChannelPtr& channel, const io::StreamInfo& info) {
  const int64_t now_ms = c_.time_source->NowUtcMs();
  const LocalTime local = c_.time_source->LocalTimeAt(now_ms);

  bool went_live = false;
  bool push_start = false;
  const ChannelState after = channel->Mutate([&](ChannelState& s) {
    s.last_active_at = util::FormatLocalTimestamp(now_ms);
    model::IncrementLiveCounts(s.stats, true, ema_, now_ms, local);
    s.live_title = info.title;
    if (AdoptsAnchorName(s, config_.default_streamer_name)) {
      s.config.streamer_name = info.anchor_name;
    }
    if (!s.is_live) {
      s.is_live = true;
      s.notified_live_start = false;
      s.notified_live_end = false;
      s.cumulative_duration_ms = 0;
      s.last_duration_ms = 0;
      went_live = true;
    }
    if (PushEnabledFor(s) && !s.notified_live_start) {
      s.notified_live_start = true;
      push_start = true;
    }
    return s;
  });

  if (went_live) {
    LogInfo("Prober", "LIVE").Field("id", after.id).Field("streamer", after.config.streamer_name);
    SendDesktopNotification("Live Notification",
                            after.config.streamer_name + " | live stream started");
  }
  if (push_start) {
    const std::string& content = config_.custom_stream_start_content.empty()
                                     ? std::string(kDefaultStartContent)
                                     : config_.custom_stream_start_content;
    SendPush(config_.custom_notification_title.empty() ? kDefaultPushTitle
                                                       : config_.custom_notification_title,
             RenderPushTemplate(content, after.config.streamer_name,
                                util::FormatLocalTimestamp(now_ms),
                                after.live_title.empty() ? "None" : after.live_title));
  }

  if (after.config.only_notify_no_record) {
    const int32_t base = config_.loop_time_seconds;
    const int32_t notify = config_.notify_loop_time_seconds;
    channel->Mutate([base, notify](ChannelState& s) {
      s.loop_interval_seconds = s.notified_live_start ? std::max(base, notify) : base;
      s.cumulative_duration_ms = 0;
      s.last_duration_ms = 0;
      s.status = ChannelStatus::kLiveBroadcasting;
    });
    return ProbeOutcome::kLiveNotifyOnly;
  }

  if (!c_.disk_gate->RecordingEnabled()) {
    channel->Mutate([](ChannelState& s) { s.status = ChannelStatus::kNoDiskSpace; });
    LogWarn("Prober", "RECORDING_SUPPRESSED").Field("id", after.id).Field("reason", "disk_space");
    return ProbeOutcome::kLiveRecordingSuppressed;
  }

  return StartSession(channel, info);
}

ProbeOutcome Prober::StartSession(const ChannelPtr& channel, const io::StreamInfo& info) {
  const int64_t now_ms = c_.time_source->NowUtcMs();
  const int32_t base = config_.loop_time_seconds;
  // Checked under the channel lock: a stop or removal that disabled
  // monitoring after the resolve must not be followed by a session.
  const ProbeOutcome begin = channel->Mutate([now_ms, base](ChannelState& s) {
    if (!s.config.monitor_enabled) return ProbeOutcome::kSkippedMonitoringDisabled;
    if (!s.is_live || s.is_recording) return ProbeOutcome::kSkippedRecording;
    s.status = ChannelStatus::kPreparingRecording;
    s.loop_interval_seconds = base;
    s.cumulative_duration_ms = 0;
    s.last_duration_ms = 0;
    s.start_time_ms = now_ms;
    s.is_recording = true;
    s.force_stop = false;
    s.manually_stopped = false;
    return ProbeOutcome::kLiveRecordingStarted;
  });
  if (begin != ProbeOutcome::kLiveRecordingStarted) {
    return begin;
  }

  const ChannelState snapshot = channel->Snapshot();
  const std::string output_dir =
      snapshot.config.recording_dir.empty() ? config_.recording_dir : snapshot.config.recording_dir;
  const std::string id = snapshot.id;

  auto revert = [&](ChannelStatus status) {
    channel->Mutate([status](ChannelState& s) {
      s.start_time_ms.reset();
      s.is_recording = false;
      s.status = status;
    });
  };

  uint64_t token = 0;
  try {
    token = c_.recorders->Launch(id, [&](uint64_t session) {
      return c_.recorder->Start(
          snapshot, info, output_dir,
          [this, id, session](const std::string&) { OnRecordingFinished(id, session); });
    });
  } catch (const std::exception& e) {
    LogError("Prober", "RECORDING_START_FAILED").Field("id", id).Field("error", e.what());
    revert(ChannelStatus::kNotRecording);
    return ProbeOutcome::kRecordingStartFailed;
  }
  if (token == 0) {
    LogWarn("Prober", "RECORDING_CONFLICT").Field("id", id);
    revert(ChannelStatus::kLiveBroadcasting);
    return ProbeOutcome::kSkippedActiveRecorder;
  }

  // Monitoring may have been stopped while the recorder call was in flight.
  // A stop that saw is_recording reached the table already; this covers the
  // one that ran before the slot was reserved.
  if (!channel->IsMonitored()) {
    c_.recorders->RequestStop(id);
    const int64_t stopped_ms = c_.time_source->NowUtcMs();
    channel->Mutate([stopped_ms](ChannelState& s) {
      if (s.is_recording) {
        s.is_live = false;
        CloseSessionTimers(s, stopped_ms);
        s.status = ChannelStatus::kStoppedMonitoring;
      }
      s.manually_stopped = true;
    });
    LogInfo("Prober", "RECORDING_ABORTED")
        .Field("id", id)
        .Field("session", token)
        .Field("reason", "monitoring_stopped");
    if (c_.request_save) c_.request_save();
    return ProbeOutcome::kSkippedMonitoringDisabled;
  }

  channel->Mutate([](ChannelState& s) {
    if (s.is_recording) s.status = ChannelStatus::kRecording;
  });
  LogInfo("Prober", "RECORDING_STARTED").Field("id", id).Field("session", token).Field("dir", output_dir);
  return ProbeOutcome::kLiveRecordingStarted;
}

void Prober::HandleOffline(const ChannelPtr& channel, const io::StreamInfo& info) {
  const int64_t now_ms = c_.time_source->NowUtcMs();
  const LocalTime local = c_.time_source->LocalTimeAt(now_ms);

  bool went_offline = false;
  bool push_end = false;
  const ChannelState after = channel->Mutate([&](ChannelState& s) {
    model::IncrementLiveCounts(s.stats, false, ema_, now_ms, local);
    s.is_recording = false;
    if (s.is_live) {
      s.is_live = false;
      went_offline = true;
      if (PushEnabledFor(s) && config_.push_on_stream_end && !s.notified_live_end) {
        s.notified_live_end = true;
        push_end = true;
      }
    }
    if (AdoptsAnchorName(s, config_.default_streamer_name)) {
      s.config.streamer_name = info.anchor_name;
    }
    s.status = ChannelStatus::kMonitoring;
    return s;
  });

  if (went_offline) {
    LogInfo("Prober", "OFFLINE").Field("id", after.id).Field("streamer", after.config.streamer_name);
  }
  if (push_end) {
    const std::string& content = config_.custom_stream_end_content.empty()
                                     ? std::string(kDefaultEndContent)
                                     : config_.custom_stream_end_content;
    SendPush(config_.custom_notification_title.empty() ? kDefaultPushTitle
                                                       : config_.custom_notification_title,
             RenderPushTemplate(content, after.config.streamer_name,
                                util::FormatLocalTimestamp(now_ms),
                                after.live_title.empty() ? "None" : after.live_title));
  }
}

ProbeOutcome Prober::CheckWithRetry(const ChannelPtr& channel) {
  return CheckWithRetry(channel, config_.retry_attempts,
                        std::chrono::seconds(config_.retry_delay_seconds));
}

ProbeOutcome Prober::CheckWithRetry(const ChannelPtr& channel, int retries,
                                    std::chrono::milliseconds delay) {
  ProbeOutcome last = ProbeOutcome::kSkippedMonitoringDisabled;
  for (int attempt = 0; attempt < retries; ++attempt) {
    const ChannelState s = channel->Snapshot();
    if (s.is_recording) {
      last = ProbeOutcome::kSkippedRecording;
      break;
    }
    if (!s.config.monitor_enabled) {
      last = ProbeOutcome::kSkippedMonitoringDisabled;
      break;
    }

    LogInfo("Prober", "RETRY_CHECK")
        .Field("id", s.id)
        .Field("attempt", std::to_string(attempt + 1) + "/" + std::to_string(retries))
        .Field("url", s.url);

    last = ProbeNow(channel);
    if (channel->IsRecording()) {
      LogInfo("Prober", "RETRY_RESUMED").Field("id", s.id);
      break;
    }
    if (attempt < retries - 1 && !c_.wait->SleepFor(delay)) {
      break;
    }
  }
  return last;
}

bool Prober::StopRecording(const ChannelPtr& channel, bool manually_stopped) {
  const std::string& id = channel->id();
  const int64_t now_ms = c_.time_source->NowUtcMs();
  // One transition, so no reader sees is_recording without is_live.
  const bool was_recording = channel->Mutate([&](ChannelState& s) {
    s.is_live = false;
    if (!s.is_recording) return false;
    s.stopping_in_progress = true;
    s.detection_time_ms.reset();
    CloseSessionTimers(s, now_ms);
    s.manually_stopped = manually_stopped;
    s.status = ChannelStatus::kNotRecording;
    return true;
  });
  if (!was_recording) {
    return false;
  }

  if (!c_.recorders->RequestStop(id)) {
    LogWarn("Prober", "NO_ACTIVE_RECORDER").Field("id", id).Field("force_stop", 1);
    channel->Mutate([](ChannelState& s) { s.force_stop = true; });
  }

  LogInfo("Prober", "RECORDING_STOPPED").Field("id", id).Field("manual", manually_stopped ? 1 : 0);

  if (c_.request_save) c_.request_save();
  Publish(channel);
  return true;
}

void Prober::OnRecordingFinished(const std::string& channel_id, uint64_t session_token) {
  if (!c_.recorders->ReleaseSession(channel_id, session_token)) {
    LogDebug("Prober", "STALE_SESSION_FINISH").Field("id", channel_id).Field("session", session_token);
    return;
  }

  auto channel = c_.registry->FindById(channel_id);
  if (!channel) {
    return;
  }

  const int64_t now_ms = c_.time_source->NowUtcMs();
  bool retry = false;
  channel->Mutate([&](ChannelState& s) {
    if (s.is_recording) {
      CloseSessionTimers(s, now_ms);
      s.status = ChannelStatus::kRecordingEnded;
    }
    s.stopping_in_progress = false;
    retry = s.config.monitor_enabled && !s.manually_stopped;
  });

  LogInfo("Prober", "RECORDING_FINISHED")
      .Field("id", channel_id)
      .Field("session", session_token)
      .Field("retry", retry ? 1 : 0);

  if (c_.request_save) c_.request_save();
  Publish(channel);

  if (retry) {
    RetrySink sink;
    {
      std::lock_guard<std::mutex> lock(retry_mutex_);
      sink = retry_sink_;
    }
    if (sink) sink(channel);
  }
}

std::chrono::milliseconds Prober::NextJitter() {
  std::lock_guard<std::mutex> lock(rng_mutex_);
  std::uniform_int_distribution<int32_t> dist(config_.probe_jitter_min_ms,
                                              config_.probe_jitter_max_ms);
  return std::chrono::milliseconds(dist(rng_));
}

bool Prober::PushEnabledFor(const ChannelState& state) const {
  return config_.message_push_enabled && state.config.enabled_message_push;
}

void Prober::SendDesktopNotification(const std::string& title, const std::string& message) {
  if (!config_.desktop_notify) return;
  try {
    c_.notifier->Notify(title, message);
  } catch (const std::exception& e) {
    LogWarn("Prober", "NOTIFY_FAILED").Field("error", e.what());
  }
}

void Prober::SendPush(const std::string& title, const std::string& body) {
  try {
    c_.notifier->PushMessage(title, body);
  } catch (const std::exception& e) {
    LogWarn("Prober", "PUSH_FAILED").Field("error", e.what());
  }
}

void Prober::Publish(const ChannelPtr& channel) {
  c_.events->PublishUpdate(channel->Snapshot());
}

}  // namespace livewatch::runtime
