// Repository: LiveWatch
// Component: Channel data model
// Purpose: Value types describing one monitored channel, plus the
//          enumerated patch type used for configuration edits.
// Copyright (c) 2026 LiveWatch

#ifndef LIVEWATCH_MODEL_CHANNEL_TYPES_HPP_
#define LIVEWATCH_MODEL_CHANNEL_TYPES_HPP_

#include <cstdint>
#include <map>
#include <optional>
#include <string>

#include "livewatch/model/LearnedStats.hpp"

namespace livewatch::model {

enum class ChannelStatus {
  kIdle = 0,
  kChecking,
  kMonitoring,
  kStoppedMonitoring,
  kNotInScheduledWindow,
  kCheckError,
  kNoDiskSpace,
  kPreparingRecording,
  kRecording,
  kLiveBroadcasting,
  kNotRecording,
  kRecordingEnded,
};

const char* ChannelStatusToString(ChannelStatus status);

// Externally supplied settings. The scheduler reads these; only the
// control surface (through ChannelPatch) changes them.
struct ChannelConfig {
  std::string streamer_name;
  std::string record_format = "ts";
  std::string quality = "OD";
  bool monitor_enabled = true;
  bool scheduled_recording = false;
  std::string scheduled_start_time;  // "HH:MM[:SS]" list, comma separated
  std::string monitor_hours;         // hours per start time, comma separated
  bool segment_record = false;
  int32_t segment_time_seconds = 1800;
  std::string recording_dir;
  bool enabled_message_push = false;
  bool only_notify_no_record = false;
  bool flv_use_direct_download = false;
};

struct ChannelState {
  // Identity
  std::string id;
  std::string url;
  std::string platform;
  std::string platform_key;

  ChannelConfig config;

  // Runtime flags (never persisted)
  bool is_live = false;
  bool is_recording = false;
  bool is_checking = false;
  bool manually_stopped = false;
  bool force_stop = false;
  bool stopping_in_progress = false;
  bool notified_live_start = false;
  bool notified_live_end = false;
  ChannelStatus status = ChannelStatus::kIdle;
  std::string live_title;

  // Timers
  std::optional<int64_t> detection_time_ms;
  std::optional<int64_t> start_time_ms;
  int64_t cumulative_duration_ms = 0;
  int64_t last_duration_ms = 0;

  LearnedStats stats;
  std::string added_at;
  std::string last_active_at;

  int32_t loop_interval_seconds = 300;
};

// Recorded time shown for a channel: running session included while
// recording, otherwise the last finished total.
int64_t RecordedDurationMs(const ChannelState& state, int64_t now_ms);

// "H:MM:SS".
std::string FormatDuration(int64_t duration_ms);

// Explicit configuration diff. Every patchable field is enumerated here;
// FromFields() rejects any key that is not.
struct ChannelPatch {
  std::optional<std::string> url;
  std::optional<std::string> streamer_name;
  std::optional<std::string> record_format;
  std::optional<std::string> quality;
  std::optional<bool> monitor_enabled;
  std::optional<bool> scheduled_recording;
  std::optional<std::string> scheduled_start_time;
  std::optional<std::string> monitor_hours;
  std::optional<bool> segment_record;
  std::optional<int32_t> segment_time_seconds;
  std::optional<std::string> recording_dir;
  std::optional<bool> enabled_message_push;
  std::optional<bool> only_notify_no_record;
  std::optional<bool> flv_use_direct_download;

  // Throws std::invalid_argument on an unknown key or unparsable value.
  static ChannelPatch FromFields(const std::map<std::string, std::string>& fields);

  bool Empty() const;

  // Applies the patch. A URL change drops the cached platform identity.
  void ApplyTo(ChannelState& state) const;
};

}  // namespace livewatch::model

#endif  // LIVEWATCH_MODEL_CHANNEL_TYPES_HPP_
