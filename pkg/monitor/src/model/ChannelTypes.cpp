// Repository: LiveWatch
// Component: Channel data model
// Copyright (c) 2026 LiveWatch

#include "livewatch/model/ChannelTypes.hpp"

#include <cstdio>
#include <stdexcept>

namespace livewatch::model {

namespace {

bool ParseBool(const std::string& key, const std::string& value) {
  if (value == "true" || value == "1" || value == "yes") return true;
  if (value == "false" || value == "0" || value == "no") return false;
  throw std::invalid_argument("ChannelPatch: field '" + key +
                              "' expects a boolean, got '" + value + "'");
}

int32_t ParseInt(const std::string& key, const std::string& value) {
  size_t consumed = 0;
  int32_t out = 0;
  try {
    out = static_cast<int32_t>(std::stoi(value, &consumed));
  } catch (const std::exception&) {
    consumed = 0;
  }
  if (consumed == 0 || consumed != value.size()) {
    throw std::invalid_argument("ChannelPatch: field '" + key +
                                "' expects an integer, got '" + value + "'");
  }
  return out;
}

}  // namespace

const char* ChannelStatusToString(ChannelStatus status) {
  switch (status) {
    case ChannelStatus::kIdle: return "idle";
    case ChannelStatus::kChecking: return "checking";
    case ChannelStatus::kMonitoring: return "monitoring";
    case ChannelStatus::kStoppedMonitoring: return "stopped_monitoring";
    case ChannelStatus::kNotInScheduledWindow: return "not_in_scheduled_window";
    case ChannelStatus::kCheckError: return "check_error";
    case ChannelStatus::kNoDiskSpace: return "no_disk_space";
    case ChannelStatus::kPreparingRecording: return "preparing_recording";
    case ChannelStatus::kRecording: return "recording";
    case ChannelStatus::kLiveBroadcasting: return "live_broadcasting";
    case ChannelStatus::kNotRecording: return "not_recording";
    case ChannelStatus::kRecordingEnded: return "recording_ended";
  }
  return "unknown";
}

int64_t RecordedDurationMs(const ChannelState& state, int64_t now_ms) {
  if (state.is_recording && state.start_time_ms.has_value()) {
    int64_t running = now_ms - *state.start_time_ms;
    if (running < 0) running = 0;
    return state.cumulative_duration_ms + running;
  }
  return state.last_duration_ms;
}

std::string FormatDuration(int64_t duration_ms) {
  if (duration_ms < 0) duration_ms = 0;
  const int64_t total_s = duration_ms / 1000;
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%lld:%02d:%02d",
                static_cast<long long>(total_s / 3600),
                static_cast<int>((total_s / 60) % 60),
                static_cast<int>(total_s % 60));
  return buf;
}

ChannelPatch ChannelPatch::FromFields(const std::map<std::string, std::string>& fields) {
  ChannelPatch patch;
  for (const auto& [key, value] : fields) {
    if (key == "url") patch.url = value;
    else if (key == "streamer_name") patch.streamer_name = value;
    else if (key == "record_format") patch.record_format = value;
    else if (key == "quality") patch.quality = value;
    else if (key == "monitor_enabled") patch.monitor_enabled = ParseBool(key, value);
    else if (key == "scheduled_recording") patch.scheduled_recording = ParseBool(key, value);
    else if (key == "scheduled_start_time") patch.scheduled_start_time = value;
    else if (key == "monitor_hours") patch.monitor_hours = value;
    else if (key == "segment_record") patch.segment_record = ParseBool(key, value);
    else if (key == "segment_time_seconds") patch.segment_time_seconds = ParseInt(key, value);
    else if (key == "recording_dir") patch.recording_dir = value;
    else if (key == "enabled_message_push") patch.enabled_message_push = ParseBool(key, value);
    else if (key == "only_notify_no_record") patch.only_notify_no_record = ParseBool(key, value);
    else if (key == "flv_use_direct_download") patch.flv_use_direct_download = ParseBool(key, value);
    else throw std::invalid_argument("ChannelPatch: unknown field '" + key + "'");
  }
  if (patch.url.has_value() && patch.url->empty()) {
    throw std::invalid_argument("ChannelPatch: url must not be empty");
  }
  if (patch.segment_time_seconds.has_value() && *patch.segment_time_seconds <= 0) {
    throw std::invalid_argument("ChannelPatch: segment_time_seconds must be positive");
  }
  return patch;
}

bool ChannelPatch::Empty() const {
  return !url && !streamer_name && !record_format && !quality && !monitor_enabled &&
         !scheduled_recording && !scheduled_start_time && !monitor_hours &&
         !segment_record && !segment_time_seconds && !recording_dir &&
         !enabled_message_push && !only_notify_no_record && !flv_use_direct_download;
}

void ChannelPatch::ApplyTo(ChannelState& state) const {
  if (url && *url != state.url) {
    state.url = *url;
    state.platform.clear();
    state.platform_key.clear();
  }
  ChannelConfig& c = state.config;
  if (streamer_name) c.streamer_name = *streamer_name;
  if (record_format) c.record_format = *record_format;
  if (quality) c.quality = *quality;
  if (monitor_enabled) c.monitor_enabled = *monitor_enabled;
  if (scheduled_recording) c.scheduled_recording = *scheduled_recording;
  if (scheduled_start_time) c.scheduled_start_time = *scheduled_start_time;
  if (monitor_hours) c.monitor_hours = *monitor_hours;
  if (segment_record) c.segment_record = *segment_record;
  if (segment_time_seconds) c.segment_time_seconds = *segment_time_seconds;
  if (recording_dir) c.recording_dir = *recording_dir;
  if (enabled_message_push) c.enabled_message_push = *enabled_message_push;
  if (only_notify_no_record) c.only_notify_no_record = *only_notify_no_record;
  if (flv_use_direct_download) c.flv_use_direct_download = *flv_use_direct_download;
}

}  // namespace livewatch::model
