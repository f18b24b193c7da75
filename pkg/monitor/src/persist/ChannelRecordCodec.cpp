// Repository: LiveWatch
// Component: Channel record codec
// Copyright (c) 2026 LiveWatch

#include "persist/ChannelRecordCodec.hpp"

namespace livewatch::persist {

namespace proto = livewatch::v1;

proto::ChannelConfig ToProtoConfig(const model::ChannelConfig& c) {
  proto::ChannelConfig p;
  p.set_streamer_name(c.streamer_name);
  p.set_record_format(c.record_format);
  p.set_quality(c.quality);
  p.set_monitor_enabled(c.monitor_enabled);
  p.set_scheduled_recording(c.scheduled_recording);
  p.set_scheduled_start_time(c.scheduled_start_time);
  p.set_monitor_hours(c.monitor_hours);
  p.set_segment_record(c.segment_record);
  p.set_segment_time_seconds(c.segment_time_seconds);
  p.set_recording_dir(c.recording_dir);
  p.set_enabled_message_push(c.enabled_message_push);
  p.set_only_notify_no_record(c.only_notify_no_record);
  p.set_flv_use_direct_download(c.flv_use_direct_download);
  return p;
}

model::ChannelConfig FromProtoConfig(const proto::ChannelConfig& p) {
  model::ChannelConfig c;
  c.streamer_name = p.streamer_name();
  if (!p.record_format().empty()) c.record_format = p.record_format();
  if (!p.quality().empty()) c.quality = p.quality();
  c.monitor_enabled = p.monitor_enabled();
  c.scheduled_recording = p.scheduled_recording();
  c.scheduled_start_time = p.scheduled_start_time();
  c.monitor_hours = p.monitor_hours();
  c.segment_record = p.segment_record();
  if (p.segment_time_seconds() > 0) c.segment_time_seconds = p.segment_time_seconds();
  c.recording_dir = p.recording_dir();
  c.enabled_message_push = p.enabled_message_push();
  c.only_notify_no_record = p.only_notify_no_record();
  c.flv_use_direct_download = p.flv_use_direct_download();
  return c;
}

proto::ChannelRecord ToRecord(const model::ChannelState& s) {
  proto::ChannelRecord r;
  r.set_id(s.id);
  r.set_url(s.url);
  r.set_platform(s.platform);
  r.set_platform_key(s.platform_key);
  *r.mutable_config() = ToProtoConfig(s.config);

  auto* stats = r.mutable_stats();
  stats->set_priority_score(s.stats.priority_score);
  for (const auto& [weekday, hours] : s.stats.historical_intervals) {
    auto& list = (*stats->mutable_historical_intervals())[weekday];
    for (int hour : hours) list.add_hours(hour);
  }
  stats->set_has_last_seen_live(s.stats.last_seen_live_ms.has_value());
  stats->set_last_seen_live_ms(s.stats.last_seen_live_ms.value_or(0));
  stats->set_consistency_score(s.stats.consistency_score);
  stats->set_live_check_count(s.stats.live_check_count);
  stats->set_live_found_count(s.stats.live_found_count);

  r.set_added_at(s.added_at);
  r.set_last_active_at(s.last_active_at);
  r.set_last_duration_ms(s.last_duration_ms);
  return r;
}

model::ChannelState FromRecord(const proto::ChannelRecord& r) {
  model::ChannelState s;
  s.id = r.id();
  s.url = r.url();
  s.platform = r.platform();
  s.platform_key = r.platform_key();
  s.config = FromProtoConfig(r.config());

  const auto& stats = r.stats();
  s.stats.priority_score = stats.priority_score();
  for (const auto& [weekday, list] : stats.historical_intervals()) {
    if (weekday < 0 || weekday > 6) continue;
    auto& hours = s.stats.historical_intervals[weekday];
    for (int hour : list.hours()) {
      if (hour < 0 || hour > 23) continue;
      if (hours.size() == model::LearnedStats::kMaxHoursPerDay) hours.erase(hours.begin());
      hours.push_back(hour);
    }
    if (hours.empty()) s.stats.historical_intervals.erase(weekday);
  }
  if (stats.has_last_seen_live()) s.stats.last_seen_live_ms = stats.last_seen_live_ms();
  s.stats.consistency_score = stats.consistency_score();
  s.stats.live_check_count = stats.live_check_count();
  s.stats.live_found_count = stats.live_found_count();

  s.added_at = r.added_at();
  s.last_active_at = r.last_active_at();
  s.last_duration_ms = r.last_duration_ms();
  return s;
}

}  // namespace livewatch::persist
