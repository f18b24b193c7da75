// Repository: LiveWatch
// Component: Monitor Configuration
// Purpose: Tunables for the scheduler, prober, persistence and daemon,
//          loadable from a key=value settings file.
// Copyright (c) 2026 LiveWatch

#ifndef LIVEWATCH_CONFIG_MONITOR_CONFIG_HPP_
#define LIVEWATCH_CONFIG_MONITOR_CONFIG_HPP_

#include <cstdint>
#include <string>

namespace livewatch::config {

struct MonitorConfig {
  // Scheduling
  int32_t loop_time_seconds = 300;  // Base polling interval.
  int32_t heartbeat_seconds = 30;   // Dispatcher cycle period.
  bool check_on_startup = true;
  int32_t platform_max_concurrent_requests = 3;
  double ema_alpha_active = 0.1;
  double ema_alpha_offline = 0.01;
  int32_t notify_loop_time_seconds = 600;

  // Recording
  double recording_space_threshold_gb = 0.0;
  std::string recording_dir = ".";

  // Prober
  int32_t probe_jitter_min_ms = 2000;
  int32_t probe_jitter_max_ms = 5000;
  int32_t retry_attempts = 2;
  int32_t retry_delay_seconds = 20;

  // Persistence
  int32_t persist_debounce_ms = 2000;
  std::string store_path = "channels.pb";

  // Notifications
  bool desktop_notify = true;
  bool message_push_enabled = true;
  bool push_on_stream_end = true;
  std::string custom_notification_title;
  std::string custom_stream_start_content;
  std::string custom_stream_end_content;
  std::string default_streamer_name = "Live Room";

  // Lane workers
  int32_t fast_workers = 1;
  int32_t medium_workers = 2;
  int32_t slow_workers = 1;

  // Daemon endpoints
  std::string listen_address = "127.0.0.1:50071";
  std::string resolver_address;
  std::string recorder_address;

  // Applies one "key=value" line. Blank lines and '#' comments are ignored.
  // Throws std::invalid_argument on an unknown key or unparsable value.
  void ApplyLine(const std::string& line);

  // Reads a settings file line by line through ApplyLine(). Errors name the
  // file and line number. Throws std::runtime_error when the file cannot be
  // opened.
  void LoadFile(const std::string& path);

  // Throws std::invalid_argument describing the first invalid value.
  void Validate() const;
};

}  // namespace livewatch::config

#endif  // LIVEWATCH_CONFIG_MONITOR_CONFIG_HPP_
