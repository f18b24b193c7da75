// Repository: LiveWatch
// Component: Monitor Configuration
// Copyright (c) 2026 LiveWatch

#include "livewatch/config/MonitorConfig.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace livewatch::config {

namespace {

std::string Trim(const std::string& s) {
  const auto first = s.find_first_not_of(" \t\r");
  if (first == std::string::npos) return "";
  const auto last = s.find_last_not_of(" \t\r");
  return s.substr(first, last - first + 1);
}

[[noreturn]] void BadValue(const std::string& key, const std::string& value,
                           const char* expected) {
  throw std::invalid_argument("setting '" + key + "' expects " + expected +
                              ", got '" + value + "'");
}

int32_t ToInt(const std::string& key, const std::string& value) {
  try {
    size_t consumed = 0;
    const int v = std::stoi(value, &consumed);
    if (consumed == value.size()) return static_cast<int32_t>(v);
  } catch (const std::exception&) {
  }
  BadValue(key, value, "an integer");
}

double ToDouble(const std::string& key, const std::string& value) {
  try {
    size_t consumed = 0;
    const double v = std::stod(value, &consumed);
    if (consumed == value.size()) return v;
  } catch (const std::exception&) {
  }
  BadValue(key, value, "a number");
}

bool ToBool(const std::string& key, const std::string& value) {
  if (value == "true" || value == "1" || value == "yes" || value == "on") return true;
  if (value == "false" || value == "0" || value == "no" || value == "off") return false;
  BadValue(key, value, "a boolean");
}

}  // namespace

void MonitorConfig::ApplyLine(const std::string& raw) {
  const std::string line = Trim(raw);
  if (line.empty() || line[0] == '#') return;

  const auto eq = line.find('=');
  if (eq == std::string::npos) {
    throw std::invalid_argument("expected key=value, got '" + line + "'");
  }
  const std::string key = Trim(line.substr(0, eq));
  const std::string value = Trim(line.substr(eq + 1));

  if (key == "loop_time_seconds") loop_time_seconds = ToInt(key, value);
  else if (key == "heartbeat_seconds") heartbeat_seconds = ToInt(key, value);
  else if (key == "check_on_startup") check_on_startup = ToBool(key, value);
  else if (key == "platform_max_concurrent_requests") platform_max_concurrent_requests = ToInt(key, value);
  else if (key == "ema_alpha_active") ema_alpha_active = ToDouble(key, value);
  else if (key == "ema_alpha_offline") ema_alpha_offline = ToDouble(key, value);
  else if (key == "notify_loop_time_seconds") notify_loop_time_seconds = ToInt(key, value);
  else if (key == "recording_space_threshold_gb") recording_space_threshold_gb = ToDouble(key, value);
  else if (key == "recording_dir") recording_dir = value;
  else if (key == "probe_jitter_min_ms") probe_jitter_min_ms = ToInt(key, value);
  else if (key == "probe_jitter_max_ms") probe_jitter_max_ms = ToInt(key, value);
  else if (key == "retry_attempts") retry_attempts = ToInt(key, value);
  else if (key == "retry_delay_seconds") retry_delay_seconds = ToInt(key, value);
  else if (key == "persist_debounce_ms") persist_debounce_ms = ToInt(key, value);
  else if (key == "store_path") store_path = value;
  else if (key == "desktop_notify") desktop_notify = ToBool(key, value);
  else if (key == "message_push_enabled") message_push_enabled = ToBool(key, value);
  else if (key == "push_on_stream_end") push_on_stream_end = ToBool(key, value);
  else if (key == "custom_notification_title") custom_notification_title = value;
  else if (key == "custom_stream_start_content") custom_stream_start_content = value;
  else if (key == "custom_stream_end_content") custom_stream_end_content = value;
  else if (key == "default_streamer_name") default_streamer_name = value;
  else if (key == "fast_workers") fast_workers = ToInt(key, value);
  else if (key == "medium_workers") medium_workers = ToInt(key, value);
  else if (key == "slow_workers") slow_workers = ToInt(key, value);
  else if (key == "listen_address") listen_address = value;
  else if (key == "resolver_address") resolver_address = value;
  else if (key == "recorder_address") recorder_address = value;
  else throw std::invalid_argument("unknown setting '" + key + "'");
}

void MonitorConfig::LoadFile(const std::string& path) {
  std::ifstream in(path);
  if (!in.is_open()) {
    throw std::runtime_error("cannot open settings file: " + path);
  }
  std::string line;
  int line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    try {
      ApplyLine(line);
    } catch (const std::invalid_argument& e) {
      std::ostringstream oss;
      oss << path << ":" << line_no << ": " << e.what();
      throw std::invalid_argument(oss.str());
    }
  }
}

void MonitorConfig::Validate() const {
  auto require = [](bool ok, const char* what) {
    if (!ok) throw std::invalid_argument(std::string("invalid configuration: ") + what);
  };
  require(loop_time_seconds > 0, "loop_time_seconds must be positive");
  require(heartbeat_seconds > 0, "heartbeat_seconds must be positive");
  require(notify_loop_time_seconds > 0, "notify_loop_time_seconds must be positive");
  require(platform_max_concurrent_requests > 0,
          "platform_max_concurrent_requests must be positive");
  require(ema_alpha_active > 0.0 && ema_alpha_active <= 1.0,
          "ema_alpha_active must be in (0, 1]");
  require(ema_alpha_offline > 0.0 && ema_alpha_offline <= 1.0,
          "ema_alpha_offline must be in (0, 1]");
  require(recording_space_threshold_gb >= 0.0,
          "recording_space_threshold_gb must not be negative");
  require(probe_jitter_min_ms >= 0, "probe_jitter_min_ms must not be negative");
  require(probe_jitter_min_ms <= probe_jitter_max_ms,
          "probe_jitter_min_ms must not exceed probe_jitter_max_ms");
  require(retry_attempts > 0, "retry_attempts must be positive");
  require(retry_delay_seconds >= 0, "retry_delay_seconds must not be negative");
  require(persist_debounce_ms >= 0, "persist_debounce_ms must not be negative");
  require(fast_workers > 0 && medium_workers > 0 && slow_workers > 0,
          "every lane needs at least one worker");
  require(!store_path.empty(), "store_path must not be empty");
}

}  // namespace livewatch::config
