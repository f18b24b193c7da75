// Repository: LiveWatch
// Component: Structured Logger
// Purpose: Level-filtered, component-tagged log lines shared by every thread.
// Copyright (c) 2026 LiveWatch

#ifndef LIVEWATCH_UTIL_LOGGER_HPP_
#define LIVEWATCH_UTIL_LOGGER_HPP_

#include <functional>
#include <sstream>
#include <string>

namespace livewatch::util {

enum class LogLevel {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
};

const char* LogLevelToString(LogLevel level);

// Accepts debug, info, warn or error in any case.
// Throws std::invalid_argument otherwise.
LogLevel ParseLogLevel(const std::string& text);

// Every emitted line reads
//
//   <LEVEL> [<component>] <EVENT> key=value ...
//
// Debug and Info go to stdout, Warn and Error to stderr. A line is written
// and flushed under one mutex so lines from concurrent threads never
// interleave. The threshold starts from LIVEWATCH_LOG_LEVEL (default info).
class Logger {
 public:
  struct Record {
    LogLevel level;
    std::string component;
    std::string message;
  };
  using Sink = std::function<void(const Record&)>;

  static void Write(LogLevel level, const std::string& component, const std::string& message);

  static void SetThreshold(LogLevel level);
  static LogLevel Threshold();
  static bool Enabled(LogLevel level);

  // Receives every emitted record in addition to the stream; nullptr
  // clears. Called under the logger mutex, so it must not log.
  static void SetSink(Sink sink);

  static std::string Format(const Record& record);
};

// One log statement. Fields are collected while the statement runs and the
// line is written when the temporary is destroyed:
//
//   LogInfo("MonitorEngine", "CHANNEL_ADDED").Field("id", id).Field("url", url);
//
// Below the threshold nothing is formatted.
class LogEvent {
 public:
  LogEvent(LogLevel level, const char* component, const char* event);
  ~LogEvent();

  LogEvent(const LogEvent&) = delete;
  LogEvent& operator=(const LogEvent&) = delete;

  template <typename T>
  LogEvent& Field(const char* key, const T& value) {
    if (enabled_) body_ << ' ' << key << '=' << value;
    return *this;
  }

  // Already formatted "key=value ..." text.
  LogEvent& Append(const std::string& pairs) {
    if (enabled_ && !pairs.empty()) body_ << ' ' << pairs;
    return *this;
  }

 private:
  const LogLevel level_;
  const char* const component_;
  const bool enabled_;
  std::ostringstream body_;
};

inline LogEvent LogDebug(const char* component, const char* event) {
  return LogEvent(LogLevel::kDebug, component, event);
}
inline LogEvent LogInfo(const char* component, const char* event) {
  return LogEvent(LogLevel::kInfo, component, event);
}
inline LogEvent LogWarn(const char* component, const char* event) {
  return LogEvent(LogLevel::kWarn, component, event);
}
inline LogEvent LogError(const char* component, const char* event) {
  return LogEvent(LogLevel::kError, component, event);
}

}  // namespace livewatch::util

#endif  // LIVEWATCH_UTIL_LOGGER_HPP_
