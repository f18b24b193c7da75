// Repository: LiveWatch
// Component: Structured Logger
// Copyright (c) 2026 LiveWatch

#include "livewatch/util/Logger.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <stdexcept>

namespace livewatch::util {

namespace {

LogLevel InitialThreshold() {
  const char* env = std::getenv("LIVEWATCH_LOG_LEVEL");
  if (env == nullptr || *env == '\0') return LogLevel::kInfo;
  try {
    return ParseLogLevel(env);
  } catch (const std::invalid_argument&) {
    std::cerr << "WARN [Logger] BAD_LOG_LEVEL value=" << env << " using=info\n";
    return LogLevel::kInfo;
  }
}

std::atomic<int>& ThresholdSlot() {
  static std::atomic<int> slot{static_cast<int>(InitialThreshold())};
  return slot;
}

std::mutex& WriteMutex() {
  static std::mutex mutex;
  return mutex;
}

Logger::Sink& SinkSlot() {
  static Logger::Sink sink;
  return sink;
}

}  // namespace

const char* LogLevelToString(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug: return "DEBUG";
    case LogLevel::kInfo:  return "INFO";
    case LogLevel::kWarn:  return "WARN";
    case LogLevel::kError: return "ERROR";
  }
  return "INFO";
}

LogLevel ParseLogLevel(const std::string& text) {
  std::string lower(text);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (lower == "debug") return LogLevel::kDebug;
  if (lower == "info") return LogLevel::kInfo;
  if (lower == "warn" || lower == "warning") return LogLevel::kWarn;
  if (lower == "error") return LogLevel::kError;
  throw std::invalid_argument("unknown log level: " + text);
}

void Logger::SetThreshold(LogLevel level) {
  ThresholdSlot().store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel Logger::Threshold() {
  return static_cast<LogLevel>(ThresholdSlot().load(std::memory_order_relaxed));
}

bool Logger::Enabled(LogLevel level) {
  return static_cast<int>(level) >= ThresholdSlot().load(std::memory_order_relaxed);
}

void Logger::SetSink(Sink sink) {
  std::lock_guard<std::mutex> lock(WriteMutex());
  SinkSlot() = std::move(sink);
}

std::string Logger::Format(const Record& record) {
  std::string line = LogLevelToString(record.level);
  line += " [";
  line += record.component;
  line += "] ";
  line += record.message;
  return line;
}

void Logger::Write(LogLevel level, const std::string& component, const std::string& message) {
  if (!Enabled(level)) return;
  const Record record{level, component, message};
  const std::string line = Format(record);

  std::lock_guard<std::mutex> lock(WriteMutex());
  if (SinkSlot()) SinkSlot()(record);
  std::ostream& out = level >= LogLevel::kWarn ? std::cerr : std::cout;
  out << line << '\n';
  out.flush();
}

LogEvent::LogEvent(LogLevel level, const char* component, const char* event)
    : level_(level), component_(component), enabled_(Logger::Enabled(level)) {
  if (enabled_) body_ << event;
}

LogEvent::~LogEvent() {
  if (enabled_) Logger::Write(level_, component_, body_.str());
}

}  // namespace livewatch::util
