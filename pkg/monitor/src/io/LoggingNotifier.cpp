// Repository: LiveWatch
// Component: Logging notifier
// Copyright (c) 2026 LiveWatch

#include "livewatch/io/LoggingNotifier.hpp"

#include "livewatch/util/Logger.hpp"

namespace livewatch::io {

using livewatch::util::LogInfo;

namespace {

std::string Quoted(const std::string& text) {
  return "\"" + text + "\"";
}

}  // namespace

void LoggingNotifier::Notify(const std::string& title, const std::string& message) {
  LogInfo("Notify", "DESKTOP").Field("title", Quoted(title)).Field("message", Quoted(message));
}

void LoggingNotifier::PushMessage(const std::string& title, const std::string& body) {
  LogInfo("Notify", "PUSH").Field("title", Quoted(title)).Field("body", Quoted(body));
}

}  // namespace livewatch::io
