// Repository: LiveWatch
// Component: Timestamp formatting
// Copyright (c) 2026 LiveWatch

#include "livewatch/util/Timestamp.hpp"

#include <ctime>

namespace livewatch::util {

std::string FormatLocalTimestamp(int64_t utc_ms) {
  const time_t s = static_cast<time_t>(utc_ms / 1000);
  struct tm tm {};
  if (localtime_r(&s, &tm) == nullptr) return "";
  char buf[32];
  if (std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm) == 0) return "";
  return buf;
}

}  // namespace livewatch::util
