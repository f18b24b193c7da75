// Repository: LiveWatch
// Component: Timestamp formatting
// Copyright (c) 2026 LiveWatch

#ifndef LIVEWATCH_UTIL_TIMESTAMP_HPP_
#define LIVEWATCH_UTIL_TIMESTAMP_HPP_

#include <cstdint>
#include <string>

namespace livewatch::util {

// "YYYY-MM-DD HH:MM:SS" in the process time zone.
std::string FormatLocalTimestamp(int64_t utc_ms);

}  // namespace livewatch::util

#endif  // LIVEWATCH_UTIL_TIMESTAMP_HPP_
