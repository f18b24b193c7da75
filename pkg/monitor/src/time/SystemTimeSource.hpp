#pragma once
#include "time/ITimeSource.hpp"
#include <chrono>
#include <ctime>

namespace livewatch {

class SystemTimeSource : public ITimeSource {
public:
  int64_t NowUtcMs() const override {
    using namespace std::chrono;
    return duration_cast<milliseconds>(
        system_clock::now().time_since_epoch()).count();
  }

  LocalTime LocalTimeAt(int64_t utc_ms) const override {
    time_t s = static_cast<time_t>(utc_ms / 1000);
    struct tm tm {};
    LocalTime out;
    if (localtime_r(&s, &tm) == nullptr) return out;
    out.weekday = tm.tm_wday;
    out.hour = tm.tm_hour;
    out.minute = tm.tm_min;
    out.second = tm.tm_sec;
    return out;
  }
};

}  // namespace livewatch
