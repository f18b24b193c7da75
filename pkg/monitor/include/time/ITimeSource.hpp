#pragma once
#include <cstdint>

namespace livewatch {

// Wall-clock breakdown used by pattern learning. weekday: 0 = Sunday.
struct LocalTime {
  int weekday = 0;
  int hour = 0;
  int minute = 0;
  int second = 0;

  int SecondOfDay() const { return hour * 3600 + minute * 60 + second; }
};

class ITimeSource {
public:
  virtual ~ITimeSource() = default;
  virtual int64_t NowUtcMs() const = 0;
  // Breakdown of utc_ms in the zone the learned schedule is expressed in.
  virtual LocalTime LocalTimeAt(int64_t utc_ms) const = 0;

  LocalTime LocalNow() const { return LocalTimeAt(NowUtcMs()); }
};

}  // namespace livewatch
