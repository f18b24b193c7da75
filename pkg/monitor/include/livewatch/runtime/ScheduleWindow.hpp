// Repository: LiveWatch
// Component: Scheduled Recording Windows
// Purpose: Daily monitoring windows built from (start time, duration) pairs.
// Copyright (c) 2026 LiveWatch

#ifndef LIVEWATCH_RUNTIME_SCHEDULE_WINDOW_HPP_
#define LIVEWATCH_RUNTIME_SCHEDULE_WINDOW_HPP_

#include <string>
#include <vector>

#include "time/ITimeSource.hpp"

namespace livewatch::runtime {

// [start, start + duration) in seconds of the day; may cross midnight.
struct ScheduleWindow {
  static constexpr double kDefaultDurationHours = 5.0;

  int start_second = 0;
  int duration_seconds = 0;

  bool Contains(int second_of_day) const;
  std::string ToString() const;  // "HH:MM:SS~HH:MM:SS"
};

// start_times: "HH:MM[:SS]" entries, comma separated.
// duration_hours: matching durations, comma separated; a missing or empty
// entry means kDefaultDurationHours. Malformed entries are skipped.
std::vector<ScheduleWindow> ParseScheduleWindows(const std::string& start_times,
                                                 const std::string& duration_hours);

// True when any window contains now. No windows → false.
bool InAnyWindow(const std::vector<ScheduleWindow>& windows, const LocalTime& now);

}  // namespace livewatch::runtime

#endif  // LIVEWATCH_RUNTIME_SCHEDULE_WINDOW_HPP_
