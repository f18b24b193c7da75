// Repository: LiveWatch
// Component: Scheduled Recording Windows
// Copyright (c) 2026 LiveWatch

#include "livewatch/runtime/ScheduleWindow.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <optional>

#include "livewatch/util/Logger.hpp"

namespace livewatch::runtime {

using livewatch::util::LogWarn;

namespace {

constexpr int kSecondsPerDay = 24 * 60 * 60;

std::vector<std::string> SplitComma(const std::string& s) {
  std::vector<std::string> out;
  std::string item;
  std::istringstream in(s);
  while (std::getline(in, item, ',')) {
    const auto first = item.find_first_not_of(" \t");
    const auto last = item.find_last_not_of(" \t");
    out.push_back(first == std::string::npos ? "" : item.substr(first, last - first + 1));
  }
  return out;
}

std::optional<int> ParseClock(const std::string& text) {
  int h = 0, m = 0, s = 0;
  char tail = 0;
  const int n = std::sscanf(text.c_str(), "%d:%d:%d%c", &h, &m, &s, &tail);
  if (n == 2 || n == 3) {
    if (n == 2) s = 0;
    if (h < 0 || h > 23 || m < 0 || m > 59 || s < 0 || s > 59) return std::nullopt;
    return h * 3600 + m * 60 + s;
  }
  return std::nullopt;
}

std::optional<double> ParseHours(const std::string& text) {
  if (text.empty()) return ScheduleWindow::kDefaultDurationHours;
  try {
    size_t consumed = 0;
    const double hours = std::stod(text, &consumed);
    if (consumed != text.size() || !std::isfinite(hours) || hours <= 0.0) return std::nullopt;
    return hours;
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

}  // namespace

bool ScheduleWindow::Contains(int second_of_day) const {
  if (duration_seconds >= kSecondsPerDay) return true;
  const int end = start_second + duration_seconds;
  if (end <= kSecondsPerDay) {
    return second_of_day >= start_second && second_of_day < end;
  }
  return second_of_day >= start_second || second_of_day < end - kSecondsPerDay;
}

std::string ScheduleWindow::ToString() const {
  const int end = (start_second + duration_seconds) % kSecondsPerDay;
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%02d:%02d:%02d~%02d:%02d:%02d",
                start_second / 3600, (start_second / 60) % 60, start_second % 60,
                end / 3600, (end / 60) % 60, end % 60);
  return buf;
}

std::vector<ScheduleWindow> ParseScheduleWindows(const std::string& start_times,
                                                 const std::string& duration_hours) {
  std::vector<ScheduleWindow> windows;
  if (start_times.empty()) return windows;

  const auto starts = SplitComma(start_times);
  const auto hours = SplitComma(duration_hours);
  for (size_t i = 0; i < starts.size(); ++i) {
    if (starts[i].empty()) continue;
    const auto start = ParseClock(starts[i]);
    const auto span = ParseHours(i < hours.size() ? hours[i] : "");
    if (!start || !span) {
      LogWarn("ScheduleWindow", "SKIP_ENTRY").Field("start", "'" + starts[i] + "'");
      continue;
    }
    ScheduleWindow w;
    w.start_second = *start;
    // Anything from a full day up matches every time of day.
    w.duration_seconds = static_cast<int>(std::min(*span, 24.0) * 3600.0);
    windows.push_back(w);
  }
  return windows;
}

bool InAnyWindow(const std::vector<ScheduleWindow>& windows, const LocalTime& now) {
  const int t = now.SecondOfDay();
  for (const auto& w : windows) {
    if (w.Contains(t)) return true;
  }
  return false;
}

}  // namespace livewatch::runtime
