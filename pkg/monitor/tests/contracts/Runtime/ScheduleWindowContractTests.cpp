// Repository: LiveWatch
// Component: Scheduled Recording Window Contract Tests
// Copyright (c) 2026 LiveWatch

#include <gtest/gtest.h>

#include "livewatch/runtime/ScheduleWindow.hpp"

using namespace livewatch;
using namespace livewatch::runtime;

namespace {

LocalTime Clock(int hour, int minute, int second = 0) {
  LocalTime t;
  t.hour = hour;
  t.minute = minute;
  t.second = second;
  return t;
}

}  // namespace

TEST(ScheduleWindowContract, ParsesStartAndDuration) {
  const auto windows = ParseScheduleWindows("20:00", "2");
  ASSERT_EQ(windows.size(), 1u);
  EXPECT_EQ(windows[0].start_second, 20 * 3600);
  EXPECT_EQ(windows[0].duration_seconds, 2 * 3600);
  EXPECT_EQ(windows[0].ToString(), "20:00:00~22:00:00");
}

TEST(ScheduleWindowContract, MissingDurationDefaultsToFiveHours) {
  const auto windows = ParseScheduleWindows("08:30:15, 18:00", "1.5");
  ASSERT_EQ(windows.size(), 2u);
  EXPECT_EQ(windows[0].duration_seconds, 5400);
  EXPECT_EQ(windows[1].duration_seconds, 5 * 3600);
}

TEST(ScheduleWindowContract, MalformedEntriesAreSkipped) {
  const auto windows = ParseScheduleWindows("25:00,abc,10:00,11:00", "1,1,x,1");
  ASSERT_EQ(windows.size(), 1u);
  EXPECT_EQ(windows[0].start_second, 11 * 3600);
}

TEST(ScheduleWindowContract, WindowIsHalfOpen) {
  const auto windows = ParseScheduleWindows("20:00", "2");
  EXPECT_FALSE(InAnyWindow(windows, Clock(19, 59, 59)));
  EXPECT_TRUE(InAnyWindow(windows, Clock(20, 0)));
  EXPECT_TRUE(InAnyWindow(windows, Clock(21, 59, 59)));
  EXPECT_FALSE(InAnyWindow(windows, Clock(22, 0)));
}

TEST(ScheduleWindowContract, WindowWrapsPastMidnight) {
  const auto windows = ParseScheduleWindows("22:00", "4");
  EXPECT_TRUE(InAnyWindow(windows, Clock(23, 30)));
  EXPECT_TRUE(InAnyWindow(windows, Clock(1, 59)));
  EXPECT_FALSE(InAnyWindow(windows, Clock(2, 0)));
  EXPECT_FALSE(InAnyWindow(windows, Clock(12, 0)));
  EXPECT_EQ(windows[0].ToString(), "22:00:00~02:00:00");
}

TEST(ScheduleWindowContract, FullDaySpanAlwaysMatches) {
  const auto windows = ParseScheduleWindows("06:00", "24");
  EXPECT_TRUE(InAnyWindow(windows, Clock(5, 59)));
}

TEST(ScheduleWindowContract, HugeSpanIsClampedToOneDay) {
  const auto windows = ParseScheduleWindows("06:00,07:00", "1e9,inf");
  ASSERT_EQ(windows.size(), 1u);
  EXPECT_EQ(windows[0].duration_seconds, 24 * 3600);
  EXPECT_TRUE(InAnyWindow(windows, Clock(3, 0)));
}

TEST(ScheduleWindowContract, NoWindowsNeverMatch) {
  EXPECT_TRUE(ParseScheduleWindows("", "3").empty());
  EXPECT_FALSE(InAnyWindow({}, Clock(12, 0)));
}
