// Repository: LiveWatch
// Component: Learned Statistics Contract Tests
// Purpose: EMA update, weekday/hour history, recency decay and the bounded
//          legacy counters folded in by IncrementLiveCounts.
// Copyright (c) 2026 LiveWatch

#include <gtest/gtest.h>

#include <cmath>

#include "livewatch/model/LearnedStats.hpp"

using namespace livewatch;
using livewatch::model::EmaParams;
using livewatch::model::IncrementLiveCounts;
using livewatch::model::LearnedStats;

namespace {

constexpr int64_t kNowMs = 1704153600000LL;  // Tuesday 2024-01-02 00:00 UTC
constexpr int64_t kDayMs = 24LL * 60 * 60 * 1000;

LocalTime At(int weekday, int hour, int minute = 0) {
  LocalTime t;
  t.weekday = weekday;
  t.hour = hour;
  t.minute = minute;
  return t;
}

}  // namespace

// =============================================================================
// EMA
// =============================================================================

TEST(LearnedStatsContract, TenLiveObservationsFromZeroReachPointSixFive) {
  LearnedStats stats;
  EmaParams params;
  for (int i = 0; i < 10; ++i) {
    IncrementLiveCounts(stats, true, params, kNowMs, At(2, 20));
  }
  // 1 - 0.9^10
  EXPECT_NEAR(stats.priority_score, 0.651, 0.01);
}

TEST(LearnedStatsContract, OfflineObservationDecaysSlowly) {
  LearnedStats stats;
  stats.priority_score = 1.0;
  IncrementLiveCounts(stats, false, EmaParams{}, kNowMs, At(2, 3));
  EXPECT_DOUBLE_EQ(stats.priority_score, 0.99);
}

TEST(LearnedStatsContract, ScoreStaysWithinUnitInterval) {
  LearnedStats stats;
  EmaParams params{1.0, 1.0};
  IncrementLiveCounts(stats, true, params, kNowMs, At(2, 1));
  EXPECT_DOUBLE_EQ(stats.priority_score, 1.0);
  IncrementLiveCounts(stats, false, params, kNowMs, At(2, 1));
  EXPECT_DOUBLE_EQ(stats.priority_score, 0.0);
}

// =============================================================================
// Weekday/hour history
// =============================================================================

TEST(LearnedStatsContract, LiveObservationRecordsWeekdayHourOnce) {
  LearnedStats stats;
  IncrementLiveCounts(stats, true, EmaParams{}, kNowMs, At(2, 20));
  IncrementLiveCounts(stats, true, EmaParams{}, kNowMs, At(2, 20, 45));
  ASSERT_EQ(stats.historical_intervals.count(2), 1u);
  EXPECT_EQ(stats.historical_intervals[2], std::vector<int>({20}));
  ASSERT_TRUE(stats.last_seen_live_ms.has_value());
  EXPECT_EQ(*stats.last_seen_live_ms, kNowMs);
}

TEST(LearnedStatsContract, OfflineObservationLeavesHistoryUntouched) {
  LearnedStats stats;
  IncrementLiveCounts(stats, false, EmaParams{}, kNowMs, At(2, 20));
  EXPECT_FALSE(stats.HasHistory());
  EXPECT_FALSE(stats.last_seen_live_ms.has_value());
}

TEST(LearnedStatsContract, HistoryKeepsFiveMostRecentHoursPerDay) {
  LearnedStats stats;
  for (int hour = 10; hour < 16; ++hour) {
    IncrementLiveCounts(stats, true, EmaParams{}, kNowMs, At(5, hour));
  }
  EXPECT_EQ(stats.historical_intervals[5], std::vector<int>({11, 12, 13, 14, 15}));
}

TEST(LearnedStatsContract, ConsistencyIsFilledShareOfKnownDays) {
  LearnedStats stats;
  IncrementLiveCounts(stats, true, EmaParams{}, kNowMs, At(1, 8));
  IncrementLiveCounts(stats, true, EmaParams{}, kNowMs, At(1, 9));
  EXPECT_DOUBLE_EQ(stats.consistency_score, 2.0 / 5.0);
  IncrementLiveCounts(stats, true, EmaParams{}, kNowMs, At(3, 9));
  EXPECT_DOUBLE_EQ(stats.consistency_score, 3.0 / 10.0);
}

// =============================================================================
// Recency decay
// =============================================================================

TEST(LearnedStatsContract, NoDecayWithinThirtyDays) {
  LearnedStats stats;
  stats.priority_score = 0.5;
  stats.last_seen_live_ms = kNowMs - 30 * kDayMs;
  IncrementLiveCounts(stats, false, EmaParams{}, kNowMs, At(2, 0));
  EXPECT_DOUBLE_EQ(stats.priority_score, 0.5 * 0.99);
}

TEST(LearnedStatsContract, FortyDaysInactiveAppliesTenDaysOfDecay) {
  LearnedStats stats;
  stats.priority_score = 0.5;
  stats.last_seen_live_ms = kNowMs - 40 * kDayMs;
  IncrementLiveCounts(stats, false, EmaParams{}, kNowMs, At(2, 0));
  EXPECT_NEAR(stats.priority_score, 0.5 * 0.99 * std::pow(0.99, 10), 1e-12);
}

TEST(LearnedStatsContract, DecayIsCappedAtSixtyExtraDays) {
  LearnedStats stats;
  stats.priority_score = 0.5;
  stats.last_seen_live_ms = kNowMs - 400 * kDayMs;
  IncrementLiveCounts(stats, false, EmaParams{}, kNowMs, At(2, 0));
  EXPECT_NEAR(stats.priority_score, 0.5 * 0.99 * std::pow(0.99, 60), 1e-12);
}

TEST(LearnedStatsContract, DaysInactiveCountsWholeDays) {
  EXPECT_EQ(model::DaysInactive(kNowMs - 3 * kDayMs - 1, kNowMs), 3);
  EXPECT_EQ(model::DaysInactive(kNowMs + 5, kNowMs), 0);
}

// =============================================================================
// Legacy counters
// =============================================================================

TEST(LearnedStatsContract, CountersHalveWhenCheckCountExceedsCap) {
  LearnedStats stats;
  stats.live_check_count = 100;
  stats.live_found_count = 41;
  IncrementLiveCounts(stats, true, EmaParams{}, kNowMs, At(2, 0));
  EXPECT_EQ(stats.live_check_count, 50);
  EXPECT_EQ(stats.live_found_count, 21);
}

TEST(LearnedStatsContract, CountersNeverExceedCap) {
  LearnedStats stats;
  for (int i = 0; i < 1000; ++i) {
    IncrementLiveCounts(stats, (i % 3) == 0, EmaParams{}, kNowMs, At(2, i % 24));
    ASSERT_LE(stats.live_check_count, LearnedStats::kLegacyCounterCap);
    ASSERT_LE(stats.live_found_count, stats.live_check_count);
  }
}
