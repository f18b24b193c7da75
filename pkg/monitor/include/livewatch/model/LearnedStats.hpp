// Repository: LiveWatch
// Component: Learned channel statistics
// Purpose: EMA liveness score, weekday/hour on-air histogram, recency decay
//          and the bounded legacy counters.
// Copyright (c) 2026 LiveWatch

#ifndef LIVEWATCH_MODEL_LEARNED_STATS_HPP_
#define LIVEWATCH_MODEL_LEARNED_STATS_HPP_

#include <cstdint>
#include <map>
#include <optional>
#include <vector>

#include "time/ITimeSource.hpp"

namespace livewatch::model {

struct EmaParams {
  double alpha_active = 0.1;    // Weight of a live observation.
  double alpha_offline = 0.01;  // Weight of an offline observation.
};

struct LearnedStats {
  static constexpr size_t kMaxHoursPerDay = 5;
  static constexpr int32_t kLegacyCounterCap = 100;
  static constexpr int kDecayGraceDays = 30;
  static constexpr int kDecayMaxExtraDays = 60;
  static constexpr double kDecayPerDay = 0.99;

  double priority_score = 0.0;
  // weekday (0 = Sunday) -> distinct hours-of-day, oldest first.
  std::map<int, std::vector<int>> historical_intervals;
  std::optional<int64_t> last_seen_live_ms;
  double consistency_score = 0.0;
  int32_t live_check_count = 0;
  int32_t live_found_count = 0;

  bool HasHistory() const { return !historical_intervals.empty(); }
};

// Folds one observation into stats. Steps run in order: history slot (live
// only), consistency, EMA, recency decay, legacy counters.
// This is the only writer of priority_score.
void IncrementLiveCounts(LearnedStats& stats, bool is_live,
                         const EmaParams& params, int64_t now_ms,
                         const LocalTime& local_now);

// Whole days between last_seen_ms and now_ms (0 when last_seen is later).
int DaysInactive(int64_t last_seen_ms, int64_t now_ms);

}  // namespace livewatch::model

#endif  // LIVEWATCH_MODEL_LEARNED_STATS_HPP_
