// Repository: LiveWatch
// Component: Learned channel statistics
// Copyright (c) 2026 LiveWatch

#include "livewatch/model/LearnedStats.hpp"

#include <algorithm>
#include <cmath>

namespace livewatch::model {

namespace {

constexpr int64_t kMsPerDay = 24LL * 60 * 60 * 1000;

void RecordLiveSlot(LearnedStats& stats, const LocalTime& local_now) {
  auto& hours = stats.historical_intervals[local_now.weekday];
  if (std::find(hours.begin(), hours.end(), local_now.hour) != hours.end()) {
    return;
  }
  hours.push_back(local_now.hour);
  if (hours.size() > LearnedStats::kMaxHoursPerDay) {
    hours.erase(hours.begin());
  }
}

}  // namespace

int DaysInactive(int64_t last_seen_ms, int64_t now_ms) {
  if (now_ms <= last_seen_ms) return 0;
  return static_cast<int>((now_ms - last_seen_ms) / kMsPerDay);
}

void IncrementLiveCounts(LearnedStats& stats, bool is_live,
                         const EmaParams& params, int64_t now_ms,
                         const LocalTime& local_now) {
  if (is_live) {
    RecordLiveSlot(stats, local_now);
    stats.last_seen_live_ms = now_ms;
  }

  if (stats.HasHistory()) {
    size_t total_slots = 0;
    for (const auto& [day, hours] : stats.historical_intervals) {
      total_slots += hours.size();
    }
    const double max_slots = static_cast<double>(stats.historical_intervals.size()) *
                             static_cast<double>(LearnedStats::kMaxHoursPerDay);
    stats.consistency_score = static_cast<double>(total_slots) / max_slots;
  }

  const double alpha = is_live ? params.alpha_active : params.alpha_offline;
  const double observed = is_live ? 1.0 : 0.0;
  stats.priority_score = stats.priority_score * (1.0 - alpha) + observed * alpha;

  if (stats.last_seen_live_ms.has_value()) {
    const int days = DaysInactive(*stats.last_seen_live_ms, now_ms);
    if (days > LearnedStats::kDecayGraceDays) {
      const int extra = std::min(days - LearnedStats::kDecayGraceDays,
                                 LearnedStats::kDecayMaxExtraDays);
      stats.priority_score *= std::pow(LearnedStats::kDecayPerDay, extra);
    }
  }

  stats.live_check_count += 1;
  if (is_live) {
    stats.live_found_count += 1;
  }
  if (stats.live_check_count > LearnedStats::kLegacyCounterCap) {
    stats.live_check_count /= 2;
    stats.live_found_count /= 2;
  }
}

}  // namespace livewatch::model
