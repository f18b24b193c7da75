// Repository: LiveWatch
// Component: Predictor
// Copyright (c) 2026 LiveWatch

#include "livewatch/predict/Predictor.hpp"

#include <algorithm>

namespace livewatch::predict {

const char* LaneToString(Lane lane) {
  switch (lane) {
    case Lane::kFast: return "fast";
    case Lane::kMedium: return "medium";
    case Lane::kSlow: return "slow";
  }
  return "unknown";
}

Lane LaneForInterval(int32_t interval_seconds) {
  if (interval_seconds <= 60) return Lane::kFast;
  if (interval_seconds <= 180) return Lane::kMedium;
  return Lane::kSlow;
}

double Predictor::Likelihood(const model::LearnedStats& stats, const LocalTime& now) {
  if (!stats.HasHistory()) {
    return kNeutral;
  }
  auto it = stats.historical_intervals.find(now.weekday);
  if (it == stats.historical_intervals.end()) {
    return kUnknownDay;
  }
  const auto& hours = it->second;
  if (std::find(hours.begin(), hours.end(), now.hour) != hours.end()) {
    return kInWindow;
  }
  const int next_hour = (now.hour + 1) % 24;
  if (std::find(hours.begin(), hours.end(), next_hour) != hours.end()) {
    const double minute_progress = static_cast<double>(now.minute) / 60.0;
    return kApproachFloor + kApproachSpan * minute_progress;
  }
  return kFarFromWindow;
}

int32_t Predictor::IntervalForLikelihood(double likelihood, int32_t base_interval_seconds) {
  if (likelihood >= 0.9) return kHotIntervalSeconds;
  if (likelihood >= 0.5) return base_interval_seconds / 2;
  if (likelihood <= 0.2) return base_interval_seconds * 2;
  return base_interval_seconds;
}

}  // namespace livewatch::predict
