// Repository: LiveWatch
// Component: Predictor
// Purpose: Live-likelihood score and adjusted polling interval derived from a
//          channel's learned weekday/hour histogram.
// Copyright (c) 2026 LiveWatch

#ifndef LIVEWATCH_PREDICT_PREDICTOR_HPP_
#define LIVEWATCH_PREDICT_PREDICTOR_HPP_

#include <cstdint>

#include "livewatch/model/LearnedStats.hpp"
#include "time/ITimeSource.hpp"

namespace livewatch::predict {

// Priority lane, keyed by the adjusted polling interval.
enum class Lane {
  kFast = 0,    // <= 60 s
  kMedium = 1,  // <= 180 s
  kSlow = 2,    // otherwise
};

inline constexpr int kLaneCount = 3;

const char* LaneToString(Lane lane);
Lane LaneForInterval(int32_t interval_seconds);

// Stateless; every function is a pure function of its inputs.
class Predictor {
 public:
  static constexpr double kNeutral = 0.5;
  static constexpr double kUnknownDay = 0.2;
  static constexpr double kInWindow = 1.0;
  static constexpr double kApproachFloor = 0.5;
  static constexpr double kApproachSpan = 0.4;
  static constexpr double kFarFromWindow = 0.1;
  static constexpr int32_t kHotIntervalSeconds = 60;

  // No history → 0.5. Weekday absent → 0.2. Current hour known → 1.0.
  // Next hour known → 0.5..0.9 across the current hour. Otherwise 0.1.
  static double Likelihood(const model::LearnedStats& stats, const LocalTime& now);

  static int32_t IntervalForLikelihood(double likelihood, int32_t base_interval_seconds);

  static int32_t AdjustedIntervalSeconds(const model::LearnedStats& stats,
                                         const LocalTime& now,
                                         int32_t base_interval_seconds) {
    return IntervalForLikelihood(Likelihood(stats, now), base_interval_seconds);
  }
};

}  // namespace livewatch::predict

#endif  // LIVEWATCH_PREDICT_PREDICTOR_HPP_
