// Repository: LiveWatch
// Component: Dispatcher
// Copyright (c) 2026 LiveWatch

#include "livewatch/runtime/Dispatcher.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

#include "livewatch/util/Logger.hpp"

namespace livewatch::runtime {

using livewatch::model::ChannelState;
using livewatch::predict::Lane;
using livewatch::predict::Predictor;
using livewatch::util::LogDebug;
using livewatch::util::LogInfo;
using livewatch::util::Logger;

std::string CycleSummary::ToString() const {
  std::ostringstream oss;
  oss << "disp=" << dispatched[0] << "F+" << dispatched[1] << "M+" << dispatched[2] << "S"
      << " busy=" << busy[0] << "F+" << busy[1] << "M+" << busy[2] << "S"
      << " waiting=" << waiting << " recording=" << recording;
  return oss.str();
}

Dispatcher::Dispatcher(const config::MonitorConfig& config,
                       ChannelRegistry& registry,
                       LaneQueues queues,
                       DiskSpaceGate& disk_gate,
                       std::shared_ptr<ITimeSource> time_source,
                       SaveRequest request_save,
                       uint32_t tiebreak_seed)
    : base_interval_seconds_(config.loop_time_seconds),
      notify_interval_seconds_(config.notify_loop_time_seconds),
      ema_{config.ema_alpha_active, config.ema_alpha_offline},
      registry_(registry),
      queues_(std::move(queues)),
      disk_gate_(disk_gate),
      time_source_(std::move(time_source)),
      request_save_(std::move(request_save)),
      rng_(tiebreak_seed) {
  for (const auto& q : queues_) {
    if (!q) throw std::invalid_argument("Dispatcher: every lane needs a queue");
  }
  if (!time_source_) throw std::invalid_argument("Dispatcher: time source is required");
}

CycleSummary Dispatcher::RunCycle() {
  disk_gate_.Refresh();

  struct Candidate {
    double priority;
    double tiebreak;
    ChannelRegistry::ChannelPtr channel;
  };

  const auto channels = registry_.All();
  std::uniform_real_distribution<double> tiebreak(0.0, 1.0);
  std::vector<Candidate> order;
  order.reserve(channels->size());
  for (const auto& channel : *channels) {
    const double priority =
        channel->Mutate([](ChannelState& s) { return s.stats.priority_score; });
    order.push_back(Candidate{priority, tiebreak(rng_), channel});
  }
  std::sort(order.begin(), order.end(), [](const Candidate& a, const Candidate& b) {
    if (a.priority != b.priority) return a.priority > b.priority;
    return a.tiebreak > b.tiebreak;
  });

  CycleSummary summary;
  const int64_t now_ms = time_source_->NowUtcMs();
  const LocalTime local = time_source_->LocalTimeAt(now_ms);

  for (const auto& candidate : order) {
    const auto& channel = candidate.channel;
    if (!channel->IsMonitored()) continue;

    // Still live while recording: keep the learned pattern current.
    const bool recording = channel->Mutate([&](ChannelState& s) {
      if (!s.is_recording) return false;
      model::IncrementLiveCounts(s.stats, true, ema_, now_ms, local);
      return true;
    });
    if (recording) {
      ++summary.recording;
      continue;
    }

    double likelihood = 0.0;
    bool due = false;
    const int32_t interval = channel->Mutate([&](ChannelState& s) {
      likelihood = Predictor::Likelihood(s.stats, local);
      int32_t adjusted = Predictor::IntervalForLikelihood(likelihood, base_interval_seconds_);
      if (s.config.only_notify_no_record && s.is_live && s.notified_live_start) {
        adjusted = std::max(adjusted, notify_interval_seconds_);
      }
      s.loop_interval_seconds = adjusted;
      due = !s.detection_time_ms.has_value() ||
            now_ms - *s.detection_time_ms >= static_cast<int64_t>(adjusted) * 1000;
      return adjusted;
    });

    if (!due) {
      ++summary.waiting;
      continue;
    }

    const Lane lane = predict::LaneForInterval(interval);
    const auto lane_index = static_cast<size_t>(lane);
    if (!channel->TryBeginCheck()) {
      ++summary.busy[lane_index];
      continue;
    }
    if (!queues_[lane_index]->Push(channel)) {
      channel->EndCheck();
      continue;
    }
    ++summary.dispatched[lane_index];

    if (Logger::Enabled(util::LogLevel::kDebug)) {
      std::ostringstream rounded;
      rounded << std::fixed << std::setprecision(2) << likelihood;
      LogDebug("Dispatcher", "DISPATCH")
          .Field("id", channel->id())
          .Field("lane", predict::LaneToString(lane))
          .Field("interval", interval)
          .Field("likelihood", rounded.str());
    }
  }

  if (summary.TotalActive() > 0) {
    LogInfo("Dispatcher", "CYCLE").Append(summary.ToString());
  }

  if (request_save_) request_save_();
  return summary;
}

}  // namespace livewatch::runtime
