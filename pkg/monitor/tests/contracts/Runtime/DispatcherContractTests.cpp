// Repository: LiveWatch
// Component: Dispatcher Contract Tests
// Purpose: Interval recomputation, dueness, lane routing, de-duplication and
//          priority ordering of one scheduling cycle.
// Copyright (c) 2026 LiveWatch

#include <gtest/gtest.h>

#include "fixtures/FakeDiskSpaceGuard.h"
#include "livewatch/runtime/Dispatcher.hpp"
#include "support/DeterministicTimeSource.hpp"
#include "support/FastTestConfig.hpp"

using namespace livewatch;
using namespace livewatch::runtime;
using livewatch::model::ChannelState;
using livewatch::predict::Lane;
using livewatch::tests::fixtures::FakeDiskSpaceGuard;

namespace {

constexpr int64_t kTuesday2015Ms =
    DeterministicTimeSource::kTuesdayMidnightMs + (20LL * 3600 + 15 * 60) * 1000;

class DispatcherContractTest : public ::testing::Test {
 protected:
  void SetUp() override {
    config_ = test_infra::FastTestConfig();
    clock_ = std::make_shared<DeterministicTimeSource>(kTuesday2015Ms);
    guard_ = std::make_shared<FakeDiskSpaceGuard>();
    gate_ = std::make_unique<DiskSpaceGate>(guard_, 1.0, "/rec");
    queues_ = {std::make_shared<ProbeQueue>("fast"), std::make_shared<ProbeQueue>("medium"),
               std::make_shared<ProbeQueue>("slow")};
    dispatcher_ = std::make_unique<Dispatcher>(config_, registry_, queues_, *gate_, clock_,
                                               [this] { ++save_requests_; }, 7u);
  }

  std::shared_ptr<model::Channel> AddChannel(const std::string& id,
                                             void (*init)(ChannelState&) = nullptr) {
    ChannelState state;
    state.id = id;
    state.url = "https://live.example.com/" + id;
    if (init) init(state);
    auto channel = std::make_shared<model::Channel>(state);
    registry_.Add(channel);
    return channel;
  }

  ProbeQueue& Queue(Lane lane) { return *queues_[static_cast<size_t>(lane)]; }

  config::MonitorConfig config_;
  std::shared_ptr<DeterministicTimeSource> clock_;
  std::shared_ptr<FakeDiskSpaceGuard> guard_;
  std::unique_ptr<DiskSpaceGate> gate_;
  ChannelRegistry registry_;
  LaneQueues queues_;
  std::unique_ptr<Dispatcher> dispatcher_;
  int save_requests_ = 0;
};

}  // namespace

TEST_F(DispatcherContractTest, KnownHourGoesToFastLaneAtSixtySeconds) {
  auto channel = AddChannel("tue20", [](ChannelState& s) {
    s.stats.historical_intervals[2] = {20};
  });

  const CycleSummary summary = dispatcher_->RunCycle();

  EXPECT_EQ(summary.dispatched[0], 1);
  EXPECT_EQ(summary.TotalDispatched(), 1);
  EXPECT_EQ(channel->Snapshot().loop_interval_seconds, 60);
  EXPECT_TRUE(channel->IsChecking());
  ASSERT_EQ(Queue(Lane::kFast).Size(), 1u);
  EXPECT_EQ(Queue(Lane::kFast).Pop()->id(), "tue20");
}

TEST_F(DispatcherContractTest, FreshChannelIsDueImmediately) {
  auto channel = AddChannel("fresh");
  const CycleSummary summary = dispatcher_->RunCycle();
  EXPECT_EQ(summary.dispatched[1], 1);
  EXPECT_EQ(channel->Snapshot().loop_interval_seconds, 150);
  EXPECT_EQ(Queue(Lane::kMedium).Size(), 1u);
}

TEST_F(DispatcherContractTest, ChannelWaitsUntilIntervalElapses) {
  AddChannel("recent", [](ChannelState& s) {
    s.stats.historical_intervals[3] = {9};  // Wednesday only: 0.2 -> 600 s.
    s.detection_time_ms = kTuesday2015Ms - 599'000;
  });

  CycleSummary summary = dispatcher_->RunCycle();
  EXPECT_EQ(summary.waiting, 1);
  EXPECT_EQ(summary.TotalDispatched(), 0);

  clock_->AdvanceMs(1'000);
  summary = dispatcher_->RunCycle();
  EXPECT_EQ(summary.dispatched[2], 1);
  EXPECT_EQ(Queue(Lane::kSlow).Size(), 1u);
}

TEST_F(DispatcherContractTest, ChannelIsNeverQueuedTwice) {
  AddChannel("dup");
  dispatcher_->RunCycle();
  const CycleSummary second = dispatcher_->RunCycle();

  EXPECT_EQ(second.TotalDispatched(), 0);
  EXPECT_EQ(second.busy[1], 1);
  EXPECT_EQ(Queue(Lane::kMedium).Size(), 1u);
}

TEST_F(DispatcherContractTest, UnmonitoredChannelsAreIgnored) {
  auto channel = AddChannel("off", [](ChannelState& s) { s.config.monitor_enabled = false; });
  const CycleSummary summary = dispatcher_->RunCycle();
  EXPECT_EQ(summary.TotalActive(), 0);
  EXPECT_EQ(summary.waiting, 0);
  EXPECT_FALSE(channel->IsChecking());
}

TEST_F(DispatcherContractTest, RecordingChannelRefreshesPatternInsteadOfProbing) {
  auto channel = AddChannel("rec", [](ChannelState& s) { s.is_recording = true; });
  const CycleSummary summary = dispatcher_->RunCycle();

  EXPECT_EQ(summary.recording, 1);
  EXPECT_EQ(summary.TotalDispatched(), 0);
  const ChannelState s = channel->Snapshot();
  EXPECT_DOUBLE_EQ(s.stats.priority_score, 0.1);
  EXPECT_EQ(s.stats.historical_intervals.at(2), std::vector<int>({20}));
  EXPECT_FALSE(channel->IsChecking());
}

TEST_F(DispatcherContractTest, AnnouncedNotifyOnlyChannelUsesNotifyInterval) {
  auto channel = AddChannel("notify", [](ChannelState& s) {
    s.stats.historical_intervals[2] = {20};
    s.config.only_notify_no_record = true;
    s.is_live = true;
    s.notified_live_start = true;
    s.detection_time_ms = kTuesday2015Ms - 120'000;
  });

  const CycleSummary summary = dispatcher_->RunCycle();
  EXPECT_EQ(channel->Snapshot().loop_interval_seconds, 600);
  EXPECT_EQ(summary.waiting, 1);
}

TEST_F(DispatcherContractTest, HigherPriorityChannelsAreQueuedFirst) {
  AddChannel("low", [](ChannelState& s) { s.stats.priority_score = 0.1; });
  AddChannel("high", [](ChannelState& s) { s.stats.priority_score = 0.9; });
  AddChannel("mid", [](ChannelState& s) { s.stats.priority_score = 0.5; });

  dispatcher_->RunCycle();

  ASSERT_EQ(Queue(Lane::kMedium).Size(), 3u);
  EXPECT_EQ(Queue(Lane::kMedium).Pop()->id(), "high");
  EXPECT_EQ(Queue(Lane::kMedium).Pop()->id(), "mid");
  EXPECT_EQ(Queue(Lane::kMedium).Pop()->id(), "low");
}

TEST_F(DispatcherContractTest, CycleRefreshesDiskGateAndRequestsSave) {
  guard_->SetLow(true);
  dispatcher_->RunCycle();
  EXPECT_FALSE(gate_->RecordingEnabled());
  EXPECT_EQ(save_requests_, 1);
}

TEST_F(DispatcherContractTest, ClosedQueueReleasesToken) {
  auto channel = AddChannel("closed");
  Queue(Lane::kMedium).Close();
  const CycleSummary summary = dispatcher_->RunCycle();
  EXPECT_EQ(summary.TotalDispatched(), 0);
  EXPECT_FALSE(channel->IsChecking());
}

TEST(CycleSummaryContract, FormatsPerLaneCounts) {
  CycleSummary summary;
  summary.dispatched = {1, 0, 2};
  summary.waiting = 3;
  summary.recording = 1;
  EXPECT_EQ(summary.ToString(), "disp=1F+0M+2S busy=0F+0M+0S waiting=3 recording=1");
}
