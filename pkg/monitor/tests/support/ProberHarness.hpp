// Repository: LiveWatch
// Component: Prober harness (test only)
// Purpose: Owns a Prober wired to fakes plus the registry, lanes and
//          runtime primitives it needs, for worker-level tests.
// Copyright (c) 2026 LiveWatch

#ifndef LIVEWATCH_TESTS_SUPPORT_PROBER_HARNESS_HPP_
#define LIVEWATCH_TESTS_SUPPORT_PROBER_HARNESS_HPP_

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <thread>

#include "fixtures/FakeNotifier.h"
#include "fixtures/FakeStreamRecorder.h"
#include "fixtures/FakeStreamResolver.h"
#include "livewatch/runtime/Dispatcher.hpp"
#include "livewatch/runtime/Prober.hpp"
#include "support/DeterministicTimeSource.hpp"
#include "support/FastTestConfig.hpp"
#include "support/ImmediateWaitStrategy.hpp"

namespace livewatch::test_infra {

struct ProberHarness {
  config::MonitorConfig config = FastTestConfig();
  std::shared_ptr<DeterministicTimeSource> clock = std::make_shared<DeterministicTimeSource>();
  std::shared_ptr<tests::fixtures::FakeStreamResolver> resolver =
      std::make_shared<tests::fixtures::FakeStreamResolver>();
  std::shared_ptr<tests::fixtures::FakeStreamRecorder> recorder =
      std::make_shared<tests::fixtures::FakeStreamRecorder>();
  std::shared_ptr<tests::fixtures::FakeNotifier> notifier =
      std::make_shared<tests::fixtures::FakeNotifier>();
  std::shared_ptr<runtime::ImmediateWaitStrategy> wait =
      std::make_shared<runtime::ImmediateWaitStrategy>();
  runtime::ChannelRegistry registry;
  runtime::PlatformPermits permits;
  runtime::DiskSpaceGate gate{nullptr, 0.0, "."};
  runtime::ActiveRecorders recorders;
  runtime::ChannelEventBus events;
  runtime::LaneQueues queues{std::make_shared<runtime::ProbeQueue>("fast"),
                             std::make_shared<runtime::ProbeQueue>("medium"),
                             std::make_shared<runtime::ProbeQueue>("slow")};
  std::unique_ptr<runtime::Prober> prober;

  ProberHarness() {
    runtime::Prober::Collaborators c;
    c.resolver = resolver;
    c.recorder = recorder;
    c.notifier = notifier;
    c.time_source = clock;
    c.wait = wait;
    c.registry = &registry;
    c.permits = &permits;
    c.disk_gate = &gate;
    c.recorders = &recorders;
    c.events = &events;
    prober = std::make_unique<runtime::Prober>(config, std::move(c), 3u);
  }

  std::shared_ptr<model::Channel> AddChannel(const std::string& id, bool monitored = true) {
    model::ChannelState state;
    state.id = id;
    state.url = "https://live.example.com/" + id;
    state.config.monitor_enabled = monitored;
    auto channel = std::make_shared<model::Channel>(state);
    registry.Add(channel);
    return channel;
  }

  // Takes the probe token and queues channel on lane.
  bool Enqueue(const std::shared_ptr<model::Channel>& channel, predict::Lane lane) {
    if (!channel->TryBeginCheck()) return false;
    return queues[static_cast<size_t>(lane)]->Push(channel);
  }
};

// Polls condition every 5 ms until it holds or timeout passes.
inline bool WaitFor(const std::function<bool()>& condition,
                    std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (condition()) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return condition();
}

}  // namespace livewatch::test_infra

#endif  // LIVEWATCH_TESTS_SUPPORT_PROBER_HARNESS_HPP_
