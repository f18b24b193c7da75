// Repository: LiveWatch
// Component: MonitorControl Contract Tests
// Purpose: The gRPC control surface served in-process over the assembled
//          engine: status codes, views and the update stream lifecycle.
// Copyright (c) 2026 LiveWatch

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>

#include <grpcpp/grpcpp.h>

#include "control/monitor_service.h"
#include "fixtures/FakeDiskSpaceGuard.h"
#include "fixtures/FakeNotifier.h"
#include "fixtures/FakeStreamRecorder.h"
#include "fixtures/FakeStreamResolver.h"
#include "fixtures/InMemoryPersistenceGateway.h"
#include "livewatch/model/ChannelTypes.hpp"
#include "livewatch/runtime/MonitorEngine.hpp"
#include "monitor.grpc.pb.h"
#include "support/DeterministicTimeSource.hpp"
#include "support/FastTestConfig.hpp"
#include "support/ImmediateWaitStrategy.hpp"
#include "support/ProberHarness.hpp"

using namespace livewatch;
using namespace livewatch::tests::fixtures;
using livewatch::control::MonitorControlImpl;
using livewatch::test_infra::WaitFor;
namespace proto = livewatch::v1;

namespace {

class MonitorControlContractTest : public ::testing::Test {
 protected:
  void SetUp() override {
    runtime::EngineDependencies deps;
    deps.resolver = std::make_shared<FakeStreamResolver>();
    deps.recorder = std::make_shared<FakeStreamRecorder>();
    deps.notifier = std::make_shared<FakeNotifier>();
    deps.disk_guard = std::make_shared<FakeDiskSpaceGuard>();
    deps.store = std::make_shared<InMemoryPersistenceGateway>();
    deps.time_source = std::make_shared<DeterministicTimeSource>();
    deps.wait = std::make_shared<runtime::ImmediateWaitStrategy>();
    deps.seed = 5u;
    engine_ = std::make_shared<runtime::MonitorEngine>(test_infra::FastTestConfig(), deps);

    service_ = std::make_unique<MonitorControlImpl>(engine_);
    grpc::ServerBuilder builder;
    builder.RegisterService(service_.get());
    server_ = builder.BuildAndStart();
    ASSERT_NE(server_, nullptr);
    stub_ = proto::MonitorControl::NewStub(server_->InProcessChannel(grpc::ChannelArguments()));
  }

  void TearDown() override {
    if (service_) service_->Shutdown();
    if (server_) {
      server_->Shutdown(std::chrono::system_clock::now() + std::chrono::seconds(2));
    }
    if (engine_) engine_->Stop();
  }

  // Added with monitoring off so no probe is queued behind the test.
  proto::ChannelStatusView AddIdleChannel(const std::string& url, const std::string& name) {
    proto::AddChannelRequest request;
    request.set_url(url);
    request.mutable_config()->set_streamer_name(name);
    request.mutable_config()->set_monitor_enabled(false);
    proto::AddChannelResponse response;
    grpc::ClientContext context;
    const grpc::Status status = stub_->AddChannel(&context, request, &response);
    EXPECT_TRUE(status.ok()) << status.error_message();
    return response.channel();
  }

  std::shared_ptr<runtime::MonitorEngine> engine_;
  std::unique_ptr<MonitorControlImpl> service_;
  std::unique_ptr<grpc::Server> server_;
  std::unique_ptr<proto::MonitorControl::Stub> stub_;
};

}  // namespace

// =============================================================================
// Unary RPCs
// =============================================================================

TEST_F(MonitorControlContractTest, AddChannelReturnsView) {
  const auto view = AddIdleChannel("https://live.example.com/a", "Alice");

  EXPECT_EQ(view.record().id().size(), 36u);
  EXPECT_EQ(view.record().url(), "https://live.example.com/a");
  EXPECT_EQ(view.record().config().streamer_name(), "Alice");
  EXPECT_EQ(view.status(), model::ChannelStatusToString(model::ChannelStatus::kStoppedMonitoring));
  EXPECT_FALSE(view.is_recording());
  EXPECT_FALSE(view.removed());
  EXPECT_EQ(view.recorded_duration(), "0:00:00");

  proto::ListChannelsResponse list;
  grpc::ClientContext context;
  ASSERT_TRUE(stub_->ListChannels(&context, proto::ListChannelsRequest{}, &list).ok());
  ASSERT_EQ(list.channels_size(), 1);
  EXPECT_EQ(list.channels(0).record().id(), view.record().id());
}

TEST_F(MonitorControlContractTest, AddChannelWithoutUrlIsInvalidArgument) {
  proto::AddChannelResponse response;
  grpc::ClientContext context;
  const grpc::Status status = stub_->AddChannel(&context, proto::AddChannelRequest{}, &response);
  EXPECT_EQ(status.error_code(), grpc::StatusCode::INVALID_ARGUMENT);
}

TEST_F(MonitorControlContractTest, UpdateChannelMapsErrorsToStatusCodes) {
  const auto view = AddIdleChannel("https://live.example.com/a", "Alice");

  {
    proto::UpdateChannelRequest request;
    request.set_id(view.record().id());
    (*request.mutable_fields())["no_such_field"] = "x";
    proto::UpdateChannelResponse response;
    grpc::ClientContext context;
    EXPECT_EQ(stub_->UpdateChannel(&context, request, &response).error_code(),
              grpc::StatusCode::INVALID_ARGUMENT);
  }
  {
    proto::UpdateChannelRequest request;
    request.set_id("missing");
    (*request.mutable_fields())["streamer_name"] = "Bob";
    proto::UpdateChannelResponse response;
    grpc::ClientContext context;
    EXPECT_EQ(stub_->UpdateChannel(&context, request, &response).error_code(),
              grpc::StatusCode::NOT_FOUND);
  }
  {
    proto::UpdateChannelRequest request;
    request.set_id(view.record().id());
    (*request.mutable_fields())["streamer_name"] = "Bob";
    proto::UpdateChannelResponse response;
    grpc::ClientContext context;
    ASSERT_TRUE(stub_->UpdateChannel(&context, request, &response).ok());
    EXPECT_EQ(response.channel().record().config().streamer_name(), "Bob");
  }
}

TEST_F(MonitorControlContractTest, StopRecordingOnUnknownIdIsNotFound) {
  proto::StopRecordingRequest request;
  request.set_id("missing");
  proto::StopRecordingResponse response;
  grpc::ClientContext context;
  EXPECT_EQ(stub_->StopRecording(&context, request, &response).error_code(),
            grpc::StatusCode::NOT_FOUND);

  const auto view = AddIdleChannel("https://live.example.com/a", "Alice");
  request.set_id(view.record().id());
  grpc::ClientContext second;
  ASSERT_TRUE(stub_->StopRecording(&second, request, &response).ok());
  EXPECT_FALSE(response.stopped());
}

TEST_F(MonitorControlContractTest, RemoveAndSetMonitoringReportCounts) {
  const auto a = AddIdleChannel("https://live.example.com/a", "Alice");
  AddIdleChannel("https://live.example.com/b", "Bea");

  proto::SetMonitoringRequest enable;
  enable.set_enabled(true);
  proto::SetMonitoringResponse set_response;
  grpc::ClientContext set_context;
  ASSERT_TRUE(stub_->SetMonitoring(&set_context, enable, &set_response).ok());
  EXPECT_EQ(set_response.changed(), 2);

  proto::RemoveChannelsRequest remove;
  remove.add_ids(a.record().id());
  remove.add_ids("missing");
  proto::RemoveChannelsResponse remove_response;
  grpc::ClientContext remove_context;
  ASSERT_TRUE(stub_->RemoveChannels(&remove_context, remove, &remove_response).ok());
  EXPECT_EQ(remove_response.removed(), 1);
  EXPECT_EQ(engine_->ListChannels().size(), 1u);
}

// =============================================================================
// Update stream
// =============================================================================

TEST_F(MonitorControlContractTest, SubscribeUpdatesDeliversThenDetaches) {
  const auto view = AddIdleChannel("https://live.example.com/a", "Alice");
  const std::string id = view.record().id();
  const size_t baseline = engine_->events().SubscriberCount();

  grpc::ClientContext stream_context;
  auto reader = stub_->SubscribeUpdates(&stream_context, proto::SubscribeUpdatesRequest{});

  // The server attaches asynchronously; keep publishing until it has.
  ASSERT_TRUE(WaitFor([&] { return engine_->events().SubscriberCount() > baseline; }));
  std::atomic<bool> reading{true};
  std::thread publisher([&] {
    int n = 0;
    while (reading.load()) {
      model::ChannelPatch patch;
      patch.streamer_name = "Alice " + std::to_string(++n);
      engine_->UpdateChannel(id, patch);
      std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
  });

  proto::ChannelStatusView update;
  ASSERT_TRUE(reader->Read(&update));
  reading = false;
  publisher.join();
  EXPECT_EQ(update.record().id(), id);
  EXPECT_FALSE(update.removed());

  engine_->RemoveChannels({id});
  bool saw_removal = false;
  while (!saw_removal && reader->Read(&update)) {
    saw_removal = update.removed();
  }
  EXPECT_TRUE(saw_removal);

  stream_context.TryCancel();
  const grpc::Status finished = reader->Finish();
  EXPECT_EQ(finished.error_code(), grpc::StatusCode::CANCELLED);
  EXPECT_TRUE(WaitFor([&] { return engine_->events().SubscriberCount() == baseline; }));
}
