// Repository: LiveWatch
// Component: MonitorControl gRPC Service Implementation
// Copyright (c) 2026 LiveWatch

#include "control/monitor_service.h"

#include <chrono>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

#include "livewatch/model/ChannelTypes.hpp"
#include "control/update_mailbox.h"
#include "livewatch/util/Logger.hpp"
#include "persist/ChannelRecordCodec.hpp"

namespace livewatch {
namespace control {

namespace proto = livewatch::v1;
using livewatch::util::LogInfo;
using livewatch::util::LogWarn;
using livewatch::util::LogError;

namespace {

constexpr std::chrono::milliseconds kStreamPollInterval{200};

template <typename Fn>
grpc::Status Guarded(const char* rpc, Fn&& fn) {
  try {
    return fn();
  } catch (const std::invalid_argument& e) {
    return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, e.what());
  } catch (const std::out_of_range& e) {
    return grpc::Status(grpc::StatusCode::NOT_FOUND, e.what());
  } catch (const std::exception& e) {
    LogError("MonitorControl", "RPC_FAILED").Field("rpc", rpc).Field("error", e.what());
    return grpc::Status(grpc::StatusCode::INTERNAL, e.what());
  } catch (...) {
    LogError("MonitorControl", "RPC_FAILED").Field("rpc", rpc).Field("error", "unknown");
    return grpc::Status(grpc::StatusCode::INTERNAL, "unknown exception");
  }
}

}  // namespace

MonitorControlImpl::MonitorControlImpl(std::shared_ptr<runtime::MonitorEngine> engine)
    : engine_(std::move(engine)) {
  if (!engine_) {
    throw std::invalid_argument("MonitorControlImpl: engine is required");
  }
}

MonitorControlImpl::~MonitorControlImpl() {
  Shutdown();
}

void MonitorControlImpl::Shutdown() {
  shutdown_.store(true, std::memory_order_release);
}

proto::ChannelStatusView MonitorControlImpl::MakeView(const model::ChannelState& state,
                                                      bool removed) const {
  proto::ChannelStatusView view;
  *view.mutable_record() = persist::ToRecord(state);
  view.set_status(model::ChannelStatusToString(state.status));
  view.set_is_live(state.is_live);
  view.set_is_recording(state.is_recording);
  view.set_is_checking(state.is_checking);
  view.set_manually_stopped(state.manually_stopped);
  view.set_loop_interval_seconds(state.loop_interval_seconds);
  view.set_likelihood(engine_->LikelihoodOf(state));
  view.set_live_title(state.live_title);
  view.set_recorded_duration(
      model::FormatDuration(model::RecordedDurationMs(state, engine_->NowUtcMs())));
  view.set_removed(removed);
  return view;
}

grpc::Status MonitorControlImpl::AddChannel(grpc::ServerContext* context,
                                            const proto::AddChannelRequest* request,
                                            proto::AddChannelResponse* response) {
  (void)context;
  return Guarded("AddChannel", [&] {
    model::ChannelConfig config = request->has_config()
                                      ? persist::FromProtoConfig(request->config())
                                      : model::ChannelConfig{};
    const auto state = engine_->AddChannel(request->url(), config);
    *response->mutable_channel() = MakeView(state);
    return grpc::Status::OK;
  });
}

grpc::Status MonitorControlImpl::RemoveChannels(grpc::ServerContext* context,
                                                const proto::RemoveChannelsRequest* request,
                                                proto::RemoveChannelsResponse* response) {
  (void)context;
  return Guarded("RemoveChannels", [&] {
    const std::vector<std::string> ids(request->ids().begin(), request->ids().end());
    response->set_removed(static_cast<int32_t>(engine_->RemoveChannels(ids)));
    return grpc::Status::OK;
  });
}

grpc::Status MonitorControlImpl::UpdateChannel(grpc::ServerContext* context,
                                               const proto::UpdateChannelRequest* request,
                                               proto::UpdateChannelResponse* response) {
  (void)context;
  return Guarded("UpdateChannel", [&] {
    const std::map<std::string, std::string> fields(request->fields().begin(),
                                                    request->fields().end());
    const auto patch = model::ChannelPatch::FromFields(fields);
    if (patch.Empty()) {
      throw std::invalid_argument("UpdateChannel: no fields to update");
    }
    const auto state = engine_->UpdateChannel(request->id(), patch);
    *response->mutable_channel() = MakeView(state);
    return grpc::Status::OK;
  });
}

grpc::Status MonitorControlImpl::SetMonitoring(grpc::ServerContext* context,
                                               const proto::SetMonitoringRequest* request,
                                               proto::SetMonitoringResponse* response) {
  (void)context;
  return Guarded("SetMonitoring", [&] {
    const std::vector<std::string> ids(request->ids().begin(), request->ids().end());
    response->set_changed(static_cast<int32_t>(engine_->SetMonitoring(ids, request->enabled())));
    return grpc::Status::OK;
  });
}

grpc::Status MonitorControlImpl::StopRecording(grpc::ServerContext* context,
                                               const proto::StopRecordingRequest* request,
                                               proto::StopRecordingResponse* response) {
  (void)context;
  return Guarded("StopRecording", [&] {
    if (!engine_->GetChannel(request->id()).has_value()) {
      throw std::out_of_range("StopRecording: unknown channel " + request->id());
    }
    response->set_stopped(engine_->StopRecording(request->id()));
    return grpc::Status::OK;
  });
}

grpc::Status MonitorControlImpl::ListChannels(grpc::ServerContext* context,
                                              const proto::ListChannelsRequest* request,
                                              proto::ListChannelsResponse* response) {
  (void)context;
  (void)request;
  return Guarded("ListChannels", [&] {
    for (const auto& state : engine_->ListChannels()) {
      *response->add_channels() = MakeView(state);
    }
    return grpc::Status::OK;
  });
}

grpc::Status MonitorControlImpl::SubscribeUpdates(
    grpc::ServerContext* context, const proto::SubscribeUpdatesRequest* request,
    grpc::ServerWriter<proto::ChannelStatusView>* writer) {
  (void)request;
  auto mailbox = std::make_shared<UpdateMailbox>();
  const uint64_t subscription = engine_->events().Subscribe(
      [mailbox](const runtime::ChannelEvent& event) { mailbox->Push(event); });
  LogInfo("MonitorControl", "SUBSCRIBER_ATTACHED").Field("peer", context->peer());

  grpc::Status result = grpc::Status::OK;
  try {
    while (!shutdown_.load(std::memory_order_acquire) && !context->IsCancelled()) {
      const auto batch = mailbox->WaitAndDrain(kStreamPollInterval);
      if (const size_t dropped = mailbox->TakeDropped()) {
        LogWarn("MonitorControl", "SUBSCRIBER_LAGGING")
            .Field("peer", context->peer())
            .Field("dropped", dropped);
      }
      bool open = true;
      for (const auto& event : batch) {
        const bool removed = event.type == runtime::ChannelEventType::kRemoved;
        if (!writer->Write(MakeView(event.state, removed))) {
          open = false;
          break;
        }
      }
      if (!open) break;
    }
  } catch (const std::exception& e) {
    LogError("MonitorControl", "RPC_FAILED").Field("rpc", "SubscribeUpdates").Field("error", e.what());
    result = grpc::Status(grpc::StatusCode::INTERNAL, e.what());
  } catch (...) {
    LogError("MonitorControl", "RPC_FAILED").Field("rpc", "SubscribeUpdates").Field("error", "unknown");
    result = grpc::Status(grpc::StatusCode::INTERNAL, "unknown exception");
  }

  engine_->events().Unsubscribe(subscription);
  LogInfo("MonitorControl", "SUBSCRIBER_DETACHED").Field("peer", context->peer());
  return result;
}

}  // namespace control
}  // namespace livewatch
