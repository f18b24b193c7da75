// Repository: LiveWatch
// Component: MonitorControl gRPC Service Implementation
// Purpose: Implements the MonitorControl service: channel management and
//          status streaming over the MonitorEngine.
// Copyright (c) 2026 LiveWatch

#ifndef LIVEWATCH_MONITOR_SERVICE_H_
#define LIVEWATCH_MONITOR_SERVICE_H_

#include <atomic>
#include <memory>

#include <grpcpp/grpcpp.h>

#include "monitor.grpc.pb.h"
#include "monitor.pb.h"
#include "livewatch/runtime/MonitorEngine.hpp"

namespace livewatch {
namespace control {

// Thin adapter: decodes requests, calls MonitorEngine, encodes views.
// Exceptions never leave a handler; they map onto grpc::Status codes:
// std::invalid_argument → INVALID_ARGUMENT, std::out_of_range → NOT_FOUND,
// anything else → INTERNAL.
class MonitorControlImpl final : public livewatch::v1::MonitorControl::Service {
 public:
  explicit MonitorControlImpl(std::shared_ptr<runtime::MonitorEngine> engine);
  ~MonitorControlImpl() override;

  MonitorControlImpl(const MonitorControlImpl&) = delete;
  MonitorControlImpl& operator=(const MonitorControlImpl&) = delete;

  grpc::Status AddChannel(grpc::ServerContext* context,
                          const livewatch::v1::AddChannelRequest* request,
                          livewatch::v1::AddChannelResponse* response) override;

  grpc::Status RemoveChannels(grpc::ServerContext* context,
                              const livewatch::v1::RemoveChannelsRequest* request,
                              livewatch::v1::RemoveChannelsResponse* response) override;

  grpc::Status UpdateChannel(grpc::ServerContext* context,
                             const livewatch::v1::UpdateChannelRequest* request,
                             livewatch::v1::UpdateChannelResponse* response) override;

  grpc::Status SetMonitoring(grpc::ServerContext* context,
                             const livewatch::v1::SetMonitoringRequest* request,
                             livewatch::v1::SetMonitoringResponse* response) override;

  grpc::Status StopRecording(grpc::ServerContext* context,
                             const livewatch::v1::StopRecordingRequest* request,
                             livewatch::v1::StopRecordingResponse* response) override;

  grpc::Status ListChannels(grpc::ServerContext* context,
                            const livewatch::v1::ListChannelsRequest* request,
                            livewatch::v1::ListChannelsResponse* response) override;

  // Streams one view per channel event until the client cancels or
  // Shutdown() is called.
  grpc::Status SubscribeUpdates(grpc::ServerContext* context,
                                const livewatch::v1::SubscribeUpdatesRequest* request,
                                grpc::ServerWriter<livewatch::v1::ChannelStatusView>* writer) override;

  // Ends every open SubscribeUpdates stream. Call before server shutdown.
  void Shutdown();

  livewatch::v1::ChannelStatusView MakeView(const model::ChannelState& state,
                                            bool removed = false) const;

 private:
  std::shared_ptr<runtime::MonitorEngine> engine_;

  std::atomic<bool> shutdown_{false};
};

}  // namespace control
}  // namespace livewatch

#endif  // LIVEWATCH_MONITOR_SERVICE_H_
