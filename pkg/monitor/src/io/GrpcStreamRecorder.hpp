// Repository: LiveWatch
// Component: gRPC stream recorder client
// Purpose: IStreamRecorder backed by an external livewatch.v1.StreamRecorder
//          service. Each session gets a watcher thread following the
//          session's event stream until it finishes.
// Copyright (c) 2026 LiveWatch

#pragma once

#include <chrono>
#include <memory>
#include <string>

#include <grpcpp/grpcpp.h>
#include "monitor.grpc.pb.h"

#include "livewatch/io/IStreamRecorder.hpp"
#include "livewatch/util/IdGenerator.hpp"

namespace livewatch::io {

class GrpcStreamRecorder : public IStreamRecorder {
 public:
  static constexpr std::chrono::seconds kStartDeadline{10};
  static constexpr std::chrono::seconds kStopDeadline{2};

  explicit GrpcStreamRecorder(const std::string& target_address);

  // Throws std::runtime_error when the service is unreachable or declines.
  std::unique_ptr<IRecordingHandle> Start(const model::ChannelState& channel,
                                          const StreamInfo& stream,
                                          const std::string& output_dir,
                                          FinishedCallback on_finished) override;

 private:
  std::string target_address_;
  std::shared_ptr<grpc::Channel> grpc_channel_;
  std::shared_ptr<livewatch::v1::StreamRecorder::Stub> stub_;
  util::IdGenerator session_ids_;
};

}  // namespace livewatch::io
