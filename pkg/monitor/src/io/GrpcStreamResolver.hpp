// Repository: LiveWatch
// Component: gRPC stream resolver client
// Purpose: IStreamResolver backed by an external livewatch.v1.StreamResolver
//          service (platform URL parsing lives there).
// Copyright (c) 2026 LiveWatch

#pragma once

#include <chrono>
#include <memory>
#include <string>

#include <grpcpp/grpcpp.h>
#include "monitor.grpc.pb.h"

#include "livewatch/io/IStreamResolver.hpp"

namespace livewatch::io {

// Transport failures and resolver-side errors come back as StreamInfo::error;
// Resolve() itself does not throw.
class GrpcStreamResolver : public IStreamResolver {
 public:
  static constexpr std::chrono::seconds kDefaultDeadline{30};

  explicit GrpcStreamResolver(const std::string& target_address,
                              std::chrono::milliseconds deadline = kDefaultDeadline);

  StreamInfo Resolve(const std::string& url, const std::string& platform_key) override;

 private:
  std::string target_address_;
  std::chrono::milliseconds deadline_;
  std::shared_ptr<grpc::Channel> grpc_channel_;
  std::unique_ptr<livewatch::v1::StreamResolver::Stub> stub_;
};

}  // namespace livewatch::io
