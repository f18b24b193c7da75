// Repository: LiveWatch
// Component: gRPC stream resolver client
// Copyright (c) 2026 LiveWatch

#include "io/GrpcStreamResolver.hpp"

#include <sstream>

namespace livewatch::io {

namespace proto = livewatch::v1;

GrpcStreamResolver::GrpcStreamResolver(const std::string& target_address,
                                       std::chrono::milliseconds deadline)
    : target_address_(target_address),
      deadline_(deadline),
      grpc_channel_(grpc::CreateChannel(target_address, grpc::InsecureChannelCredentials())),
      stub_(proto::StreamResolver::NewStub(grpc_channel_)) {}

StreamInfo GrpcStreamResolver::Resolve(const std::string& url, const std::string& platform_key) {
  proto::ResolveRequest request;
  request.set_url(url);
  request.set_platform_key(platform_key);

  grpc::ClientContext ctx;
  ctx.set_deadline(std::chrono::system_clock::now() + deadline_);
  proto::ResolveResponse response;
  const grpc::Status status = stub_->Resolve(&ctx, request, &response);

  StreamInfo info;
  if (!status.ok()) {
    std::ostringstream oss;
    oss << "resolver rpc failed target=" << target_address_
        << " code=" << static_cast<int>(status.error_code())
        << " message=" << status.error_message();
    info.error = oss.str();
    return info;
  }
  if (!response.error().empty()) {
    info.error = response.error();
    return info;
  }
  info.is_live = response.is_live();
  info.anchor_name = response.anchor_name();
  info.title = response.title();
  info.record_url = response.record_url();
  return info;
}

}  // namespace livewatch::io
