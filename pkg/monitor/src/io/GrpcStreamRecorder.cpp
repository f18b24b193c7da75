// Repository: LiveWatch
// Component: gRPC stream recorder client
// Copyright (c) 2026 LiveWatch

#include "io/GrpcStreamRecorder.hpp"

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <thread>

#include "livewatch/util/Logger.hpp"
#include "livewatch/util/IdGenerator.hpp"

namespace livewatch::io {

namespace proto = livewatch::v1;
using livewatch::util::LogInfo;
using livewatch::util::LogWarn;
using livewatch::util::LogError;

namespace {

// State shared between the handle and its watcher thread. The watcher only
// touches this object, so the handle may be destroyed from inside the
// finished callback.
struct Session {
  std::shared_ptr<proto::StreamRecorder::Stub> stub;
  std::string channel_id;
  std::string session_id;
  IStreamRecorder::FinishedCallback on_finished;

  grpc::ClientContext watch_ctx;
  std::atomic<bool> stop_requested{false};

  std::mutex mutex;
  std::condition_variable cv;
  bool finished = false;
};

void WatchLoop(const std::shared_ptr<Session>& session) {
  proto::WatchSessionRequest request;
  request.set_session_id(session->session_id);
  auto reader = session->stub->WatchSession(&session->watch_ctx, request);

  proto::SessionEvent event;
  std::string detail;
  while (reader->Read(&event)) {
    if (event.kind() == proto::SessionEvent::KIND_FINISHED) {
      detail = event.detail();
      break;
    }
  }
  const grpc::Status status = reader->Finish();

  {
    auto line = LogInfo("GrpcStreamRecorder", "SESSION_FINISHED");
    line.Field("channel", session->channel_id).Field("session", session->session_id);
    if (!detail.empty()) line.Field("detail", detail);
    if (!status.ok() && status.error_code() != grpc::StatusCode::CANCELLED) {
      line.Field("stream_error", status.error_message());
    }
  }

  {
    std::lock_guard<std::mutex> lock(session->mutex);
    session->finished = true;
  }
  session->cv.notify_all();

  try {
    if (session->on_finished) session->on_finished(session->channel_id);
  } catch (const std::exception& e) {
    LogError("GrpcStreamRecorder", "FINISH_CALLBACK_FAILED")
        .Field("channel", session->channel_id)
        .Field("error", e.what());
  } catch (...) {
    LogError("GrpcStreamRecorder", "FINISH_CALLBACK_FAILED")
        .Field("channel", session->channel_id)
        .Field("error", "unknown");
  }
}

class GrpcRecordingHandle : public IRecordingHandle {
 public:
  explicit GrpcRecordingHandle(std::shared_ptr<Session> session)
      : session_(std::move(session)) {
    watcher_ = std::thread(WatchLoop, session_);
  }

  ~GrpcRecordingHandle() override {
    if (!IsFinished()) {
      RequestStop();
      session_->watch_ctx.TryCancel();
    }
    if (!watcher_.joinable()) return;
    // Destroyed from the finished callback: the watcher is exiting on its own.
    if (watcher_.get_id() == std::this_thread::get_id()) {
      watcher_.detach();
    } else {
      watcher_.join();
    }
  }

  void RequestStop() override {
    if (session_->stop_requested.exchange(true)) return;
    proto::StopSessionRequest request;
    request.set_session_id(session_->session_id);
    proto::StopSessionResponse response;
    grpc::ClientContext ctx;
    ctx.set_deadline(std::chrono::system_clock::now() + GrpcStreamRecorder::kStopDeadline);
    const grpc::Status status = session_->stub->StopSession(&ctx, request, &response);
    if (!status.ok()) {
      LogWarn("GrpcStreamRecorder", "STOP_RPC_FAILED")
          .Field("session", session_->session_id)
          .Field("error", status.error_message());
    }
  }

  bool ShouldStop() const override {
    return session_->stop_requested.load() || IsFinished();
  }

  bool WaitStopped(std::chrono::milliseconds timeout) override {
    std::unique_lock<std::mutex> lock(session_->mutex);
    return session_->cv.wait_for(lock, timeout, [this] { return session_->finished; });
  }

 private:
  bool IsFinished() const {
    std::lock_guard<std::mutex> lock(session_->mutex);
    return session_->finished;
  }

  std::shared_ptr<Session> session_;
  std::thread watcher_;
};

}  // namespace

GrpcStreamRecorder::GrpcStreamRecorder(const std::string& target_address)
    : target_address_(target_address),
      grpc_channel_(grpc::CreateChannel(target_address, grpc::InsecureChannelCredentials())),
      stub_(proto::StreamRecorder::NewStub(grpc_channel_)) {}

std::unique_ptr<IRecordingHandle> GrpcStreamRecorder::Start(const model::ChannelState& channel,
                                                            const StreamInfo& stream,
                                                            const std::string& output_dir,
                                                            FinishedCallback on_finished) {
  auto session = std::make_shared<Session>();
  session->stub = stub_;
  session->channel_id = channel.id;
  session->session_id = session_ids_.NextUuid();
  session->on_finished = std::move(on_finished);

  proto::StartRecordingRequest request;
  request.set_channel_id(channel.id);
  request.set_session_id(session->session_id);
  request.set_record_url(stream.record_url);
  request.set_streamer_name(channel.config.streamer_name);
  request.set_title(stream.title);
  request.set_record_format(channel.config.record_format);
  request.set_quality(channel.config.quality);
  request.set_output_dir(output_dir);
  request.set_segment_record(channel.config.segment_record);
  request.set_segment_time_seconds(channel.config.segment_time_seconds);
  request.set_flv_use_direct_download(channel.config.flv_use_direct_download);

  grpc::ClientContext ctx;
  ctx.set_deadline(std::chrono::system_clock::now() + kStartDeadline);
  proto::StartRecordingResponse response;
  const grpc::Status status = stub_->StartRecording(&ctx, request, &response);
  if (!status.ok()) {
    throw std::runtime_error("recorder rpc failed target=" + target_address_ +
                             " message=" + status.error_message());
  }
  if (!response.accepted()) {
    throw std::runtime_error("recorder declined session: " + response.message());
  }

  LogInfo("GrpcStreamRecorder", "SESSION_STARTED")
      .Field("channel", channel.id)
      .Field("session", session->session_id)
      .Field("dir", output_dir);
  return std::make_unique<GrpcRecordingHandle>(std::move(session));
}

}  // namespace livewatch::io
