// Repository: LiveWatch
// Component: Stream Recorder Interface
// Purpose: Narrow contract to the capture process. The scheduler owns the
//          session lifecycle decisions; the recorder owns capture mechanics.
// Copyright (c) 2026 LiveWatch

#ifndef LIVEWATCH_IO_ISTREAM_RECORDER_HPP_
#define LIVEWATCH_IO_ISTREAM_RECORDER_HPP_

#include <chrono>
#include <functional>
#include <memory>
#include <string>

#include "livewatch/io/IStreamResolver.hpp"
#include "livewatch/model/ChannelTypes.hpp"

namespace livewatch::io {

// One running capture session.
class IRecordingHandle {
 public:
  virtual ~IRecordingHandle() = default;

  // Cooperative stop request; returns immediately.
  virtual void RequestStop() = 0;

  // True once a stop was requested or the session ended by itself.
  virtual bool ShouldStop() const = 0;

  // Blocks until the session acknowledged the stop or timeout elapsed.
  virtual bool WaitStopped(std::chrono::milliseconds timeout) = 0;
};

class IStreamRecorder {
 public:
  using FinishedCallback = std::function<void(const std::string& channel_id)>;

  virtual ~IStreamRecorder() = default;

  // Starts capturing. on_finished fires once when the session ends for any
  // reason; it is never invoked from inside Start().
  // Throws std::runtime_error when the session could not be started.
  virtual std::unique_ptr<IRecordingHandle> Start(const model::ChannelState& channel,
                                                  const StreamInfo& stream,
                                                  const std::string& output_dir,
                                                  FinishedCallback on_finished) = 0;
};

}  // namespace livewatch::io

#endif  // LIVEWATCH_IO_ISTREAM_RECORDER_HPP_
