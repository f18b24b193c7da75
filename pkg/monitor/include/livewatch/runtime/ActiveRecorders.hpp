// Repository: LiveWatch
// Component: Active Recorders
// Purpose: Channel id → owned recording handle, with session tokens so a
//          late completion of an old session never evicts a newer one.
// Copyright (c) 2026 LiveWatch

#ifndef LIVEWATCH_RUNTIME_ACTIVE_RECORDERS_HPP_
#define LIVEWATCH_RUNTIME_ACTIVE_RECORDERS_HPP_

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "livewatch/io/IStreamRecorder.hpp"

namespace livewatch::runtime {

class ActiveRecorders {
 public:
  // Shared so a stop can run on a copy after the table lock is released.
  using HandlePtr = std::shared_ptr<io::IRecordingHandle>;
  // Receives the session token the handle is registered under.
  using Factory = std::function<std::unique_ptr<io::IRecordingHandle>(uint64_t session_token)>;

  ActiveRecorders() = default;
  ActiveRecorders(const ActiveRecorders&) = delete;
  ActiveRecorders& operator=(const ActiveRecorders&) = delete;

  // Reserves the channel's slot, runs factory without holding the table
  // lock and installs the handle it returns. A previous handle that already
  // signalled stop is replaced. Returns the session token, or 0 when a live
  // or pending session holds the slot. Exceptions from factory propagate;
  // the reservation is dropped then.
  //
  // A stop requested while the factory runs is applied to the new handle
  // as soon as it is installed. If the slot was released meanwhile the new
  // handle is stopped and dropped.
  uint64_t Launch(const std::string& channel_id, const Factory& factory);

  bool Contains(const std::string& channel_id) const;

  // A handle exists and has not signalled stop, or a launch is pending.
  bool IsActive(const std::string& channel_id) const;

  // Cooperative stop, issued outside the table lock. False when the slot is
  // empty.
  bool RequestStop(const std::string& channel_id);

  // Unregisters the slot if it still belongs to session_token, pending or
  // installed. False for a stale token.
  bool ReleaseSession(const std::string& channel_id, uint64_t session_token);

  HandlePtr Take(const std::string& channel_id);

  void RequestStopAll();
  std::vector<std::string> Ids() const;
  size_t Size() const;

 private:
  struct Entry {
    uint64_t token = 0;
    HandlePtr handle;
    bool pending = false;
    bool stop_requested = false;
  };

  mutable std::mutex mutex_;
  std::unordered_map<std::string, Entry> entries_;
  uint64_t next_token_ = 1;
};

}  // namespace livewatch::runtime

#endif  // LIVEWATCH_RUNTIME_ACTIVE_RECORDERS_HPP_
