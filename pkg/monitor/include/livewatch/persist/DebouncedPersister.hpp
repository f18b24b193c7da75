// Repository: LiveWatch
// Component: Debounced persistence writer
// Purpose: Coalesces bursts of save requests into one gateway write per
//          quiet window, on a dedicated writer thread.
// Copyright (c) 2026 LiveWatch

#ifndef LIVEWATCH_PERSIST_DEBOUNCED_PERSISTER_HPP_
#define LIVEWATCH_PERSIST_DEBOUNCED_PERSISTER_HPP_

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "livewatch/model/ChannelTypes.hpp"
#include "livewatch/persist/IPersistenceGateway.hpp"

namespace livewatch::persist {

// Every RequestSave() restarts the debounce window; the writer thread saves
// the snapshot returned by snapshot_fn once the window passes without a new
// request. The snapshot is taken at write time, so one write covers every
// mutation made before it.
//
// A failed write is logged and counted; in-memory state stays authoritative
// and the next request writes the full snapshot again.
class DebouncedPersister {
 public:
  using SnapshotFn = std::function<std::vector<model::ChannelState>()>;

  static constexpr int kDefaultDelayMs = 2000;

  DebouncedPersister(std::shared_ptr<IPersistenceGateway> gateway,
                     SnapshotFn snapshot_fn,
                     std::chrono::milliseconds delay =
                         std::chrono::milliseconds(kDefaultDelayMs));
  // Writes any pending request before returning.
  ~DebouncedPersister();

  DebouncedPersister(const DebouncedPersister&) = delete;
  DebouncedPersister& operator=(const DebouncedPersister&) = delete;

  void RequestSave();

  // Writes immediately if a request is pending. Returns false on failure.
  bool Flush();

  bool HasPending() const;
  uint64_t RequestCount() const { return requests_.load(std::memory_order_relaxed); }
  uint64_t SaveCount() const { return saves_.load(std::memory_order_relaxed); }
  uint64_t FailureCount() const { return failures_.load(std::memory_order_relaxed); }

 private:
  void WriterLoop();
  bool WriteSnapshot();

  std::shared_ptr<IPersistenceGateway> gateway_;
  SnapshotFn snapshot_fn_;
  std::chrono::milliseconds delay_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  bool pending_ = false;
  bool shutdown_ = false;
  std::chrono::steady_clock::time_point deadline_;

  // Serializes gateway writes between Flush() and the writer thread.
  std::mutex write_mutex_;

  std::atomic<uint64_t> requests_{0};
  std::atomic<uint64_t> saves_{0};
  std::atomic<uint64_t> failures_{0};

  std::thread writer_thread_;
};

}  // namespace livewatch::persist

#endif  // LIVEWATCH_PERSIST_DEBOUNCED_PERSISTER_HPP_
