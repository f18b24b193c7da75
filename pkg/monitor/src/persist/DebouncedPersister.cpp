// Repository: LiveWatch
// Component: Debounced persistence writer
// Copyright (c) 2026 LiveWatch

#include "livewatch/persist/DebouncedPersister.hpp"

#include <stdexcept>

#include "livewatch/util/Logger.hpp"

namespace livewatch::persist {

using livewatch::util::LogDebug;
using livewatch::util::LogError;

DebouncedPersister::DebouncedPersister(std::shared_ptr<IPersistenceGateway> gateway,
                                       SnapshotFn snapshot_fn,
                                       std::chrono::milliseconds delay)
    : gateway_(std::move(gateway)),
      snapshot_fn_(std::move(snapshot_fn)),
      delay_(delay),
      deadline_(std::chrono::steady_clock::now()) {
  if (!gateway_ || !snapshot_fn_) {
    throw std::invalid_argument("DebouncedPersister: gateway and snapshot source are required");
  }
  writer_thread_ = std::thread(&DebouncedPersister::WriterLoop, this);
}

DebouncedPersister::~DebouncedPersister() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
  if (writer_thread_.joinable()) {
    writer_thread_.join();
  }
  Flush();
}

void DebouncedPersister::RequestSave() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_ = true;
    deadline_ = std::chrono::steady_clock::now() + delay_;
  }
  requests_.fetch_add(1, std::memory_order_relaxed);
  cv_.notify_all();
}

bool DebouncedPersister::HasPending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_;
}

bool DebouncedPersister::Flush() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!pending_) return true;
    pending_ = false;
  }
  return WriteSnapshot();
}

void DebouncedPersister::WriterLoop() {
  std::unique_lock<std::mutex> lock(mutex_);
  while (true) {
    cv_.wait(lock, [this] { return shutdown_ || pending_; });
    if (shutdown_) break;

    // Quiet window: every RequestSave() pushes deadline_ forward.
    while (!shutdown_ && pending_ && std::chrono::steady_clock::now() < deadline_) {
      cv_.wait_until(lock, deadline_);
    }
    if (shutdown_) break;
    if (!pending_) continue;  // Flushed while waiting.

    pending_ = false;
    lock.unlock();
    WriteSnapshot();
    lock.lock();
  }
}

bool DebouncedPersister::WriteSnapshot() {
  std::lock_guard<std::mutex> write_lock(write_mutex_);
  try {
    const auto snapshot = snapshot_fn_();
    gateway_->SaveAll(snapshot);
    saves_.fetch_add(1, std::memory_order_relaxed);
    LogDebug("Persist", "SAVED").Field("channels", snapshot.size());
    return true;
  } catch (const std::exception& e) {
    failures_.fetch_add(1, std::memory_order_relaxed);
    LogError("Persist", "SAVE_FAILED").Field("error", e.what());
    return false;
  } catch (...) {
    failures_.fetch_add(1, std::memory_order_relaxed);
    LogError("Persist", "SAVE_FAILED").Field("error", "unknown");
    return false;
  }
}

}  // namespace livewatch::persist
