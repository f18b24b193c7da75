// Repository: LiveWatch
// Component: Active Recorders
// Copyright (c) 2026 LiveWatch

#include "livewatch/runtime/ActiveRecorders.hpp"

namespace livewatch::runtime {

uint64_t ActiveRecorders::Launch(const std::string& channel_id, const Factory& factory) {
  HandlePtr replaced;
  uint64_t token = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(channel_id);
    if (it != entries_.end()) {
      const Entry& e = it->second;
      if (e.pending || (e.handle && !e.handle->ShouldStop())) return 0;
      replaced = std::move(it->second.handle);
    }
    token = next_token_++;
    Entry reservation;
    reservation.token = token;
    reservation.pending = true;
    entries_[channel_id] = std::move(reservation);
  }
  // Destroyed outside the lock; a handle may join its watcher thread.
  replaced.reset();

  auto release_reservation = [&] {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(channel_id);
    if (it != entries_.end() && it->second.token == token) entries_.erase(it);
  };

  HandlePtr handle;
  try {
    handle = factory(token);
  } catch (...) {
    release_reservation();
    throw;
  }
  if (!handle) {
    release_reservation();
    return 0;
  }

  bool stop_now = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(channel_id);
    if (it == entries_.end() || it->second.token != token) {
      // Taken while the factory ran; the new session has no owner.
      stop_now = true;
    } else {
      it->second.handle = handle;
      it->second.pending = false;
      stop_now = it->second.stop_requested;
    }
  }
  if (stop_now) {
    handle->RequestStop();
  }
  return token;
}

bool ActiveRecorders::Contains(const std::string& channel_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.count(channel_id) != 0;
}

bool ActiveRecorders::IsActive(const std::string& channel_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(channel_id);
  if (it == entries_.end()) return false;
  if (it->second.pending) return !it->second.stop_requested;
  return it->second.handle && !it->second.handle->ShouldStop();
}

bool ActiveRecorders::RequestStop(const std::string& channel_id) {
  HandlePtr handle;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(channel_id);
    if (it == entries_.end()) return false;
    it->second.stop_requested = true;
    handle = it->second.handle;
  }
  // Null while the launch is pending; Launch applies the stop on install.
  if (handle) handle->RequestStop();
  return true;
}

bool ActiveRecorders::ReleaseSession(const std::string& channel_id, uint64_t session_token) {
  HandlePtr released;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(channel_id);
    if (it == entries_.end() || it->second.token != session_token) return false;
    released = std::move(it->second.handle);
    entries_.erase(it);
  }
  return true;
}

ActiveRecorders::HandlePtr ActiveRecorders::Take(const std::string& channel_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(channel_id);
  if (it == entries_.end()) return nullptr;
  HandlePtr handle = std::move(it->second.handle);
  entries_.erase(it);
  return handle;
}

void ActiveRecorders::RequestStopAll() {
  std::vector<HandlePtr> handles;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    handles.reserve(entries_.size());
    for (auto& [id, entry] : entries_) {
      entry.stop_requested = true;
      if (entry.handle) handles.push_back(entry.handle);
    }
  }
  for (const auto& handle : handles) handle->RequestStop();
}

std::vector<std::string> ActiveRecorders::Ids() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> ids;
  ids.reserve(entries_.size());
  for (const auto& [id, entry] : entries_) ids.push_back(id);
  return ids;
}

size_t ActiveRecorders::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

}  // namespace livewatch::runtime
