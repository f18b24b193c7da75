// Repository: LiveWatch
// Component: Channel Registry
// Copyright (c) 2026 LiveWatch

#include "livewatch/runtime/ChannelRegistry.hpp"

#include <algorithm>

namespace livewatch::runtime {

ChannelRegistry::ChannelRegistry()
    : channels_(std::make_shared<const std::vector<ChannelPtr>>()) {}

void ChannelRegistry::SetMutationListener(MutationListener listener) {
  std::lock_guard<std::mutex> lock(mutation_mutex_);
  listener_ = std::move(listener);
}

bool ChannelRegistry::Add(ChannelPtr channel) {
  if (!channel) return false;
  {
    std::lock_guard<std::mutex> lock(mutation_mutex_);
    const auto& current = *channels_;
    const bool exists = std::any_of(current.begin(), current.end(),
                                    [&](const ChannelPtr& c) { return c->id() == channel->id(); });
    if (exists) return false;
    auto next = std::make_shared<std::vector<ChannelPtr>>(current);
    next->push_back(std::move(channel));
    channels_ = std::move(next);
  }
  NotifyMutation();
  return true;
}

ChannelRegistry::ChannelPtr ChannelRegistry::Remove(const std::string& id) {
  ChannelPtr removed;
  {
    std::lock_guard<std::mutex> lock(mutation_mutex_);
    auto next = std::make_shared<std::vector<ChannelPtr>>();
    next->reserve(channels_->size());
    for (const auto& c : *channels_) {
      if (!removed && c->id() == id) {
        removed = c;
        continue;
      }
      next->push_back(c);
    }
    if (!removed) return nullptr;
    channels_ = std::move(next);
  }
  NotifyMutation();
  return removed;
}

void ChannelRegistry::Clear() {
  {
    std::lock_guard<std::mutex> lock(mutation_mutex_);
    channels_ = std::make_shared<const std::vector<ChannelPtr>>();
  }
  NotifyMutation();
}

ChannelRegistry::Snapshot ChannelRegistry::All() const {
  std::lock_guard<std::mutex> lock(mutation_mutex_);
  return channels_;
}

ChannelRegistry::ChannelPtr ChannelRegistry::FindById(const std::string& id) const {
  const Snapshot snapshot = All();
  for (const auto& c : *snapshot) {
    if (c->id() == id) return c;
  }
  return nullptr;
}

size_t ChannelRegistry::Size() const {
  return All()->size();
}

std::vector<model::ChannelState> ChannelRegistry::SnapshotStates() const {
  const Snapshot snapshot = All();
  std::vector<model::ChannelState> out;
  out.reserve(snapshot->size());
  for (const auto& c : *snapshot) {
    out.push_back(c->Snapshot());
  }
  return out;
}

void ChannelRegistry::NotifyMutation() {
  MutationListener listener;
  {
    std::lock_guard<std::mutex> lock(mutation_mutex_);
    listener = listener_;
  }
  if (listener) listener();
}

}  // namespace livewatch::runtime
