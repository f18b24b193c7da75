// Repository: LiveWatch
// Component: Channel Registry
// Purpose: The shared collection of monitored channels. Structural changes
//          are serialized; readers iterate an immutable snapshot.
// Copyright (c) 2026 LiveWatch

#ifndef LIVEWATCH_RUNTIME_CHANNEL_REGISTRY_HPP_
#define LIVEWATCH_RUNTIME_CHANNEL_REGISTRY_HPP_

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "livewatch/model/Channel.hpp"

namespace livewatch::runtime {

// Copy-on-write list of channels. Add/Remove/Clear build a new vector under
// mutation_mutex_ and swap it in; All() hands out the current vector, which
// is never modified afterwards.
//
// Every structural mutation invokes the mutation listener (normally
// DebouncedPersister::RequestSave) after the swap.
class ChannelRegistry {
 public:
  using ChannelPtr = std::shared_ptr<model::Channel>;
  using Snapshot = std::shared_ptr<const std::vector<ChannelPtr>>;
  using MutationListener = std::function<void()>;

  ChannelRegistry();

  ChannelRegistry(const ChannelRegistry&) = delete;
  ChannelRegistry& operator=(const ChannelRegistry&) = delete;

  void SetMutationListener(MutationListener listener);

  // Returns false (and changes nothing) when the id is already registered.
  bool Add(ChannelPtr channel);

  // Returns the removed channel, or nullptr if the id was unknown.
  ChannelPtr Remove(const std::string& id);

  void Clear();

  Snapshot All() const;
  ChannelPtr FindById(const std::string& id) const;
  size_t Size() const;

  // Value copies of every channel, for persistence and listing.
  std::vector<model::ChannelState> SnapshotStates() const;

 private:
  void NotifyMutation();

  mutable std::mutex mutation_mutex_;
  Snapshot channels_;
  MutationListener listener_;
};

}  // namespace livewatch::runtime

#endif  // LIVEWATCH_RUNTIME_CHANNEL_REGISTRY_HPP_
