// Repository: LiveWatch
// Component: Persistence Gateway Interface
// Purpose: Whole-collection save/load of channel records keyed by channel id.
// Copyright (c) 2026 LiveWatch

#ifndef LIVEWATCH_PERSIST_IPERSISTENCE_GATEWAY_HPP_
#define LIVEWATCH_PERSIST_IPERSISTENCE_GATEWAY_HPP_

#include <vector>

#include "livewatch/model/ChannelTypes.hpp"

namespace livewatch::persist {

// SaveAll must be atomic (a crash never exposes a partial write) and
// idempotent (saving the same snapshot twice yields the same store).
// Both operations throw std::runtime_error on backend failure.
class IPersistenceGateway {
 public:
  virtual ~IPersistenceGateway() = default;
  virtual void SaveAll(const std::vector<model::ChannelState>& channels) = 0;
  virtual std::vector<model::ChannelState> LoadAll() = 0;
};

}  // namespace livewatch::persist

#endif  // LIVEWATCH_PERSIST_IPERSISTENCE_GATEWAY_HPP_
