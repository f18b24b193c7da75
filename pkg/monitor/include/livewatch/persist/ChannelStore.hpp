// Repository: LiveWatch
// Component: Channel Store
// Purpose: File-backed persistence gateway. The whole collection is one
//          protobuf ChannelStoreSnapshot, replaced atomically on each save.
// Copyright (c) 2026 LiveWatch

#ifndef LIVEWATCH_PERSIST_CHANNEL_STORE_HPP_
#define LIVEWATCH_PERSIST_CHANNEL_STORE_HPP_

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include "livewatch/persist/IPersistenceGateway.hpp"

namespace livewatch::persist {

// Save: serialize → <path>.tmp.<pid> → fsync → rename over <path>.
// Load: a missing file is an empty store. A file that does not parse, or
// carries a newer schema, is moved aside to <path>.bak and treated as empty
// so the next save starts clean.
class ChannelStore : public IPersistenceGateway {
 public:
  static constexpr uint32_t kSchemaVersion = 1;

  explicit ChannelStore(std::string path);

  void SaveAll(const std::vector<model::ChannelState>& channels) override;
  std::vector<model::ChannelState> LoadAll() override;

  const std::string& path() const { return path_; }

 private:
  void BackUpCorrupt(const std::string& reason);

  const std::string path_;
  std::mutex mutex_;
};

}  // namespace livewatch::persist

#endif  // LIVEWATCH_PERSIST_CHANNEL_STORE_HPP_
