#ifndef LIVEWATCH_TESTS_FIXTURES_IN_MEMORY_PERSISTENCE_GATEWAY_H_
#define LIVEWATCH_TESTS_FIXTURES_IN_MEMORY_PERSISTENCE_GATEWAY_H_

#include <atomic>
#include <mutex>
#include <stdexcept>
#include <vector>

#include "livewatch/persist/IPersistenceGateway.hpp"

namespace livewatch::tests::fixtures
{

class InMemoryPersistenceGateway : public persist::IPersistenceGateway
{
public:
  void SaveAll(const std::vector<model::ChannelState>& channels) override
  {
    if (fail_saves_.load()) throw std::runtime_error("disk full");
    std::lock_guard<std::mutex> lock(mutex_);
    stored_ = channels;
    save_count_ += 1;
  }

  std::vector<model::ChannelState> LoadAll() override
  {
    std::lock_guard<std::mutex> lock(mutex_);
    return stored_;
  }

  void Seed(std::vector<model::ChannelState> channels)
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stored_ = std::move(channels);
  }

  std::vector<model::ChannelState> Stored() const
  {
    std::lock_guard<std::mutex> lock(mutex_);
    return stored_;
  }

  int SaveCount() const
  {
    std::lock_guard<std::mutex> lock(mutex_);
    return save_count_;
  }

  void SetFailSaves(bool fail) { fail_saves_.store(fail); }

private:
  mutable std::mutex mutex_;
  std::vector<model::ChannelState> stored_;
  int save_count_ = 0;
  std::atomic<bool> fail_saves_{false};
};

}  // namespace livewatch::tests::fixtures

#endif  // LIVEWATCH_TESTS_FIXTURES_IN_MEMORY_PERSISTENCE_GATEWAY_H_
