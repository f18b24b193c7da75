// Repository: LiveWatch
// Component: Update Mailbox Contract Tests
// Purpose: Coalescing, ordering and the bound of the per-stream buffer.
// Copyright (c) 2026 LiveWatch

#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>

#include "control/update_mailbox.h"

using livewatch::control::UpdateMailbox;
using livewatch::runtime::ChannelEvent;
using livewatch::runtime::ChannelEventType;

namespace {

ChannelEvent Event(ChannelEventType type, const std::string& id, const std::string& name = "") {
  ChannelEvent e;
  e.type = type;
  e.state.id = id;
  e.state.config.streamer_name = name;
  return e;
}

}  // namespace

TEST(UpdateMailboxContract, ZeroLimitRejected) {
  EXPECT_THROW(UpdateMailbox(0), std::invalid_argument);
}

TEST(UpdateMailboxContract, UpdatesForOneChannelCoalesceInPlace) {
  UpdateMailbox box;
  box.Push(Event(ChannelEventType::kUpdated, "a", "v1"));
  box.Push(Event(ChannelEventType::kUpdated, "b", "v1"));
  box.Push(Event(ChannelEventType::kUpdated, "a", "v2"));
  box.Push(Event(ChannelEventType::kUpdated, "a", "v3"));

  const auto batch = box.WaitAndDrain(std::chrono::milliseconds(0));
  ASSERT_EQ(batch.size(), 2u);
  EXPECT_EQ(batch[0].state.id, "a");
  EXPECT_EQ(batch[0].state.config.streamer_name, "v3");
  EXPECT_EQ(batch[1].state.id, "b");
  EXPECT_EQ(box.Size(), 0u);
  EXPECT_EQ(box.TakeDropped(), 0u);
}

TEST(UpdateMailboxContract, RemovalIsNeitherMergedNorOvertaken) {
  UpdateMailbox box;
  box.Push(Event(ChannelEventType::kUpdated, "a", "v1"));
  box.Push(Event(ChannelEventType::kRemoved, "a"));
  box.Push(Event(ChannelEventType::kUpdated, "a", "v2"));

  const auto batch = box.WaitAndDrain(std::chrono::milliseconds(0));
  ASSERT_EQ(batch.size(), 3u);
  EXPECT_EQ(batch[0].type, ChannelEventType::kUpdated);
  EXPECT_EQ(batch[0].state.config.streamer_name, "v1");
  EXPECT_EQ(batch[1].type, ChannelEventType::kRemoved);
  EXPECT_EQ(batch[2].state.config.streamer_name, "v2");
}

TEST(UpdateMailboxContract, OverflowDropsOldestAndCountsThem) {
  UpdateMailbox box(3);
  for (int i = 0; i < 5; ++i) {
    box.Push(Event(ChannelEventType::kUpdated, "ch" + std::to_string(i)));
  }
  EXPECT_EQ(box.Size(), 3u);
  EXPECT_EQ(box.TakeDropped(), 2u);
  EXPECT_EQ(box.TakeDropped(), 0u);

  const auto batch = box.WaitAndDrain(std::chrono::milliseconds(0));
  ASSERT_EQ(batch.size(), 3u);
  EXPECT_EQ(batch.front().state.id, "ch2");
  EXPECT_EQ(batch.back().state.id, "ch4");
}

TEST(UpdateMailboxContract, WaitReturnsEmptyOnTimeout) {
  UpdateMailbox box;
  const auto start = std::chrono::steady_clock::now();
  EXPECT_TRUE(box.WaitAndDrain(std::chrono::milliseconds(30)).empty());
  EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(25));
}

TEST(UpdateMailboxContract, PushWakesWaitingReader) {
  UpdateMailbox box;
  std::thread writer([&] {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    box.Push(Event(ChannelEventType::kUpdated, "a"));
  });
  const auto batch = box.WaitAndDrain(std::chrono::seconds(5));
  writer.join();
  ASSERT_EQ(batch.size(), 1u);
  EXPECT_EQ(batch[0].state.id, "a");
}
