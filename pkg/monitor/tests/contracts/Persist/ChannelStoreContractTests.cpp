// Repository: LiveWatch
// Component: Channel Store Contract Tests
// Purpose: File-backed snapshot save/load, missing and corrupt stores, and
//          the record codec boundaries.
// Copyright (c) 2026 LiveWatch

#include <gtest/gtest.h>

#include <dirent.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cstdlib>
#include <fstream>
#include <string>

#include "livewatch/persist/ChannelStore.hpp"
#include "persist/ChannelRecordCodec.hpp"

using namespace livewatch;
using livewatch::model::ChannelState;
using livewatch::persist::ChannelStore;

namespace {

class ChannelStoreContractTest : public ::testing::Test {
 protected:
  void SetUp() override {
    char tmpl[] = "/tmp/livewatch_store_XXXXXX";
    char* dir = mkdtemp(tmpl);
    ASSERT_NE(dir, nullptr);
    dir_ = dir;
    path_ = dir_ + "/channels.pb";
  }

  void TearDown() override {
    if (DIR* d = opendir(dir_.c_str())) {
      while (dirent* entry = readdir(d)) {
        const std::string name = entry->d_name;
        if (name == "." || name == "..") continue;
        unlink((dir_ + "/" + name).c_str());
      }
      closedir(d);
    }
    rmdir(dir_.c_str());
  }

  static bool Exists(const std::string& path) {
    struct stat st {};
    return stat(path.c_str(), &st) == 0;
  }

  int FileCount() const {
    int count = 0;
    if (DIR* d = opendir(dir_.c_str())) {
      while (dirent* entry = readdir(d)) {
        const std::string name = entry->d_name;
        if (name != "." && name != "..") ++count;
      }
      closedir(d);
    }
    return count;
  }

  static ChannelState Sample() {
    ChannelState s;
    s.id = "3f1c";
    s.url = "https://live.example.com/room";
    s.platform = "live.example.com";
    s.platform_key = "live.example.com";
    s.config.streamer_name = "Night Owl";
    s.config.quality = "HD";
    s.config.scheduled_recording = true;
    s.config.scheduled_start_time = "20:00";
    s.config.monitor_hours = "3";
    s.config.enabled_message_push = true;
    s.stats.priority_score = 0.42;
    s.stats.historical_intervals[2] = {19, 20};
    s.stats.historical_intervals[6] = {22};
    s.stats.last_seen_live_ms = 1704153600000LL;
    s.stats.consistency_score = 0.3;
    s.stats.live_check_count = 17;
    s.stats.live_found_count = 5;
    s.added_at = "2024-01-01 10:00:00";
    s.last_active_at = "2024-01-02 20:15:00";
    s.last_duration_ms = 5'400'000;
    s.is_recording = true;
    s.status = model::ChannelStatus::kRecording;
    return s;
  }

  std::string dir_;
  std::string path_;
};

}  // namespace

TEST_F(ChannelStoreContractTest, MissingFileIsEmptyStore) {
  ChannelStore store(path_);
  EXPECT_TRUE(store.LoadAll().empty());
}

TEST_F(ChannelStoreContractTest, SaveThenLoadKeepsPersistentFields) {
  ChannelStore store(path_);
  store.SaveAll({Sample()});

  const auto loaded = ChannelStore(path_).LoadAll();
  ASSERT_EQ(loaded.size(), 1u);
  const ChannelState& s = loaded[0];
  EXPECT_EQ(s.id, "3f1c");
  EXPECT_EQ(s.url, "https://live.example.com/room");
  EXPECT_EQ(s.platform_key, "live.example.com");
  EXPECT_EQ(s.config.streamer_name, "Night Owl");
  EXPECT_EQ(s.config.quality, "HD");
  EXPECT_TRUE(s.config.scheduled_recording);
  EXPECT_EQ(s.config.scheduled_start_time, "20:00");
  EXPECT_TRUE(s.config.enabled_message_push);
  EXPECT_DOUBLE_EQ(s.stats.priority_score, 0.42);
  EXPECT_EQ(s.stats.historical_intervals.at(2), std::vector<int>({19, 20}));
  EXPECT_EQ(s.stats.historical_intervals.at(6), std::vector<int>({22}));
  ASSERT_TRUE(s.stats.last_seen_live_ms.has_value());
  EXPECT_EQ(*s.stats.last_seen_live_ms, 1704153600000LL);
  EXPECT_EQ(s.stats.live_check_count, 17);
  EXPECT_EQ(s.added_at, "2024-01-01 10:00:00");
  EXPECT_EQ(s.last_duration_ms, 5'400'000);

  // Runtime flags are never persisted.
  EXPECT_FALSE(s.is_recording);
  EXPECT_EQ(s.status, model::ChannelStatus::kIdle);
}

TEST_F(ChannelStoreContractTest, SaveReplacesWholeCollection) {
  ChannelStore store(path_);
  ChannelState a = Sample();
  ChannelState b = Sample();
  b.id = "other";
  store.SaveAll({a, b});
  store.SaveAll({b});

  const auto loaded = store.LoadAll();
  ASSERT_EQ(loaded.size(), 1u);
  EXPECT_EQ(loaded[0].id, "other");
  // No temporary file is left next to the store.
  EXPECT_EQ(FileCount(), 1);
}

TEST_F(ChannelStoreContractTest, CorruptFileIsMovedAside) {
  {
    std::ofstream out(path_, std::ios::binary);
    out << "\xff\xff\xff\xff not a snapshot";
  }
  ChannelStore store(path_);
  EXPECT_TRUE(store.LoadAll().empty());
  EXPECT_FALSE(Exists(path_));
  EXPECT_TRUE(Exists(path_ + ".bak"));

  store.SaveAll({Sample()});
  EXPECT_EQ(store.LoadAll().size(), 1u);
}

TEST_F(ChannelStoreContractTest, UnwritableLocationThrows) {
  ChannelStore store(dir_ + "/missing/channels.pb");
  EXPECT_THROW(store.SaveAll({Sample()}), std::runtime_error);
}

TEST_F(ChannelStoreContractTest, EmptyPathIsRejected) {
  EXPECT_THROW(ChannelStore(""), std::invalid_argument);
}

TEST(ChannelRecordCodecContract, OutOfRangeHistoryIsDropped) {
  livewatch::v1::ChannelRecord record;
  record.set_id("c");
  record.set_url("u");
  auto& intervals = *record.mutable_stats()->mutable_historical_intervals();
  intervals[9].add_hours(10);
  intervals[1].add_hours(25);
  intervals[1].add_hours(7);
  for (int h = 0; h < 7; ++h) intervals[3].add_hours(h);

  const ChannelState s = persist::FromRecord(record);
  EXPECT_EQ(s.stats.historical_intervals.count(9), 0u);
  EXPECT_EQ(s.stats.historical_intervals.at(1), std::vector<int>({7}));
  EXPECT_EQ(s.stats.historical_intervals.at(3), std::vector<int>({2, 3, 4, 5, 6}));
}

TEST(ChannelRecordCodecContract, EmptyConfigFieldsKeepDefaults) {
  livewatch::v1::ChannelConfig proto;
  const model::ChannelConfig c = persist::FromProtoConfig(proto);
  EXPECT_EQ(c.record_format, "ts");
  EXPECT_EQ(c.quality, "OD");
  EXPECT_EQ(c.segment_time_seconds, 1800);
}
