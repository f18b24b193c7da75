// Repository: LiveWatch
// Component: Channel Store
// Copyright (c) 2026 LiveWatch

#include "livewatch/persist/ChannelStore.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include "livewatch/util/Logger.hpp"
#include "monitor.pb.h"
#include "persist/ChannelRecordCodec.hpp"

namespace livewatch::persist {

using livewatch::util::LogInfo;
using livewatch::util::LogWarn;
using livewatch::util::LogError;

namespace {

std::runtime_error IoError(const std::string& what, const std::string& path) {
  return std::runtime_error("ChannelStore: " + what + " " + path + ": " + std::strerror(errno));
}

}  // namespace

ChannelStore::ChannelStore(std::string path) : path_(std::move(path)) {
  if (path_.empty()) {
    throw std::invalid_argument("ChannelStore: path must not be empty");
  }
}

void ChannelStore::SaveAll(const std::vector<model::ChannelState>& channels) {
  livewatch::v1::ChannelStoreSnapshot snapshot;
  snapshot.set_schema_version(kSchemaVersion);
  for (const auto& state : channels) {
    *snapshot.add_channels() = ToRecord(state);
  }
  std::string bytes;
  if (!snapshot.SerializeToString(&bytes)) {
    throw std::runtime_error("ChannelStore: snapshot serialization failed");
  }

  std::lock_guard<std::mutex> lock(mutex_);
  const std::string tmp_path =
      path_ + ".tmp." + std::to_string(static_cast<unsigned long>(getpid()));

  const int fd = ::open(tmp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
  if (fd < 0) throw IoError("cannot create", tmp_path);

  size_t written = 0;
  while (written < bytes.size()) {
    const ssize_t n = ::write(fd, bytes.data() + written, bytes.size() - written);
    if (n < 0) {
      if (errno == EINTR) continue;
      const auto err = IoError("write failed", tmp_path);
      ::close(fd);
      ::unlink(tmp_path.c_str());
      throw err;
    }
    written += static_cast<size_t>(n);
  }
  if (::fsync(fd) != 0) {
    const auto err = IoError("fsync failed", tmp_path);
    ::close(fd);
    ::unlink(tmp_path.c_str());
    throw err;
  }
  if (::close(fd) != 0) {
    const auto err = IoError("close failed", tmp_path);
    ::unlink(tmp_path.c_str());
    throw err;
  }
  if (std::rename(tmp_path.c_str(), path_.c_str()) != 0) {
    const auto err = IoError("rename failed", path_);
    ::unlink(tmp_path.c_str());
    throw err;
  }
}

std::vector<model::ChannelState> ChannelStore::LoadAll() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<model::ChannelState> out;

  if (::access(path_.c_str(), F_OK) != 0 && errno == ENOENT) {
    LogInfo("ChannelStore", "NO_STORE").Field("path", path_);
    return out;
  }
  std::ifstream in(path_, std::ios::binary);
  if (!in) {
    throw IoError("cannot open", path_);
  }

  livewatch::v1::ChannelStoreSnapshot snapshot;
  if (!snapshot.ParseFromIstream(&in)) {
    in.close();
    BackUpCorrupt("unparsable snapshot");
    return out;
  }
  in.close();
  if (snapshot.schema_version() > kSchemaVersion) {
    std::ostringstream reason;
    reason << "unsupported schema_version=" << snapshot.schema_version();
    BackUpCorrupt(reason.str());
    return out;
  }

  out.reserve(static_cast<size_t>(snapshot.channels_size()));
  for (const auto& record : snapshot.channels()) {
    if (record.id().empty() || record.url().empty()) {
      LogWarn("ChannelStore", "SKIP_RECORD").Field("reason", "missing_id_or_url");
      continue;
    }
    out.push_back(FromRecord(record));
  }

  LogInfo("ChannelStore", "LOADED").Field("path", path_).Field("channels", out.size());
  return out;
}

void ChannelStore::BackUpCorrupt(const std::string& reason) {
  const std::string backup = path_ + ".bak";
  if (std::rename(path_.c_str(), backup.c_str()) != 0) {
    throw IoError("cannot back up corrupt store", path_);
  }
  LogError("ChannelStore", "CORRUPT_STORE")
      .Field("path", path_)
      .Field("reason", reason)
      .Field("backup", backup);
}

}  // namespace livewatch::persist
