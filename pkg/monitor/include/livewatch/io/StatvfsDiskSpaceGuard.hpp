// Repository: LiveWatch
// Component: statvfs disk-space guard
// Copyright (c) 2026 LiveWatch

#ifndef LIVEWATCH_IO_STATVFS_DISK_SPACE_GUARD_HPP_
#define LIVEWATCH_IO_STATVFS_DISK_SPACE_GUARD_HPP_

#include <string>

#include "livewatch/io/IDiskSpaceGuard.hpp"

namespace livewatch::io {

// Free space available to unprivileged writers (f_bavail). A threshold of
// zero or less never reports low space. Throws std::runtime_error when
// statvfs fails.
class StatvfsDiskSpaceGuard : public IDiskSpaceGuard {
 public:
  bool FreeSpaceBelow(double threshold_gb, const std::string& path) override;

  static double FreeGigabytes(const std::string& path);
};

}  // namespace livewatch::io

#endif  // LIVEWATCH_IO_STATVFS_DISK_SPACE_GUARD_HPP_
