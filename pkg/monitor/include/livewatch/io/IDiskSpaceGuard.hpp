// Repository: LiveWatch
// Component: Disk-space Guard Interface
// Copyright (c) 2026 LiveWatch

#ifndef LIVEWATCH_IO_IDISK_SPACE_GUARD_HPP_
#define LIVEWATCH_IO_IDISK_SPACE_GUARD_HPP_

#include <string>

namespace livewatch::io {

class IDiskSpaceGuard {
 public:
  virtual ~IDiskSpaceGuard() = default;
  // True when the free space at path is below threshold_gb gigabytes.
  virtual bool FreeSpaceBelow(double threshold_gb, const std::string& path) = 0;
};

}  // namespace livewatch::io

#endif  // LIVEWATCH_IO_IDISK_SPACE_GUARD_HPP_
