// Repository: LiveWatch
// Component: Disk Space Gate
// Copyright (c) 2026 LiveWatch

#include "livewatch/runtime/DiskSpaceGate.hpp"


#include "livewatch/util/Logger.hpp"

namespace livewatch::runtime {

using livewatch::util::LogInfo;
using livewatch::util::LogWarn;
using livewatch::util::LogError;

DiskSpaceGate::DiskSpaceGate(std::shared_ptr<io::IDiskSpaceGuard> guard,
                             double threshold_gb,
                             std::string path)
    : guard_(std::move(guard)), threshold_gb_(threshold_gb), path_(std::move(path)) {}

bool DiskSpaceGate::Refresh() {
  if (!guard_) return RecordingEnabled();

  bool below = false;
  try {
    below = guard_->FreeSpaceBelow(threshold_gb_, path_);
  } catch (const std::exception& e) {
    LogWarn("DiskSpaceGate", "GUARD_FAILED").Field("error", e.what());
    return RecordingEnabled();
  }

  const bool enabled = !below;
  const bool was_enabled = enabled_.exchange(enabled, std::memory_order_acq_rel);
  if (was_enabled && !enabled) {
    LogError("DiskSpaceGate", "RECORDING_DISABLED").Field("path", path_).Field("below_gb", threshold_gb_);
  } else if (!was_enabled && enabled) {
    LogInfo("DiskSpaceGate", "RECORDING_ENABLED").Field("path", path_);
  }
  return enabled;
}

}  // namespace livewatch::runtime
