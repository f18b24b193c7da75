// Repository: LiveWatch
// Component: Disk Space Gate
// Purpose: Global switch that suspends new recording sessions while the
//          recording volume is below the free-space threshold.
// Copyright (c) 2026 LiveWatch

#ifndef LIVEWATCH_RUNTIME_DISK_SPACE_GATE_HPP_
#define LIVEWATCH_RUNTIME_DISK_SPACE_GATE_HPP_

#include <atomic>
#include <memory>
#include <string>

#include "livewatch/io/IDiskSpaceGuard.hpp"

namespace livewatch::runtime {

// Existing sessions are unaffected; only session starts consult the gate.
// Probing continues while the gate is closed.
class DiskSpaceGate {
 public:
  DiskSpaceGate(std::shared_ptr<io::IDiskSpaceGuard> guard,
                double threshold_gb,
                std::string path);

  // Re-evaluates the guard. Returns the new RecordingEnabled() value.
  // A guard that throws leaves the gate as it was.
  bool Refresh();

  bool RecordingEnabled() const { return enabled_.load(std::memory_order_acquire); }

 private:
  std::shared_ptr<io::IDiskSpaceGuard> guard_;
  const double threshold_gb_;
  const std::string path_;
  std::atomic<bool> enabled_{true};
};

}  // namespace livewatch::runtime

#endif  // LIVEWATCH_RUNTIME_DISK_SPACE_GATE_HPP_
