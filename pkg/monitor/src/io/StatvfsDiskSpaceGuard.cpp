// Repository: LiveWatch
// Component: statvfs disk-space guard
// Copyright (c) 2026 LiveWatch

#include "livewatch/io/StatvfsDiskSpaceGuard.hpp"

#include <sys/statvfs.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>

namespace livewatch::io {

double StatvfsDiskSpaceGuard::FreeGigabytes(const std::string& path) {
  struct statvfs st {};
  if (::statvfs(path.c_str(), &st) != 0) {
    throw std::runtime_error("statvfs(" + path + ") failed: " + std::strerror(errno));
  }
  const double bytes = static_cast<double>(st.f_bavail) * static_cast<double>(st.f_frsize);
  return bytes / (1024.0 * 1024.0 * 1024.0);
}

bool StatvfsDiskSpaceGuard::FreeSpaceBelow(double threshold_gb, const std::string& path) {
  if (threshold_gb <= 0.0) return false;
  return FreeGigabytes(path) < threshold_gb;
}

}  // namespace livewatch::io
