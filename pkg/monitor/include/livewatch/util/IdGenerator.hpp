// Repository: LiveWatch
// Component: Id Generator
// Purpose: Channel and recording-session identifiers.
// Copyright (c) 2026 LiveWatch

#ifndef LIVEWATCH_UTIL_ID_GENERATOR_HPP_
#define LIVEWATCH_UTIL_ID_GENERATOR_HPP_

#include <cstdint>
#include <mutex>
#include <random>
#include <string>

namespace livewatch::util {

// Produces random (version 4) UUIDs, lowercase hex with dashes. Two
// generators built from the same seed yield the same sequence. Safe to share
// between threads.
class IdGenerator {
 public:
  // Seeded from std::random_device.
  IdGenerator();
  explicit IdGenerator(uint64_t seed);

  IdGenerator(const IdGenerator&) = delete;
  IdGenerator& operator=(const IdGenerator&) = delete;

  std::string NextUuid();

  static bool IsUuid(const std::string& text);

 private:
  std::mutex mutex_;
  std::mt19937_64 engine_;
};

}  // namespace livewatch::util

#endif  // LIVEWATCH_UTIL_ID_GENERATOR_HPP_
