// Repository: LiveWatch
// Component: Id Generator
// Copyright (c) 2026 LiveWatch

#include "livewatch/util/IdGenerator.hpp"

#include <cstdio>

namespace livewatch::util {

namespace {

uint64_t DeviceSeed() {
  std::random_device rd;
  return (static_cast<uint64_t>(rd()) << 32) ^ rd();
}

bool IsLowerHex(char c) {
  return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
}

}  // namespace

IdGenerator::IdGenerator() : engine_(DeviceSeed()) {}

IdGenerator::IdGenerator(uint64_t seed) : engine_(seed) {}

std::string IdGenerator::NextUuid() {
  uint64_t hi = 0;
  uint64_t lo = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    hi = engine_();
    lo = engine_();
  }
  // Version nibble 4, variant bits 10.
  hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
  lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

  char buf[37];
  std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
                static_cast<unsigned>(hi >> 32),
                static_cast<unsigned>((hi >> 16) & 0xFFFF),
                static_cast<unsigned>(hi & 0xFFFF),
                static_cast<unsigned>(lo >> 48),
                static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
  return buf;
}

bool IdGenerator::IsUuid(const std::string& text) {
  if (text.size() != 36) return false;
  for (size_t i = 0; i < text.size(); ++i) {
    const bool dash = i == 8 || i == 13 || i == 18 || i == 23;
    if (dash ? text[i] != '-' : !IsLowerHex(text[i])) return false;
  }
  return text[14] == '4' && (text[19] == '8' || text[19] == '9' || text[19] == 'a' ||
                             text[19] == 'b');
}

}  // namespace livewatch::util
