// Repository: LiveWatch
// Component: Stream Resolver Interface
// Purpose: Turns a channel URL into live/offline status plus stream metadata.
// Copyright (c) 2026 LiveWatch

#ifndef LIVEWATCH_IO_ISTREAM_RESOLVER_HPP_
#define LIVEWATCH_IO_ISTREAM_RESOLVER_HPP_

#include <optional>
#include <string>

namespace livewatch::io {

struct StreamInfo {
  bool is_live = false;
  std::string anchor_name;
  std::string title;
  std::string record_url;
  std::optional<std::string> error;

  // A result the prober may act on: no error and a resolved anchor.
  bool IsComplete() const { return !error.has_value() && !anchor_name.empty(); }
};

// Implementations must be callable concurrently (up to the per-platform
// permit count) and must report an offline channel as a normal result, not
// an error. Transport failures are reported through StreamInfo::error.
class IStreamResolver {
 public:
  virtual ~IStreamResolver() = default;
  virtual StreamInfo Resolve(const std::string& url, const std::string& platform_key) = 0;
};

}  // namespace livewatch::io

#endif  // LIVEWATCH_IO_ISTREAM_RESOLVER_HPP_
