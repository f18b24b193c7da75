// Repository: LiveWatch
// Component: Notifier Interface
// Purpose: Desktop notification and push-message delivery (fire and forget).
// Copyright (c) 2026 LiveWatch

#ifndef LIVEWATCH_IO_INOTIFIER_HPP_
#define LIVEWATCH_IO_INOTIFIER_HPP_

#include <string>

namespace livewatch::io {

// Callers catch and log anything thrown; delivery failures never reach the
// scheduler.
class INotifier {
 public:
  virtual ~INotifier() = default;
  virtual void Notify(const std::string& title, const std::string& message) = 0;
  virtual void PushMessage(const std::string& title, const std::string& body) = 0;
};

}  // namespace livewatch::io

#endif  // LIVEWATCH_IO_INOTIFIER_HPP_
