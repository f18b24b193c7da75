// Repository: LiveWatch
// Component: Logging notifier
// Purpose: INotifier for headless deployments: notifications and push
//          messages become log lines.
// Copyright (c) 2026 LiveWatch

#ifndef LIVEWATCH_IO_LOGGING_NOTIFIER_HPP_
#define LIVEWATCH_IO_LOGGING_NOTIFIER_HPP_

#include <string>

#include "livewatch/io/INotifier.hpp"

namespace livewatch::io {

class LoggingNotifier : public INotifier {
 public:
  void Notify(const std::string& title, const std::string& message) override;
  void PushMessage(const std::string& title, const std::string& body) override;
};

}  // namespace livewatch::io

#endif  // LIVEWATCH_IO_LOGGING_NOTIFIER_HPP_
