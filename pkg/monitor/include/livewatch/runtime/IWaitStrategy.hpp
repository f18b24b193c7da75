// Repository: LiveWatch
// Component: Wait Strategy Interface
// Purpose: Decouple sleeping (jitter, retry delay, heartbeat, debounce) from
//          the scheduling logic.
//          Production: RealtimeWaitStrategy sleeps, interruptible on shutdown.
//          Tests: ImmediateWaitStrategy (records the request, no sleep).
// Copyright (c) 2026 LiveWatch

#ifndef LIVEWATCH_RUNTIME_IWAIT_STRATEGY_HPP_
#define LIVEWATCH_RUNTIME_IWAIT_STRATEGY_HPP_

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace livewatch::runtime {

class IWaitStrategy {
 public:
  // Returns false when the wait was cut short by Interrupt().
  virtual bool SleepFor(std::chrono::milliseconds duration) = 0;
  // Wakes every sleeper; subsequent sleeps return false immediately.
  virtual void Interrupt() = 0;
  virtual ~IWaitStrategy() = default;
};

class RealtimeWaitStrategy : public IWaitStrategy {
 public:
  bool SleepFor(std::chrono::milliseconds duration) override {
    std::unique_lock<std::mutex> lock(mutex_);
    return !cv_.wait_for(lock, duration, [this] { return interrupted_; });
  }

  void Interrupt() override {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      interrupted_ = true;
    }
    cv_.notify_all();
  }

 private:
  std::mutex mutex_;
  std::condition_variable cv_;
  bool interrupted_ = false;
};

}  // namespace livewatch::runtime

#endif  // LIVEWATCH_RUNTIME_IWAIT_STRATEGY_HPP_
