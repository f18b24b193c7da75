// Repository: LiveWatch
// Component: Platform Permits
// Purpose: Per-platform counting semaphores bounding simultaneous outbound
//          probes against one external platform.
// Copyright (c) 2026 LiveWatch

#ifndef LIVEWATCH_RUNTIME_PLATFORM_PERMITS_HPP_
#define LIVEWATCH_RUNTIME_PLATFORM_PERMITS_HPP_

#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace livewatch::runtime {

class PlatformPermits {
 public:
  static constexpr int kDefaultMaxConcurrent = 3;

  class Semaphore {
   public:
    explicit Semaphore(int permits) : available_(permits) {}
    void Acquire();
    void Release();
    int Available() const;

   private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    int available_;
  };

  // Holds one permit for its lifetime.
  class Permit {
   public:
    explicit Permit(std::shared_ptr<Semaphore> semaphore);
    ~Permit();
    Permit(const Permit&) = delete;
    Permit& operator=(const Permit&) = delete;

   private:
    std::shared_ptr<Semaphore> semaphore_;
  };

  explicit PlatformPermits(int max_concurrent = kDefaultMaxConcurrent);

  PlatformPermits(const PlatformPermits&) = delete;
  PlatformPermits& operator=(const PlatformPermits&) = delete;

  // Blocks until a permit for platform_key is free. Semaphores are created
  // on first use.
  std::unique_ptr<Permit> Acquire(const std::string& platform_key);

  // Free permits for platform_key (max_concurrent when never used).
  int Available(const std::string& platform_key) const;
  int max_concurrent() const { return max_concurrent_; }

 private:
  std::shared_ptr<Semaphore> SemaphoreFor(const std::string& platform_key);

  const int max_concurrent_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<Semaphore>> semaphores_;
};

}  // namespace livewatch::runtime

#endif  // LIVEWATCH_RUNTIME_PLATFORM_PERMITS_HPP_
