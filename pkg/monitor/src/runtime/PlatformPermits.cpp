// Repository: LiveWatch
// Component: Platform Permits
// Copyright (c) 2026 LiveWatch

#include "livewatch/runtime/PlatformPermits.hpp"

#include <stdexcept>

namespace livewatch::runtime {

void PlatformPermits::Semaphore::Acquire() {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait(lock, [this] { return available_ > 0; });
  --available_;
}

void PlatformPermits::Semaphore::Release() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    ++available_;
  }
  cv_.notify_one();
}

int PlatformPermits::Semaphore::Available() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return available_;
}

PlatformPermits::Permit::Permit(std::shared_ptr<Semaphore> semaphore)
    : semaphore_(std::move(semaphore)) {
  semaphore_->Acquire();
}

PlatformPermits::Permit::~Permit() {
  semaphore_->Release();
}

PlatformPermits::PlatformPermits(int max_concurrent) : max_concurrent_(max_concurrent) {
  if (max_concurrent_ <= 0) {
    throw std::invalid_argument("PlatformPermits: max_concurrent must be positive");
  }
}

std::shared_ptr<PlatformPermits::Semaphore> PlatformPermits::SemaphoreFor(
    const std::string& platform_key) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& slot = semaphores_[platform_key];
  if (!slot) {
    slot = std::make_shared<Semaphore>(max_concurrent_);
  }
  return slot;
}

std::unique_ptr<PlatformPermits::Permit> PlatformPermits::Acquire(
    const std::string& platform_key) {
  return std::make_unique<Permit>(SemaphoreFor(platform_key));
}

int PlatformPermits::Available(const std::string& platform_key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = semaphores_.find(platform_key);
  if (it == semaphores_.end()) return max_concurrent_;
  return it->second->Available();
}

}  // namespace livewatch::runtime
