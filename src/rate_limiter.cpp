#include "rate_limiter.hpp"
#include <algorithm>
#include <thread>

namespace mdjobs {

namespace {
constexpr auto kWindow = std::chrono::seconds(1);
}

RateLimiter::RateLimiter(double maxPerSecond)
    : maxPerSecond_(std::max(kMinRate, maxPerSecond)) {}

void RateLimiter::expire(Clock::time_point now) {
  while (!window_.empty() && now - window_.front() >= kWindow) {
    window_.pop_front();
  }
}

void RateLimiter::acquire() {
  // Held across the sleep: later callers queue behind the current waiter
  std::lock_guard<std::mutex> lock(mutex_);

  auto now = Clock::now();
  expire(now);
  while (static_cast<double>(window_.size()) >= maxPerSecond_) {
    std::this_thread::sleep_until(window_.front() + kWindow);
    now = Clock::now();
    expire(now);
  }

  window_.push_back(Clock::now());
  granted_++;
}

} // namespace mdjobs
