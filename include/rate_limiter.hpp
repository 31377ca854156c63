#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <mutex>

namespace mdjobs {

/**
 * Sliding-window admission control shared by concurrent workers.
 *
 * acquire() blocks the caller until a grant fits inside the trailing
 * one-second window, so no more than maxPerSecond grants land in any
 * one-second span. Waiters are served roughly in arrival order.
 */
class RateLimiter {
public:
  static constexpr double kMinRate = 0.1;

  explicit RateLimiter(double maxPerSecond);

  RateLimiter(const RateLimiter &) = delete;
  RateLimiter &operator=(const RateLimiter &) = delete;

  void acquire();

  double maxPerSecond() const { return maxPerSecond_; }
  uint64_t grantedCount() const { return granted_.load(); }

private:
  using Clock = std::chrono::steady_clock;

  const double maxPerSecond_;
  std::mutex mutex_;
  std::deque<Clock::time_point> window_;
  std::atomic<uint64_t> granted_{0};

  void expire(Clock::time_point now);
};

} // namespace mdjobs
