#pragma once

#include <chrono>
#include <mutex>

namespace warden {

// -----------------------------------------------------------------------------
// TokenBucket
// -----------------------------------------------------------------------------
//
// @brief  Request-rate limiter shared by every exchange call.
//
// @details
// Holds up to `capacity` tokens and refills at `rate_per_second`. acquire()
// takes one token, sleeping until one is available. The mutex is held only
// to refill and take; the sleep happens unlocked, so several workers waiting
// for tokens do not serialize on the lock.
//
// tryAcquire() is the non-blocking form used by tests and by callers that
// prefer to skip a low-priority call rather than wait.
// -----------------------------------------------------------------------------
class TokenBucket {
 public:
  using Clock = std::chrono::steady_clock;

  TokenBucket(double rate_per_second, double capacity);

  TokenBucket(const TokenBucket&) = delete;
  TokenBucket& operator=(const TokenBucket&) = delete;

  // Blocks until a token is taken. Returns how long the caller waited.
  std::chrono::milliseconds acquire();

  bool tryAcquire();

  // Tokens currently available after refill (snapshot).
  double available();

 private:
  void refill(Clock::time_point now);

  const double rate_per_second_;
  const double capacity_;

  std::mutex mutex_;
  double tokens_;
  Clock::time_point last_refill_;
};

}  // namespace warden
