#pragma once

#include <chrono>
#include <mutex>
#include <random>

namespace warden {

// -----------------------------------------------------------------------------
// BackoffPolicy
// -----------------------------------------------------------------------------
// Exponential backoff with symmetric jitter:
//
//   delay(attempt) = min(cap, base * 2^attempt) * U(1 - jitter, 1 + jitter)
//
// attempt is zero-based (the delay before the first retry is ~base). The
// jitter spreads retries from several workers that failed on the same
// outage. Thread-safe; the RNG is guarded by a mutex.
// -----------------------------------------------------------------------------
class BackoffPolicy {
 public:
  BackoffPolicy(std::chrono::milliseconds base, std::chrono::milliseconds cap,
                double jitter_ratio);

  std::chrono::milliseconds delayFor(int attempt);

  // Delay before jitter, for logging and tests.
  std::chrono::milliseconds nominalDelayFor(int attempt) const;

 private:
  const std::chrono::milliseconds base_;
  const std::chrono::milliseconds cap_;
  const double jitter_ratio_;

  std::mutex rng_mutex_;
  std::mt19937 rng_;
};

}  // namespace warden
