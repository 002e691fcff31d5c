#include "warden/exchange/token_bucket.hpp"

#include <algorithm>
#include <thread>

namespace warden {

namespace {

constexpr auto kMinWait = std::chrono::milliseconds(1);

}  // namespace

TokenBucket::TokenBucket(double rate_per_second, double capacity)
    : rate_per_second_(std::max(rate_per_second, 0.1)),
      capacity_(std::max(capacity, 1.0)),
      tokens_(std::max(capacity, 1.0)),
      last_refill_(Clock::now()) {}

std::chrono::milliseconds TokenBucket::acquire() {
  const auto started = Clock::now();

  while (true) {
    std::chrono::duration<double> wait{0.0};
    {
      std::lock_guard lock(mutex_);
      refill(Clock::now());
      if (tokens_ >= 1.0) {
        tokens_ -= 1.0;
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            Clock::now() - started);
      }
      wait = std::chrono::duration<double>((1.0 - tokens_) / rate_per_second_);
    }
    std::this_thread::sleep_for(
        std::max<std::chrono::milliseconds>(
            std::chrono::duration_cast<std::chrono::milliseconds>(wait),
            kMinWait));
  }
}

bool TokenBucket::tryAcquire() {
  std::lock_guard lock(mutex_);
  refill(Clock::now());
  if (tokens_ >= 1.0) {
    tokens_ -= 1.0;
    return true;
  }
  return false;
}

double TokenBucket::available() {
  std::lock_guard lock(mutex_);
  refill(Clock::now());
  return tokens_;
}

void TokenBucket::refill(Clock::time_point now) {
  std::chrono::duration<double> elapsed = now - last_refill_;
  last_refill_ = now;
  tokens_ = std::min(capacity_, tokens_ + elapsed.count() * rate_per_second_);
}

}  // namespace warden
