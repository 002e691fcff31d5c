#include "warden/exchange/backoff_policy.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>

namespace warden {

BackoffPolicy::BackoffPolicy(std::chrono::milliseconds base,
                             std::chrono::milliseconds cap,
                             double jitter_ratio)
    : base_(base),
      cap_(cap),
      jitter_ratio_(std::clamp(jitter_ratio, 0.0, 1.0)),
      rng_(std::random_device{}()) {}

std::chrono::milliseconds BackoffPolicy::nominalDelayFor(int attempt) const {
  double scaled = static_cast<double>(base_.count()) *
                  std::pow(2.0, static_cast<double>(std::max(attempt, 0)));
  double capped = std::min(scaled, static_cast<double>(cap_.count()));
  return std::chrono::milliseconds(static_cast<std::int64_t>(capped));
}

std::chrono::milliseconds BackoffPolicy::delayFor(int attempt) {
  double nominal = static_cast<double>(nominalDelayFor(attempt).count());
  if (jitter_ratio_ <= 0.0) {
    return std::chrono::milliseconds(static_cast<std::int64_t>(nominal));
  }

  double factor = 1.0;
  {
    std::lock_guard lock(rng_mutex_);
    std::uniform_real_distribution<double> dist(1.0 - jitter_ratio_,
                                                1.0 + jitter_ratio_);
    factor = dist(rng_);
  }
  return std::chrono::milliseconds(
      static_cast<std::int64_t>(std::llround(nominal * factor)));
}

}  // namespace warden
