#pragma once

#include "warden/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace warden {

// -----------------------------------------------------------------------------
// SimulationTimeProvider: explicitly driven clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider whose value only changes when a caller sets it.
//
// @details
// Used by the test suite to make time-dependent policy deterministic:
// a test sets the clock, submits a signal stamped 30 s earlier and asserts
// STALE_SIGNAL; or advances past a capability TTL and asserts a re-probe.
//
// Storage is a single std::atomic<int64_t>, so readers on worker threads
// never block the writer. Monotonicity is the caller's responsibility.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;
  explicit SimulationTimeProvider(std::int64_t start_ms)
      : current_time_ms_(start_ms) {}

  std::int64_t now_ms() const override;

  // Sets the clock to an absolute epoch-millisecond value.
  void advance_time(std::int64_t new_time_ms);

  // Moves the clock forward by delta_ms.
  void advance_by(std::int64_t delta_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace warden
