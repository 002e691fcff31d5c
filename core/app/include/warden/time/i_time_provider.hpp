#pragma once

#include <cstdint>

namespace warden {

// -----------------------------------------------------------------------------
// ITimeProvider: injectable wall clock
// -----------------------------------------------------------------------------
//
// @brief  Abstracts "now" for every component that compares timestamps:
//         signal age, symbol cooldowns, capability TTLs, repair windows,
//         feed staleness.
//
// @details
//   - LiveTimeProvider       → std::chrono::system_clock.
//   - SimulationTimeProvider → value set explicitly (tests, replays).
//
// Injecting the clock is what lets tests expire a capability record or
// age a signal past max_signal_age_seconds without sleeping.
//
// Units: epoch milliseconds as std::int64_t, matching the JSON wire format
// of signals, ticks and ledger lines.
//
// Thread-safety contract:
//   Implementations must tolerate concurrent now_ms() from every worker.
//
// Ownership:
//   Components hold a const reference; the provider must outlive them.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // Epoch milliseconds. Pure read, safe from any thread.
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace warden
