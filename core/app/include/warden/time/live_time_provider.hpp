#pragma once

#include "warden/time/i_time_provider.hpp"

namespace warden {

// -----------------------------------------------------------------------------
// LiveTimeProvider
// -----------------------------------------------------------------------------
// Production clock: system_clock converted to epoch milliseconds. Stateless,
// so one instance can be shared by every component of the engine.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace warden
