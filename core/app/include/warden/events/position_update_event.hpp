#pragma once

#include "warden/domain/position.hpp"

#include <cstdint>

namespace warden {

// -----------------------------------------------------------------------------
// PositionUpdateEvent
// -----------------------------------------------------------------------------
// Snapshot of a Position after PositionBook applied a change (fill, stop
// placement, state transition). Published for telemetry only; nothing in
// the core reacts to it.
// -----------------------------------------------------------------------------
struct PositionUpdateEvent {
  domain::Position position;
  std::int64_t timestamp_ms{0};
};

}  // namespace warden
