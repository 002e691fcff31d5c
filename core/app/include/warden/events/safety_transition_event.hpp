#pragma once

#include "warden/domain/safety_state.hpp"

namespace warden {

// -----------------------------------------------------------------------------
// SafetyTransitionEvent
// -----------------------------------------------------------------------------
// One recorded SafetySupervisor transition. The same value is appended to
// the ledger, so telemetry subscribers and the audit trail see identical
// version numbers.
// -----------------------------------------------------------------------------
struct SafetyTransitionEvent {
  domain::SafetyTransition transition;
};

}  // namespace warden
