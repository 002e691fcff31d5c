#pragma once

#include "warden/domain/signal_intent.hpp"

namespace warden {

// -----------------------------------------------------------------------------
// SignalEvent
// -----------------------------------------------------------------------------
// Carries one validated SignalEnvelope from the ingestion boundary
// (SignalGateway, tests) into the signal loop. WardenEngine's subscriber on
// that loop performs the idempotency lookup, risk evaluation and plan
// submission, so all inbound signals are serialized on one thread.
// -----------------------------------------------------------------------------
struct SignalEvent {
  domain::SignalEnvelope envelope;
};

}  // namespace warden
