#pragma once

namespace warden {
namespace domain {

// -----------------------------------------------------------------------------
// OrderStatus: single-order lifecycle
// -----------------------------------------------------------------------------
//
// @brief  Enumerates every state an exchange order can occupy as seen by
//         the engine.
//
// @details
// Legal transitions (enforced by OrderTracker::transitionStatus):
//
//   New ──> Submitted ──> Accepted ──> PartiallyFilled ──> Filled
//    │          │            │              │    ▲
//    │          ▼            ▼              ▼    │
//    │       Rejected     Canceled       Canceled└── (more partial fills)
//    │       Failed       Rejected
//    └──> Failed
//
// Failed means the placement call itself never produced an exchange order
// (retries exhausted, permanent error). Rejected means the exchange answered
// and refused it.
//
// Terminal states: Filled, Canceled, Rejected, Failed.
// -----------------------------------------------------------------------------
enum class OrderStatus {
  New,              // Built locally, not yet sent
  Submitted,        // Placement call in flight
  Accepted,         // Live on the exchange book (NEW/LIVE on the wire)
  PartiallyFilled,  // Some quantity filled, remainder still open
  Filled,           // Fully filled, terminal
  Canceled,         // Canceled, terminal
  Rejected,         // Refused by the exchange, terminal
  Failed,           // Never reached the exchange, terminal
};

const char* toString(OrderStatus status);

}  // namespace domain
}  // namespace warden
