#pragma once

#include <cstdint>
#include <string>

namespace warden {
namespace domain {

// Capability kinds probed at startup and refreshed by the capability worker.
inline constexpr const char* kCapabilityPlanOrders = "plan_orders";

// -----------------------------------------------------------------------------
// CapabilityValue
// -----------------------------------------------------------------------------
// Unknown is a first-class result (probe timed out or was inconclusive).
// It is never collapsed into Supported or Unsupported.
// -----------------------------------------------------------------------------
enum class CapabilityValue {
  Supported,
  Unsupported,
  Unknown,
};

// -----------------------------------------------------------------------------
// ProbeResult: raw outcome of one probeCapability() call
// -----------------------------------------------------------------------------
struct ProbeResult {
  CapabilityValue value{CapabilityValue::Unknown};
  std::string reason;
};

// -----------------------------------------------------------------------------
// CapabilityRecord
// -----------------------------------------------------------------------------
//
// @brief  Cached probe result with an explicit expiry.
//
// @details
// Unknown records carry the short retry TTL; Supported and Unsupported carry
// the long TTL. A record past expires_at_ms is stale and must be re-probed
// before a Trigger-mode decision is made on it.
// -----------------------------------------------------------------------------
struct CapabilityRecord {
  std::string kind;
  CapabilityValue value{CapabilityValue::Unknown};
  std::string reason;
  std::int64_t probed_at_ms{0};
  std::int64_t expires_at_ms{0};

  bool isFresh(std::int64_t now_ms) const { return now_ms < expires_at_ms; }
};

const char* toString(CapabilityValue value);

}  // namespace domain
}  // namespace warden
