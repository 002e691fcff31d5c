#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace warden {
namespace domain {

// -----------------------------------------------------------------------------
// SafetyMode
// -----------------------------------------------------------------------------
//   Normal ⇄ SafeMode ──> PanicClose
//
// PanicClose is one-way; only an operator reset leaves it.
// -----------------------------------------------------------------------------
enum class SafetyMode {
  Normal,
  SafeMode,
  PanicClose,
};

// -----------------------------------------------------------------------------
// SafetyState
// -----------------------------------------------------------------------------
//
// @brief  Process-wide safety state as a versioned value.
//
// @details
// Owned and mutated only by SafetySupervisor. Everyone else reads a copy via
// SafetySupervisor::snapshot(). version increases by one on every recorded
// transition, so two snapshots with equal versions describe the same state.
// -----------------------------------------------------------------------------
struct SafetyState {
  SafetyMode mode{SafetyMode::Normal};
  std::vector<std::string> reasons;
  std::int64_t entered_at_ms{0};
  std::uint64_t version{0};
};

// Recorded event for one mode change. The history of these replays the
// state exactly.
struct SafetyTransition {
  SafetyMode from{SafetyMode::Normal};
  SafetyMode to{SafetyMode::Normal};
  std::string reason;
  std::string source;
  std::int64_t timestamp_ms{0};
  std::uint64_t version{0};
};

const char* toString(SafetyMode mode);

inline bool allowsNewEntries(const SafetyState& state) {
  return state.mode == SafetyMode::Normal;
}

}  // namespace domain
}  // namespace warden
