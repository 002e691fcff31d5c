#pragma once

#include "warden/domain/trade_side.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace warden {
namespace domain {

enum class EntryType {
  Market,
  Limit,
};

// -----------------------------------------------------------------------------
// EntrySignal
// -----------------------------------------------------------------------------
//
// @brief  A normalized request to open a new position.
//
// @details
// Produced by SignalCodec at the ingestion boundary. Every required field is
// present and typed once an EntrySignal exists; the RiskEngine never
// re-validates the payload shape, only its policy acceptability.
//
// entry_low/entry_high describe the entry range. A MARKET entry or a single
// price sets both to the same value. stop_loss and leverage are optional
// because sources routinely omit them; the RiskEngine decides whether a
// missing stop can be derived from policy.
// -----------------------------------------------------------------------------
struct EntrySignal {
  std::string symbol;
  PositionSide side{PositionSide::Long};
  EntryType entry_type{EntryType::Limit};
  double entry_low{0.0};
  double entry_high{0.0};
  std::optional<double> stop_loss;
  std::vector<double> take_profits;
  std::optional<int> leverage;
  double quality{1.0};     // Source-assigned signal quality in [0, 1]
  double confidence{1.0};  // Extraction confidence in [0, 1]
};

enum class ManageActionKind {
  MoveStopToBreakEven,
  Reduce,
  Close,
  SetTakeProfit,
};

// -----------------------------------------------------------------------------
// ManageAction
// -----------------------------------------------------------------------------
// Follow-up instruction for an already open position. reduce_pct is only
// meaningful for Reduce and lies in (0, 100]; take_profits only for
// SetTakeProfit.
// -----------------------------------------------------------------------------
struct ManageAction {
  std::string symbol;
  ManageActionKind kind{ManageActionKind::MoveStopToBreakEven};
  std::optional<double> reduce_pct;
  std::vector<double> take_profits;
};

// Message that carried no actionable instruction. Recorded, never executed.
struct NonSignal {
  std::string reason;
};

// -----------------------------------------------------------------------------
// SignalIntent: closed tagged variant
// -----------------------------------------------------------------------------
// The engine dispatches on the alternative with std::visit / std::get_if.
// Adding a fourth alternative is a compile-time change at every dispatch
// site, which is the point of keeping the set closed.
// -----------------------------------------------------------------------------
using SignalIntent = std::variant<EntrySignal, ManageAction, NonSignal>;

// -----------------------------------------------------------------------------
// SignalEnvelope
// -----------------------------------------------------------------------------
//
// @brief  Identity and receipt metadata wrapped around one SignalIntent.
//
// @details
// signal_id is the idempotency key: a second envelope with the same
// signal_id is dropped before risk evaluation. (message_id, version)
// identifies the source message; an edited message arrives as a new
// version of the same message_id and is recorded but not auto-executed.
//
// Immutable once received. Safe to copy across threads.
// -----------------------------------------------------------------------------
struct SignalEnvelope {
  std::string signal_id;
  std::string message_id;
  int version{1};
  std::int64_t received_at_ms{0};
  SignalIntent intent;
};

const char* toString(ManageActionKind kind);
const char* intentKindName(const SignalIntent& intent);

}  // namespace domain
}  // namespace warden
