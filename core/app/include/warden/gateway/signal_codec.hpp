#pragma once

#include "warden/domain/signal_intent.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <stdexcept>
#include <string>

namespace warden {

// Thrown when a payload is valid JSON but not a valid signal. what() names
// the offending field.
class SignalFormatError : public std::runtime_error {
 public:
  explicit SignalFormatError(const std::string& what)
      : std::runtime_error(what) {}
};

// -----------------------------------------------------------------------------
// SignalCodec: JSON wire format <-> SignalEnvelope
// -----------------------------------------------------------------------------
//
// @brief  The single place where untrusted signal payloads are checked.
//
// @details
// Wire format (one JSON object per message):
//
//   {
//     "signal_id":      "tg-123-1",       // required, idempotency key
//     "message_id":     "tg-123",         // defaults to signal_id
//     "version":        1,                // >= 1, edits bump it
//     "received_at_ms": 1700000000000,    // defaults to the receive clock
//     "type":           "ENTRY_SIGNAL",   // | MANAGE_ACTION | NON_SIGNAL
//
//     // ENTRY_SIGNAL
//     "symbol": "BTCUSDT", "side": "LONG",
//     "entry_type": "LIMIT",              // | MARKET
//     "entry": 100.0,                     // or "entry_low" + "entry_high"
//     "stop_loss": 99.0, "take_profits": [101, 102],
//     "leverage": 10, "quality": 0.9, "confidence": 0.95,
//
//     // MANAGE_ACTION
//     "symbol": "BTCUSDT",
//     "action": "MOVE_SL_TO_BE",          // | REDUCE | CLOSE | SET_TP
//     "reduce_pct": 50,                   // REDUCE only, (0, 100]
//     "take_profits": [105],              // SET_TP only, non-empty
//
//     // NON_SIGNAL
//     "reason": "chatter"
//   }
//
// Symbols are upper-cased with '/', '-' and spaces removed. A LIMIT entry
// needs a price; a MARKET entry may omit it. Every required field is
// checked here, so the RiskEngine only sees well-formed intents.
//
// Errors: SignalFormatError for semantic problems; nlohmann::json
// exceptions from parseSignal() for malformed text.
// -----------------------------------------------------------------------------
domain::SignalEnvelope decodeSignal(const nlohmann::json& j,
                                    std::int64_t received_at_ms);

domain::SignalEnvelope parseSignal(const std::string& payload,
                                   std::int64_t received_at_ms);

nlohmann::json encodeSignal(const domain::SignalEnvelope& envelope);

std::string normalizeSymbol(const std::string& raw);

}  // namespace warden
