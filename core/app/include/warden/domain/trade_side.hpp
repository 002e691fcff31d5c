#pragma once

#include <optional>
#include <string>

namespace warden {
namespace domain {

// -----------------------------------------------------------------------------
// PositionSide
// -----------------------------------------------------------------------------
// Responsibility: Direction of a position or of the signal that opens it.
// LONG profits when price rises, SHORT when it falls. Also used as the
// hold side of a hedge-mode position.
// -----------------------------------------------------------------------------
enum class PositionSide {
  Long,
  Short,
};

// -----------------------------------------------------------------------------
// OrderSide
// -----------------------------------------------------------------------------
// Responsibility: Wire-level direction of a single order. An entry for a
// LONG position buys; every protective order for it sells.
// -----------------------------------------------------------------------------
enum class OrderSide {
  Buy,
  Sell,
};

inline OrderSide entrySide(PositionSide side) {
  return side == PositionSide::Long ? OrderSide::Buy : OrderSide::Sell;
}

inline OrderSide closeSide(PositionSide side) {
  return side == PositionSide::Long ? OrderSide::Sell : OrderSide::Buy;
}

inline const char* toString(PositionSide side) {
  switch (side) {
    case PositionSide::Long:  return "LONG";
    case PositionSide::Short: return "SHORT";
  }
  return "UNKNOWN";
}

inline const char* toString(OrderSide side) {
  switch (side) {
    case OrderSide::Buy:  return "BUY";
    case OrderSide::Sell: return "SELL";
  }
  return "UNKNOWN";
}

// Accepts LONG/SHORT and the BUY/SELL synonyms, case-insensitive.
std::optional<PositionSide> parsePositionSide(const std::string& text);

}  // namespace domain
}  // namespace warden
