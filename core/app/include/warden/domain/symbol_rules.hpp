#pragma once

#include <optional>
#include <string>

namespace warden {
namespace domain {

// -----------------------------------------------------------------------------
// SymbolRules
// -----------------------------------------------------------------------------
// Exchange precision and tradability rules for one instrument, as returned
// by getSymbolRules(). Quantities and prices sent to the exchange are
// floored to qty_step / price_step. volume_24h is the quote-currency volume
// when the venue reports it.
// -----------------------------------------------------------------------------
struct SymbolRules {
  std::string symbol;
  double qty_step{0.0};
  double price_step{0.0};
  double min_qty{0.0};
  bool tradable{true};
  std::optional<double> volume_24h;
};

}  // namespace domain
}  // namespace warden
