#pragma once

#include <cstdint>

namespace warden {
namespace domain {

// -----------------------------------------------------------------------------
// AccountMode
// -----------------------------------------------------------------------------
// OneWay: one net position per symbol, closes carry reduce_only.
// Hedge:  long and short legs coexist, closes carry trade_side=close plus
//         the leg's hold side.
// -----------------------------------------------------------------------------
enum class AccountMode {
  OneWay,
  Hedge,
};

// -----------------------------------------------------------------------------
// AccountSnapshot
// -----------------------------------------------------------------------------
// Point-in-time balance view from getBalance(). equity includes unrealized
// PnL; margin_ratio is maintenance margin / equity as reported by the venue
// (0 when unknown).
// -----------------------------------------------------------------------------
struct AccountSnapshot {
  double equity{0.0};
  double available{0.0};
  double unrealized_pnl{0.0};
  double margin_ratio{0.0};
  std::int64_t timestamp_ms{0};
};

}  // namespace domain
}  // namespace warden
