#pragma once

namespace warden {
namespace sizing {

// Largest multiple of step that is <= value. step <= 0 returns value.
// A small epsilon absorbs binary noise (5.0 / 0.001 must stay 5000 steps).
double floorToStep(double value, double step);

// qty = equity * risk_ratio / |entry - stop|. Returns 0 when the stop
// distance or any input is not positive.
double riskBasedQuantity(double equity, double risk_ratio, double entry,
                         double stop);

// Config values may be written as percent (0.5 == 0.5 %) or as ratio
// (0.005). Anything >= 1 or > 0.05 is read as percent.
double ratioFromPercentOrRatio(double value);

}  // namespace sizing
}  // namespace warden
