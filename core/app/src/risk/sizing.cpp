#include "warden/risk/sizing.hpp"

#include <cmath>

namespace warden {
namespace sizing {

namespace {
constexpr double kStepEpsilon = 1e-9;
}  // namespace

double floorToStep(double value, double step) {
  if (step <= 0.0) {
    return value;
  }
  double steps = std::floor(value / step + kStepEpsilon);
  return steps * step;
}

double riskBasedQuantity(double equity, double risk_ratio, double entry,
                         double stop) {
  double distance = std::abs(entry - stop);
  if (equity <= 0.0 || risk_ratio <= 0.0 || entry <= 0.0 || distance <= 0.0) {
    return 0.0;
  }
  return equity * risk_ratio / distance;
}

double ratioFromPercentOrRatio(double value) {
  if (value >= 1.0 || value > 0.05) {
    return value / 100.0;
  }
  return value;
}

}  // namespace sizing
}  // namespace warden
