#pragma once
// ===================================================================
// Venue step rounding
//
// Prices must be multiples of the venue tick size and quantities
// multiples of the venue quantity step. Step values come from the
// venue market metadata, never from a hard-coded table.
// ===================================================================

#include <cmath>
#include <cstdio>
#include <string>

namespace trendpilot {
namespace common {

// Tolerance for values that land a hair below a step boundary after
// floating-point division (0.3 / 0.1 = 2.9999999999999996)
constexpr double kStepEpsilon = 1e-9;

// Quantity rounding is always down: never order more than sized
inline double roundDownToStep(double value, double step) {
    if (step <= 0.0 || value <= 0.0) return 0.0;
    return std::floor(value / step + kStepEpsilon) * step;
}

// Nearest tick; a price already on the grid is returned untouched
inline double roundToTick(double price, double tick) {
    if (tick <= 0.0) return price;
    const double ticks = price / tick;
    const double nearest = std::round(ticks);
    if (std::fabs(ticks - nearest) < kStepEpsilon) return price;
    return nearest * tick;
}

// Decimal places needed to print a value on the given step
inline int stepDecimals(double step) {
    int decimals = 0;
    double s = step;
    while (s > 0.0 && s < 1.0 - kStepEpsilon && decimals < 10) {
        s *= 10.0;
        decimals++;
    }
    return decimals;
}

inline std::string formatOnStep(double value, double step) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.*f", stepDecimals(step), value);
    return std::string(buf);
}

} // namespace common
} // namespace trendpilot
