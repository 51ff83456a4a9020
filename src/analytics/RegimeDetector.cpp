#include "analytics/RegimeDetector.h"
#include <cmath>
#include <sstream>

namespace trendpilot {
namespace analytics {

RegimeDetector::RegimeDetector(const RegimeFilterConfig& config)
    : config_(config) {}

TrendDirection RegimeDetector::classifyTrend(const IndicatorFrame& frame, double min_margin) {
    if (!frame.ema_fast || !frame.ema_slow) {
        return TrendDirection::NONE;
    }
    const double gap = *frame.ema_fast - *frame.ema_slow;
    if (gap > min_margin) return TrendDirection::UP;
    if (gap < -min_margin) return TrendDirection::DOWN;
    return TrendDirection::NONE;
}

RegimeAnalysis RegimeDetector::analyzeRegime(
    const IndicatorFrame& prev,
    const IndicatorFrame& current,
    double price
) const {
    RegimeAnalysis result;

    if (price <= 0.0 || !current.ema_fast || !current.ema_slow || !current.atr ||
        !current.ema_trend || !prev.ema_trend) {
        result.description = "Insufficient Data";
        return result;
    }

    result.gap_pct = std::abs(*current.ema_fast - *current.ema_slow) / price;
    result.atr_pct = *current.atr / price;
    result.slope_pct = std::abs(*current.ema_trend - *prev.ema_trend) / price;

    const bool gap_ok = result.gap_pct <= config_.gap_cap;
    const bool atr_ok = result.atr_pct >= config_.min_atr_pct && result.atr_pct <= config_.max_atr_pct;
    const bool slope_ok = result.slope_pct <= config_.slope_cap;

    result.sideways = gap_ok && atr_ok && slope_ok;

    std::ostringstream oss;
    if (result.sideways) {
        oss << "Sideways";
    } else {
        oss << "Not sideways:";
        if (!gap_ok) oss << " gap";
        if (!atr_ok) oss << " atr";
        if (!slope_ok) oss << " slope";
    }
    result.description = oss.str();
    return result;
}

} // namespace analytics
} // namespace trendpilot
