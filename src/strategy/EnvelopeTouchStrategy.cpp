#include "strategy/EnvelopeTouchStrategy.h"
#include "analytics/RegimeDetector.h"

namespace trendpilot {
namespace strategy {

EnvelopeTouchStrategy::EnvelopeTouchStrategy(const EnvelopeTouchStrategyConfig& config)
    : config_(config) {}

StrategyInfo EnvelopeTouchStrategy::getInfo() const {
    StrategyInfo info;
    info.name = "envelope_touch";
    info.description = "EMA trend filter with kernel envelope touch entries";
    info.mean_reversion = true;
    info.requires_envelope = true;
    return info;
}

Signal EnvelopeTouchStrategy::generateSignal(
    const std::vector<analytics::IndicatorFrame>& closed_history,
    double current_price
) {
    Signal none;
    if (closed_history.empty()) {
        return none;
    }
    const auto& cur = closed_history.back();
    if (!cur.hasEnvelope()) {
        return none;
    }

    const auto trend = analytics::RegimeDetector::classifyTrend(cur, config_.trend_margin);
    if (trend == analytics::TrendDirection::UP && current_price <= *cur.envelope_lower) {
        return makeSignal(Direction::LONG, cur, current_price, "lower_band_touch");
    }
    if (trend == analytics::TrendDirection::DOWN && current_price >= *cur.envelope_upper) {
        return makeSignal(Direction::SHORT, cur, current_price, "upper_band_touch");
    }
    return none;
}

} // namespace strategy
} // namespace trendpilot
