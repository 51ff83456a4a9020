#pragma once

#include "strategy/IStrategy.h"

namespace trendpilot {
namespace strategy {

// Trend-side entries at the kernel envelope: buy the lower band in an
// uptrend, sell the upper band in a downtrend
class EnvelopeTouchStrategy : public IStrategy {
public:
    explicit EnvelopeTouchStrategy(const EnvelopeTouchStrategyConfig& config);

    StrategyInfo getInfo() const override;
    StrategyVariant variant() const override { return StrategyVariant::ENVELOPE_TOUCH; }

    Signal generateSignal(
        const std::vector<analytics::IndicatorFrame>& closed_history,
        double current_price
    ) override;

private:
    EnvelopeTouchStrategyConfig config_;
};

} // namespace strategy
} // namespace trendpilot
