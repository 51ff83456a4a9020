#pragma once

#include "strategy/IStrategy.h"

namespace trendpilot {
namespace strategy {

// EMA fast/slow crossover confirmed by a threshold margin
class CrossoverStrategy : public IStrategy {
public:
    explicit CrossoverStrategy(const CrossoverStrategyConfig& config);

    StrategyInfo getInfo() const override;
    StrategyVariant variant() const override { return StrategyVariant::CROSSOVER; }

    Signal generateSignal(
        const std::vector<analytics::IndicatorFrame>& closed_history,
        double current_price
    ) override;

    // Previous fast on-or-below slow, current fast above slow + threshold
    static bool isCrossUp(double prev_fast, double prev_slow,
                          double cur_fast, double cur_slow, double threshold);
    static bool isCrossDown(double prev_fast, double prev_slow,
                            double cur_fast, double cur_slow, double threshold);

private:
    CrossoverStrategyConfig config_;
};

} // namespace strategy
} // namespace trendpilot
