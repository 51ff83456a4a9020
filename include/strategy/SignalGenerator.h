#pragma once

#include "strategy/IStrategy.h"
#include "analytics/RegimeDetector.h"
#include <memory>
#include <vector>

namespace trendpilot {
namespace strategy {

// Everything the decision cycle needs from one tick of indicator data
struct TickAssessment {
    bool valid = false;                 // false: skip the tick (undefined indicators)
    Signal entry;                       // at most one entry signal
    analytics::TrendDirection trend = analytics::TrendDirection::NONE;
    analytics::RegimeAnalysis regime;
    bool regime_blocked = false;        // mean-reversion entry vetoed by the sideways filter
};

// Runs the configured strategy variant behind the regime filter
class SignalGenerator {
public:
    SignalGenerator(const StrategyConfig& config,
                    const analytics::RegimeFilterConfig& regime_config);

    static std::unique_ptr<IStrategy> createStrategy(const StrategyConfig& config);

    TickAssessment assess(const std::vector<analytics::IndicatorFrame>& closed_history,
                          double current_price);

    // Ladder add-leg confirmation: the previous close sat on the wrong side of
    // ema_fast, price is back across it in the position's direction, and
    // ema_fast is still on the trend side of ema_slow
    static bool isAddLegConfirmation(Side side,
                                     const std::vector<analytics::IndicatorFrame>& closed_history,
                                     double current_price);

    // Trend margin used for trend classification
    double trendMargin() const;

    IStrategy& strategy() { return *strategy_; }
    const StrategyConfig& config() const { return config_; }

private:
    StrategyConfig config_;
    analytics::RegimeDetector regime_detector_;
    std::unique_ptr<IStrategy> strategy_;
};

} // namespace strategy
} // namespace trendpilot
