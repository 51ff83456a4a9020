#pragma once

#include "strategy/IStrategy.h"

namespace trendpilot {
namespace strategy {

// Snap-back entries after a close stretched beyond ema_fast by
// extension_factor x ATR and the next close returned across ema_fast
class ExtensionReversionStrategy : public IStrategy {
public:
    explicit ExtensionReversionStrategy(const ExtensionReversionStrategyConfig& config);

    StrategyInfo getInfo() const override;
    StrategyVariant variant() const override { return StrategyVariant::EXTENSION_REVERSION; }

    Signal generateSignal(
        const std::vector<analytics::IndicatorFrame>& closed_history,
        double current_price
    ) override;

private:
    ExtensionReversionStrategyConfig config_;
};

} // namespace strategy
} // namespace trendpilot
