#include "strategy/ExtensionReversionStrategy.h"

namespace trendpilot {
namespace strategy {

ExtensionReversionStrategy::ExtensionReversionStrategy(const ExtensionReversionStrategyConfig& config)
    : config_(config) {}

StrategyInfo ExtensionReversionStrategy::getInfo() const {
    StrategyInfo info;
    info.name = "extension_reversion";
    info.description = "Reversion after an ATR-scaled stretch from the fast EMA";
    info.mean_reversion = true;
    info.requires_envelope = false;
    return info;
}

Signal ExtensionReversionStrategy::generateSignal(
    const std::vector<analytics::IndicatorFrame>& closed_history,
    double current_price
) {
    Signal none;
    if (closed_history.size() < 2) {
        return none;
    }
    const auto& prev = closed_history[closed_history.size() - 2];
    const auto& cur = closed_history.back();
    if (!prev.ema_fast || !prev.atr || !cur.ema_fast) {
        return none;
    }

    const double stretch = config_.extension_factor * (*prev.atr);
    const bool long_setup = prev.close < *prev.ema_fast - stretch && cur.close > *cur.ema_fast;
    const bool short_setup = prev.close > *prev.ema_fast + stretch && cur.close < *cur.ema_fast;

    if (long_setup == short_setup) {
        return none;
    }
    if (long_setup) {
        return makeSignal(Direction::LONG, cur, current_price, "extension_below_reverted");
    }
    return makeSignal(Direction::SHORT, cur, current_price, "extension_above_reverted");
}

} // namespace strategy
} // namespace trendpilot
