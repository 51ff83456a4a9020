#include "strategy/CrossoverStrategy.h"
#include "common/Logger.h"

namespace trendpilot {
namespace strategy {

CrossoverStrategy::CrossoverStrategy(const CrossoverStrategyConfig& config)
    : config_(config) {}

StrategyInfo CrossoverStrategy::getInfo() const {
    StrategyInfo info;
    info.name = "crossover";
    info.description = "EMA fast/slow crossover with threshold confirmation";
    info.mean_reversion = false;
    info.requires_envelope = false;
    return info;
}

bool CrossoverStrategy::isCrossUp(double prev_fast, double prev_slow,
                                  double cur_fast, double cur_slow, double threshold) {
    return prev_fast <= prev_slow && cur_fast > cur_slow + threshold;
}

bool CrossoverStrategy::isCrossDown(double prev_fast, double prev_slow,
                                    double cur_fast, double cur_slow, double threshold) {
    return prev_fast >= prev_slow && cur_fast < cur_slow - threshold;
}

Signal CrossoverStrategy::generateSignal(
    const std::vector<analytics::IndicatorFrame>& closed_history,
    double current_price
) {
    Signal none;
    if (closed_history.size() < 2) {
        return none;
    }
    const auto& prev = closed_history[closed_history.size() - 2];
    const auto& cur = closed_history.back();
    if (!prev.ema_fast || !prev.ema_slow || !cur.ema_fast || !cur.ema_slow) {
        return none;
    }

    const bool up = isCrossUp(*prev.ema_fast, *prev.ema_slow, *cur.ema_fast, *cur.ema_slow,
                              config_.cross_threshold);
    const bool down = isCrossDown(*prev.ema_fast, *prev.ema_slow, *cur.ema_fast, *cur.ema_slow,
                                  config_.cross_threshold);
    if (up == down) {
        return none;
    }

    if (config_.require_trend_agreement) {
        if (!cur.ema_trend) {
            return none;
        }
        if (up && current_price <= *cur.ema_trend) {
            LOG_DEBUG("crossover up ignored: price {:.2f} not above trend EMA {:.2f}",
                      current_price, *cur.ema_trend);
            return none;
        }
        if (down && current_price >= *cur.ema_trend) {
            LOG_DEBUG("crossover down ignored: price {:.2f} not below trend EMA {:.2f}",
                      current_price, *cur.ema_trend);
            return none;
        }
    }

    return makeSignal(up ? Direction::LONG : Direction::SHORT, cur, current_price,
                      up ? "ema_cross_up" : "ema_cross_down");
}

} // namespace strategy
} // namespace trendpilot
