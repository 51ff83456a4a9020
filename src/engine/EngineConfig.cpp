#include "engine/EngineConfig.h"
#include "common/Clock.h"

namespace trendpilot {
namespace engine {

std::vector<std::string> EngineConfig::validate() const {
    std::vector<std::string> errors;

    if (symbol.empty()) {
        errors.push_back("trading.symbol is empty");
    }
    if (timeframeMs(timeframe) <= 0) {
        errors.push_back("trading.timeframe '" + timeframe + "' is not recognized");
    }
    if (loop_seconds < 0) {
        errors.push_back("trading.loop_seconds must be >= 0");
    }

    if (indicators.ema_fast <= 0 || indicators.ema_slow <= 0 || indicators.ema_trend <= 0 ||
        indicators.atr_period <= 0) {
        errors.push_back("indicator periods must be positive");
    }
    if (indicators.ema_fast >= indicators.ema_slow) {
        errors.push_back("indicators.ema_fast must be shorter than ema_slow");
    }
    if (indicators.envelope_enabled &&
        (indicators.envelope_bandwidth <= 0.0 || indicators.envelope_window <= 0 ||
         indicators.envelope_multiplier <= 0.0)) {
        errors.push_back("envelope bandwidth, multiplier and window must be positive");
    }
    if (history_limit < static_cast<int>(analytics::IndicatorEngine(indicators).requiredBars()) + 1) {
        errors.push_back("trading.history_limit is shorter than the longest indicator lookback");
    }

    bool needs_envelope = strategy.variant == strategy::StrategyVariant::ENVELOPE_TOUCH ||
                          position.envelope_target || position.lock_after_stop_loss;
    if (needs_envelope && !indicators.envelope_enabled) {
        errors.push_back("envelope is disabled but the strategy or exit rules need it");
    }

    switch (sizing.policy) {
        case risk::SizingPolicy::RISK_FRACTION:
            if (sizing.risk_fraction <= 0.0 || sizing.risk_fraction > 1.0) {
                errors.push_back("sizing.risk_fraction must be in (0, 1]");
            }
            if (position.initial_stop_distance <= 0.0) {
                errors.push_back("risk_fraction sizing needs position.initial_stop_distance > 0");
            }
            break;
        case risk::SizingPolicy::MARGIN_FRACTION:
            if (sizing.margin_fraction <= 0.0 || sizing.margin_fraction > 1.0) {
                errors.push_back("sizing.margin_fraction must be in (0, 1]");
            }
            break;
        case risk::SizingPolicy::LADDER:
            if (sizing.ladder.empty()) {
                errors.push_back("ladder sizing needs at least one tier");
            }
            for (size_t i = 1; i < sizing.ladder.size(); ++i) {
                if (sizing.ladder[i].min_equity <= sizing.ladder[i - 1].min_equity) {
                    errors.push_back("ladder tiers must be sorted by strictly increasing min_equity");
                    break;
                }
            }
            break;
    }
    if (sizing.leverage <= 0.0) {
        errors.push_back("market.leverage must be positive");
    }

    for (size_t i = 1; i < position.trailing_steps.size(); ++i) {
        if (position.trailing_steps[i].trigger <= position.trailing_steps[i - 1].trigger) {
            errors.push_back("position.trailing_steps triggers must be strictly increasing");
            break;
        }
    }
    if (position.cooldown_bars < 0) {
        errors.push_back("position.cooldown_bars must be >= 0");
    }
    if (position.basket_target_fraction < 0.0 || position.basket_stop_fraction < 0.0) {
        errors.push_back("basket fractions must be >= 0");
    }

    if (accounting.halt_loss_streak < 0 || accounting.max_daily_trades < 0) {
        errors.push_back("accounting limits must be >= 0");
    }
    if (daily_report_hour < 0 || daily_report_hour > 23 ||
        daily_report_minute < 0 || daily_report_minute > 59) {
        errors.push_back("daily report time must be a valid HH:MM");
    }
    if (execution.transient_retries < 0 || execution.retry_backoff_ms < 0 ||
        execution.close_confirm_polls < 1) {
        errors.push_back("execution retry settings are out of range");
    }

    return errors;
}

} // namespace engine
} // namespace trendpilot
