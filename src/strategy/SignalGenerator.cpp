#include "strategy/SignalGenerator.h"
#include "strategy/CrossoverStrategy.h"
#include "strategy/EnvelopeTouchStrategy.h"
#include "strategy/ExtensionReversionStrategy.h"
#include "common/Logger.h"

namespace trendpilot {
namespace strategy {

namespace {
bool frameComplete(const analytics::IndicatorFrame& f, bool needs_envelope) {
    if (!f.hasEmas() || !f.atr) {
        return false;
    }
    return !needs_envelope || f.hasEnvelope();
}
} // namespace

SignalGenerator::SignalGenerator(const StrategyConfig& config,
                                 const analytics::RegimeFilterConfig& regime_config)
    : config_(config)
    , regime_detector_(regime_config)
    , strategy_(createStrategy(config)) {}

std::unique_ptr<IStrategy> SignalGenerator::createStrategy(const StrategyConfig& config) {
    switch (config.variant) {
        case StrategyVariant::CROSSOVER:
            return std::make_unique<CrossoverStrategy>(config.crossover);
        case StrategyVariant::ENVELOPE_TOUCH:
            return std::make_unique<EnvelopeTouchStrategy>(config.envelope_touch);
        case StrategyVariant::EXTENSION_REVERSION:
            return std::make_unique<ExtensionReversionStrategy>(config.extension_reversion);
    }
    return std::make_unique<EnvelopeTouchStrategy>(config.envelope_touch);
}

double SignalGenerator::trendMargin() const {
    return config_.variant == StrategyVariant::ENVELOPE_TOUCH ? config_.envelope_touch.trend_margin : 0.0;
}

TickAssessment SignalGenerator::assess(
    const std::vector<analytics::IndicatorFrame>& closed_history,
    double current_price
) {
    TickAssessment out;
    if (closed_history.size() < 2 || current_price <= 0.0) {
        return out;
    }

    const StrategyInfo info = strategy_->getInfo();
    const auto& prev = closed_history[closed_history.size() - 2];
    const auto& cur = closed_history.back();

    // Crossovers and stretch checks read the previous frame; envelope only the current one
    if (!frameComplete(cur, info.requires_envelope) || !frameComplete(prev, false)) {
        LOG_DEBUG("SignalGenerator: undefined indicator on latest frames, skipping tick");
        return out;
    }

    out.valid = true;
    out.trend = analytics::RegimeDetector::classifyTrend(cur, trendMargin());
    out.regime = regime_detector_.analyzeRegime(prev, cur, current_price);

    if (info.mean_reversion && regime_detector_.config().enabled && !out.regime.sideways) {
        out.regime_blocked = true;
        LOG_DEBUG("SignalGenerator: {} blocked by regime filter ({})", info.name, out.regime.description);
        return out;
    }

    out.entry = strategy_->generateSignal(closed_history, current_price);
    if (out.entry.isEntry()) {
        LOG_INFO("Signal {} from {} at {:.4f} ({})", toString(out.entry.direction), info.name,
                 current_price, out.entry.reason);
    }
    return out;
}

bool SignalGenerator::isAddLegConfirmation(
    Side side,
    const std::vector<analytics::IndicatorFrame>& closed_history,
    double current_price
) {
    if (closed_history.size() < 2) {
        return false;
    }
    const auto& prev = closed_history[closed_history.size() - 2];
    const auto& cur = closed_history.back();
    if (!prev.ema_fast || !cur.ema_fast || !cur.ema_slow) {
        return false;
    }

    if (side == Side::LONG) {
        return *cur.ema_fast > *cur.ema_slow &&
               prev.close < *prev.ema_fast &&
               current_price > *cur.ema_fast;
    }
    return *cur.ema_fast < *cur.ema_slow &&
           prev.close > *prev.ema_fast &&
           current_price < *cur.ema_fast;
}

} // namespace strategy
} // namespace trendpilot
