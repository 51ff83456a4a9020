#include "analytics/IndicatorEngine.h"
#include "common/Logger.h"
#include <algorithm>

namespace trendpilot {
namespace analytics {

IndicatorEngine::IndicatorEngine(const IndicatorConfig& config)
    : config_(config) {}

size_t IndicatorEngine::requiredBars() const {
    // Signals read the previous frame too, so EMAs and ATR need one extra bar
    size_t required = static_cast<size_t>(std::max({config_.ema_fast, config_.ema_slow, config_.ema_trend})) + 1;
    required = std::max(required, static_cast<size_t>(config_.atr_period + 2));
    if (config_.envelope_enabled) {
        required = std::max(required, static_cast<size_t>(config_.envelope_window + 1));
    }
    return required;
}

std::vector<Candle> IndicatorEngine::closedOnly(const std::vector<Candle>& candles) {
    std::vector<Candle> closed;
    closed.reserve(candles.size());
    for (const auto& candle : candles) {
        if (!candle.closed) {
            continue;
        }
        closed.push_back(candle);
    }
    return closed;
}

std::optional<std::vector<IndicatorFrame>> IndicatorEngine::compute(const std::vector<Candle>& candles) const {
    const std::vector<Candle> closed = closedOnly(candles);
    if (closed.size() != candles.size()) {
        LOG_DEBUG("IndicatorEngine: excluded {} forming bar(s)", candles.size() - closed.size());
    }

    if (closed.size() < requiredBars()) {
        LOG_DEBUG("IndicatorEngine: insufficient data ({}/{})", closed.size(), requiredBars());
        return std::nullopt;
    }

    const auto closes = TechnicalIndicators::extractClosePrices(closed);
    const Series fast = TechnicalIndicators::calculateEMAVector(closes, config_.ema_fast);
    const Series slow = TechnicalIndicators::calculateEMAVector(closes, config_.ema_slow);
    const Series trend = TechnicalIndicators::calculateEMAVector(closes, config_.ema_trend);
    const Series atr = TechnicalIndicators::calculateATRVector(closed, config_.atr_period);

    std::vector<IndicatorFrame> frames(closed.size());
    for (size_t i = 0; i < closed.size(); ++i) {
        auto& f = frames[i];
        f.timestamp = closed[i].timestamp;
        f.close = closed[i].close;
        f.ema_fast = fast[i];
        f.ema_slow = slow[i];
        f.ema_trend = trend[i];
        f.atr = atr[i];
    }

    if (config_.envelope_enabled) {
        size_t first = 0;
        if (config_.envelope_tail > 0 && closed.size() > static_cast<size_t>(config_.envelope_tail)) {
            first = closed.size() - static_cast<size_t>(config_.envelope_tail);
        }
        for (size_t i = first; i < closed.size(); ++i) {
            auto env = TechnicalIndicators::calculateEnvelopeAt(
                closes, i, config_.envelope_bandwidth, config_.envelope_multiplier, config_.envelope_window);
            if (env) {
                frames[i].envelope_upper = env->upper;
                frames[i].envelope_lower = env->lower;
                frames[i].envelope_mid = env->mid;
            }
        }
    }

    return frames;
}

} // namespace analytics
} // namespace trendpilot
