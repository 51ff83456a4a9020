#pragma once

#include <optional>
#include <vector>
#include "analytics/TechnicalIndicators.h"
#include "common/Types.h"

namespace trendpilot {
namespace analytics {

struct IndicatorConfig {
    int ema_fast = 50;
    int ema_slow = 100;
    int ema_trend = 200;
    int atr_period = 14;

    bool envelope_enabled = true;
    double envelope_bandwidth = 8.0;
    double envelope_multiplier = 3.0;
    int envelope_window = 500;

    // Envelope frames computed back from the newest bar (0 = every bar)
    int envelope_tail = 2;
};

// One entry per closed candle, aligned by index
struct IndicatorFrame {
    long long timestamp = 0;
    double close = 0.0;
    SeriesValue ema_fast;
    SeriesValue ema_slow;
    SeriesValue ema_trend;
    SeriesValue atr;
    SeriesValue envelope_upper;
    SeriesValue envelope_lower;
    SeriesValue envelope_mid;

    bool hasEmas() const { return ema_fast && ema_slow && ema_trend; }
    bool hasEnvelope() const { return envelope_upper && envelope_lower && envelope_mid; }
};

class IndicatorEngine {
public:
    explicit IndicatorEngine(const IndicatorConfig& config);

    // Bars needed before the newest two frames carry EMAs and ATR (and the
    // newest one the envelope)
    size_t requiredBars() const;

    // Keeps closed bars only; a forming bar never reaches the indicators
    static std::vector<Candle> closedOnly(const std::vector<Candle>& candles);

    // std::nullopt means "insufficient data": fewer closed bars than requiredBars()
    std::optional<std::vector<IndicatorFrame>> compute(const std::vector<Candle>& candles) const;

    const IndicatorConfig& config() const { return config_; }

private:
    IndicatorConfig config_;
};

} // namespace analytics
} // namespace trendpilot
