#pragma once

#include "analytics/IndicatorEngine.h"
#include <string>

namespace trendpilot {
namespace analytics {

enum class TrendDirection {
    NONE,
    UP,
    DOWN
};

inline const char* toString(TrendDirection trend) {
    switch (trend) {
        case TrendDirection::UP: return "up";
        case TrendDirection::DOWN: return "down";
        case TrendDirection::NONE: return "none";
    }
    return "none";
}

struct RegimeFilterConfig {
    bool enabled = false;
    double gap_cap = 0.004;         // |ema_fast - ema_slow| / price
    double min_atr_pct = 0.0005;    // atr / price lower bound
    double max_atr_pct = 0.01;      // atr / price upper bound
    double slope_cap = 0.0008;      // |delta ema_trend| / price per bar
};

struct RegimeAnalysis {
    bool sideways = false;
    double gap_pct = 0.0;
    double atr_pct = 0.0;
    double slope_pct = 0.0;
    std::string description;
};

class RegimeDetector {
public:
    explicit RegimeDetector(const RegimeFilterConfig& config = RegimeFilterConfig());

    // UP only when ema_fast exceeds ema_slow by more than min_margin (price points)
    static TrendDirection classifyTrend(const IndicatorFrame& frame, double min_margin = 0.0);

    // Sideways only when gap, volatility band and trend slope all hold
    RegimeAnalysis analyzeRegime(const IndicatorFrame& prev, const IndicatorFrame& current, double price) const;

    const RegimeFilterConfig& config() const { return config_; }

private:
    RegimeFilterConfig config_;
};

} // namespace analytics
} // namespace trendpilot
