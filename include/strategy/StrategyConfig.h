#pragma once

#include <string>

namespace trendpilot {
namespace strategy {

enum class StrategyVariant {
    CROSSOVER,
    ENVELOPE_TOUCH,
    EXTENSION_REVERSION
};

inline const char* toString(StrategyVariant variant) {
    switch (variant) {
        case StrategyVariant::CROSSOVER: return "crossover";
        case StrategyVariant::ENVELOPE_TOUCH: return "envelope_touch";
        case StrategyVariant::EXTENSION_REVERSION: return "extension_reversion";
    }
    return "crossover";
}

struct CrossoverStrategyConfig {
    double cross_threshold = 0.0;       // fast must clear slow by this many points
    bool require_trend_agreement = false; // price on the same side of ema_trend
};

struct EnvelopeTouchStrategyConfig {
    double trend_margin = 0.0;          // min |ema_fast - ema_slow| to call a trend
};

struct ExtensionReversionStrategyConfig {
    double extension_factor = 1.5;      // stretch beyond ema_fast in ATR units
};

struct StrategyConfig {
    StrategyVariant variant = StrategyVariant::ENVELOPE_TOUCH;
    CrossoverStrategyConfig crossover;
    EnvelopeTouchStrategyConfig envelope_touch;
    ExtensionReversionStrategyConfig extension_reversion;
};

} // namespace strategy
} // namespace trendpilot
