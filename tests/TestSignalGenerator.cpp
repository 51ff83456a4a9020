#include "strategy/SignalGenerator.h"
#include "strategy/CrossoverStrategy.h"

#include <cassert>
#include <iostream>
#include <vector>

using namespace trendpilot;
using trendpilot::analytics::IndicatorFrame;
using trendpilot::analytics::RegimeFilterConfig;
using trendpilot::analytics::TrendDirection;
using namespace trendpilot::strategy;

namespace {

IndicatorFrame frame(long long ts, double close, double fast, double slow,
                     double trend, double atr) {
    IndicatorFrame f;
    f.timestamp = ts;
    f.close = close;
    f.ema_fast = fast;
    f.ema_slow = slow;
    f.ema_trend = trend;
    f.atr = atr;
    return f;
}

IndicatorFrame withEnvelope(IndicatorFrame f, double lower, double upper) {
    f.envelope_lower = lower;
    f.envelope_upper = upper;
    f.envelope_mid = (lower + upper) / 2.0;
    return f;
}

} // namespace

int main() {
    // Crossover must clear the slow EMA by the threshold
    {
        StrategyConfig cfg;
        cfg.variant = StrategyVariant::CROSSOVER;
        cfg.crossover.cross_threshold = 0.2;
        SignalGenerator gen(cfg, RegimeFilterConfig());

        std::vector<IndicatorFrame> history = {
            frame(1000, 10.0, 9.8, 10.0, 9.0, 0.3),
            frame(2000, 10.4, 10.3, 10.0, 9.0, 0.3),
        };
        auto a = gen.assess(history, 10.4);
        assert(a.valid);
        assert(a.entry.isEntry());
        assert(a.entry.direction == Direction::LONG);
        assert(a.entry.variant == StrategyVariant::CROSSOVER);
        assert(a.entry.bar_timestamp == 2000);
        assert(a.trend == TrendDirection::UP);

        cfg.crossover.cross_threshold = 0.4;
        SignalGenerator strict(cfg, RegimeFilterConfig());
        assert(!strict.assess(history, 10.4).entry.isEntry());

        assert(CrossoverStrategy::isCrossDown(10.2, 10.0, 9.5, 10.0, 0.2));
        assert(!CrossoverStrategy::isCrossDown(9.9, 10.0, 9.5, 10.0, 0.2));
    }

    // Trend agreement vetoes a cross on the wrong side of the trend EMA
    {
        StrategyConfig cfg;
        cfg.variant = StrategyVariant::CROSSOVER;
        cfg.crossover.require_trend_agreement = true;
        SignalGenerator gen(cfg, RegimeFilterConfig());

        std::vector<IndicatorFrame> history = {
            frame(1000, 10.0, 9.8, 10.0, 11.0, 0.3),
            frame(2000, 10.4, 10.3, 10.0, 11.0, 0.3),
        };
        assert(!gen.assess(history, 10.4).entry.isEntry());
        assert(gen.assess(history, 11.5).entry.direction == Direction::LONG);
    }

    // Envelope touch in the direction of the trend
    {
        StrategyConfig cfg;
        cfg.variant = StrategyVariant::ENVELOPE_TOUCH;
        SignalGenerator gen(cfg, RegimeFilterConfig());

        std::vector<IndicatorFrame> up = {
            frame(1000, 100.0, 105.0, 100.0, 98.0, 2.0),
            withEnvelope(frame(2000, 100.0, 105.0, 100.0, 98.0, 2.0), 95.0, 110.0),
        };
        assert(gen.assess(up, 94.0).entry.direction == Direction::LONG);
        assert(gen.assess(up, 95.0).entry.direction == Direction::LONG);
        assert(!gen.assess(up, 96.0).entry.isEntry());
        assert(!gen.assess(up, 111.0).entry.isEntry());

        std::vector<IndicatorFrame> down = {
            frame(1000, 100.0, 95.0, 100.0, 102.0, 2.0),
            withEnvelope(frame(2000, 100.0, 95.0, 100.0, 102.0, 2.0), 90.0, 105.0),
        };
        assert(gen.assess(down, 106.0).entry.direction == Direction::SHORT);
        assert(!gen.assess(down, 89.0).entry.isEntry());

        // Missing envelope means the tick is skipped
        std::vector<IndicatorFrame> bare = {
            frame(1000, 100.0, 105.0, 100.0, 98.0, 2.0),
            frame(2000, 100.0, 105.0, 100.0, 98.0, 2.0),
        };
        auto skipped = gen.assess(bare, 94.0);
        assert(!skipped.valid);
        assert(!skipped.entry.isEntry());
    }

    // Sideways filter blocks mean-reversion entries outside a quiet regime
    {
        StrategyConfig cfg;
        cfg.variant = StrategyVariant::ENVELOPE_TOUCH;
        RegimeFilterConfig regime;
        regime.enabled = true;
        SignalGenerator gen(cfg, regime);

        std::vector<IndicatorFrame> trending = {
            frame(1000, 100.0, 105.0, 100.0, 98.0, 2.0),
            withEnvelope(frame(2000, 100.0, 105.0, 100.0, 98.0, 2.0), 95.0, 110.0),
        };
        auto blocked = gen.assess(trending, 94.0);
        assert(blocked.valid);
        assert(blocked.regime_blocked);
        assert(!blocked.regime.sideways);
        assert(!blocked.entry.isEntry());

        std::vector<IndicatorFrame> quiet = {
            frame(1000, 100.0, 100.1, 100.0, 100.0, 0.1),
            withEnvelope(frame(2000, 100.0, 100.1, 100.0, 100.0, 0.1), 95.0, 105.0),
        };
        auto allowed = gen.assess(quiet, 94.0);
        assert(allowed.regime.sideways);
        assert(!allowed.regime_blocked);
        assert(allowed.entry.direction == Direction::LONG);
    }

    // Regime filter does not apply to the crossover
    {
        StrategyConfig cfg;
        cfg.variant = StrategyVariant::CROSSOVER;
        RegimeFilterConfig regime;
        regime.enabled = true;
        SignalGenerator gen(cfg, regime);
        std::vector<IndicatorFrame> history = {
            frame(1000, 10.0, 9.8, 10.0, 9.0, 0.3),
            frame(2000, 10.4, 10.3, 10.0, 9.0, 0.3),
        };
        auto a = gen.assess(history, 10.4);
        assert(!a.regime_blocked);
        assert(a.entry.direction == Direction::LONG);
    }

    // Stretch beyond ema_fast by factor * ATR, then a close back across it
    {
        StrategyConfig cfg;
        cfg.variant = StrategyVariant::EXTENSION_REVERSION;
        cfg.extension_reversion.extension_factor = 1.5;
        SignalGenerator gen(cfg, RegimeFilterConfig());

        std::vector<IndicatorFrame> history = {
            frame(1000, 90.0, 100.0, 101.0, 102.0, 4.0),
            frame(2000, 101.0, 100.0, 101.0, 102.0, 4.0),
        };
        assert(gen.assess(history, 101.0).entry.direction == Direction::LONG);

        history[0].close = 95.0;    // stretch of 5 is inside 1.5 * 4
        assert(!gen.assess(history, 101.0).entry.isEntry());

        std::vector<IndicatorFrame> above = {
            frame(1000, 110.0, 100.0, 99.0, 98.0, 4.0),
            frame(2000, 99.0, 100.0, 99.0, 98.0, 4.0),
        };
        assert(gen.assess(above, 99.0).entry.direction == Direction::SHORT);
    }

    // Ladder add-leg confirmation
    {
        std::vector<IndicatorFrame> history = {
            frame(1000, 99.0, 104.0, 100.0, 95.0, 1.0),
            frame(2000, 106.0, 105.0, 100.0, 95.0, 1.0),
        };
        assert(SignalGenerator::isAddLegConfirmation(Side::LONG, history, 106.0));
        assert(!SignalGenerator::isAddLegConfirmation(Side::LONG, history, 104.0));
        assert(!SignalGenerator::isAddLegConfirmation(Side::SHORT, history, 90.0));

        history[0].close = 104.5;
        assert(!SignalGenerator::isAddLegConfirmation(Side::LONG, history, 106.0));

        std::vector<IndicatorFrame> down = {
            frame(1000, 101.0, 96.0, 100.0, 105.0, 1.0),
            frame(2000, 94.0, 95.0, 100.0, 105.0, 1.0),
        };
        assert(SignalGenerator::isAddLegConfirmation(Side::SHORT, down, 94.0));
    }

    std::cout << "[TEST] SignalGenerator PASSED\n";
    return 0;
}
