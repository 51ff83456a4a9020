#pragma once

#include <string>
#include <vector>

#include "analytics/IndicatorEngine.h"
#include "analytics/RegimeDetector.h"
#include "engine/PositionStateMachine.h"
#include "execution/OrderExecutor.h"
#include "risk/DailyAccounting.h"
#include "risk/RiskSizer.h"
#include "strategy/StrategyConfig.h"

namespace trendpilot {
namespace engine {

enum class TradingMode {
    BACKTEST,       // replay history as fast as possible
    PAPER           // replay history paced by the loop interval
};

inline const char* toString(TradingMode mode) {
    return mode == TradingMode::PAPER ? "paper" : "backtest";
}

struct EngineConfig {
    TradingMode mode = TradingMode::BACKTEST;
    std::string symbol = "BTC-USDT-SWAP";
    std::string timeframe = "15m";
    int loop_seconds = 3;               // idle interval between cycles
    int history_limit = 600;            // candles requested per cycle

    bool daily_report_enabled = true;
    int daily_report_hour = 23;         // local time of the scheduled report
    int daily_report_minute = 59;

    analytics::IndicatorConfig indicators;
    analytics::RegimeFilterConfig regime;
    strategy::StrategyConfig strategy;
    risk::RiskSizerConfig sizing;
    PositionConfig position;
    risk::DailyAccountingConfig accounting;
    execution::ExecutionConfig execution;

    // Human-readable problems; empty when the configuration is usable
    std::vector<std::string> validate() const;
};

} // namespace engine
} // namespace trendpilot
