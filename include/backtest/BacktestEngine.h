#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "backtest/PaperVenue.h"
#include "common/Clock.h"
#include "core/contracts/IDailyStatStore.h"
#include "core/contracts/IEventJournal.h"
#include "core/contracts/INotificationSink.h"
#include "engine/EngineConfig.h"
#include "engine/TradingEngine.h"
#include "risk/DailyAccounting.h"

namespace trendpilot {
namespace backtest {

// Drives the trading engine over a candle history, one cycle per bar,
// with a ManualClock pinned to the replayed bar time
class BacktestEngine {
public:
    BacktestEngine(const engine::EngineConfig& config,
                   const PaperVenueConfig& venue_config,
                   std::vector<Candle> history,
                   core::INotificationSink& notifier,
                   core::IDailyStatStore& stat_store,
                   core::IEventJournal* journal = nullptr);

    // pace_clock paces paper runs (loop_seconds between bars); nullptr = full speed.
    // false when the engine refused to start.
    bool run(IClock* pace_clock = nullptr);
    void requestStop() { stop_requested_ = true; }

    struct Result {
        double initial_equity = 0.0;
        double final_equity = 0.0;
        double total_profit = 0.0;
        double max_drawdown = 0.0;      // fraction of the running equity peak
        int total_trades = 0;
        int winning_trades = 0;
        int losing_trades = 0;
        double win_rate = 0.0;
        double avg_win = 0.0;
        double avg_loss = 0.0;
        double profit_factor = 0.0;
        double expectancy = 0.0;
        int cycles = 0;
        int skipped_cycles = 0;
        bool position_open_at_end = false;
        std::map<std::string, int> exit_reason_counts;
        std::vector<risk::TradeRecord> trades;
    };
    Result getResult() const;

    const PaperVenue& venue() const { return venue_; }
    const engine::TradingEngine& engine() const { return *engine_; }

    static std::string formatResult(const Result& result);

private:
    void updateDrawdown();

    engine::EngineConfig config_;
    PaperVenueConfig venue_config_;
    PaperVenue venue_;
    ManualClock clock_;
    std::unique_ptr<engine::TradingEngine> engine_;
    long long bar_ms_;

    double peak_equity_ = 0.0;
    double max_drawdown_ = 0.0;
    int cycles_ = 0;
    int skipped_cycles_ = 0;
    std::atomic<bool> stop_requested_{false};
};

} // namespace backtest
} // namespace trendpilot
