#include "backtest/BacktestEngine.h"
#include "common/Logger.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <sstream>

namespace trendpilot {
namespace backtest {

BacktestEngine::BacktestEngine(const engine::EngineConfig& config,
                               const PaperVenueConfig& venue_config,
                               std::vector<Candle> history,
                               core::INotificationSink& notifier,
                               core::IDailyStatStore& stat_store,
                               core::IEventJournal* journal)
    : config_(config)
    , venue_config_(venue_config)
    , venue_(venue_config, std::move(history))
    , clock_(0)
    , bar_ms_(timeframeMs(config.timeframe)) {
    if (bar_ms_ <= 0) {
        bar_ms_ = 60 * 1000;
    }
    // Engine and venue share the replay clock; the venue is both feed and venue
    engine_ = std::make_unique<engine::TradingEngine>(config_, venue_, venue_, clock_,
                                                      notifier, stat_store, journal);
}

bool BacktestEngine::run(IClock* pace_clock) {
    if (venue_.size() == 0) {
        LOG_ERROR("Backtest has no candles");
        return false;
    }

    // Warm-up: the first cycle already sees enough closed bars
    analytics::IndicatorEngine warmup_engine(config_.indicators);
    const size_t warmup = std::min(warmup_engine.requiredBars(), venue_.size() - 1);
    venue_.setCursor(warmup);
    clock_.setMs(venue_.currentBar().timestamp + bar_ms_ - 1);

    if (!engine_->start()) {
        LOG_ERROR("Backtest aborted: engine failed to start");
        return false;
    }

    LOG_INFO("Starting backtest with {} candles ({} warm-up)", venue_.size(), warmup);
    peak_equity_ = venue_config_.initial_equity;

    do {
        if (stop_requested_) {
            LOG_INFO("Backtest stop requested at bar {}", venue_.cursor());
            break;
        }
        clock_.setMs(venue_.currentBar().timestamp + bar_ms_ - 1);

        engine::CycleOutcome outcome = engine::CycleOutcome::COMPLETED;
        try {
            outcome = engine_->runCycle();
        } catch (const std::exception& e) {
            LOG_ERROR("Cycle failed at bar {}: {}", venue_.cursor(), e.what());
            outcome = engine::CycleOutcome::SKIPPED_TRANSIENT;
        }
        cycles_++;
        if (outcome != engine::CycleOutcome::COMPLETED) {
            skipped_cycles_++;
        }
        updateDrawdown();

        if (pace_clock) {
            pace_clock->sleepFor(std::chrono::seconds(config_.loop_seconds));
        }
    } while (venue_.advance());

    LOG_INFO("Backtest completed after {} cycles", cycles_);
    return true;
}

void BacktestEngine::updateDrawdown() {
    const double current = venue_.equitySnapshot().total;
    if (current > peak_equity_) {
        peak_equity_ = current;
    }
    const double drawdown = peak_equity_ > 0.0 ? (peak_equity_ - current) / peak_equity_ : 0.0;
    if (drawdown > max_drawdown_) {
        max_drawdown_ = drawdown;
    }
}

BacktestEngine::Result BacktestEngine::getResult() const {
    Result result;
    result.initial_equity = venue_config_.initial_equity;

    result.final_equity = venue_.equitySnapshot().total;
    result.total_profit = result.final_equity - result.initial_equity;
    result.max_drawdown = max_drawdown_;
    result.cycles = cycles_;
    result.skipped_cycles = skipped_cycles_;
    result.position_open_at_end = engine_->state().position.isOpen();
    result.trades = engine_->state().history;

    double gross_profit = 0.0;
    double gross_loss_abs = 0.0;
    for (const auto& trade : result.trades) {
        result.total_trades++;
        result.exit_reason_counts[trade.reason]++;
        if (trade.pnl > 0.0) {
            result.winning_trades++;
            gross_profit += trade.pnl;
        } else if (trade.pnl < 0.0) {
            result.losing_trades++;
            gross_loss_abs += std::abs(trade.pnl);
        }
    }

    if (result.total_trades > 0) {
        result.win_rate = static_cast<double>(result.winning_trades) / result.total_trades;
        result.expectancy = (gross_profit - gross_loss_abs) / result.total_trades;
    }
    result.avg_win = result.winning_trades > 0 ? gross_profit / result.winning_trades : 0.0;
    result.avg_loss = result.losing_trades > 0 ? gross_loss_abs / result.losing_trades : 0.0;
    result.profit_factor = gross_loss_abs > 1e-12 ? gross_profit / gross_loss_abs : 0.0;
    return result;
}

std::string BacktestEngine::formatResult(const Result& r) {
    std::ostringstream oss;
    char buf[256];

    oss << "========== Backtest result ==========\n";
    std::snprintf(buf, sizeof(buf), "Equity        : %.2f -> %.2f (%+.2f)\n",
                  r.initial_equity, r.final_equity, r.total_profit);
    oss << buf;
    std::snprintf(buf, sizeof(buf), "Trades        : %d (wins %d, losses %d, win rate %.1f%%)\n",
                  r.total_trades, r.winning_trades, r.losing_trades, r.win_rate * 100.0);
    oss << buf;
    std::snprintf(buf, sizeof(buf), "Avg win/loss  : %.2f / %.2f, profit factor %.2f, expectancy %.2f\n",
                  r.avg_win, r.avg_loss, r.profit_factor, r.expectancy);
    oss << buf;
    std::snprintf(buf, sizeof(buf), "Max drawdown  : %.2f%%\n", r.max_drawdown * 100.0);
    oss << buf;
    std::snprintf(buf, sizeof(buf), "Cycles        : %d (%d skipped)%s\n", r.cycles, r.skipped_cycles,
                  r.position_open_at_end ? ", position still open" : "");
    oss << buf;
    for (const auto& [reason, count] : r.exit_reason_counts) {
        std::snprintf(buf, sizeof(buf), "  exit %-16s %d\n", reason.c_str(), count);
        oss << buf;
    }
    return oss.str();
}

} // namespace backtest
} // namespace trendpilot
