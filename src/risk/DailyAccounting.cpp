#include "risk/DailyAccounting.h"
#include "common/Logger.h"
#include <cstdio>
#include <ctime>
#include <sstream>

namespace trendpilot {
namespace risk {

DailyAccounting::DailyAccounting(const DailyAccountingConfig& config, const IClock& clock)
    : config_(config)
    , clock_(clock) {
    stats_.date = today();
}

std::string DailyAccounting::today() const {
    return dayKey(clock_.now(), config_.utc_offset_minutes);
}

std::string DailyAccounting::nowTimeOfDay() const {
    std::time_t t = std::chrono::system_clock::to_time_t(clock_.now());
    t += static_cast<std::time_t>(config_.utc_offset_minutes) * 60;
    std::tm tm_local{};
    gmtime_r(&t, &tm_local);
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%02d:%02d:%02d", tm_local.tm_hour, tm_local.tm_min, tm_local.tm_sec);
    return std::string(buf);
}

void DailyAccounting::restore(const DailyStats& stats) {
    if (stats.date != today()) {
        LOG_INFO("Stored daily stats are for {}, starting fresh day {}", stats.date, today());
        return;
    }
    stats_ = stats;
    LOG_INFO("Daily stats restored: trades={}, loss_streak={}, halted={}, pnl={:.2f}",
             stats_.trades_today, stats_.loss_streak, stats_.halted, stats_.realized_pnl);
}

bool DailyAccounting::rollIfNewDay(DailyStats* finished) {
    const std::string current_day = today();
    if (current_day == stats_.date) {
        return false;
    }

    if (finished) {
        *finished = stats_;
    }
    LOG_INFO("Day changed {} -> {}: daily counters reset (pnl {:.2f}, halted {})",
             stats_.date, current_day, stats_.realized_pnl, stats_.halted);
    stats_ = DailyStats();
    stats_.date = current_day;
    return true;
}

void DailyAccounting::recordEntry() {
    stats_.trades_today++;
}

void DailyAccounting::recordExit(const TradeRecord& trade) {
    stats_.realized_pnl += trade.pnl;
    stats_.trades.push_back(trade);

    if (trade.pnl > 0.0) {
        stats_.wins++;
        stats_.loss_streak = 0;
    } else if (trade.pnl < 0.0) {
        stats_.losses++;
        stats_.loss_streak++;
    }

    if (!stats_.halted && config_.halt_loss_streak > 0 &&
        stats_.loss_streak >= config_.halt_loss_streak) {
        stats_.halted = true;
        LOG_WARN("Loss streak {} reached the limit {}: entries halted until day rollover",
                 stats_.loss_streak, config_.halt_loss_streak);
    }
}

bool DailyAccounting::entriesBlocked() const {
    if (stats_.halted) {
        return true;
    }
    return config_.max_daily_trades > 0 && stats_.trades_today >= config_.max_daily_trades;
}

std::string formatDailyReport(const DailyStats& stats, size_t max_lines) {
    std::ostringstream oss;
    char buf[256];

    oss << "Daily summary " << stats.date << "\n";
    std::snprintf(buf, sizeof(buf), "PnL: %+.2f | trades %d | wins %d | losses %d%s",
                  stats.realized_pnl, stats.trades_today, stats.wins, stats.losses,
                  stats.halted ? " | halted" : "");
    oss << buf;

    if (!stats.trades.empty()) {
        oss << "\n------------";
        size_t start = stats.trades.size() > max_lines ? stats.trades.size() - max_lines : 0;
        for (size_t i = start; i < stats.trades.size(); ++i) {
            const auto& t = stats.trades[i];
            std::snprintf(buf, sizeof(buf), "\n%s | %s | %.2f -> %.2f | %+.2f (%s)",
                          t.time.c_str(), t.side.c_str(), t.entry_price, t.exit_price,
                          t.pnl, t.reason.c_str());
            oss << buf;
        }
    }
    return oss.str();
}

} // namespace risk
} // namespace trendpilot
