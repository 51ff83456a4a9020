#pragma once

#include "common/Clock.h"
#include <string>
#include <vector>

namespace trendpilot {
namespace risk {

struct TradeRecord {
    std::string time;           // HH:MM:SS local
    std::string side;
    double entry_price = 0.0;
    double exit_price = 0.0;
    double quantity = 0.0;
    double pnl = 0.0;
    std::string reason;
};

struct DailyStats {
    std::string date;           // YYYY-MM-DD local
    int trades_today = 0;
    int loss_streak = 0;
    bool halted = false;
    int wins = 0;
    int losses = 0;
    double realized_pnl = 0.0;
    std::vector<TradeRecord> trades;
};

struct DailyAccountingConfig {
    int halt_loss_streak = 3;       // 0 disables the streak halt
    int max_daily_trades = 0;       // 0 = unlimited
    int utc_offset_minutes = 0;     // local day boundary
};

// Per-day trade counters, loss streak and halt state
class DailyAccounting {
public:
    DailyAccounting(const DailyAccountingConfig& config, const IClock& clock);

    // Replace the current day with a stored record (same-day restart)
    void restore(const DailyStats& stats);

    // Returns true when the local day changed; `finished` receives the closed day
    bool rollIfNewDay(DailyStats* finished = nullptr);

    void recordEntry();
    void recordExit(const TradeRecord& trade);

    // Entries blocked: streak halt or daily trade cap
    bool entriesBlocked() const;
    bool isHalted() const { return stats_.halted; }

    const DailyStats& stats() const { return stats_; }
    std::string today() const;
    std::string nowTimeOfDay() const;

private:
    DailyAccountingConfig config_;
    const IClock& clock_;
    DailyStats stats_;
};

// Plain-text summary of one day for the notification sink
std::string formatDailyReport(const DailyStats& stats, size_t max_lines = 20);

} // namespace risk
} // namespace trendpilot
