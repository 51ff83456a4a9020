#include "core/state/DailyStatStoreJson.h"

#include <cassert>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>

using namespace trendpilot;
using namespace trendpilot::core;

namespace {

risk::DailyStats sampleDay(const std::string& date) {
    risk::DailyStats stats;
    stats.date = date;
    stats.trades_today = 3;
    stats.loss_streak = 2;
    stats.halted = false;
    stats.wins = 1;
    stats.losses = 2;
    stats.realized_pnl = -4.75;

    risk::TradeRecord t;
    t.time = "09:15:00";
    t.side = "short";
    t.entry_price = 43000.0;
    t.exit_price = 43300.0;
    t.quantity = 0.01;
    t.pnl = -3.0;
    t.reason = "stop_loss";
    stats.trades.push_back(t);
    return stats;
}

} // namespace

int main() {
    const auto dir = std::filesystem::temp_directory_path() / "trendpilot_test_stats";
    const auto path = dir / "daily_stats.json";
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);

    // Missing file loads nothing; save creates the directory
    {
        DailyStatStoreJson store(path);
        assert(!store.load("2024-01-01").has_value());
        assert(store.save(sampleDay("2024-01-01")));
        assert(std::filesystem::exists(path));
    }

    // Days are kept side by side and survive a new instance
    {
        DailyStatStoreJson store(path);
        auto second = sampleDay("2024-01-02");
        second.halted = true;
        second.loss_streak = 3;
        assert(store.save(second));

        DailyStatStoreJson reopened(path);
        auto first = reopened.load("2024-01-01");
        assert(first.has_value());
        assert(first->loss_streak == 2);
        assert(!first->halted);
        assert(std::abs(first->realized_pnl + 4.75) < 1e-9);
        assert(first->trades.size() == 1);
        assert(first->trades[0].reason == "stop_loss");
        assert(std::abs(first->trades[0].exit_price - 43300.0) < 1e-9);

        auto again = reopened.load("2024-01-02");
        assert(again.has_value());
        assert(again->halted);
        assert(again->loss_streak == 3);
        assert(!reopened.load("2024-01-03").has_value());
    }

    // Saving the same day overwrites it
    {
        DailyStatStoreJson store(path);
        auto updated = sampleDay("2024-01-01");
        updated.trades_today = 5;
        assert(store.save(updated));
        assert(store.load("2024-01-01")->trades_today == 5);
        assert(store.load("2024-01-02").has_value());
    }

    // A corrupt file is treated as empty instead of failing the caller
    {
        std::ofstream out(path, std::ios::trunc);
        out << "{ broken";
        out.close();

        DailyStatStoreJson store(path);
        assert(!store.load("2024-01-01").has_value());
        assert(store.save(sampleDay("2024-01-04")));
        assert(store.load("2024-01-04").has_value());
    }

    // Memory store used by backtests
    {
        MemoryDailyStatStore memory;
        assert(!memory.load("2024-01-01").has_value());
        assert(memory.save(sampleDay("2024-01-01")));
        assert(memory.saveCount() == 1);
        auto loaded = memory.load("2024-01-01");
        assert(loaded.has_value());
        assert(loaded->losses == 2);
    }

    std::filesystem::remove_all(dir, ec);
    std::cout << "[TEST] DailyStatStore PASSED\n";
    return 0;
}
