#include "core/state/DailyStatStoreJson.h"
#include "common/Logger.h"

#include <fstream>
#include <system_error>

namespace trendpilot {
namespace core {

DailyStatStoreJson::DailyStatStoreJson(std::filesystem::path file_path)
    : file_path_(std::move(file_path)) {}

nlohmann::json DailyStatStoreJson::toJson(const risk::DailyStats& stats) {
    nlohmann::json raw;
    raw["date"] = stats.date;
    raw["trades_today"] = stats.trades_today;
    raw["loss_streak"] = stats.loss_streak;
    raw["halted"] = stats.halted;
    raw["wins"] = stats.wins;
    raw["losses"] = stats.losses;
    raw["realized_pnl"] = stats.realized_pnl;

    nlohmann::json trades = nlohmann::json::array();
    for (const auto& t : stats.trades) {
        trades.push_back({
            {"time", t.time},
            {"side", t.side},
            {"entry", t.entry_price},
            {"exit", t.exit_price},
            {"qty", t.quantity},
            {"pnl", t.pnl},
            {"reason", t.reason}
        });
    }
    raw["trades"] = trades;
    return raw;
}

risk::DailyStats DailyStatStoreJson::fromJson(const nlohmann::json& raw) {
    risk::DailyStats stats;
    stats.date = raw.value("date", std::string());
    stats.trades_today = raw.value("trades_today", 0);
    stats.loss_streak = raw.value("loss_streak", 0);
    stats.halted = raw.value("halted", false);
    stats.wins = raw.value("wins", 0);
    stats.losses = raw.value("losses", 0);
    stats.realized_pnl = raw.value("realized_pnl", 0.0);

    if (raw.contains("trades") && raw["trades"].is_array()) {
        for (const auto& item : raw["trades"]) {
            risk::TradeRecord t;
            t.time = item.value("time", std::string());
            t.side = item.value("side", std::string());
            t.entry_price = item.value("entry", 0.0);
            t.exit_price = item.value("exit", 0.0);
            t.quantity = item.value("qty", 0.0);
            t.pnl = item.value("pnl", 0.0);
            t.reason = item.value("reason", std::string());
            stats.trades.push_back(t);
        }
    }
    return stats;
}

nlohmann::json DailyStatStoreJson::readAll() const {
    if (!std::filesystem::exists(file_path_)) {
        return nlohmann::json::object();
    }

    std::ifstream in(file_path_, std::ios::binary);
    if (!in.is_open()) {
        return nlohmann::json::object();
    }

    try {
        nlohmann::json raw;
        in >> raw;
        if (raw.is_object()) {
            return raw;
        }
        LOG_WARN("Daily stat file {} is not an object, starting empty", file_path_.string());
    } catch (const nlohmann::json::exception& e) {
        LOG_WARN("Daily stat file {} unreadable ({}), starting empty", file_path_.string(), e.what());
    }
    return nlohmann::json::object();
}

std::optional<risk::DailyStats> DailyStatStoreJson::load(const std::string& date) {
    nlohmann::json all = readAll();
    if (!all.contains(date) || !all[date].is_object()) {
        return std::nullopt;
    }
    risk::DailyStats stats = fromJson(all[date]);
    stats.date = date;
    return stats;
}

bool DailyStatStoreJson::save(const risk::DailyStats& stats) {
    nlohmann::json all = readAll();
    all[stats.date] = toJson(stats);

    if (file_path_.has_parent_path()) {
        std::error_code dir_ec;
        std::filesystem::create_directories(file_path_.parent_path(), dir_ec);
    }

    auto tmp_path = file_path_;
    tmp_path += ".tmp";

    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return false;
        }
        out << all.dump(2);
    }

    std::error_code ec;
    std::filesystem::rename(tmp_path, file_path_, ec);
    if (!ec) {
        return true;
    }

    // Rename over an existing file can fail on some filesystems; copy instead
    ec.clear();
    std::filesystem::copy_file(
        tmp_path,
        file_path_,
        std::filesystem::copy_options::overwrite_existing,
        ec
    );
    if (ec) {
        return false;
    }

    std::filesystem::remove(tmp_path, ec);
    return true;
}

std::optional<risk::DailyStats> MemoryDailyStatStore::load(const std::string& date) {
    if (!days_.contains(date)) {
        return std::nullopt;
    }
    return DailyStatStoreJson::fromJson(days_[date]);
}

bool MemoryDailyStatStore::save(const risk::DailyStats& stats) {
    days_[stats.date] = DailyStatStoreJson::toJson(stats);
    save_count_++;
    return true;
}

} // namespace core
} // namespace trendpilot
