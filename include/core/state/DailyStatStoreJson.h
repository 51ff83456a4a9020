#pragma once

#include <filesystem>
#include <optional>

#include <nlohmann/json.hpp>

#include "core/contracts/IDailyStatStore.h"

namespace trendpilot {
namespace core {

// One JSON document keyed by date: {"2024-05-01": {...}, ...}
class DailyStatStoreJson : public IDailyStatStore {
public:
    explicit DailyStatStoreJson(std::filesystem::path file_path);

    std::optional<risk::DailyStats> load(const std::string& date) override;
    bool save(const risk::DailyStats& stats) override;

    static nlohmann::json toJson(const risk::DailyStats& stats);
    static risk::DailyStats fromJson(const nlohmann::json& raw);

private:
    nlohmann::json readAll() const;

    std::filesystem::path file_path_;
};

// In-process store for tests and backtests
class MemoryDailyStatStore : public IDailyStatStore {
public:
    std::optional<risk::DailyStats> load(const std::string& date) override;
    bool save(const risk::DailyStats& stats) override;

    size_t saveCount() const { return save_count_; }

private:
    nlohmann::json days_ = nlohmann::json::object();
    size_t save_count_ = 0;
};

} // namespace core
} // namespace trendpilot
