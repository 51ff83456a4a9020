#pragma once

#include <string>
#include <filesystem>
#include <nlohmann/json.hpp>
#include "common/Types.h"
#include "engine/EngineConfig.h"

namespace trendpilot {

class Config {
public:
    static Config& getInstance();

    // Missing file keeps defaults (true); unreadable or invalid content returns false
    bool load(const std::string& config_path);
    bool loadFromJson(const nlohmann::json& j);
    void reset();

    engine::EngineConfig getEngineConfig() const { return engine_config_; }
    MarketMetadata getMarketMetadata() const { return market_; }
    double getInitialEquity() const { return initial_equity_; }
    double getFeeRate() const { return fee_rate_; }

    std::string getLogLevel() const { return log_level_; }
    std::string getLogDir() const { return log_dir_; }
    std::string getStatsFile() const { return stats_file_; }
    std::string getJournalFile() const { return journal_file_; }
    std::string getDataFile() const { return data_file_; }

    // Secrets come from the environment only
    std::string getTelegramToken() const { return telegram_token_; }
    std::string getTelegramChatId() const { return telegram_chat_id_; }
    bool hasTelegram() const { return !telegram_token_.empty() && !telegram_chat_id_.empty(); }

    // Lower-case, trimmed, aliases resolved. Unknown names throw std::invalid_argument.
    static strategy::StrategyVariant parseStrategyVariant(const std::string& name);
    static risk::SizingPolicy parseSizingPolicy(const std::string& name);
    static engine::TradingMode parseTradingMode(const std::string& name);

private:
    Config() = default;
    void readSecrets(const nlohmann::json& j);

    engine::EngineConfig engine_config_;
    MarketMetadata market_ = defaultMarket();
    double initial_equity_ = 1000.0;
    double fee_rate_ = 0.0005;

    std::string log_level_ = "info";
    std::string log_dir_ = "logs";
    std::string stats_file_ = "data/daily_stats.json";
    std::string journal_file_ = "data/journal.jsonl";
    std::string data_file_ = "data/candles.csv";

    std::string telegram_token_;
    std::string telegram_chat_id_;

    static MarketMetadata defaultMarket();
};

} // namespace trendpilot
