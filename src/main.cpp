#include "common/Logger.h"
#include "common/Config.h"
#include "common/PathUtils.h"
#include "backtest/BacktestEngine.h"
#include "backtest/DataHistory.h"
#include "core/state/DailyStatStoreJson.h"
#include "core/state/EventJournalJsonl.h"
#include "network/CurlHttpClient.h"
#include "network/Notifiers.h"

#include <nlohmann/json.hpp>

#include <csignal>
#include <iostream>
#include <memory>
#include <string>

using namespace trendpilot;

namespace {

// Ctrl+C stops the replay at the next cycle boundary
backtest::BacktestEngine* g_backtest = nullptr;

void signalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        if (g_backtest) {
            g_backtest->requestStop();
        }
    }
}

struct CliOptions {
    std::string config_path = "config/config.json";
    std::string data_path;
    std::string mode;
    bool json_output = false;
};

void printUsage() {
    std::cout << "usage: trendpilot [--config <file>] [--data <candles.csv>] "
                 "[--mode backtest|paper] [--json]\n";
}

bool parseArgs(int argc, char* argv[], CliOptions& out) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            out.config_path = argv[++i];
        } else if (arg == "--data" && i + 1 < argc) {
            out.data_path = argv[++i];
        } else if (arg == "--mode" && i + 1 < argc) {
            out.mode = argv[++i];
        } else if (arg == "--json") {
            out.json_output = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage();
            return false;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            printUsage();
            return false;
        }
    }
    return true;
}

std::unique_ptr<core::INotificationSink> makeNotifier(const Config& config, engine::TradingMode mode) {
    if (mode == engine::TradingMode::BACKTEST) {
        return std::make_unique<network::RecordingNotifier>();
    }
    if (!config.hasTelegram()) {
        LOG_INFO("TELEGRAM_TOKEN / TELEGRAM_CHAT_ID not set, notifications go to the log");
        return std::make_unique<network::LogNotifier>();
    }
    auto http = std::make_shared<network::CurlHttpClient>(network::TelegramNotifier::kApiBaseUrl, 10);
    return std::make_unique<network::TelegramNotifier>(http, config.getTelegramToken(),
                                                       config.getTelegramChatId());
}

} // namespace

int main(int argc, char* argv[]) {
    CliOptions options;
    if (!parseArgs(argc, argv, options)) {
        return 2;
    }

    try {
        auto& config = Config::getInstance();
        if (!config.load(options.config_path)) {
            std::cerr << "Invalid configuration, aborting\n";
            return 1;
        }

        Logger::getInstance().initialize(config.getLogDir(), config.getLogLevel());

        engine::EngineConfig engine_config = config.getEngineConfig();
        if (!options.mode.empty()) {
            engine_config.mode = Config::parseTradingMode(options.mode);
        }
        const std::string data_path = options.data_path.empty() ? config.getDataFile() : options.data_path;

        std::cout << "\n";
        std::cout << "=============================================\n";
        std::cout << "       trendpilot " << engine_config.symbol << " " << engine_config.timeframe << "\n";
        std::cout << "       mode: " << engine::toString(engine_config.mode) << "\n";
        std::cout << "=============================================\n\n";

        auto candles = backtest::DataHistory::loadCSV(data_path);
        if (candles.empty()) {
            LOG_ERROR("No candles loaded from {}", data_path);
            return 1;
        }

        backtest::PaperVenueConfig venue_config;
        venue_config.symbol = engine_config.symbol;
        venue_config.market = config.getMarketMetadata();
        venue_config.initial_equity = config.getInitialEquity();
        venue_config.leverage = engine_config.sizing.leverage;
        venue_config.fee_rate = config.getFeeRate();

        auto notifier = makeNotifier(config, engine_config.mode);

        std::unique_ptr<core::IDailyStatStore> stat_store;
        std::unique_ptr<core::IEventJournal> journal;
        if (engine_config.mode == engine::TradingMode::PAPER) {
            stat_store = std::make_unique<core::DailyStatStoreJson>(
                utils::PathUtils::resolveRelativePath(config.getStatsFile()));
            journal = std::make_unique<core::EventJournalJsonl>(
                utils::PathUtils::resolveRelativePath(config.getJournalFile()));
        } else {
            stat_store = std::make_unique<core::MemoryDailyStatStore>();
        }

        backtest::BacktestEngine runner(engine_config, venue_config, std::move(candles),
                                        *notifier, *stat_store, journal.get());
        g_backtest = &runner;
        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        SystemClock pace_clock;
        const bool ok = runner.run(engine_config.mode == engine::TradingMode::PAPER ? &pace_clock : nullptr);
        g_backtest = nullptr;
        if (!ok) {
            std::cerr << "Engine failed to start, see the log for details\n";
            return 1;
        }

        const auto result = runner.getResult();
        if (options.json_output) {
            nlohmann::json j;
            j["initial_equity"] = result.initial_equity;
            j["final_equity"] = result.final_equity;
            j["total_profit"] = result.total_profit;
            j["max_drawdown"] = result.max_drawdown;
            j["total_trades"] = result.total_trades;
            j["winning_trades"] = result.winning_trades;
            j["losing_trades"] = result.losing_trades;
            j["win_rate"] = result.win_rate;
            j["profit_factor"] = result.profit_factor;
            j["expectancy"] = result.expectancy;
            j["exit_reason_counts"] = result.exit_reason_counts;
            std::cout << j.dump() << "\n";
        } else {
            std::cout << backtest::BacktestEngine::formatResult(result);
        }

        LOG_INFO("Program terminated");
        return 0;
    } catch (const std::exception& e) {
        LOG_ERROR("Fatal error: {}", e.what());
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
