#include "common/Config.h"
#include "common/Logger.h"
#include <iostream>
#include <cassert>
#include <cmath>
#include <filesystem>
#include <stdexcept>

int main() {
    using namespace trendpilot;

    spdlog::set_level(spdlog::level::debug);

    std::cout << "[TEST] Starting Config Test..." << std::endl;

    Config& config = Config::getInstance();

    // 1. Defaults
    config.reset();
    {
        auto ec = config.getEngineConfig();
        assert(ec.mode == engine::TradingMode::BACKTEST);
        assert(ec.timeframe == "15m");
        assert(ec.indicators.ema_fast == 50);
        assert(ec.indicators.ema_slow == 100);
        assert(ec.indicators.ema_trend == 200);
        assert(std::abs(config.getFeeRate() - 0.0005) < 1e-9);
        assert(config.getMarketMetadata().isValid());
    }

    // 2. Sections override defaults, aliases resolve
    {
        nlohmann::json j = {
            {"trading", {
                {"mode", "Paper"},
                {"symbol", " ETH-USDT-SWAP "},
                {"timeframe", "5m"},
                {"loop_seconds", 7},
                {"utc_offset_minutes", 540},
                {"daily_report", {{"enabled", true}, {"time", "21:30"}}},
                {"retry", {{"transient_retries", 5}, {"backoff_ms", 250}}}
            }},
            {"market", {{"tick_size", 0.01}, {"qty_step", 0.001}, {"min_qty", 0.001}, {"leverage", 20}}},
            {"strategy", {{"variant", "ema-cross"}, {"crossover", {{"cross_threshold", 0.2}}}}},
            {"sizing", {
                {"policy", "tier"},
                {"ladder", {
                    {{"min_equity", 0}, {"leg_notional", 15}, {"max_legs", 2}},
                    {{"min_equity", 500}, {"leg_notional", 50}, {"max_legs", 3}}
                }}
            }},
            {"position", {
                {"initial_stop_distance", 250},
                {"lock_after_stop_loss", true},
                {"trailing_steps", {
                    {{"trigger", 300}, {"stop_offset", -100}},
                    {{"trigger", 500}, {"stop_offset", 0}}
                }}
            }},
            {"accounting", {{"halt_loss_streak", 4}, {"max_daily_trades", 10}}},
            {"paths", {{"stats_file", "state/stats.json"}}}
        };

        config.reset();
        assert(config.loadFromJson(j));
        auto ec = config.getEngineConfig();
        assert(ec.mode == engine::TradingMode::PAPER);
        assert(ec.symbol == "ETH-USDT-SWAP");
        assert(ec.timeframe == "5m");
        assert(ec.loop_seconds == 7);
        assert(ec.accounting.utc_offset_minutes == 540);
        assert(ec.daily_report_hour == 21);
        assert(ec.daily_report_minute == 30);
        assert(ec.execution.transient_retries == 5);
        assert(ec.execution.retry_backoff_ms == 250);
        assert(std::abs(ec.sizing.leverage - 20.0) < 1e-9);
        assert(std::abs(config.getMarketMetadata().qty_step - 0.001) < 1e-12);
        assert(ec.strategy.variant == strategy::StrategyVariant::CROSSOVER);
        assert(std::abs(ec.strategy.crossover.cross_threshold - 0.2) < 1e-12);
        assert(ec.sizing.policy == risk::SizingPolicy::LADDER);
        assert(ec.sizing.ladder.size() == 2);
        assert(ec.sizing.ladder[1].max_legs == 3);
        assert(std::abs(ec.position.initial_stop_distance - 250.0) < 1e-9);
        assert(ec.position.lock_after_stop_loss);
        assert(ec.position.trailing_steps.size() == 2);
        assert(std::abs(ec.position.trailing_steps[0].stop_offset + 100.0) < 1e-9);
        assert(ec.accounting.halt_loss_streak == 4);
        assert(ec.accounting.max_daily_trades == 10);
        assert(config.getStatsFile() == "state/stats.json");
        assert(config.getJournalFile() == "data/journal.jsonl");
    }

    // 3. Name parsing
    assert(Config::parseStrategyVariant("nadaraya") == strategy::StrategyVariant::ENVELOPE_TOUCH);
    assert(Config::parseStrategyVariant("EXTENSION") == strategy::StrategyVariant::EXTENSION_REVERSION);
    assert(Config::parseSizingPolicy("risk") == risk::SizingPolicy::RISK_FRACTION);
    assert(Config::parseSizingPolicy("margin") == risk::SizingPolicy::MARGIN_FRACTION);
    {
        bool threw = false;
        try {
            Config::parseTradingMode("live");
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);
    }

    // 4. Invalid content is reported, not silently accepted
    {
        const nlohmann::json unknown_variant = {{"strategy", {{"variant", "martingale"}}}};
        const nlohmann::json bad_report_time = {{"trading", {{"daily_report", {{"time", "25:00"}}}}}};
        const nlohmann::json live_mode = {{"trading", {{"mode", "live"}}}};
        const nlohmann::json wrong_type = {{"indicators", {{"ema_fast", "fast"}}}};

        config.reset();
        assert(!config.loadFromJson(unknown_variant));
        config.reset();
        assert(!config.loadFromJson(bad_report_time));
        config.reset();
        assert(!config.loadFromJson(live_mode));
        config.reset();
        assert(!config.loadFromJson(wrong_type));
    }

    // 5. Missing file keeps defaults
    config.reset();
    assert(config.load("does/not/exist/config.json"));
    assert(config.getEngineConfig().indicators.ema_slow == 100);

    // 6. Shipped sample configuration loads and validates
    std::string config_path = "config/config.json";
    if (std::filesystem::exists(config_path)) {
        std::cout << "[TEST] Found config.json, loading..." << std::endl;
        config.reset();
        assert(config.load(config_path));
        auto ec = config.getEngineConfig();
        assert(ec.indicators.envelope_window == 500);
        assert(std::abs(ec.sizing.margin_fraction - 0.8) < 1e-9);
        assert(std::abs(ec.position.initial_stop_distance - 300.0) < 1e-9);
        assert(ec.position.trailing_steps.size() == 3);
        assert(ec.validate().empty());
    } else {
        std::cout << "[TEST] config.json not found, skipping sample check" << std::endl;
    }

    std::cout << "[TEST] Config Test PASSED!" << std::endl;
    return 0;
}
