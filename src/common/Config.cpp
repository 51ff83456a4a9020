#include "common/Config.h"
#include "common/PathUtils.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace trendpilot {

namespace {
std::string trimCopy(std::string s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    return s;
}

std::string normalizeName(std::string name) {
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    name = trimCopy(name);
    std::replace(name.begin(), name.end(), '-', '_');
    return name;
}

std::string readEnvVar(const char* name) {
    const char* value = std::getenv(name);
    return value ? trimCopy(value) : "";
}

// "HH:MM" -> hour, minute; false on malformed input
bool parseClockTime(const std::string& text, int& hour, int& minute) {
    const auto colon = text.find(':');
    if (colon == std::string::npos) {
        return false;
    }
    try {
        hour = std::stoi(text.substr(0, colon));
        minute = std::stoi(text.substr(colon + 1));
    } catch (const std::exception&) {
        return false;
    }
    return hour >= 0 && hour <= 23 && minute >= 0 && minute <= 59;
}
}

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

MarketMetadata Config::defaultMarket() {
    MarketMetadata m;
    m.tick_size = 0.1;
    m.qty_step = 0.01;
    m.min_qty = 0.01;
    return m;
}

void Config::reset() {
    engine_config_ = engine::EngineConfig();
    market_ = defaultMarket();
    initial_equity_ = 1000.0;
    fee_rate_ = 0.0005;
    log_level_ = "info";
    log_dir_ = "logs";
    stats_file_ = "data/daily_stats.json";
    journal_file_ = "data/journal.jsonl";
    data_file_ = "data/candles.csv";
    telegram_token_.clear();
    telegram_chat_id_.clear();
}

strategy::StrategyVariant Config::parseStrategyVariant(const std::string& raw) {
    const std::string name = normalizeName(raw);
    if (name == "crossover" || name == "ema_cross" || name == "ema_crossover" || name == "cross") {
        return strategy::StrategyVariant::CROSSOVER;
    }
    if (name == "envelope_touch" || name == "envelope" || name == "nadaraya" ||
        name == "nadaraya_watson" || name == "ema_envelope") {
        return strategy::StrategyVariant::ENVELOPE_TOUCH;
    }
    if (name == "extension_reversion" || name == "extension" || name == "reversion" ||
        name == "pullback") {
        return strategy::StrategyVariant::EXTENSION_REVERSION;
    }
    throw std::invalid_argument("unknown strategy variant '" + raw + "'");
}

risk::SizingPolicy Config::parseSizingPolicy(const std::string& raw) {
    const std::string name = normalizeName(raw);
    if (name == "risk_fraction" || name == "risk") {
        return risk::SizingPolicy::RISK_FRACTION;
    }
    if (name == "ladder" || name == "capital_tier" || name == "tier") {
        return risk::SizingPolicy::LADDER;
    }
    if (name == "margin_fraction" || name == "margin") {
        return risk::SizingPolicy::MARGIN_FRACTION;
    }
    throw std::invalid_argument("unknown sizing policy '" + raw + "'");
}

engine::TradingMode Config::parseTradingMode(const std::string& raw) {
    const std::string name = normalizeName(raw);
    if (name == "backtest") {
        return engine::TradingMode::BACKTEST;
    }
    if (name == "paper") {
        return engine::TradingMode::PAPER;
    }
    throw std::invalid_argument("unknown trading mode '" + raw + "' (live trading is not available)");
}

bool Config::load(const std::string& path) {
    std::filesystem::path config_path;
    if (std::filesystem::path(path).is_absolute() || std::filesystem::exists(path)) {
        config_path = path;
    } else {
        config_path = utils::PathUtils::resolveRelativePath(path);
    }

    std::cout << "Config file: " << config_path << std::endl;

    if (!std::filesystem::exists(config_path)) {
        std::cout << "Warning: config file not found, using defaults" << std::endl;
        nlohmann::json empty = nlohmann::json::object();
        readSecrets(empty);
        return true;
    }

    std::ifstream file(config_path);
    if (!file.is_open()) {
        std::cerr << "Config file could not be opened: " << config_path << std::endl;
        return false;
    }

    try {
        nlohmann::json j;
        file >> j;
        return loadFromJson(j);
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "Config parse error: " << e.what() << std::endl;
        return false;
    }
}

void Config::readSecrets(const nlohmann::json& j) {
    if (j.contains("telegram") && j["telegram"].is_object()) {
        const auto& t = j["telegram"];
        if (!trimCopy(t.value("token", "")).empty() || !trimCopy(t.value("chat_id", "")).empty()) {
            std::cout << "Warning: telegram credentials in the config file are ignored, "
                      << "use TELEGRAM_TOKEN / TELEGRAM_CHAT_ID" << std::endl;
        }
    }

    telegram_token_ = readEnvVar("TELEGRAM_TOKEN");
    telegram_chat_id_ = readEnvVar("TELEGRAM_CHAT_ID");
}

bool Config::loadFromJson(const nlohmann::json& j) {
    try {
        readSecrets(j);
        engine::EngineConfig& ec = engine_config_;

        if (j.contains("trading")) {
            const auto& t = j["trading"];
            ec.mode = parseTradingMode(t.value("mode", std::string("backtest")));
            ec.symbol = trimCopy(t.value("symbol", ec.symbol));
            ec.timeframe = trimCopy(t.value("timeframe", ec.timeframe));
            ec.loop_seconds = t.value("loop_seconds", ec.loop_seconds);
            ec.history_limit = t.value("history_limit", ec.history_limit);
            log_level_ = t.value("log_level", log_level_);
            ec.accounting.utc_offset_minutes = t.value("utc_offset_minutes", ec.accounting.utc_offset_minutes);

            if (t.contains("daily_report")) {
                const auto& r = t["daily_report"];
                ec.daily_report_enabled = r.value("enabled", ec.daily_report_enabled);
                const std::string at = r.value("time", std::string("23:59"));
                if (!parseClockTime(at, ec.daily_report_hour, ec.daily_report_minute)) {
                    throw std::invalid_argument("trading.daily_report.time '" + at + "' is not HH:MM");
                }
            }

            if (t.contains("retry")) {
                const auto& r = t["retry"];
                ec.execution.transient_retries = r.value("transient_retries", ec.execution.transient_retries);
                ec.execution.retry_backoff_ms = r.value("backoff_ms", ec.execution.retry_backoff_ms);
                ec.execution.close_confirm_polls = r.value("close_confirm_polls", ec.execution.close_confirm_polls);
                ec.execution.close_poll_interval_ms =
                    r.value("close_poll_interval_ms", ec.execution.close_poll_interval_ms);
            }
        }

        if (j.contains("market")) {
            const auto& m = j["market"];
            market_.tick_size = m.value("tick_size", market_.tick_size);
            market_.qty_step = m.value("qty_step", market_.qty_step);
            market_.min_qty = m.value("min_qty", market_.min_qty);
            ec.sizing.leverage = m.value("leverage", ec.sizing.leverage);
            initial_equity_ = m.value("initial_equity", initial_equity_);
            fee_rate_ = m.value("fee_rate", fee_rate_);
        }
        market_.symbol = ec.symbol;

        if (j.contains("indicators")) {
            const auto& i = j["indicators"];
            ec.indicators.ema_fast = i.value("ema_fast", ec.indicators.ema_fast);
            ec.indicators.ema_slow = i.value("ema_slow", ec.indicators.ema_slow);
            ec.indicators.ema_trend = i.value("ema_trend", ec.indicators.ema_trend);
            ec.indicators.atr_period = i.value("atr_period", ec.indicators.atr_period);
            if (i.contains("envelope")) {
                const auto& e = i["envelope"];
                ec.indicators.envelope_enabled = e.value("enabled", ec.indicators.envelope_enabled);
                ec.indicators.envelope_bandwidth = e.value("bandwidth", ec.indicators.envelope_bandwidth);
                ec.indicators.envelope_multiplier = e.value("multiplier", ec.indicators.envelope_multiplier);
                ec.indicators.envelope_window = e.value("window", ec.indicators.envelope_window);
            }
        }

        if (j.contains("regime_filter")) {
            const auto& r = j["regime_filter"];
            ec.regime.enabled = r.value("enabled", ec.regime.enabled);
            ec.regime.gap_cap = r.value("gap_cap", ec.regime.gap_cap);
            ec.regime.min_atr_pct = r.value("min_atr_pct", ec.regime.min_atr_pct);
            ec.regime.max_atr_pct = r.value("max_atr_pct", ec.regime.max_atr_pct);
            ec.regime.slope_cap = r.value("slope_cap", ec.regime.slope_cap);
        }

        if (j.contains("strategy")) {
            const auto& s = j["strategy"];
            ec.strategy.variant = parseStrategyVariant(s.value("variant", std::string("envelope_touch")));
            if (s.contains("crossover")) {
                const auto& c = s["crossover"];
                ec.strategy.crossover.cross_threshold =
                    c.value("cross_threshold", ec.strategy.crossover.cross_threshold);
                ec.strategy.crossover.require_trend_agreement =
                    c.value("require_trend_agreement", ec.strategy.crossover.require_trend_agreement);
            }
            if (s.contains("envelope_touch")) {
                ec.strategy.envelope_touch.trend_margin =
                    s["envelope_touch"].value("trend_margin", ec.strategy.envelope_touch.trend_margin);
            }
            if (s.contains("extension_reversion")) {
                ec.strategy.extension_reversion.extension_factor =
                    s["extension_reversion"].value("extension_factor",
                                                   ec.strategy.extension_reversion.extension_factor);
            }
        }

        if (j.contains("sizing")) {
            const auto& s = j["sizing"];
            ec.sizing.policy = parseSizingPolicy(s.value("policy", std::string("margin_fraction")));
            ec.sizing.risk_fraction = s.value("risk_fraction", ec.sizing.risk_fraction);
            ec.sizing.margin_fraction = s.value("margin_fraction", ec.sizing.margin_fraction);
            if (s.contains("ladder") && s["ladder"].is_array()) {
                ec.sizing.ladder.clear();
                for (const auto& tier : s["ladder"]) {
                    risk::LadderTier lt;
                    lt.min_equity = tier.value("min_equity", 0.0);
                    lt.leg_notional = tier.value("leg_notional", 0.0);
                    lt.max_legs = tier.value("max_legs", 1);
                    ec.sizing.ladder.push_back(lt);
                }
            }
        }

        if (j.contains("position")) {
            const auto& p = j["position"];
            ec.position.initial_stop_distance = p.value("initial_stop_distance", ec.position.initial_stop_distance);
            ec.position.cooldown_bars = p.value("cooldown_bars", ec.position.cooldown_bars);
            ec.position.lock_after_stop_loss = p.value("lock_after_stop_loss", ec.position.lock_after_stop_loss);
            ec.position.envelope_target = p.value("envelope_target", ec.position.envelope_target);
            ec.position.exit_on_opposing_signal =
                p.value("exit_on_opposing_signal", ec.position.exit_on_opposing_signal);
            ec.position.exit_on_trend_flip = p.value("exit_on_trend_flip", ec.position.exit_on_trend_flip);
            ec.position.basket_target_fraction =
                p.value("basket_target_fraction", ec.position.basket_target_fraction);
            ec.position.basket_stop_fraction = p.value("basket_stop_fraction", ec.position.basket_stop_fraction);
            if (p.contains("trailing_steps") && p["trailing_steps"].is_array()) {
                ec.position.trailing_steps.clear();
                for (const auto& step : p["trailing_steps"]) {
                    engine::TrailingStep ts;
                    ts.trigger = step.value("trigger", 0.0);
                    ts.stop_offset = step.value("stop_offset", 0.0);
                    ec.position.trailing_steps.push_back(ts);
                }
            }
        }

        if (j.contains("accounting")) {
            const auto& a = j["accounting"];
            ec.accounting.halt_loss_streak = a.value("halt_loss_streak", ec.accounting.halt_loss_streak);
            ec.accounting.max_daily_trades = a.value("max_daily_trades", ec.accounting.max_daily_trades);
        }

        if (j.contains("paths")) {
            const auto& p = j["paths"];
            stats_file_ = p.value("stats_file", stats_file_);
            journal_file_ = p.value("journal_file", journal_file_);
            log_dir_ = p.value("log_dir", log_dir_);
            data_file_ = p.value("data_file", data_file_);
        }
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "Config value error: " << e.what() << std::endl;
        return false;
    } catch (const std::invalid_argument& e) {
        std::cerr << "Config value error: " << e.what() << std::endl;
        return false;
    }
    return true;
}

} // namespace trendpilot
