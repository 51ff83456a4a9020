#include "engine/TradingEngine.h"
#include "common/Logger.h"
#include "common/Retry.h"

#include <cstdio>

namespace trendpilot {
namespace engine {

const char* toString(CycleOutcome outcome) {
    switch (outcome) {
        case CycleOutcome::COMPLETED: return "completed";
        case CycleOutcome::SKIPPED_TRANSIENT: return "skipped_transient";
        case CycleOutcome::SKIPPED_NO_DATA: return "skipped_no_data";
        case CycleOutcome::NOT_STARTED: return "not_started";
    }
    return "completed";
}

namespace {
bool isStopExit(ExitReason reason) {
    return reason == ExitReason::STOP_LOSS || reason == ExitReason::TRAILING_PROFIT;
}

std::string formatPrice(double value) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.2f", value);
    return std::string(buf);
}
} // namespace

TradingEngine::TradingEngine(const EngineConfig& config,
                             core::IMarketDataFeed& feed,
                             core::IVenue& venue,
                             IClock& clock,
                             core::INotificationSink& notifier,
                             core::IDailyStatStore& stat_store,
                             core::IEventJournal* journal)
    : config_(config)
    , feed_(feed)
    , clock_(clock)
    , notifier_(notifier)
    , stat_store_(stat_store)
    , journal_(journal)
    , indicators_(config.indicators)
    , signals_(config.strategy, config.regime)
    , sizer_(config.sizing)
    , executor_(venue, clock, config.execution)
    , state_(config.position, config.accounting, clock) {
    LOG_INFO("TradingEngine created: {} {} mode={} strategy={} sizing={}",
             config_.symbol, config_.timeframe, toString(config_.mode),
             strategy::toString(config_.strategy.variant), risk::toString(config_.sizing.policy));
}

bool TradingEngine::start() {
    if (started_) {
        LOG_WARN("Engine already started");
        return true;
    }

    LOG_INFO("========================================");
    LOG_INFO("Starting trading engine");
    LOG_INFO("========================================");

    const auto errors = config_.validate();
    if (!errors.empty()) {
        for (const auto& e : errors) {
            LOG_ERROR("Configuration error: {}", e);
        }
        return false;
    }

    auto meta = executor_.getMarketMetadata(config_.symbol);
    if (!meta.ok()) {
        LOG_ERROR("Market metadata for {} unavailable: {} ({})", config_.symbol,
                  toString(meta.error().kind), meta.error().message);
        return false;
    }
    if (!meta.value().isValid()) {
        LOG_ERROR("Market metadata for {} is incomplete (tick={}, step={}, min={})", config_.symbol,
                  meta.value().tick_size, meta.value().qty_step, meta.value().min_qty);
        return false;
    }
    state_.market = meta.value();

    // The clock may have moved since construction (replay clocks are set late)
    state_.daily.rollIfNewDay();
    auto stored = stat_store_.load(state_.daily.today());
    if (stored) {
        state_.daily.restore(*stored);
    } else {
        LOG_INFO("No stored stats for {}, fresh day", state_.daily.today());
    }

    auto position = executor_.queryPosition(config_.symbol);
    if (position.ok()) {
        applyReconcile(position.value(), 0);
    } else if (position.isTransient()) {
        LOG_WARN("Startup position query failed transiently, reconciling on the first cycle");
    } else {
        LOG_ERROR("Position query rejected at startup: {}", position.error().message);
        return false;
    }

    started_ = true;
    notify("trendpilot started: " + config_.symbol + " " + config_.timeframe + " (" +
           strategy::toString(config_.strategy.variant) + ")");
    return true;
}

CycleOutcome TradingEngine::runCycle() {
    if (!started_) {
        return CycleOutcome::NOT_STARTED;
    }
    state_.cycles++;

    handleDayRollover();
    handleScheduledReport();

    TickData tick;
    if (!fetchTick(tick)) {
        return CycleOutcome::SKIPPED_TRANSIENT;
    }

    auto venue_position = executor_.queryPosition(config_.symbol);
    if (!venue_position.ok()) {
        LOG_WARN("Tick abandoned: position query failed ({})", venue_position.error().message);
        return CycleOutcome::SKIPPED_TRANSIENT;
    }
    // A close confirmed here counts as this cycle's exit
    bool exited = applyReconcile(venue_position.value(), tick.candles.back().timestamp) ==
                  ReconcileOutcome::EXIT_CONFIRMED;
    if (exited && state_.position.exitPending()) {
        // Venue is flat but the basket could not be valued yet
        return CycleOutcome::SKIPPED_TRANSIENT;
    }

    auto frames = indicators_.compute(tick.closed);
    if (!frames) {
        LOG_DEBUG("Insufficient history: {} closed bars, {} required",
                  tick.closed.size(), indicators_.requiredBars());
        return CycleOutcome::SKIPPED_NO_DATA;
    }

    bool unlocked = false;
    handleNewClosedBar(*frames, unlocked);

    const auto assessment = signals_.assess(*frames, tick.price);
    if (!assessment.valid) {
        return CycleOutcome::SKIPPED_NO_DATA;
    }

    if (state_.position.isOpen()) {
        manageOpenPosition(tick, *frames, assessment, exited);
    }

    if (state_.position.isLocked()) {
        if (assessment.entry.isEntry()) {
            LOG_DEBUG("Entry {} suppressed: post stop-loss lock active", toString(assessment.entry.direction));
        }
    } else if (unlocked) {
        LOG_DEBUG("Lock released this cycle, entries resume next cycle");
    } else if (state_.position.isFlat() && !exited) {
        tryEnter(tick, assessment);
    }

    return CycleOutcome::COMPLETED;
}

bool TradingEngine::fetchTick(TickData& tick) {
    const RetryPolicy policy = executor_.retryPolicy();

    auto candles = retryTransient(clock_, policy, "Candle fetch", [this]() {
        return feed_.fetchCandles(config_.symbol, config_.timeframe, config_.history_limit);
    });
    if (!candles.ok()) {
        LOG_WARN("Tick abandoned: candle fetch failed ({}: {})",
                 toString(candles.error().kind), candles.error().message);
        return false;
    }
    if (candles.value().empty()) {
        LOG_WARN("Tick abandoned: feed returned no candles");
        return false;
    }

    auto last = retryTransient(clock_, policy, "Last price", [this]() {
        return feed_.fetchLastPrice(config_.symbol);
    });
    if (!last.ok() || last.value() <= 0.0) {
        LOG_WARN("Tick abandoned: last price unavailable");
        return false;
    }

    tick.candles = std::move(candles.value());
    tick.closed = analytics::IndicatorEngine::closedOnly(tick.candles);
    tick.price = last.value();
    return true;
}

void TradingEngine::handleDayRollover() {
    risk::DailyStats finished;
    if (!state_.daily.rollIfNewDay(&finished)) {
        return;
    }

    if (!stat_store_.save(finished)) {
        LOG_WARN("Could not save stats for {}", finished.date);
    }
    journal(core::JournalEventType::DAY_ROLLED, {
        {"finished", finished.date},
        {"pnl", finished.realized_pnl},
        {"trades", finished.trades_today}
    });
    if (state_.last_report_day != finished.date) {
        notify(risk::formatDailyReport(finished));
    }
    persistStats();
}

void TradingEngine::handleScheduledReport() {
    if (!config_.daily_report_enabled) {
        return;
    }

    int hour = 0;
    int minute = 0;
    localHourMinute(clock_.now(), config_.accounting.utc_offset_minutes, hour, minute);
    if (hour * 60 + minute < config_.daily_report_hour * 60 + config_.daily_report_minute) {
        return;
    }

    const std::string today = state_.daily.today();
    if (state_.last_report_day == today) {
        return;
    }
    state_.last_report_day = today;
    notify(risk::formatDailyReport(state_.daily.stats()));
}

void TradingEngine::handleNewClosedBar(const std::vector<analytics::IndicatorFrame>& frames, bool& unlocked) {
    const auto& latest = frames.back();
    if (latest.timestamp <= state_.last_closed_bar) {
        return;
    }

    const bool first_bar = state_.last_closed_bar == 0;
    state_.last_closed_bar = latest.timestamp;
    if (first_bar) {
        return;
    }

    if (state_.position.onClosedBar(latest.close, latest.envelope_lower, latest.envelope_upper)) {
        unlocked = true;
        journal(core::JournalEventType::LOCK_CHANGED, {{"locked", false}, {"close", latest.close}});
    }
}

void TradingEngine::manageOpenPosition(const TickData& tick,
                                       const std::vector<analytics::IndicatorFrame>& frames,
                                       const strategy::TickAssessment& assessment,
                                       bool& exited) {
    auto& psm = state_.position;

    if (psm.exitPending()) {
        LOG_INFO("Retrying unconfirmed exit ({})", toString(psm.pendingExit()->reason));
        executeExit(*psm.pendingExit());
        exited = !psm.isOpen();
        return;
    }

    TickContext ctx;
    ctx.price = tick.price;
    const Candle& newest = tick.candles.back();
    if (!newest.closed) {
        ctx.bar_timestamp = newest.timestamp;
        ctx.bar_high = newest.high;
        ctx.bar_low = newest.low;
    } else {
        ctx.bar_high = tick.price;
        ctx.bar_low = tick.price;
    }

    const auto& current = frames.back();
    ctx.envelope_upper = current.envelope_upper;
    ctx.envelope_lower = current.envelope_lower;
    ctx.signal = assessment.entry.direction;
    ctx.trend = assessment.trend;

    if (psm.basket()) {
        auto equity = executor_.getEquity();
        if (equity.ok()) {
            ctx.equity = equity.value().total;
        } else {
            LOG_WARN("Equity unavailable, basket targets skipped this tick");
        }
    }

    const int step_before = psm.position()->trailing_step;
    const ExitDecision decision = psm.evaluate(ctx);

    const Position& pos = *psm.position();
    if (pos.trailing_step != step_before) {
        journal(core::JournalEventType::STOP_STEPPED, {
            {"step", pos.trailing_step},
            {"stop", pos.stop_price}
        });
    }

    if (decision.shouldExit()) {
        psm.markExitPending(decision);
        journal(core::JournalEventType::EXIT_REQUESTED, {
            {"reason", toString(decision.reason)},
            {"price", decision.fill_price},
            {"detail", decision.detail}
        });
        executeExit(decision);
        exited = !psm.isOpen();
        return;
    }

    if (config_.sizing.policy == risk::SizingPolicy::LADDER) {
        tryAddLeg(tick, frames);
    }
}

void TradingEngine::tryAddLeg(const TickData& tick, const std::vector<analytics::IndicatorFrame>& frames) {
    const Position pos = *state_.position.position();
    const long long bar = frames.back().timestamp;
    if (bar <= state_.last_leg_bar) {
        return;
    }
    if (!strategy::SignalGenerator::isAddLegConfirmation(pos.side, frames, tick.price)) {
        return;
    }

    auto equity = executor_.getEquity();
    if (!equity.ok()) {
        LOG_WARN("Add-leg skipped: equity unavailable ({})", equity.error().message);
        return;
    }
    if (!sizer_.canAddLeg(equity.value().total, pos.leg_count)) {
        LOG_DEBUG("Add-leg confirmation ignored: {} legs is the tier maximum", pos.leg_count);
        return;
    }

    const auto sizing = sizer_.sizeLadderLeg(equity.value().total, tick.price, pos.leg_count, state_.market);
    if (!sizing.tradable()) {
        LOG_DEBUG("Add-leg skipped: {}", sizing.reason);
        return;
    }

    auto fill = executor_.submitEntry(config_.symbol, pos.side, sizing.quantity, tick.price,
                                      state_.market, "add_leg");
    if (!fill.ok()) {
        LOG_WARN("Add-leg order failed: {}", fill.error().message);
        return;
    }

    const double margin = fill.value().quantity * fill.value().price / config_.sizing.leverage;
    if (state_.position.addLeg(pos.side, fill.value().price, fill.value().quantity, margin)) {
        state_.last_leg_bar = bar;
        journal(core::JournalEventType::LEG_ADDED, {
            {"leg", state_.position.position()->leg_count},
            {"price", fill.value().price},
            {"qty", fill.value().quantity}
        });
        notify("Leg added: " + toString(pos.side) + " " + config_.symbol + " @ " +
               formatPrice(fill.value().price));
    }
}

void TradingEngine::tryEnter(const TickData& tick, const strategy::TickAssessment& assessment) {
    if (!assessment.entry.isEntry()) {
        return;
    }
    if (state_.daily.entriesBlocked()) {
        LOG_DEBUG("Entry {} blocked: {}", toString(assessment.entry.direction),
                  state_.daily.isHalted() ? "halted" : "daily trade cap");
        return;
    }
    if (!state_.position.canEnter()) {
        LOG_DEBUG("Entry {} blocked: cooldown {}/{} bars", toString(assessment.entry.direction),
                  state_.position.barsSinceExit(), config_.position.cooldown_bars);
        return;
    }

    const Side side = *toSide(assessment.entry.direction);
    auto equity = executor_.getEquity();
    if (!equity.ok()) {
        LOG_WARN("Entry skipped: equity unavailable ({})", equity.error().message);
        return;
    }

    double stop = 0.0;
    if (config_.position.initial_stop_distance > 0.0) {
        stop = tick.price - sideSign(side) * config_.position.initial_stop_distance;
    }
    const auto sizing = sizer_.sizeEntry(equity.value(), tick.price, stop, state_.market);
    if (!sizing.tradable()) {
        LOG_INFO("Entry {} skipped: {}", toString(side), sizing.reason);
        return;
    }

    auto fill = executor_.submitEntry(config_.symbol, side, sizing.quantity, tick.price,
                                      state_.market, assessment.entry.strategy_name);
    if (!fill.ok()) {
        LOG_WARN("Entry abandoned: {} ({})", toString(fill.error().kind), fill.error().message);
        return;
    }

    const OrderFill& f = fill.value();
    const double margin = f.quantity * f.price / config_.sizing.leverage;
    std::optional<double> basket_equity;
    if (config_.sizing.policy == risk::SizingPolicy::LADDER) {
        basket_equity = equity.value().total;
    }

    if (!state_.position.openPosition(side, f.price, f.quantity, margin,
                                      tick.candles.back().timestamp, basket_equity)) {
        LOG_ERROR("Fill received but local open refused; venue reconciliation will adopt it");
        return;
    }
    state_.last_leg_bar = assessment.entry.bar_timestamp;
    state_.daily.recordEntry();

    journal(core::JournalEventType::POSITION_OPENED, {
        {"side", toString(side)},
        {"price", f.price},
        {"qty", f.quantity},
        {"stop", state_.position.position()->stop_price},
        {"strategy", assessment.entry.strategy_name},
        {"reason", assessment.entry.reason}
    });
    notify("Opened " + toString(side) + " " + config_.symbol + " @ " + formatPrice(f.price) +
           " (" + assessment.entry.reason + ")");
    persistStats();
}

void TradingEngine::executeExit(const ExitDecision& decision) {
    const Position pos = *state_.position.position();
    auto result = executor_.closePosition(config_.symbol, pos.side, pos.quantity,
                                          decision.fill_price, toString(decision.reason));
    if (!result.confirmed) {
        LOG_WARN("Exit {} not confirmed, position kept and retried next cycle", toString(decision.reason));
        return;
    }

    double fill_price = decision.fill_price;
    if (result.order_filled && !isStopExit(decision.reason)) {
        fill_price = result.fill_price;
    }
    if (!finalizeExit(fill_price)) {
        LOG_INFO("Close of {} filled, booking deferred to the next reconcile", config_.symbol);
    }
}

bool TradingEngine::finalizeExit(double fill_price) {
    std::optional<double> equity_now;
    if (state_.position.basket()) {
        auto equity = executor_.getEquity();
        if (!equity.ok()) {
            LOG_WARN("Equity unavailable at basket close ({}), exit kept pending", equity.error().message);
            return false;
        }
        equity_now = equity.value().total;
    }

    const bool was_halted = state_.daily.isHalted();
    const ClosedPosition closed = state_.position.onExitConfirmed(fill_price, equity_now);
    state_.closed_positions.push_back(closed);

    risk::TradeRecord record;
    record.time = state_.daily.nowTimeOfDay();
    record.side = toString(closed.side);
    record.entry_price = closed.entry_price;
    record.exit_price = closed.exit_price;
    record.quantity = closed.quantity;
    record.pnl = closed.pnl;
    record.reason = toString(closed.reason);
    state_.daily.recordExit(record);
    state_.history.push_back(record);

    Logger::getInstance().logTrade(config_.symbol, record.side, record.entry_price, record.exit_price,
                                   record.quantity, record.pnl, record.reason);
    journal(core::JournalEventType::POSITION_CLOSED, {
        {"side", record.side},
        {"entry", record.entry_price},
        {"exit", record.exit_price},
        {"qty", record.quantity},
        {"legs", closed.legs},
        {"pnl", record.pnl},
        {"reason", record.reason}
    });

    char buf[160];
    std::snprintf(buf, sizeof(buf), "Closed %s %s %.2f -> %.2f, pnl %+.2f (%s)",
                  record.side.c_str(), config_.symbol.c_str(), record.entry_price,
                  record.exit_price, record.pnl, record.reason.c_str());
    notify(buf);

    if (!was_halted && state_.daily.isHalted()) {
        journal(core::JournalEventType::HALTED, {{"loss_streak", state_.daily.stats().loss_streak}});
        notify("Trading halted for today after " + std::to_string(state_.daily.stats().loss_streak) +
               " consecutive losses");
    }
    if (state_.position.isLocked()) {
        journal(core::JournalEventType::LOCK_CHANGED, {{"locked", true}});
    }
    persistStats();
    return true;
}

ReconcileOutcome TradingEngine::applyReconcile(const std::optional<VenuePosition>& venue_position,
                                               long long bar_timestamp) {
    const ReconcileOutcome outcome = state_.position.reconcile(venue_position, bar_timestamp);
    switch (outcome) {
        case ReconcileOutcome::EXIT_CONFIRMED:
            LOG_INFO("Venue shows the pending exit completed");
            if (!finalizeExit(state_.position.pendingExit()->fill_price)) {
                LOG_WARN("Confirmed exit not booked yet, retrying next cycle");
            }
            break;
        case ReconcileOutcome::CORRECTED_TO_FLAT:
            journal(core::JournalEventType::STATE_CORRECTED, {{"to", "flat"}});
            break;
        case ReconcileOutcome::ADOPTED:
            journal(core::JournalEventType::STATE_CORRECTED, {
                {"to", "open"},
                {"side", toString(venue_position->side)},
                {"qty", venue_position->quantity},
                {"entry", venue_position->entry_price}
            });
            break;
        case ReconcileOutcome::QUANTITY_SYNCED:
        case ReconcileOutcome::IN_SYNC:
            break;
    }
    return outcome;
}

void TradingEngine::journal(core::JournalEventType type, nlohmann::json payload) {
    if (!journal_) {
        return;
    }
    core::JournalEvent event;
    event.ts_ms = clock_.nowMs();
    event.type = type;
    event.symbol = config_.symbol;
    event.payload = std::move(payload);
    if (!journal_->append(event)) {
        LOG_WARN("Journal append failed");
    }
}

void TradingEngine::notify(const std::string& text) {
    if (!notifier_.send(text)) {
        LOG_WARN("Notification delivery failed");
    }
}

void TradingEngine::persistStats() {
    if (!stat_store_.save(state_.daily.stats())) {
        LOG_WARN("Daily stats could not be saved");
    }
}

} // namespace engine
} // namespace trendpilot
