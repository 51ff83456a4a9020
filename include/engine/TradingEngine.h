#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "analytics/IndicatorEngine.h"
#include "common/Clock.h"
#include "common/Types.h"
#include "core/contracts/IDailyStatStore.h"
#include "core/contracts/IEventJournal.h"
#include "core/contracts/IMarketDataFeed.h"
#include "core/contracts/INotificationSink.h"
#include "core/contracts/IVenue.h"
#include "engine/EngineConfig.h"
#include "engine/PositionStateMachine.h"
#include "execution/OrderExecutor.h"
#include "risk/DailyAccounting.h"
#include "risk/RiskSizer.h"
#include "strategy/SignalGenerator.h"

namespace trendpilot {
namespace engine {

enum class CycleOutcome {
    COMPLETED,
    SKIPPED_TRANSIENT,          // a collaborator kept failing, tick abandoned
    SKIPPED_NO_DATA,            // not enough closed bars for the indicators
    NOT_STARTED
};

const char* toString(CycleOutcome outcome);

// Mutable state of one running scheduler; nothing outside this object
// survives between cycles
struct EngineState {
    PositionStateMachine position;
    risk::DailyAccounting daily;
    MarketMetadata market;
    long long last_closed_bar = 0;
    long long last_leg_bar = 0;         // closed bar that confirmed the latest leg
    std::string last_report_day;        // day the scheduled report went out
    std::vector<risk::TradeRecord> history;
    std::vector<ClosedPosition> closed_positions;
    int cycles = 0;

    EngineState(const PositionConfig& position_config,
                const risk::DailyAccountingConfig& accounting_config,
                const IClock& clock)
        : position(position_config)
        , daily(accounting_config, clock) {}
};

// Single-threaded tick scheduler:
// fetch -> indicators -> signal -> position management -> accounting
class TradingEngine {
public:
    TradingEngine(const EngineConfig& config,
                  core::IMarketDataFeed& feed,
                  core::IVenue& venue,
                  IClock& clock,
                  core::INotificationSink& notifier,
                  core::IDailyStatStore& stat_store,
                  core::IEventJournal* journal = nullptr);

    // Validates configuration, loads market metadata, restores today's stats
    // and reconciles against the venue. false = fatal, do not run.
    bool start();

    // One full decision cycle
    CycleOutcome runCycle();

    bool isStarted() const { return started_; }

    const EngineState& state() const { return state_; }
    const EngineConfig& config() const { return config_; }

private:
    struct TickData {
        std::vector<Candle> candles;
        std::vector<Candle> closed;
        double price = 0.0;
    };

    bool fetchTick(TickData& tick);
    void handleDayRollover();
    void handleScheduledReport();
    void handleNewClosedBar(const std::vector<analytics::IndicatorFrame>& frames, bool& unlocked);

    void manageOpenPosition(const TickData& tick,
                            const std::vector<analytics::IndicatorFrame>& frames,
                            const strategy::TickAssessment& assessment,
                            bool& exited);
    void tryAddLeg(const TickData& tick, const std::vector<analytics::IndicatorFrame>& frames);
    void tryEnter(const TickData& tick, const strategy::TickAssessment& assessment);

    void executeExit(const ExitDecision& decision);
    // false when a basket close could not be valued; the exit stays pending
    bool finalizeExit(double fill_price);
    ReconcileOutcome applyReconcile(const std::optional<VenuePosition>& venue_position, long long bar_timestamp);

    void journal(core::JournalEventType type, nlohmann::json payload);
    void notify(const std::string& text);
    void persistStats();

    EngineConfig config_;
    core::IMarketDataFeed& feed_;
    IClock& clock_;
    core::INotificationSink& notifier_;
    core::IDailyStatStore& stat_store_;
    core::IEventJournal* journal_;

    analytics::IndicatorEngine indicators_;
    strategy::SignalGenerator signals_;
    risk::RiskSizer sizer_;
    execution::OrderExecutor executor_;

    EngineState state_;
    bool started_ = false;
};

} // namespace engine
} // namespace trendpilot
