#pragma once

#include "common/Types.h"
#include "analytics/RegimeDetector.h"
#include <optional>
#include <string>
#include <vector>

namespace trendpilot {
namespace engine {

enum class PositionState { FLAT, OPEN, LOCKED };

enum class ExitReason {
    NONE,
    STOP_LOSS,              // stop breached at a loss (or breakeven)
    TRAILING_PROFIT,        // stop breached after trailing moved it into profit
    ENVELOPE_TARGET,        // price reached the opposite envelope band
    BASKET_TARGET,          // basket equity gain reached target_fraction
    BASKET_STOP,            // basket equity loss reached stop_fraction
    OPPOSING_SIGNAL,        // entry signal in the other direction
    TREND_FLIP              // EMA trend turned against the position
};

const char* toString(PositionState state);
const char* toString(ExitReason reason);

// One trailing stage: once favorable excursion (points) reaches `trigger`,
// the stop moves to entry + side_sign * stop_offset
struct TrailingStep {
    double trigger = 0.0;
    double stop_offset = 0.0;
};

struct PositionConfig {
    double initial_stop_distance = 300.0;   // points from entry, <= 0 disables the price stop
    std::vector<TrailingStep> trailing_steps;
    int cooldown_bars = 0;                  // closed bars after an exit before re-entry
    bool lock_after_stop_loss = false;
    bool envelope_target = true;
    bool exit_on_opposing_signal = true;
    bool exit_on_trend_flip = true;
    double basket_target_fraction = 0.0;    // 0 disables
    double basket_stop_fraction = 0.0;      // 0 disables
};

struct Leg {
    double price = 0.0;
    double quantity = 0.0;
};

struct Position {
    Side side = Side::LONG;
    double entry_price = 0.0;
    double quantity = 0.0;
    double stop_price = 0.0;
    int trailing_step = 0;
    int leg_count = 0;
    double margin_committed = 0.0;
    long long entry_bar = 0;                // timestamp of the bar the entry happened in

    bool hasStop() const { return stop_price > 0.0; }
};

struct Basket {
    double equity_at_open = 0.0;
    double target_fraction = 0.0;
    double stop_fraction = 0.0;
    std::vector<Leg> legs;
};

// Market view for one evaluation tick
struct TickContext {
    double price = 0.0;
    long long bar_timestamp = 0;            // bar the extremes belong to
    double bar_high = 0.0;
    double bar_low = 0.0;
    std::optional<double> envelope_upper;
    std::optional<double> envelope_lower;
    Direction signal = Direction::NONE;
    analytics::TrendDirection trend = analytics::TrendDirection::NONE;
    std::optional<double> equity;           // total equity, needed for baskets
};

struct ExitDecision {
    ExitReason reason = ExitReason::NONE;
    double fill_price = 0.0;                // expected fill; stop exits fill at the stop
    std::string detail;

    bool shouldExit() const { return reason != ExitReason::NONE; }
};

struct ClosedPosition {
    Side side = Side::LONG;
    double entry_price = 0.0;
    double exit_price = 0.0;
    double quantity = 0.0;
    int legs = 0;
    double pnl = 0.0;
    ExitReason reason = ExitReason::NONE;
    bool stop_loss = false;                 // drives the post-stop lock
};

enum class ReconcileOutcome {
    IN_SYNC,
    CORRECTED_TO_FLAT,      // local open, venue none
    EXIT_CONFIRMED,         // pending close observed as done by the venue
    ADOPTED,                // venue position replaced local state
    QUANTITY_SYNCED
};

const char* toString(ReconcileOutcome outcome);

// Lifecycle of the single position (or basket) for one symbol
class PositionStateMachine {
public:
    explicit PositionStateMachine(const PositionConfig& config);

    PositionState state() const { return state_; }
    bool isFlat() const { return state_ == PositionState::FLAT; }
    bool isOpen() const { return state_ == PositionState::OPEN; }
    bool isLocked() const { return state_ == PositionState::LOCKED; }

    const std::optional<Position>& position() const { return position_; }
    const std::optional<Basket>& basket() const { return basket_; }

    // FLAT, no pending exit and cooldown elapsed
    bool canEnter() const;
    int barsSinceExit() const { return bars_since_exit_; }

    // FLAT -> OPEN(0). basket_equity starts a basket; its P&L is the equity change
    // and the fractions only arm the basket target/stop exits
    bool openPosition(Side side, double price, double quantity, double margin,
                      long long bar_timestamp, std::optional<double> basket_equity = std::nullopt);

    // Appends a leg; side must match, entry_price stays as opened
    bool addLeg(Side side, double price, double quantity, double margin);

    // Trailing steps, then stop breach, basket stop, targets, signal exits
    ExitDecision evaluate(const TickContext& ctx);

    bool exitPending() const { return pending_exit_.has_value(); }
    const std::optional<ExitDecision>& pendingExit() const { return pending_exit_; }
    void markExitPending(const ExitDecision& decision);

    // OPEN -> FLAT (or LOCKED). equity_now is used for basket P&L; without it a
    // basket is valued leg by leg at fill_price
    ClosedPosition onExitConfirmed(double fill_price, std::optional<double> equity_now = std::nullopt);

    // Called once per newly closed bar; returns true when a lock was released
    bool onClosedBar(double close, std::optional<double> envelope_lower,
                     std::optional<double> envelope_upper);

    ReconcileOutcome reconcile(const std::optional<VenuePosition>& venue, long long bar_timestamp);

    // Venue-reported quantity replaces the local one while open
    void syncQuantity(double quantity);

    const PositionConfig& config() const { return config_; }

private:
    double initialStop(Side side, double entry_price) const;
    bool advanceTrailing(double favorable_extreme);
    void resetToFlat();

    PositionConfig config_;
    PositionState state_ = PositionState::FLAT;
    std::optional<Position> position_;
    std::optional<Basket> basket_;
    std::optional<ExitDecision> pending_exit_;
    int bars_since_exit_;
};

} // namespace engine
} // namespace trendpilot
