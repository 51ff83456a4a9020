#include "engine/PositionStateMachine.h"
#include "common/Logger.h"
#include <algorithm>
#include <cmath>
#include <limits>

namespace trendpilot {
namespace engine {

const char* toString(PositionState state) {
    switch (state) {
        case PositionState::FLAT: return "FLAT";
        case PositionState::OPEN: return "OPEN";
        case PositionState::LOCKED: return "LOCKED";
    }
    return "FLAT";
}

const char* toString(ExitReason reason) {
    switch (reason) {
        case ExitReason::NONE: return "none";
        case ExitReason::STOP_LOSS: return "stop_loss";
        case ExitReason::TRAILING_PROFIT: return "trailing_profit";
        case ExitReason::ENVELOPE_TARGET: return "envelope_target";
        case ExitReason::BASKET_TARGET: return "basket_target";
        case ExitReason::BASKET_STOP: return "basket_stop";
        case ExitReason::OPPOSING_SIGNAL: return "opposing_signal";
        case ExitReason::TREND_FLIP: return "trend_flip";
    }
    return "none";
}

const char* toString(ReconcileOutcome outcome) {
    switch (outcome) {
        case ReconcileOutcome::IN_SYNC: return "in_sync";
        case ReconcileOutcome::CORRECTED_TO_FLAT: return "corrected_to_flat";
        case ReconcileOutcome::EXIT_CONFIRMED: return "exit_confirmed";
        case ReconcileOutcome::ADOPTED: return "adopted";
        case ReconcileOutcome::QUANTITY_SYNCED: return "quantity_synced";
    }
    return "in_sync";
}

PositionStateMachine::PositionStateMachine(const PositionConfig& config)
    : config_(config)
    , bars_since_exit_(std::numeric_limits<int>::max() / 2) {
}

double PositionStateMachine::initialStop(Side side, double entry_price) const {
    if (config_.initial_stop_distance <= 0.0) {
        return 0.0;
    }
    return entry_price - sideSign(side) * config_.initial_stop_distance;
}

bool PositionStateMachine::canEnter() const {
    if (state_ != PositionState::FLAT || pending_exit_) {
        return false;
    }
    return bars_since_exit_ >= config_.cooldown_bars;
}

bool PositionStateMachine::openPosition(Side side, double price, double quantity, double margin,
                                        long long bar_timestamp, std::optional<double> basket_equity) {
    if (state_ != PositionState::FLAT) {
        LOG_WARN("Open refused: state is {}", toString(state_));
        return false;
    }
    if (quantity <= 0.0 || price <= 0.0) {
        LOG_WARN("Open refused: invalid fill qty={} price={}", quantity, price);
        return false;
    }

    Position pos;
    pos.side = side;
    pos.entry_price = price;
    pos.quantity = quantity;
    pos.stop_price = initialStop(side, price);
    pos.trailing_step = 0;
    pos.leg_count = 1;
    pos.margin_committed = margin;
    pos.entry_bar = bar_timestamp;
    position_ = pos;

    basket_.reset();
    if (basket_equity) {
        Basket basket;
        basket.equity_at_open = *basket_equity;
        basket.target_fraction = config_.basket_target_fraction;
        basket.stop_fraction = config_.basket_stop_fraction;
        basket.legs.push_back(Leg{price, quantity});
        basket_ = basket;
    }

    state_ = PositionState::OPEN;
    pending_exit_.reset();

    LOG_INFO("Position opened: {} qty={:.6f} entry={:.2f} stop={:.2f}{}",
             toString(side), quantity, price, pos.stop_price,
             basket_ ? " (basket)" : "");
    return true;
}

bool PositionStateMachine::addLeg(Side side, double price, double quantity, double margin) {
    if (state_ != PositionState::OPEN || !position_ || pending_exit_) {
        return false;
    }
    if (side != position_->side) {
        LOG_WARN("Add-leg refused: {} leg on a {} position", toString(side), toString(position_->side));
        return false;
    }
    if (quantity <= 0.0) {
        return false;
    }

    position_->quantity += quantity;
    position_->margin_committed += margin;
    position_->leg_count++;
    if (basket_) {
        basket_->legs.push_back(Leg{price, quantity});
    }

    LOG_INFO("Leg {} added: {} qty={:.6f} @ {:.2f} (total qty {:.6f})",
             position_->leg_count, toString(side), quantity, price, position_->quantity);
    return true;
}

bool PositionStateMachine::advanceTrailing(double favorable_extreme) {
    Position& pos = *position_;
    double excursion = (favorable_extreme - pos.entry_price) * sideSign(pos.side);
    bool stepped = false;

    while (pos.trailing_step < static_cast<int>(config_.trailing_steps.size())) {
        const TrailingStep& next = config_.trailing_steps[pos.trailing_step];
        if (excursion < next.trigger) {
            break;
        }
        pos.trailing_step++;
        pos.stop_price = pos.entry_price + sideSign(pos.side) * next.stop_offset;
        stepped = true;
        LOG_INFO("Trailing step {} reached (excursion {:.2f} >= {:.2f}): stop -> {:.2f}",
                 pos.trailing_step, excursion, next.trigger, pos.stop_price);
    }
    return stepped;
}

ExitDecision PositionStateMachine::evaluate(const TickContext& ctx) {
    ExitDecision decision;
    if (state_ != PositionState::OPEN || !position_) {
        return decision;
    }
    if (pending_exit_) {
        return *pending_exit_;
    }

    Position& pos = *position_;
    const int sign = sideSign(pos.side);

    // Extremes of the entry bar may predate the fill
    double high = ctx.bar_high;
    double low = ctx.bar_low;
    if (ctx.bar_timestamp == pos.entry_bar || high <= 0.0 || low <= 0.0) {
        high = ctx.price;
        low = ctx.price;
    }
    high = std::max(high, ctx.price);
    low = std::min(low, ctx.price);

    const double favorable = pos.side == Side::LONG ? high : low;
    const double adverse = pos.side == Side::LONG ? low : high;

    advanceTrailing(favorable);

    if (pos.hasStop()) {
        bool breached = pos.side == Side::LONG ? adverse <= pos.stop_price
                                               : adverse >= pos.stop_price;
        if (breached) {
            double locked_in = (pos.stop_price - pos.entry_price) * sign;
            decision.reason = locked_in > 0.0 ? ExitReason::TRAILING_PROFIT : ExitReason::STOP_LOSS;
            decision.fill_price = pos.stop_price;
            decision.detail = "stop " + std::to_string(pos.stop_price) +
                              " breached at step " + std::to_string(pos.trailing_step);
            return decision;
        }
    }

    if (basket_ && ctx.equity && basket_->equity_at_open > 0.0) {
        double change = (*ctx.equity - basket_->equity_at_open) / basket_->equity_at_open;
        if (basket_->stop_fraction > 0.0 && change <= -basket_->stop_fraction) {
            decision.reason = ExitReason::BASKET_STOP;
            decision.fill_price = ctx.price;
            decision.detail = "basket equity change " + std::to_string(change);
            return decision;
        }
        if (basket_->target_fraction > 0.0 && change >= basket_->target_fraction) {
            decision.reason = ExitReason::BASKET_TARGET;
            decision.fill_price = ctx.price;
            decision.detail = "basket equity change " + std::to_string(change);
            return decision;
        }
    }

    if (config_.envelope_target && ctx.envelope_upper && ctx.envelope_lower) {
        bool reached = pos.side == Side::LONG ? ctx.price >= *ctx.envelope_upper
                                              : ctx.price <= *ctx.envelope_lower;
        if (reached) {
            decision.reason = ExitReason::ENVELOPE_TARGET;
            decision.fill_price = ctx.price;
            decision.detail = "opposite band reached";
            return decision;
        }
    }

    const Direction against = toDirection(opposite(pos.side));
    if (config_.exit_on_opposing_signal && ctx.signal == against) {
        decision.reason = ExitReason::OPPOSING_SIGNAL;
        decision.fill_price = ctx.price;
        decision.detail = "opposing " + toString(ctx.signal) + " signal";
        return decision;
    }

    if (config_.exit_on_trend_flip) {
        analytics::TrendDirection bad = pos.side == Side::LONG ? analytics::TrendDirection::DOWN
                                                               : analytics::TrendDirection::UP;
        if (ctx.trend == bad) {
            decision.reason = ExitReason::TREND_FLIP;
            decision.fill_price = ctx.price;
            decision.detail = std::string("trend turned ") + analytics::toString(ctx.trend);
            return decision;
        }
    }

    return decision;
}

void PositionStateMachine::markExitPending(const ExitDecision& decision) {
    if (state_ != PositionState::OPEN || pending_exit_) {
        return;
    }
    pending_exit_ = decision;
    LOG_INFO("Exit pending: {} @ {:.2f} ({})", toString(decision.reason),
             decision.fill_price, decision.detail);
}

ClosedPosition PositionStateMachine::onExitConfirmed(double fill_price, std::optional<double> equity_now) {
    ClosedPosition closed;
    if (!position_) {
        return closed;
    }

    const Position& pos = *position_;
    closed.side = pos.side;
    closed.entry_price = pos.entry_price;
    closed.exit_price = fill_price;
    closed.quantity = pos.quantity;
    closed.legs = pos.leg_count;
    closed.reason = pending_exit_ ? pending_exit_->reason : ExitReason::NONE;

    if (basket_ && equity_now) {
        closed.pnl = *equity_now - basket_->equity_at_open;
    } else if (basket_) {
        closed.pnl = 0.0;
        for (const Leg& leg : basket_->legs) {
            closed.pnl += (fill_price - leg.price) * leg.quantity * sideSign(pos.side);
        }
    } else {
        closed.pnl = (fill_price - pos.entry_price) * pos.quantity * sideSign(pos.side);
    }

    // Stop exits are classified by the realized sign, not by trailing stage
    if (closed.reason == ExitReason::STOP_LOSS || closed.reason == ExitReason::TRAILING_PROFIT) {
        closed.reason = closed.pnl > 0.0 ? ExitReason::TRAILING_PROFIT : ExitReason::STOP_LOSS;
    }
    closed.stop_loss = closed.reason == ExitReason::STOP_LOSS || closed.reason == ExitReason::BASKET_STOP;

    LOG_INFO("Position closed: {} {:.6f} {:.2f} -> {:.2f}, pnl {:+.2f} ({})",
             toString(closed.side), closed.quantity, closed.entry_price, closed.exit_price,
             closed.pnl, toString(closed.reason));

    resetToFlat();
    if (closed.stop_loss && config_.lock_after_stop_loss) {
        state_ = PositionState::LOCKED;
        LOG_INFO("Post stop-loss lock engaged: waiting for a close inside the envelope");
    }
    return closed;
}

void PositionStateMachine::resetToFlat() {
    position_.reset();
    basket_.reset();
    pending_exit_.reset();
    state_ = PositionState::FLAT;
    bars_since_exit_ = 0;
}

bool PositionStateMachine::onClosedBar(double close, std::optional<double> envelope_lower,
                                       std::optional<double> envelope_upper) {
    if (state_ == PositionState::FLAT || state_ == PositionState::LOCKED) {
        if (bars_since_exit_ < std::numeric_limits<int>::max() / 2) {
            bars_since_exit_++;
        }
    }

    if (state_ != PositionState::LOCKED || !envelope_lower || !envelope_upper) {
        return false;
    }
    if (close >= *envelope_lower && close <= *envelope_upper) {
        state_ = PositionState::FLAT;
        LOG_INFO("Lock released: close {:.2f} inside [{:.2f}, {:.2f}]",
                 close, *envelope_lower, *envelope_upper);
        return true;
    }
    return false;
}

ReconcileOutcome PositionStateMachine::reconcile(const std::optional<VenuePosition>& venue,
                                                 long long bar_timestamp) {
    if (!venue || venue->quantity <= 0.0) {
        if (state_ != PositionState::OPEN) {
            return ReconcileOutcome::IN_SYNC;
        }
        if (pending_exit_) {
            return ReconcileOutcome::EXIT_CONFIRMED;
        }
        LOG_WARN("State desync: local {} position but venue reports none, correcting to FLAT",
                 toString(position_->side));
        resetToFlat();
        return ReconcileOutcome::CORRECTED_TO_FLAT;
    }

    if (state_ == PositionState::OPEN && position_ && position_->side == venue->side) {
        if (std::fabs(position_->quantity - venue->quantity) > 1e-12) {
            syncQuantity(venue->quantity);
            return ReconcileOutcome::QUANTITY_SYNCED;
        }
        return ReconcileOutcome::IN_SYNC;
    }

    LOG_WARN("State desync: adopting venue {} position qty={:.6f} entry={:.2f} (local {})",
             toString(venue->side), venue->quantity, venue->entry_price, toString(state_));
    Position pos;
    pos.side = venue->side;
    pos.entry_price = venue->entry_price;
    pos.quantity = venue->quantity;
    pos.stop_price = initialStop(venue->side, venue->entry_price);
    pos.leg_count = 1;
    pos.entry_bar = bar_timestamp;
    position_ = pos;
    basket_.reset();
    pending_exit_.reset();
    state_ = PositionState::OPEN;
    return ReconcileOutcome::ADOPTED;
}

void PositionStateMachine::syncQuantity(double quantity) {
    if (!position_ || quantity <= 0.0) {
        return;
    }
    if (std::fabs(position_->quantity - quantity) > 1e-12) {
        LOG_INFO("Position quantity synced from venue: {:.6f} -> {:.6f}", position_->quantity, quantity);
        position_->quantity = quantity;
    }
}

} // namespace engine
} // namespace trendpilot
