#include "engine/PositionStateMachine.h"

#include <cassert>
#include <cmath>
#include <iostream>

using namespace trendpilot;
using namespace trendpilot::engine;
using trendpilot::analytics::TrendDirection;

namespace {

bool near(double a, double b, double eps = 1e-9) {
    return std::abs(a - b) < eps;
}

TickContext tick(double price, long long bar_ts, double high, double low) {
    TickContext ctx;
    ctx.price = price;
    ctx.bar_timestamp = bar_ts;
    ctx.bar_high = high;
    ctx.bar_low = low;
    return ctx;
}

PositionConfig basicConfig() {
    PositionConfig cfg;
    cfg.initial_stop_distance = 10.0;
    cfg.envelope_target = false;
    cfg.exit_on_opposing_signal = false;
    cfg.exit_on_trend_flip = false;
    return cfg;
}

} // namespace

int main() {
    // Stop breach intrabar fills at the stop, not at the bar low
    {
        PositionStateMachine psm(basicConfig());
        assert(psm.canEnter());
        assert(psm.openPosition(Side::LONG, 100.0, 1.0, 10.0, 1000));
        assert(psm.isOpen());
        assert(near(psm.position()->stop_price, 90.0));

        // Extremes of the entry bar are ignored
        assert(!psm.evaluate(tick(99.0, 1000, 101.0, 85.0)).shouldExit());

        auto d = psm.evaluate(tick(92.0, 2000, 101.0, 85.0));
        assert(d.shouldExit());
        assert(d.reason == ExitReason::STOP_LOSS);
        assert(near(d.fill_price, 90.0));

        psm.markExitPending(d);
        assert(psm.exitPending());
        assert(!psm.canEnter());

        auto closed = psm.onExitConfirmed(d.fill_price);
        assert(near(closed.pnl, -10.0));
        assert(closed.stop_loss);
        assert(closed.reason == ExitReason::STOP_LOSS);
        assert(psm.isFlat());
        assert(!psm.position().has_value());
    }

    // Short stop sits above entry
    {
        PositionStateMachine psm(basicConfig());
        assert(psm.openPosition(Side::SHORT, 100.0, 2.0, 10.0, 1000));
        assert(near(psm.position()->stop_price, 110.0));
        auto d = psm.evaluate(tick(108.0, 2000, 112.0, 99.0));
        assert(d.reason == ExitReason::STOP_LOSS);
        assert(near(d.fill_price, 110.0));
        psm.markExitPending(d);
        assert(near(psm.onExitConfirmed(110.0).pnl, -20.0));
    }

    // Trailing stage never goes back on a smaller excursion
    {
        PositionConfig cfg = basicConfig();
        cfg.trailing_steps = {TrailingStep{5.0, -2.0}, TrailingStep{10.0, 3.0}};
        PositionStateMachine psm(cfg);
        assert(psm.openPosition(Side::LONG, 100.0, 1.0, 10.0, 1000));

        assert(!psm.evaluate(tick(105.0, 2000, 106.0, 99.0)).shouldExit());
        assert(psm.position()->trailing_step == 1);
        assert(near(psm.position()->stop_price, 98.0));

        assert(!psm.evaluate(tick(110.0, 3000, 111.0, 104.0)).shouldExit());
        assert(psm.position()->trailing_step == 2);
        assert(near(psm.position()->stop_price, 103.0));

        // A smaller excursion later does not move the stop back
        auto d = psm.evaluate(tick(96.0, 4000, 105.0, 95.0));
        assert(psm.position()->trailing_step == 2);
        assert(d.reason == ExitReason::TRAILING_PROFIT);
        assert(near(d.fill_price, 103.0));

        psm.markExitPending(d);
        auto closed = psm.onExitConfirmed(103.0);
        assert(closed.reason == ExitReason::TRAILING_PROFIT);
        assert(!closed.stop_loss);
        assert(near(closed.pnl, 3.0));
    }

    // A later step may loosen the stop; offsets apply exactly as configured
    {
        PositionConfig cfg = basicConfig();
        cfg.trailing_steps = {TrailingStep{5.0, 4.0}, TrailingStep{10.0, 1.0}};
        PositionStateMachine psm(cfg);
        assert(psm.openPosition(Side::LONG, 100.0, 1.0, 10.0, 1000));

        assert(!psm.evaluate(tick(105.0, 2000, 106.0, 104.5)).shouldExit());
        assert(psm.position()->trailing_step == 1);
        assert(near(psm.position()->stop_price, 104.0));

        assert(!psm.evaluate(tick(110.0, 3000, 111.0, 105.0)).shouldExit());
        assert(psm.position()->trailing_step == 2);
        assert(near(psm.position()->stop_price, 101.0));

        // 102 is below the first-step stop but above the current one
        assert(!psm.evaluate(tick(103.0, 4000, 104.0, 102.0)).shouldExit());
        assert(psm.position()->trailing_step == 2);
        assert(near(psm.position()->stop_price, 101.0));

        auto d = psm.evaluate(tick(100.5, 5000, 103.0, 100.5));
        assert(psm.position()->trailing_step == 2);
        assert(d.reason == ExitReason::TRAILING_PROFIT);
        assert(near(d.fill_price, 101.0));
    }

    // Step and breach inside one bar produce a single exit
    {
        PositionConfig cfg = basicConfig();
        cfg.trailing_steps = {TrailingStep{10.0, 3.0}};
        PositionStateMachine psm(cfg);
        assert(psm.openPosition(Side::LONG, 100.0, 1.0, 10.0, 1000));

        auto d = psm.evaluate(tick(102.0, 2000, 112.0, 101.0));
        assert(d.reason == ExitReason::TRAILING_PROFIT);
        assert(near(d.fill_price, 103.0));
        psm.markExitPending(d);

        auto again = psm.evaluate(tick(101.0, 2000, 112.0, 101.0));
        assert(again.reason == d.reason);
        assert(near(again.fill_price, d.fill_price));
        assert(psm.position()->trailing_step == 1);

        // A second mark while pending is ignored
        ExitDecision other;
        other.reason = ExitReason::TREND_FLIP;
        psm.markExitPending(other);
        assert(psm.pendingExit()->reason == ExitReason::TRAILING_PROFIT);
    }

    // Stop exit realized at a gain after slippage is reported as profit
    {
        PositionStateMachine psm(basicConfig());
        assert(psm.openPosition(Side::LONG, 100.0, 1.0, 10.0, 1000));
        auto d = psm.evaluate(tick(89.0, 2000, 100.0, 89.0));
        assert(d.reason == ExitReason::STOP_LOSS);
        psm.markExitPending(d);
        auto closed = psm.onExitConfirmed(100.5);
        assert(closed.reason == ExitReason::TRAILING_PROFIT);
        assert(!closed.stop_loss);
    }

    // Lock after a stop loss; release only on a closed bar inside the envelope
    {
        PositionConfig cfg = basicConfig();
        cfg.lock_after_stop_loss = true;
        PositionStateMachine psm(cfg);
        assert(psm.openPosition(Side::LONG, 100.0, 1.0, 10.0, 1000));
        auto d = psm.evaluate(tick(88.0, 2000, 100.0, 88.0));
        psm.markExitPending(d);
        psm.onExitConfirmed(90.0);

        assert(psm.isLocked());
        assert(!psm.canEnter());
        assert(!psm.openPosition(Side::LONG, 90.0, 1.0, 10.0, 3000));

        assert(!psm.onClosedBar(80.0, 85.0, 95.0));
        assert(psm.isLocked());
        assert(!psm.onClosedBar(90.0, std::nullopt, std::nullopt));
        assert(psm.isLocked());
        assert(psm.onClosedBar(85.0, 85.0, 95.0));
        assert(psm.isFlat());
        assert(psm.canEnter());
    }

    // Cooldown counts closed bars after an exit
    {
        PositionConfig cfg = basicConfig();
        cfg.cooldown_bars = 2;
        cfg.exit_on_trend_flip = true;
        PositionStateMachine psm(cfg);
        assert(psm.canEnter());
        assert(psm.openPosition(Side::LONG, 100.0, 1.0, 10.0, 1000));

        TickContext ctx = tick(101.0, 2000, 101.0, 100.0);
        ctx.trend = TrendDirection::DOWN;
        auto d = psm.evaluate(ctx);
        assert(d.reason == ExitReason::TREND_FLIP);
        psm.markExitPending(d);
        auto closed = psm.onExitConfirmed(101.0);
        assert(!closed.stop_loss);
        assert(psm.isFlat());

        assert(!psm.canEnter());
        psm.onClosedBar(101.0, std::nullopt, std::nullopt);
        assert(!psm.canEnter());
        psm.onClosedBar(101.0, std::nullopt, std::nullopt);
        assert(psm.canEnter());
    }

    // Legs must match the open side; entry price stays as opened
    {
        PositionStateMachine psm(basicConfig());
        assert(!psm.addLeg(Side::LONG, 100.0, 1.0, 1.0));
        assert(psm.openPosition(Side::LONG, 100.0, 1.0, 10.0, 1000));
        assert(!psm.openPosition(Side::LONG, 101.0, 1.0, 10.0, 1000));
        assert(!psm.addLeg(Side::SHORT, 101.0, 1.0, 1.0));
        assert(psm.addLeg(Side::LONG, 102.0, 0.5, 5.0));
        assert(psm.position()->leg_count == 2);
        assert(near(psm.position()->quantity, 1.5));
        assert(near(psm.position()->entry_price, 100.0));
        assert(near(psm.position()->margin_committed, 15.0));
    }

    // Envelope target and opposing signal
    {
        PositionConfig cfg = basicConfig();
        cfg.envelope_target = true;
        cfg.exit_on_opposing_signal = true;
        PositionStateMachine psm(cfg);
        assert(psm.openPosition(Side::SHORT, 100.0, 1.0, 10.0, 1000));

        TickContext ctx = tick(96.0, 2000, 100.0, 96.0);
        ctx.envelope_lower = 95.0;
        ctx.envelope_upper = 105.0;
        assert(!psm.evaluate(ctx).shouldExit());
        ctx.price = 95.0;
        ctx.bar_low = 95.0;
        auto d = psm.evaluate(ctx);
        assert(d.reason == ExitReason::ENVELOPE_TARGET);
        assert(near(d.fill_price, 95.0));

        ctx.envelope_lower.reset();
        ctx.signal = Direction::LONG;
        assert(psm.evaluate(ctx).reason == ExitReason::OPPOSING_SIGNAL);
        ctx.signal = Direction::SHORT;
        assert(!psm.evaluate(ctx).shouldExit());
    }

    // Basket target from equity change; P&L is the equity delta
    {
        PositionConfig cfg = basicConfig();
        cfg.initial_stop_distance = 0.0;
        cfg.basket_target_fraction = 0.05;
        cfg.basket_stop_fraction = 0.03;
        PositionStateMachine psm(cfg);
        assert(psm.openPosition(Side::LONG, 100.0, 1.0, 10.0, 1000, 1000.0));
        assert(psm.basket().has_value());
        assert(!psm.position()->hasStop());
        assert(psm.addLeg(Side::LONG, 98.0, 1.0, 10.0));
        assert(psm.basket()->legs.size() == 2);

        TickContext ctx = tick(101.0, 2000, 101.0, 97.0);
        ctx.equity = 1020.0;
        assert(!psm.evaluate(ctx).shouldExit());
        ctx.equity = 1060.0;
        auto d = psm.evaluate(ctx);
        assert(d.reason == ExitReason::BASKET_TARGET);
        psm.markExitPending(d);
        auto closed = psm.onExitConfirmed(101.0, 1060.0);
        assert(near(closed.pnl, 60.0));
        assert(closed.legs == 2);
        assert(!closed.stop_loss);

        assert(psm.openPosition(Side::LONG, 100.0, 1.0, 10.0, 3000, 1000.0));
        ctx.bar_timestamp = 4000;
        ctx.equity = 965.0;
        auto stop = psm.evaluate(ctx);
        assert(stop.reason == ExitReason::BASKET_STOP);
        psm.markExitPending(stop);
        assert(psm.onExitConfirmed(96.0, 965.0).stop_loss);
    }

    // Ladder basket without target/stop fractions is still valued by equity
    {
        PositionStateMachine psm(basicConfig());
        assert(psm.openPosition(Side::LONG, 100.0, 1.0, 10.0, 1000, 1000.0));
        assert(psm.basket().has_value());
        assert(near(psm.basket()->equity_at_open, 1000.0));
        assert(psm.addLeg(Side::LONG, 90.0, 1.0, 9.0));

        // No fractions configured: equity moves never trigger basket exits
        TickContext ctx = tick(95.0, 2000, 96.0, 94.0);
        ctx.equity = 500.0;
        assert(!psm.evaluate(ctx).shouldExit());

        ExitDecision d;
        d.reason = ExitReason::ENVELOPE_TARGET;
        d.fill_price = 95.0;
        psm.markExitPending(d);
        auto closed = psm.onExitConfirmed(95.0, 1000.0);
        assert(near(closed.pnl, 0.0));
        assert(closed.legs == 2);
        assert(!closed.stop_loss);
        assert(closed.reason == ExitReason::ENVELOPE_TARGET);
    }

    // Without an equity reading a basket is summed leg by leg
    {
        PositionStateMachine psm(basicConfig());
        assert(psm.openPosition(Side::LONG, 100.0, 1.0, 10.0, 1000, 1000.0));
        assert(psm.addLeg(Side::LONG, 90.0, 1.0, 9.0));
        ExitDecision d;
        d.reason = ExitReason::OPPOSING_SIGNAL;
        d.fill_price = 96.0;
        psm.markExitPending(d);
        auto closed = psm.onExitConfirmed(96.0);
        assert(near(closed.pnl, 2.0));
        assert(near(closed.entry_price, 100.0));
    }

    // Venue is authoritative during reconciliation
    {
        PositionStateMachine psm(basicConfig());
        assert(psm.reconcile(std::nullopt, 1000) == ReconcileOutcome::IN_SYNC);

        assert(psm.openPosition(Side::LONG, 100.0, 1.0, 10.0, 1000));
        assert(psm.reconcile(std::nullopt, 2000) == ReconcileOutcome::CORRECTED_TO_FLAT);
        assert(psm.isFlat());

        assert(psm.openPosition(Side::LONG, 100.0, 1.0, 10.0, 3000));
        VenuePosition vp;
        vp.side = Side::LONG;
        vp.quantity = 1.0;
        vp.entry_price = 100.0;
        assert(psm.reconcile(vp, 3000) == ReconcileOutcome::IN_SYNC);
        vp.quantity = 2.0;
        vp.entry_price = 99.0;
        assert(psm.reconcile(vp, 3000) == ReconcileOutcome::QUANTITY_SYNCED);
        assert(near(psm.position()->quantity, 2.0));
        assert(near(psm.position()->entry_price, 100.0));

        ExitDecision d;
        d.reason = ExitReason::TREND_FLIP;
        d.fill_price = 100.0;
        psm.markExitPending(d);
        assert(psm.reconcile(std::nullopt, 4000) == ReconcileOutcome::EXIT_CONFIRMED);
        assert(psm.isOpen());
        psm.onExitConfirmed(100.0);
        assert(psm.isFlat());

        VenuePosition shorted;
        shorted.side = Side::SHORT;
        shorted.quantity = 0.5;
        shorted.entry_price = 200.0;
        assert(psm.reconcile(shorted, 5000) == ReconcileOutcome::ADOPTED);
        assert(psm.isOpen());
        assert(psm.position()->side == Side::SHORT);
        assert(near(psm.position()->entry_price, 200.0));
        assert(near(psm.position()->stop_price, 210.0));

        // Side disagreement replaces the local position
        VenuePosition flipped = shorted;
        flipped.side = Side::LONG;
        assert(psm.reconcile(flipped, 6000) == ReconcileOutcome::ADOPTED);
        assert(psm.position()->side == Side::LONG);
    }

    std::cout << "[TEST] PositionStateMachine PASSED\n";
    return 0;
}
