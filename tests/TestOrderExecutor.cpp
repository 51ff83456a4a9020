#include "execution/OrderExecutor.h"
#include "backtest/PaperVenue.h"
#include "common/Clock.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <vector>

using namespace trendpilot;
using trendpilot::backtest::PaperVenue;
using trendpilot::backtest::PaperVenueConfig;
using trendpilot::execution::ExecutionConfig;
using trendpilot::execution::OrderExecutor;

namespace {

const char* kSymbol = "BTC-USDT-SWAP";

bool near(double a, double b, double eps = 1e-9) {
    return std::abs(a - b) < eps;
}

PaperVenueConfig venueConfig() {
    PaperVenueConfig cfg;
    cfg.symbol = kSymbol;
    cfg.market.tick_size = 0.1;
    cfg.market.qty_step = 0.01;
    cfg.market.min_qty = 0.01;
    cfg.initial_equity = 1000.0;
    cfg.leverage = 10.0;
    return cfg;
}

std::vector<Candle> flatHistory() {
    std::vector<Candle> out;
    for (int i = 0; i < 5; ++i) {
        out.emplace_back(i * 60000LL, 100.0, 101.0, 99.0, 100.0, 1.0);
    }
    return out;
}

ExecutionConfig execConfig() {
    ExecutionConfig cfg;
    cfg.transient_retries = 3;
    cfg.retry_backoff_ms = 500;
    cfg.close_confirm_polls = 4;
    cfg.close_poll_interval_ms = 250;
    return cfg;
}

} // namespace

int main() {
    const MarketMetadata market = venueConfig().market;

    // Transient failures are retried with a fixed backoff
    {
        PaperVenue venue(venueConfig(), flatHistory());
        ManualClock clock(0);
        OrderExecutor executor(venue, clock, execConfig());

        venue.failNextOrders(VenueErrorKind::TRANSIENT, 2);
        auto fill = executor.submitEntry(kSymbol, Side::LONG, 1.0, 100.0, market, "test");
        assert(fill.ok());
        assert(near(fill.value().quantity, 1.0));
        assert(venue.orders().size() == 3);
        assert(clock.totalSlept() == 1000);
    }

    // Retries are bounded
    {
        PaperVenue venue(venueConfig(), flatHistory());
        ManualClock clock(0);
        OrderExecutor executor(venue, clock, execConfig());

        venue.failNextOrders(VenueErrorKind::TRANSIENT, 10);
        auto fill = executor.submitEntry(kSymbol, Side::LONG, 1.0, 100.0, market, "test");
        assert(!fill.ok());
        assert(fill.isTransient());
        assert(venue.orders().size() == 4);
        assert(clock.totalSlept() == 1500);
    }

    // Rejections are not retried
    {
        PaperVenue venue(venueConfig(), flatHistory());
        ManualClock clock(0);
        OrderExecutor executor(venue, clock, execConfig());

        venue.failNextOrders(VenueErrorKind::REJECTED, 1);
        auto fill = executor.submitEntry(kSymbol, Side::SHORT, 1.0, 100.0, market, "test");
        assert(!fill.ok());
        assert(fill.error().kind == VenueErrorKind::REJECTED);
        assert(venue.orders().size() == 1);
        assert(clock.totalSlept() == 0);
    }

    // Insufficient margin halves the quantity until it fits
    {
        PaperVenue venue(venueConfig(), flatHistory());
        ManualClock clock(0);
        OrderExecutor executor(venue, clock, execConfig());

        // 1000 equity at 10x covers 100 units at price 100
        auto fill = executor.submitEntry(kSymbol, Side::LONG, 300.0, 100.0, market, "test");
        assert(fill.ok());
        assert(near(fill.value().quantity, 75.0));
        assert(venue.orders().size() == 3);
        assert(near(venue.orders()[0].quantity, 300.0));
        assert(near(venue.orders()[1].quantity, 150.0));
    }

    // Paper fills land on the venue tick
    {
        PaperVenue venue(venueConfig(), flatHistory());
        ManualClock clock(0);
        OrderExecutor executor(venue, clock, execConfig());

        auto down = executor.submitEntry(kSymbol, Side::LONG, 1.0, 100.04, market, "test");
        assert(down.ok());
        assert(near(down.value().price, 100.0));
        auto up = executor.submitEntry(kSymbol, Side::LONG, 1.0, 100.06, market, "test");
        assert(up.ok());
        assert(near(up.value().price, 100.1));
        auto on_grid = executor.submitEntry(kSymbol, Side::LONG, 1.0, 100.3, market, "test");
        assert(on_grid.ok());
        assert(on_grid.value().price == 100.3);
    }

    // Halving stops at the venue minimum
    {
        PaperVenue venue(venueConfig(), flatHistory());
        ManualClock clock(0);
        OrderExecutor executor(venue, clock, execConfig());

        venue.failNextOrders(VenueErrorKind::INSUFFICIENT_MARGIN, 5);
        auto fill = executor.submitEntry(kSymbol, Side::LONG, 0.03, 100.0, market, "test");
        assert(!fill.ok());
        assert(fill.error().kind == VenueErrorKind::INSUFFICIENT_MARGIN);
        assert(venue.orders().size() == 2);
        assert(near(venue.orders()[1].quantity, 0.01));

        auto tiny = executor.submitEntry(kSymbol, Side::LONG, 0.005, 100.0, market, "test");
        assert(!tiny.ok());
        assert(tiny.error().kind == VenueErrorKind::BELOW_MINIMUM);
        assert(venue.orders().size() == 2);
    }

    // Close is confirmed once the venue stops reporting the position
    {
        PaperVenue venue(venueConfig(), flatHistory());
        ManualClock clock(0);
        OrderExecutor executor(venue, clock, execConfig());

        assert(executor.submitEntry(kSymbol, Side::LONG, 2.0, 100.0, market, "open").ok());
        venue.setCloseReportLag(2);
        auto result = executor.closePosition(kSymbol, Side::LONG, 2.0, 104.0, "exit");
        assert(result.order_filled);
        assert(result.confirmed);
        assert(near(result.fill_price, 104.0));
        assert(clock.totalSlept() == 500);
        assert(venue.orders().back().reduce_only);
        assert(venue.orders().back().side == OrderSide::SELL);
        assert(near(venue.cash(), 1008.0));
    }

    // A lag longer than the poll budget leaves the close unconfirmed
    {
        PaperVenue venue(venueConfig(), flatHistory());
        ManualClock clock(0);
        OrderExecutor executor(venue, clock, execConfig());

        assert(executor.submitEntry(kSymbol, Side::SHORT, 1.0, 100.0, market, "open").ok());
        venue.setCloseReportLag(10);
        auto result = executor.closePosition(kSymbol, Side::SHORT, 1.0, 98.0, "exit");
        assert(result.order_filled);
        assert(!result.confirmed);
        assert(clock.totalSlept() == 1000);
    }

    // Queries retry transient failures; fatal metadata is returned at once
    {
        PaperVenue venue(venueConfig(), flatHistory());
        ManualClock clock(0);
        OrderExecutor executor(venue, clock, execConfig());

        venue.failNextPositionQueries(2);
        auto pos = executor.queryPosition(kSymbol);
        assert(pos.ok());
        assert(!pos.value().has_value());
        assert(clock.totalSlept() == 1000);

        auto meta = executor.getMarketMetadata(kSymbol);
        assert(meta.ok());
        assert(meta.value().isValid());
        assert(meta.value().symbol == kSymbol);

        venue.failMetadata(true);
        auto failed = executor.getMarketMetadata(kSymbol);
        assert(!failed.ok());
        assert(failed.error().kind == VenueErrorKind::FATAL);
        assert(clock.totalSlept() == 1000);

        auto equity = executor.getEquity();
        assert(equity.ok());
        assert(near(equity.value().total, 1000.0));
    }

    std::cout << "[TEST] OrderExecutor PASSED\n";
    return 0;
}
