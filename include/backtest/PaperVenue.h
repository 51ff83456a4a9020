#pragma once

#include <deque>
#include <optional>
#include <string>
#include <vector>

#include "common/Types.h"
#include "core/contracts/IMarketDataFeed.h"
#include "core/contracts/IVenue.h"

namespace trendpilot {
namespace backtest {

struct PaperVenueConfig {
    std::string symbol = "BTC-USDT-SWAP";
    MarketMetadata market;
    double initial_equity = 1000.0;
    double leverage = 15.0;
    double fee_rate = 0.0;          // per side, fraction of notional
};

// In-process venue and price feed replaying a candle history.
// The bar at the cursor is served as the forming bar; market orders fill
// at the request's reference price (or the last price when none is given),
// snapped to the venue tick.
class PaperVenue : public core::IVenue, public core::IMarketDataFeed {
public:
    PaperVenue(const PaperVenueConfig& config, std::vector<Candle> history);

    // ===== replay =====
    size_t size() const { return history_.size(); }
    size_t cursor() const { return cursor_; }
    void setCursor(size_t index);
    bool advance();                 // false at the end of history
    const Candle& currentBar() const { return history_[cursor_]; }

    // Replaces the forming bar's close as last price (intrabar scenarios)
    void setLastPrice(std::optional<double> price) { price_override_ = price; }

    // ===== IMarketDataFeed =====
    VenueResult<std::vector<Candle>> fetchCandles(const std::string& symbol,
                                                  const std::string& timeframe,
                                                  int limit) override;
    VenueResult<double> fetchLastPrice(const std::string& symbol) override;

    // ===== IVenue =====
    VenueResult<std::optional<VenuePosition>> queryPosition(const std::string& symbol) override;
    VenueResult<MarketMetadata> getMarketMetadata(const std::string& symbol) override;
    VenueResult<OrderFill> submitOrder(const OrderRequest& request) override;
    VenueResult<EquitySnapshot> getEquity() override;

    // ===== failure scripting =====
    void failNextOrders(VenueErrorKind kind, int count = 1);
    void failNextFeedCalls(int count) { feed_failures_ = count; }
    void failNextPositionQueries(int count) { position_failures_ = count; }
    void failNextEquityQueries(int count) { equity_failures_ = count; }
    void failMetadata(bool fail) { metadata_failure_ = fail; }
    // After a close fills, the old position is still reported for `polls` queries
    void setCloseReportLag(int polls) { close_report_lag_ = polls; }
    // Overwrites venue-side position (desync scenarios)
    void forcePosition(const std::optional<VenuePosition>& position);

    const std::vector<OrderRequest>& orders() const { return orders_; }
    double cash() const { return cash_; }
    EquitySnapshot equitySnapshot() const;
    double lastPrice() const;

private:
    bool symbolMatches(const std::string& symbol) const { return symbol == config_.symbol; }
    double unrealizedPnl(double mark) const;
    double marginUsed() const;
    VenueResult<OrderFill> fillReduceOnly(const OrderRequest& request, double price);
    VenueResult<OrderFill> fillOpen(const OrderRequest& request, double price);

    PaperVenueConfig config_;
    std::vector<Candle> history_;
    size_t cursor_ = 0;
    std::optional<double> price_override_;

    double cash_;
    std::optional<VenuePosition> position_;
    double position_margin_ = 0.0;

    std::deque<VenueErrorKind> order_failures_;
    int feed_failures_ = 0;
    int position_failures_ = 0;
    int equity_failures_ = 0;
    bool metadata_failure_ = false;
    int close_report_lag_ = 0;
    int lagged_reports_left_ = 0;
    std::optional<VenuePosition> lagged_position_;

    std::vector<OrderRequest> orders_;
    long long order_seq_ = 0;
};

} // namespace backtest
} // namespace trendpilot
