#pragma once

#include <optional>
#include <string>
#include "common/Clock.h"
#include "common/Retry.h"
#include "common/Types.h"
#include "common/VenueResult.h"
#include "core/contracts/IVenue.h"

namespace trendpilot {
namespace execution {

struct ExecutionConfig {
    int transient_retries = 3;          // attempts after the first transient failure
    int retry_backoff_ms = 1000;        // fixed backoff between attempts
    int close_confirm_polls = 10;       // position re-polls after a close order
    int close_poll_interval_ms = 1000;
};

struct CloseResult {
    bool confirmed = false;             // venue reports no position
    bool order_filled = false;
    double fill_price = 0.0;
    VenueError error;
};

// Order placement policy around an IVenue: transient retry with fixed
// backoff, margin halving for entries, confirmed closes
class OrderExecutor {
public:
    OrderExecutor(core::IVenue& venue, IClock& clock, const ExecutionConfig& config);

    // Entry or add-leg. On insufficient margin the quantity is halved (on the
    // venue step) and resubmitted until it would fall below the venue minimum.
    VenueResult<OrderFill> submitEntry(const std::string& symbol, Side side, double quantity,
                                       double reference_price, const MarketMetadata& market,
                                       const std::string& reason);

    // Reduce-only close, then re-poll the venue position with bounded retries
    CloseResult closePosition(const std::string& symbol, Side side, double quantity,
                              double reference_price, const std::string& reason);

    VenueResult<std::optional<VenuePosition>> queryPosition(const std::string& symbol);
    VenueResult<EquitySnapshot> getEquity();
    VenueResult<MarketMetadata> getMarketMetadata(const std::string& symbol);

    const ExecutionConfig& config() const { return config_; }
    RetryPolicy retryPolicy() const;

private:
    VenueResult<OrderFill> submitWithRetry(const OrderRequest& request);

    core::IVenue& venue_;
    IClock& clock_;
    ExecutionConfig config_;
};

} // namespace execution
} // namespace trendpilot
