#include "execution/OrderExecutor.h"
#include "common/Logger.h"
#include "common/QuantityStep.h"

namespace trendpilot {
namespace execution {

OrderExecutor::OrderExecutor(core::IVenue& venue, IClock& clock, const ExecutionConfig& config)
    : venue_(venue)
    , clock_(clock)
    , config_(config) {
}

RetryPolicy OrderExecutor::retryPolicy() const {
    RetryPolicy policy;
    policy.retries = config_.transient_retries;
    policy.backoff_ms = config_.retry_backoff_ms;
    return policy;
}

VenueResult<OrderFill> OrderExecutor::submitWithRetry(const OrderRequest& request) {
    return retryTransient(clock_, retryPolicy(), "Order submit",
                          [this, &request]() { return venue_.submitOrder(request); });
}

VenueResult<OrderFill> OrderExecutor::submitEntry(const std::string& symbol, Side side, double quantity,
                                                  double reference_price, const MarketMetadata& market,
                                                  const std::string& reason) {
    OrderRequest request;
    request.symbol = symbol;
    request.side = entryOrderSide(side);
    request.quantity = common::roundDownToStep(quantity, market.qty_step);
    request.reduce_only = false;
    request.reference_price = reference_price;
    request.reason = reason;

    if (request.quantity < market.min_qty || request.quantity <= 0.0) {
        return VenueResult<OrderFill>::failure(VenueErrorKind::BELOW_MINIMUM,
                                               "quantity below venue minimum");
    }

    while (true) {
        LOG_INFO("Submitting {} {} qty={} @~{:.2f} ({})", toString(request.side), symbol,
                 common::formatOnStep(request.quantity, market.qty_step), reference_price, reason);
        auto result = submitWithRetry(request);
        if (result.ok()) {
            return result;
        }
        if (result.error().kind != VenueErrorKind::INSUFFICIENT_MARGIN) {
            LOG_WARN("Entry order failed: {} ({})", toString(result.error().kind), result.error().message);
            return result;
        }

        double halved = common::roundDownToStep(request.quantity / 2.0, market.qty_step);
        if (halved < market.min_qty || halved <= 0.0) {
            LOG_WARN("Insufficient margin even at qty={}, entry abandoned",
                     common::formatOnStep(request.quantity, market.qty_step));
            return result;
        }
        LOG_WARN("Insufficient margin for qty={}, retrying with {}",
                 common::formatOnStep(request.quantity, market.qty_step),
                 common::formatOnStep(halved, market.qty_step));
        request.quantity = halved;
    }
}

CloseResult OrderExecutor::closePosition(const std::string& symbol, Side side, double quantity,
                                         double reference_price, const std::string& reason) {
    CloseResult out;

    OrderRequest request;
    request.symbol = symbol;
    request.side = exitOrderSide(side);
    request.quantity = quantity;
    request.reduce_only = true;
    request.reference_price = reference_price;
    request.reason = reason;

    LOG_INFO("Closing {} {} qty={} reduce-only ({})", toString(side), symbol, quantity, reason);
    auto fill = submitWithRetry(request);
    if (fill.ok()) {
        out.order_filled = true;
        out.fill_price = fill.value().price;
    } else {
        out.error = fill.error();
        LOG_WARN("Close order failed: {} ({})", toString(out.error.kind), out.error.message);
    }

    for (int poll = 0; poll < config_.close_confirm_polls; ++poll) {
        auto pos = venue_.queryPosition(symbol);
        if (pos.ok() && !pos.value()) {
            out.confirmed = true;
            LOG_INFO("Close confirmed by venue after {} poll(s)", poll + 1);
            return out;
        }
        if (!pos.ok()) {
            LOG_WARN("Close confirmation poll failed: {}", pos.error().message);
        }
        clock_.sleepFor(std::chrono::milliseconds(config_.close_poll_interval_ms));
    }

    LOG_WARN("Venue still reports {} position after {} polls, keeping local state",
             symbol, config_.close_confirm_polls);
    return out;
}

VenueResult<std::optional<VenuePosition>> OrderExecutor::queryPosition(const std::string& symbol) {
    return retryTransient(clock_, retryPolicy(), "Position query",
                          [this, &symbol]() { return venue_.queryPosition(symbol); });
}

VenueResult<EquitySnapshot> OrderExecutor::getEquity() {
    return retryTransient(clock_, retryPolicy(), "Equity query",
                          [this]() { return venue_.getEquity(); });
}

VenueResult<MarketMetadata> OrderExecutor::getMarketMetadata(const std::string& symbol) {
    return retryTransient(clock_, retryPolicy(), "Market metadata",
                          [this, &symbol]() { return venue_.getMarketMetadata(symbol); });
}

} // namespace execution
} // namespace trendpilot
