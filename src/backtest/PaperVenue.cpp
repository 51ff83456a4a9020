#include "backtest/PaperVenue.h"
#include "common/Logger.h"
#include "common/QuantityStep.h"

#include <algorithm>
#include <cmath>

namespace trendpilot {
namespace backtest {

PaperVenue::PaperVenue(const PaperVenueConfig& config, std::vector<Candle> history)
    : config_(config)
    , history_(std::move(history))
    , cash_(config.initial_equity) {
    if (config_.leverage <= 0.0) {
        config_.leverage = 1.0;
    }
}

void PaperVenue::setCursor(size_t index) {
    if (history_.empty()) {
        return;
    }
    cursor_ = std::min(index, history_.size() - 1);
    price_override_.reset();
}

bool PaperVenue::advance() {
    if (cursor_ + 1 >= history_.size()) {
        return false;
    }
    cursor_++;
    price_override_.reset();
    return true;
}

double PaperVenue::lastPrice() const {
    if (price_override_) {
        return *price_override_;
    }
    return history_.empty() ? 0.0 : history_[cursor_].close;
}

VenueResult<std::vector<Candle>> PaperVenue::fetchCandles(const std::string& symbol,
                                                          const std::string& timeframe,
                                                          int limit) {
    (void)timeframe;
    if (feed_failures_ > 0) {
        feed_failures_--;
        return VenueResult<std::vector<Candle>>::failure(VenueErrorKind::TRANSIENT, "scripted feed timeout");
    }
    if (!symbolMatches(symbol)) {
        return VenueResult<std::vector<Candle>>::failure(VenueErrorKind::FATAL, "unknown symbol " + symbol);
    }
    if (history_.empty()) {
        return VenueResult<std::vector<Candle>>::success({});
    }

    const size_t count = static_cast<size_t>(std::max(1, limit));
    const size_t end = cursor_ + 1;
    const size_t begin = end > count ? end - count : 0;

    std::vector<Candle> out(history_.begin() + begin, history_.begin() + end);
    Candle& forming = out.back();
    forming.closed = false;
    if (price_override_) {
        forming.close = *price_override_;
        forming.high = std::max(forming.high, *price_override_);
        forming.low = std::min(forming.low, *price_override_);
    }
    return VenueResult<std::vector<Candle>>::success(std::move(out));
}

VenueResult<double> PaperVenue::fetchLastPrice(const std::string& symbol) {
    if (feed_failures_ > 0) {
        feed_failures_--;
        return VenueResult<double>::failure(VenueErrorKind::TRANSIENT, "scripted feed timeout");
    }
    if (!symbolMatches(symbol)) {
        return VenueResult<double>::failure(VenueErrorKind::FATAL, "unknown symbol " + symbol);
    }
    return VenueResult<double>::success(lastPrice());
}

VenueResult<std::optional<VenuePosition>> PaperVenue::queryPosition(const std::string& symbol) {
    using Result = VenueResult<std::optional<VenuePosition>>;
    if (position_failures_ > 0) {
        position_failures_--;
        return Result::failure(VenueErrorKind::TRANSIENT, "scripted position query timeout");
    }
    if (!symbolMatches(symbol)) {
        return Result::failure(VenueErrorKind::FATAL, "unknown symbol " + symbol);
    }
    if (lagged_reports_left_ > 0 && lagged_position_) {
        lagged_reports_left_--;
        return Result::success(lagged_position_);
    }
    if (!position_) {
        return Result::success(std::nullopt);
    }
    VenuePosition report = *position_;
    report.unrealized_pnl = unrealizedPnl(lastPrice());
    return Result::success(report);
}

VenueResult<MarketMetadata> PaperVenue::getMarketMetadata(const std::string& symbol) {
    if (metadata_failure_) {
        return VenueResult<MarketMetadata>::failure(VenueErrorKind::FATAL, "market metadata unavailable");
    }
    if (!symbolMatches(symbol)) {
        return VenueResult<MarketMetadata>::failure(VenueErrorKind::FATAL, "unknown symbol " + symbol);
    }
    MarketMetadata meta = config_.market;
    meta.symbol = config_.symbol;
    return VenueResult<MarketMetadata>::success(meta);
}

EquitySnapshot PaperVenue::equitySnapshot() const {
    EquitySnapshot snap;
    snap.total = cash_ + unrealizedPnl(lastPrice());
    snap.free = std::max(0.0, snap.total - marginUsed());
    return snap;
}

VenueResult<EquitySnapshot> PaperVenue::getEquity() {
    if (equity_failures_ > 0) {
        equity_failures_--;
        return VenueResult<EquitySnapshot>::failure(VenueErrorKind::TRANSIENT, "scripted balance timeout");
    }
    return VenueResult<EquitySnapshot>::success(equitySnapshot());
}

double PaperVenue::unrealizedPnl(double mark) const {
    if (!position_) {
        return 0.0;
    }
    return (mark - position_->entry_price) * position_->quantity * sideSign(position_->side);
}

double PaperVenue::marginUsed() const {
    return position_ ? position_margin_ : 0.0;
}

void PaperVenue::failNextOrders(VenueErrorKind kind, int count) {
    for (int i = 0; i < count; ++i) {
        order_failures_.push_back(kind);
    }
}

void PaperVenue::forcePosition(const std::optional<VenuePosition>& position) {
    position_ = position;
    position_margin_ = position ? position->quantity * position->entry_price / config_.leverage : 0.0;
    lagged_reports_left_ = 0;
}

VenueResult<OrderFill> PaperVenue::submitOrder(const OrderRequest& request) {
    orders_.push_back(request);

    if (!order_failures_.empty()) {
        VenueErrorKind kind = order_failures_.front();
        order_failures_.pop_front();
        return VenueResult<OrderFill>::failure(kind, std::string("scripted ") + toString(kind));
    }
    if (!symbolMatches(request.symbol)) {
        return VenueResult<OrderFill>::failure(VenueErrorKind::REJECTED, "unknown symbol " + request.symbol);
    }

    const double raw_price = request.reference_price > 0.0 ? request.reference_price : lastPrice();
    const double price = common::roundToTick(raw_price, config_.market.tick_size);
    if (price <= 0.0) {
        return VenueResult<OrderFill>::failure(VenueErrorKind::TRANSIENT, "no price available");
    }

    if (request.reduce_only) {
        return fillReduceOnly(request, price);
    }
    return fillOpen(request, price);
}

VenueResult<OrderFill> PaperVenue::fillOpen(const OrderRequest& request, double price) {
    const double qty = common::roundDownToStep(request.quantity, config_.market.qty_step);
    if (qty < config_.market.min_qty - common::kStepEpsilon || qty <= 0.0) {
        return VenueResult<OrderFill>::failure(VenueErrorKind::BELOW_MINIMUM, "quantity below venue minimum");
    }

    const Side side = request.side == OrderSide::BUY ? Side::LONG : Side::SHORT;
    if (position_ && position_->side != side) {
        return VenueResult<OrderFill>::failure(VenueErrorKind::REJECTED, "opposite position open");
    }

    const double notional = qty * price;
    const double margin = notional / config_.leverage;
    const double fee = notional * config_.fee_rate;
    const EquitySnapshot equity = equitySnapshot();
    if (margin + fee > equity.free + 1e-9) {
        return VenueResult<OrderFill>::failure(VenueErrorKind::INSUFFICIENT_MARGIN, "insufficient margin");
    }

    cash_ -= fee;
    if (position_) {
        // Venue tracks the blended entry across legs
        const double total_qty = position_->quantity + qty;
        position_->entry_price = (position_->entry_price * position_->quantity + price * qty) / total_qty;
        position_->quantity = total_qty;
    } else {
        VenuePosition pos;
        pos.side = side;
        pos.quantity = qty;
        pos.entry_price = price;
        position_ = pos;
    }
    position_margin_ += margin;

    OrderFill fill;
    fill.order_id = "paper-" + std::to_string(++order_seq_);
    fill.side = request.side;
    fill.quantity = qty;
    fill.price = price;
    return VenueResult<OrderFill>::success(fill);
}

VenueResult<OrderFill> PaperVenue::fillReduceOnly(const OrderRequest& request, double price) {
    if (!position_) {
        return VenueResult<OrderFill>::failure(VenueErrorKind::REJECTED, "no position to reduce");
    }
    if (exitOrderSide(position_->side) != request.side) {
        return VenueResult<OrderFill>::failure(VenueErrorKind::REJECTED, "reduce-only side does not reduce");
    }

    const double qty = std::min(request.quantity, position_->quantity);
    const double pnl = (price - position_->entry_price) * qty * sideSign(position_->side);
    const double fee = qty * price * config_.fee_rate;
    cash_ += pnl - fee;

    const VenuePosition before = *position_;
    const double remaining = position_->quantity - qty;
    if (remaining <= common::kStepEpsilon) {
        position_.reset();
        position_margin_ = 0.0;
        if (close_report_lag_ > 0) {
            lagged_position_ = before;
            lagged_reports_left_ = close_report_lag_;
        }
    } else {
        position_margin_ *= remaining / position_->quantity;
        position_->quantity = remaining;
    }

    OrderFill fill;
    fill.order_id = "paper-" + std::to_string(++order_seq_);
    fill.side = request.side;
    fill.quantity = qty;
    fill.price = price;
    return VenueResult<OrderFill>::success(fill);
}

} // namespace backtest
} // namespace trendpilot
