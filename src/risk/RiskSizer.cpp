#include "risk/RiskSizer.h"
#include "common/Logger.h"
#include "common/QuantityStep.h"
#include <algorithm>
#include <cmath>

namespace trendpilot {
namespace risk {

RiskSizer::RiskSizer(const RiskSizerConfig& config)
    : config_(config) {
    std::sort(config_.ladder.begin(), config_.ladder.end(),
              [](const LadderTier& a, const LadderTier& b) { return a.min_equity < b.min_equity; });
    if (config_.leverage <= 0.0) {
        config_.leverage = 1.0;
    }
}

double RiskSizer::applyVenueRules(double quantity, const MarketMetadata& market) {
    double qty = common::roundDownToStep(quantity, market.qty_step);
    if (qty < market.min_qty - common::kStepEpsilon || qty <= 0.0) {
        return 0.0;
    }
    return qty;
}

SizingDecision RiskSizer::finalize(double notional, double price, const MarketMetadata& market) const {
    SizingDecision d;
    d.notional = notional;
    if (notional <= 0.0 || price <= 0.0) {
        d.reason = "non_positive_notional";
        return d;
    }
    d.quantity = applyVenueRules(notional / price, market);
    if (!d.tradable()) {
        d.reason = "below_venue_minimum";
        d.notional = 0.0;
        return d;
    }
    d.notional = d.quantity * price;
    d.margin = d.notional / config_.leverage;
    return d;
}

SizingDecision RiskSizer::sizeByRisk(double equity, double entry_price, double stop_price,
                                     const MarketMetadata& market) const {
    if (entry_price <= 0.0 || equity <= 0.0) {
        SizingDecision d;
        d.reason = "no_equity";
        return d;
    }

    const double stop_distance_fraction = std::abs(entry_price - stop_price) / entry_price;
    if (stop_distance_fraction <= 0.0) {
        SizingDecision d;
        d.reason = "zero_stop_distance";
        return d;
    }

    double notional = equity * config_.risk_fraction / stop_distance_fraction;
    const double cap = equity * config_.leverage;
    if (notional > cap) {
        LOG_DEBUG("RiskSizer: risk notional {:.2f} capped at {:.2f}", notional, cap);
        notional = cap;
    }
    return finalize(notional, entry_price, market);
}

SizingDecision RiskSizer::sizeByMargin(double free_equity, double entry_price,
                                       const MarketMetadata& market) const {
    const double margin = std::max(0.0, free_equity * config_.margin_fraction);
    if (margin <= 0.0) {
        SizingDecision d;
        d.reason = "no_free_equity";
        return d;
    }
    return finalize(margin * config_.leverage, entry_price, market);
}

std::optional<LadderTier> RiskSizer::tierFor(double equity) const {
    std::optional<LadderTier> tier;
    for (const auto& t : config_.ladder) {
        if (equity >= t.min_equity) {
            tier = t;
        } else {
            break;
        }
    }
    return tier;
}

bool RiskSizer::canAddLeg(double equity, int leg_count) const {
    auto tier = tierFor(equity);
    return tier && leg_count < tier->max_legs;
}

SizingDecision RiskSizer::sizeLadderLeg(double equity, double price, int leg_count,
                                        const MarketMetadata& market) const {
    auto tier = tierFor(equity);
    if (!tier) {
        SizingDecision d;
        d.reason = "equity_below_first_tier";
        return d;
    }
    if (leg_count >= tier->max_legs) {
        SizingDecision d;
        d.reason = "max_legs_reached";
        return d;
    }
    return finalize(tier->leg_notional, price, market);
}

SizingDecision RiskSizer::sizeEntry(const EquitySnapshot& equity, double entry_price, double stop_price,
                                    const MarketMetadata& market) const {
    switch (config_.policy) {
        case SizingPolicy::RISK_FRACTION:
            return sizeByRisk(equity.total, entry_price, stop_price, market);
        case SizingPolicy::LADDER:
            return sizeLadderLeg(equity.total, entry_price, 0, market);
        case SizingPolicy::MARGIN_FRACTION:
            return sizeByMargin(equity.free, entry_price, market);
    }
    return SizingDecision();
}

} // namespace risk
} // namespace trendpilot
