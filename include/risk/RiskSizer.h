#pragma once

#include "common/Types.h"
#include <optional>
#include <string>
#include <vector>

namespace trendpilot {
namespace risk {

enum class SizingPolicy {
    RISK_FRACTION,      // risk a fixed share of equity to the stop
    LADDER,             // capital tiers -> (leg_notional, max_legs)
    MARGIN_FRACTION     // share of free capital as margin, times leverage
};

inline const char* toString(SizingPolicy policy) {
    switch (policy) {
        case SizingPolicy::RISK_FRACTION: return "risk_fraction";
        case SizingPolicy::LADDER: return "ladder";
        case SizingPolicy::MARGIN_FRACTION: return "margin_fraction";
    }
    return "risk_fraction";
}

// Tier applies once equity >= min_equity
struct LadderTier {
    double min_equity = 0.0;
    double leg_notional = 0.0;
    int max_legs = 1;
};

struct RiskSizerConfig {
    SizingPolicy policy = SizingPolicy::MARGIN_FRACTION;
    double risk_fraction = 0.01;
    double margin_fraction = 0.80;
    double leverage = 15.0;
    std::vector<LadderTier> ladder;     // sorted ascending by min_equity
};

struct SizingDecision {
    double quantity = 0.0;
    double notional = 0.0;
    double margin = 0.0;                // notional / leverage
    std::string reason;                 // why the size is zero

    bool tradable() const { return quantity > 0.0; }
};

// Converts equity and stop distance into an order quantity
class RiskSizer {
public:
    explicit RiskSizer(const RiskSizerConfig& config);

    // notional = equity * risk_fraction / (|entry - stop| / entry), capped at equity * leverage
    SizingDecision sizeByRisk(double equity, double entry_price, double stop_price,
                              const MarketMetadata& market) const;

    SizingDecision sizeByMargin(double free_equity, double entry_price,
                                const MarketMetadata& market) const;

    // Tier for the current equity, re-evaluated on every call
    std::optional<LadderTier> tierFor(double equity) const;
    bool canAddLeg(double equity, int leg_count) const;
    SizingDecision sizeLadderLeg(double equity, double price, int leg_count,
                                 const MarketMetadata& market) const;

    // Dispatch on the configured policy for a fresh entry
    SizingDecision sizeEntry(const EquitySnapshot& equity, double entry_price, double stop_price,
                             const MarketMetadata& market) const;

    // Round down to the venue step; below the venue minimum means zero
    static double applyVenueRules(double quantity, const MarketMetadata& market);

    const RiskSizerConfig& config() const { return config_; }

private:
    SizingDecision finalize(double notional, double price, const MarketMetadata& market) const;

    RiskSizerConfig config_;
};

} // namespace risk
} // namespace trendpilot
