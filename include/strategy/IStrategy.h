#pragma once

#include "common/Types.h"
#include "analytics/IndicatorEngine.h"
#include "strategy/StrategyConfig.h"
#include <string>
#include <vector>

namespace trendpilot {
namespace strategy {

// Entry signal produced once per tick
struct Signal {
    Direction direction;
    StrategyVariant variant;
    std::string strategy_name;
    double reference_price;             // price the signal was evaluated at
    long long bar_timestamp;            // newest closed bar used
    std::string reason;

    Signal()
        : direction(Direction::NONE)
        , variant(StrategyVariant::CROSSOVER)
        , reference_price(0.0)
        , bar_timestamp(0)
    {}

    bool isEntry() const { return direction != Direction::NONE; }
};

struct StrategyInfo {
    std::string name;
    std::string description;
    bool mean_reversion;                // subject to the sideways regime filter
    bool requires_envelope;

    StrategyInfo()
        : mean_reversion(false)
        , requires_envelope(false)
    {}
};

// Strategy interface: (closed history, current price) -> Signal
class IStrategy {
public:
    virtual ~IStrategy() = default;

    virtual StrategyInfo getInfo() const = 0;
    virtual StrategyVariant variant() const = 0;

    // closed_history has at least two fully defined frames (previous, current)
    virtual Signal generateSignal(
        const std::vector<analytics::IndicatorFrame>& closed_history,
        double current_price
    ) = 0;

protected:
    Signal makeSignal(Direction direction,
                      const analytics::IndicatorFrame& current,
                      double current_price,
                      const std::string& reason) const {
        Signal s;
        s.direction = direction;
        s.variant = variant();
        s.strategy_name = getInfo().name;
        s.reference_price = current_price;
        s.bar_timestamp = current.timestamp;
        s.reason = reason;
        return s;
    }
};

} // namespace strategy
} // namespace trendpilot
