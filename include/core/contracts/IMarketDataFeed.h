#pragma once

#include <string>
#include <vector>

#include "common/Types.h"
#include "common/VenueResult.h"

namespace trendpilot {
namespace core {

// Oldest-first candles; the newest element may be a forming bar (closed == false)
class IMarketDataFeed {
public:
    virtual ~IMarketDataFeed() = default;

    virtual VenueResult<std::vector<Candle>> fetchCandles(const std::string& symbol,
                                                          const std::string& timeframe,
                                                          int limit) = 0;
    virtual VenueResult<double> fetchLastPrice(const std::string& symbol) = 0;
};

} // namespace core
} // namespace trendpilot
