#pragma once

#include <optional>
#include <string>

#include "common/Types.h"
#include "common/VenueResult.h"

namespace trendpilot {
namespace core {

// Authoritative position, account and order surface of one execution venue
class IVenue {
public:
    virtual ~IVenue() = default;

    // std::nullopt value means "no open position"
    virtual VenueResult<std::optional<VenuePosition>> queryPosition(const std::string& symbol) = 0;
    virtual VenueResult<MarketMetadata> getMarketMetadata(const std::string& symbol) = 0;
    virtual VenueResult<OrderFill> submitOrder(const OrderRequest& request) = 0;
    virtual VenueResult<EquitySnapshot> getEquity() = 0;
};

} // namespace core
} // namespace trendpilot
