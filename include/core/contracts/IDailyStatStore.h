#pragma once

#include <optional>
#include <string>

#include "risk/DailyAccounting.h"

namespace trendpilot {
namespace core {

class IDailyStatStore {
public:
    virtual ~IDailyStatStore() = default;

    // std::nullopt is a fresh day, not an error
    virtual std::optional<risk::DailyStats> load(const std::string& date) = 0;
    virtual bool save(const risk::DailyStats& stats) = 0;
};

} // namespace core
} // namespace trendpilot
