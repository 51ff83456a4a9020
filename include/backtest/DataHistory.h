#pragma once

#include <string>
#include <vector>
#include "common/Types.h"

namespace trendpilot {
namespace backtest {

class DataHistory {
public:
    // Load candles from a CSV file
    // Expected format: timestamp,open,high,low,close,volume (header optional)
    // Result is sorted oldest-first with duplicate timestamps removed.
    static std::vector<Candle> loadCSV(const std::string& file_path);

    // Epoch seconds become epoch milliseconds; milliseconds pass through
    static long long toMsTimestamp(long long ts);
};

} // namespace backtest
} // namespace trendpilot
