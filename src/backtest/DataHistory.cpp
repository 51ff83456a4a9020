#include "backtest/DataHistory.h"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include "common/Logger.h"

namespace trendpilot {
namespace backtest {

long long DataHistory::toMsTimestamp(long long ts) {
    // Anything below 1e11 cannot be a millisecond timestamp after 1973
    if (ts > 0 && ts < 100000000000LL) {
        return ts * 1000LL;
    }
    return ts;
}

std::vector<Candle> DataHistory::loadCSV(const std::string& file_path) {
    std::vector<Candle> candles;
    std::ifstream file(file_path);

    if (!file.is_open()) {
        LOG_ERROR("Failed to open CSV file: {}", file_path);
        return candles;
    }

    auto trim = [](std::string s) {
        while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
            s.erase(s.begin());
        }
        while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
            s.pop_back();
        }
        return s;
    };

    auto normalizeCell = [&](std::string s) {
        s = trim(std::move(s));

        // Strip UTF-8 BOM if present at first cell.
        if (s.size() >= 3 &&
            static_cast<unsigned char>(s[0]) == 0xEF &&
            static_cast<unsigned char>(s[1]) == 0xBB &&
            static_cast<unsigned char>(s[2]) == 0xBF) {
            s = s.substr(3);
        }

        if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
            s = s.substr(1, s.size() - 2);
        }
        return trim(std::move(s));
    };

    std::string line;
    size_t rejected = 0;

    while (std::getline(file, line)) {
        std::stringstream ss(line);
        std::string cell;
        std::vector<std::string> row;

        while (std::getline(ss, cell, ',')) {
            row.push_back(normalizeCell(cell));
        }

        if (row.size() < 5) continue;
        if (row[0].empty()) continue;
        if (!std::isdigit(static_cast<unsigned char>(row[0][0]))) {
            // Header or malformed row.
            continue;
        }

        try {
            Candle candle;
            candle.timestamp = toMsTimestamp(std::stoll(row[0]));
            candle.open = std::stod(row[1]);
            candle.high = std::stod(row[2]);
            candle.low = std::stod(row[3]);
            candle.close = std::stod(row[4]);
            candle.volume = row.size() > 5 && !row[5].empty() ? std::stod(row[5]) : 0.0;
            candle.closed = true;

            if (candle.high < candle.low || candle.close <= 0.0) {
                rejected++;
                continue;
            }
            candles.push_back(candle);
        } catch (const std::exception& e) {
            LOG_WARN("Error parsing row: {} - {}", line, e.what());
            rejected++;
        }
    }

    std::sort(candles.begin(), candles.end(), [](const Candle& a, const Candle& b) {
        return a.timestamp < b.timestamp;
    });
    candles.erase(std::unique(candles.begin(), candles.end(), [](const Candle& a, const Candle& b) {
        return a.timestamp == b.timestamp;
    }), candles.end());

    if (rejected > 0) {
        LOG_WARN("{} rows rejected while loading {}", rejected, file_path);
    }
    LOG_INFO("Loaded {} candles from {}", candles.size(), file_path);
    return candles;
}

} // namespace backtest
} // namespace trendpilot
