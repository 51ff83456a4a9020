#include "common/Clock.h"

#include <ctime>
#include <cstdio>
#include <thread>

namespace trendpilot {

namespace {
std::tm shiftedUtc(std::chrono::system_clock::time_point tp, int utc_offset_minutes) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    t += static_cast<std::time_t>(utc_offset_minutes) * 60;
    std::tm out{};
    gmtime_r(&t, &out);
    return out;
}
} // namespace

std::chrono::system_clock::time_point SystemClock::now() const {
    return std::chrono::system_clock::now();
}

void SystemClock::sleepFor(std::chrono::milliseconds duration) {
    if (duration.count() > 0) {
        std::this_thread::sleep_for(duration);
    }
}

ManualClock::ManualClock(long long start_ms)
    : now_ms_(start_ms) {}

std::chrono::system_clock::time_point ManualClock::now() const {
    return std::chrono::system_clock::time_point(std::chrono::milliseconds(now_ms_));
}

void ManualClock::sleepFor(std::chrono::milliseconds duration) {
    if (duration.count() > 0) {
        now_ms_ += duration.count();
        total_slept_ms_ += duration.count();
    }
}

void ManualClock::setMs(long long epoch_ms) {
    now_ms_ = epoch_ms;
}

void ManualClock::advance(std::chrono::milliseconds duration) {
    now_ms_ += duration.count();
}

std::string dayKey(std::chrono::system_clock::time_point tp, int utc_offset_minutes) {
    const std::tm tm_local = shiftedUtc(tp, utc_offset_minutes);
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d",
                  tm_local.tm_year + 1900, tm_local.tm_mon + 1, tm_local.tm_mday);
    return std::string(buf);
}

void localHourMinute(std::chrono::system_clock::time_point tp, int utc_offset_minutes,
                     int& hour, int& minute) {
    const std::tm tm_local = shiftedUtc(tp, utc_offset_minutes);
    hour = tm_local.tm_hour;
    minute = tm_local.tm_min;
}

long long timeframeMs(const std::string& timeframe) {
    if (timeframe.size() < 2) {
        return 0;
    }
    long long count = 0;
    for (size_t i = 0; i + 1 < timeframe.size(); ++i) {
        char c = timeframe[i];
        if (c < '0' || c > '9') {
            return 0;
        }
        count = count * 10 + (c - '0');
    }
    switch (timeframe.back()) {
        case 'm': return count * 60LL * 1000LL;
        case 'h':
        case 'H': return count * 3600LL * 1000LL;
        case 'd':
        case 'D': return count * 86400LL * 1000LL;
        default: return 0;
    }
}

} // namespace trendpilot
