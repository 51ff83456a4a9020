#pragma once

#include <chrono>
#include <string>

namespace trendpilot {

// Time source for the engine. The scheduler sleeps only through this
// interface so tests can advance time without real delays.
class IClock {
public:
    virtual ~IClock() = default;

    virtual std::chrono::system_clock::time_point now() const = 0;
    virtual void sleepFor(std::chrono::milliseconds duration) = 0;

    long long nowMs() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            now().time_since_epoch()).count();
    }
};

class SystemClock : public IClock {
public:
    std::chrono::system_clock::time_point now() const override;
    void sleepFor(std::chrono::milliseconds duration) override;
};

// Deterministic clock: sleepFor advances time instantly
class ManualClock : public IClock {
public:
    explicit ManualClock(long long start_ms = 0);

    std::chrono::system_clock::time_point now() const override;
    void sleepFor(std::chrono::milliseconds duration) override;

    void setMs(long long epoch_ms);
    void advance(std::chrono::milliseconds duration);
    long long totalSlept() const { return total_slept_ms_; }

private:
    long long now_ms_;
    long long total_slept_ms_ = 0;
};

// Calendar day key "YYYY-MM-DD" for the given instant shifted by a fixed UTC offset
std::string dayKey(std::chrono::system_clock::time_point tp, int utc_offset_minutes);

// Local wall-clock hour/minute under the same offset
void localHourMinute(std::chrono::system_clock::time_point tp, int utc_offset_minutes,
                     int& hour, int& minute);

// Bar length for timeframe strings like "1m", "15m", "4h", "1d"; 0 if unrecognized
long long timeframeMs(const std::string& timeframe);

} // namespace trendpilot
