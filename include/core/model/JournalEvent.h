#pragma once

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

namespace trendpilot {
namespace core {

enum class JournalEventType {
    POSITION_OPENED,
    LEG_ADDED,
    STOP_STEPPED,
    EXIT_REQUESTED,
    POSITION_CLOSED,
    STATE_CORRECTED,
    LOCK_CHANGED,
    HALTED,
    DAY_ROLLED
};

const char* toString(JournalEventType type);

struct JournalEvent {
    std::uint64_t seq = 0;
    long long ts_ms = 0;
    JournalEventType type = JournalEventType::POSITION_OPENED;
    std::string symbol;
    nlohmann::json payload = nlohmann::json::object();
};

} // namespace core
} // namespace trendpilot
