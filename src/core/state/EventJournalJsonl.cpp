#include "core/state/EventJournalJsonl.h"
#include "common/Logger.h"

#include <algorithm>

namespace trendpilot {
namespace core {

const char* toString(JournalEventType type) {
    switch (type) {
        case JournalEventType::POSITION_OPENED: return "POSITION_OPENED";
        case JournalEventType::LEG_ADDED: return "LEG_ADDED";
        case JournalEventType::STOP_STEPPED: return "STOP_STEPPED";
        case JournalEventType::EXIT_REQUESTED: return "EXIT_REQUESTED";
        case JournalEventType::POSITION_CLOSED: return "POSITION_CLOSED";
        case JournalEventType::STATE_CORRECTED: return "STATE_CORRECTED";
        case JournalEventType::LOCK_CHANGED: return "LOCK_CHANGED";
        case JournalEventType::HALTED: return "HALTED";
        case JournalEventType::DAY_ROLLED: return "DAY_ROLLED";
    }
    return "POSITION_OPENED";
}

EventJournalJsonl::EventJournalJsonl(std::filesystem::path file_path)
    : file_path_(std::move(file_path)) {
    recoverLastSeq();
}

void EventJournalJsonl::recoverLastSeq() {
    std::ifstream in(file_path_, std::ios::binary);
    if (!in.is_open()) {
        return;
    }

    std::string row;
    size_t malformed = 0;
    while (std::getline(in, row)) {
        if (row.empty()) {
            continue;
        }
        try {
            const auto line = nlohmann::json::parse(row);
            last_seq_ = std::max(last_seq_, line.value("seq", static_cast<std::uint64_t>(0)));
        } catch (const nlohmann::json::exception&) {
            malformed++;
        }
    }
    if (malformed > 0) {
        LOG_WARN("Journal {}: {} malformed lines ignored, continuing after seq {}",
                 file_path_.string(), malformed, last_seq_);
    }
}

bool EventJournalJsonl::ensureOpen() {
    if (out_.is_open()) {
        return true;
    }
    if (file_path_.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(file_path_.parent_path(), ec);
        if (ec) {
            LOG_WARN("Journal directory {} not created: {}", file_path_.parent_path().string(), ec.message());
        }
    }
    out_.open(file_path_, std::ios::binary | std::ios::app);
    return out_.is_open();
}

bool EventJournalJsonl::append(const JournalEvent& event) {
    if (!ensureOpen()) {
        return false;
    }

    const nlohmann::json line = {
        {"seq", last_seq_ + 1},
        {"ts_ms", event.ts_ms},
        {"type", toString(event.type)},
        {"symbol", event.symbol},
        {"payload", event.payload}
    };
    out_ << line.dump() << '\n';
    out_.flush();
    if (!out_.good()) {
        out_.close();
        return false;
    }
    last_seq_++;
    return true;
}

} // namespace core
} // namespace trendpilot
