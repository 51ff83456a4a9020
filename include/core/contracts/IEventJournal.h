#pragma once

#include <cstdint>

#include "core/model/JournalEvent.h"

namespace trendpilot {
namespace core {

// Append-only record of position lifecycle events. Sequence numbers are
// assigned by the journal and never repeat, also across restarts.
class IEventJournal {
public:
    virtual ~IEventJournal() = default;

    virtual bool append(const JournalEvent& event) = 0;
    virtual std::uint64_t lastSeq() const = 0;
};

} // namespace core
} // namespace trendpilot
