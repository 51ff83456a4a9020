#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>

#include "core/contracts/IEventJournal.h"

namespace trendpilot {
namespace core {

// One JSON object per line: {"seq","ts_ms","type","symbol","payload"}
class EventJournalJsonl : public IEventJournal {
public:
    // Scans an existing file so numbering continues after the last valid line
    explicit EventJournalJsonl(std::filesystem::path file_path);

    bool append(const JournalEvent& event) override;
    std::uint64_t lastSeq() const override { return last_seq_; }

    const std::filesystem::path& path() const { return file_path_; }

private:
    void recoverLastSeq();
    bool ensureOpen();

    std::filesystem::path file_path_;
    std::ofstream out_;
    std::uint64_t last_seq_ = 0;
};

} // namespace core
} // namespace trendpilot
