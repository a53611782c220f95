#pragma once

#include "history/CowStateMap.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace VS::History {

struct HistoryOptions {
    std::string name         = "state";
    bool        trackSharing = true;
};

struct HistoryOperationRecord {
    std::string                           type;
    std::chrono::system_clock::time_point timestamp;
    std::chrono::nanoseconds              duration{0};
    bool                                  success      = true;
    std::size_t                           cursorBefore = 0;
    std::size_t                           cursorAfter  = 0;
    std::size_t                           sizeBefore   = 0;
    std::size_t                           sizeAfter    = 0;
    std::optional<CowStateMap::DeltaStats> delta;
    std::string                           message;
};

struct HistoryCounts {
    std::size_t versions = 0;
    std::size_t cursor   = 0;
    std::size_t undo     = 0;
    std::size_t redo     = 0;
};

struct HistoryStats {
    HistoryCounts                         counts;
    CowStateMap::MemoryStats              sharing;
    std::optional<HistoryOperationRecord> lastOperation;
};

} // namespace VS::History
