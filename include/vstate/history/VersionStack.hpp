#pragma once

#include "history/CowStateMap.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <vector>

namespace VS::History {

/**
 * Linear sequence of snapshots with a cursor naming the current version.
 *
 * The sequence is never empty and the cursor always indexes a stored entry.
 * append() discards every entry after the cursor before pushing, so
 * committing after an undo permanently drops the old redo tail.
 */
class VersionStack {
public:
    struct Stats {
        std::size_t totalEntries = 0;
        std::size_t undoCount    = 0;
        std::size_t redoCount    = 0;
    };

    VersionStack();
    explicit VersionStack(CowStateMap initial);

    void reset(CowStateMap initial);

    // Truncates the redo tail, pushes, and moves the cursor to the new entry.
    void append(CowStateMap snapshot);
    // Pushes at the tail, keeping any redo tail, and moves the cursor there.
    void push(CowStateMap snapshot);

    [[nodiscard]] auto size() const -> std::size_t { return entries.size(); }
    [[nodiscard]] auto cursor() const -> std::size_t { return cursorIndex; }

    [[nodiscard]] auto canUndo() const -> bool;
    [[nodiscard]] auto canRedo() const -> bool;

    auto undo() -> bool;
    auto redo() -> bool;
    void rewind(std::int64_t steps);

    [[nodiscard]] auto current() const -> CowStateMap const& { return entries[cursorIndex]; }
    [[nodiscard]] auto front() const -> CowStateMap const& { return entries.front(); }

    [[nodiscard]] auto at(std::size_t index) const
        -> std::optional<std::reference_wrapper<CowStateMap const>>;

    [[nodiscard]] auto snapshots() const -> std::span<const CowStateMap> { return entries; }

    [[nodiscard]] auto stats() const -> Stats;

private:
    void dropRedoTail();

    std::vector<CowStateMap> entries;
    std::size_t              cursorIndex = 0;
};

} // namespace VS::History
