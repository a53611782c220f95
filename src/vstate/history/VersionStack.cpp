#include "history/VersionStack.hpp"

#include <cstddef>
#include <utility>

namespace VS::History {

VersionStack::VersionStack()
    : VersionStack(CowStateMap{}) {}

VersionStack::VersionStack(CowStateMap initial) {
    entries.push_back(std::move(initial));
}

void VersionStack::reset(CowStateMap initial) {
    entries.clear();
    entries.push_back(std::move(initial));
    cursorIndex = 0;
}

void VersionStack::append(CowStateMap snapshot) {
    dropRedoTail();
    entries.push_back(std::move(snapshot));
    cursorIndex = entries.size() - 1;
}

void VersionStack::push(CowStateMap snapshot) {
    entries.push_back(std::move(snapshot));
    cursorIndex = entries.size() - 1;
}

auto VersionStack::canUndo() const -> bool {
    return cursorIndex > 0;
}

auto VersionStack::canRedo() const -> bool {
    return cursorIndex < entries.size() - 1;
}

auto VersionStack::undo() -> bool {
    if (!canUndo())
        return false;
    cursorIndex -= 1;
    return true;
}

auto VersionStack::redo() -> bool {
    if (!canRedo())
        return false;
    cursorIndex += 1;
    return true;
}

void VersionStack::rewind(std::int64_t steps) {
    if (steps < 0)
        steps = 0;
    auto const target = static_cast<std::int64_t>(cursorIndex) - steps;
    if (target > 0) {
        cursorIndex = static_cast<std::size_t>(target);
    } else {
        cursorIndex = 0;
    }
}

auto VersionStack::at(std::size_t index) const
    -> std::optional<std::reference_wrapper<CowStateMap const>> {
    if (index >= entries.size())
        return std::nullopt;
    return entries[index];
}

auto VersionStack::stats() const -> Stats {
    Stats s;
    s.totalEntries = entries.size();
    s.undoCount    = cursorIndex;
    s.redoCount    = entries.size() - 1 - cursorIndex;
    return s;
}

void VersionStack::dropRedoTail() {
    entries.erase(entries.begin() + static_cast<std::ptrdiff_t>(cursorIndex) + 1, entries.end());
}

} // namespace VS::History
