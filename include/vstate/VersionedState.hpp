#pragma once

#include "core/Error.hpp"
#include "history/CowStateMap.hpp"
#include "history/HistoryTypes.hpp"
#include "history/StateDelta.hpp"
#include "history/VersionStack.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>

namespace VS {

/**
 * Immutable application state with a linear undo/redo history.
 *
 * Every commit shallow-merges a delta onto the current version and appends the
 * result; stored versions are never modified. Navigation only moves the cursor
 * (or, for reset, replaces or extends the history).
 *
 * Reads materialize a fresh nlohmann::json object on every call, so callers may
 * mutate what they get back without affecting stored versions.
 *
 * No internal locking: callers serialize mutating operations.
 */
class VersionedState {
public:
    VersionedState();
    explicit VersionedState(History::CowStateMap initial, History::HistoryOptions options = {});

    // Fails with InvalidDeltaShape when initialState is neither an object nor null.
    [[nodiscard]] static auto create(nlohmann::json const& initialState, History::HistoryOptions options = {})
        -> Expected<VersionedState>;

    /**
     * Shallow-merges delta onto the current version and makes the result the
     * new current version. Any versions after the cursor are discarded first.
     * On failure the history and cursor are left untouched.
     */
    auto commit(nlohmann::json const& delta) -> Expected<nlohmann::json>;
    auto commit(History::StateUpdater const& updater) -> Expected<nlohmann::json>;
    auto commit(History::ViewUpdater const& updater) -> Expected<nlohmann::json>;
    auto commitDelta(History::StateDelta const& delta) -> Expected<nlohmann::json>;

    [[nodiscard]] auto currentState() const -> nlohmann::json;
    [[nodiscard]] auto currentStateAsPersistentView() const -> History::CowStateMap;
    [[nodiscard]] auto initialState() const -> nlohmann::json;
    [[nodiscard]] auto stateAtVersion(std::int64_t index) const -> Expected<nlohmann::json>;

    // force == true drops all history; otherwise the initial state is appended.
    auto reset(bool force = false) -> nlohmann::json;
    // Moves back n versions, stopping at the first one. Negative n is ignored.
    auto rewind(std::int64_t n) -> nlohmann::json;
    auto undo() -> nlohmann::json;
    auto redo() -> nlohmann::json;

    [[nodiscard]] auto canUndo() const -> bool { return versions.canUndo(); }
    [[nodiscard]] auto canRedo() const -> bool { return versions.canRedo(); }
    [[nodiscard]] auto currentIndex() const -> std::size_t { return versions.cursor(); }
    [[nodiscard]] auto historySize() const -> std::size_t { return versions.size(); }

    [[nodiscard]] auto stats() const -> History::HistoryStats;
    [[nodiscard]] auto lastOperation() const -> std::optional<History::HistoryOperationRecord> const& {
        return lastOperationRecord;
    }
    [[nodiscard]] auto options() const -> History::HistoryOptions const& { return historyOptions; }

private:
    class OperationScope;

    [[nodiscard]] auto resolveDelta(History::StateDelta const& delta) const -> Expected<History::CowStateMap>;

    History::HistoryOptions                        historyOptions;
    History::VersionStack                          versions;
    std::optional<History::HistoryOperationRecord> lastOperationRecord;
};

} // namespace VS
