#include "VersionedState.hpp"
#include "log/TaggedLogger.hpp"

#include <chrono>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace VS {

using History::CowStateMap;
using History::HistoryOperationRecord;
using History::StateDelta;

// Records one operation into lastOperationRecord when it goes out of scope.
class VersionedState::OperationScope {
public:
    OperationScope(VersionedState& owner, std::string_view type)
        : owner(owner)
        , startSteady(std::chrono::steady_clock::now()) {
        record.type         = std::string{type};
        record.timestamp    = std::chrono::system_clock::now();
        record.cursorBefore = owner.versions.cursor();
        record.sizeBefore   = owner.versions.size();
        record.success      = false;
        record.message      = "aborted";
    }

    OperationScope(OperationScope const&)            = delete;
    OperationScope& operator=(OperationScope const&) = delete;

    void setResult(bool success, std::string message = {}) {
        record.success = success;
        record.message = std::move(message);
    }

    void setDelta(CowStateMap::DeltaStats stats) { record.delta = stats; }

    ~OperationScope() {
        record.duration    = std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::steady_clock::now() - startSteady);
        record.cursorAfter = owner.versions.cursor();
        record.sizeAfter   = owner.versions.size();
        if (record.success) {
            vs_log(owner.historyOptions.name + ": " + record.type + " -> version "
                       + std::to_string(record.cursorAfter) + " of " + std::to_string(record.sizeAfter),
                   "VersionedState");
        } else {
            vs_log(owner.historyOptions.name + ": " + record.type + " failed: " + record.message,
                   "VersionedState",
                   "ERROR");
        }
        owner.lastOperationRecord = std::move(record);
    }

private:
    VersionedState&                       owner;
    std::chrono::steady_clock::time_point startSteady;
    HistoryOperationRecord                record;
};

VersionedState::VersionedState()
    : VersionedState(CowStateMap{}) {}

VersionedState::VersionedState(CowStateMap initial, History::HistoryOptions options)
    : historyOptions(std::move(options))
    , versions(std::move(initial)) {}

auto VersionedState::create(nlohmann::json const& initialState, History::HistoryOptions options)
    -> Expected<VersionedState> {
    auto initial = CowStateMap::fromObject(initialState);
    if (!initial) {
        vs_log(options.name + ": rejected initial state: " + describeError(initial.error()), "VersionedState", "ERROR");
        return std::unexpected(initial.error());
    }
    return VersionedState{std::move(*initial), std::move(options)};
}

auto VersionedState::commit(nlohmann::json const& delta) -> Expected<nlohmann::json> {
    return commitDelta(StateDelta{delta});
}

auto VersionedState::commit(History::StateUpdater const& updater) -> Expected<nlohmann::json> {
    return commitDelta(StateDelta{updater});
}

auto VersionedState::commit(History::ViewUpdater const& updater) -> Expected<nlohmann::json> {
    return commitDelta(StateDelta{updater});
}

auto VersionedState::commitDelta(StateDelta const& delta) -> Expected<nlohmann::json> {
    OperationScope scope(*this, "commit");

    auto next = resolveDelta(delta);
    if (!next) {
        scope.setResult(false, describeError(next.error()));
        return std::unexpected(next.error());
    }
    if (historyOptions.trackSharing) {
        scope.setDelta(next->analyzeDelta(versions.current()));
    }
    versions.append(std::move(*next));
    scope.setResult(true);
    return currentState();
}

auto VersionedState::resolveDelta(StateDelta const& delta) const -> Expected<CowStateMap> {
    auto const& base = versions.current();
    return std::visit(
        [&base](auto const& alternative) -> Expected<CowStateMap> {
            using T = std::decay_t<decltype(alternative)>;
            if constexpr (std::is_same_v<T, nlohmann::json>) {
                return base.merge(alternative);
            } else if constexpr (std::is_same_v<T, History::StateUpdater>) {
                if (!alternative) {
                    return std::unexpected(Error{Error::Code::InvalidDeltaShape, "empty state updater"});
                }
                return base.merge(alternative(base.toObject()));
            } else {
                if (!alternative) {
                    return std::unexpected(Error{Error::Code::InvalidDeltaShape, "empty view updater"});
                }
                return base.merge(alternative(base));
            }
        },
        delta.variant());
}

auto VersionedState::currentState() const -> nlohmann::json {
    return versions.current().toObject();
}

auto VersionedState::currentStateAsPersistentView() const -> CowStateMap {
    return versions.current();
}

auto VersionedState::initialState() const -> nlohmann::json {
    return versions.front().toObject();
}

auto VersionedState::stateAtVersion(std::int64_t index) const -> Expected<nlohmann::json> {
    if (index >= 0) {
        if (auto snapshot = versions.at(static_cast<std::size_t>(index))) {
            return snapshot->get().toObject();
        }
    }
    return std::unexpected(Error{Error::Code::IndexOutOfRange,
                                 "version " + std::to_string(index) + " outside [0, "
                                     + std::to_string(versions.size() - 1) + "]"});
}

auto VersionedState::reset(bool force) -> nlohmann::json {
    OperationScope scope(*this, force ? "reset.hard" : "reset");
    auto initial = versions.front();
    if (force) {
        versions.reset(std::move(initial));
    } else {
        versions.push(std::move(initial));
    }
    scope.setResult(true);
    return currentState();
}

auto VersionedState::rewind(std::int64_t n) -> nlohmann::json {
    OperationScope scope(*this, "rewind");
    versions.rewind(n);
    scope.setResult(true);
    return currentState();
}

auto VersionedState::undo() -> nlohmann::json {
    OperationScope scope(*this, "undo");
    versions.undo();
    scope.setResult(true);
    return currentState();
}

auto VersionedState::redo() -> nlohmann::json {
    OperationScope scope(*this, "redo");
    versions.redo();
    scope.setResult(true);
    return currentState();
}

auto VersionedState::stats() const -> History::HistoryStats {
    History::HistoryStats stats;
    auto const counts      = versions.stats();
    stats.counts.versions  = counts.totalEntries;
    stats.counts.cursor    = versions.cursor();
    stats.counts.undo      = counts.undoCount;
    stats.counts.redo      = counts.redoCount;
    stats.sharing          = CowStateMap::analyze(versions.snapshots());
    stats.lastOperation    = lastOperationRecord;
    return stats;
}

} // namespace VS
