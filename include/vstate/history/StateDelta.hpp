#pragma once

#include "history/CowStateMap.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <utility>
#include <variant>

namespace VS::History {

// Produces a delta from the materialized current state.
using StateUpdater = std::function<nlohmann::json(nlohmann::json const& current)>;
// Produces a delta from the persistent view, skipping materialization.
using ViewUpdater  = std::function<CowStateMap(CowStateMap const& current)>;

/**
 * What a commit merges onto the current version: either a literal mapping or
 * a pure function of the current state that yields one.
 */
class StateDelta {
public:
    using Variant = std::variant<nlohmann::json, StateUpdater, ViewUpdater>;

    StateDelta(nlohmann::json value)
        : variant_(std::move(value)) {}
    StateDelta(StateUpdater updater)
        : variant_(std::move(updater)) {}
    StateDelta(ViewUpdater updater)
        : variant_(std::move(updater)) {}

    [[nodiscard]] static auto value(nlohmann::json mapping) -> StateDelta {
        return StateDelta{std::move(mapping)};
    }
    [[nodiscard]] static auto updater(StateUpdater fn) -> StateDelta {
        return StateDelta{std::move(fn)};
    }
    [[nodiscard]] static auto viewUpdater(ViewUpdater fn) -> StateDelta {
        return StateDelta{std::move(fn)};
    }

    [[nodiscard]] auto variant() const noexcept -> Variant const& { return variant_; }

private:
    Variant variant_;
};

} // namespace VS::History
