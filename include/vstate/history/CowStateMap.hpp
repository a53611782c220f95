#pragma once

#include "core/Error.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <map>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace VS::History {

/**
 * Copy-on-write key/value snapshot of application state.
 *
 * Values are immutable once published. A merge copies the key table of the
 * base snapshot and swaps in fresh value nodes only for the keys named by the
 * delta, so every untouched value stays shared with the base.
 *
 * The merge is one level deep: a nested object in the delta replaces the
 * stored value wholesale.
 */
class CowStateMap {
public:
    using Value    = nlohmann::json;
    using ValuePtr = std::shared_ptr<const Value>;
    using Entries  = std::map<std::string, ValuePtr, std::less<>>;

    struct MemoryStats {
        std::size_t uniqueValues = 0;
        std::size_t keySlots     = 0;
    };

    struct DeltaStats {
        std::size_t newValues     = 0;
        std::size_t reusedValues  = 0;
        std::size_t removedValues = 0;
    };

    CowStateMap();

    // Accepts a JSON object; null is read as the empty mapping.
    [[nodiscard]] static auto fromObject(nlohmann::json const& object) -> Expected<CowStateMap>;

    [[nodiscard]] auto merge(nlohmann::json const& delta) const -> Expected<CowStateMap>;
    [[nodiscard]] auto merge(CowStateMap const& delta) const -> CowStateMap;

    [[nodiscard]] auto set(std::string_view key, Value value) const -> CowStateMap;
    [[nodiscard]] auto erase(std::string_view key) const -> CowStateMap;

    [[nodiscard]] auto toObject() const -> nlohmann::json;

    [[nodiscard]] auto find(std::string_view key) const -> ValuePtr;
    [[nodiscard]] auto contains(std::string_view key) const -> bool;
    [[nodiscard]] auto size() const noexcept -> std::size_t { return entries_->size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return entries_->empty(); }
    [[nodiscard]] auto keys() const -> std::vector<std::string>;

    // True when both snapshots hold the very same value node for key.
    [[nodiscard]] auto sharesValueWith(CowStateMap const& other, std::string_view key) const -> bool;

    [[nodiscard]] auto analyzeDelta(CowStateMap const& baseline) const -> DeltaStats;

    [[nodiscard]] static auto analyze(std::span<const CowStateMap> snapshots) -> MemoryStats;

    friend auto operator==(CowStateMap const& lhs, CowStateMap const& rhs) -> bool;

private:
    explicit CowStateMap(std::shared_ptr<const Entries> entries);

    [[nodiscard]] auto cloneEntries() const -> std::shared_ptr<Entries>;

    std::shared_ptr<const Entries> entries_;
};

} // namespace VS::History
