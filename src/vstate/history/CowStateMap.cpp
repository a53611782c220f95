#include "history/CowStateMap.hpp"

#include <string>
#include <unordered_set>
#include <utility>

namespace VS::History {

namespace {

auto describeType(nlohmann::json const& value) -> std::string {
    return std::string{"expected an object, got "} + value.type_name();
}

} // namespace

CowStateMap::CowStateMap()
    : entries_(std::make_shared<const Entries>()) {}

CowStateMap::CowStateMap(std::shared_ptr<const Entries> entries)
    : entries_(std::move(entries)) {}

auto CowStateMap::fromObject(nlohmann::json const& object) -> Expected<CowStateMap> {
    return CowStateMap{}.merge(object);
}

auto CowStateMap::merge(nlohmann::json const& delta) const -> Expected<CowStateMap> {
    if (delta.is_null()) {
        return CowStateMap{entries_};
    }
    if (!delta.is_object()) {
        return std::unexpected(Error{Error::Code::InvalidDeltaShape, describeType(delta)});
    }
    auto table = cloneEntries();
    for (auto const& [key, value] : delta.items()) {
        table->insert_or_assign(key, std::make_shared<const Value>(value));
    }
    return CowStateMap{std::shared_ptr<const Entries>(std::move(table))};
}

auto CowStateMap::merge(CowStateMap const& delta) const -> CowStateMap {
    if (delta.empty()) {
        return CowStateMap{entries_};
    }
    auto table = cloneEntries();
    for (auto const& [key, value] : *delta.entries_) {
        table->insert_or_assign(key, value);
    }
    return CowStateMap{std::shared_ptr<const Entries>(std::move(table))};
}

auto CowStateMap::set(std::string_view key, Value value) const -> CowStateMap {
    auto table = cloneEntries();
    table->insert_or_assign(std::string{key}, std::make_shared<const Value>(std::move(value)));
    return CowStateMap{std::shared_ptr<const Entries>(std::move(table))};
}

auto CowStateMap::erase(std::string_view key) const -> CowStateMap {
    auto it = entries_->find(key);
    if (it == entries_->end()) {
        return CowStateMap{entries_};
    }
    auto table = cloneEntries();
    table->erase(it->first);
    return CowStateMap{std::shared_ptr<const Entries>(std::move(table))};
}

auto CowStateMap::toObject() const -> nlohmann::json {
    auto object = nlohmann::json::object();
    for (auto const& [key, value] : *entries_) {
        object[key] = value ? *value : nlohmann::json{};
    }
    return object;
}

auto CowStateMap::find(std::string_view key) const -> ValuePtr {
    auto it = entries_->find(key);
    if (it == entries_->end()) {
        return nullptr;
    }
    return it->second;
}

auto CowStateMap::contains(std::string_view key) const -> bool {
    return entries_->find(key) != entries_->end();
}

auto CowStateMap::keys() const -> std::vector<std::string> {
    std::vector<std::string> names;
    names.reserve(entries_->size());
    for (auto const& [key, _] : *entries_) {
        names.push_back(key);
    }
    return names;
}

auto CowStateMap::sharesValueWith(CowStateMap const& other, std::string_view key) const -> bool {
    auto mine   = find(key);
    auto theirs = other.find(key);
    return mine && mine == theirs;
}

auto CowStateMap::analyzeDelta(CowStateMap const& baseline) const -> DeltaStats {
    DeltaStats stats;

    std::unordered_set<Value const*> baselineSet;
    baselineSet.reserve(baseline.size());
    for (auto const& [_, value] : *baseline.entries_) {
        baselineSet.insert(value.get());
    }

    std::unordered_set<Value const*> updatedSet;
    updatedSet.reserve(size());
    for (auto const& [_, value] : *entries_) {
        auto raw = value.get();
        updatedSet.insert(raw);
        if (baselineSet.contains(raw)) {
            stats.reusedValues++;
        } else {
            stats.newValues++;
        }
    }

    for (auto const* raw : baselineSet) {
        if (!updatedSet.contains(raw)) {
            stats.removedValues++;
        }
    }
    return stats;
}

auto CowStateMap::analyze(std::span<const CowStateMap> snapshots) -> MemoryStats {
    MemoryStats stats;
    std::unordered_set<Value const*> visited;
    for (auto const& snapshot : snapshots) {
        for (auto const& [_, value] : *snapshot.entries_) {
            stats.keySlots++;
            if (value && visited.insert(value.get()).second) {
                stats.uniqueValues++;
            }
        }
    }
    return stats;
}

auto CowStateMap::cloneEntries() const -> std::shared_ptr<Entries> {
    return std::make_shared<Entries>(*entries_);
}

auto operator==(CowStateMap const& lhs, CowStateMap const& rhs) -> bool {
    if (lhs.entries_ == rhs.entries_) {
        return true;
    }
    if (lhs.size() != rhs.size()) {
        return false;
    }
    auto left  = lhs.entries_->begin();
    auto right = rhs.entries_->begin();
    for (; left != lhs.entries_->end(); ++left, ++right) {
        if (left->first != right->first) {
            return false;
        }
        if (left->second != right->second && *left->second != *right->second) {
            return false;
        }
    }
    return true;
}

} // namespace VS::History
