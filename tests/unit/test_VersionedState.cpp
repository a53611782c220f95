#include "VersionedState.hpp"

#include <doctest/doctest.h>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace VS;
using namespace VS::History;
using nlohmann::json;

namespace {

auto makeState(json const& initial, HistoryOptions options = {}) -> VersionedState {
    auto state = VersionedState::create(initial, std::move(options));
    REQUIRE_MESSAGE(state.has_value(), "create failed for: " << initial.dump());
    return std::move(*state);
}

auto commitOk(VersionedState& state, json const& delta) -> json {
    auto result = state.commit(delta);
    REQUIRE_MESSAGE(result.has_value(), "commit failed for: " << delta.dump());
    return *result;
}

} // namespace

TEST_SUITE("VersionedState") {

TEST_CASE("construction stores the initial state as version zero") {
    auto state = makeState(json{{"x", 0}});
    CHECK(state.historySize() == 1);
    CHECK(state.currentIndex() == 0);
    CHECK(state.currentState() == json{{"x", 0}});
    CHECK(state.initialState() == json{{"x", 0}});
    CHECK_FALSE(state.canUndo());
    CHECK_FALSE(state.canRedo());
    CHECK_FALSE(state.lastOperation().has_value());
}

TEST_CASE("default and null construction start empty") {
    VersionedState defaulted;
    CHECK(defaulted.currentState() == json::object());

    auto fromNull = makeState(json{});
    CHECK(fromNull.currentState() == json::object());
    CHECK(fromNull.historySize() == 1);
}

TEST_CASE("create rejects non-object initial state") {
    auto state = VersionedState::create(json::array({1, 2, 3}));
    REQUIRE_FALSE(state.has_value());
    CHECK(state.error().code == Error::Code::InvalidDeltaShape);
}

TEST_CASE("commit shallow merges onto the current version") {
    auto state  = makeState(json{{"a", 0}, {"b", 2}});
    auto result = commitOk(state, json{{"a", 1}});
    CHECK(result == json{{"a", 1}, {"b", 2}});
    CHECK(state.currentState() == result);
    CHECK(state.historySize() == 2);
    CHECK(state.currentIndex() == 1);
    CHECK(state.canUndo());
}

TEST_CASE("commit replaces nested values wholesale") {
    auto state = makeState(json{{"settings", {{"theme", "dark"}, {"zoom", 2}}}, {"title", "doc"}});
    commitOk(state, json{{"settings", {{"zoom", 3}}}});
    CHECK(state.currentState() == json{{"settings", {{"zoom", 3}}}, {"title", "doc"}});
}

TEST_CASE("commit accepts braced deltas") {
    auto state = makeState(json{{"count", 0}});
    auto result = state.commit({{"count", 5}, {"label", "five"}});
    REQUIRE(result.has_value());
    CHECK(*result == json{{"count", 5}, {"label", "five"}});
}

TEST_CASE("commit with an updater sees the materialized current state") {
    auto state = makeState(json{{"count", 1}, {"name", "n"}});
    auto result = state.commit(StateUpdater{[](json const& current) {
        return json{{"count", current["count"].get<int>() + 1}};
    }});
    REQUIRE(result.has_value());
    CHECK(*result == json{{"count", 2}, {"name", "n"}});

    auto again = state.commit([](json const& current) -> json {
        return {{"count", current["count"].get<int>() * 10}};
    });
    REQUIRE(again.has_value());
    CHECK((*again)["count"] == 20);
}

TEST_CASE("commit with a view updater receives the persistent snapshot") {
    auto state = makeState(json{{"items", json::array({"a"})}, {"count", 1}});
    auto before = state.currentStateAsPersistentView();

    auto result = state.commit([](CowStateMap const& current) -> CowStateMap {
        return current.set("count", current.find("count")->get<int>() + 1);
    });
    REQUIRE(result.has_value());
    CHECK(*result == json{{"items", json::array({"a"})}, {"count", 2}});

    auto after = state.currentStateAsPersistentView();
    CHECK(after.sharesValueWith(before, "items"));
    CHECK_FALSE(after.sharesValueWith(before, "count"));
}

TEST_CASE("commitDelta dispatches each delta kind") {
    auto state = makeState(json{{"v", 0}});
    std::vector<StateDelta> deltas{
        StateDelta::value(json{{"v", 1}}),
        StateDelta::updater([](json const& s) { return json{{"v", s["v"].get<int>() + 1}}; }),
        StateDelta::viewUpdater([](CowStateMap const& s) { return s.set("w", true); }),
    };
    for (auto const& delta : deltas) {
        REQUIRE(state.commitDelta(delta).has_value());
    }
    CHECK(state.currentState() == json{{"v", 2}, {"w", true}});
    CHECK(state.historySize() == 4);
}

TEST_CASE("commit with null delta appends an identical version") {
    auto state  = makeState(json{{"a", 1}});
    auto result = commitOk(state, json{});
    CHECK(result == json{{"a", 1}});
    CHECK(state.historySize() == 2);
}

TEST_CASE("invalid delta leaves history untouched") {
    auto state = makeState(json{{"x", 0}});
    commitOk(state, json{{"x", 1}});
    commitOk(state, json{{"x", 2}});
    state.undo();

    auto failed = state.commit(json::array({"x", 3}));
    REQUIRE_FALSE(failed.has_value());
    CHECK(failed.error().code == Error::Code::InvalidDeltaShape);
    CHECK(state.historySize() == 3);
    CHECK(state.currentIndex() == 1);
    CHECK(state.canRedo());
    CHECK(state.currentState() == json{{"x", 1}});

    auto fromUpdater = state.commit([](json const&) -> json { return 42; });
    REQUIRE_FALSE(fromUpdater.has_value());
    CHECK(fromUpdater.error().code == Error::Code::InvalidDeltaShape);
    CHECK(state.historySize() == 3);

    auto const& last = state.lastOperation();
    REQUIRE(last.has_value());
    CHECK(last->type == "commit");
    CHECK_FALSE(last->success);
    CHECK(last->message.find("invalid_delta_shape") != std::string::npos);
    CHECK(last->sizeBefore == last->sizeAfter);
}

TEST_CASE("empty updater is rejected") {
    auto state  = makeState(json{{"x", 0}});
    auto result = state.commit(StateUpdater{});
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == Error::Code::InvalidDeltaShape);
    CHECK(state.historySize() == 1);
}

TEST_CASE("throwing updater propagates and leaves history untouched") {
    auto state = makeState(json{{"x", 0}});
    CHECK_THROWS_AS(state.commit([](json const&) -> json { throw std::runtime_error("boom"); }),
                    std::runtime_error);
    CHECK(state.historySize() == 1);
    CHECK(state.currentState() == json{{"x", 0}});
    REQUIRE(state.lastOperation().has_value());
    CHECK_FALSE(state.lastOperation()->success);
}

TEST_CASE("undo and redo round trip") {
    auto state = makeState(json{{"x", 0}});
    commitOk(state, json{{"x", 1}});
    commitOk(state, json{{"x", 2}});

    state.undo();
    CHECK(state.undo() == json{{"x", 0}});
    CHECK_FALSE(state.canUndo());
    CHECK(state.undo() == json{{"x", 0}});

    state.redo();
    CHECK(state.redo() == json{{"x", 2}});
    CHECK_FALSE(state.canRedo());
    CHECK(state.redo() == json{{"x", 2}});
    CHECK(state.currentIndex() == 2);
}

TEST_CASE("commit after undo truncates the redo tail") {
    auto state = makeState(json{{"x", 0}});
    for (int i = 1; i <= 4; ++i) {
        commitOk(state, json{{"x", i}});
    }
    state.undo();
    state.undo();
    state.undo();
    auto const cursorBefore = state.currentIndex();
    CHECK(cursorBefore == 1);
    CHECK(state.canRedo());

    commitOk(state, json{{"x", 99}});
    CHECK_FALSE(state.canRedo());
    CHECK(state.historySize() == (cursorBefore + 1) + 1);
    CHECK(state.currentIndex() == state.historySize() - 1);

    auto second = state.stateAtVersion(1);
    REQUIRE(second.has_value());
    CHECK(*second == json{{"x", 1}});
}

TEST_CASE("stored versions never change") {
    auto state = makeState(json{{"list", json::array({1})}, {"n", 0}});
    commitOk(state, json{{"n", 1}});

    std::vector<json> recorded;
    for (std::int64_t i = 0; i < static_cast<std::int64_t>(state.historySize()); ++i) {
        recorded.push_back(*state.stateAtVersion(i));
    }

    auto mutated = state.currentState();
    mutated["list"].push_back(2);
    commitOk(state, json{{"list", json::array({7})}});
    state.undo();
    state.undo();
    commitOk(state, json{{"n", 5}});

    for (std::size_t i = 0; i < recorded.size(); ++i) {
        auto now = state.stateAtVersion(static_cast<std::int64_t>(i));
        REQUIRE(now.has_value());
        CHECK(*now == recorded[i]);
    }
}

TEST_CASE("current state reads are independent copies") {
    auto state = makeState(json{{"list", json::array({1, 2})}});
    auto first  = state.currentState();
    auto second = state.currentState();
    CHECK(first == second);

    first["list"].push_back(3);
    first["added"] = true;
    CHECK(second == json{{"list", json::array({1, 2})}});
    CHECK(state.currentState() == json{{"list", json::array({1, 2})}});
}

TEST_CASE("hard reset drops all history") {
    auto state = makeState(json{{"x", 0}});
    commitOk(state, json{{"x", 1}});
    commitOk(state, json{{"y", 2}});

    auto result = state.reset(true);
    CHECK(result == json{{"x", 0}});
    CHECK(state.historySize() == 1);
    CHECK(state.currentIndex() == 0);
    CHECK(state.currentState() == state.initialState());
    CHECK_FALSE(state.canUndo());
    CHECK_FALSE(state.canRedo());
    CHECK(state.undo() == json{{"x", 0}});
    CHECK(state.currentIndex() == 0);
}

TEST_CASE("soft reset appends the initial state") {
    auto state = makeState(json{{"x", 0}});
    commitOk(state, json{{"x", 1}});
    commitOk(state, json{{"x", 2}});
    auto const sizeBefore = state.historySize();

    CHECK(state.reset() == json{{"x", 0}});
    CHECK(state.historySize() == sizeBefore + 1);
    CHECK(state.currentIndex() == sizeBefore);
    CHECK(state.canUndo());
    CHECK(state.undo() == json{{"x", 2}});
}

TEST_CASE("soft reset keeps the redo tail") {
    auto state = makeState(json{{"x", 0}});
    commitOk(state, json{{"x", 1}});
    commitOk(state, json{{"x", 2}});
    state.rewind(2);

    state.reset(false);
    CHECK(state.historySize() == 4);
    CHECK(state.currentIndex() == 3);
    CHECK(*state.stateAtVersion(2) == json{{"x", 2}});
}

TEST_CASE("rewind clamps at the initial version") {
    auto state = makeState(json{{"x", 0}});
    for (int i = 1; i <= 5; ++i) {
        commitOk(state, json{{"x", i}});
    }

    CHECK(state.rewind(2) == json{{"x", 3}});
    CHECK(state.currentIndex() == 3);

    CHECK(state.rewind(-3) == json{{"x", 3}});
    CHECK(state.currentIndex() == 3);

    CHECK(state.rewind(3) == json{{"x", 0}});
    CHECK(state.currentIndex() == 0);

    state.redo();
    state.redo();
    CHECK(state.rewind(100) == json{{"x", 0}});
    CHECK(state.currentIndex() == 0);
    CHECK(state.historySize() == 6);
    CHECK(state.canRedo());
}

TEST_CASE("stateAtVersion rejects out of range indices") {
    auto state = makeState(json{{"x", 0}});
    commitOk(state, json{{"x", 1}});

    auto past = state.stateAtVersion(static_cast<std::int64_t>(state.historySize()));
    REQUIRE_FALSE(past.has_value());
    CHECK(past.error().code == Error::Code::IndexOutOfRange);

    auto negative = state.stateAtVersion(-1);
    REQUIRE_FALSE(negative.has_value());
    CHECK(negative.error().code == Error::Code::IndexOutOfRange);

    auto first = state.stateAtVersion(0);
    REQUIRE(first.has_value());
    CHECK(*first == json{{"x", 0}});
}

TEST_CASE("cursor stays within bounds across mixed operations") {
    auto state = makeState(json{{"n", 0}});
    for (int step = 0; step < 40; ++step) {
        switch (step % 7) {
        case 0:
        case 3:
            commitOk(state, json{{"n", step}});
            break;
        case 1:
            state.undo();
            break;
        case 2:
            state.rewind(step % 4);
            break;
        case 4:
            state.redo();
            break;
        case 5:
            state.reset(step % 2 == 0);
            break;
        default:
            state.undo();
            state.undo();
            break;
        }
        CHECK(state.currentIndex() < state.historySize());
        CHECK(state.canUndo() == (state.currentIndex() > 0));
        CHECK(state.canRedo() == (state.currentIndex() < state.historySize() - 1));
    }
}

TEST_CASE("last operation records navigation and commits") {
    auto state = makeState(json{{"a", 1}, {"b", 2}});
    commitOk(state, json{{"a", 3}});

    auto record = state.lastOperation();
    REQUIRE(record.has_value());
    CHECK(record->type == "commit");
    CHECK(record->success);
    CHECK(record->cursorBefore == 0);
    CHECK(record->cursorAfter == 1);
    CHECK(record->sizeAfter == 2);
    REQUIRE(record->delta.has_value());
    CHECK(record->delta->newValues == 1);
    CHECK(record->delta->reusedValues == 1);

    state.rewind(5);
    REQUIRE(state.lastOperation().has_value());
    CHECK(state.lastOperation()->type == "rewind");
    CHECK(state.lastOperation()->cursorAfter == 0);

    state.reset(true);
    CHECK(state.lastOperation()->type == "reset.hard");
}

TEST_CASE("sharing tracking can be disabled") {
    HistoryOptions options;
    options.name         = "untracked";
    options.trackSharing = false;
    auto state = makeState(json{{"a", 1}}, options);
    commitOk(state, json{{"a", 2}});

    REQUIRE(state.lastOperation().has_value());
    CHECK_FALSE(state.lastOperation()->delta.has_value());
    CHECK(state.options().name == "untracked");
}

TEST_CASE("stats report counts and structural sharing") {
    auto state = makeState(json{{"doc", json::array({1, 2, 3})}, {"cursor", 0}});
    commitOk(state, json{{"cursor", 1}});
    commitOk(state, json{{"cursor", 2}});
    state.undo();

    auto stats = state.stats();
    CHECK(stats.counts.versions == 3);
    CHECK(stats.counts.cursor == 1);
    CHECK(stats.counts.undo == 1);
    CHECK(stats.counts.redo == 1);
    CHECK(stats.sharing.keySlots == 6);
    CHECK(stats.sharing.uniqueValues == 4);
    REQUIRE(stats.lastOperation.has_value());
    CHECK(stats.lastOperation->type == "undo");
}

TEST_CASE("copies keep independent histories") {
    auto state = makeState(json{{"x", 0}});
    commitOk(state, json{{"x", 1}});

    auto copy = state;
    commitOk(copy, json{{"x", 2}});
    state.undo();

    CHECK(state.currentState() == json{{"x", 0}});
    CHECK(copy.currentState() == json{{"x", 2}});
    CHECK(copy.historySize() == 3);
    CHECK(state.historySize() == 2);
}

} // TEST_SUITE
