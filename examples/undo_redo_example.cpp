#include <vstate/VersionedState.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <iostream>

using nlohmann::json;

namespace {

void show(char const* label, VS::VersionedState const& state) {
    std::cout << label << " [" << state.currentIndex() << "/" << state.historySize() - 1 << "] "
              << state.currentState().dump() << '\n';
}

} // namespace

int main() {
    VS::History::HistoryOptions options;
    options.name = "document";

    auto created = VS::VersionedState::create(json{{"title", "untitled"}, {"words", 0}}, options);
    if (!created) {
        std::cerr << VS::describeError(created.error()) << '\n';
        return 1;
    }
    auto& state = *created;
    show("initial", state);

    if (auto result = state.commit({{"title", "Draft"}}); !result) {
        std::cerr << VS::describeError(result.error()) << '\n';
        return 1;
    }
    show("rename ", state);

    auto counted = state.commit([](json const& current) -> json {
        return {{"words", current["words"].get<int>() + 250}};
    });
    if (!counted) {
        std::cerr << VS::describeError(counted.error()) << '\n';
        return 1;
    }
    show("write  ", state);

    state.undo();
    show("undo   ", state);
    state.redo();
    show("redo   ", state);

    state.rewind(5);
    show("rewind ", state);

    // Committing here drops the two versions that could have been redone.
    if (auto branched = state.commit({{"title", "Outline"}}); !branched) {
        std::cerr << VS::describeError(branched.error()) << '\n';
        return 1;
    }
    show("branch ", state);

    if (auto rejected = state.commit(json::array({"not", "a", "mapping"})); !rejected) {
        std::cout << "rejected: " << VS::describeError(rejected.error()) << '\n';
    }

    auto version = state.stateAtVersion(static_cast<std::int64_t>(state.historySize()));
    if (!version) {
        std::cout << "lookup:   " << VS::describeError(version.error()) << '\n';
    }

    state.reset(true);
    show("reset  ", state);

    auto const stats = state.stats();
    std::cout << "versions=" << stats.counts.versions << " unique values=" << stats.sharing.uniqueValues << '\n';
    return 0;
}
