#include "StateRegistry.hpp"
#include <spdlog/spdlog.h>

namespace Wildspirit {

void StateRegistry::add(StateId id, std::unique_ptr<GameState> state) {
    if (!state) {
        spdlog::error("Refusing to register null state for {}", id);
        return;
    }
    if (states_.contains(id)) {
        spdlog::warn("State {} registered twice, replacing", id);
    }
    states_[id] = std::move(state);
}

GameState* StateRegistry::find(StateId id) const {
    auto it = states_.find(id);
    return it != states_.end() ? it->second.get() : nullptr;
}

} // namespace Wildspirit
