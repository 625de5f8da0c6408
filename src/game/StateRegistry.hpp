#pragma once

#include "StateId.hpp"
#include "GameState.hpp"
#include <memory>
#include <unordered_map>

namespace Wildspirit {

/**
 * Fixed StateId -> state instance table, filled once at startup.
 */
class StateRegistry {
public:
    /**
     * Register the instance for an id. Registering an id twice replaces the
     * earlier instance (and logs a warning).
     */
    void add(StateId id, std::unique_ptr<GameState> state);

    GameState* find(StateId id) const;
    bool contains(StateId id) const { return states_.contains(id); }
    size_t size() const { return states_.size(); }

private:
    std::unordered_map<StateId, std::unique_ptr<GameState>> states_;
};

} // namespace Wildspirit
