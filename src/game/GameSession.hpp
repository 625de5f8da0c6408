#pragma once

#include "../rpg/Party.hpp"
#include "../rpg/Inventory.hpp"
#include "../script/GameVariables.hpp"
#include <string>

namespace Wildspirit {

/**
 * Everything a save game captures: party, items, story variables, time played.
 */
struct GameSession {
    explicit GameSession(const ItemCatalog* catalog) : inventory(catalog) {}

    Party party;
    Inventory inventory;
    GameVariables variables;

    std::string mapName = "meadow";
    double playtimeSeconds = 0.0;

    // Seconds left before world interactions and encounters fire again
    float interactionCooldown = 0.0f;

    bool started = false;

    /**
     * Wipe progress and hand out the starting spirit and supplies.
     */
    void startNewGame();

    void reset();
};

} // namespace Wildspirit
