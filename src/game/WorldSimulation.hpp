#pragma once

#include "StateId.hpp"
#include "StateData.hpp"
#include <optional>
#include <string>

namespace Wildspirit {

class RenderSurface;

/**
 * A state the world wants to open on top of gameplay (talking to an NPC,
 * opening a chest, browsing a stall).
 */
struct WorldTransition {
    StateId target;
    StateData data;
};

/**
 * The overworld: map, player movement, NPCs and roaming spirits.
 * PlayingState drives it and turns its events into state transitions.
 */
class WorldSimulation {
public:
    virtual ~WorldSimulation() = default;

    virtual void update(float deltaTime) = 0;
    virtual void render(RenderSurface& surface) = 0;

    /**
     * The player pressed interact. Returns what to open, if anything is in reach.
     */
    virtual std::optional<WorldTransition> interact() = 0;

    /**
     * A roaming spirit touched the player this frame.
     */
    virtual std::optional<BattleRequest> pollEncounter() = 0;

    // Remove a defeated spirit or emptied chest
    virtual void removeObject(const std::string& objectId) { (void)objectId; }

    virtual std::string getMapName() const { return "meadow"; }
};

} // namespace Wildspirit
