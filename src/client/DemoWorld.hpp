#pragma once

#include "../game/WorldSimulation.hpp"
#include <string>
#include <vector>

namespace Wildspirit {

class GameVariables;

/**
 * A small meadow for the headless client. The player "faces" each
 * interactable in turn, and a roaming spirit bumps into them every
 * ENCOUNTER_INTERVAL seconds of field time.
 */
class DemoWorld : public WorldSimulation {
public:
    static constexpr float ENCOUNTER_INTERVAL = 12.0f;

    explicit DemoWorld(const GameVariables* variables = nullptr);

    /**
     * Attach an NPC script from disk. NPCs without one fall back to their fixed lines.
     */
    bool loadScript(const std::string& npcId, const std::string& filepath);

    void update(float deltaTime) override;
    void render(RenderSurface& surface) override;
    std::optional<WorldTransition> interact() override;
    std::optional<BattleRequest> pollEncounter() override;
    void removeObject(const std::string& objectId) override;
    std::string getMapName() const override { return "meadow"; }

    // Put every object back (new game or loaded save)
    void reset();

    bool hasObject(const std::string& objectId) const;

private:
    struct Interactable {
        std::string id;
        WorldTransition opens;
        bool removed = false;
    };

    struct RoamingSpirit {
        std::string id;
        BattleRequest encounter;
        bool removed = false;
    };

    void populate();
    bool isGone(const std::string& id, bool removed) const;

    const GameVariables* variables_;
    std::vector<Interactable> interactables_;
    std::vector<RoamingSpirit> roaming_;
    size_t facing_ = 0;
    float encounterTimer_ = 0.0f;
    bool encounterDue_ = false;
};

} // namespace Wildspirit
