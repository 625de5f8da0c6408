#pragma once

#include "../GameState.hpp"

namespace Wildspirit {

/**
 * Contents of a chest or a defeated spirit's drop. Confirm takes everything,
 * cancel leaves it where it is.
 */
class LootWindowState : public GameState {
public:
    using GameState::GameState;

    void enter(const StateData& data) override;
    void handleInput(Input& input) override;
    void render(RenderSurface& surface) override;

    /**
     * Move all items and gold into the inventory and mark the source as emptied.
     * Items that no longer fit stay behind.
     */
    void takeAll();

    const LootRequest& getLoot() const { return loot_; }

private:
    LootRequest loot_;
};

} // namespace Wildspirit
