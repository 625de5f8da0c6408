#pragma once

#include "../GameState.hpp"

namespace Wildspirit {

/**
 * Overworld gameplay. Drives the world simulation and opens overlays:
 * pause, inventory, whatever the player interacts with, and encounters.
 */
class PlayingState : public GameState {
public:
    using GameState::GameState;

    void enter(const StateData& data) override;
    void update(float deltaTime) override;
    void render(RenderSurface& surface) override;
    void handleInput(Input& input) override;

private:
    bool interactionsBlocked() const;
};

} // namespace Wildspirit
