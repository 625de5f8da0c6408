#pragma once

#include "../GameState.hpp"

namespace Wildspirit {

/**
 * Boot screen. Warms the audio cache, then moves on to the main menu.
 */
class LoadingState : public GameState {
public:
    static constexpr float MIN_DISPLAY_SECONDS = 0.5f;

    using GameState::GameState;

    void enter(const StateData& data) override;
    void update(float deltaTime) override;
    void render(RenderSurface& surface) override;

    float getProgress() const;

private:
    float elapsed_ = 0.0f;
};

} // namespace Wildspirit
