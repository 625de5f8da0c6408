#pragma once

#include "StateData.hpp"
#include "GameServices.hpp"
#include "../services/Localization.hpp"
#include <string>
#include <string_view>

namespace Wildspirit {

class GameStateManager;
class RenderSurface;
class Input;

/**
 * One mode of the game. Every hook defaults to doing nothing, so a state
 * only overrides what it needs.
 *
 * States are created once at startup and entered many times; enter() must
 * fully reset anything that exit() leaves behind.
 */
class GameState {
public:
    GameState(GameStateManager& manager, GameServices& services)
        : manager_(manager)
        , services_(services) {}

    virtual ~GameState() = default;

    GameState(const GameState&) = delete;
    GameState& operator=(const GameState&) = delete;

    virtual void enter(const StateData& data) { (void)data; }
    virtual void exit() {}
    virtual void update(float deltaTime) { (void)deltaTime; }
    virtual void render(RenderSurface& surface) { (void)surface; }
    virtual void handleInput(Input& input) { (void)input; }

    // Another state was pushed on top of this one
    virtual void pause() {}

    // The state above was popped
    virtual void resume() {}

protected:
    /**
     * Localized text, or the key itself when no localization is loaded.
     */
    std::string tr(std::string_view key, const TranslationParams& params = {}) const;

    void playEffect(const std::string& name) const;

    GameStateManager& manager_;
    GameServices& services_;
};

} // namespace Wildspirit
