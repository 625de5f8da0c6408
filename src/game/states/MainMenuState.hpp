#pragma once

#include "../GameState.hpp"
#include <array>

namespace Wildspirit {

/**
 * Title screen: New Game, Continue, Load Game, Settings, Exit.
 * Continue is disabled until a save exists.
 */
class MainMenuState : public GameState {
public:
    enum class Option {
        NewGame,
        Continue,
        LoadGame,
        Settings,
        Exit
    };

    static constexpr std::array<Option, 5> OPTIONS = {
        Option::NewGame, Option::Continue, Option::LoadGame, Option::Settings, Option::Exit
    };

    using GameState::GameState;

    void enter(const StateData& data) override;
    void handleInput(Input& input) override;
    void render(RenderSurface& surface) override;

    size_t getSelectedIndex() const { return selected_; }
    bool isEnabled(Option option) const;

private:
    void move(int direction);
    void activate(Option option);

    size_t selected_ = 0;
    bool hasSaves_ = false;
};

} // namespace Wildspirit
