#pragma once

#include "../GameState.hpp"
#include <array>

namespace Wildspirit {

/**
 * Pause menu pushed over gameplay (or battle).
 */
class PausedState : public GameState {
public:
    enum class Option {
        Resume,
        Inventory,
        Save,
        Settings,
        MainMenu
    };

    static constexpr std::array<Option, 5> OPTIONS = {
        Option::Resume, Option::Inventory, Option::Save, Option::Settings, Option::MainMenu
    };

    using GameState::GameState;

    void enter(const StateData& data) override;
    void handleInput(Input& input) override;
    void render(RenderSurface& surface) override;

    size_t getSelectedIndex() const { return selected_; }

private:
    void activate(Option option);

    size_t selected_ = 0;
};

} // namespace Wildspirit
