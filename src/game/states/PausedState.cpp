#include "PausedState.hpp"
#include "../GameStateManager.hpp"
#include "../../core/InputActions.hpp"
#include "../../core/RenderSurface.hpp"
#include "../../ui/MenuRenderer.hpp"
#include "../../ui/MenuSelection.hpp"
#include <spdlog/spdlog.h>

namespace Wildspirit {

void PausedState::enter(const StateData& data) {
    if (!data.isResumingFromPause) {
        selected_ = 0;
    }
}

void PausedState::handleInput(Input& input) {
    // Menu toggles pause off again
    if (input.isJustPressed(GameAction::Cancel) || input.isJustPressed(GameAction::Menu)) {
        input.consumePress(GameAction::Menu);
        manager_.popState();
        return;
    }

    if (input.isJustPressed(GameAction::Up)) {
        selected_ = MenuSelection::wrapPrevious(selected_, OPTIONS.size());
        playEffect("cursor");
    } else if (input.isJustPressed(GameAction::Down)) {
        selected_ = MenuSelection::wrapNext(selected_, OPTIONS.size());
        playEffect("cursor");
    } else if (input.isJustPressed(GameAction::Confirm)) {
        playEffect("confirm");
        activate(OPTIONS[selected_]);
    }
}

void PausedState::activate(Option option) {
    switch (option) {
        case Option::Resume:
            manager_.popState();
            break;
        case Option::Inventory:
            manager_.pushState(StateId::Inventory);
            break;
        case Option::Save:
            manager_.pushState(StateId::SaveLoad, StateData::withSaveLoad(SaveLoadMode::Save));
            break;
        case Option::Settings:
            manager_.pushState(StateId::Settings);
            break;
        case Option::MainMenu:
            spdlog::info("Returning to main menu");
            manager_.clearStack();
            manager_.changeState(StateId::MainMenu);
            break;
    }
}

void PausedState::render(RenderSurface& surface) {
    MenuRenderer::drawOverlay(surface);
    MenuRenderer::drawTitle(surface, tr("pause.title"), 0.2f);

    static constexpr const char* LABEL_KEYS[] = {
        "pause.resume", "pause.inventory", "pause.save", "pause.settings", "pause.mainMenu"
    };

    std::vector<MenuEntry> entries;
    for (const char* key : LABEL_KEYS) {
        entries.push_back({tr(key)});
    }
    MenuRenderer::drawMenuOptions(surface, entries, selected_, 0.4f);
}

} // namespace Wildspirit
