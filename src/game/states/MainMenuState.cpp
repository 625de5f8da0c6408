#include "MainMenuState.hpp"
#include "../GameStateManager.hpp"
#include "../GameSession.hpp"
#include "../../core/InputActions.hpp"
#include "../../core/RenderSurface.hpp"
#include "../../services/AudioService.hpp"
#include "../../services/SaveManager.hpp"
#include "../../ui/MenuRenderer.hpp"
#include "../../ui/MenuSelection.hpp"
#include <spdlog/spdlog.h>

namespace Wildspirit {

void MainMenuState::enter(const StateData& data) {
    hasSaves_ = services_.saves && services_.saves->hasSaves();

    if (data.isResumingFromPause) {
        // Back from settings or the load screen; saves may have changed
        if (!isEnabled(OPTIONS[selected_])) selected_ = 0;
        return;
    }

    selected_ = hasSaves_ ? 1 : 0;
    if (services_.audio) {
        services_.audio->playBGM("title");
    }
}

bool MainMenuState::isEnabled(Option option) const {
    if (option == Option::Continue) {
        return hasSaves_ && services_.session != nullptr;
    }
    return true;
}

void MainMenuState::move(int direction) {
    size_t index = selected_;
    // Skip disabled entries, stopping at either end
    do {
        size_t next = direction > 0 ? MenuSelection::clampNext(index, OPTIONS.size())
                                    : MenuSelection::clampPrevious(index, OPTIONS.size());
        if (next == index) return;
        index = next;
    } while (!isEnabled(OPTIONS[index]));

    selected_ = index;
    playEffect("cursor");
}

void MainMenuState::handleInput(Input& input) {
    if (input.isJustPressed(GameAction::Up)) {
        move(-1);
    } else if (input.isJustPressed(GameAction::Down)) {
        move(1);
    } else if (input.isJustPressed(GameAction::Confirm)) {
        Option option = OPTIONS[selected_];
        if (!isEnabled(option)) {
            playEffect("error");
            return;
        }
        playEffect("confirm");
        activate(option);
    }
}

void MainMenuState::activate(Option option) {
    switch (option) {
        case Option::NewGame:
            if (services_.session) {
                services_.session->startNewGame();
            }
            manager_.changeState(StateId::Playing);
            break;

        case Option::Continue: {
            auto latest = services_.saves ? services_.saves->getLatestSave() : std::nullopt;
            if (!latest || !services_.session || !services_.saves->loadGame(latest->id, *services_.session)) {
                spdlog::warn("Continue failed, no loadable save");
                playEffect("error");
                return;
            }
            manager_.changeState(StateId::Playing);
            break;
        }

        case Option::LoadGame:
            manager_.pushState(StateId::SaveLoad, StateData::withSaveLoad(SaveLoadMode::Load));
            break;

        case Option::Settings:
            manager_.pushState(StateId::Settings);
            break;

        case Option::Exit:
            spdlog::info("Exit requested from main menu");
            manager_.requestQuit();
            break;
    }
}

void MainMenuState::render(RenderSurface& surface) {
    surface.fillRect(glm::vec2(0.0f), glm::vec2(surface.getWidth(), surface.getHeight()),
                     glm::vec4(0.05f, 0.1f, 0.15f, 1.0f));
    MenuRenderer::drawTitle(surface, tr("game.title"), 0.2f);

    static constexpr const char* LABEL_KEYS[] = {
        "menu.newGame", "menu.continue", "menu.loadGame", "menu.settings", "menu.exit"
    };

    std::vector<MenuEntry> entries;
    for (size_t i = 0; i < OPTIONS.size(); ++i) {
        entries.push_back({tr(LABEL_KEYS[i]), isEnabled(OPTIONS[i])});
    }
    MenuRenderer::drawMenuOptions(surface, entries, selected_);
}

} // namespace Wildspirit
