#include "PlayingState.hpp"
#include "../GameStateManager.hpp"
#include "../GameSession.hpp"
#include "../WorldSimulation.hpp"
#include "../../core/InputActions.hpp"
#include "../../core/RenderSurface.hpp"
#include "../../services/AudioService.hpp"
#include <algorithm>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace Wildspirit {

void PlayingState::enter(const StateData& data) {
    if (services_.session && services_.world) {
        services_.session->mapName = services_.world->getMapName();
    }
    if (!services_.audio) return;

    if (data.isResumingFromPause) {
        services_.audio->resumeBGM();
    } else {
        services_.audio->playBGM("field");
    }
}

bool PlayingState::interactionsBlocked() const {
    return services_.session && services_.session->interactionCooldown > 0.0f;
}

void PlayingState::update(float deltaTime) {
    if (GameSession* session = services_.session) {
        session->playtimeSeconds += deltaTime;
        session->interactionCooldown = std::max(0.0f, session->interactionCooldown - deltaTime);
    }

    if (!services_.world) return;
    services_.world->update(deltaTime);

    if (interactionsBlocked()) return;

    if (auto encounter = services_.world->pollEncounter()) {
        spdlog::info("Encounter with {} spirit(s)", encounter->enemies.size());
        manager_.pushState(StateId::Battle, StateData::withBattle(std::move(*encounter)));
    }
}

void PlayingState::handleInput(Input& input) {
    if (input.isJustPressed(GameAction::Menu)) {
        input.consumePress(GameAction::Menu);
        manager_.pushState(StateId::Paused);
        return;
    }

    if (input.isJustPressed(GameAction::Inventory)) {
        manager_.pushState(StateId::Inventory);
        return;
    }

    if (input.isJustPressed(GameAction::Interact) && services_.world && !interactionsBlocked()) {
        if (auto transition = services_.world->interact()) {
            manager_.pushState(transition->target, std::move(transition->data));
        }
    }
}

void PlayingState::render(RenderSurface& surface) {
    if (services_.world) {
        services_.world->render(surface);
    }

    if (const GameSession* session = services_.session) {
        auto total = static_cast<int64_t>(session->playtimeSeconds);
        std::string hud = fmt::format("{}  {}G  {:02}:{:02}", session->mapName, session->inventory.getGold(),
                                      total / 3600, (total / 60) % 60);
        surface.drawText(hud, glm::vec2(16.0f, 16.0f), 18.0f, Colors::White);
    }
}

} // namespace Wildspirit
