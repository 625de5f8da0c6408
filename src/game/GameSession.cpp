#include "GameSession.hpp"
#include <spdlog/spdlog.h>

namespace Wildspirit {

void GameSession::reset() {
    party.clear();
    inventory.clear();
    variables.clear();
    mapName = "meadow";
    playtimeSeconds = 0.0;
    interactionCooldown = 0.0f;
    started = false;
}

void GameSession::startNewGame() {
    reset();

    SpiritTemplate starter;
    starter.id = "sylphie";
    starter.name = "Sylphie";
    starter.level = 5;
    starter.type1 = Element::Wind;
    starter.baseStats = {60, 30, 14, 10, 16, 12, 22};
    party.addSpirit(std::move(starter));

    inventory.addGold(100);
    inventory.addItem("health_potion", 3);

    started = true;
    spdlog::info("New game started");
}

} // namespace Wildspirit
