#include "RegisterStates.hpp"
#include "BattleState.hpp"
#include "DialogueState.hpp"
#include "InventoryState.hpp"
#include "LoadingState.hpp"
#include "LootWindowState.hpp"
#include "MainMenuState.hpp"
#include "PausedState.hpp"
#include "PlayingState.hpp"
#include "SaveLoadState.hpp"
#include "SettingsState.hpp"
#include "ShopState.hpp"
#include "../GameStateManager.hpp"
#include <memory>

namespace Wildspirit {

void registerAllStates(GameStateManager& manager, GameServices& services) {
    manager.registerState(StateId::Loading, std::make_unique<LoadingState>(manager, services));
    manager.registerState(StateId::MainMenu, std::make_unique<MainMenuState>(manager, services));
    manager.registerState(StateId::Playing, std::make_unique<PlayingState>(manager, services));
    manager.registerState(StateId::Paused, std::make_unique<PausedState>(manager, services));
    manager.registerState(StateId::SaveLoad, std::make_unique<SaveLoadState>(manager, services));
    manager.registerState(StateId::Inventory, std::make_unique<InventoryState>(manager, services));
    manager.registerState(StateId::Dialogue, std::make_unique<DialogueState>(manager, services));
    manager.registerState(StateId::Shop, std::make_unique<ShopState>(manager, services));
    manager.registerState(StateId::LootWindow, std::make_unique<LootWindowState>(manager, services));
    manager.registerState(StateId::Settings, std::make_unique<SettingsState>(manager, services));
    manager.registerState(StateId::Battle, std::make_unique<BattleState>(manager, services));
}

} // namespace Wildspirit
