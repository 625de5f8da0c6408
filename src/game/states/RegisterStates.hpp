#pragma once

namespace Wildspirit {

class GameStateManager;
struct GameServices;

/**
 * Create one instance of every state and register it with the manager.
 * The services must outlive the manager.
 */
void registerAllStates(GameStateManager& manager, GameServices& services);

} // namespace Wildspirit
