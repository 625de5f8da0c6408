#pragma once

#include <string>

namespace Wildspirit {

class AudioService;
class Localization;
class SaveManager;
class BattleSystem;
class WorldSimulation;
class Settings;
class ItemCatalog;
class ScriptEngine;
struct GameSession;

/**
 * Collaborators shared by every state. Any of them may be null; callers
 * treat a missing service as the feature being absent.
 */
struct GameServices {
    AudioService* audio = nullptr;
    Localization* localization = nullptr;
    SaveManager* saves = nullptr;
    BattleSystem* battle = nullptr;
    WorldSimulation* world = nullptr;
    Settings* settings = nullptr;
    const ItemCatalog* catalog = nullptr;
    GameSession* session = nullptr;
    ScriptEngine* script = nullptr;

    std::string settingsPath = "settings.json";
};

} // namespace Wildspirit
