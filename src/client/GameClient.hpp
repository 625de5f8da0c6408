#pragma once

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include "core/InputActions.hpp"
#include "core/Settings.hpp"
#include "services/JsonSaveManager.hpp"
#include "services/Localization.hpp"
#include "rpg/ItemCatalog.hpp"
#include "battle/BattleSystem.hpp"
#include "script/ScriptEngine.hpp"
#include "game/GameServices.hpp"
#include "game/GameSession.hpp"
#include "game/GameStateManager.hpp"
#include "LogAudioService.hpp"
#include "LogRenderSurface.hpp"
#include "DemoWorld.hpp"

namespace Wildspirit {

struct ClientOptions {
    std::filesystem::path assetsPath = "assets";
    std::string settingsPath = "settings.json";
    std::filesystem::path savesPath = "saves";

    // Hard stop for scripted runs that never send quit
    float maxRunSeconds = 600.0f;
};

/**
 * Wildspirit headless client.
 * Owns every subsystem and drives the state machine at a fixed step from an
 * action script ("confirm", "down", "wait 1.5", "key key.keyboard.f", "quit").
 */
class GameClient {
public:
    static constexpr float FIXED_DELTA = 1.0f / 60.0f;

    explicit GameClient(ClientOptions options = {});
    ~GameClient();

    GameClient(const GameClient&) = delete;
    GameClient& operator=(const GameClient&) = delete;

    /**
     * Load settings, locales, items and tuning, then enter the loading screen.
     */
    void init();

    /**
     * Run commands from input until quit, end of input or the time limit.
     */
    void run(std::istream& commands);

    void shutdown();

    /**
     * Apply one command line. Returns false when the client should stop.
     */
    bool executeCommand(const std::string& line);

    // One fixed step: input, update, render
    void frame();

    GameStateManager& getStateManager() { return manager_; }
    GameSession& getSession() { return session_; }
    Settings& getSettings() { return settings_; }
    const LogRenderSurface& getSurface() const { return surface_; }
    double getElapsedSeconds() const { return elapsed_; }

private:
    void loadAssets();
    void wireServices();
    void tick();

    ClientOptions options_;

    Settings settings_;
    LocaleTable locales_;
    ItemCatalog catalog_;
    GameSession session_;
    LogAudioService audio_;
    JsonSaveManager saves_;
    BattleSystem battle_;
    ScriptEngine script_;
    DemoWorld world_;

    GameServices services_;
    GameStateManager manager_;
    ActionInputState input_;
    LogRenderSurface surface_;

    double elapsed_ = 0.0;
    bool running_ = false;
    std::optional<StateId> previousState_;
};

} // namespace Wildspirit
