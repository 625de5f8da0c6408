#include "GameClient.hpp"
#include "game/states/RegisterStates.hpp"
#include "game/states/SettingsState.hpp"
#include <cmath>
#include <istream>
#include <sstream>
#include <spdlog/spdlog.h>

namespace Wildspirit {

GameClient::GameClient(ClientOptions options)
    : options_(std::move(options))
    , catalog_(ItemCatalog::withDefaults())
    , session_(&catalog_)
    , audio_(&settings_)
    , saves_(options_.savesPath)
    , world_(&session_.variables) {
}

GameClient::~GameClient() = default;

void GameClient::init() {
    spdlog::info("Initializing Wildspirit...");

    settings_.load(options_.settingsPath);
    loadAssets();
    wireServices();

    registerAllStates(manager_, services_);
    manager_.changeState(StateId::Loading);

    spdlog::info("Wildspirit initialization complete");
}

void GameClient::loadAssets() {
    const auto& assets = options_.assetsPath;

    for (const auto& code : SettingsState::availableLanguages()) {
        locales_.loadFile(code, (assets / "locales" / (code + ".json")).string());
    }
    if (!locales_.setLocale(settings_.language.getValue())) {
        spdlog::warn("Language '{}' not available, using fallback", settings_.language.getValue());
    }
    settings_.language.setChangeCallback([this](const std::string& language) {
        if (locales_.setLocale(language)) {
            spdlog::info("Language changed to {}", language);
        } else {
            spdlog::warn("Language '{}' not available", language);
        }
    });

    // Definitions from disk replace the built-in ones with the same id
    if (auto count = catalog_.loadFromFile((assets / "items.json").string())) {
        spdlog::info("Item catalog has {} entries ({} from file)", catalog_.size(), *count);
    }

    BattleTuning tuning;
    if (tuning.load((assets / "battle.json").string())) {
        battle_.setTuning(tuning);
    }

    world_.loadScript("elder", (assets / "scripts" / "elder.ws").string());
    world_.loadScript("merchant", (assets / "scripts" / "merchant.ws").string());
}

void GameClient::wireServices() {
    script_.setContext({&session_.variables, &session_.inventory, &audio_});
    battle_.setAudio(&audio_);

    services_.audio = &audio_;
    services_.localization = &locales_;
    services_.saves = &saves_;
    services_.battle = &battle_;
    services_.world = &world_;
    services_.settings = &settings_;
    services_.catalog = &catalog_;
    services_.session = &session_;
    services_.script = &script_;
    services_.settingsPath = options_.settingsPath;
}

void GameClient::run(std::istream& commands) {
    running_ = true;
    spdlog::info("Entering main loop...");

    std::string line;
    while (running_ && !manager_.shouldQuit() && std::getline(commands, line)) {
        if (!executeCommand(line)) break;
        if (elapsed_ >= options_.maxRunSeconds) {
            spdlog::warn("Run time limit of {}s reached", options_.maxRunSeconds);
            break;
        }
    }

    running_ = false;
}

bool GameClient::executeCommand(const std::string& line) {
    std::istringstream stream(line);
    std::string command;
    if (!(stream >> command) || command.starts_with('#')) {
        return true;
    }

    if (command == "quit") {
        return false;
    }

    if (command == "wait") {
        float seconds = 0.0f;
        if (!(stream >> seconds) || seconds < 0.0f) {
            spdlog::warn("wait needs a duration in seconds: '{}'", line);
            return true;
        }
        auto frames = static_cast<int>(std::ceil(seconds / FIXED_DELTA));
        for (int i = 0; i < frames && !manager_.shouldQuit(); ++i) {
            frame();
        }
        return !manager_.shouldQuit();
    }

    if (command == "key") {
        std::string keyName;
        if (!(stream >> keyName)) {
            spdlog::warn("key needs a key name: '{}'", line);
            return true;
        }
        input_.setLastKeyName(keyName);
        frame();
        return !manager_.shouldQuit();
    }

    auto action = gameActionFromName(command);
    if (!action) {
        spdlog::warn("Unknown command '{}'", command);
        return true;
    }

    input_.tap(*action);
    frame();
    return !manager_.shouldQuit();
}

void GameClient::frame() {
    manager_.handleInput(input_);
    manager_.update(FIXED_DELTA);
    tick();

    surface_.beginFrame();
    manager_.render(surface_);
    surface_.endFrame();

    input_.endFrame();
    elapsed_ += FIXED_DELTA;
}

void GameClient::tick() {
    // Detect a return to the main menu and put the world back to its initial state
    auto currentState = manager_.getCurrentState();
    if (currentState == StateId::MainMenu && previousState_ && previousState_ != StateId::MainMenu) {
        spdlog::info("Returned to main menu, resetting world");
        world_.reset();
    }
    previousState_ = currentState;
}

void GameClient::shutdown() {
    spdlog::info("Shutting down...");
    if (!settings_.save(options_.settingsPath)) {
        spdlog::warn("Could not save settings on exit");
    }
    battle_.cleanup();
    script_.stop();
}

} // namespace Wildspirit
