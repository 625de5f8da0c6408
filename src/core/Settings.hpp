#pragma once

#include <string>
#include <unordered_map>
#include <cstdint>
#include "SimpleOption.hpp"

namespace Wildspirit {

enum class TextSpeed {
    Slow,
    Medium,
    Fast
};

/**
 * Characters revealed per second by the dialogue typewriter.
 */
inline float textSpeedCharsPerSecond(TextSpeed speed) {
    switch (speed) {
        case TextSpeed::Slow: return 20.0f;
        case TextSpeed::Medium: return 40.0f;
        case TextSpeed::Fast: return 80.0f;
    }
    return 40.0f;
}

/**
 * Persistent player settings, saved to and loaded from settings.json.
 */
class Settings {
public:
    Settings();

    SimpleOption<int32_t> version;

    // Audio
    SimpleOption<float> masterVolume;
    SimpleOption<float> bgmVolume;
    SimpleOption<float> sfxVolume;
    SimpleOption<bool> muted;

    // Gameplay
    SimpleOption<TextSpeed> textSpeed;
    SimpleOption<std::string> language;
    SimpleOption<bool> showBattleLog;
    SimpleOption<float> battleSpeed;

    // Abstract action -> key name ("input.confirm" -> "key.keyboard.enter")
    std::unordered_map<std::string, std::string> keybinds;

    static std::unordered_map<std::string, std::string> defaultKeybinds();

    /**
     * Load settings from file. Returns true if the file was parsed.
     * Missing or invalid fields keep their defaults.
     */
    bool load(const std::string& filepath = "settings.json");

    /**
     * Save settings to file. Returns true if successful.
     */
    bool save(const std::string& filepath = "settings.json") const;

    // Restore every option and binding to its default
    void resetToDefaults();

private:
    // Visits every SimpleOption member; Self is Settings or const Settings
    template<typename Self, typename Fn>
    static void forEachOption(Self& self, Fn&& fn);
};

} // namespace Wildspirit
