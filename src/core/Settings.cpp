#include "Settings.hpp"
#include <fstream>
#include <iterator>
#include <map>
#include <fmt/format.h>

namespace Wildspirit {

Settings::Settings()
    : version(ofInt("version", 1, 1, 100))
    , masterVolume(ofFloat("masterVolume", 0.8f, 0.0f, 1.0f))
    , bgmVolume(ofFloat("bgmVolume", 0.7f, 0.0f, 1.0f))
    , sfxVolume(ofFloat("sfxVolume", 0.8f, 0.0f, 1.0f))
    , muted(ofBoolean("muted", false))
    , textSpeed(ofEnum("textSpeed", TextSpeed::Medium))
    , language(ofString("language", "en"))
    , showBattleLog(ofBoolean("showBattleLog", true))
    , battleSpeed(ofFloat("battleSpeed", 1.0f, 0.5f, 2.0f))
    , keybinds(defaultKeybinds())
{
}

std::unordered_map<std::string, std::string> Settings::defaultKeybinds() {
    return {
        {"input.up", "key.keyboard.up"},
        {"input.down", "key.keyboard.down"},
        {"input.left", "key.keyboard.left"},
        {"input.right", "key.keyboard.right"},
        {"input.confirm", "key.keyboard.enter"},
        {"input.cancel", "key.keyboard.backspace"},
        {"input.menu", "key.keyboard.escape"},
        {"input.interact", "key.keyboard.e"},
        {"input.inventory", "key.keyboard.i"}
    };
}

template<typename Self, typename Fn>
void Settings::forEachOption(Self& self, Fn&& fn) {
    fn(self.version);
    fn(self.masterVolume);
    fn(self.bgmVolume);
    fn(self.sfxVolume);
    fn(self.muted);
    fn(self.textSpeed);
    fn(self.language);
    fn(self.showBattleLog);
    fn(self.battleSpeed);
}

bool Settings::load(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        spdlog::info("No settings at {}, using defaults", filepath);
        return false;
    }
    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

    simdjson::dom::parser parser;
    simdjson::dom::object root;
    if (auto error = parser.parse(content).get(root)) {
        spdlog::warn("Failed to parse settings {}: {}", filepath, simdjson::error_message(error));
        return false;
    }

    size_t missing = 0;
    forEachOption(*this, [&](auto& option) {
        simdjson::dom::element field;
        if (root[option.getKey()].get(field)) {
            ++missing;
            return;
        }
        option.readJson(field);
    });

    simdjson::dom::object bindings;
    if (!root["keybinds"].get(bindings)) {
        for (auto [action, key] : bindings) {
            std::string_view keyName;
            if (key.get(keyName)) {
                spdlog::warn("Keybind {} is not a key name", std::string(action));
                continue;
            }
            keybinds[std::string(action)] = std::string(keyName);
        }
    }

    spdlog::info("Loaded settings (v{}): volume={}, textSpeed={}, language={}",
                 version, masterVolume, magic_enum::enum_name(textSpeed.getValue()), language);

    // Fill in fields added since the file was written
    if (missing > 0 && !save(filepath)) {
        spdlog::warn("Could not add {} missing settings to {}", missing, filepath);
    }
    return true;
}

bool Settings::save(const std::string& filepath) const {
    fmt::memory_buffer out;
    fmt::format_to(std::back_inserter(out), "{{\n");
    forEachOption(*this, [&out](const auto& option) {
        fmt::format_to(std::back_inserter(out), "  \"{}\": {},\n", option.getKey(), option.toJson());
    });

    // Sorted so the file diffs cleanly between saves
    std::map<std::string, std::string> sorted(keybinds.begin(), keybinds.end());
    fmt::format_to(std::back_inserter(out), "  \"keybinds\": {{\n");
    size_t count = 0;
    for (const auto& [action, key] : sorted) {
        fmt::format_to(std::back_inserter(out), "    \"{}\": \"{}\"{}\n", action, key,
                       ++count < sorted.size() ? "," : "");
    }
    fmt::format_to(std::back_inserter(out), "  }}\n}}\n");

    std::ofstream file(filepath);
    if (!file.is_open()) {
        spdlog::error("Failed to open settings file for writing: {}", filepath);
        return false;
    }
    file.write(out.data(), static_cast<std::streamsize>(out.size()));
    if (!file.good()) {
        spdlog::error("Failed to write settings file: {}", filepath);
        return false;
    }

    spdlog::debug("Saved settings to {}", filepath);
    return true;
}

void Settings::resetToDefaults() {
    forEachOption(*this, [](auto& option) { option.reset(); });
    keybinds = defaultKeybinds();
}

} // namespace Wildspirit
