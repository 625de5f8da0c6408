#include "SettingsState.hpp"
#include "../GameStateManager.hpp"
#include "../../core/RenderSurface.hpp"
#include "../../ui/MenuRenderer.hpp"
#include "../../ui/MenuSelection.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fmt/format.h>
#include <glm/glm.hpp>
#include <magic_enum/magic_enum.hpp>
#include <spdlog/spdlog.h>

namespace Wildspirit {

namespace {

template<class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};

template<class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

std::string lowercase(std::string_view text) {
    std::string result;
    for (char c : text) {
        result += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return result;
}

// "key.keyboard.left.shift" -> "LEFT SHIFT"
std::string keyDisplayName(const std::string& key) {
    std::string_view name = key;
    constexpr std::string_view PREFIX = "key.keyboard.";
    if (name.starts_with(PREFIX)) {
        name.remove_prefix(PREFIX.size());
    }

    std::string result;
    for (char c : name) {
        result += c == '.' ? ' ' : static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return result;
}

} // namespace

const std::vector<std::string>& SettingsState::availableLanguages() {
    static const std::vector<std::string> LANGUAGES = {"en", "de"};
    return LANGUAGES;
}

void SettingsState::enter(const StateData& data) {
    listening_.reset();
    if (data.isResumingFromPause) return;

    selected_ = 0;
    scrollOffset_ = 0;
    buildOptions();
}

void SettingsState::buildOptions() {
    options_.clear();

    Settings* settings = services_.settings;
    if (!settings) {
        options_.push_back(InfoOption{"settings.unavailable", ""});
        return;
    }

    options_.push_back(SliderOption{"settings.masterVolume", &settings->masterVolume});
    options_.push_back(SliderOption{"settings.bgmVolume", &settings->bgmVolume});
    options_.push_back(SliderOption{"settings.sfxVolume", &settings->sfxVolume});
    options_.push_back(ToggleOption{"settings.muted", &settings->muted});

    SelectOption textSpeed;
    textSpeed.labelKey = "settings.textSpeed";
    for (auto speed : magic_enum::enum_values<TextSpeed>()) {
        textSpeed.values.emplace_back(magic_enum::enum_name(speed));
        textSpeed.valueLabelKeys.push_back("settings.textSpeed." + lowercase(magic_enum::enum_name(speed)));
    }
    textSpeed.current = [settings]() {
        return magic_enum::enum_index(settings->textSpeed.getValue()).value_or(0);
    };
    textSpeed.apply = [settings](const std::string& value) {
        if (auto speed = magic_enum::enum_cast<TextSpeed>(value)) {
            settings->textSpeed = *speed;
        }
    };
    options_.push_back(std::move(textSpeed));

    SelectOption language;
    language.labelKey = "settings.language";
    language.values = availableLanguages();
    for (const auto& code : language.values) {
        language.valueLabelKeys.push_back("language." + code);
    }
    language.current = [settings]() {
        const auto& languages = availableLanguages();
        auto it = std::find(languages.begin(), languages.end(), settings->language.getValue());
        return it == languages.end() ? size_t{0} : static_cast<size_t>(it - languages.begin());
    };
    language.apply = [settings](const std::string& value) { settings->language = value; };
    options_.push_back(std::move(language));

    options_.push_back(ToggleOption{"settings.showBattleLog", &settings->showBattleLog});
    options_.push_back(SliderOption{"settings.battleSpeed", &settings->battleSpeed, 0.5f, 2.0f, 0.25f, false});

    for (auto action : magic_enum::enum_values<GameAction>()) {
        options_.push_back(BindingOption{action});
    }

    options_.push_back(InfoOption{"settings.version", std::to_string(settings->version.getValue())});
}

void SettingsState::handleInput(Input& input) {
    if (listening_) {
        handleRebind(input);
        return;
    }

    if (input.isJustPressed(GameAction::Cancel)) {
        close();
        return;
    }

    if (input.isJustPressed(GameAction::Up)) {
        selected_ = MenuSelection::wrapPrevious(selected_, options_.size());
        scrollOffset_ = MenuSelection::scrollToShow(selected_, scrollOffset_, VISIBLE_ROWS);
        playEffect("cursor");
    } else if (input.isJustPressed(GameAction::Down)) {
        selected_ = MenuSelection::wrapNext(selected_, options_.size());
        scrollOffset_ = MenuSelection::scrollToShow(selected_, scrollOffset_, VISIBLE_ROWS);
        playEffect("cursor");
    } else if (selected_ < options_.size()) {
        if (input.isJustPressed(GameAction::Left)) {
            adjust(options_[selected_], -1);
        } else if (input.isJustPressed(GameAction::Right)) {
            adjust(options_[selected_], 1);
        } else if (input.isJustPressed(GameAction::Confirm)) {
            activate(options_[selected_]);
        }
    }
}

void SettingsState::adjust(SettingsOption& option, int direction) {
    std::visit(Overloaded{
        [&](SliderOption& slider) {
            if (!slider.option) return;
            float stepped = slider.option->getValue() + slider.step * static_cast<float>(direction);
            stepped = std::round(stepped / slider.step) * slider.step;
            slider.option->setValue(glm::clamp(stepped, slider.minValue, slider.maxValue));
            playEffect("cursor");
        },
        [&](ToggleOption& toggle) {
            if (!toggle.option) return;
            toggle.option->setValue(!toggle.option->getValue());
            playEffect("cursor");
        },
        [&](SelectOption& select) {
            if (select.values.empty() || !select.current || !select.apply) return;
            size_t index = direction > 0 ? MenuSelection::wrapNext(select.current(), select.values.size())
                                         : MenuSelection::wrapPrevious(select.current(), select.values.size());
            select.apply(select.values[index]);
            playEffect("cursor");
        },
        [](BindingOption&) {},
        [](InfoOption&) {}
    }, option);
}

void SettingsState::activate(SettingsOption& option) {
    std::visit(Overloaded{
        [](SliderOption&) {},
        [&](ToggleOption&) { adjust(option, 1); },
        [&](SelectOption&) { adjust(option, 1); },
        [&](BindingOption& binding) {
            listening_ = binding.action;
            playEffect("confirm");
            spdlog::debug("Waiting for key to bind {}", magic_enum::enum_name(binding.action));
        },
        [](InfoOption&) {}
    }, option);
}

void SettingsState::handleRebind(Input& input) {
    if (input.isJustPressed(GameAction::Cancel)) {
        listening_.reset();
        return;
    }

    auto key = input.lastKeyName();
    if (!key || !services_.settings) return;

    std::string actionKey = gameActionToSettingsKey(*listening_);
    services_.settings->keybinds[actionKey] = *key;
    spdlog::info("Rebound {} to {}", actionKey, *key);
    listening_.reset();
    playEffect("confirm");
}

void SettingsState::close() {
    if (services_.settings && !services_.settings->save(services_.settingsPath)) {
        spdlog::warn("Failed to save settings to {}", services_.settingsPath);
    }
    manager_.popState();
}

std::string SettingsState::labelFor(const SettingsOption& option) const {
    return std::visit(Overloaded{
        [&](const BindingOption& binding) {
            return tr("action." + lowercase(magic_enum::enum_name(binding.action)));
        },
        [&](const auto& other) { return tr(other.labelKey); }
    }, option);
}

std::string SettingsState::describe(const SettingsOption& option) const {
    return std::visit(Overloaded{
        [](const SliderOption& slider) -> std::string {
            if (!slider.option) return "";
            float value = slider.option->getValue();
            return slider.percent ? fmt::format("{}%", static_cast<int>(std::round(value * 100.0f)))
                                  : fmt::format("x{:.2f}", value);
        },
        [&](const ToggleOption& toggle) -> std::string {
            if (!toggle.option) return "";
            return tr(toggle.option->getValue() ? "common.on" : "common.off");
        },
        [&](const SelectOption& select) -> std::string {
            if (!select.current) return "";
            size_t index = select.current();
            return index < select.valueLabelKeys.size() ? tr(select.valueLabelKeys[index]) : "";
        },
        [&](const BindingOption& binding) -> std::string {
            if (listening_ == binding.action) return tr("settings.pressKey");
            if (!services_.settings) return "";
            auto it = services_.settings->keybinds.find(gameActionToSettingsKey(binding.action));
            return it == services_.settings->keybinds.end() ? "-" : keyDisplayName(it->second);
        },
        [](const InfoOption& info) -> std::string { return info.value; }
    }, option);
}

void SettingsState::render(RenderSurface& surface) {
    MenuRenderer::drawOverlay(surface);
    MenuRenderer::drawTitle(surface, tr("settings.title"), 0.1f);

    std::vector<MenuEntry> entries;
    for (const auto& option : options_) {
        bool enabled = !std::holds_alternative<InfoOption>(option);
        entries.push_back({labelFor(option), enabled, describe(option)});
    }
    MenuRenderer::drawMenuOptions(surface, entries, selected_, 0.2f, 0.075f, scrollOffset_, VISIBLE_ROWS);
    MenuRenderer::drawHint(surface, tr(listening_ ? "settings.rebindHint" : "settings.hint"));
}

} // namespace Wildspirit
