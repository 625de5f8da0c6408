#pragma once

#include "../GameState.hpp"
#include "../../core/InputActions.hpp"
#include "../../core/Settings.hpp"
#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace Wildspirit {

struct SliderOption {
    std::string labelKey;
    SimpleOption<float>* option = nullptr;
    float minValue = 0.0f;
    float maxValue = 1.0f;
    float step = 0.1f;

    // Show as 0-100% instead of a multiplier
    bool percent = true;
};

struct ToggleOption {
    std::string labelKey;
    SimpleOption<bool>* option = nullptr;
};

/**
 * Cycles through a fixed list of values. `labelKeys` is parallel to `values`.
 */
struct SelectOption {
    std::string labelKey;
    std::vector<std::string> values;
    std::vector<std::string> valueLabelKeys;
    std::function<size_t()> current;
    std::function<void(const std::string&)> apply;
};

struct BindingOption {
    GameAction action = GameAction::Confirm;
};

struct InfoOption {
    std::string labelKey;
    std::string value;
};

using SettingsOption = std::variant<SliderOption, ToggleOption, SelectOption, BindingOption, InfoOption>;

/**
 * Settings screen. Changes apply immediately and are written to disk when
 * the screen is closed.
 */
class SettingsState : public GameState {
public:
    static constexpr size_t VISIBLE_ROWS = 9;

    using GameState::GameState;

    void enter(const StateData& data) override;
    void handleInput(Input& input) override;
    void render(RenderSurface& surface) override;

    const std::vector<SettingsOption>& getOptions() const { return options_; }
    size_t getSelectedIndex() const { return selected_; }
    bool isListeningForKey() const { return listening_.has_value(); }

    // Languages offered in the language selector
    static const std::vector<std::string>& availableLanguages();

private:
    void buildOptions();
    void adjust(SettingsOption& option, int direction);
    void activate(SettingsOption& option);
    void handleRebind(Input& input);
    std::string describe(const SettingsOption& option) const;
    std::string labelFor(const SettingsOption& option) const;
    void close();

    std::vector<SettingsOption> options_;
    size_t selected_ = 0;
    size_t scrollOffset_ = 0;
    std::optional<GameAction> listening_;
};

} // namespace Wildspirit
