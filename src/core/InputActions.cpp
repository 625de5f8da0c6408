#include "InputActions.hpp"
#include <cctype>

namespace Wildspirit {

std::string gameActionToSettingsKey(GameAction action) {
    auto enumName = magic_enum::enum_name(action);
    std::string result = "input.";
    for (char c : enumName) {
        result += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return result;
}

std::optional<GameAction> gameActionFromName(std::string_view name) {
    return magic_enum::enum_cast<GameAction>(name, magic_enum::case_insensitive);
}

bool ActionInputState::isJustPressed(GameAction action) const {
    size_t i = indexOf(action);
    return current_[i] && !previous_[i] && !consumed_[i];
}

bool ActionInputState::isPressed(GameAction action) const {
    return current_[indexOf(action)];
}

void ActionInputState::consumePress(GameAction action) {
    consumed_[indexOf(action)] = true;
}

void ActionInputState::setPressed(GameAction action, bool pressed) {
    current_[indexOf(action)] = pressed;
}

void ActionInputState::tap(GameAction action) {
    size_t i = indexOf(action);
    current_[i] = true;
    previous_[i] = false;
    pulse_[i] = true;
}

void ActionInputState::endFrame() {
    previous_ = current_;
    consumed_.fill(false);
    for (size_t i = 0; i < ACTION_COUNT; ++i) {
        if (pulse_[i]) {
            current_[i] = false;
            previous_[i] = false;
            pulse_[i] = false;
        }
    }
    lastKey_.reset();
}

void ActionInputState::releaseAll() {
    current_.fill(false);
    previous_.fill(false);
    consumed_.fill(false);
    pulse_.fill(false);
    lastKey_.reset();
}

} // namespace Wildspirit
