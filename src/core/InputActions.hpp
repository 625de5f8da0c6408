#pragma once

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <magic_enum/magic_enum.hpp>

namespace Wildspirit {

/**
 * Abstract input actions. States never see raw keys, only these.
 */
enum class GameAction {
    Up,
    Down,
    Left,
    Right,
    Confirm,
    Cancel,
    Menu,
    Interact,
    Inventory
};

/**
 * Convert GameAction to its settings file key (GameAction::Confirm -> "input.confirm").
 */
std::string gameActionToSettingsKey(GameAction action);

/**
 * Parse a lowercase action name ("confirm", "menu") as used by scripts and the host.
 */
std::optional<GameAction> gameActionFromName(std::string_view name);

/**
 * Input queries consumed by game states.
 * isJustPressed is edge-triggered, isPressed is level-triggered.
 */
class Input {
public:
    virtual ~Input() = default;

    virtual bool isJustPressed(GameAction action) const = 0;
    virtual bool isPressed(GameAction action) const = 0;

    // Swallow this frame's press so later readers in the same frame don't see it
    virtual void consumePress(GameAction action) = 0;

    // Raw key name of the last key pressed this frame, used for rebinding
    virtual std::optional<std::string> lastKeyName() const { return std::nullopt; }
};

/**
 * Frame-based action state fed by the host (or tests).
 * Call endFrame() once per frame after the state machine has read input.
 */
class ActionInputState : public Input {
public:
    bool isJustPressed(GameAction action) const override;
    bool isPressed(GameAction action) const override;
    void consumePress(GameAction action) override;
    std::optional<std::string> lastKeyName() const override { return lastKey_; }

    void setPressed(GameAction action, bool pressed);

    // One-frame pulse: pressed now, released again by the next endFrame()
    void tap(GameAction action);

    void setLastKeyName(std::string keyName) { lastKey_ = std::move(keyName); }

    void endFrame();
    void releaseAll();

private:
    static constexpr size_t ACTION_COUNT = magic_enum::enum_count<GameAction>();

    static size_t indexOf(GameAction action) {
        return magic_enum::enum_index(action).value_or(0);
    }

    std::array<bool, ACTION_COUNT> current_{};
    std::array<bool, ACTION_COUNT> previous_{};
    std::array<bool, ACTION_COUNT> consumed_{};
    std::array<bool, ACTION_COUNT> pulse_{};
    std::optional<std::string> lastKey_;
};

} // namespace Wildspirit
