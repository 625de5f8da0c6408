#pragma once

#include "../GameState.hpp"
#include "../../ui/TypewriterText.hpp"
#include <string>
#include <vector>

namespace Wildspirit {

/**
 * Dialogue box driven either by a fixed list of lines or by an NPC script.
 *
 * A script may open a shop; the shop is pushed over this state and, once
 * popped, the dialogue continues from the statement after the shop. The
 * script is only started on a fresh enter.
 */
class DialogueState : public GameState {
public:
    using GameState::GameState;

    void enter(const StateData& data) override;
    void exit() override;
    void update(float deltaTime) override;
    void handleInput(Input& input) override;
    void render(RenderSurface& surface) override;

    const TypewriterText& getTypewriter() const { return typewriter_; }
    const std::string& getSpeaker() const { return speaker_; }
    bool isShowingChoices() const { return !choices_.empty(); }
    const std::vector<std::string>& getChoices() const { return choices_; }
    size_t getSelectedChoice() const { return selectedChoice_; }
    bool isScripted() const { return scripted_; }

private:
    void showMessage(std::string text);
    void advance();
    void advanceScript();
    void finish();
    void applyTextSpeed();

    TypewriterText typewriter_;
    std::string speaker_;

    std::vector<std::string> messages_;
    size_t messageIndex_ = 0;

    bool scripted_ = false;
    std::vector<std::string> choices_;
    size_t selectedChoice_ = 0;

    // Hidden while a shop opened by the script is on top
    bool hidden_ = false;
    bool finished_ = false;
};

} // namespace Wildspirit
