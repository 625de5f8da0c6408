#include "DialogueState.hpp"
#include "../GameStateManager.hpp"
#include "../../core/InputActions.hpp"
#include "../../core/RenderSurface.hpp"
#include "../../core/Settings.hpp"
#include "../../script/ScriptEngine.hpp"
#include "../../ui/MenuRenderer.hpp"
#include "../../ui/MenuSelection.hpp"
#include <spdlog/spdlog.h>

namespace Wildspirit {

void DialogueState::enter(const StateData& data) {
    applyTextSpeed();

    if (data.isResumingFromPause) {
        // Back from a shop the script opened; carry on after it
        if (hidden_) {
            hidden_ = false;
            advance();
        }
        return;
    }

    speaker_.clear();
    messages_.clear();
    messageIndex_ = 0;
    choices_.clear();
    selectedChoice_ = 0;
    scripted_ = false;
    hidden_ = false;
    finished_ = false;
    typewriter_.setText("");

    if (data.dialogue) {
        speaker_ = data.dialogue->speaker;
        messages_ = data.dialogue->messages;

        if (data.dialogue->script) {
            if (services_.script && services_.script->start(*data.dialogue->script)) {
                scripted_ = true;
            } else {
                spdlog::warn("Dialogue script for '{}' could not be started", speaker_);
            }
        }
    }

    if (scripted_) {
        advanceScript();
    } else if (!messages_.empty()) {
        showMessage(messages_.front());
    } else {
        finished_ = true;
        manager_.schedule(0.0f, [this]() { manager_.popState(); });
    }
}

void DialogueState::exit() {
    if (scripted_ && services_.script) {
        services_.script->stop();
    }
}

void DialogueState::applyTextSpeed() {
    if (services_.settings) {
        typewriter_.setCharsPerSecond(textSpeedCharsPerSecond(services_.settings->textSpeed.getValue()));
    }
}

void DialogueState::showMessage(std::string text) {
    choices_.clear();
    typewriter_.setText(std::move(text));
}

void DialogueState::update(float deltaTime) {
    if (hidden_ || finished_) return;
    typewriter_.update(deltaTime);
}

void DialogueState::handleInput(Input& input) {
    if (hidden_ || finished_) return;

    if (!typewriter_.isComplete()) {
        if (input.isJustPressed(GameAction::Confirm)) {
            typewriter_.skip();
        }
        return;
    }

    if (!choices_.empty()) {
        if (input.isJustPressed(GameAction::Up)) {
            selectedChoice_ = MenuSelection::wrapPrevious(selectedChoice_, choices_.size());
            playEffect("cursor");
        } else if (input.isJustPressed(GameAction::Down)) {
            selectedChoice_ = MenuSelection::wrapNext(selectedChoice_, choices_.size());
            playEffect("cursor");
        } else if (input.isJustPressed(GameAction::Confirm)) {
            playEffect("confirm");
            if (services_.script) {
                services_.script->submitChoice(static_cast<int32_t>(selectedChoice_));
            }
            choices_.clear();
            advance();
        }
        return;
    }

    if (input.isJustPressed(GameAction::Confirm)) {
        advance();
    }
}

void DialogueState::advance() {
    if (scripted_) {
        advanceScript();
        return;
    }

    ++messageIndex_;
    if (messageIndex_ < messages_.size()) {
        showMessage(messages_[messageIndex_]);
    } else {
        finish();
    }
}

void DialogueState::advanceScript() {
    if (!services_.script) {
        finish();
        return;
    }

    ScriptStep step = services_.script->next();
    switch (step.kind) {
        case ScriptStep::Kind::ShowMessage:
            showMessage(std::move(step.text));
            break;
        case ScriptStep::Kind::ShowChoice:
            showMessage(std::move(step.text));
            choices_ = std::move(step.choices);
            selectedChoice_ = 0;
            break;
        case ScriptStep::Kind::OpenShop:
            hidden_ = true;
            manager_.pushState(StateId::Shop, StateData::withShop(std::move(step.shop)));
            break;
        case ScriptStep::Kind::Finished:
            finish();
            break;
    }
}

void DialogueState::finish() {
    finished_ = true;
    manager_.popState();
}

void DialogueState::render(RenderSurface& surface) {
    if (hidden_) return;

    auto width = static_cast<float>(surface.getWidth());
    auto height = static_cast<float>(surface.getHeight());

    glm::vec2 boxPos(width * 0.05f, height * 0.68f);
    glm::vec2 boxSize(width * 0.9f, height * 0.28f);
    MenuRenderer::drawPanel(surface, boxPos, boxSize);

    if (!speaker_.empty()) {
        surface.drawText(speaker_, boxPos + glm::vec2(16.0f, 12.0f), 20.0f, Colors::Yellow);
    }
    surface.drawText(typewriter_.getVisibleText(), boxPos + glm::vec2(16.0f, 44.0f), 18.0f, Colors::White);

    if (!choices_.empty() && typewriter_.isComplete()) {
        std::vector<MenuEntry> entries;
        for (const auto& choice : choices_) {
            entries.push_back({choice});
        }
        MenuRenderer::drawMenuOptions(surface, entries, selectedChoice_, 0.4f, 0.06f);
    } else if (typewriter_.isComplete()) {
        surface.drawText(">", boxPos + boxSize - glm::vec2(28.0f, 28.0f), 18.0f, Colors::White);
    }
}

} // namespace Wildspirit
