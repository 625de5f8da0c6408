#include "BattleState.hpp"
#include "../GameStateManager.hpp"
#include "../GameSession.hpp"
#include "../WorldSimulation.hpp"
#include "../../battle/BattleSystem.hpp"
#include "../../core/InputActions.hpp"
#include "../../core/RenderSurface.hpp"
#include "../../core/Settings.hpp"
#include "../../services/AudioService.hpp"
#include "../../ui/MenuRenderer.hpp"
#include "../../ui/MenuSelection.hpp"
#include <algorithm>
#include <fmt/format.h>
#include <magic_enum/magic_enum.hpp>
#include <spdlog/spdlog.h>
#include <tracy/Tracy.hpp>

namespace Wildspirit {

void BattleState::enter(const StateData& data) {
    // Back from the pause menu; the fight was frozen, only the music needs restoring
    if (data.isResumingFromPause) {
        if (services_.audio) services_.audio->resumeBGM();
        return;
    }

    phase_ = BattlePhase::Transition;
    transitionTimer_ = 0.0f;
    resultsTimer_ = 0.0f;
    showingResults_ = false;
    rewardsApplied_ = false;
    result_.reset();
    rewards_ = {};
    levelUps_.clear();
    deferred_.clear();
    feedback_.clear();
    resetSelection();

    BattleSystem* battle = services_.battle;
    if (!battle) {
        spdlog::error("Battle state entered without a battle system");
        manager_.schedule(0.0f, [this]() { manager_.popState(); });
        return;
    }

    BattleRequest request = data.battle.value_or(BattleRequest{});
    battle->setAudio(services_.audio);
    battle->startBattle(request, services_.session ? &services_.session->party : nullptr);
    registerCallbacks();

    if (services_.audio) {
        services_.audio->stopAmbience();
        services_.audio->playBGM(request.bgm.value_or(request.isBoss ? "boss" : "battle"));
    }
}

void BattleState::exit() {
    clearCallbacks();
    if (services_.battle) {
        services_.battle->cleanup();
    }
    selectedSpirit_ = nullptr;
    deferred_.clear();
    feedback_.clear();

    if (services_.audio) {
        services_.audio->resumeBGM();
    }
}

void BattleState::registerCallbacks() {
    BattleSystem* battle = services_.battle;
    battle->onDamage = [this](const BattleSpirit& target, int32_t amount) {
        feedback_.addDamage(spiritPosition(target), amount);
    };
    battle->onHeal = [this](const BattleSpirit& target, int32_t amount) {
        feedback_.addHeal(spiritPosition(target), amount);
    };
    battle->onActionText = [this](const BattleSpirit& user, const std::string& text) {
        feedback_.addActionText(text, spiritPosition(user) - glm::vec2(0.0f, 60.0f));
    };
    battle->onLogEntry = [this](const std::string& message) {
        feedback_.addLogEntry(message);
    };
}

void BattleState::clearCallbacks() {
    if (BattleSystem* battle = services_.battle) {
        battle->onDamage = nullptr;
        battle->onHeal = nullptr;
        battle->onActionText = nullptr;
        battle->onLogEntry = nullptr;
    }
}

void BattleState::update(float deltaTime) {
    ZoneScoped;

    feedback_.update(deltaTime);

    BattleSystem* battle = services_.battle;
    if (!battle) return;

    switch (phase_) {
        case BattlePhase::Transition:
            transitionTimer_ += deltaTime;
            if (transitionTimer_ >= battle->getTuning().transitionDuration) {
                phase_ = BattlePhase::Battle;
            }
            return;
        case BattlePhase::Results:
            resultsTimer_ += deltaTime;
            return;
        default:
            break;
    }

    float speed = services_.settings ? services_.settings->battleSpeed.getValue() : 1.0f;
    battle->update(deltaTime * speed);

    if (battle->getResult()) {
        showResults();
        return;
    }

    pruneDeferred();

    // The spirit being commanded may have been knocked out meanwhile
    if (selectedSpirit_ && !selectedSpirit_->isAlive) {
        resetSelection();
        phase_ = BattlePhase::Battle;
    }

    if (phase_ == BattlePhase::TargetSelect) {
        syncTargetCursor();
    }

    if (phase_ == BattlePhase::Battle) {
        selectNextReadySpirit();
    }
}

void BattleState::selectNextReadySpirit() {
    for (BattleSpirit* spirit : services_.battle->getReadyPlayerSpirits()) {
        if (std::find(deferred_.begin(), deferred_.end(), spirit) != deferred_.end()) continue;

        selectedSpirit_ = spirit;
        commandIndex_ = 0;
        phase_ = BattlePhase::ActionSelect;
        return;
    }
}

void BattleState::pruneDeferred() {
    std::erase_if(deferred_, [](const BattleSpirit* spirit) { return !spirit->isAlive || !spirit->isReady; });
}

void BattleState::resetSelection() {
    selectedSpirit_ = nullptr;
    commandIndex_ = 0;
    abilityIndex_ = 0;
    targetIndex_ = 0;
    targetSpirit_ = nullptr;
    pendingType_ = ActionType::Attack;
    pendingAbility_.reset();
    targetAllies_ = false;
}

void BattleState::handleInput(Input& input) {
    if (phase_ != BattlePhase::Results && input.isJustPressed(GameAction::Menu)) {
        input.consumePress(GameAction::Menu);
        manager_.pushState(StateId::Paused);
        return;
    }

    if (!services_.battle) return;

    switch (phase_) {
        case BattlePhase::Transition:
            break;
        case BattlePhase::Battle:
            if (input.isJustPressed(GameAction::Confirm) && !deferred_.empty()) {
                deferred_.clear();
                selectNextReadySpirit();
            }
            break;
        case BattlePhase::ActionSelect:
            handleActionSelect(input);
            break;
        case BattlePhase::AbilitySelect:
            handleAbilitySelect(input);
            break;
        case BattlePhase::TargetSelect:
            handleTargetSelect(input);
            break;
        case BattlePhase::Results:
            if (input.isJustPressed(GameAction::Confirm)
                && resultsTimer_ > services_.battle->getTuning().resultsMinDisplay) {
                exitBattle();
            }
            break;
    }
}

void BattleState::handleActionSelect(Input& input) {
    if (input.isJustPressed(GameAction::Up)) {
        commandIndex_ = MenuSelection::wrapPrevious(commandIndex_, COMMANDS.size());
        playEffect("cursor");
    } else if (input.isJustPressed(GameAction::Down)) {
        commandIndex_ = MenuSelection::wrapNext(commandIndex_, COMMANDS.size());
        playEffect("cursor");
    } else if (input.isJustPressed(GameAction::Confirm)) {
        chooseCommand(COMMANDS[commandIndex_]);
    } else if (input.isJustPressed(GameAction::Cancel)) {
        if (selectedSpirit_) {
            deferred_.push_back(selectedSpirit_);
        }
        resetSelection();
        phase_ = BattlePhase::Battle;
    }
}

void BattleState::chooseCommand(BattleCommand command) {
    BattleSystem* battle = services_.battle;
    if (!selectedSpirit_) return;

    switch (command) {
        case BattleCommand::Attack:
            pendingType_ = ActionType::Attack;
            pendingAbility_.reset();
            beginTargeting(false, 0);
            break;
        case BattleCommand::Ability:
            if (selectedSpirit_->abilities.empty()) {
                playEffect("error");
                return;
            }
            abilityIndex_ = 0;
            phase_ = BattlePhase::AbilitySelect;
            playEffect("confirm");
            break;
        case BattleCommand::Seal:
            if (!battle->canSeal()) {
                playEffect("error");
                feedback_.addLogEntry(tr("battle.cannotSeal"));
                return;
            }
            pendingType_ = ActionType::Seal;
            pendingAbility_.reset();
            beginTargeting(false, 0);
            break;
        case BattleCommand::Flee:
            if (!battle->canFlee()) {
                playEffect("error");
                feedback_.addLogEntry(tr("battle.cannotFlee"));
                return;
            }
            pendingType_ = ActionType::Flee;
            pendingAbility_.reset();
            beginTargeting(false, 0);
            break;
    }
}

void BattleState::handleAbilitySelect(Input& input) {
    size_t count = selectedSpirit_ ? selectedSpirit_->abilities.size() : 0;

    if (input.isJustPressed(GameAction::Up)) {
        abilityIndex_ = MenuSelection::wrapPrevious(abilityIndex_, count);
        playEffect("cursor");
    } else if (input.isJustPressed(GameAction::Down)) {
        abilityIndex_ = MenuSelection::wrapNext(abilityIndex_, count);
        playEffect("cursor");
    } else if (input.isJustPressed(GameAction::Confirm)) {
        chooseAbility();
    } else if (input.isJustPressed(GameAction::Cancel)) {
        phase_ = BattlePhase::ActionSelect;
    }
}

void BattleState::chooseAbility() {
    if (!selectedSpirit_ || abilityIndex_ >= selectedSpirit_->abilities.size()) return;

    const Ability& ability = selectedSpirit_->abilities[abilityIndex_];
    if (ability.mpCost > selectedSpirit_->currentMp) {
        playEffect("error");
        feedback_.addLogEntry(tr("battle.notEnoughMp"));
        return;
    }

    pendingType_ = ActionType::Ability;
    pendingAbility_ = ability;

    size_t initial = 0;
    if (ability.targetsAllies()) {
        auto allies = services_.battle->getAlivePlayerSpirits();
        auto self = std::find(allies.begin(), allies.end(), selectedSpirit_);
        if (self != allies.end()) {
            initial = static_cast<size_t>(self - allies.begin());
        }
    }
    beginTargeting(ability.targetsAllies(), initial);
}

void BattleState::beginTargeting(bool allies, size_t initialIndex) {
    targetAllies_ = allies;
    auto targets = currentTargets();
    targetIndex_ = MenuSelection::clampIndex(initialIndex, targets.size());
    targetSpirit_ = targets.empty() ? nullptr : targets[targetIndex_];
    phase_ = BattlePhase::TargetSelect;
    playEffect("confirm");
}

void BattleState::syncTargetCursor() {
    auto targets = currentTargets();
    if (targets.empty()) {
        targetIndex_ = 0;
        targetSpirit_ = nullptr;
        return;
    }

    // Follow the highlighted spirit when the list shifts around it
    auto it = std::find(targets.begin(), targets.end(), targetSpirit_);
    if (it != targets.end()) {
        targetIndex_ = static_cast<size_t>(it - targets.begin());
        return;
    }

    // It was knocked out; land on the nearest survivor
    targetIndex_ = MenuSelection::clampIndex(targetIndex_, targets.size());
    targetSpirit_ = targets[targetIndex_];
    playEffect("cursor");
}

std::vector<BattleSpirit*> BattleState::currentTargets() const {
    if (!services_.battle) return {};
    return targetAllies_ ? services_.battle->getAlivePlayerSpirits() : services_.battle->getAliveEnemies();
}

void BattleState::handleTargetSelect(Input& input) {
    auto targets = currentTargets();

    if (input.isJustPressed(GameAction::Up) || input.isJustPressed(GameAction::Left)) {
        targetIndex_ = MenuSelection::wrapPrevious(targetIndex_, targets.size());
        targetSpirit_ = targets.empty() ? nullptr : targets[targetIndex_];
        playEffect("cursor");
    } else if (input.isJustPressed(GameAction::Down) || input.isJustPressed(GameAction::Right)) {
        targetIndex_ = MenuSelection::wrapNext(targetIndex_, targets.size());
        targetSpirit_ = targets.empty() ? nullptr : targets[targetIndex_];
        playEffect("cursor");
    } else if (input.isJustPressed(GameAction::Confirm)) {
        if (targetIndex_ >= targets.size()) {
            playEffect("error");
            return;
        }
        executeSelectedAction(targets[targetIndex_]);
    } else if (input.isJustPressed(GameAction::Cancel)) {
        phase_ = pendingType_ == ActionType::Ability ? BattlePhase::AbilitySelect : BattlePhase::ActionSelect;
    }
}

void BattleState::executeSelectedAction(BattleSpirit* target) {
    PendingAction action;
    action.type = pendingType_;
    action.user = selectedSpirit_;
    action.ability = pendingAbility_;
    action.target = target;

    if (services_.battle->queuePlayerAction(action)) {
        playEffect("confirm");
    } else {
        playEffect("error");
    }

    resetSelection();
    phase_ = BattlePhase::Battle;
}

void BattleState::showResults() {
    if (showingResults_) return;

    showingResults_ = true;
    phase_ = BattlePhase::Results;
    resultsTimer_ = 0.0f;
    resetSelection();
    result_ = services_.battle->getResult();
    rewards_ = services_.battle->getRewards();

    spdlog::info("Showing battle results: {}", magic_enum::enum_name(*result_));
    switch (*result_) {
        case BattleResult::Victory:
            if (services_.audio) services_.audio->playBGM("victory");
            break;
        case BattleResult::Defeat:
            playEffect("defeat");
            break;
        case BattleResult::Fled:
            playEffect("flee");
            break;
    }
}

void BattleState::applyRewards() {
    if (rewardsApplied_) return;
    rewardsApplied_ = true;

    GameSession* session = services_.session;
    if (!session || result_ != BattleResult::Victory) return;

    levelUps_ = session->party.awardExp(rewards_.exp);
    session->inventory.addGold(rewards_.gold);
    for (const auto& drop : rewards_.items) {
        if (!session->inventory.addItem(drop.itemId, drop.quantity)) {
            spdlog::warn("No room for reward item {}", drop.itemId);
        }
    }
    for (const auto& levelUp : levelUps_) {
        spdlog::info("{} reached level {}", levelUp.name, levelUp.newLevel);
    }
    spdlog::info("Rewards applied: {} exp, {} gold, {} items", rewards_.exp, rewards_.gold, rewards_.items.size());
}

void BattleState::exitBattle() {
    GameSession* session = services_.session;

    if (result_ == BattleResult::Victory) {
        applyRewards();
        const auto& triggerId = services_.battle->getTriggerId();
        if (triggerId) {
            if (session) session->variables.set("defeated." + *triggerId, true);
            if (services_.world) services_.world->removeObject(*triggerId);
        }
    } else if (result_ == BattleResult::Defeat && session) {
        session->party.healAll();
    }

    if (session) {
        session->interactionCooldown = services_.battle->getTuning().interactionCooldown;
    }
    manager_.popState();
}

glm::vec2 BattleState::spiritPosition(const BattleSpirit& spirit) const {
    const BattleSystem* battle = services_.battle;
    if (!battle) return surfaceSize_ * 0.5f;

    const auto& side = spirit.isPlayerOwned ? battle->getPlayerParty() : battle->getEnemyParty();
    size_t index = 0;
    for (size_t i = 0; i < side.size(); ++i) {
        if (&side[i] == &spirit) {
            index = i;
            break;
        }
    }

    float column = (static_cast<float>(index) + 1.0f) / (static_cast<float>(side.size()) + 1.0f);
    float row = spirit.isPlayerOwned ? 0.62f : 0.25f;
    return glm::vec2(surfaceSize_.x * column, surfaceSize_.y * row);
}

void BattleState::drawSpirit(RenderSurface& surface, const BattleSpirit& spirit) const {
    glm::vec2 pos = spiritPosition(spirit);
    glm::vec4 nameColor = !spirit.isAlive ? Colors::Gray
                        : spirit.isCasting ? Colors::Blue
                        : (&spirit == selectedSpirit_ ? Colors::Yellow : Colors::White);

    surface.drawText(fmt::format("{} Lv{}", spirit.name, spirit.level), pos, 18.0f, nameColor, TextAlign::Center);

    glm::vec2 barSize(120.0f, 8.0f);
    glm::vec2 barPos = pos + glm::vec2(-barSize.x * 0.5f, 24.0f);
    surface.drawBar(barPos, barSize, spirit.hpFraction(), Colors::Green, Colors::Black);
    surface.drawText(fmt::format("{}/{}", spirit.currentHp, spirit.maxHp), barPos + glm::vec2(barSize.x + 6.0f, -4.0f),
                     12.0f, Colors::White);

    if (spirit.isPlayerOwned) {
        float mp = spirit.maxMp > 0 ? static_cast<float>(spirit.currentMp) / static_cast<float>(spirit.maxMp) : 0.0f;
        surface.drawBar(barPos + glm::vec2(0.0f, 12.0f), barSize, mp, Colors::Blue, Colors::Black);
    }

    float atbMax = services_.battle ? services_.battle->getTuning().atbMax : 100.0f;
    float gauge = spirit.isCasting && spirit.castDuration > 0.0f ? spirit.castTimer / spirit.castDuration
                                                                : spirit.atb / atbMax;
    surface.drawBar(barPos + glm::vec2(0.0f, 24.0f), barSize, gauge,
                    spirit.isReady ? Colors::Yellow : Colors::White, Colors::Black);
}

void BattleState::drawCommandMenu(RenderSurface& surface) const {
    if (!selectedSpirit_) return;

    glm::vec2 panelPos(surfaceSize_.x * 0.05f, surfaceSize_.y * 0.75f);
    glm::vec2 panelSize(surfaceSize_.x * 0.35f, surfaceSize_.y * 0.22f);
    MenuRenderer::drawPanel(surface, panelPos, panelSize);
    surface.drawText(selectedSpirit_->name, panelPos + glm::vec2(12.0f, 8.0f), 16.0f, Colors::Yellow);

    std::vector<std::string> rows;
    size_t selected = 0;
    switch (phase_) {
        case BattlePhase::ActionSelect: {
            static constexpr const char* COMMAND_KEYS[] = {
                "battle.attack", "battle.ability", "battle.seal", "battle.flee"
            };
            for (const char* key : COMMAND_KEYS) rows.push_back(tr(key));
            selected = commandIndex_;
            break;
        }
        case BattlePhase::AbilitySelect:
            for (const auto& ability : selectedSpirit_->abilities) {
                rows.push_back(ability.mpCost > 0 ? fmt::format("{}  {} MP", ability.name, ability.mpCost)
                                                  : ability.name);
            }
            selected = abilityIndex_;
            break;
        case BattlePhase::TargetSelect:
            for (const BattleSpirit* target : currentTargets()) rows.push_back(target->name);
            selected = targetIndex_;
            break;
        default:
            return;
    }

    for (size_t i = 0; i < rows.size(); ++i) {
        glm::vec2 at = panelPos + glm::vec2(24.0f, 32.0f + static_cast<float>(i) * 22.0f);
        bool isSelected = i == selected;
        bool disabled = phase_ == BattlePhase::AbilitySelect
                        && selectedSpirit_->abilities[i].mpCost > selectedSpirit_->currentMp;
        surface.drawText((isSelected ? "> " : "  ") + rows[i], at, 16.0f,
                         disabled ? Colors::Gray : (isSelected ? Colors::Yellow : Colors::White));
    }

    if (phase_ == BattlePhase::TargetSelect) {
        auto targets = currentTargets();
        if (targetIndex_ < targets.size()) {
            glm::vec2 marker = spiritPosition(*targets[targetIndex_]) - glm::vec2(0.0f, 28.0f);
            surface.drawText("v", marker, 18.0f, Colors::Yellow, TextAlign::Center);
        }
    }
}

void BattleState::drawResults(RenderSurface& surface) const {
    if (!result_) return;

    MenuRenderer::drawOverlay(surface);
    static constexpr const char* TITLE_KEYS[] = {"battle.victory", "battle.defeat", "battle.fled"};
    MenuRenderer::drawTitle(surface, tr(TITLE_KEYS[magic_enum::enum_index(*result_).value_or(0)]), 0.3f);

    if (*result_ == BattleResult::Victory) {
        MenuRenderer::drawHint(surface, tr("battle.rewards", {{"exp", std::to_string(rewards_.exp)},
                                                             {"gold", std::to_string(rewards_.gold)}}), 0.45f);
        float y = 0.52f;
        for (const auto& levelUp : levelUps_) {
            MenuRenderer::drawHint(surface, tr("battle.levelUp", {{"name", levelUp.name},
                                                                 {"level", std::to_string(levelUp.newLevel)}}), y);
            y += 0.05f;
        }
    }

    if (services_.battle && resultsTimer_ > services_.battle->getTuning().resultsMinDisplay) {
        MenuRenderer::drawHint(surface, tr("battle.continue"));
    }
}

void BattleState::render(RenderSurface& surface) {
    surfaceSize_ = glm::vec2(static_cast<float>(surface.getWidth()), static_cast<float>(surface.getHeight()));
    surface.fillRect(glm::vec2(0.0f), surfaceSize_, glm::vec4(0.08f, 0.1f, 0.16f, 1.0f));

    if (const BattleSystem* battle = services_.battle) {
        for (const auto& enemy : battle->getEnemyParty()) drawSpirit(surface, enemy);
        for (const auto& spirit : battle->getPlayerParty()) drawSpirit(surface, spirit);
    }

    for (const auto& number : feedback_.getDamageNumbers()) {
        surface.drawText(number.isHeal ? fmt::format("+{}", number.amount) : std::to_string(number.amount),
                         number.position, 22.0f, number.isHeal ? Colors::Green : Colors::Red, TextAlign::Center);
    }
    for (const auto& text : feedback_.getActionTexts()) {
        surface.drawText(text.text, text.position, 18.0f, Colors::White, TextAlign::Center);
    }

    if (!services_.settings || services_.settings->showBattleLog.getValue()) {
        float y = surfaceSize_.y * 0.75f;
        for (const auto& entry : feedback_.getLog()) {
            surface.drawText(entry, glm::vec2(surfaceSize_.x * 0.45f, y), 14.0f, Colors::Gray);
            y += 18.0f;
        }
    }

    switch (phase_) {
        case BattlePhase::Transition: {
            float duration = services_.battle ? services_.battle->getTuning().transitionDuration : 1.0f;
            float alpha = duration > 0.0f ? 1.0f - std::min(1.0f, transitionTimer_ / duration) : 0.0f;
            surface.fillRect(glm::vec2(0.0f), surfaceSize_, glm::vec4(0.0f, 0.0f, 0.0f, alpha));
            break;
        }
        case BattlePhase::ActionSelect:
        case BattlePhase::AbilitySelect:
        case BattlePhase::TargetSelect:
            drawCommandMenu(surface);
            break;
        case BattlePhase::Results:
            drawResults(surface);
            break;
        case BattlePhase::Battle:
            if (!deferred_.empty()) {
                MenuRenderer::drawHint(surface, tr("battle.deferredHint"));
            }
            break;
    }
}

} // namespace Wildspirit
