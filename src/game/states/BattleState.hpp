#pragma once

#include "../GameState.hpp"
#include "../../battle/BattleFeedback.hpp"
#include "../../battle/BattleTypes.hpp"
#include "../../rpg/Party.hpp"
#include <array>
#include <optional>
#include <vector>
#include <glm/glm.hpp>

namespace Wildspirit {

enum class BattlePhase {
    Transition,
    Battle,
    ActionSelect,
    AbilitySelect,
    TargetSelect,
    Results
};

enum class BattleCommand {
    Attack,
    Ability,
    Seal,
    Flee
};

/**
 * Battle screen. Collects a legal action for each ready player spirit and
 * hands it to the BattleSystem, which owns all combat math. Rewards are
 * settled once when the results screen is dismissed.
 *
 * The BattleSystem only advances while this state is on top, so pushing
 * the pause menu freezes the fight.
 */
class BattleState : public GameState {
public:
    static constexpr std::array<BattleCommand, 4> COMMANDS = {
        BattleCommand::Attack, BattleCommand::Ability, BattleCommand::Seal, BattleCommand::Flee
    };

    using GameState::GameState;

    void enter(const StateData& data) override;
    void exit() override;
    void update(float deltaTime) override;
    void handleInput(Input& input) override;
    void render(RenderSurface& surface) override;

    BattlePhase getPhase() const { return phase_; }
    const BattleSpirit* getSelectedSpirit() const { return selectedSpirit_; }
    size_t getCommandIndex() const { return commandIndex_; }
    size_t getAbilityIndex() const { return abilityIndex_; }
    size_t getTargetIndex() const { return targetIndex_; }
    const BattleSpirit* getTargetedSpirit() const { return targetSpirit_; }
    size_t getDeferredCount() const { return deferred_.size(); }
    bool isShowingResults() const { return showingResults_; }
    bool areRewardsApplied() const { return rewardsApplied_; }
    float getResultsTimer() const { return resultsTimer_; }
    std::optional<BattleResult> getResult() const { return result_; }
    const std::vector<LevelUp>& getLevelUps() const { return levelUps_; }
    const BattleFeedback& getFeedback() const { return feedback_; }

private:
    void registerCallbacks();
    void clearCallbacks();

    void selectNextReadySpirit();
    void pruneDeferred();
    void resetSelection();

    void handleActionSelect(Input& input);
    void handleAbilitySelect(Input& input);
    void handleTargetSelect(Input& input);

    void chooseCommand(BattleCommand command);
    void chooseAbility();
    void beginTargeting(bool allies, size_t initialIndex);
    void syncTargetCursor();
    std::vector<BattleSpirit*> currentTargets() const;
    void executeSelectedAction(BattleSpirit* target);

    void showResults();
    void applyRewards();
    void exitBattle();

    glm::vec2 spiritPosition(const BattleSpirit& spirit) const;
    void drawSpirit(RenderSurface& surface, const BattleSpirit& spirit) const;
    void drawCommandMenu(RenderSurface& surface) const;
    void drawResults(RenderSurface& surface) const;

    BattlePhase phase_ = BattlePhase::Transition;
    float transitionTimer_ = 0.0f;
    float resultsTimer_ = 0.0f;
    bool showingResults_ = false;
    bool rewardsApplied_ = false;
    std::optional<BattleResult> result_;
    BattleRewards rewards_;
    std::vector<LevelUp> levelUps_;

    BattleSpirit* selectedSpirit_ = nullptr;
    size_t commandIndex_ = 0;
    size_t abilityIndex_ = 0;
    size_t targetIndex_ = 0;
    BattleSpirit* targetSpirit_ = nullptr;
    ActionType pendingType_ = ActionType::Attack;
    std::optional<Ability> pendingAbility_;
    bool targetAllies_ = false;

    // Ready spirits the player backed out of; skipped until confirm is pressed
    std::vector<const BattleSpirit*> deferred_;

    BattleFeedback feedback_;
    glm::vec2 surfaceSize_{1280.0f, 720.0f};
};

} // namespace Wildspirit
