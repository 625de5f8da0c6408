#include <gtest/gtest.h>

#include "Mocks.hpp"
#include "battle/BattleSystem.hpp"
#include "game/states/BattleState.hpp"
#include "rpg/ItemCatalog.hpp"

using ::testing::_;
using ::testing::AnyNumber;
using ::testing::NiceMock;

namespace Wildspirit::Testing {
namespace {

SpiritTemplate partySpirit(int32_t hp, int32_t mp, int32_t attack) {
    SpiritTemplate data;
    data.id = "hero";
    data.name = "Hero";
    data.level = 1;
    data.type1 = Element::Wind;
    data.baseStats = {hp, mp, attack, 10, 10, 10, 10};
    data.initialAtb = 100.0f;
    return data;
}

SpiritTemplate enemySpirit(int32_t hp, int32_t attack = 1) {
    SpiritTemplate data;
    data.id = "pebblit";
    data.name = "Pebblit";
    data.level = 1;
    data.type1 = Element::Earth;
    data.baseStats = {hp, 10, attack, 10, 10, 10, 10};
    data.expYield = 40;
    data.goldYield = 15;
    data.initialAtb = 0.0f;
    return data;
}

class BattleStateTest : public ::testing::Test {
protected:
    BattleStateTest()
        : catalog(ItemCatalog::withDefaults())
        , session(&catalog)
        , battle(BattleTuning{}, 42u) {
        services.audio = &audio;
        services.battle = &battle;
        services.session = &session;
        services.world = &world;

        // Tests narrow these with their own expectations
        EXPECT_CALL(audio, playEffect(_)).Times(AnyNumber());
        EXPECT_CALL(audio, playBGM(_)).Times(AnyNumber());

        manager.registerState(StateId::Playing,
                              std::make_unique<RecordingState>(manager, services, "Playing", journal));
        manager.registerState(StateId::Paused,
                              std::make_unique<RecordingState>(manager, services, "Paused", journal));
        auto battleState = std::make_unique<BattleState>(manager, services);
        state = battleState.get();
        manager.registerState(StateId::Battle, std::move(battleState));
    }

    void startBattle(BattleRequest request) {
        manager.changeState(StateId::Playing);
        manager.pushState(StateId::Battle, StateData::withBattle(std::move(request)));
        // Finish the intro, then let the first gauge fill
        manager.update(battle.getTuning().transitionDuration);
        manager.update(0.01f);
    }

    BattleRequest singleEnemy(int32_t hp, int32_t attack = 1) {
        BattleRequest request;
        request.enemies = {enemySpirit(hp, attack)};
        return request;
    }

    void runUntilResults(int maxTicks = 100) {
        for (int i = 0; i < maxTicks && state->getPhase() != BattlePhase::Results; ++i) {
            manager.update(0.1f);
        }
    }

    std::vector<std::string> journal;
    ItemCatalog catalog;
    GameSession session;
    BattleSystem battle;
    NiceMock<MockAudioService> audio;
    NiceMock<MockWorldSimulation> world;
    GameServices services;
    GameStateManager manager;
    ActionInputState input;
    BattleState* state = nullptr;
};

TEST_F(BattleStateTest, VictoryFlowAppliesRewardsOnce) {
    session.party.addSpirit(partySpirit(10, 5, 40));
    session.inventory.addGold(100);
    startBattle(singleEnemy(1));

    ASSERT_EQ(state->getPhase(), BattlePhase::ActionSelect);
    ASSERT_NE(state->getSelectedSpirit(), nullptr);
    EXPECT_EQ(state->getSelectedSpirit()->name, "Hero");

    press(manager, input, GameAction::Confirm);
    ASSERT_EQ(state->getPhase(), BattlePhase::TargetSelect);

    press(manager, input, GameAction::Confirm);
    EXPECT_EQ(state->getPhase(), BattlePhase::Battle);
    EXPECT_EQ(battle.getQueuedActionCount(), 1u);

    runUntilResults();
    ASSERT_EQ(state->getPhase(), BattlePhase::Results);
    EXPECT_TRUE(state->isShowingResults());
    EXPECT_EQ(state->getResult(), BattleResult::Victory);
    EXPECT_FALSE(state->areRewardsApplied());

    // Too early to dismiss
    press(manager, input, GameAction::Confirm);
    EXPECT_TRUE(manager.isInState(StateId::Battle));

    manager.update(1.1f);
    press(manager, input, GameAction::Confirm);

    EXPECT_TRUE(manager.isInState(StateId::Playing));
    EXPECT_TRUE(state->areRewardsApplied());
    EXPECT_EQ(session.inventory.getGold(), 115);
    EXPECT_EQ(session.party.getMembers()[0].exp, 40);

    press(manager, input, GameAction::Confirm);
    manager.update(0.1f);
    EXPECT_EQ(session.inventory.getGold(), 115);
    EXPECT_EQ(session.party.getMembers()[0].exp, 40);
}

TEST_F(BattleStateTest, UnaffordableAbilityIsRejected) {
    SpiritTemplate hero = partySpirit(50, 2, 10);
    Ability blast;
    blast.id = "blast";
    blast.name = "Blast";
    blast.type = AbilityType::Magical;
    blast.mpCost = 5;
    hero.abilities = {blast};
    session.party.addSpirit(hero);
    startBattle(singleEnemy(50));

    ASSERT_EQ(state->getPhase(), BattlePhase::ActionSelect);
    press(manager, input, GameAction::Down);
    ASSERT_EQ(state->getCommandIndex(), 1u);
    press(manager, input, GameAction::Confirm);
    ASSERT_EQ(state->getPhase(), BattlePhase::AbilitySelect);

    EXPECT_CALL(audio, playEffect("error")).Times(1);
    press(manager, input, GameAction::Confirm);

    EXPECT_EQ(state->getPhase(), BattlePhase::AbilitySelect);
    EXPECT_EQ(battle.getQueuedActionCount(), 0u);
    EXPECT_FALSE(battle.hasCurrentAction());
}

TEST_F(BattleStateTest, CommandMenuWraps) {
    session.party.addSpirit(partySpirit(50, 20, 10));
    startBattle(singleEnemy(50));

    press(manager, input, GameAction::Up);
    EXPECT_EQ(state->getCommandIndex(), BattleState::COMMANDS.size() - 1);
    press(manager, input, GameAction::Down);
    EXPECT_EQ(state->getCommandIndex(), 0u);
}

TEST_F(BattleStateTest, BossBattleRefusesFleeAndSeal) {
    session.party.addSpirit(partySpirit(50, 20, 10));
    BattleRequest request = singleEnemy(50);
    request.isBoss = true;

    EXPECT_CALL(audio, playBGM("boss"));
    startBattle(request);

    // Seal
    press(manager, input, GameAction::Down);
    press(manager, input, GameAction::Down);
    EXPECT_CALL(audio, playEffect("error")).Times(2);
    press(manager, input, GameAction::Confirm);
    EXPECT_EQ(state->getPhase(), BattlePhase::ActionSelect);

    // Flee
    press(manager, input, GameAction::Down);
    press(manager, input, GameAction::Confirm);
    EXPECT_EQ(state->getPhase(), BattlePhase::ActionSelect);
    EXPECT_EQ(battle.getQueuedActionCount(), 0u);

    const auto& log = state->getFeedback().getLog();
    ASSERT_GE(log.size(), 2u);
    EXPECT_EQ(log[log.size() - 2], "battle.cannotSeal");
    EXPECT_EQ(log.back(), "battle.cannotFlee");
}

TEST_F(BattleStateTest, FleeWaitsForConfirmationOnTargetScreen) {
    session.party.addSpirit(partySpirit(50, 20, 10));
    startBattle(singleEnemy(50));

    press(manager, input, GameAction::Up);
    ASSERT_EQ(BattleState::COMMANDS[state->getCommandIndex()], BattleCommand::Flee);
    press(manager, input, GameAction::Confirm);
    ASSERT_EQ(state->getPhase(), BattlePhase::TargetSelect);
    EXPECT_EQ(battle.getQueuedActionCount(), 0u);

    press(manager, input, GameAction::Cancel);
    EXPECT_EQ(state->getPhase(), BattlePhase::ActionSelect);
    EXPECT_EQ(battle.getQueuedActionCount(), 0u);

    press(manager, input, GameAction::Confirm);
    ASSERT_EQ(state->getPhase(), BattlePhase::TargetSelect);
    press(manager, input, GameAction::Confirm);
    EXPECT_EQ(state->getPhase(), BattlePhase::Battle);
    EXPECT_EQ(battle.getQueuedActionCount(), 1u);
}

TEST_F(BattleStateTest, KnockedOutEnemyLeavesTargetList) {
    SpiritTemplate second = partySpirit(50, 20, 40);
    second.id = "sidekick";
    second.name = "Sidekick";
    session.party.addSpirit(partySpirit(50, 20, 40));
    session.party.addSpirit(second);

    BattleRequest request;
    request.enemies = {enemySpirit(50), enemySpirit(1)};
    startBattle(request);

    // Hero sends an attack at the weak enemy
    ASSERT_EQ(state->getSelectedSpirit()->name, "Hero");
    press(manager, input, GameAction::Confirm);
    press(manager, input, GameAction::Down);
    ASSERT_EQ(state->getTargetedSpirit(), &battle.getEnemyParty()[1]);
    press(manager, input, GameAction::Confirm);
    ASSERT_EQ(battle.getQueuedActionCount(), 1u);

    // Sidekick aims at the same enemy before the hit lands
    manager.update(0.01f);
    ASSERT_EQ(state->getPhase(), BattlePhase::ActionSelect);
    ASSERT_EQ(state->getSelectedSpirit()->name, "Sidekick");
    press(manager, input, GameAction::Confirm);
    press(manager, input, GameAction::Down);
    ASSERT_EQ(state->getTargetIndex(), 1u);

    EXPECT_CALL(audio, playEffect("cursor")).Times(1);
    for (int i = 0; i < 10 && battle.getEnemyParty()[1].isAlive; ++i) {
        manager.update(0.1f);
    }

    ASSERT_FALSE(battle.getEnemyParty()[1].isAlive);
    EXPECT_EQ(state->getPhase(), BattlePhase::TargetSelect);
    EXPECT_EQ(state->getTargetIndex(), 0u);
    EXPECT_EQ(state->getTargetedSpirit(), &battle.getEnemyParty()[0]);

    // Moving the cursor only cycles through survivors
    EXPECT_CALL(audio, playEffect("cursor")).Times(1);
    press(manager, input, GameAction::Down);
    EXPECT_EQ(state->getTargetedSpirit(), &battle.getEnemyParty()[0]);

    press(manager, input, GameAction::Confirm);
    EXPECT_EQ(state->getPhase(), BattlePhase::Battle);
    EXPECT_EQ(battle.getQueuedActionCount(), 1u);
}

TEST_F(BattleStateTest, TargetCancelReturnsToPreviousMenu) {
    session.party.addSpirit(partySpirit(50, 20, 10));
    startBattle(singleEnemy(50));

    press(manager, input, GameAction::Confirm);
    ASSERT_EQ(state->getPhase(), BattlePhase::TargetSelect);
    press(manager, input, GameAction::Cancel);
    EXPECT_EQ(state->getPhase(), BattlePhase::ActionSelect);

    press(manager, input, GameAction::Down);
    press(manager, input, GameAction::Confirm);
    ASSERT_EQ(state->getPhase(), BattlePhase::AbilitySelect);
    press(manager, input, GameAction::Confirm);
    ASSERT_EQ(state->getPhase(), BattlePhase::TargetSelect);
    press(manager, input, GameAction::Cancel);
    EXPECT_EQ(state->getPhase(), BattlePhase::AbilitySelect);
}

TEST_F(BattleStateTest, CancelDefersSpiritUntilConfirm) {
    session.party.addSpirit(partySpirit(50, 20, 10));
    startBattle(singleEnemy(50));

    press(manager, input, GameAction::Cancel);
    EXPECT_EQ(state->getPhase(), BattlePhase::Battle);
    EXPECT_EQ(state->getDeferredCount(), 1u);

    manager.update(0.01f);
    EXPECT_EQ(state->getPhase(), BattlePhase::Battle);

    press(manager, input, GameAction::Confirm);
    EXPECT_EQ(state->getPhase(), BattlePhase::ActionSelect);
    EXPECT_EQ(state->getDeferredCount(), 0u);
}

TEST_F(BattleStateTest, PauseFreezesTheFight) {
    session.party.addSpirit(partySpirit(50, 20, 10));
    startBattle(singleEnemy(50));
    float enemyAtb = battle.getEnemyParty()[0].atb;

    press(manager, input, GameAction::Menu);
    ASSERT_TRUE(manager.isInState(StateId::Paused));
    manager.update(5.0f);
    EXPECT_FLOAT_EQ(battle.getEnemyParty()[0].atb, enemyAtb);

    EXPECT_CALL(audio, resumeBGM());
    EXPECT_CALL(audio, playBGM(_)).Times(0);
    manager.popState();
    ASSERT_TRUE(manager.isInState(StateId::Battle));
    EXPECT_EQ(state->getPhase(), BattlePhase::ActionSelect);
    EXPECT_TRUE(battle.isActive());
    EXPECT_FLOAT_EQ(battle.getEnemyParty()[0].atb, enemyAtb);
}

TEST_F(BattleStateTest, VictoryRemovesTriggerFromWorld) {
    session.party.addSpirit(partySpirit(50, 20, 40));
    BattleRequest request = singleEnemy(1);
    request.triggerId = "wild_pebblit";
    startBattle(request);

    press(manager, input, GameAction::Confirm);
    press(manager, input, GameAction::Confirm);
    runUntilResults();
    manager.update(1.1f);

    EXPECT_CALL(world, removeObject("wild_pebblit"));
    press(manager, input, GameAction::Confirm);

    EXPECT_TRUE(isTruthy(session.variables.get("defeated.wild_pebblit")));
    EXPECT_FLOAT_EQ(session.interactionCooldown, battle.getTuning().interactionCooldown);
}

TEST_F(BattleStateTest, DefeatRestoresPartyWithoutRewards) {
    SpiritTemplate hero = partySpirit(1, 5, 1);
    hero.initialAtb = 0.0f;
    session.party.addSpirit(hero);
    BattleRequest request = singleEnemy(500, 80);
    request.enemies[0].initialAtb = 100.0f;
    BattleTuning tuning;
    tuning.enemyAbilityChance = 0.0f;
    battle.setTuning(tuning);
    startBattle(request);

    runUntilResults();
    ASSERT_EQ(state->getResult(), BattleResult::Defeat);
    manager.update(1.1f);
    press(manager, input, GameAction::Confirm);

    EXPECT_TRUE(manager.isInState(StateId::Playing));
    EXPECT_FALSE(session.party.getMembers()[0].currentHp.has_value());
    EXPECT_EQ(session.inventory.getGold(), 0);
    EXPECT_EQ(session.party.getMembers()[0].exp, 0);
}

TEST_F(BattleStateTest, ExitRestoresMusicAndCleansUp) {
    session.party.addSpirit(partySpirit(50, 20, 10));
    EXPECT_CALL(audio, stopAmbience());
    EXPECT_CALL(audio, playBGM("battle"));
    startBattle(singleEnemy(50));

    EXPECT_CALL(audio, resumeBGM());
    manager.popState();

    EXPECT_FALSE(battle.isActive());
    EXPECT_TRUE(battle.getEnemyParty().empty());
    EXPECT_FALSE(static_cast<bool>(battle.onDamage));
}

TEST_F(BattleStateTest, MissingBattleSystemLeavesImmediately) {
    services.battle = nullptr;
    manager.changeState(StateId::Playing);
    manager.pushState(StateId::Battle, StateData::withBattle(singleEnemy(5)));

    manager.update(0.01f);
    EXPECT_TRUE(manager.isInState(StateId::Playing));
}

} // namespace
} // namespace Wildspirit::Testing
