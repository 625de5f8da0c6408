#include <gtest/gtest.h>

#include "Mocks.hpp"
#include "core/InputActions.hpp"
#include "game/GameStateManager.hpp"
#include <unordered_map>
#include <utility>

namespace Wildspirit::Testing {
namespace {

class GameStateManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (auto [id, name] : {std::pair{StateId::MainMenu, "MainMenu"}, std::pair{StateId::Playing, "Playing"},
                                std::pair{StateId::Paused, "Paused"}, std::pair{StateId::Inventory, "Inventory"},
                                std::pair{StateId::Dialogue, "Dialogue"}}) {
            auto state = std::make_unique<RecordingState>(manager, services, name, journal);
            states[id] = state.get();
            manager.registerState(id, std::move(state));
        }
    }

    std::vector<std::string> journal;
    GameServices services;
    GameStateManager manager;
    std::unordered_map<StateId, RecordingState*> states;
};

TEST_F(GameStateManagerTest, StartsWithoutState) {
    EXPECT_FALSE(manager.getCurrentState().has_value());
    EXPECT_FALSE(manager.getPreviousState().has_value());
    EXPECT_EQ(manager.getStackDepth(), 0u);
    EXPECT_FALSE(manager.shouldQuit());
}

TEST_F(GameStateManagerTest, ChangeStateExitsOldAndEntersNew) {
    ASSERT_TRUE(manager.changeState(StateId::MainMenu));
    ASSERT_TRUE(manager.changeState(StateId::Playing));

    EXPECT_EQ(journal, (std::vector<std::string>{"MainMenu:enter", "MainMenu:exit", "Playing:enter"}));
    EXPECT_EQ(manager.getCurrentState(), StateId::Playing);
    EXPECT_EQ(manager.getPreviousState(), StateId::MainMenu);
    EXPECT_EQ(manager.getStackDepth(), 0u);
}

TEST_F(GameStateManagerTest, PauseAndResumeRoundTrip) {
    manager.changeState(StateId::Playing);
    ASSERT_TRUE(manager.pushState(StateId::Paused));

    EXPECT_TRUE(manager.isInState(StateId::Paused));
    EXPECT_EQ(manager.getStackDepth(), 1u);
    EXPECT_TRUE(manager.isStateInStack(StateId::Playing));

    ASSERT_TRUE(manager.popState());

    EXPECT_EQ(manager.getCurrentState(), StateId::Playing);
    EXPECT_EQ(manager.getStackDepth(), 0u);
    EXPECT_TRUE(states[StateId::Playing]->lastData.isResumingFromPause);
    EXPECT_EQ(journal, (std::vector<std::string>{"Playing:enter", "Playing:pause", "Paused:enter",
                                                  "Paused:exit", "Playing:resume-enter", "Playing:resume"}));
}

TEST_F(GameStateManagerTest, ResumedDataKeepsOriginalPayload) {
    DialogueRequest request;
    request.speaker = "Elder";
    request.messages = {"Hello"};
    manager.changeState(StateId::Playing);
    manager.pushState(StateId::Dialogue, StateData::withDialogue(request));
    manager.pushState(StateId::Inventory);
    manager.popState();

    const StateData& resumed = states[StateId::Dialogue]->lastData;
    EXPECT_TRUE(resumed.isResumingFromPause);
    ASSERT_TRUE(resumed.dialogue.has_value());
    EXPECT_EQ(resumed.dialogue->speaker, "Elder");
}

TEST_F(GameStateManagerTest, UnknownStateIsRejectedWithoutSideEffects) {
    manager.changeState(StateId::Playing);
    journal.clear();

    EXPECT_FALSE(manager.changeState(StateId::Battle));
    EXPECT_FALSE(manager.pushState(StateId::Shop));
    EXPECT_FALSE(manager.changeState("NOT_A_STATE"));
    EXPECT_FALSE(manager.pushState("ALSO_NOT_A_STATE"));

    EXPECT_TRUE(journal.empty());
    EXPECT_EQ(manager.getCurrentState(), StateId::Playing);
    EXPECT_EQ(manager.getStackDepth(), 0u);
}

TEST_F(GameStateManagerTest, AcceptsStringTags) {
    EXPECT_TRUE(manager.changeState("MAIN_MENU"));
    EXPECT_TRUE(manager.pushState("INVENTORY"));
    EXPECT_EQ(manager.getCurrentState(), StateId::Inventory);
    EXPECT_EQ(manager.getStackDepth(), 1u);
}

TEST_F(GameStateManagerTest, PopOnEmptyStackIsNoOp) {
    manager.changeState(StateId::Playing);
    journal.clear();

    EXPECT_FALSE(manager.popState());
    EXPECT_TRUE(journal.empty());
    EXPECT_EQ(manager.getCurrentState(), StateId::Playing);
}

TEST_F(GameStateManagerTest, ClearStackExitsFramesTopFirst) {
    manager.changeState(StateId::Playing);
    manager.pushState(StateId::Paused);
    manager.pushState(StateId::Inventory);
    journal.clear();

    manager.clearStack();

    EXPECT_EQ(manager.getStackDepth(), 0u);
    EXPECT_EQ(manager.getCurrentState(), StateId::Inventory);
    EXPECT_EQ(journal, (std::vector<std::string>{"Paused:exit", "Playing:exit"}));
}

TEST_F(GameStateManagerTest, ReturnToMainMenuFromNestedOverlays) {
    manager.changeState(StateId::Playing);
    manager.pushState(StateId::Paused);
    manager.pushState(StateId::Inventory);

    manager.clearStack();
    manager.changeState(StateId::MainMenu);

    EXPECT_EQ(manager.getCurrentState(), StateId::MainMenu);
    EXPECT_EQ(manager.getStackDepth(), 0u);
    EXPECT_FALSE(manager.isStateInStack(StateId::Playing));
    EXPECT_FALSE(manager.popState());
}

TEST_F(GameStateManagerTest, IsStateInStackCoversCurrentState) {
    EXPECT_FALSE(manager.isStateInStack(StateId::Playing));
    manager.changeState(StateId::Playing);
    EXPECT_TRUE(manager.isStateInStack(StateId::Playing));
    EXPECT_FALSE(manager.isStateInStack(StateId::Paused));
}

TEST_F(GameStateManagerTest, OnlyCurrentStateIsDriven) {
    manager.changeState(StateId::Playing);
    manager.pushState(StateId::Paused);

    ActionInputState input;
    NullRenderSurface surface;
    manager.handleInput(input);
    manager.update(0.016f);
    manager.render(surface);

    EXPECT_EQ(states[StateId::Paused]->updates, 1);
    EXPECT_EQ(states[StateId::Paused]->inputs, 1);
    EXPECT_EQ(states[StateId::Paused]->renders, 1);
    EXPECT_EQ(states[StateId::Playing]->updates, 0);
    EXPECT_EQ(states[StateId::Playing]->inputs, 0);
    EXPECT_EQ(states[StateId::Playing]->renders, 0);
}

TEST_F(GameStateManagerTest, ContinuationRunsAfterDelay) {
    manager.changeState(StateId::Playing);
    int calls = 0;
    manager.schedule(0.5f, [&]() { ++calls; });

    manager.update(0.3f);
    EXPECT_EQ(calls, 0);
    EXPECT_EQ(manager.getPendingContinuationCount(), 1u);

    manager.update(0.3f);
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(manager.getPendingContinuationCount(), 0u);
}

TEST_F(GameStateManagerTest, StaleContinuationIsDropped) {
    manager.changeState(StateId::Playing);
    manager.schedule(0.5f, [this]() { manager.changeState(StateId::MainMenu); });

    manager.pushState(StateId::Paused);
    manager.update(1.0f);

    EXPECT_EQ(manager.getCurrentState(), StateId::Paused);
    EXPECT_EQ(manager.getPendingContinuationCount(), 0u);
}

TEST_F(GameStateManagerTest, ZeroDelayContinuationRunsOnNextUpdate) {
    manager.changeState(StateId::Playing);
    manager.pushState(StateId::Dialogue);
    manager.schedule(0.0f, [this]() { manager.popState(); });

    EXPECT_EQ(manager.getCurrentState(), StateId::Dialogue);
    manager.update(0.016f);
    EXPECT_EQ(manager.getCurrentState(), StateId::Playing);
}

TEST_F(GameStateManagerTest, EnterGenerationCountsEveryEntry) {
    uint64_t start = manager.getEnterGeneration();
    manager.changeState(StateId::Playing);
    manager.pushState(StateId::Paused);
    manager.popState();
    EXPECT_EQ(manager.getEnterGeneration(), start + 3);
}

TEST_F(GameStateManagerTest, QuitRequestIsSticky) {
    manager.requestQuit();
    EXPECT_TRUE(manager.shouldQuit());
    manager.changeState(StateId::MainMenu);
    EXPECT_TRUE(manager.shouldQuit());
}

TEST(StateIdTest, TagsAreUpperSnakeCase) {
    EXPECT_EQ(stateIdToString(StateId::SaveLoad), "SAVE_LOAD");
    EXPECT_EQ(stateIdToString(StateId::LootWindow), "LOOT_WINDOW");
    EXPECT_EQ(stateIdToString(StateId::Battle), "BATTLE");
    EXPECT_EQ(stateIdFromString("MAIN_MENU"), StateId::MainMenu);
    EXPECT_FALSE(stateIdFromString("main_menu").has_value());
}

} // namespace
} // namespace Wildspirit::Testing
