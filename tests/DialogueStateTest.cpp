#include <gtest/gtest.h>

#include "Mocks.hpp"
#include "game/states/DialogueState.hpp"
#include "game/states/ShopState.hpp"
#include "rpg/ItemCatalog.hpp"
#include "script/ScriptEngine.hpp"

using ::testing::NiceMock;

namespace Wildspirit::Testing {
namespace {

constexpr const char* MERCHANT_SCRIPT = R"(
message "Finest wares!";
choice "Browse", "Leave";
if (choice == 0) {
    shop "Meadow Stall", "health_potion", 25, "ether", 40, 2;
    message "Come again!";
} else {
    message "Farewell.";
}
)";

class DialogueStateTest : public ::testing::Test {
protected:
    DialogueStateTest()
        : catalog(ItemCatalog::withDefaults())
        , session(&catalog)
        , script(ScriptContext{&session.variables, &session.inventory, &audio}, 7u) {
        services.audio = &audio;
        services.session = &session;
        services.catalog = &catalog;
        services.script = &script;

        manager.registerState(StateId::Playing,
                              std::make_unique<RecordingState>(manager, services, "Playing", journal));
        auto dialogue = std::make_unique<DialogueState>(manager, services);
        dialogueState = dialogue.get();
        manager.registerState(StateId::Dialogue, std::move(dialogue));
        auto shop = std::make_unique<ShopState>(manager, services);
        shopState = shop.get();
        manager.registerState(StateId::Shop, std::move(shop));

        manager.changeState(StateId::Playing);
    }

    void openDialogue(DialogueRequest request) {
        manager.pushState(StateId::Dialogue, StateData::withDialogue(std::move(request)));
    }

    // Reveal the current line and move past it
    void skipAndAdvance() {
        press(manager, input, GameAction::Confirm);
        press(manager, input, GameAction::Confirm);
    }

    std::vector<std::string> journal;
    ItemCatalog catalog;
    GameSession session;
    NiceMock<MockAudioService> audio;
    ScriptEngine script;
    GameServices services;
    GameStateManager manager;
    ActionInputState input;
    DialogueState* dialogueState = nullptr;
    ShopState* shopState = nullptr;
};

TEST_F(DialogueStateTest, ShowsMessagesInOrderThenCloses) {
    openDialogue({"Elder", {"Hello there.", "Safe travels."}, std::nullopt});
    EXPECT_EQ(dialogueState->getSpeaker(), "Elder");
    EXPECT_FALSE(dialogueState->getTypewriter().isComplete());

    // First confirm only finishes the reveal
    press(manager, input, GameAction::Confirm);
    EXPECT_TRUE(dialogueState->getTypewriter().isComplete());
    EXPECT_EQ(dialogueState->getTypewriter().getVisibleText(), "Hello there.");

    press(manager, input, GameAction::Confirm);
    EXPECT_EQ(dialogueState->getTypewriter().getFullText(), "Safe travels.");

    skipAndAdvance();
    EXPECT_TRUE(manager.isInState(StateId::Playing));
}

TEST_F(DialogueStateTest, TypewriterRevealsOverTime) {
    openDialogue({"Elder", {"Hello there."}, std::nullopt});
    manager.update(0.1f);
    size_t revealed = dialogueState->getTypewriter().getRevealedCount();
    EXPECT_GT(revealed, 0u);
    EXPECT_LT(revealed, dialogueState->getTypewriter().getVisibleLength());
}

TEST_F(DialogueStateTest, EmptyDialogueClosesOnNextUpdate) {
    openDialogue({});
    EXPECT_TRUE(manager.isInState(StateId::Dialogue));
    manager.update(0.016f);
    EXPECT_TRUE(manager.isInState(StateId::Playing));
}

TEST_F(DialogueStateTest, BrokenScriptFallsBackToMessages) {
    openDialogue({"Elder", {"Fallback line."}, std::string("frobnicate 3;")});
    EXPECT_FALSE(dialogueState->isScripted());
    EXPECT_EQ(dialogueState->getTypewriter().getFullText(), "Fallback line.");
}

TEST_F(DialogueStateTest, ScriptResumesAfterShopWithoutRestarting) {
    openDialogue({"Merchant", {}, std::string(MERCHANT_SCRIPT)});
    ASSERT_TRUE(dialogueState->isScripted());
    EXPECT_EQ(script.getStartCount(), 1u);
    EXPECT_EQ(dialogueState->getTypewriter().getFullText(), "Finest wares!");

    skipAndAdvance();
    ASSERT_TRUE(dialogueState->isShowingChoices());
    EXPECT_EQ(dialogueState->getChoices(), (std::vector<std::string>{"Browse", "Leave"}));

    press(manager, input, GameAction::Confirm);
    ASSERT_TRUE(manager.isInState(StateId::Shop));
    EXPECT_EQ(manager.getStackDepth(), 2u);
    EXPECT_EQ(shopState->getShop().shopName, "Meadow Stall");
    ASSERT_EQ(shopState->getShop().items.size(), 2u);
    EXPECT_EQ(shopState->getShop().items[1].stock, 2);

    press(manager, input, GameAction::Cancel);
    ASSERT_TRUE(manager.isInState(StateId::Dialogue));
    EXPECT_TRUE(manager.getCurrentStateData().isResumingFromPause);
    EXPECT_EQ(script.getStartCount(), 1u);
    EXPECT_TRUE(script.isRunning());
    EXPECT_EQ(dialogueState->getSpeaker(), "Merchant");
    EXPECT_EQ(dialogueState->getTypewriter().getFullText(), "Come again!");

    skipAndAdvance();
    EXPECT_TRUE(manager.isInState(StateId::Playing));
    EXPECT_FALSE(script.isRunning());
    EXPECT_EQ(script.getStartCount(), 1u);
}

TEST_F(DialogueStateTest, ChoiceSelectionWrapsAndPicksBranch) {
    openDialogue({"Merchant", {}, std::string(MERCHANT_SCRIPT)});
    skipAndAdvance();

    press(manager, input, GameAction::Up);
    EXPECT_EQ(dialogueState->getSelectedChoice(), 1u);
    press(manager, input, GameAction::Confirm);

    EXPECT_TRUE(manager.isInState(StateId::Dialogue));
    EXPECT_EQ(dialogueState->getTypewriter().getFullText(), "Farewell.");
}

TEST_F(DialogueStateTest, ScriptChangesReachTheSession) {
    openDialogue({"Elder", {}, std::string(R"(
        additem "health_potion", 2;
        addgold 30;
        setflag "elder.metBefore";
        message "Take these.";
    )")});

    EXPECT_EQ(session.inventory.getItemQuantity("health_potion"), 2);
    EXPECT_EQ(session.inventory.getGold(), 30);
    EXPECT_TRUE(isTruthy(session.variables.get("elder.metBefore")));
}

TEST_F(DialogueStateTest, LeavingEarlyStopsTheScript) {
    openDialogue({"Merchant", {}, std::string(MERCHANT_SCRIPT)});
    ASSERT_TRUE(script.isRunning());

    manager.clearStack();
    manager.changeState(StateId::Playing);
    EXPECT_FALSE(script.isRunning());
}

} // namespace
} // namespace Wildspirit::Testing
