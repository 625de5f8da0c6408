#include <gtest/gtest.h>

#include "Mocks.hpp"
#include "rpg/ItemCatalog.hpp"
#include "script/ScriptEngine.hpp"
#include <fstream>
#include <limits>
#include <sstream>

using ::testing::NiceMock;

namespace Wildspirit::Testing {
namespace {

using Kind = ScriptStep::Kind;

constexpr const char* ELDER_SCRIPT = R"(
// Gives a potion on the first visit
if (!getvar("elder.metBefore")) {
    message "Take this.";
    additem "health_potion", 1;
    playsound "pickup";
    setflag "elder.metBefore";
    end;
}

message "What would you like to know?";
choice "About sealing", "About the guardian", "Nothing";

if (choice == 0) {
    message "Weaken it first.";
} else if (choice == 1) {
    message "Bring ethers.";
    incvar "elder.warnings";
} else {
    message "Safe travels.";
}
)";

class ScriptEngineTest : public ::testing::Test {
protected:
    ScriptEngineTest()
        : catalog(ItemCatalog::withDefaults())
        , inventory(&catalog)
        , engine(ScriptContext{&variables, &inventory, &audio}, 99u) {}

    ItemCatalog catalog;
    GameVariables variables;
    Inventory inventory;
    NiceMock<MockAudioService> audio;
    ScriptEngine engine;
};

TEST_F(ScriptEngineTest, YieldsMessagesInOrder) {
    ASSERT_TRUE(engine.start(R"(message "One"; message "Two";)"));
    EXPECT_TRUE(engine.isRunning());

    ScriptStep step = engine.next();
    EXPECT_EQ(step.kind, Kind::ShowMessage);
    EXPECT_EQ(step.text, "One");
    EXPECT_EQ(engine.next().text, "Two");
    EXPECT_EQ(engine.next().kind, Kind::Finished);
    EXPECT_FALSE(engine.isRunning());
    EXPECT_EQ(engine.next().kind, Kind::Finished);
}

TEST_F(ScriptEngineTest, FirstVisitGivesGiftAndEnds) {
    EXPECT_CALL(audio, playEffect("pickup"));
    ASSERT_TRUE(engine.start(ELDER_SCRIPT));

    EXPECT_EQ(engine.next().text, "Take this.");
    EXPECT_EQ(engine.next().kind, Kind::Finished);
    EXPECT_EQ(inventory.getItemQuantity("health_potion"), 1);
    EXPECT_TRUE(isTruthy(variables.get("elder.metBefore")));
}

TEST_F(ScriptEngineTest, ChoiceSelectsBranch) {
    variables.set("elder.metBefore", true);
    ASSERT_TRUE(engine.start(ELDER_SCRIPT));

    EXPECT_EQ(engine.next().text, "What would you like to know?");
    ScriptStep choice = engine.next();
    ASSERT_EQ(choice.kind, Kind::ShowChoice);
    EXPECT_EQ(choice.choices.size(), 3u);
    EXPECT_TRUE(engine.isAwaitingChoice());

    engine.submitChoice(1);
    EXPECT_FALSE(engine.isAwaitingChoice());
    EXPECT_EQ(engine.next().text, "Bring ethers.");
    EXPECT_EQ(engine.next().kind, Kind::Finished);
    EXPECT_DOUBLE_EQ(toNumber(variables.get("elder.warnings")), 1.0);
}

TEST_F(ScriptEngineTest, UnansweredChoiceTakesElseBranch) {
    variables.set("elder.metBefore", true);
    ASSERT_TRUE(engine.start(ELDER_SCRIPT));
    engine.next();
    engine.next();

    EXPECT_EQ(engine.next().text, "Safe travels.");
    EXPECT_EQ(engine.getLastChoice(), -1);
}

TEST_F(ScriptEngineTest, LabelsAndGotoLoop) {
    ASSERT_TRUE(engine.start(R"(
        label top:
        incvar "count";
        if (getvar("count") < 3) {
            goto top;
        }
        message "done";
    )"));

    EXPECT_EQ(engine.next().text, "done");
    EXPECT_DOUBLE_EQ(toNumber(variables.get("count")), 3.0);
}

TEST_F(ScriptEngineTest, RunawayLoopIsStopped) {
    ASSERT_TRUE(engine.start("label spin: goto spin;"));
    EXPECT_EQ(engine.next().kind, Kind::Finished);
    EXPECT_FALSE(engine.isRunning());
}

TEST_F(ScriptEngineTest, SyntaxErrorsRefuseToStart) {
    EXPECT_FALSE(engine.start("frobnicate 3;"));
    EXPECT_FALSE(engine.start("goto nowhere;"));
    EXPECT_FALSE(engine.start("label a: label a:"));
    EXPECT_FALSE(engine.start(R"(if (true) { message "open";)"));
    EXPECT_FALSE(engine.start("message 12;"));
    EXPECT_FALSE(engine.isRunning());
    EXPECT_EQ(engine.getStartCount(), 0u);
}

TEST_F(ScriptEngineTest, RestartingResetsPosition) {
    ASSERT_TRUE(engine.start(R"(message "a"; message "b";)"));
    engine.next();
    ASSERT_TRUE(engine.start(R"(message "a"; message "b";)"));
    EXPECT_EQ(engine.next().text, "a");
    EXPECT_EQ(engine.getStartCount(), 2u);
}

TEST_F(ScriptEngineTest, GoldCommandsClampAtZero) {
    ASSERT_TRUE(engine.start("addgold 50; delgold 80;"));
    engine.next();
    EXPECT_EQ(inventory.getGold(), 0);

    ASSERT_TRUE(engine.start("addgold 50; delgold 20;"));
    engine.next();
    EXPECT_EQ(inventory.getGold(), 30);
}

TEST_F(ScriptEngineTest, InventoryFunctionsDriveConditions) {
    inventory.addItem("spirit_shard", 4);
    ASSERT_TRUE(engine.start(R"(
        if (hasitem("spirit_shard", 3) and getitemqty("spirit_shard") == 4) {
            delitem "spirit_shard", 3;
            message "Traded.";
        } else {
            message "Not enough.";
        }
    )"));

    EXPECT_EQ(engine.next().text, "Traded.");
    EXPECT_EQ(inventory.getItemQuantity("spirit_shard"), 1);
}

TEST_F(ScriptEngineTest, VariablesCompareAsStringsAndNumbers) {
    ASSERT_TRUE(engine.start(R"(
        setvar "name", "Ash";
        setvar "level", 7;
        if (getvar("name") == "Ash" && getvar("level") >= 7 && getgold() == 0) {
            message "match";
        }
    )"));
    EXPECT_EQ(engine.next().text, "match");
}

TEST_F(ScriptEngineTest, RandomStaysInRange) {
    ASSERT_TRUE(engine.start(R"(setvar "roll", random(6, 1);)"));
    engine.next();
    double roll = toNumber(variables.get("roll"));
    EXPECT_GE(roll, 1.0);
    EXPECT_LE(roll, 6.0);
}

TEST_F(ScriptEngineTest, AmountsBeyondInt32FailToCompile) {
    EXPECT_FALSE(engine.start("addgold 5000000000;"));
    EXPECT_FALSE(engine.start("delgold -3000000000;"));
    EXPECT_FALSE(engine.start(R"(additem "ether", 3000000000;)"));
    EXPECT_FALSE(engine.start(R"(shop "Stall", "ether", 1000000000000;)"));
    EXPECT_FALSE(engine.start(R"(shop "Stall", "ether", 40, 9999999999;)"));
    EXPECT_EQ(engine.getStartCount(), 0u);
    EXPECT_EQ(inventory.getGold(), 0);

    EXPECT_TRUE(engine.start("addgold 2147483647; addgold 10;"));
    engine.next();
    EXPECT_EQ(inventory.getGold(), std::numeric_limits<int32_t>::max());
}

TEST_F(ScriptEngineTest, HugeExpressionValuesSaturate) {
    inventory.addItem("ether", 2);
    ASSERT_TRUE(engine.start(R"(
        setvar "roll", random(0, 5000000000);
        setvar "floor", random(-5000000000, -4000000000);
        if (hasitem("ether", 9999999999)) {
            message "hoarder";
        } else {
            message "modest";
        }
    )"));

    EXPECT_EQ(engine.next().text, "modest");
    double roll = toNumber(variables.get("roll"));
    EXPECT_GE(roll, 0.0);
    EXPECT_LE(roll, 2147483647.0);
    EXPECT_DOUBLE_EQ(toNumber(variables.get("floor")), -2147483648.0);
}

TEST(ScriptValueTest, ToInt32SaturatesAndIgnoresText) {
    EXPECT_EQ(toInt32(ScriptValue{5e12}), std::numeric_limits<int32_t>::max());
    EXPECT_EQ(toInt32(ScriptValue{-5e12}), std::numeric_limits<int32_t>::min());
    EXPECT_EQ(toInt32(ScriptValue{12.9}), 12);
    EXPECT_EQ(toInt32(ScriptValue{std::string("seven")}), 0);
    EXPECT_EQ(toInt32(ScriptValue{std::string("42")}), 42);
    EXPECT_EQ(toInt32(ScriptValue{true}), 1);
}

TEST_F(ScriptEngineTest, ShopStepCarriesStock) {
    ASSERT_TRUE(engine.start(R"(shop "Stall", "ether", 40, 2, "health_potion", 25;)"));
    ScriptStep step = engine.next();
    ASSERT_EQ(step.kind, Kind::OpenShop);
    EXPECT_EQ(step.shop.shopName, "Stall");
    ASSERT_EQ(step.shop.items.size(), 2u);
    EXPECT_EQ(step.shop.items[0].stock, 2);
    EXPECT_TRUE(step.shop.items[1].isUnlimited());
}

TEST_F(ScriptEngineTest, MissingContextMakesCommandsNoOps) {
    ScriptEngine bare;
    ASSERT_TRUE(bare.start(R"(
        additem "ether";
        setflag "seen";
        playsound "ping";
        if (hasitem("ether") or getvar("seen")) { message "wrong"; }
        message "ok";
    )"));
    EXPECT_EQ(bare.next().text, "ok");
}

TEST_F(ScriptEngineTest, KeywordsAreCaseInsensitive) {
    ASSERT_TRUE(engine.start(R"(IF (TRUE) { MESSAGE "yes"; } ELSE { message "no"; })"));
    EXPECT_EQ(engine.next().text, "yes");
}

TEST(ScriptTokenizerTest, SkipsComments) {
    auto tokens = tokenizeScript("/* block */ message \"hi\"; // trailing");
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[0].type, TokenType::Identifier);
    EXPECT_EQ(tokens[1].type, TokenType::String);
    EXPECT_EQ(tokens[1].text, "hi");
}

TEST(ScriptFilesTest, BundledScriptsCompile) {
    for (const char* path : {WILDSPIRIT_ASSET_DIR "/scripts/elder.ws", WILDSPIRIT_ASSET_DIR "/scripts/merchant.ws"}) {
        std::ifstream file(path);
        ASSERT_TRUE(file.is_open()) << path;
        std::stringstream buffer;
        buffer << file.rdbuf();
        EXPECT_TRUE(compileScript(buffer.str()).has_value()) << path;
    }
}

} // namespace
} // namespace Wildspirit::Testing
