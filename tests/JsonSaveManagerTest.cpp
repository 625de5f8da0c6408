#include <gtest/gtest.h>

#include "game/GameSession.hpp"
#include "rpg/ItemCatalog.hpp"
#include "services/JsonSaveManager.hpp"
#include <filesystem>
#include <fstream>

namespace Wildspirit {
namespace {

class JsonSaveManagerTest : public ::testing::Test {
protected:
    JsonSaveManagerTest()
        : directory(std::filesystem::temp_directory_path() /
                    ("wildspirit_saves_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name())))
        , catalog(ItemCatalog::withDefaults())
        , saves(directory) {
        std::filesystem::remove_all(directory);
    }

    ~JsonSaveManagerTest() override {
        std::error_code ignored;
        std::filesystem::remove_all(directory, ignored);
    }

    void writeRaw(const std::string& id, const std::string& content) {
        std::filesystem::create_directories(directory);
        std::ofstream file(directory / (id + ".json"));
        file << content;
    }

    std::filesystem::path directory;
    ItemCatalog catalog;
    JsonSaveManager saves;
};

TEST_F(JsonSaveManagerTest, NoDirectoryMeansNoSaves) {
    EXPECT_FALSE(saves.hasSaves());
    EXPECT_TRUE(saves.getAllSaves().empty());
    EXPECT_FALSE(saves.getLatestSave().has_value());
}

TEST_F(JsonSaveManagerTest, SessionSurvivesRoundTrip) {
    GameSession session(&catalog);
    session.startNewGame();
    session.mapName = "grove";
    session.playtimeSeconds = 754.5;
    session.inventory.addItem("spirit_shard", 12);
    session.variables.set("elder.metBefore", true);
    session.variables.set("quest.stage", 3.0);
    session.variables.set("player.title", std::string("Warden \"Green\""));
    session.party.updateVitals("sylphie", 5, 1);

    SpiritTemplate boxed;
    boxed.id = "pebble";
    boxed.name = "Pebble";
    boxed.type1 = Element::Earth;
    session.party.addToBox(boxed);

    auto id = saves.saveGame(session, std::string("Before the boss"));
    ASSERT_TRUE(id.has_value());

    GameSession loaded(&catalog);
    ASSERT_TRUE(saves.loadGame(*id, loaded));

    EXPECT_TRUE(loaded.started);
    EXPECT_EQ(loaded.mapName, "grove");
    EXPECT_DOUBLE_EQ(loaded.playtimeSeconds, 754.5);
    EXPECT_EQ(loaded.inventory.getGold(), 100);
    EXPECT_EQ(loaded.inventory.getItemQuantity("health_potion"), 3);
    EXPECT_EQ(loaded.inventory.getItemQuantity("spirit_shard"), 12);
    EXPECT_TRUE(isTruthy(loaded.variables.get("elder.metBefore")));
    EXPECT_DOUBLE_EQ(toNumber(loaded.variables.get("quest.stage")), 3.0);
    EXPECT_EQ(toDisplayString(loaded.variables.get("player.title")), "Warden \"Green\"");

    ASSERT_EQ(loaded.party.getMembers().size(), 1u);
    const PartySpirit& starter = loaded.party.getMembers()[0];
    EXPECT_EQ(starter.data.name, "Sylphie");
    EXPECT_EQ(starter.data.level, 5);
    EXPECT_EQ(starter.data.type1, Element::Wind);
    EXPECT_EQ(starter.data.baseStats.speed, 22);
    EXPECT_EQ(starter.currentHp, 5);
    EXPECT_EQ(starter.currentMp, 1);
    EXPECT_FALSE(starter.data.abilities.empty());

    ASSERT_EQ(loaded.party.getBox().size(), 1u);
    EXPECT_EQ(loaded.party.getBox()[0].data.type1, Element::Earth);

    auto listed = saves.getAllSaves();
    ASSERT_EQ(listed.size(), 1u);
    EXPECT_EQ(listed[0].id, *id);
    EXPECT_EQ(listed[0].name, "Before the boss");
    EXPECT_EQ(listed[0].mapName, "grove");
}

TEST_F(JsonSaveManagerTest, SavingWithIdOverwritesSlot) {
    GameSession session(&catalog);
    session.startNewGame();
    ASSERT_EQ(saves.saveGame(session, std::string("First"), std::string("slot_a")), std::optional<std::string>("slot_a"));

    session.inventory.addGold(400);
    ASSERT_EQ(saves.saveGame(session, std::string("Second"), std::string("slot_a")), std::optional<std::string>("slot_a"));

    auto listed = saves.getAllSaves();
    ASSERT_EQ(listed.size(), 1u);
    EXPECT_EQ(listed[0].name, "Second");

    GameSession loaded(&catalog);
    ASSERT_TRUE(saves.loadGame("slot_a", loaded));
    EXPECT_EQ(loaded.inventory.getGold(), 500);
}

TEST_F(JsonSaveManagerTest, GeneratedIdsDoNotCollide) {
    GameSession session(&catalog);
    auto first = saves.saveGame(session);
    auto second = saves.saveGame(session);
    ASSERT_TRUE(first && second);
    EXPECT_NE(*first, *second);
    EXPECT_EQ(saves.getAllSaves().size(), 2u);
}

TEST_F(JsonSaveManagerTest, ListsNewestFirstAndSkipsCorruptFiles) {
    writeRaw("older", R"({"version": 1, "name": "Older", "timestamp": 100})");
    writeRaw("newer", R"({"version": 1, "name": "Newer", "timestamp": 200})");
    writeRaw("broken", "{ not json");

    auto listed = saves.getAllSaves();
    ASSERT_EQ(listed.size(), 2u);
    EXPECT_EQ(listed[0].id, "newer");
    EXPECT_EQ(listed[1].id, "older");
    EXPECT_EQ(saves.getLatestSave()->name, "Newer");
}

TEST_F(JsonSaveManagerTest, RejectsNewerSaveVersion) {
    writeRaw("future", R"({"version": 99, "gold": 5})");
    GameSession session(&catalog);
    session.inventory.addGold(10);

    EXPECT_FALSE(saves.loadGame("future", session));
    EXPECT_EQ(session.inventory.getGold(), 10);
}

TEST_F(JsonSaveManagerTest, MissingSaveFailsToLoad) {
    GameSession session(&catalog);
    EXPECT_FALSE(saves.loadGame("nope", session));
    EXPECT_FALSE(session.started);
}

TEST_F(JsonSaveManagerTest, DeleteRemovesSlot) {
    GameSession session(&catalog);
    auto id = saves.saveGame(session);
    ASSERT_TRUE(id);

    EXPECT_TRUE(saves.deleteSave(*id));
    EXPECT_FALSE(saves.hasSaves());
    EXPECT_FALSE(saves.deleteSave(*id));
}

} // namespace
} // namespace Wildspirit
