#include <gtest/gtest.h>

#include "rpg/Inventory.hpp"
#include "rpg/ItemCatalog.hpp"
#include "rpg/Party.hpp"

namespace Wildspirit {
namespace {

SpiritTemplate makeTemplate(const std::string& id, int32_t level = 1) {
    SpiritTemplate data;
    data.id = id;
    data.name = id;
    data.level = level;
    data.type1 = Element::Water;
    return data;
}

TEST(PartyTest, OverflowGoesToBox) {
    Party party;
    for (size_t i = 0; i < Party::MAX_PARTY; ++i) {
        EXPECT_TRUE(party.addSpirit(makeTemplate("s" + std::to_string(i))));
    }
    EXPECT_FALSE(party.addSpirit(makeTemplate("extra")));
    EXPECT_EQ(party.getMembers().size(), Party::MAX_PARTY);
    ASSERT_EQ(party.getBox().size(), 1u);
    EXPECT_EQ(party.getActiveParty().size(), Party::MAX_ACTIVE);
    EXPECT_NE(party.findSpirit("extra"), nullptr);
}

TEST(PartyTest, NewSpiritsGetDefaultAbilities) {
    Party party;
    party.addSpirit(makeTemplate("drop"));
    const auto& abilities = party.getMembers()[0].data.abilities;
    ASSERT_EQ(abilities.size(), 3u);
    EXPECT_EQ(abilities[1].id, "aqua_jet");
}

TEST(PartyTest, LastMemberCannotBeBoxed) {
    Party party;
    party.addSpirit(makeTemplate("only"));
    EXPECT_FALSE(party.moveToBox(0));

    party.addSpirit(makeTemplate("second"));
    EXPECT_TRUE(party.moveToBox(0));
    EXPECT_EQ(party.getMembers()[0].data.id, "second");
    EXPECT_TRUE(party.moveToParty(0));
    EXPECT_EQ(party.getMembers().size(), 2u);
    EXPECT_FALSE(party.moveToParty(5));
}

TEST(PartyTest, ExpIsSplitAndLevelsCarryOver) {
    EXPECT_EQ(Party::expToNextLevel(1), 100);
    EXPECT_EQ(Party::expToNextLevel(4), 800);

    Party party;
    party.addSpirit(makeTemplate("a"));
    party.addSpirit(makeTemplate("b"));

    auto levelUps = party.awardExp(300);
    ASSERT_EQ(levelUps.size(), 2u);
    EXPECT_EQ(levelUps[0].newLevel, 2);
    EXPECT_EQ(party.getMembers()[0].data.level, 2);
    EXPECT_EQ(party.getMembers()[0].exp, 50);

    EXPECT_TRUE(party.awardExp(0).empty());
}

TEST(PartyTest, VitalsAreClampedAndHealed) {
    Party party;
    party.addSpirit(makeTemplate("a"));
    const PartySpirit& spirit = party.getMembers()[0];

    party.updateVitals("a", 999, -4);
    EXPECT_EQ(spirit.currentHp, Party::maxHp(spirit));
    EXPECT_EQ(spirit.currentMp, 0);

    party.healAll();
    EXPECT_FALSE(spirit.currentHp.has_value());
    EXPECT_FALSE(spirit.currentMp.has_value());
}

TEST(PartyTest, RestoreOverflowsIntoBox) {
    std::vector<PartySpirit> members;
    for (size_t i = 0; i < Party::MAX_PARTY + 2; ++i) {
        members.push_back(PartySpirit{makeTemplate("m" + std::to_string(i))});
    }
    Party party;
    party.restore(std::move(members), {});
    EXPECT_EQ(party.getMembers().size(), Party::MAX_PARTY);
    EXPECT_EQ(party.getBox().size(), 2u);
}

class InventoryTest : public ::testing::Test {
protected:
    InventoryTest()
        : catalog(ItemCatalog::withDefaults())
        , inventory(&catalog) {}

    ItemCatalog catalog;
    Inventory inventory;
};

TEST_F(InventoryTest, StackableItemsFillStacksFirst) {
    EXPECT_TRUE(inventory.addItem("health_potion", 7));
    EXPECT_TRUE(inventory.addItem("health_potion", 8));
    ASSERT_EQ(inventory.getSlots().size(), 2u);
    EXPECT_EQ(inventory.getSlot(0)->quantity, 10);
    EXPECT_EQ(inventory.getSlot(1)->quantity, 5);
    EXPECT_EQ(inventory.getItemQuantity("health_potion"), 15);
}

TEST_F(InventoryTest, KeyItemsTakeOneSlotEach) {
    EXPECT_TRUE(inventory.addItem("old_key", 3));
    EXPECT_EQ(inventory.getSlots().size(), 3u);
}

TEST_F(InventoryTest, UnknownItemsAreRejected) {
    EXPECT_FALSE(inventory.addItem("dragon_egg"));
    EXPECT_TRUE(inventory.getSlots().empty());
}

TEST_F(InventoryTest, FullInventoryKeepsWhatFit) {
    EXPECT_TRUE(inventory.addItem("old_key", static_cast<int32_t>(Inventory::MAX_SLOTS) - 1));
    EXPECT_FALSE(inventory.addItem("health_potion", 12));
    EXPECT_EQ(inventory.getItemQuantity("health_potion"), 10);
}

TEST_F(InventoryTest, RemoveTakesFromLastStackAndDropsEmptySlots) {
    inventory.addItem("health_potion", 15);
    EXPECT_TRUE(inventory.removeItem("health_potion", 6));
    ASSERT_EQ(inventory.getSlots().size(), 1u);
    EXPECT_EQ(inventory.getSlot(0)->quantity, 9);
    EXPECT_FALSE(inventory.removeItem("health_potion", 10));
    EXPECT_EQ(inventory.getItemQuantity("health_potion"), 9);
}

TEST_F(InventoryTest, ConsumablesRestoreVitals) {
    PartySpirit spirit{makeTemplate("a")};
    spirit.currentHp = 10;
    spirit.currentMp = 2;
    inventory.addItem("health_potion");
    inventory.addItem("ether");

    EXPECT_TRUE(inventory.useItem(0, spirit));
    EXPECT_EQ(spirit.currentHp, 50);
    EXPECT_FALSE(inventory.hasItem("health_potion"));

    // Potion is gone, ether moved to slot 0
    EXPECT_TRUE(inventory.useItem(0, spirit));
    EXPECT_EQ(spirit.currentMp, 20);
    EXPECT_TRUE(inventory.getSlots().empty());
}

TEST_F(InventoryTest, UselessItemsAreKept) {
    PartySpirit spirit{makeTemplate("a")};
    inventory.addItem("health_potion");
    inventory.addItem("spirit_shard");

    EXPECT_FALSE(inventory.useItem(0, spirit));
    EXPECT_FALSE(inventory.useItem(1, spirit));
    EXPECT_FALSE(inventory.useItem(9, spirit));
    EXPECT_EQ(inventory.getSlots().size(), 2u);
}

TEST_F(InventoryTest, GoldCannotGoNegative) {
    inventory.addGold(50);
    inventory.addGold(-20);
    EXPECT_FALSE(inventory.spendGold(60));
    EXPECT_TRUE(inventory.spendGold(50));
    EXPECT_EQ(inventory.getGold(), 0);
}

TEST(ItemCatalogTest, LoadsDefinitionsAndSkipsBadEntries) {
    ItemCatalog catalog;
    auto loaded = catalog.loadFromJson(R"({
        "elixir": { "name": "Elixir", "category": "consumable", "healHp": 200, "healMp": 50, "price": 500 },
        "relic": { "name": "Relic", "category": "keyitem", "stackable": false, "maxStack": 20 },
        "nameless": { "price": 3 },
        "weird": 42
    })");

    ASSERT_EQ(loaded, std::optional<size_t>(2));
    const ItemDefinition* elixir = catalog.find("elixir");
    ASSERT_NE(elixir, nullptr);
    EXPECT_EQ(elixir->category, ItemCategory::Consumable);
    EXPECT_EQ(elixir->healHp, 200);

    const ItemDefinition* relic = catalog.find("relic");
    ASSERT_NE(relic, nullptr);
    EXPECT_EQ(relic->category, ItemCategory::KeyItem);
    EXPECT_EQ(relic->maxStack, 1);
    EXPECT_EQ(catalog.find("nameless"), nullptr);
}

TEST(ItemCatalogTest, UnparsableCatalogReportsFailure) {
    ItemCatalog catalog;
    EXPECT_FALSE(catalog.loadFromJson("[1, 2").has_value());
    EXPECT_FALSE(catalog.loadFromFile("no/such/items.json").has_value());
}

} // namespace
} // namespace Wildspirit
