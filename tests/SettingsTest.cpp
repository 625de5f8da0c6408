#include <gtest/gtest.h>

#include "core/InputActions.hpp"
#include "core/Settings.hpp"
#include <filesystem>
#include <fstream>

namespace Wildspirit {
namespace {

class SettingsTest : public ::testing::Test {
protected:
    void SetUp() override {
        path = std::filesystem::temp_directory_path() /
               ("wildspirit_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()) + ".json");
        std::filesystem::remove(path);
    }

    void TearDown() override {
        std::error_code ignored;
        std::filesystem::remove(path, ignored);
    }

    void writeFile(const std::string& content) {
        std::ofstream file(path);
        file << content;
    }

    std::filesystem::path path;
};

TEST_F(SettingsTest, DefaultsMatchFreshInstall) {
    Settings settings;
    EXPECT_EQ(settings.version.getValue(), 1);
    EXPECT_FLOAT_EQ(settings.masterVolume.getValue(), 0.8f);
    EXPECT_FALSE(settings.muted.getValue());
    EXPECT_EQ(settings.textSpeed.getValue(), TextSpeed::Medium);
    EXPECT_EQ(settings.language.getValue(), "en");
    EXPECT_EQ(settings.keybinds.at("input.confirm"), "key.keyboard.enter");
    EXPECT_EQ(settings.keybinds.size(), magic_enum::enum_count<GameAction>());
}

TEST_F(SettingsTest, SaveThenLoadKeepsChanges) {
    Settings settings;
    settings.masterVolume = 0.25f;
    settings.muted = true;
    settings.textSpeed = TextSpeed::Slow;
    settings.language = "de";
    settings.keybinds["input.interact"] = "key.keyboard.f";
    ASSERT_TRUE(settings.save(path.string()));

    Settings loaded;
    ASSERT_TRUE(loaded.load(path.string()));
    EXPECT_FLOAT_EQ(loaded.masterVolume.getValue(), 0.25f);
    EXPECT_TRUE(loaded.muted.getValue());
    EXPECT_EQ(loaded.textSpeed.getValue(), TextSpeed::Slow);
    EXPECT_EQ(loaded.language.getValue(), "de");
    EXPECT_EQ(loaded.keybinds.at("input.interact"), "key.keyboard.f");
}

TEST_F(SettingsTest, MissingFileKeepsDefaults) {
    Settings settings;
    EXPECT_FALSE(settings.load(path.string()));
    EXPECT_FLOAT_EQ(settings.bgmVolume.getValue(), 0.7f);
}

TEST_F(SettingsTest, MalformedFileKeepsDefaults) {
    writeFile("{ \"masterVolume\": ");
    Settings settings;
    EXPECT_FALSE(settings.load(path.string()));
    EXPECT_FLOAT_EQ(settings.masterVolume.getValue(), 0.8f);
}

TEST_F(SettingsTest, OutOfRangeAndMistypedValuesFallBack) {
    writeFile(R"({
        "masterVolume": 3.5,
        "muted": "yes",
        "textSpeed": "Ludicrous",
        "battleSpeed": 1.5
    })");

    Settings settings;
    ASSERT_TRUE(settings.load(path.string()));
    EXPECT_FLOAT_EQ(settings.masterVolume.getValue(), 0.8f);
    EXPECT_FALSE(settings.muted.getValue());
    EXPECT_EQ(settings.textSpeed.getValue(), TextSpeed::Medium);
    EXPECT_FLOAT_EQ(settings.battleSpeed.getValue(), 1.5f);
}

TEST_F(SettingsTest, PartialKeybindsMergeWithDefaults) {
    writeFile(R"({ "keybinds": { "input.menu": "key.keyboard.tab" } })");

    Settings settings;
    ASSERT_TRUE(settings.load(path.string()));
    EXPECT_EQ(settings.keybinds.at("input.menu"), "key.keyboard.tab");
    EXPECT_EQ(settings.keybinds.at("input.up"), "key.keyboard.up");
}

TEST_F(SettingsTest, ChangeCallbackFiresOnlyOnChange) {
    Settings settings;
    int calls = 0;
    settings.sfxVolume.setChangeCallback([&](const float&) { ++calls; });

    settings.sfxVolume = 0.8f;
    EXPECT_EQ(calls, 0);
    settings.sfxVolume = 0.5f;
    EXPECT_EQ(calls, 1);
}

TEST_F(SettingsTest, ResetRestoresDefaults) {
    Settings settings;
    settings.muted = true;
    settings.keybinds["input.up"] = "key.keyboard.w";
    settings.resetToDefaults();
    EXPECT_FALSE(settings.muted.getValue());
    EXPECT_EQ(settings.keybinds.at("input.up"), "key.keyboard.up");
}

} // namespace
} // namespace Wildspirit
