#include <gtest/gtest.h>

#include "client/GameClient.hpp"
#include <filesystem>
#include <sstream>

namespace Wildspirit {
namespace {

class GameClientTest : public ::testing::Test {
protected:
    GameClientTest()
        : workDir(std::filesystem::temp_directory_path() /
                  ("wildspirit_client_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()))) {
        std::filesystem::remove_all(workDir);
        std::filesystem::create_directories(workDir);

        options.assetsPath = WILDSPIRIT_ASSET_DIR;
        options.settingsPath = (workDir / "settings.json").string();
        options.savesPath = workDir / "saves";
        options.maxRunSeconds = 60.0f;
    }

    ~GameClientTest() override {
        std::error_code ignored;
        std::filesystem::remove_all(workDir, ignored);
    }

    std::filesystem::path workDir;
    ClientOptions options;
};

TEST_F(GameClientTest, BootsIntoMainMenu) {
    GameClient client(options);
    client.init();
    EXPECT_TRUE(client.getStateManager().isInState(StateId::Loading));

    EXPECT_TRUE(client.executeCommand("wait 1"));
    EXPECT_TRUE(client.getStateManager().isInState(StateId::MainMenu));
    EXPECT_FALSE(client.getSurface().getFrameText().empty());
}

TEST_F(GameClientTest, NewGameThenTalkToElder) {
    GameClient client(options);
    client.init();

    std::istringstream commands("wait 1\n# start a new game\nconfirm\ninteract\n");
    client.run(commands);

    EXPECT_TRUE(client.getSession().started);
    EXPECT_EQ(client.getSession().inventory.getGold(), 100);
    EXPECT_TRUE(client.getStateManager().isInState(StateId::Dialogue));
    EXPECT_TRUE(client.getStateManager().isStateInStack(StateId::Playing));
}

TEST_F(GameClientTest, SavingFromPauseMenuWritesSlot) {
    GameClient client(options);
    client.init();

    std::istringstream commands("wait 1\nconfirm\nmenu\ndown\ndown\nconfirm\nconfirm\n");
    client.run(commands);
    client.shutdown();

    EXPECT_TRUE(client.getStateManager().isInState(StateId::SaveLoad));
    JsonSaveManager saves(options.savesPath);
    EXPECT_EQ(saves.getAllSaves().size(), 1u);
    EXPECT_TRUE(std::filesystem::exists(options.settingsPath));
}

TEST_F(GameClientTest, QuitAndUnknownCommands) {
    GameClient client(options);
    client.init();

    EXPECT_TRUE(client.executeCommand(""));
    EXPECT_TRUE(client.executeCommand("dance"));
    EXPECT_TRUE(client.executeCommand("wait"));
    EXPECT_FALSE(client.executeCommand("quit"));
}

TEST_F(GameClientTest, ExitFromMainMenuStopsTheRun) {
    GameClient client(options);
    client.init();

    // Continue is disabled without saves and gets skipped
    std::istringstream commands("wait 1\ndown\ndown\ndown\nconfirm\nwait 5\n");
    client.run(commands);

    EXPECT_TRUE(client.getStateManager().shouldQuit());
    EXPECT_LT(client.getElapsedSeconds(), 2.0);
}

} // namespace
} // namespace Wildspirit
