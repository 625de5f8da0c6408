#pragma once

#include "SaveManager.hpp"
#include <filesystem>
#include <optional>
#include <string>

namespace Wildspirit {

/**
 * Save slots as one JSON file per slot (<directory>/<id>.json).
 */
class JsonSaveManager : public SaveManager {
public:
    static constexpr int32_t SAVE_VERSION = 1;

    explicit JsonSaveManager(std::filesystem::path directory = "saves");

    std::vector<SaveInfo> getAllSaves() const override;
    std::optional<SaveInfo> getLatestSave() const override;
    bool hasSaves() const override;

    std::optional<std::string> saveGame(const GameSession& session,
                                        const std::optional<std::string>& name = std::nullopt,
                                        const std::optional<std::string>& id = std::nullopt) override;

    bool loadGame(const std::string& id, GameSession& session) override;
    bool deleteSave(const std::string& id) override;

    const std::filesystem::path& getDirectory() const { return directory_; }

private:
    std::filesystem::path pathFor(const std::string& id) const;
    std::optional<std::string> readFile(const std::filesystem::path& path) const;
    std::optional<SaveInfo> readInfo(const std::filesystem::path& path) const;
    std::string generateId() const;

    std::filesystem::path directory_;
};

} // namespace Wildspirit
