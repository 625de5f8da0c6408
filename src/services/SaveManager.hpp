#pragma once

#include <optional>
#include <string>
#include <vector>
#include <cstdint>

namespace Wildspirit {

struct GameSession;

/**
 * Metadata describing one save slot, as listed in the save/load screen.
 */
struct SaveInfo {
    std::string id;
    std::string name;
    std::string mapName;
    double playtimeSeconds = 0.0;
    int64_t timestamp = 0;
};

/**
 * Save-file persistence. The on-disk format belongs to the implementation.
 */
class SaveManager {
public:
    virtual ~SaveManager() = default;

    virtual std::vector<SaveInfo> getAllSaves() const = 0;
    virtual std::optional<SaveInfo> getLatestSave() const = 0;
    virtual bool hasSaves() const = 0;

    /**
     * Write the session. Passing an existing id overwrites that slot.
     * @return id of the written slot, nullopt on failure
     */
    virtual std::optional<std::string> saveGame(const GameSession& session,
                                                const std::optional<std::string>& name = std::nullopt,
                                                const std::optional<std::string>& id = std::nullopt) = 0;

    virtual bool loadGame(const std::string& id, GameSession& session) = 0;
    virtual bool deleteSave(const std::string& id) = 0;
};

} // namespace Wildspirit
