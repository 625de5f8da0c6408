#pragma once

#include "../battle/BattleTypes.hpp"
#include "../rpg/Shop.hpp"
#include "../rpg/Spirit.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace Wildspirit {

/**
 * Either a fixed list of lines or an NPC script to run.
 */
struct DialogueRequest {
    std::string speaker;
    std::vector<std::string> messages;
    std::optional<std::string> script;
};

struct LootRequest {
    std::string title = "Loot";
    std::vector<ItemDrop> items;
    int32_t gold = 0;

    // Chest or object to mark as emptied once taken
    std::optional<std::string> sourceId;
};

enum class SaveLoadMode {
    Save,
    Load
};

struct SaveLoadRequest {
    SaveLoadMode mode = SaveLoadMode::Load;
};

/**
 * Entry data handed to GameState::enter. Copied on every transition, so a
 * state can keep or modify its copy without affecting anyone else.
 */
struct StateData {
    // Set only when re-entered by popState
    bool isResumingFromPause = false;

    std::optional<DialogueRequest> dialogue;
    std::optional<ShopRequest> shop;
    std::optional<BattleRequest> battle;
    std::optional<LootRequest> loot;
    std::optional<SaveLoadRequest> saveLoad;

    std::unordered_map<std::string, std::string> params;

    StateData asResumed() const {
        StateData copy = *this;
        copy.isResumingFromPause = true;
        return copy;
    }

    std::optional<std::string> getParam(const std::string& key) const {
        auto it = params.find(key);
        if (it == params.end()) return std::nullopt;
        return it->second;
    }

    static StateData withDialogue(DialogueRequest request) {
        StateData data;
        data.dialogue = std::move(request);
        return data;
    }

    static StateData withShop(ShopRequest request) {
        StateData data;
        data.shop = std::move(request);
        return data;
    }

    static StateData withBattle(BattleRequest request) {
        StateData data;
        data.battle = std::move(request);
        return data;
    }

    static StateData withLoot(LootRequest request) {
        StateData data;
        data.loot = std::move(request);
        return data;
    }

    static StateData withSaveLoad(SaveLoadMode mode) {
        StateData data;
        data.saveLoad = SaveLoadRequest{mode};
        return data;
    }
};

} // namespace Wildspirit
