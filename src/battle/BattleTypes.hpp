#pragma once

#include "../rpg/Spirit.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace Wildspirit {

struct StatusEffect {
    enum class Kind {
        Buff,
        Debuff
    };

    Kind kind = Kind::Buff;
    std::string stat;
    int32_t amount = 0;
    int32_t turnsLeft = 3;
};

/**
 * A combatant for the duration of one battle. Owned by BattleSystem;
 * everything else holds plain pointers that stay valid until cleanup().
 */
struct BattleSpirit {
    std::string id;
    std::string name;
    int32_t level = 1;
    Element type1 = Element::Fire;
    Element type2 = Element::None;
    bool isPlayerOwned = false;

    int32_t maxHp = 1;
    int32_t currentHp = 1;
    int32_t maxMp = 0;
    int32_t currentMp = 0;
    int32_t attack = 10;
    int32_t defense = 10;
    int32_t magicAttack = 10;
    int32_t magicDefense = 10;
    int32_t speed = 10;

    // 0 <= atb <= ATB_MAX; isReady only while atb is full
    float atb = 0.0f;
    bool isReady = false;
    bool isAlive = true;

    bool isCasting = false;
    float castTimer = 0.0f;
    float castDuration = 0.0f;
    std::optional<Ability> pendingAbility;
    BattleSpirit* pendingTarget = nullptr;

    std::vector<StatusEffect> statusEffects;
    std::vector<Ability> abilities;

    int32_t expYield = 0;
    int32_t goldYield = 0;

    // Species data, handed to the party box when sealed
    SpiritTemplate source;

    float hpFraction() const {
        return maxHp > 0 ? static_cast<float>(currentHp) / static_cast<float>(maxHp) : 0.0f;
    }
};

enum class ActionType {
    Attack,
    Ability,
    Seal,
    Flee
};

/**
 * A fully specified command waiting to be executed. Group abilities resolve
 * their targets when they run, so `target` only names the focus.
 */
struct PendingAction {
    ActionType type = ActionType::Attack;
    BattleSpirit* user = nullptr;
    std::optional<Ability> ability;
    BattleSpirit* target = nullptr;
};

enum class BattleResult {
    Victory,
    Defeat,
    Fled
};

struct BattleRewards {
    int32_t exp = 0;
    int32_t gold = 0;
    std::vector<ItemDrop> items;
};

/**
 * Everything needed to start an encounter.
 */
struct BattleRequest {
    std::vector<SpiritTemplate> enemies;
    bool isBoss = false;
    std::optional<std::string> bgm;

    // World object that started the fight, removed on victory
    std::optional<std::string> triggerId;
};

} // namespace Wildspirit
