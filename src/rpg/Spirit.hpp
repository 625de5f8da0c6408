#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace Wildspirit {

enum class Element {
    None,
    Fire,
    Water,
    Earth,
    Wind
};

enum class AbilityType {
    Physical,
    Magical,
    Supportive,
    Curse
};

enum class AbilityTarget {
    SingleEnemy,
    AllEnemies,
    SingleAlly,
    AllAllies
};

struct StatModifier {
    std::string stat;
    int32_t amount = 0;
    int32_t duration = 3;
};

struct Ability {
    std::string id;
    std::string name;
    AbilityType type = AbilityType::Physical;
    Element element = Element::None;
    int32_t power = 40;
    int32_t mpCost = 0;
    AbilityTarget target = AbilityTarget::SingleEnemy;
    std::optional<float> castTime;
    std::optional<StatModifier> buff;
    std::optional<StatModifier> debuff;

    bool targetsAllies() const {
        return target == AbilityTarget::SingleAlly || target == AbilityTarget::AllAllies;
    }
    bool targetsGroup() const {
        return target == AbilityTarget::AllEnemies || target == AbilityTarget::AllAllies;
    }
};

struct BaseStats {
    int32_t hp = 50;
    int32_t mp = 20;
    int32_t attack = 10;
    int32_t defense = 10;
    int32_t magicAttack = 10;
    int32_t magicDefense = 10;
    int32_t speed = 10;
};

struct ItemDrop {
    std::string itemId;
    int32_t quantity = 1;
};

/**
 * Species data shared by party members and wild encounters.
 */
struct SpiritTemplate {
    std::string id;
    std::string name = "Spirit";
    int32_t level = 1;
    Element type1 = Element::Fire;
    Element type2 = Element::None;
    BaseStats baseStats;
    std::vector<Ability> abilities;
    int32_t expYield = 0;
    int32_t goldYield = 0;
    std::vector<ItemDrop> drops;

    // Fixed starting ATB; random when unset
    std::optional<float> initialAtb;
};

/**
 * A spirit owned by the player: template plus progression and current vitals.
 */
struct PartySpirit {
    SpiritTemplate data;
    int32_t exp = 0;
    std::optional<int32_t> currentHp;
    std::optional<int32_t> currentMp;
};

/**
 * Level scaling applied to every base stat: 1 + (level - 1) * 0.1
 */
inline float statMultiplier(int32_t level) {
    return 1.0f + static_cast<float>(level - 1) * 0.1f;
}

inline int32_t scaledStat(int32_t base, int32_t level) {
    return static_cast<int32_t>(static_cast<float>(base) * statMultiplier(level));
}

/**
 * Basic attack, one elemental spell for the spirit's element, and a heal.
 */
std::vector<Ability> defaultAbilities(Element element);

} // namespace Wildspirit
