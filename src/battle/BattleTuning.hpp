#pragma once

#include <string>

namespace Wildspirit {

/**
 * Combat constants. Defaults match the shipped balance; battle.json may
 * override any of them.
 */
struct BattleTuning {
    float atbMax = 100.0f;
    float atbSpeedMultiplier = 0.5f;
    float maxInitialAtbFraction = 0.7f;
    float transitionDuration = 1.0f;
    float actionDuration = 0.5f;
    float resultsMinDisplay = 1.0f;
    float fleeChance = 0.75f;
    float sealBaseChance = 0.3f;
    float sealMissingHpBonus = 0.5f;
    float enemyAbilityChance = 0.3f;
    float interactionCooldown = 2.0f;

    /**
     * Read overrides from a JSON file. Unknown keys are ignored, missing
     * keys keep their defaults.
     * @return false if the file is missing or malformed (defaults are kept)
     */
    bool load(const std::string& filepath);
    bool loadFromJson(const std::string& json);
};

} // namespace Wildspirit
