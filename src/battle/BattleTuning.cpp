#include "BattleTuning.hpp"
#include <fstream>
#include <iterator>
#include <simdjson.h>
#include <spdlog/spdlog.h>

namespace Wildspirit {

bool BattleTuning::load(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        spdlog::info("Battle tuning file not found, using defaults");
        return false;
    }
    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());
    return loadFromJson(content);
}

bool BattleTuning::loadFromJson(const std::string& json) {
    simdjson::dom::parser parser;
    simdjson::dom::element doc;
    auto error = parser.parse(json).get(doc);
    if (error) {
        spdlog::warn("Failed to parse battle tuning: {}", simdjson::error_message(error));
        return false;
    }

    auto parseField = [&](const char* name, float& field, float minValue) {
        double value = 0.0;
        if (doc[name].get(value)) {
            return;
        }
        if (value < minValue) {
            spdlog::warn("Battle tuning '{}' = {} is below {}, ignoring", name, value, minValue);
            return;
        }
        field = static_cast<float>(value);
    };

    parseField("atbMax", atbMax, 1.0f);
    parseField("atbSpeedMultiplier", atbSpeedMultiplier, 0.0f);
    parseField("maxInitialAtbFraction", maxInitialAtbFraction, 0.0f);
    parseField("transitionDuration", transitionDuration, 0.0f);
    parseField("actionDuration", actionDuration, 0.0f);
    parseField("resultsMinDisplay", resultsMinDisplay, 0.0f);
    parseField("fleeChance", fleeChance, 0.0f);
    parseField("sealBaseChance", sealBaseChance, 0.0f);
    parseField("sealMissingHpBonus", sealMissingHpBonus, 0.0f);
    parseField("enemyAbilityChance", enemyAbilityChance, 0.0f);
    parseField("interactionCooldown", interactionCooldown, 0.0f);

    if (maxInitialAtbFraction > 1.0f) maxInitialAtbFraction = 1.0f;

    spdlog::info("Battle tuning loaded (ATB max {}, flee {:.0f}%)", atbMax, fleeChance * 100.0f);
    return true;
}

} // namespace Wildspirit
