#include "BattleFeedback.hpp"
#include <algorithm>

namespace Wildspirit {

void BattleFeedback::addDamage(const glm::vec2& position, int32_t amount) {
    damageNumbers_.push_back({position, amount, false});
}

void BattleFeedback::addHeal(const glm::vec2& position, int32_t amount) {
    damageNumbers_.push_back({position, amount, true});
}

void BattleFeedback::addActionText(std::string text, const glm::vec2& position) {
    actionTexts_.push_back({std::move(text), position});
}

void BattleFeedback::addLogEntry(std::string entry) {
    log_.push_back(std::move(entry));
    while (log_.size() > MAX_LOG_ENTRIES) {
        log_.pop_front();
    }
}

void BattleFeedback::update(float deltaTime) {
    for (auto& number : damageNumbers_) {
        number.timer += deltaTime;
        number.position.y -= FLOAT_SPEED * deltaTime;
    }
    for (auto& text : actionTexts_) {
        text.timer += deltaTime;
    }

    std::erase_if(damageNumbers_, [](const DamageNumber& n) { return !(n.timer < n.duration); });
    std::erase_if(actionTexts_, [](const ActionText& t) { return !(t.timer < t.duration); });
}

void BattleFeedback::clear() {
    damageNumbers_.clear();
    actionTexts_.clear();
    log_.clear();
}

} // namespace Wildspirit
