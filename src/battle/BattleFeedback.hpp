#pragma once

#include <cstdint>
#include <deque>
#include <string>
#include <vector>
#include <glm/glm.hpp>

namespace Wildspirit {

struct DamageNumber {
    glm::vec2 position;
    int32_t amount = 0;
    bool isHeal = false;
    float timer = 0.0f;
    float duration = 1.0f;
};

struct ActionText {
    std::string text;
    glm::vec2 position;
    float timer = 0.0f;
    float duration = 1.5f;
};

/**
 * Floating numbers, action captions and the rolling battle log.
 * Written by combat callbacks, read only by rendering.
 */
class BattleFeedback {
public:
    static constexpr size_t MAX_LOG_ENTRIES = 5;
    static constexpr float FLOAT_SPEED = 30.0f;

    void addDamage(const glm::vec2& position, int32_t amount);
    void addHeal(const glm::vec2& position, int32_t amount);
    void addActionText(std::string text, const glm::vec2& position);
    void addLogEntry(std::string entry);

    /**
     * Age every entry; numbers drift upward and expire once timer reaches duration.
     */
    void update(float deltaTime);

    void clear();

    const std::vector<DamageNumber>& getDamageNumbers() const { return damageNumbers_; }
    const std::vector<ActionText>& getActionTexts() const { return actionTexts_; }
    const std::deque<std::string>& getLog() const { return log_; }

private:
    std::vector<DamageNumber> damageNumbers_;
    std::vector<ActionText> actionTexts_;
    std::deque<std::string> log_;
};

} // namespace Wildspirit
