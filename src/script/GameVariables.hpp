#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <variant>

namespace Wildspirit {

/**
 * Value held by a script variable: unset, flag, number or text.
 */
using ScriptValue = std::variant<std::monostate, bool, double, std::string>;

bool isTruthy(const ScriptValue& value);
double toNumber(const ScriptValue& value);
// Saturates at the int32 range; values that aren't numbers read as 0
int32_t toInt32(const ScriptValue& value);
std::string toDisplayString(const ScriptValue& value);

/**
 * Named story flags and counters shared by every NPC script.
 * Persisted with the save game.
 */
class GameVariables {
public:
    void set(const std::string& name, ScriptValue value);
    ScriptValue get(const std::string& name, ScriptValue defaultValue = {}) const;
    bool has(const std::string& name) const { return variables_.contains(name); }
    void erase(const std::string& name);

    void increment(const std::string& name, double amount = 1.0);
    void decrement(const std::string& name, double amount = 1.0);
    void toggle(const std::string& name);

    const std::unordered_map<std::string, ScriptValue>& getAll() const { return variables_; }
    void loadFrom(std::unordered_map<std::string, ScriptValue> values);
    void clear();

private:
    std::unordered_map<std::string, ScriptValue> variables_;
};

} // namespace Wildspirit
