#include "GameVariables.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace Wildspirit {

bool isTruthy(const ScriptValue& value) {
    return std::visit([](const auto& v) -> bool {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return false;
        } else if constexpr (std::is_same_v<T, bool>) {
            return v;
        } else if constexpr (std::is_same_v<T, double>) {
            return v != 0.0 && !std::isnan(v);
        } else {
            return !v.empty();
        }
    }, value);
}

double toNumber(const ScriptValue& value) {
    return std::visit([](const auto& v) -> double {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return 0.0;
        } else if constexpr (std::is_same_v<T, bool>) {
            return v ? 1.0 : 0.0;
        } else if constexpr (std::is_same_v<T, double>) {
            return v;
        } else {
            char* end = nullptr;
            double parsed = std::strtod(v.c_str(), &end);
            return (end != v.c_str() && *end == '\0') ? parsed : std::nan("");
        }
    }, value);
}

int32_t toInt32(const ScriptValue& value) {
    double number = toNumber(value);
    if (std::isnan(number)) return 0;
    number = std::clamp(number,
                        static_cast<double>(std::numeric_limits<int32_t>::min()),
                        static_cast<double>(std::numeric_limits<int32_t>::max()));
    return static_cast<int32_t>(number);
}

std::string toDisplayString(const ScriptValue& value) {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            return v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, double>) {
            return fmt::format("{}", v);
        } else {
            return v;
        }
    }, value);
}

void GameVariables::set(const std::string& name, ScriptValue value) {
    spdlog::debug("Variable '{}' = {}", name, toDisplayString(value));
    variables_[name] = std::move(value);
}

ScriptValue GameVariables::get(const std::string& name, ScriptValue defaultValue) const {
    auto it = variables_.find(name);
    return it != variables_.end() ? it->second : defaultValue;
}

void GameVariables::erase(const std::string& name) {
    variables_.erase(name);
}

void GameVariables::increment(const std::string& name, double amount) {
    set(name, toNumber(get(name, 0.0)) + amount);
}

void GameVariables::decrement(const std::string& name, double amount) {
    set(name, toNumber(get(name, 0.0)) - amount);
}

void GameVariables::toggle(const std::string& name) {
    set(name, !isTruthy(get(name, false)));
}

void GameVariables::loadFrom(std::unordered_map<std::string, ScriptValue> values) {
    variables_ = std::move(values);
    spdlog::info("Loaded {} game variables", variables_.size());
}

void GameVariables::clear() {
    variables_.clear();
}

} // namespace Wildspirit
