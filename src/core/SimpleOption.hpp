#pragma once

#include <string>
#include <functional>
#include <optional>
#include <type_traits>
#include <cstdint>
#include <string_view>
#include <fmt/format.h>
#include <simdjson.h>
#include <spdlog/spdlog.h>
#include <magic_enum/magic_enum.hpp>

namespace Wildspirit {

/**
 * A single persisted setting: current value, default, optional range validator
 * and a change callback. Serialises itself to and from JSON.
 */
template<typename T>
class SimpleOption {
public:
    using ChangeCallback = std::function<void(const T&)>;
    using Validator = std::function<std::optional<T>(const T&)>;

    /**
     * @param key Settings file key (e.g. "masterVolume")
     * @param defaultValue Value used when nothing valid was loaded
     * @param validator Returns nullopt for values that must be rejected
     * @param changeCallback Invoked after the stored value actually changes
     */
    SimpleOption(
        std::string key,
        T defaultValue,
        Validator validator = nullptr,
        ChangeCallback changeCallback = nullptr
    ) : key_(std::move(key)),
        defaultValue_(defaultValue),
        value_(defaultValue),
        validator_(std::move(validator)),
        changeCallback_(std::move(changeCallback)) {}

    const T& getValue() const { return value_; }

    operator const T&() const { return value_; }

    SimpleOption& operator=(const T& value) {
        setValue(value);
        return *this;
    }

    // Rejected values fall back to the default
    void setValue(const T& value) {
        T validated = value;

        if (validator_) {
            auto result = validator_(value);
            if (!result.has_value()) {
                spdlog::error("Invalid option value for {}, using default", key_);
                validated = defaultValue_;
            } else {
                validated = *result;
            }
        }

        if (value_ != validated) {
            value_ = validated;
            if (changeCallback_) {
                changeCallback_(value_);
            }
        }
    }

    void setChangeCallback(ChangeCallback callback) { changeCallback_ = std::move(callback); }

    void reset() { setValue(defaultValue_); }

    const std::string& getKey() const { return key_; }

    /**
     * Current value as a JSON literal.
     */
    std::string toJson() const {
        if constexpr (std::is_same_v<T, bool>) {
            return value_ ? "true" : "false";
        } else if constexpr (std::is_arithmetic_v<T>) {
            return fmt::format("{}", value_);
        } else if constexpr (std::is_same_v<T, std::string>) {
            return quote(value_);
        } else if constexpr (std::is_enum_v<T>) {
            return quote(magic_enum::enum_name(value_));
        } else {
            static_assert(sizeof(T) == 0, "Unsupported type for SimpleOption");
        }
    }

    /**
     * Take the value from a parsed settings field. A field of the wrong JSON
     * type, or an enum name that doesn't exist, leaves the option untouched.
     */
    bool readJson(const simdjson::dom::element& element) {
        std::optional<T> parsed;

        if constexpr (std::is_same_v<T, bool>) {
            bool flag = false;
            if (!element.get(flag)) parsed = flag;
        } else if constexpr (std::is_integral_v<T>) {
            int64_t number = 0;
            if (!element.get(number)) parsed = static_cast<T>(number);
        } else if constexpr (std::is_floating_point_v<T>) {
            double number = 0.0;
            if (!element.get(number)) parsed = static_cast<T>(number);
        } else if constexpr (std::is_same_v<T, std::string>) {
            std::string_view text;
            if (!element.get(text)) parsed = std::string(text);
        } else if constexpr (std::is_enum_v<T>) {
            std::string_view text;
            if (!element.get(text)) parsed = magic_enum::enum_cast<T>(text);
        } else {
            static_assert(sizeof(T) == 0, "Unsupported type for SimpleOption");
        }

        if (!parsed) {
            spdlog::warn("Ignoring setting {}: unexpected value", key_);
            return false;
        }
        setValue(*parsed);
        return true;
    }

private:
    static std::string quote(std::string_view text) {
        std::string result = "\"";
        for (char c : text) {
            if (c == '"' || c == '\\') result += '\\';
            result += c;
        }
        result += '"';
        return result;
    }

    std::string key_;
    T defaultValue_;
    T value_;
    Validator validator_;
    ChangeCallback changeCallback_;
};

inline SimpleOption<bool> ofBoolean(
    std::string key,
    bool defaultValue,
    SimpleOption<bool>::ChangeCallback callback = nullptr
) {
    return SimpleOption<bool>(std::move(key), defaultValue, nullptr, std::move(callback));
}

/**
 * Integer option rejecting values outside [minValue, maxValue].
 */
inline SimpleOption<int32_t> ofInt(
    std::string key,
    int32_t defaultValue,
    int32_t minValue,
    int32_t maxValue,
    SimpleOption<int32_t>::ChangeCallback callback = nullptr
) {
    auto validator = [minValue, maxValue](int32_t val) -> std::optional<int32_t> {
        if (val >= minValue && val <= maxValue) return val;
        return std::nullopt;
    };
    return SimpleOption<int32_t>(std::move(key), defaultValue, validator, std::move(callback));
}

/**
 * Float option rejecting values outside [minValue, maxValue].
 */
inline SimpleOption<float> ofFloat(
    std::string key,
    float defaultValue,
    float minValue,
    float maxValue,
    SimpleOption<float>::ChangeCallback callback = nullptr
) {
    auto validator = [minValue, maxValue](float val) -> std::optional<float> {
        if (val >= minValue && val <= maxValue) return val;
        return std::nullopt;
    };
    return SimpleOption<float>(std::move(key), defaultValue, validator, std::move(callback));
}

inline SimpleOption<std::string> ofString(
    std::string key,
    std::string defaultValue,
    SimpleOption<std::string>::ChangeCallback callback = nullptr
) {
    return SimpleOption<std::string>(std::move(key), std::move(defaultValue), nullptr, std::move(callback));
}

template<typename E>
inline SimpleOption<E> ofEnum(
    std::string key,
    E defaultValue,
    typename SimpleOption<E>::ChangeCallback callback = nullptr
) {
    return SimpleOption<E>(std::move(key), defaultValue, nullptr, std::move(callback));
}

} // namespace Wildspirit

template<typename T>
struct fmt::formatter<Wildspirit::SimpleOption<T>> : fmt::formatter<T> {
    auto format(const Wildspirit::SimpleOption<T>& option, fmt::format_context& ctx) const {
        return fmt::formatter<T>::format(option.getValue(), ctx);
    }
};
