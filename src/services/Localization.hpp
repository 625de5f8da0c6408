#pragma once

#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace Wildspirit {

using TranslationParams = std::vector<std::pair<std::string, std::string>>;

/**
 * Key -> display string lookup with {name} parameter substitution.
 */
class Localization {
public:
    virtual ~Localization() = default;

    virtual std::string t(std::string_view key, const TranslationParams& params = {}) const = 0;
};

/**
 * Replace every {name} placeholder in text with its value.
 */
std::string substituteParams(std::string text, const TranslationParams& params);

/**
 * Localization backed by locale JSON files (locales/<code>.json).
 * Nested objects are flattened to dotted keys ("menu.newGame").
 * Lookups fall back to the fallback locale, then to the key itself.
 */
class LocaleTable : public Localization {
public:
    explicit LocaleTable(std::string fallbackLocale = "en");

    /**
     * Parse a locale file and register its strings under the given code.
     * Returns false (and keeps existing strings) if the file can't be read.
     */
    bool loadFile(const std::string& locale, const std::string& filepath);

    /**
     * Parse locale strings from a JSON document already in memory.
     */
    bool loadJson(const std::string& locale, const std::string& json);

    bool setLocale(const std::string& locale);
    const std::string& getLocale() const { return currentLocale_; }
    bool hasLocale(const std::string& locale) const { return strings_.contains(locale); }

    std::string t(std::string_view key, const TranslationParams& params = {}) const override;

private:
    const std::string* find(const std::string& locale, const std::string& key) const;

    std::string currentLocale_;
    std::string fallbackLocale_;
    std::unordered_map<std::string, std::unordered_map<std::string, std::string>> strings_;
    mutable std::unordered_set<std::string> missingKeys_;
};

} // namespace Wildspirit
