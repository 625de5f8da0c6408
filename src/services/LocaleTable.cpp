#include "Localization.hpp"
#include <fstream>
#include <iterator>
#include <simdjson.h>
#include <spdlog/spdlog.h>

namespace Wildspirit {

namespace {

void flatten(const simdjson::dom::element& element, const std::string& prefix,
             std::unordered_map<std::string, std::string>& out) {
    switch (element.type()) {
        case simdjson::dom::element_type::OBJECT: {
            simdjson::dom::object obj;
            if (element.get(obj)) return;
            for (auto [key, value] : obj) {
                std::string childKey = prefix.empty() ? std::string(key) : prefix + "." + std::string(key);
                flatten(value, childKey, out);
            }
            break;
        }
        case simdjson::dom::element_type::STRING: {
            std::string_view text;
            if (!element.get(text)) {
                out[prefix] = std::string(text);
            }
            break;
        }
        default:
            // Numbers, arrays and booleans are not display strings
            break;
    }
}

} // namespace

std::string substituteParams(std::string text, const TranslationParams& params) {
    for (const auto& [name, value] : params) {
        const std::string placeholder = "{" + name + "}";
        size_t pos = 0;
        while ((pos = text.find(placeholder, pos)) != std::string::npos) {
            text.replace(pos, placeholder.size(), value);
            pos += value.size();
        }
    }
    return text;
}

LocaleTable::LocaleTable(std::string fallbackLocale)
    : currentLocale_(fallbackLocale)
    , fallbackLocale_(std::move(fallbackLocale)) {
}

bool LocaleTable::loadFile(const std::string& locale, const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        spdlog::warn("Locale file not found: {}", filepath);
        return false;
    }
    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());
    return loadJson(locale, content);
}

bool LocaleTable::loadJson(const std::string& locale, const std::string& json) {
    simdjson::dom::parser parser;
    simdjson::dom::element doc;
    auto error = parser.parse(json).get(doc);
    if (error) {
        spdlog::warn("Failed to parse locale '{}': {}", locale, simdjson::error_message(error));
        return false;
    }

    std::unordered_map<std::string, std::string> table;
    flatten(doc, "", table);
    spdlog::info("Loaded locale '{}' ({} strings)", locale, table.size());
    strings_[locale] = std::move(table);
    return true;
}

bool LocaleTable::setLocale(const std::string& locale) {
    if (!hasLocale(locale)) {
        spdlog::warn("Locale '{}' is not loaded, keeping '{}'", locale, currentLocale_);
        return false;
    }
    currentLocale_ = locale;
    missingKeys_.clear();
    return true;
}

const std::string* LocaleTable::find(const std::string& locale, const std::string& key) const {
    auto localeIt = strings_.find(locale);
    if (localeIt == strings_.end()) return nullptr;
    auto it = localeIt->second.find(key);
    return it != localeIt->second.end() ? &it->second : nullptr;
}

std::string LocaleTable::t(std::string_view key, const TranslationParams& params) const {
    std::string keyStr(key);
    const std::string* value = find(currentLocale_, keyStr);
    if (!value && currentLocale_ != fallbackLocale_) {
        value = find(fallbackLocale_, keyStr);
    }

    if (!value) {
        // Warn once per key
        if (missingKeys_.insert(keyStr).second) {
            spdlog::warn("Missing translation: {}", keyStr);
        }
        return keyStr;
    }

    if (params.empty()) {
        return *value;
    }
    return substituteParams(*value, params);
}

} // namespace Wildspirit
