#include "ItemCatalog.hpp"
#include <fstream>
#include <iterator>
#include <simdjson.h>
#include <spdlog/spdlog.h>
#include <magic_enum/magic_enum.hpp>

namespace Wildspirit {

void ItemCatalog::add(ItemDefinition definition) {
    std::string id = definition.id;
    items_[id] = std::move(definition);
}

const ItemDefinition* ItemCatalog::find(const std::string& id) const {
    auto it = items_.find(id);
    return it != items_.end() ? &it->second : nullptr;
}

std::optional<size_t> ItemCatalog::loadFromFile(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        spdlog::warn("Item catalog not found: {}", filepath);
        return std::nullopt;
    }
    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());
    return loadFromJson(content);
}

std::optional<size_t> ItemCatalog::loadFromJson(const std::string& json) {
    simdjson::dom::parser parser;
    simdjson::dom::object root;
    auto error = parser.parse(json).get(root);
    if (error) {
        spdlog::warn("Failed to parse item catalog: {}", simdjson::error_message(error));
        return std::nullopt;
    }

    size_t loaded = 0;
    for (auto [key, value] : root) {
        simdjson::dom::object entry;
        if (value.get(entry)) {
            spdlog::warn("Item '{}' is not an object, skipping", std::string(key));
            continue;
        }

        ItemDefinition def;
        def.id = std::string(key);

        std::string_view name;
        if (entry["name"].get(name)) {
            spdlog::warn("Item '{}' has no name, skipping", def.id);
            continue;
        }
        def.name = std::string(name);

        std::string_view text;
        if (!entry["description"].get(text)) def.description = std::string(text);
        if (!entry["category"].get(text)) {
            def.category = magic_enum::enum_cast<ItemCategory>(text, magic_enum::case_insensitive)
                               .value_or(ItemCategory::Material);
        }

        bool flag = false;
        if (!entry["stackable"].get(flag)) def.stackable = flag;

        int64_t number = 0;
        if (!entry["maxStack"].get(number)) def.maxStack = static_cast<int32_t>(number);
        if (!entry["price"].get(number)) def.price = static_cast<int32_t>(number);
        if (!entry["healHp"].get(number)) def.healHp = static_cast<int32_t>(number);
        if (!entry["healMp"].get(number)) def.healMp = static_cast<int32_t>(number);

        if (!def.stackable) def.maxStack = 1;
        add(std::move(def));
        ++loaded;
    }

    spdlog::info("Loaded {} item definitions", loaded);
    return loaded;
}

ItemCatalog ItemCatalog::withDefaults() {
    ItemCatalog catalog;
    catalog.add({"health_potion", "Health Potion", "Restores 50 HP", ItemCategory::Consumable, true, 10, 25, 50, 0});
    catalog.add({"ether", "Ether", "Restores 20 MP", ItemCategory::Consumable, true, 10, 40, 0, 20});
    catalog.add({"spirit_shard", "Spirit Shard", "A glowing fragment", ItemCategory::Material, true, 99, 5, 0, 0});
    catalog.add({"old_key", "Old Key", "Opens something, somewhere", ItemCategory::KeyItem, false, 1, 0, 0, 0});
    return catalog;
}

} // namespace Wildspirit
