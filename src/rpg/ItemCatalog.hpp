#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>

namespace Wildspirit {

enum class ItemCategory {
    Consumable,
    Material,
    KeyItem
};

struct ItemDefinition {
    std::string id;
    std::string name;
    std::string description;
    ItemCategory category = ItemCategory::Material;
    bool stackable = true;
    int32_t maxStack = 99;
    int32_t price = 0;
    int32_t healHp = 0;
    int32_t healMp = 0;
};

/**
 * Item type definitions, loaded from items.json.
 */
class ItemCatalog {
public:
    void add(ItemDefinition definition);
    const ItemDefinition* find(const std::string& id) const;
    size_t size() const { return items_.size(); }

    /**
     * Load definitions from a JSON object keyed by item id. Entries with
     * missing names or bad types are skipped with a warning.
     * @return number of definitions loaded, nullopt if the file couldn't be parsed
     */
    std::optional<size_t> loadFromFile(const std::string& filepath);
    std::optional<size_t> loadFromJson(const std::string& json);

    static ItemCatalog withDefaults();

private:
    std::unordered_map<std::string, ItemDefinition> items_;
};

} // namespace Wildspirit
