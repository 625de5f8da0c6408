#pragma once

#include "ItemCatalog.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace Wildspirit {

struct PartySpirit;

struct InventorySlot {
    std::string itemId;
    int32_t quantity = 0;
};

/**
 * Slot-based item storage plus the player's gold.
 * Stackable items fill existing stacks before opening new slots.
 */
class Inventory {
public:
    static constexpr size_t MAX_SLOTS = 30;

    explicit Inventory(const ItemCatalog* catalog) : catalog_(catalog) {}

    /**
     * @return false if the item is unknown or didn't fully fit (what fit is kept)
     */
    bool addItem(const std::string& itemId, int32_t quantity = 1);
    bool removeItem(const std::string& itemId, int32_t quantity = 1);
    int32_t getItemQuantity(const std::string& itemId) const;
    bool hasItem(const std::string& itemId, int32_t quantity = 1) const;

    /**
     * Apply a consumable in slotIndex to target. Removes one on success.
     */
    bool useItem(size_t slotIndex, PartySpirit& target);

    const InventorySlot* getSlot(size_t index) const;
    const std::vector<InventorySlot>& getSlots() const { return slots_; }
    const ItemCatalog* getCatalog() const { return catalog_; }

    int32_t getGold() const { return gold_; }
    void addGold(int32_t amount);
    bool spendGold(int32_t amount);

    void clear();

private:
    const ItemCatalog* catalog_;
    std::vector<InventorySlot> slots_;
    int32_t gold_ = 0;
};

} // namespace Wildspirit
