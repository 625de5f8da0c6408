#include "Inventory.hpp"
#include "Party.hpp"
#include <algorithm>
#include <cstdint>
#include <limits>
#include <spdlog/spdlog.h>

namespace Wildspirit {

bool Inventory::addItem(const std::string& itemId, int32_t quantity) {
    const ItemDefinition* def = catalog_ ? catalog_->find(itemId) : nullptr;
    if (!def) {
        spdlog::warn("Cannot add unknown item: {}", itemId);
        return false;
    }

    int32_t remaining = quantity;
    if (def->stackable) {
        for (auto& slot : slots_) {
            if (slot.itemId == itemId && slot.quantity < def->maxStack) {
                int32_t canAdd = std::min(remaining, def->maxStack - slot.quantity);
                slot.quantity += canAdd;
                remaining -= canAdd;
                if (remaining <= 0) return true;
            }
        }
    }

    while (remaining > 0 && slots_.size() < MAX_SLOTS) {
        int32_t stackSize = std::min(remaining, std::max(1, def->maxStack));
        slots_.push_back({itemId, stackSize});
        remaining -= stackSize;
    }

    if (remaining > 0) {
        spdlog::warn("Inventory full, dropped {} x{}", itemId, remaining);
    }
    return remaining <= 0;
}

bool Inventory::removeItem(const std::string& itemId, int32_t quantity) {
    if (!hasItem(itemId, quantity)) {
        return false;
    }

    int32_t remaining = quantity;
    for (size_t i = slots_.size(); i-- > 0 && remaining > 0;) {
        auto& slot = slots_[i];
        if (slot.itemId != itemId) continue;
        int32_t taken = std::min(remaining, slot.quantity);
        slot.quantity -= taken;
        remaining -= taken;
        if (slot.quantity <= 0) {
            slots_.erase(slots_.begin() + static_cast<std::ptrdiff_t>(i));
        }
    }
    return true;
}

int32_t Inventory::getItemQuantity(const std::string& itemId) const {
    int32_t total = 0;
    for (const auto& slot : slots_) {
        if (slot.itemId == itemId) total += slot.quantity;
    }
    return total;
}

bool Inventory::hasItem(const std::string& itemId, int32_t quantity) const {
    return getItemQuantity(itemId) >= quantity;
}

bool Inventory::useItem(size_t slotIndex, PartySpirit& target) {
    if (slotIndex >= slots_.size()) return false;

    const std::string itemId = slots_[slotIndex].itemId;
    const ItemDefinition* def = catalog_ ? catalog_->find(itemId) : nullptr;
    if (!def || def->category != ItemCategory::Consumable) {
        return false;
    }

    const int32_t maxHp = Party::maxHp(target);
    const int32_t maxMp = Party::maxMp(target);
    const int32_t hp = target.currentHp.value_or(maxHp);
    const int32_t mp = target.currentMp.value_or(maxMp);
    if ((def->healHp == 0 || hp >= maxHp) && (def->healMp == 0 || mp >= maxMp)) {
        // Nothing to restore
        return false;
    }

    target.currentHp = std::min(maxHp, hp + def->healHp);
    target.currentMp = std::min(maxMp, mp + def->healMp);

    slots_[slotIndex].quantity--;
    if (slots_[slotIndex].quantity <= 0) {
        slots_.erase(slots_.begin() + static_cast<std::ptrdiff_t>(slotIndex));
    }
    spdlog::info("Used {} on {}", def->name, target.data.name);
    return true;
}

const InventorySlot* Inventory::getSlot(size_t index) const {
    return index < slots_.size() ? &slots_[index] : nullptr;
}

void Inventory::addGold(int32_t amount) {
    if (amount <= 0) return;
    // Saturate instead of wrapping
    gold_ = static_cast<int32_t>(std::min<int64_t>(int64_t{gold_} + amount, std::numeric_limits<int32_t>::max()));
}

bool Inventory::spendGold(int32_t amount) {
    if (amount < 0 || gold_ < amount) return false;
    gold_ -= amount;
    return true;
}

void Inventory::clear() {
    slots_.clear();
    gold_ = 0;
}

} // namespace Wildspirit
