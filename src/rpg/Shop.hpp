#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace Wildspirit {

struct ShopItem {
    std::string itemId;
    int32_t price = 100;
    int32_t stock = UNLIMITED_STOCK;

    static constexpr int32_t UNLIMITED_STOCK = -1;

    bool isUnlimited() const { return stock < 0; }
    bool inStock() const { return stock != 0; }
};

/**
 * A shop opened by an NPC script: display name and what's on offer.
 */
struct ShopRequest {
    std::string shopName = "Shop";
    std::vector<ShopItem> items;
};

} // namespace Wildspirit
