#pragma once

#include "../GameState.hpp"
#include "../../rpg/Shop.hpp"

namespace Wildspirit {

class ShopState : public GameState {
public:
    enum class PurchaseResult {
        Bought,
        NotEnoughGold,
        OutOfStock,
        InventoryFull,
        Unavailable
    };

    using GameState::GameState;

    void enter(const StateData& data) override;
    void handleInput(Input& input) override;
    void render(RenderSurface& surface) override;

    /**
     * Buy one of the item at index. Gold and stock only change on success.
     */
    PurchaseResult purchase(size_t index);

    const ShopRequest& getShop() const { return shop_; }
    size_t getSelectedIndex() const { return selected_; }

private:
    std::string itemName(const std::string& itemId) const;

    ShopRequest shop_;
    size_t selected_ = 0;
    std::string statusMessage_;
};

} // namespace Wildspirit
