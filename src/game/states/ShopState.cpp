#include "ShopState.hpp"
#include "../GameStateManager.hpp"
#include "../GameSession.hpp"
#include "../../core/InputActions.hpp"
#include "../../core/RenderSurface.hpp"
#include "../../ui/MenuRenderer.hpp"
#include "../../ui/MenuSelection.hpp"
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace Wildspirit {

void ShopState::enter(const StateData& data) {
    if (data.isResumingFromPause) return;

    shop_ = data.shop.value_or(ShopRequest{});
    selected_ = 0;
    statusMessage_.clear();
    spdlog::info("Opened shop '{}' with {} items", shop_.shopName, shop_.items.size());
}

void ShopState::handleInput(Input& input) {
    if (input.isJustPressed(GameAction::Cancel)) {
        manager_.popState();
        return;
    }

    if (input.isJustPressed(GameAction::Up)) {
        selected_ = MenuSelection::wrapPrevious(selected_, shop_.items.size());
        playEffect("cursor");
    } else if (input.isJustPressed(GameAction::Down)) {
        selected_ = MenuSelection::wrapNext(selected_, shop_.items.size());
        playEffect("cursor");
    } else if (input.isJustPressed(GameAction::Confirm)) {
        PurchaseResult result = purchase(selected_);
        switch (result) {
            case PurchaseResult::Bought:
                statusMessage_ = tr("shop.bought", {{"item", itemName(shop_.items[selected_].itemId)}});
                playEffect("purchase");
                break;
            case PurchaseResult::NotEnoughGold:
                statusMessage_ = tr("shop.notEnoughGold");
                playEffect("error");
                break;
            case PurchaseResult::OutOfStock:
                statusMessage_ = tr("shop.outOfStock");
                playEffect("error");
                break;
            case PurchaseResult::InventoryFull:
                statusMessage_ = tr("shop.inventoryFull");
                playEffect("error");
                break;
            case PurchaseResult::Unavailable:
                playEffect("error");
                break;
        }
    }
}

ShopState::PurchaseResult ShopState::purchase(size_t index) {
    if (index >= shop_.items.size() || !services_.session) {
        return PurchaseResult::Unavailable;
    }

    ShopItem& item = shop_.items[index];
    Inventory& inventory = services_.session->inventory;

    if (!item.inStock()) return PurchaseResult::OutOfStock;
    if (inventory.getGold() < item.price) return PurchaseResult::NotEnoughGold;
    if (!inventory.addItem(item.itemId, 1)) return PurchaseResult::InventoryFull;

    inventory.spendGold(item.price);
    if (!item.isUnlimited()) {
        --item.stock;
    }

    spdlog::info("Bought {} for {}G ({}G left)", item.itemId, item.price, inventory.getGold());
    return PurchaseResult::Bought;
}

std::string ShopState::itemName(const std::string& itemId) const {
    if (services_.catalog) {
        if (const ItemDefinition* definition = services_.catalog->find(itemId)) {
            return definition->name;
        }
    }
    return itemId;
}

void ShopState::render(RenderSurface& surface) {
    MenuRenderer::drawOverlay(surface);
    MenuRenderer::drawTitle(surface, shop_.shopName);

    if (shop_.items.empty()) {
        MenuRenderer::drawHint(surface, tr("shop.empty"), 0.5f);
    } else {
        int32_t gold = services_.session ? services_.session->inventory.getGold() : 0;
        std::vector<MenuEntry> entries;
        for (const auto& item : shop_.items) {
            std::string value = item.isUnlimited() ? fmt::format("{}G", item.price)
                                                   : fmt::format("{}G  ({})", item.price, item.stock);
            entries.push_back({itemName(item.itemId), item.inStock() && gold >= item.price, value});
        }
        MenuRenderer::drawMenuOptions(surface, entries, selected_, 0.25f, 0.07f);
    }

    if (services_.session) {
        surface.drawText(tr("hud.gold", {{"gold", std::to_string(services_.session->inventory.getGold())}}),
                         glm::vec2(20.0f, 20.0f), 18.0f, Colors::Yellow);
    }
    if (!statusMessage_.empty()) {
        MenuRenderer::drawHint(surface, statusMessage_, 0.88f);
    }
}

} // namespace Wildspirit
