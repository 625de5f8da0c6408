#include "LootWindowState.hpp"
#include "../GameStateManager.hpp"
#include "../GameSession.hpp"
#include "../WorldSimulation.hpp"
#include "../../core/InputActions.hpp"
#include "../../core/RenderSurface.hpp"
#include "../../ui/MenuRenderer.hpp"
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace Wildspirit {

void LootWindowState::enter(const StateData& data) {
    if (data.isResumingFromPause) return;
    loot_ = data.loot.value_or(LootRequest{});
}

void LootWindowState::handleInput(Input& input) {
    if (input.isJustPressed(GameAction::Confirm)) {
        takeAll();
        manager_.popState();
    } else if (input.isJustPressed(GameAction::Cancel)) {
        manager_.popState();
    }
}

void LootWindowState::takeAll() {
    if (!services_.session) {
        playEffect("error");
        return;
    }

    Inventory& inventory = services_.session->inventory;
    std::vector<ItemDrop> leftover;
    for (const auto& drop : loot_.items) {
        int32_t before = inventory.getItemQuantity(drop.itemId);
        if (!inventory.addItem(drop.itemId, drop.quantity)) {
            int32_t taken = inventory.getItemQuantity(drop.itemId) - before;
            spdlog::warn("Only {} of {} {} fit in the inventory", taken, drop.quantity, drop.itemId);
            if (drop.quantity > taken) {
                leftover.push_back({drop.itemId, drop.quantity - taken});
            }
        }
    }

    if (loot_.gold > 0) {
        inventory.addGold(loot_.gold);
    }

    if (leftover.empty() && loot_.sourceId) {
        services_.session->variables.set("looted." + *loot_.sourceId, true);
        if (services_.world) {
            services_.world->removeObject(*loot_.sourceId);
        }
    }

    spdlog::info("Took loot '{}' ({} items, {}G)", loot_.title, loot_.items.size() - leftover.size(), loot_.gold);
    loot_.items = std::move(leftover);
    loot_.gold = 0;
    playEffect("pickup");
}

void LootWindowState::render(RenderSurface& surface) {
    MenuRenderer::drawOverlay(surface);
    MenuRenderer::drawTitle(surface, loot_.title, 0.2f);

    const ItemCatalog* catalog = services_.catalog;
    std::vector<MenuEntry> entries;
    for (const auto& drop : loot_.items) {
        const ItemDefinition* definition = catalog ? catalog->find(drop.itemId) : nullptr;
        entries.push_back({definition ? definition->name : drop.itemId, true, fmt::format("x{}", drop.quantity)});
    }
    if (loot_.gold > 0) {
        entries.push_back({tr("loot.gold"), true, fmt::format("{}G", loot_.gold)});
    }

    if (entries.empty()) {
        MenuRenderer::drawHint(surface, tr("loot.empty"), 0.5f);
    } else {
        MenuRenderer::drawMenuOptions(surface, entries, SIZE_MAX, 0.35f, 0.07f);
    }
    MenuRenderer::drawHint(surface, tr("loot.hint"));
}

} // namespace Wildspirit
