#include "InventoryState.hpp"
#include "../GameStateManager.hpp"
#include "../GameSession.hpp"
#include "../../core/InputActions.hpp"
#include "../../core/RenderSurface.hpp"
#include "../../rpg/Inventory.hpp"
#include "../../ui/MenuRenderer.hpp"
#include "../../ui/MenuSelection.hpp"
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace Wildspirit {

void InventoryState::enter(const StateData& data) {
    if (!data.isResumingFromPause) {
        selected_ = 0;
    }
    selected_ = MenuSelection::clampIndex(selected_, itemCount());
    statusMessage_.clear();
}

Inventory* InventoryState::inventory() const {
    return services_.session ? &services_.session->inventory : nullptr;
}

size_t InventoryState::itemCount() const {
    Inventory* items = inventory();
    return items ? items->getSlots().size() : 0;
}

size_t InventoryState::getPageCount() const {
    size_t count = itemCount();
    return count == 0 ? 1 : (count + ITEMS_PER_PAGE - 1) / ITEMS_PER_PAGE;
}

PartySpirit* InventoryState::firstAliveSpirit() const {
    if (!services_.session) return nullptr;
    for (PartySpirit* spirit : services_.session->party.getActiveParty()) {
        if (spirit->currentHp.value_or(Party::maxHp(*spirit)) > 0) {
            return spirit;
        }
    }
    return nullptr;
}

void InventoryState::handleInput(Input& input) {
    if (input.isJustPressed(GameAction::Cancel) || input.isJustPressed(GameAction::Inventory)) {
        input.consumePress(GameAction::Inventory);
        manager_.popState();
        return;
    }

    size_t count = itemCount();
    if (input.isJustPressed(GameAction::Up)) {
        selected_ = MenuSelection::wrapPrevious(selected_, count);
        playEffect("cursor");
    } else if (input.isJustPressed(GameAction::Down)) {
        selected_ = MenuSelection::wrapNext(selected_, count);
        playEffect("cursor");
    } else if (input.isJustPressed(GameAction::Left)) {
        changePage(false);
    } else if (input.isJustPressed(GameAction::Right)) {
        changePage(true);
    } else if (input.isJustPressed(GameAction::Confirm)) {
        useSelected();
    }
}

void InventoryState::changePage(bool forward) {
    size_t pages = getPageCount();
    if (pages <= 1) return;

    size_t page = forward ? MenuSelection::wrapNext(getPage(), pages) : MenuSelection::wrapPrevious(getPage(), pages);
    size_t row = selected_ % ITEMS_PER_PAGE;
    selected_ = MenuSelection::clampIndex(page * ITEMS_PER_PAGE + row, itemCount());
    playEffect("cursor");
}

void InventoryState::useSelected() {
    Inventory* items = inventory();
    PartySpirit* target = firstAliveSpirit();
    if (!items || !target || itemCount() == 0) {
        playEffect("error");
        return;
    }

    const InventorySlot* slot = items->getSlot(selected_);
    std::string itemId = slot ? slot->itemId : std::string();
    if (!items->useItem(selected_, *target)) {
        statusMessage_ = tr("inventory.cannotUse");
        playEffect("error");
        return;
    }

    spdlog::info("Used {} on {}", itemId, target->data.name);
    const ItemDefinition* definition = items->getCatalog() ? items->getCatalog()->find(itemId) : nullptr;
    statusMessage_ = tr("inventory.used", {{"item", definition ? definition->name : itemId},
                                           {"target", target->data.name}});
    playEffect("heal");
    selected_ = MenuSelection::clampIndex(selected_, itemCount());
}

void InventoryState::render(RenderSurface& surface) {
    MenuRenderer::drawOverlay(surface);
    MenuRenderer::drawTitle(surface, tr("inventory.title"));

    Inventory* items = inventory();
    if (!items || items->getSlots().empty()) {
        MenuRenderer::drawHint(surface, tr("inventory.empty"), 0.5f);
    } else {
        const ItemCatalog* catalog = items->getCatalog();
        std::vector<MenuEntry> entries;
        for (const auto& slot : items->getSlots()) {
            const ItemDefinition* definition = catalog ? catalog->find(slot.itemId) : nullptr;
            entries.push_back({definition ? definition->name : slot.itemId, true, fmt::format("x{}", slot.quantity)});
        }
        MenuRenderer::drawMenuOptions(surface, entries, selected_, 0.25f, 0.07f,
                                      getPage() * ITEMS_PER_PAGE, ITEMS_PER_PAGE);

        auto height = static_cast<float>(surface.getHeight());
        auto width = static_cast<float>(surface.getWidth());
        surface.drawText(fmt::format("{}/{}", getPage() + 1, getPageCount()),
                         glm::vec2(width * 0.5f, height * 0.85f), 18.0f, Colors::Gray, TextAlign::Center);
    }

    if (items) {
        surface.drawText(tr("hud.gold", {{"gold", std::to_string(items->getGold())}}),
                         glm::vec2(20.0f, 20.0f), 18.0f, Colors::Yellow);
    }
    if (!statusMessage_.empty()) {
        MenuRenderer::drawHint(surface, statusMessage_, 0.9f);
    }
}

} // namespace Wildspirit
