#include "SaveLoadState.hpp"
#include "../GameStateManager.hpp"
#include "../GameSession.hpp"
#include "../../core/InputActions.hpp"
#include "../../core/RenderSurface.hpp"
#include "../../ui/MenuRenderer.hpp"
#include "../../ui/MenuSelection.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <spdlog/spdlog.h>

namespace Wildspirit {

void SaveLoadState::enter(const StateData& data) {
    if (!data.isResumingFromPause) {
        mode_ = data.saveLoad ? data.saveLoad->mode : SaveLoadMode::Load;
        selected_ = 0;
        scrollOffset_ = 0;
    }
    modal_ = Modal::None;
    loading_ = false;
    statusMessage_.clear();
    refreshSaves();
}

void SaveLoadState::refreshSaves() {
    saves_ = services_.saves ? services_.saves->getAllSaves() : std::vector<SaveInfo>{};
    selected_ = MenuSelection::clampIndex(selected_, getRowCount());
    scrollOffset_ = MenuSelection::scrollToShow(selected_, std::min(scrollOffset_, selected_), VISIBLE_ROWS);
}

size_t SaveLoadState::getRowCount() const {
    return saves_.size() + (mode_ == SaveLoadMode::Save ? 1 : 0);
}

bool SaveLoadState::isNewSaveRow(size_t row) const {
    return mode_ == SaveLoadMode::Save && row == 0;
}

const SaveInfo* SaveLoadState::slotForRow(size_t row) const {
    size_t index = mode_ == SaveLoadMode::Save ? row - 1 : row;
    if (isNewSaveRow(row) || index >= saves_.size()) return nullptr;
    return &saves_[index];
}

void SaveLoadState::handleInput(Input& input) {
    if (loading_) return;

    if (modal_ != Modal::None) {
        if (input.isJustPressed(GameAction::Left) || input.isJustPressed(GameAction::Right)
            || input.isJustPressed(GameAction::Up) || input.isJustPressed(GameAction::Down)) {
            modalSelection_ = MenuSelection::wrapNext(modalSelection_, 2);
            playEffect("cursor");
        } else if (input.isJustPressed(GameAction::Confirm)) {
            confirmModal();
        } else if (input.isJustPressed(GameAction::Cancel)) {
            modal_ = Modal::None;
        }
        return;
    }

    if (input.isJustPressed(GameAction::Cancel)) {
        manager_.popState();
    } else if (input.isJustPressed(GameAction::Up)) {
        moveSelection(false);
    } else if (input.isJustPressed(GameAction::Down)) {
        moveSelection(true);
    } else if (input.isJustPressed(GameAction::Confirm)) {
        confirmRow();
    } else if (input.isJustPressed(GameAction::Interact)) {
        if (slotForRow(selected_)) {
            modal_ = Modal::ConfirmDelete;
            modalSelection_ = 1;
        } else {
            playEffect("error");
        }
    }
}

void SaveLoadState::moveSelection(bool down) {
    size_t count = getRowCount();
    if (count == 0) return;
    selected_ = down ? MenuSelection::wrapNext(selected_, count) : MenuSelection::wrapPrevious(selected_, count);
    scrollOffset_ = MenuSelection::scrollToShow(selected_, scrollOffset_, VISIBLE_ROWS);
    playEffect("cursor");
}

void SaveLoadState::confirmRow() {
    if (getRowCount() == 0) {
        playEffect("error");
        return;
    }

    if (isNewSaveRow(selected_)) {
        writeSave(std::nullopt);
        return;
    }

    const SaveInfo* slot = slotForRow(selected_);
    if (!slot) return;

    if (mode_ == SaveLoadMode::Save) {
        modal_ = Modal::ConfirmOverwrite;
        modalSelection_ = 1;
    } else {
        loadSlot(*slot);
    }
}

void SaveLoadState::confirmModal() {
    Modal modal = modal_;
    modal_ = Modal::None;

    // Options are Yes, No
    if (modalSelection_ != 0) return;

    const SaveInfo* slot = slotForRow(selected_);
    if (!slot) return;

    if (modal == Modal::ConfirmOverwrite) {
        writeSave(slot->id);
    } else if (modal == Modal::ConfirmDelete) {
        deleteSelected();
    }
}

void SaveLoadState::writeSave(const std::optional<std::string>& overwriteId) {
    if (!services_.saves || !services_.session) {
        playEffect("error");
        return;
    }

    std::optional<std::string> name;
    if (overwriteId) {
        if (const SaveInfo* slot = slotForRow(selected_)) name = slot->name;
    }

    auto id = services_.saves->saveGame(*services_.session, name, overwriteId);
    if (!id) {
        spdlog::warn("Saving failed");
        statusMessage_ = tr("save.failed");
        playEffect("error");
        return;
    }

    spdlog::info("Saved game to slot {}", *id);
    statusMessage_ = tr("save.success");
    playEffect("save");
    refreshSaves();
}

void SaveLoadState::loadSlot(const SaveInfo& save) {
    if (!services_.saves || !services_.session || !services_.saves->loadGame(save.id, *services_.session)) {
        spdlog::warn("Loading save {} failed", save.id);
        statusMessage_ = tr("load.failed");
        playEffect("error");
        return;
    }

    spdlog::info("Loaded save {}", save.id);
    playEffect("confirm");
    loading_ = true;
    manager_.schedule(LOAD_TRANSITION_SECONDS, [this]() {
        manager_.clearStack();
        manager_.changeState(StateId::Playing);
    });
}

void SaveLoadState::deleteSelected() {
    const SaveInfo* slot = slotForRow(selected_);
    if (!slot || !services_.saves) return;

    std::string id = slot->id;
    if (services_.saves->deleteSave(id)) {
        spdlog::info("Deleted save {}", id);
        playEffect("delete");
    } else {
        playEffect("error");
    }
    refreshSaves();
}

void SaveLoadState::render(RenderSurface& surface) {
    MenuRenderer::drawOverlay(surface);
    MenuRenderer::drawTitle(surface, tr(mode_ == SaveLoadMode::Save ? "save.title" : "load.title"), 0.12f);

    std::vector<MenuEntry> entries;
    if (mode_ == SaveLoadMode::Save) {
        entries.push_back({tr("save.newSlot")});
    }
    for (const auto& save : saves_) {
        auto total = static_cast<int64_t>(save.playtimeSeconds);
        entries.push_back({save.name, true,
                           fmt::format("{}  {:02}:{:02}", save.mapName, total / 3600, (total / 60) % 60)});
    }

    if (entries.empty()) {
        MenuRenderer::drawHint(surface, tr("load.empty"), 0.5f);
    } else {
        MenuRenderer::drawMenuOptions(surface, entries, selected_, 0.3f, 0.1f, scrollOffset_, VISIBLE_ROWS);
    }

    if (!statusMessage_.empty()) {
        MenuRenderer::drawHint(surface, statusMessage_, 0.88f);
    }
    MenuRenderer::drawHint(surface, tr("save.hint"));

    if (modal_ != Modal::None) {
        bool overwrite = modal_ == Modal::ConfirmOverwrite;
        MenuRenderer::drawModal(surface, tr(overwrite ? "save.overwriteTitle" : "save.deleteTitle"),
                                tr(overwrite ? "save.overwriteMessage" : "save.deleteMessage"),
                                {tr("common.yes"), tr("common.no")}, modalSelection_);
    }
}

} // namespace Wildspirit
