#pragma once

#include "../GameState.hpp"
#include "../../services/SaveManager.hpp"
#include <vector>

namespace Wildspirit {

/**
 * Save slot browser. In save mode the first row creates a new slot;
 * picking an existing slot asks before overwriting. Interact deletes the
 * selected slot after confirmation.
 */
class SaveLoadState : public GameState {
public:
    static constexpr size_t VISIBLE_ROWS = 5;
    static constexpr float LOAD_TRANSITION_SECONDS = 0.3f;

    enum class Modal {
        None,
        ConfirmOverwrite,
        ConfirmDelete
    };

    using GameState::GameState;

    void enter(const StateData& data) override;
    void handleInput(Input& input) override;
    void render(RenderSurface& surface) override;

    SaveLoadMode getMode() const { return mode_; }
    Modal getModal() const { return modal_; }
    size_t getSelectedIndex() const { return selected_; }
    size_t getScrollOffset() const { return scrollOffset_; }
    size_t getRowCount() const;
    bool isLoading() const { return loading_; }

private:
    void refreshSaves();
    bool isNewSaveRow(size_t row) const;
    const SaveInfo* slotForRow(size_t row) const;

    void moveSelection(bool down);
    void confirmRow();
    void confirmModal();
    void writeSave(const std::optional<std::string>& overwriteId);
    void loadSlot(const SaveInfo& save);
    void deleteSelected();

    SaveLoadMode mode_ = SaveLoadMode::Load;
    std::vector<SaveInfo> saves_;
    size_t selected_ = 0;
    size_t scrollOffset_ = 0;
    Modal modal_ = Modal::None;
    size_t modalSelection_ = 1;
    bool loading_ = false;
    std::string statusMessage_;
};

} // namespace Wildspirit
