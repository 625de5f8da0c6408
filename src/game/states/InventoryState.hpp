#pragma once

#include "../GameState.hpp"

namespace Wildspirit {

class Inventory;
struct PartySpirit;

/**
 * Paged item list. Confirm uses the selected consumable on the first
 * living party spirit.
 */
class InventoryState : public GameState {
public:
    static constexpr size_t ITEMS_PER_PAGE = 8;

    using GameState::GameState;

    void enter(const StateData& data) override;
    void handleInput(Input& input) override;
    void render(RenderSurface& surface) override;

    size_t getSelectedIndex() const { return selected_; }
    size_t getPage() const { return selected_ / ITEMS_PER_PAGE; }
    size_t getPageCount() const;

private:
    Inventory* inventory() const;
    PartySpirit* firstAliveSpirit() const;
    size_t itemCount() const;
    void changePage(bool forward);
    void useSelected();

    size_t selected_ = 0;
    std::string statusMessage_;
};

} // namespace Wildspirit
