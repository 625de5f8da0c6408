#pragma once

#include "../core/RenderSurface.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace Wildspirit {

struct MenuEntry {
    std::string label;
    bool enabled = true;

    // Right-aligned value column (settings, prices)
    std::string value;
};

/**
 * Shared layout for full-screen menus. Positions are fractions of the
 * surface height so menus scale with the window.
 */
namespace MenuRenderer {

    void drawOverlay(RenderSurface& surface, const glm::vec4& color = Colors::Overlay);
    void drawPanel(RenderSurface& surface, const glm::vec2& position, const glm::vec2& size);
    void drawTitle(RenderSurface& surface, const std::string& title, float yFraction = 0.12f);
    void drawHint(RenderSurface& surface, const std::string& text, float yFraction = 0.95f);

    /**
     * Vertical option list. Only rows in [firstRow, firstRow + maxRows) are drawn.
     */
    void drawMenuOptions(RenderSurface& surface, const std::vector<MenuEntry>& entries, size_t selected,
                         float startYFraction = 0.45f, float spacingFraction = 0.08f,
                         size_t firstRow = 0, size_t maxRows = SIZE_MAX);

    /**
     * Centered yes/no box drawn over everything else.
     */
    void drawModal(RenderSurface& surface, const std::string& title, const std::string& message,
                   const std::vector<std::string>& options, size_t selected);

} // namespace MenuRenderer

} // namespace Wildspirit
