#include "MenuRenderer.hpp"
#include <algorithm>
#include <cstdint>

namespace Wildspirit {

namespace MenuRenderer {

namespace {

float fontSize(const RenderSurface& surface, float fraction) {
    return std::max(12.0f, static_cast<float>(surface.getHeight()) * fraction);
}

} // namespace

void drawOverlay(RenderSurface& surface, const glm::vec4& color) {
    surface.fillRect(glm::vec2(0.0f), glm::vec2(surface.getWidth(), surface.getHeight()), color);
}

void drawPanel(RenderSurface& surface, const glm::vec2& position, const glm::vec2& size) {
    constexpr float border = 2.0f;
    surface.fillRect(position - glm::vec2(border), size + glm::vec2(border * 2.0f), Colors::Gray);
    surface.fillRect(position, size, glm::vec4(0.08f, 0.08f, 0.12f, 0.9f));
}

void drawTitle(RenderSurface& surface, const std::string& title, float yFraction) {
    float w = static_cast<float>(surface.getWidth());
    float h = static_cast<float>(surface.getHeight());
    surface.drawText(title, glm::vec2(w * 0.5f, h * yFraction), fontSize(surface, 0.06f),
                     Colors::Yellow, TextAlign::Center);
}

void drawHint(RenderSurface& surface, const std::string& text, float yFraction) {
    float w = static_cast<float>(surface.getWidth());
    float h = static_cast<float>(surface.getHeight());
    surface.drawText(text, glm::vec2(w * 0.5f, h * yFraction), fontSize(surface, 0.025f),
                     Colors::Gray, TextAlign::Center);
}

void drawMenuOptions(RenderSurface& surface, const std::vector<MenuEntry>& entries, size_t selected,
                     float startYFraction, float spacingFraction, size_t firstRow, size_t maxRows) {
    float w = static_cast<float>(surface.getWidth());
    float h = static_cast<float>(surface.getHeight());
    float size = fontSize(surface, 0.035f);

    size_t end = std::min(entries.size(), firstRow + std::min(maxRows, entries.size()));
    for (size_t i = firstRow; i < end; ++i) {
        const MenuEntry& entry = entries[i];
        float y = h * (startYFraction + spacingFraction * static_cast<float>(i - firstRow));
        bool isSelected = i == selected;

        glm::vec4 color = !entry.enabled ? Colors::Gray : (isSelected ? Colors::Yellow : Colors::White);
        if (isSelected) {
            surface.fillRect(glm::vec2(w * 0.2f, y - size * 0.2f), glm::vec2(w * 0.6f, size * 1.4f),
                             glm::vec4(1.0f, 1.0f, 1.0f, 0.1f));
        }

        if (entry.value.empty()) {
            surface.drawText(entry.label, glm::vec2(w * 0.5f, y), size, color, TextAlign::Center);
        } else {
            surface.drawText(entry.label, glm::vec2(w * 0.22f, y), size, color, TextAlign::Left);
            surface.drawText(entry.value, glm::vec2(w * 0.78f, y), size, color, TextAlign::Right);
        }
    }
}

void drawModal(RenderSurface& surface, const std::string& title, const std::string& message,
               const std::vector<std::string>& options, size_t selected) {
    float w = static_cast<float>(surface.getWidth());
    float h = static_cast<float>(surface.getHeight());

    drawOverlay(surface, glm::vec4(0.0f, 0.0f, 0.0f, 0.5f));
    glm::vec2 size(w * 0.5f, h * 0.3f);
    glm::vec2 position((w - size.x) * 0.5f, (h - size.y) * 0.5f);
    drawPanel(surface, position, size);

    float textSize = fontSize(surface, 0.03f);
    surface.drawText(title, glm::vec2(w * 0.5f, position.y + textSize), textSize * 1.2f,
                     Colors::Yellow, TextAlign::Center);
    surface.drawText(message, glm::vec2(w * 0.5f, position.y + textSize * 3.0f), textSize,
                     Colors::White, TextAlign::Center);

    float spacing = size.x / static_cast<float>(options.size() + 1);
    for (size_t i = 0; i < options.size(); ++i) {
        glm::vec2 at(position.x + spacing * static_cast<float>(i + 1), position.y + size.y - textSize * 2.0f);
        surface.drawText(options[i], at, textSize, i == selected ? Colors::Yellow : Colors::White,
                         TextAlign::Center);
    }
}

} // namespace MenuRenderer

} // namespace Wildspirit
