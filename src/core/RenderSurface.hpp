#pragma once

#include <glm/glm.hpp>
#include <string>
#include <cstdint>

namespace Wildspirit {

enum class TextAlign {
    Left,
    Center,
    Right
};

/**
 * Drawing target handed to GameState::render. Backends (canvas, GPU, text log)
 * implement these primitives; states only describe what goes where.
 */
class RenderSurface {
public:
    virtual ~RenderSurface() = default;

    virtual uint32_t getWidth() const = 0;
    virtual uint32_t getHeight() const = 0;

    virtual void fillRect(const glm::vec2& position, const glm::vec2& size, const glm::vec4& color) = 0;
    virtual void drawText(const std::string& text, const glm::vec2& position, float size,
                          const glm::vec4& color, TextAlign align = TextAlign::Left) = 0;

    // Horizontal gauge filled to progress in [0, 1]
    virtual void drawBar(const glm::vec2& position, const glm::vec2& size, float progress,
                         const glm::vec4& fillColor, const glm::vec4& backColor) {
        fillRect(position, size, backColor);
        float clamped = glm::clamp(progress, 0.0f, 1.0f);
        fillRect(position, glm::vec2(size.x * clamped, size.y), fillColor);
    }
};

namespace Colors {
    inline const glm::vec4 White{1.0f, 1.0f, 1.0f, 1.0f};
    inline const glm::vec4 Black{0.0f, 0.0f, 0.0f, 1.0f};
    inline const glm::vec4 Yellow{1.0f, 1.0f, 0.0f, 1.0f};
    inline const glm::vec4 Gray{0.5f, 0.5f, 0.5f, 1.0f};
    inline const glm::vec4 Red{1.0f, 0.3f, 0.3f, 1.0f};
    inline const glm::vec4 Green{0.3f, 1.0f, 0.3f, 1.0f};
    inline const glm::vec4 Blue{0.3f, 0.5f, 1.0f, 1.0f};
    inline const glm::vec4 Overlay{0.0f, 0.0f, 0.0f, 0.7f};
}

} // namespace Wildspirit
