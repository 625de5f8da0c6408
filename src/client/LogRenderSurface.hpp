#pragma once

#include "../core/RenderSurface.hpp"
#include <string>
#include <vector>

namespace Wildspirit {

/**
 * Text-only surface for the headless client. Records the text drawn each
 * frame and logs the screen whenever it changes.
 */
class LogRenderSurface : public RenderSurface {
public:
    LogRenderSurface(uint32_t width = 1280, uint32_t height = 720)
        : width_(width)
        , height_(height) {}

    uint32_t getWidth() const override { return width_; }
    uint32_t getHeight() const override { return height_; }

    void fillRect(const glm::vec2& position, const glm::vec2& size, const glm::vec4& color) override;
    void drawText(const std::string& text, const glm::vec2& position, float size,
                  const glm::vec4& color, TextAlign align = TextAlign::Left) override;

    void beginFrame();

    /**
     * @return true if this frame's text differs from the previous frame's
     */
    bool endFrame();

    const std::vector<std::string>& getFrameText() const { return lastFrame_; }
    size_t getRectCount() const { return rects_; }

private:
    uint32_t width_;
    uint32_t height_;
    std::vector<std::string> frame_;
    std::vector<std::string> lastFrame_;
    size_t rects_ = 0;
};

} // namespace Wildspirit
