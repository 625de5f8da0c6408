#include "LogRenderSurface.hpp"
#include <spdlog/spdlog.h>

namespace Wildspirit {

void LogRenderSurface::fillRect(const glm::vec2& position, const glm::vec2& size, const glm::vec4& color) {
    (void)position;
    (void)size;
    if (color.a > 0.0f) {
        ++rects_;
    }
}

void LogRenderSurface::drawText(const std::string& text, const glm::vec2& position, float size,
                                const glm::vec4& color, TextAlign align) {
    (void)position;
    (void)size;
    (void)align;
    if (text.empty() || color.a <= 0.0f) return;
    frame_.push_back(text);
}

void LogRenderSurface::beginFrame() {
    frame_.clear();
    rects_ = 0;
}

bool LogRenderSurface::endFrame() {
    if (frame_ == lastFrame_) return false;

    lastFrame_ = frame_;
    spdlog::debug("[Screen] ----");
    for (const auto& line : lastFrame_) {
        spdlog::debug("[Screen] {}", line);
    }
    return true;
}

} // namespace Wildspirit
