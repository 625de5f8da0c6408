#include "LoadingState.hpp"
#include "../GameStateManager.hpp"
#include "../../core/RenderSurface.hpp"
#include "../../services/AudioService.hpp"
#include "../../ui/MenuRenderer.hpp"
#include <algorithm>

namespace Wildspirit {

void LoadingState::enter(const StateData& data) {
    (void)data;
    elapsed_ = 0.0f;

    if (services_.audio) {
        services_.audio->preloadCommon();
    }

    manager_.schedule(MIN_DISPLAY_SECONDS, [this]() {
        manager_.changeState(StateId::MainMenu);
    });
}

void LoadingState::update(float deltaTime) {
    elapsed_ += deltaTime;
}

float LoadingState::getProgress() const {
    return std::clamp(elapsed_ / MIN_DISPLAY_SECONDS, 0.0f, 1.0f);
}

void LoadingState::render(RenderSurface& surface) {
    float w = static_cast<float>(surface.getWidth());
    float h = static_cast<float>(surface.getHeight());

    surface.fillRect(glm::vec2(0.0f), glm::vec2(w, h), Colors::Black);
    MenuRenderer::drawTitle(surface, tr("loading.title"), 0.45f);
    surface.drawBar(glm::vec2(w * 0.3f, h * 0.55f), glm::vec2(w * 0.4f, h * 0.02f), getProgress(),
                    Colors::Blue, Colors::Gray);
}

} // namespace Wildspirit
