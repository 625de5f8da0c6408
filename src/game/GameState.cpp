#include "GameState.hpp"
#include "../services/AudioService.hpp"

namespace Wildspirit {

std::string GameState::tr(std::string_view key, const TranslationParams& params) const {
    if (services_.localization) {
        return services_.localization->t(key, params);
    }
    return substituteParams(std::string(key), params);
}

void GameState::playEffect(const std::string& name) const {
    if (services_.audio) {
        services_.audio->playEffect(name);
    }
}

} // namespace Wildspirit
