#include "LogAudioService.hpp"
#include "../core/Settings.hpp"
#include <algorithm>
#include <iterator>
#include <string_view>
#include <spdlog/spdlog.h>

namespace Wildspirit {

namespace {

constexpr const char* COMMON_EFFECTS[] = {
    "cursor", "confirm", "error", "heal", "pickup", "purchase", "save", "delete", "ready", "strike", "spell"
};

constexpr std::string_view TRANSIENT_TRACKS[] = {"battle", "boss", "victory"};

constexpr size_t MAX_EFFECT_HISTORY = 64;

} // namespace

float LogAudioService::effectVolume() const {
    if (!settings_) return 1.0f;
    if (settings_->muted.getValue()) return 0.0f;
    return settings_->masterVolume.getValue() * settings_->sfxVolume.getValue();
}

void LogAudioService::playEffect(const std::string& name) {
    float volume = effectVolume();
    if (volume <= 0.0f) return;

    spdlog::debug("[Audio] effect '{}' at {:.2f}", name, volume);
    effects_.push_back(name);
    if (effects_.size() > MAX_EFFECT_HISTORY) {
        effects_.erase(effects_.begin());
    }
}

void LogAudioService::playBGM(const std::string& name) {
    if (currentBgm_ == name) return;

    // Battle and jingle tracks are temporary; resumeBGM returns to the last other track
    bool transient = std::find(std::begin(TRANSIENT_TRACKS), std::end(TRANSIENT_TRACKS), name)
                     != std::end(TRANSIENT_TRACKS);
    if (!transient) {
        resumeBgm_ = name;
    }
    currentBgm_ = name;
    spdlog::debug("[Audio] bgm '{}'", name);
}

void LogAudioService::stopAmbience() {
    spdlog::debug("[Audio] ambience stopped");
}

void LogAudioService::resumeBGM() {
    if (!resumeBgm_ || currentBgm_ == resumeBgm_) return;
    currentBgm_ = resumeBgm_;
    spdlog::debug("[Audio] resumed bgm '{}'", *currentBgm_);
}

void LogAudioService::preloadCommon() {
    if (preloaded_) return;
    preloaded_ = true;
    spdlog::info("Preloaded {} common sound effects", std::size(COMMON_EFFECTS));
}

} // namespace Wildspirit
