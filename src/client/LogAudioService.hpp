#pragma once

#include "../services/AudioService.hpp"
#include <optional>
#include <string>
#include <vector>

namespace Wildspirit {

class Settings;

/**
 * Audio backend for the headless client: tracks what would be playing and
 * logs every cue instead of mixing sound.
 */
class LogAudioService : public AudioService {
public:
    explicit LogAudioService(const Settings* settings = nullptr) : settings_(settings) {}

    void playEffect(const std::string& name) override;
    void playBGM(const std::string& name) override;
    void stopAmbience() override;
    void resumeBGM() override;
    void preloadCommon() override;

    const std::optional<std::string>& getCurrentBGM() const { return currentBgm_; }
    const std::vector<std::string>& getEffectHistory() const { return effects_; }

private:
    float effectVolume() const;

    const Settings* settings_;
    std::optional<std::string> currentBgm_;

    // Last non-battle track, restored by resumeBGM
    std::optional<std::string> resumeBgm_;
    std::vector<std::string> effects_;
    bool preloaded_ = false;
};

} // namespace Wildspirit
