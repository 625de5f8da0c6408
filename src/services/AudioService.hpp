#pragma once

#include <string>

namespace Wildspirit {

/**
 * Fire-and-forget audio playback. Implementations own mixing and devices;
 * game states only name the cue to play.
 */
class AudioService {
public:
    virtual ~AudioService() = default;

    virtual void playEffect(const std::string& name) = 0;
    virtual void playBGM(const std::string& name) = 0;
    virtual void stopAmbience() = 0;
    virtual void resumeBGM() = 0;

    // Warm caches for frequently used cues; optional
    virtual void preloadCommon() {}
};

} // namespace Wildspirit
