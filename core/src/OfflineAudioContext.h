#pragma once

#include <vector>

#include "AudioGraphContext.h"

namespace sympathetic {

// Render graph driven by hand: time only moves when render() is
// called. Used by tests and by the CLI in --offline mode.
class OfflineAudioContext : public AudioGraphContext {
public:
    explicit OfflineAudioContext(double sampleRate = 44100.0);

    // Renders `numSamples` and returns them.
    std::vector<float> render(int numSamples);

    // Renders whole samples until the clock reaches at least `seconds`
    // past its current position and returns them.
    std::vector<float> renderSeconds(double seconds);

    // Like renderSeconds() but only keeps the peak level.
    float advance(double seconds);
};

}  // namespace sympathetic
