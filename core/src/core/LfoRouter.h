#pragma once

#include <memory>
#include <unordered_map>
#include <vector>

#include "core/AudioContext.h"
#include "core/SynthPatch.h"
#include "core/SynthSettings.h"

namespace sympathetic {

// Single shared low-frequency oscillator routed into every sounding
// voice.
//
// The LFO feeds two bus gains: the pitch bus (gain = depth, summed into
// each voice oscillator's detune in cents) and the filter bus (gain =
// depth * 100, summed into each voice filter's cutoff in Hz). Voices are
// registered explicitly so that their taps can be removed when the
// voice is torn down.
//
// Not thread-safe on its own; SynthEngine calls it under its mutex.
class LfoRouter {
public:
    static constexpr double kFilterDepthScale = 100.0;

    LfoRouter(AudioContext& context, const LfoSettings& settings);
    ~LfoRouter();

    LfoRouter(const LfoRouter&) = delete;
    LfoRouter& operator=(const LfoRouter&) = delete;

    // Mutates the live oscillator and bus gains in place.
    void update(const LfoPatch& patch);

    // Taps every oscillator's detune and every filter's cutoff of the
    // voice. Registering an id twice replaces its previous taps.
    void connectVoice(VoiceId voice,
                      const std::vector<std::shared_ptr<OscillatorNode>>& oscillators,
                      const std::vector<std::shared_ptr<FilterNode>>& filters);

    // Removes the taps of `voice`. Returns false for an unknown id.
    bool disconnectVoice(VoiceId voice);

    [[nodiscard]] bool isVoiceConnected(VoiceId voice) const;
    [[nodiscard]] std::size_t connectedVoiceCount() const noexcept
    {
        return taps_.size();
    }

    // Number of modulation edges currently held (one per tapped param).
    [[nodiscard]] std::size_t tapCount() const;

    [[nodiscard]] const LfoSettings& settings() const noexcept
    {
        return settings_;
    }

    [[nodiscard]] const std::shared_ptr<OscillatorNode>& oscillator() const noexcept
    {
        return oscillator_;
    }
    [[nodiscard]] const std::shared_ptr<GainNode>& pitchBus() const noexcept
    {
        return pitchBus_;
    }
    [[nodiscard]] const std::shared_ptr<GainNode>& filterBus() const noexcept
    {
        return filterBus_;
    }

private:
    struct VoiceTaps {
        std::vector<std::shared_ptr<OscillatorNode>> oscillators;
        std::vector<std::shared_ptr<FilterNode>> filters;
    };

    void removeTaps(VoiceTaps& taps);

    AudioContext& context_;
    LfoSettings settings_;

    std::shared_ptr<OscillatorNode> oscillator_;
    std::shared_ptr<GainNode> pitchBus_;
    std::shared_ptr<GainNode> filterBus_;

    std::unordered_map<VoiceId, VoiceTaps> taps_;
};

}  // namespace sympathetic
