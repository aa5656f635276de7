#pragma once

#include <array>
#include <memory>

#include "core/AudioContext.h"
#include "core/SynthSettings.h"

namespace sympathetic {

// Static part of the signal graph shared by all voices:
//
//   channel[0..2] ─► limiter ─► master ─► destination | output()
//
// The noise section joins at master(), after the limiter. Voice
// filters connect into channel(slot). When the engine is built with
// speakers off the master feeds output() instead of the context
// destination so that a host can route or meter it.
class MixerBus {
public:
    // Brick-wall-ish limiter in front of the master volume.
    static CompressorSettings LimiterSettings();

    MixerBus(AudioContext& context,
             const std::array<MixerChannel, kNumOscillators>& channels,
             const SynthOptions& options);
    ~MixerBus();

    MixerBus(const MixerBus&) = delete;
    MixerBus& operator=(const MixerBus&) = delete;

    // Volume of one channel, clamped to [0, 1]. Returns false for an
    // out-of-range slot.
    bool setChannelVolume(int slot, float volume);

    // An inactive channel is muted but keeps its volume.
    bool setChannelActive(int slot, bool active);

    // Master volume, clamped to [0, 1].
    void setVolume(float volume);

    [[nodiscard]] float volume() const noexcept { return masterVolume_; }

    [[nodiscard]] const MixerChannel& channelSettings(int slot) const;

    [[nodiscard]] const std::shared_ptr<GainNode>& channel(int slot) const;
    [[nodiscard]] const std::shared_ptr<CompressorNode>& limiter() const noexcept
    {
        return limiter_;
    }
    [[nodiscard]] const std::shared_ptr<GainNode>& master() const noexcept
    {
        return master_;
    }

    // Tap fed by the master when speakers are off; nullptr otherwise.
    [[nodiscard]] const std::shared_ptr<GainNode>& output() const noexcept
    {
        return output_;
    }

private:
    [[nodiscard]] static bool validSlot(int slot) noexcept;
    void applyChannelGain(int slot);

    AudioContext& context_;

    std::array<MixerChannel, kNumOscillators> settings_;
    std::array<std::shared_ptr<GainNode>, kNumOscillators> channels_;
    std::shared_ptr<CompressorNode> limiter_;
    std::shared_ptr<GainNode> master_;
    std::shared_ptr<GainNode> output_;
    float masterVolume_{0.5F};
};

}  // namespace sympathetic
