#pragma once

#include <memory>

#include "core/AudioContext.h"
#include "core/SynthSettings.h"

namespace sympathetic {

// Filtered-noise layer shared by all voices:
//
//   noise ─► bandpass ─► level ─► gate ─► sink (the master bus)
//
// The gate is opened by every note-on and closed only when no voice is
// active any more. The source is started lazily the first time the
// level goes above zero and then runs until the section is destroyed.
class NoiseSection {
public:
    static constexpr float kMinFilterFrequency = 20.0F;
    static constexpr float kMaxFilterFrequency = 20000.0F;
    static constexpr float kMinFilterQ = 0.1F;
    static constexpr float kMaxFilterQ = 20.0F;

    NoiseSection(AudioContext& context, const NoiseSettings& settings,
                 const std::shared_ptr<AudioNode>& sink);
    ~NoiseSection();

    NoiseSection(const NoiseSection&) = delete;
    NoiseSection& operator=(const NoiseSection&) = delete;

    // Level clamped to [0, 1].
    void setLevel(float level);
    // Cutoff clamped to [20, 20000] Hz.
    void setFilterFrequency(float frequencyHz);
    // Q clamped to [0.1, 20].
    void setFilterQ(float q);

    // Moves the bandpass to a note frequency without touching the stored
    // filter setting.
    void tuneTo(double frequencyHz);

    void openGate();
    void closeGate();

    [[nodiscard]] bool gateOpen() const noexcept { return gateOpen_; }
    [[nodiscard]] bool sourceStarted() const;

    [[nodiscard]] const NoiseSettings& settings() const noexcept
    {
        return settings_;
    }

    [[nodiscard]] const std::shared_ptr<NoiseSourceNode>& source() const noexcept
    {
        return source_;
    }
    [[nodiscard]] const std::shared_ptr<FilterNode>& filter() const noexcept
    {
        return filter_;
    }
    [[nodiscard]] const std::shared_ptr<GainNode>& level() const noexcept
    {
        return level_;
    }
    [[nodiscard]] const std::shared_ptr<GainNode>& gate() const noexcept
    {
        return gate_;
    }

private:
    AudioContext& context_;
    NoiseSettings settings_;

    std::shared_ptr<NoiseSourceNode> source_;
    std::shared_ptr<FilterNode> filter_;
    std::shared_ptr<GainNode> level_;
    std::shared_ptr<GainNode> gate_;

    bool gateOpen_{false};
};

}  // namespace sympathetic
