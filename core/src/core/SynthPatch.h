#pragma once

#include <array>
#include <optional>

#include "core/SynthSettings.h"

namespace sympathetic {

// Sparse parameter patches. Every field is independently optional:
// present fields are applied, absent ones leave the current setting
// untouched. Patches typically come from external collaborators (a
// sound-design assistant, a control surface) and are clamped once at
// the boundary with ClampPatch().

struct EnvelopePatch {
    std::optional<float> attack;
    std::optional<float> decay;
    std::optional<float> sustain;
    std::optional<float> release;
    std::optional<float> start_level;
    std::optional<float> max_level;

    [[nodiscard]] bool empty() const;
};

struct OscillatorPatch {
    std::optional<Waveform> waveform;
    std::optional<OscillatorRange> range;
    std::optional<float> detune;
    std::optional<float> volume;  // Mixer channel volume.

    [[nodiscard]] bool empty() const;
};

struct FilterPatch {
    // `max_level` is ignored; the cutoff drives it.
    EnvelopePatch envelope;
    std::optional<float> cutoff;
    std::optional<float> q;
    std::optional<float> contour;
    std::optional<FilterType> filter_type;

    [[nodiscard]] bool empty() const;
};

struct LfoPatch {
    std::optional<Waveform> waveform;
    std::optional<float> frequency;
    std::optional<float> depth;

    [[nodiscard]] bool empty() const;
};

struct NoisePatch {
    std::optional<float> level;
    std::optional<float> filter_frequency;
    std::optional<float> filter_q;

    [[nodiscard]] bool empty() const;
};

struct SynthPatch {
    std::array<OscillatorPatch, kNumOscillators> oscillators{};
    FilterPatch filter;
    EnvelopePatch volume_envelope;
    std::optional<float> master_volume;
    NoisePatch noise;
    LfoPatch lfo;

    [[nodiscard]] bool empty() const;
};

// Documented domains of the patch fields.
namespace patch_limits {
inline constexpr float kDetuneMin = -50.0F;
inline constexpr float kDetuneMax = 50.0F;

inline constexpr float kFilterAttackMax = 5.0F;
inline constexpr float kFilterDecayMax = 2.5F;
inline constexpr float kFilterSustainMax = 10000.0F;
inline constexpr float kFilterReleaseMax = 5.0F;
inline constexpr float kFilterCutoffMin = 20.0F;
inline constexpr float kFilterCutoffMax = 20000.0F;
inline constexpr float kFilterStartLevelMin = 20.0F;
inline constexpr float kFilterStartLevelMax = 5000.0F;
inline constexpr float kFilterQMax = 10.0F;

inline constexpr float kVolumeAttackMax = 5.0F;
inline constexpr float kVolumeDecayMin = 0.1F;
inline constexpr float kVolumeDecayMax = 5.0F;
inline constexpr float kVolumeSustainMin = 0.1F;
inline constexpr float kVolumeReleaseMax = 10.0F;

inline constexpr float kNoiseFilterFrequencyMin = 100.0F;
inline constexpr float kNoiseFilterFrequencyMax = 8000.0F;
inline constexpr float kNoiseFilterQMin = 0.1F;
inline constexpr float kNoiseFilterQMax = 10.0F;

inline constexpr float kLfoFrequencyMax = 30.0F;
inline constexpr float kLfoDepthMax = 100.0F;
}  // namespace patch_limits

// Returns a copy of `patch` with every present field clamped into its
// documented domain. NaN values are dropped (treated as absent).
[[nodiscard]] SynthPatch ClampPatch(const SynthPatch& patch);

}  // namespace sympathetic
