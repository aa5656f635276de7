#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sympathetic {

// Number of oscillator slots (osc1..osc3) per engine instance.
inline constexpr int kNumOscillators = 3;

// Floor substituted for any level used as an exponential ramp
// endpoint.
inline constexpr float kMinimumLevel = 1e-4F;

enum class Waveform {
    kSine = 0,
    kTriangle,
    kSawtooth,
    kSquare,
};

enum class FilterType {
    kLowpass = 0,
    kHighpass,
    kBandpass,
};

// Oscillator range in organ feet: 32 is the lowest octave, 2 the
// highest.
enum class OscillatorRange {
    k2 = 2,
    k4 = 4,
    k8 = 8,
    k16 = 16,
    k32 = 32,
};

// Stable id/name pairs so that text front-ends can map names onto the
// enums in the order they are declared.
struct WaveformMode {
    Waveform waveform;
    const char* name;
};

struct FilterTypeMode {
    FilterType type;
    const char* name;
};

using WaveformModes = std::array<WaveformMode, 4>;
using FilterTypeModes = std::array<FilterTypeMode, 3>;

[[nodiscard]] const WaveformModes& SupportedWaveforms();
[[nodiscard]] const FilterTypeModes& SupportedFilterTypes();

[[nodiscard]] const char* WaveformName(Waveform waveform);
[[nodiscard]] std::optional<Waveform> WaveformFromName(std::string_view name);

[[nodiscard]] const char* FilterTypeName(FilterType type);
[[nodiscard]] std::optional<FilterType> FilterTypeFromName(
    std::string_view name);

// Frequency factor applied to a note for the given range:
// 2 → ×4, 4 → ×2, 8 → ×1, 16 → ÷2, 32 → ÷4.
[[nodiscard]] double RangeMultiplier(OscillatorRange range);

// Exact match on one of the five legal ranges.
[[nodiscard]] std::optional<OscillatorRange> RangeFromFeet(int feet);

// Nearest legal range (log2 distance) for an arbitrary positive value.
// Non-positive values snap to the highest pitch range (2).
[[nodiscard]] OscillatorRange SnapRange(double feet);

struct OscillatorSettings {
    OscillatorRange range{OscillatorRange::k8};
    Waveform waveform{Waveform::kSquare};
    float detune{0.0F};  // Cents, [-50, 50].
};

struct MixerChannel {
    float volume{0.25F};  // [0, 1].
    bool active{true};
};

// ADSR shape for one automation target. `sustain`, `start_level` and
// `max_level` are in the target's unit: linear gain for amplitude, Hz
// for filter cutoff.
struct EnvelopeSettings {
    float attack{0.0F};
    float decay{0.0F};
    float sustain{1.0F};
    float release{0.0F};
    float start_level{0.0F};
    float max_level{1.0F};
};

// Filter envelope plus the filter node configuration. The envelope's
// `max_level` always mirrors `cutoff_frequency`.
struct FilterEnvelopeSettings : EnvelopeSettings {
    float q{5.0F};
    float cutoff_frequency{10000.0F};
    // [0, 1] scale of the envelope excursion above `start_level`.
    float contour{1.0F};
    FilterType filter_type{FilterType::kLowpass};
};

struct LfoSettings {
    Waveform waveform{Waveform::kTriangle};
    float frequency{0.0F};  // Hz, [0, 30].
    float depth{0.0F};      // [0, 100]: cents on pitch, ×100 Hz on filter.
};

struct NoiseSettings {
    float level{0.0F};
    float filter_frequency{1000.0F};
    float filter_q{1.0F};
};

// Arena key of a voice. Monotonically increasing per engine, never
// reused.
using VoiceId = std::uint64_t;

// Construction-time options of a SynthEngine.
struct SynthOptions {
    // When false the master bus feeds an output tap instead of the
    // context destination.
    bool speakers_on{true};
    float master_volume{0.5F};
};

// Parameter store: every timbre setting read at note-on.
struct SynthSettings {
    std::array<OscillatorSettings, kNumOscillators> oscillators{
        OscillatorSettings{OscillatorRange::k8, Waveform::kSquare, 0.0F},
        OscillatorSettings{OscillatorRange::k4, Waveform::kSawtooth, 0.0F},
        OscillatorSettings{OscillatorRange::k16, Waveform::kSquare, 0.0F},
    };
    std::array<MixerChannel, kNumOscillators> mixer{};
    EnvelopeSettings volume_envelope{0.01F, 0.5F, 0.4F, 0.3F, 0.0F, 1.0F};
    FilterEnvelopeSettings filter_envelope{
        {0.1F, 0.5F, 2000.0F, 1.0F, 200.0F, 10000.0F},
        5.0F,
        10000.0F,
        1.0F,
        FilterType::kLowpass,
    };
    LfoSettings lfo{};
    NoiseSettings noise{};
    float master_volume{0.5F};
};

// Filter envelope values for one voice with the contour applied: the
// excursion above `start_level` of both the peak (cutoff) and the
// sustain level is multiplied by `contour`.
[[nodiscard]] EnvelopeSettings ContourScaledEnvelope(
    const FilterEnvelopeSettings& filter);

// Canonical slot key ("osc1".."osc3") for a zero-based slot index.
[[nodiscard]] std::string OscillatorKey(int slot);

}  // namespace sympathetic
