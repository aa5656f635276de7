#include "core/SynthSettings.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>

namespace sympathetic {

namespace {

bool EqualsIgnoreCase(const std::string_view a, const std::string_view b)
{
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

constexpr std::array<OscillatorRange, 5> kRanges = {
    OscillatorRange::k2, OscillatorRange::k4, OscillatorRange::k8,
    OscillatorRange::k16, OscillatorRange::k32,
};

}  // namespace

const WaveformModes& SupportedWaveforms()
{
    // Same order as the Waveform enum so indices map directly.
    static const WaveformModes kModes = {
        WaveformMode{Waveform::kSine, "sine"},
        WaveformMode{Waveform::kTriangle, "triangle"},
        WaveformMode{Waveform::kSawtooth, "sawtooth"},
        WaveformMode{Waveform::kSquare, "square"},
    };
    return kModes;
}

const FilterTypeModes& SupportedFilterTypes()
{
    static const FilterTypeModes kModes = {
        FilterTypeMode{FilterType::kLowpass, "lowpass"},
        FilterTypeMode{FilterType::kHighpass, "highpass"},
        FilterTypeMode{FilterType::kBandpass, "bandpass"},
    };
    return kModes;
}

const char* WaveformName(const Waveform waveform)
{
    return SupportedWaveforms()[static_cast<std::size_t>(waveform)].name;
}

std::optional<Waveform> WaveformFromName(const std::string_view name)
{
    for (const auto& mode : SupportedWaveforms()) {
        if (EqualsIgnoreCase(name, mode.name)) {
            return mode.waveform;
        }
    }
    // Short alias commonly used by synth front-ends.
    if (EqualsIgnoreCase(name, "saw")) {
        return Waveform::kSawtooth;
    }
    return std::nullopt;
}

const char* FilterTypeName(const FilterType type)
{
    return SupportedFilterTypes()[static_cast<std::size_t>(type)].name;
}

std::optional<FilterType> FilterTypeFromName(const std::string_view name)
{
    for (const auto& mode : SupportedFilterTypes()) {
        if (EqualsIgnoreCase(name, mode.name)) {
            return mode.type;
        }
    }
    return std::nullopt;
}

double RangeMultiplier(const OscillatorRange range)
{
    switch (range) {
    case OscillatorRange::k2: return 4.0;
    case OscillatorRange::k4: return 2.0;
    case OscillatorRange::k8: return 1.0;
    case OscillatorRange::k16: return 0.5;
    case OscillatorRange::k32: return 0.25;
    }
    return 1.0;
}

std::optional<OscillatorRange> RangeFromFeet(const int feet)
{
    for (const auto range : kRanges) {
        if (static_cast<int>(range) == feet) {
            return range;
        }
    }
    return std::nullopt;
}

OscillatorRange SnapRange(const double feet)
{
    if (!(feet > 0.0)) {
        return OscillatorRange::k2;
    }

    const double target = std::log2(feet);
    OscillatorRange best = OscillatorRange::k8;
    double bestDistance = std::numeric_limits<double>::max();
    for (const auto range : kRanges) {
        const double distance =
            std::abs(std::log2(static_cast<double>(range)) - target);
        if (distance < bestDistance) {
            bestDistance = distance;
            best = range;
        }
    }
    return best;
}

EnvelopeSettings ContourScaledEnvelope(const FilterEnvelopeSettings& filter)
{
    const float contour = std::clamp(filter.contour, 0.0F, 1.0F);
    const float start = filter.start_level;

    EnvelopeSettings scaled = filter;
    scaled.max_level = start + (filter.cutoff_frequency - start) * contour;
    scaled.sustain = start + (filter.sustain - start) * contour;
    return scaled;
}

std::string OscillatorKey(const int slot)
{
    return "osc" + std::to_string(slot + 1);
}

}  // namespace sympathetic
