#include "core/PatchSerialization.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <functional>
#include <iomanip>
#include <limits>
#include <sstream>
#include <variant>

namespace sympathetic {

namespace {

using FieldRef = std::variant<std::optional<float>*, std::optional<Waveform>*,
                              std::optional<OscillatorRange>*,
                              std::optional<FilterType>*>;

struct PatchKey {
    std::string name;
    std::function<FieldRef(SynthPatch&)> field;
};

std::vector<PatchKey> BuildPatchKeys()
{
    std::vector<PatchKey> keys;

    for (int slot = 0; slot < kNumOscillators; ++slot) {
        const std::string prefix = OscillatorKey(slot);
        keys.push_back({prefix + "Waveform", [slot](SynthPatch& p) {
                            return FieldRef{&p.oscillators[slot].waveform};
                        }});
        keys.push_back({prefix + "Range", [slot](SynthPatch& p) {
                            return FieldRef{&p.oscillators[slot].range};
                        }});
        keys.push_back({prefix + "Detune", [slot](SynthPatch& p) {
                            return FieldRef{&p.oscillators[slot].detune};
                        }});
        keys.push_back({prefix + "Volume", [slot](SynthPatch& p) {
                            return FieldRef{&p.oscillators[slot].volume};
                        }});
    }

    keys.push_back({"filterAttack", [](SynthPatch& p) {
                        return FieldRef{&p.filter.envelope.attack};
                    }});
    keys.push_back({"filterDecay", [](SynthPatch& p) {
                        return FieldRef{&p.filter.envelope.decay};
                    }});
    keys.push_back({"filterSustain", [](SynthPatch& p) {
                        return FieldRef{&p.filter.envelope.sustain};
                    }});
    keys.push_back({"filterRelease", [](SynthPatch& p) {
                        return FieldRef{&p.filter.envelope.release};
                    }});
    keys.push_back({"filterCutoff",
                    [](SynthPatch& p) { return FieldRef{&p.filter.cutoff}; }});
    keys.push_back({"filterStartLevel", [](SynthPatch& p) {
                        return FieldRef{&p.filter.envelope.start_level};
                    }});
    keys.push_back({"filterEmphasis",
                    [](SynthPatch& p) { return FieldRef{&p.filter.q}; }});
    keys.push_back({"filterContour",
                    [](SynthPatch& p) { return FieldRef{&p.filter.contour}; }});
    keys.push_back({"filterType", [](SynthPatch& p) {
                        return FieldRef{&p.filter.filter_type};
                    }});

    keys.push_back({"volumeAttack", [](SynthPatch& p) {
                        return FieldRef{&p.volume_envelope.attack};
                    }});
    keys.push_back({"volumeDecay", [](SynthPatch& p) {
                        return FieldRef{&p.volume_envelope.decay};
                    }});
    keys.push_back({"volumeSustain", [](SynthPatch& p) {
                        return FieldRef{&p.volume_envelope.sustain};
                    }});
    keys.push_back({"volumeRelease", [](SynthPatch& p) {
                        return FieldRef{&p.volume_envelope.release};
                    }});

    keys.push_back({"masterVolume",
                    [](SynthPatch& p) { return FieldRef{&p.master_volume}; }});
    keys.push_back({"noiseLevel",
                    [](SynthPatch& p) { return FieldRef{&p.noise.level}; }});
    keys.push_back({"noiseFilterFreq", [](SynthPatch& p) {
                        return FieldRef{&p.noise.filter_frequency};
                    }});
    keys.push_back({"noiseFilterQ",
                    [](SynthPatch& p) { return FieldRef{&p.noise.filter_q}; }});

    keys.push_back({"lfoWaveform",
                    [](SynthPatch& p) { return FieldRef{&p.lfo.waveform}; }});
    keys.push_back({"lfoFrequency",
                    [](SynthPatch& p) { return FieldRef{&p.lfo.frequency}; }});
    keys.push_back({"lfoDepth",
                    [](SynthPatch& p) { return FieldRef{&p.lfo.depth}; }});

    return keys;
}

const std::vector<PatchKey>& PatchKeys()
{
    static const std::vector<PatchKey> keys = BuildPatchKeys();
    return keys;
}

std::string_view Trim(std::string_view s)
{
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    return s;
}

std::optional<double> ParseNumber(std::string_view text)
{
    if (text.empty()) {
        return std::nullopt;
    }
    const std::string buffer(text);
    char* end = nullptr;
    const double value = std::strtod(buffer.c_str(), &end);
    if (end != buffer.c_str() + buffer.size() || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

// Parses `text` into the field referenced by `ref`. Returns false when
// the value is not valid for that field type.
bool AssignValue(const FieldRef& ref, std::string_view text)
{
    if (auto* const* f = std::get_if<std::optional<float>*>(&ref)) {
        const auto value = ParseNumber(text);
        if (!value.has_value()) {
            return false;
        }
        // Out-of-range magnitudes saturate; clamping into the field's
        // domain happens later in ClampPatch().
        constexpr double kFloatMax = std::numeric_limits<float>::max();
        **f = static_cast<float>(std::clamp(*value, -kFloatMax, kFloatMax));
        return true;
    }
    if (auto* const* w = std::get_if<std::optional<Waveform>*>(&ref)) {
        const auto waveform = WaveformFromName(text);
        if (!waveform.has_value()) {
            return false;
        }
        **w = *waveform;
        return true;
    }
    if (auto* const* r = std::get_if<std::optional<OscillatorRange>*>(&ref)) {
        const auto value = ParseNumber(text);
        if (!value.has_value()) {
            return false;
        }
        **r = SnapRange(*value);
        return true;
    }
    if (auto* const* t = std::get_if<std::optional<FilterType>*>(&ref)) {
        const auto type = FilterTypeFromName(text);
        if (!type.has_value()) {
            return false;
        }
        **t = *type;
        return true;
    }
    return false;
}

// Writes the textual value of a present field. Returns false when the
// field is absent.
bool FormatValue(const FieldRef& ref, std::ostringstream& out)
{
    if (auto* const* f = std::get_if<std::optional<float>*>(&ref)) {
        if (!(*f)->has_value()) {
            return false;
        }
        // Enough digits for the value to parse back bit-exact.
        out << std::setprecision(std::numeric_limits<float>::max_digits10)
            << **(*f);
        return true;
    }
    if (auto* const* w = std::get_if<std::optional<Waveform>*>(&ref)) {
        if (!(*w)->has_value()) {
            return false;
        }
        out << WaveformName(**(*w));
        return true;
    }
    if (auto* const* r = std::get_if<std::optional<OscillatorRange>*>(&ref)) {
        if (!(*r)->has_value()) {
            return false;
        }
        out << static_cast<int>(**(*r));
        return true;
    }
    if (auto* const* t = std::get_if<std::optional<FilterType>*>(&ref)) {
        if (!(*t)->has_value()) {
            return false;
        }
        out << FilterTypeName(**(*t));
        return true;
    }
    return false;
}

}  // namespace

bool ParsePatchAssignment(const std::string_view assignment,
                          SynthPatch& patch,
                          std::string* const error_message)
{
    const std::string_view trimmed = Trim(assignment);
    const auto eq = trimmed.find('=');
    if (eq == std::string_view::npos) {
        if (error_message != nullptr) {
            *error_message =
                "Expected key=value, got '" + std::string(trimmed) + "'";
        }
        return false;
    }

    const std::string_view key = Trim(trimmed.substr(0, eq));
    const std::string_view value = Trim(trimmed.substr(eq + 1));

    for (const auto& entry : PatchKeys()) {
        if (entry.name != key) {
            continue;
        }

        // Parse into a scratch copy so that a bad value leaves `patch`
        // untouched.
        SynthPatch candidate = patch;
        if (!AssignValue(entry.field(candidate), value)) {
            if (error_message != nullptr) {
                *error_message = "Invalid value '" + std::string(value) +
                                 "' for " + entry.name;
            }
            return false;
        }

        patch = candidate;
        if (error_message != nullptr) {
            error_message->clear();
        }
        return true;
    }

    if (error_message != nullptr) {
        *error_message = "Unknown patch key '" + std::string(key) + "'";
    }
    return false;
}

std::string SerializePatch(const SynthPatch& patch)
{
    SynthPatch copy = patch;
    std::ostringstream out;

    for (const auto& entry : PatchKeys()) {
        std::ostringstream value;
        if (!FormatValue(entry.field(copy), value)) {
            continue;
        }
        out << entry.name << '=' << value.str() << '\n';
    }

    return out.str();
}

std::vector<std::string> SupportedPatchKeys()
{
    std::vector<std::string> names;
    names.reserve(PatchKeys().size());
    for (const auto& entry : PatchKeys()) {
        names.push_back(entry.name);
    }
    return names;
}

}  // namespace sympathetic
