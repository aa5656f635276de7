#include "core/SynthPatch.h"

#include <algorithm>
#include <cmath>

namespace sympathetic {

namespace {

void ClampField(std::optional<float>& field, const float lo, const float hi)
{
    if (!field.has_value()) {
        return;
    }
    if (std::isnan(*field)) {
        field.reset();
        return;
    }
    field = std::clamp(*field, lo, hi);
}

}  // namespace

bool EnvelopePatch::empty() const
{
    return !attack && !decay && !sustain && !release && !start_level &&
           !max_level;
}

bool OscillatorPatch::empty() const
{
    return !waveform && !range && !detune && !volume;
}

bool FilterPatch::empty() const
{
    return envelope.empty() && !cutoff && !q && !contour && !filter_type;
}

bool LfoPatch::empty() const
{
    return !waveform && !frequency && !depth;
}

bool NoisePatch::empty() const
{
    return !level && !filter_frequency && !filter_q;
}

bool SynthPatch::empty() const
{
    return std::all_of(oscillators.begin(), oscillators.end(),
                       [](const OscillatorPatch& p) { return p.empty(); }) &&
           filter.empty() && volume_envelope.empty() && !master_volume &&
           noise.empty() && lfo.empty();
}

SynthPatch ClampPatch(const SynthPatch& patch)
{
    using namespace patch_limits;

    SynthPatch out = patch;

    for (auto& osc : out.oscillators) {
        ClampField(osc.detune, kDetuneMin, kDetuneMax);
        ClampField(osc.volume, 0.0F, 1.0F);
    }

    ClampField(out.filter.envelope.attack, 0.0F, kFilterAttackMax);
    ClampField(out.filter.envelope.decay, 0.0F, kFilterDecayMax);
    ClampField(out.filter.envelope.sustain, 0.0F, kFilterSustainMax);
    ClampField(out.filter.envelope.release, 0.0F, kFilterReleaseMax);
    ClampField(out.filter.envelope.start_level, kFilterStartLevelMin,
               kFilterStartLevelMax);
    // The peak of the filter envelope is always the cutoff.
    out.filter.envelope.max_level.reset();
    ClampField(out.filter.cutoff, kFilterCutoffMin, kFilterCutoffMax);
    ClampField(out.filter.q, 0.0F, kFilterQMax);
    ClampField(out.filter.contour, 0.0F, 1.0F);

    ClampField(out.volume_envelope.attack, 0.0F, kVolumeAttackMax);
    ClampField(out.volume_envelope.decay, kVolumeDecayMin, kVolumeDecayMax);
    ClampField(out.volume_envelope.sustain, kVolumeSustainMin, 1.0F);
    ClampField(out.volume_envelope.release, 0.0F, kVolumeReleaseMax);
    out.volume_envelope.start_level.reset();
    out.volume_envelope.max_level.reset();

    ClampField(out.master_volume, 0.0F, 1.0F);

    ClampField(out.noise.level, 0.0F, 1.0F);
    ClampField(out.noise.filter_frequency, kNoiseFilterFrequencyMin,
               kNoiseFilterFrequencyMax);
    ClampField(out.noise.filter_q, kNoiseFilterQMin, kNoiseFilterQMax);

    ClampField(out.lfo.frequency, 0.0F, kLfoFrequencyMax);
    ClampField(out.lfo.depth, 0.0F, kLfoDepthMax);

    return out;
}

}  // namespace sympathetic
