#include <algorithm>
#include <cassert>
#include <cmath>
#include <limits>
#include <memory>
#include <string>

#include "OfflineAudioContext.h"
#include "core/SynthEngine.h"

// Voice allocation, release scheduling and live parameter routing of the
// engine, driven on an offline render graph.

using sympathetic::AudioParam;
using sympathetic::AutomationEvent;
using sympathetic::EnvelopePatch;
using sympathetic::FilterPatch;
using sympathetic::FilterType;
using sympathetic::kMinimumLevel;
using sympathetic::LfoPatch;
using sympathetic::MidiNoteEvent;
using sympathetic::OfflineAudioContext;
using sympathetic::OscillatorPatch;
using sympathetic::SynthEngine;
using sympathetic::SynthOptions;
using sympathetic::SynthPatch;

namespace {

bool near(const double a, const double b, const double eps = 1e-6)
{
    return std::abs(a - b) <= eps;
}

bool exponentialEndpointsSafe(const AudioParam& param)
{
    for (const auto& event : param.events()) {
        if (event.kind == AutomationEvent::Kind::kExponentialRamp &&
            event.value < static_cast<double>(kMinimumLevel)) {
            return false;
        }
    }
    return true;
}

double maxEventValue(const AudioParam& param)
{
    double result = 0.0;
    for (const auto& event : param.events()) {
        result = std::max(result, event.value);
    }
    return result;
}

bool voiceParamsSafe(const SynthEngine::VoiceSnapshot& voice)
{
    for (const auto& gain : voice.gains) {
        if (!exponentialEndpointsSafe(gain->gain())) {
            return false;
        }
    }
    for (const auto& filter : voice.filters) {
        if (!exponentialEndpointsSafe(filter->frequency())) {
            return false;
        }
    }
    return true;
}

}  // namespace

int main()
{
    // A note builds one chain per oscillator at the range-scaled pitch.
    {
        OfflineAudioContext context;
        SynthEngine engine(context);
        assert(!engine.noiseGateOpen());
        assert(engine.output() == nullptr);

        engine.playNote("A4");
        assert(engine.activeVoiceCount() == 1U);
        assert(engine.isNoteActive("A4"));
        assert(engine.noiseGateOpen());

        const auto voice = engine.voice("A4");
        assert(voice.has_value());
        assert(voice->frequency == 440.0);
        assert(voice->oscillators.size() == 3U);
        assert(voice->gains.size() == 3U);
        assert(voice->filters.size() == 3U);
        // Default ranges 8', 4' and 16'.
        assert(voice->oscillators[0]->frequency().value() == 440.0);
        assert(voice->oscillators[1]->frequency().value() == 880.0);
        assert(voice->oscillators[2]->frequency().value() == 220.0);
        assert(voice->oscillators[0]->startTime() == 0.0);
        assert(!voice->oscillators[0]->stopTime().has_value());
        assert(voice->filters[0]->type() == FilterType::kLowpass);
        assert(voiceParamsSafe(*voice));

        // Malformed names still play, at concert pitch.
        engine.playNote("not-a-note");
        assert(engine.voice("not-a-note")->frequency == 440.0);
        assert(engine.activeVoiceCount() == 2U);
        assert(engine.activeNotes().size() == 2U);

        // Unknown keys are ignored.
        engine.stopNote("C9");
        assert(engine.activeVoiceCount() == 2U);
    }

    // Playing an active key replaces the voice instead of stacking.
    {
        OfflineAudioContext context;
        SynthEngine engine(context);

        engine.playNote("C4");
        const auto first = engine.voice("C4");
        engine.playNote("C4");
        const auto second = engine.voice("C4");

        assert(engine.activeVoiceCount() == 1U);
        assert(engine.releasingVoiceCount() == 1U);
        assert(first->id != second->id);

        const auto replaced = engine.voiceById(first->id);
        assert(replaced.has_value());
        assert(replaced->release_start == 0.0);
        for (const auto& oscillator : replaced->oscillators) {
            assert(oscillator->stopTime().has_value());
            assert(near(*oscillator->stopTime(),
                        0.3 + SynthEngine::kStopGuardSeconds));
        }
        assert(!second->oscillators[0]->stopTime().has_value());
        assert(voiceParamsSafe(*replaced));
        assert(voiceParamsSafe(*second));
    }

    // The release time is captured when the note starts.
    {
        OfflineAudioContext context;
        SynthEngine engine(context);

        engine.playNote("E4");
        EnvelopePatch longRelease;
        longRelease.release = 2.0F;
        engine.updateVolumeEnvelope(longRelease);
        assert(engine.settings().volume_envelope.release == 2.0F);

        const auto id = engine.voice("E4")->id;
        engine.stopNote("E4");
        const auto released = engine.voiceById(id);
        assert(released.has_value());
        assert(near(released->release_time, 0.3));
        assert(near(*released->teardown_deadline,
                    0.3 + SynthEngine::kStopGuardSeconds));

        // The gain fades linearly to silence over the captured release.
        const AudioParam& gain = released->gains[0]->gain();
        assert(gain.events().back().kind == AutomationEvent::Kind::kLinearRamp);
        assert(gain.valueAtTime(0.3 + 1e-6) == 0.0);

        engine.playNote("E4");
        assert(engine.voice("E4")->release_time == 2.0F);
    }

    // Event times never lie in the past.
    {
        OfflineAudioContext context;
        SynthEngine engine(context);
        (void)context.advance(0.1);
        const double now = context.currentTime();

        engine.playNote("G4", 0.0);
        assert(engine.voice("G4")->start_time == now);
        engine.playNote("B4", now + 0.25);
        assert(engine.voice("B4")->start_time == now + 0.25);
    }

    // The noise gate follows the active-voice count.
    {
        OfflineAudioContext context;
        SynthEngine engine(context);

        engine.playNote("A4");
        engine.playNote("C5");
        assert(engine.noiseGateOpen());
        engine.stopNote("A4");
        assert(engine.noiseGateOpen());
        engine.stopNote("C5");
        assert(!engine.noiseGateOpen());

        engine.playNote("D4");
        engine.playNote("F4");
        engine.stopAll();
        assert(engine.activeVoiceCount() == 0U);
        assert(engine.releasingVoiceCount() == 4U);
        assert(!engine.noiseGateOpen());
    }

    // Filter edits reach new voices only; contour scales the excursion.
    {
        OfflineAudioContext context;
        SynthEngine engine(context);

        engine.playNote("A3");
        const auto before = engine.voice("A3");
        assert(maxEventValue(before->filters[0]->frequency()) == 10000.0);

        SynthPatch patch;
        patch.filter.cutoff = 5000.0F;
        engine.applyPatch(patch);
        assert(engine.settings().filter_envelope.cutoff_frequency == 5000.0F);
        assert(engine.settings().filter_envelope.max_level == 5000.0F);

        engine.playNote("A4");
        const auto after = engine.voice("A4");
        assert(maxEventValue(after->filters[0]->frequency()) == 5000.0);
        assert(maxEventValue(before->filters[0]->frequency()) == 10000.0);

        FilterPatch contour;
        contour.cutoff = 10000.0F;
        contour.contour = 0.5F;
        contour.filter_type = FilterType::kBandpass;
        engine.updateFilterEnvelope(contour);
        engine.playNote("A5");
        const auto scaled = engine.voice("A5");
        const auto events = scaled->filters[0]->frequency().events();
        assert(events.size() == 3U);
        assert(events[0].value == 200.0);
        assert(events[1].value == 5100.0);
        assert(events[2].value == 1100.0);
        assert(scaled->filters[0]->type() == FilterType::kBandpass);

        engine.setFilterType(FilterType::kHighpass);
        engine.playNote("A2");
        assert(engine.voice("A2")->filters[0]->type() == FilterType::kHighpass);
        assert(scaled->filters[0]->type() == FilterType::kBandpass);
    }

    // A replayed note starts again from the floor.
    {
        OfflineAudioContext context;
        SynthEngine engine(context);

        engine.playNote("C3");
        (void)context.advance(0.05);
        engine.stopNote("C3");
        (void)context.advance(0.05);
        engine.playNote("C3");

        const auto voice = engine.voice("C3");
        const double start = voice->start_time;
        assert(near(voice->gains[0]->gain().valueAtTime(start), kMinimumLevel,
                    1e-9));
        assert(near(voice->filters[0]->frequency().valueAtTime(start), 200.0));
        assert(engine.releasingVoiceCount() == 1U);
    }

    // Released voices are torn down after their deadline.
    {
        OfflineAudioContext context;
        SynthEngine engine(context);
        const std::size_t baseline = context.nodeCount();

        engine.playNote("F3");
        const auto id = engine.voice("F3")->id;
        assert(engine.lfo().isVoiceConnected(id));
        assert(!engine.lfo().isVoiceConnected(id + 1));
        assert(engine.lfo().connectedVoiceCount() == 1U);
        assert(engine.lfo().tapCount() == 6U);
        assert(context.nodeCount() == baseline + 9U);

        engine.stopNote("F3");
        assert(engine.reapFinishedVoices() == 0U);
        assert(engine.releasingVoiceCount() == 1U);

        (void)context.advance(0.45);
        assert(engine.reapFinishedVoices() == 1U);
        assert(engine.releasingVoiceCount() == 0U);
        assert(engine.lfo().tapCount() == 0U);
        assert(!engine.lfo().isVoiceConnected(id));
        assert(context.nodeCount() == baseline);

        // Note events reap on their own.
        engine.playNote("G3");
        engine.stopNote("G3");
        (void)context.advance(0.45);
        engine.playNote("A3");
        assert(engine.releasingVoiceCount() == 0U);
        assert(engine.activeVoiceCount() == 1U);
    }

    // Mixer channels, master volume and clamping.
    {
        OfflineAudioContext context;
        SynthEngine engine(context);

        assert(engine.setMixerActive(1, false));
        assert(engine.mixer().channel(1)->gain().value() == 0.0);
        assert(engine.mixer().channelSettings(1).volume == 0.25F);
        assert(!engine.settings().mixer[1].active);
        assert(engine.setMixerActive(1, true));
        assert(engine.mixer().channel(1)->gain().value() == 0.25);

        assert(engine.updateMixer(0, 2.0F));
        assert(engine.settings().mixer[0].volume == 1.0F);
        assert(!engine.updateMixer(3, 0.5F));
        assert(!engine.setMixerActive(-1, true));

        engine.setVolume(-1.0F);
        assert(engine.settings().master_volume == 0.0F);
        assert(engine.mixer().master()->gain().value() == 0.0);
        engine.setVolume(0.75F);
        assert(engine.mixer().master()->gain().value() == 0.75);

        engine.setNoiseLevel(0.5F);
        assert(engine.noise().sourceStarted());
        assert(engine.settings().noise.level == 0.5F);
        engine.setNoiseFilterFrequency(1.0F);
        assert(engine.settings().noise.filter_frequency == 20.0F);
        engine.setNoiseFilterQ(100.0F);
        assert(engine.settings().noise.filter_q == 20.0F);
    }

    // Non-finite levels are ignored and the output stays usable.
    {
        OfflineAudioContext context;
        SynthEngine engine(context);
        const float nan = std::numeric_limits<float>::quiet_NaN();

        engine.setNoiseLevel(0.5F);
        engine.playNote("A4");

        engine.setNoiseFilterFrequency(nan);
        engine.setNoiseFilterQ(nan);
        engine.setNoiseLevel(std::numeric_limits<float>::infinity());
        engine.setVolume(nan);
        assert(engine.updateMixer(0, nan));

        const auto settings = engine.settings();
        assert(settings.noise.filter_frequency == 1000.0F);
        assert(settings.noise.filter_q == 1.0F);
        assert(settings.noise.level == 0.5F);
        assert(settings.master_volume == 0.5F);
        assert(settings.mixer[0].volume == 0.25F);
        assert(engine.noise().filter()->frequency().value() == 1000.0);
        assert(engine.mixer().master()->gain().value() == 0.5);

        const float peak = context.advance(0.2);
        assert(std::isfinite(peak));
        assert(peak > 0.0F);
        // Still finite after the first block.
        const float later = context.advance(0.2);
        assert(std::isfinite(later));
        assert(later > 0.0F);

        // A NaN reaching a filter parameter directly keeps the old cutoff.
        engine.voice("A4")->filters[0]->frequency().setValue(nan);
        const float poisoned = context.advance(0.1);
        assert(std::isfinite(poisoned));
        assert(poisoned > 0.0F);
    }

    // Detune and the LFO act on sounding voices.
    {
        OfflineAudioContext context;
        SynthEngine engine(context);
        engine.playNote("A4");

        OscillatorPatch detune;
        detune.detune = 80.0F;
        assert(engine.updateOscillator(0, detune));
        assert(engine.settings().oscillators[0].detune == 50.0F);
        assert(engine.voice("A4")->oscillators[0]->detune().value() == 50.0);
        assert(engine.voice("A4")->oscillators[1]->detune().value() == 0.0);
        assert(!engine.updateOscillator(3, detune));

        // Range only affects later notes.
        OscillatorPatch range;
        range.range = sympathetic::OscillatorRange::k32;
        assert(engine.updateOscillator(0, range));
        assert(engine.voice("A4")->oscillators[0]->frequency().value() == 440.0);
        engine.playNote("A3");
        assert(engine.voice("A3")->oscillators[0]->frequency().value() == 55.0);

        LfoPatch lfo;
        lfo.depth = 10.0F;
        lfo.frequency = 5.0F;
        engine.updateLFO(lfo);
        assert(engine.lfo().pitchBus()->gain().value() == 10.0);
        assert(engine.lfo().filterBus()->gain().value() == 1000.0);
        assert(engine.settings().lfo.frequency == 5.0F);
        assert(engine.lfo().tapCount() == 12U);
    }

    // MIDI note events.
    {
        OfflineAudioContext context;
        SynthEngine engine(context);

        MidiNoteEvent on;
        on.note = 69;
        on.velocity01 = 0.8F;
        on.is_note_on = true;
        engine.handleMidiEvent(on);
        assert(engine.isNoteActive("A4"));

        // Note-on with zero velocity is a note-off.
        MidiNoteEvent silent = on;
        silent.velocity01 = 0.0F;
        engine.handleMidiEvent(silent);
        assert(!engine.isNoteActive("A4"));

        engine.handleMidiEvent(on);
        MidiNoteEvent off = on;
        off.is_note_on = false;
        engine.handleMidiEvent(off);
        assert(engine.activeVoiceCount() == 0U);
        assert(engine.releasingVoiceCount() == 2U);
    }

    // With speakers off the master feeds an output tap.
    {
        OfflineAudioContext context;
        SynthOptions options;
        options.speakers_on = false;
        options.master_volume = 0.3F;
        SynthEngine engine(context, options);
        assert(engine.output() != nullptr);
        assert(engine.settings().master_volume == 0.3F);

        const auto edges = context.graph().edges_from(engine.mixer().master()->id());
        assert(edges.size() == 1U);
        assert(edges[0].to_node_id == engine.output()->id());
    }

    return 0;
}
