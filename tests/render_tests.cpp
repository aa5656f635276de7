#include <cassert>
#include <cmath>
#include <memory>
#include <vector>

#include "OfflineAudioContext.h"
#include "core/SynthEngine.h"
#include "core/WaveformHistory.h"

// Rendering through the reference graph: node semantics, clock and
// history bookkeeping, and what the engine actually sounds like.

using sympathetic::FilterType;
using sympathetic::OfflineAudioContext;
using sympathetic::SynthEngine;
using sympathetic::SynthOptions;
using sympathetic::Waveform;
using sympathetic::WaveformHistory;

int main()
{
    // --- WaveformHistory ------------------------------------------------
    {
        WaveformHistory history(8);
        history.setSampleRate(4.0);
        assert(history.peak(1.0) == 0.0F);

        float empty[3] = {1.0F, 1.0F, 1.0F};
        history.getSnapshot(empty, 3, 1.0);
        assert(empty[0] == 0.0F && empty[2] == 0.0F);

        const float samples[4] = {0.1F, -0.9F, 0.3F, 0.2F};
        history.writeSamples(samples, 4);
        assert(history.samplesWritten() == 4);
        assert(history.peak(1.0) == 0.9F);
        // Half a second at 4 Hz covers the last two samples only.
        assert(history.peak(0.5) == 0.3F);

        float ends[2] = {};
        history.getSnapshot(ends, 2, 1.0);
        assert(ends[0] == 0.1F);
        assert(ends[1] == 0.2F);

        // Older samples are overwritten once the ring wraps.
        const float more[6] = {0.0F, 0.0F, 0.0F, 0.0F, 0.0F, 0.05F};
        history.writeSamples(more, 6);
        assert(history.samplesWritten() == 10);
        assert(history.peak(2.0) == 0.3F);
        assert(history.peak(1.0) == 0.05F);

        history.reset();
        assert(history.samplesWritten() == 0);
        assert(history.peak(2.0) == 0.0F);
    }

    // --- Offline clock ------------------------------------------------
    {
        OfflineAudioContext context(1000.0);
        assert(context.currentTime() == 0.0);
        assert(context.sampleRate() == 1000.0);
        assert(context.nodeCount() == 1U);

        const auto block = context.render(250);
        assert(block.size() == 250U);
        assert(context.currentTime() == 0.25);
        assert(context.renderSeconds(0.5).size() == 500U);
        assert(context.currentTime() == 0.75);
        assert(context.history().samplesWritten() == 750);
        assert(context.advance(0.25) == 0.0F);
        assert(context.currentTime() == 1.0);

        // The clock stays continuous across a rate change.
        context.setSampleRate(2000.0);
        assert(context.currentTime() == 1.0);
        assert(context.history().samplesWritten() == 0);
        (void)context.render(1000);
        assert(context.currentTime() == 1.5);
    }

    // --- Nodes ----------------------------------------------------------
    {
        OfflineAudioContext context(1000.0);

        // 250 Hz square at 1 kHz: two samples high, two low.
        auto oscillator = context.createOscillator(250.0, Waveform::kSquare);
        auto gain = context.createGain(0.5);
        context.connect(oscillator, gain);
        context.connect(gain, context.destination());
        // Duplicate edges are ignored.
        context.connect(gain, context.destination());
        assert(context.graph().edges_from(gain->id()).size() == 1U);

        assert(context.render(4) == std::vector<float>(4, 0.0F));
        assert(oscillator->start(context.currentTime()));
        assert(!oscillator->start(context.currentTime()));
        const std::vector<float> expected{0.5F, 0.5F, -0.5F, -0.5F};
        assert(context.render(4) == expected);

        assert(oscillator->stop(context.currentTime()));
        assert(!oscillator->stop(context.currentTime()));
        assert(context.render(4) == std::vector<float>(4, 0.0F));

        // A 0 Hz square holds at +1 and works as a constant source for
        // parameter modulation.
        auto constant = context.createOscillator(0.0, Waveform::kSquare);
        auto depth = context.createGain(0.25);
        auto carrier = context.createOscillator(0.0, Waveform::kSquare);
        auto amp = context.createGain(0.5);
        context.connect(constant, depth);
        context.connect(carrier, amp);
        context.connect(amp, context.destination());
        context.connect(depth, amp, amp->gain());
        (void)constant->start(context.currentTime());
        (void)carrier->start(context.currentTime());

        assert(context.render(1)[0] == 0.75F);

        const auto graph = context.graph();
        assert(graph.count_nodes_of_kind("oscillator") == 3U);
        assert(graph.modulation_edges().size() == 1U);
        assert(graph.modulation_edges()[0].from_node_id == depth->id());
        assert(graph.modulation_edges()[0].to_param == "gain");

        assert(context.disconnect(depth, amp->gain()));
        assert(!context.disconnect(depth, amp->gain()));
        assert(context.render(1)[0] == 0.5F);

        // Nodes die once disconnected and released by their owners.
        const std::size_t before = context.nodeCount();
        assert(before == 7U);
        context.disconnect(constant);
        context.disconnect(depth);
        constant.reset();
        depth.reset();
        assert(context.nodeCount() == before - 2U);

        // Filters report what they were built with.
        auto filter = context.createFilter(FilterType::kBandpass, 800.0, 2.0);
        assert(filter->type() == FilterType::kBandpass);
        assert(filter->frequency().value() == 800.0);
        assert(filter->q().value() == 2.0);
        filter->setType(FilterType::kHighpass);
        assert(filter->type() == FilterType::kHighpass);

        // A foreign node is not wired.
        OfflineAudioContext other(1000.0);
        auto foreign = other.createGain(1.0);
        context.connect(foreign, context.destination());
        assert(context.graph().edges_from(foreign->id()).empty());

        // Noise starts once.
        auto noise = context.createNoise();
        assert(!noise->started());
        assert(noise->start(0.0));
        assert(!noise->start(0.0));
    }

    // --- Engine output ------------------------------------------------
    {
        OfflineAudioContext context;
        SynthEngine engine(context);
        assert(engine.lfo().pitchBus()->gain().value() == 0.0);
        assert(engine.lfo().filterBus()->gain().value() == 0.0);

        // Nothing plays before the first note.
        assert(context.advance(0.05) == 0.0F);

        engine.playNote("A4");
        const float held = context.advance(0.3);
        assert(held > 0.05F);
        assert(held <= 1.0F);
        assert(context.history().peak(0.05) > 0.0F);

        engine.stopNote("A4");
        (void)context.advance(0.3 + SynthEngine::kStopGuardSeconds + 0.05);
        assert(engine.reapFinishedVoices() == 1U);
        assert(context.advance(0.1) < 1e-6F);
    }

    // Muted channels silence the voice.
    {
        OfflineAudioContext context;
        SynthEngine engine(context);
        for (int slot = 0; slot < sympathetic::kNumOscillators; ++slot) {
            assert(engine.setMixerActive(slot, false));
        }
        engine.playNote("C4");
        assert(context.advance(0.2) == 0.0F);
    }

    // With speakers off nothing reaches the destination.
    {
        OfflineAudioContext context;
        SynthOptions options;
        options.speakers_on = false;
        SynthEngine engine(context, options);
        engine.playNote("C4");
        assert(context.advance(0.2) == 0.0F);
    }

    return 0;
}
