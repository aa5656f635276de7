#include <cassert>
#include <cmath>
#include <string>

#include "core/NoteConversion.h"
#include "core/SynthSettings.h"

// Note, MIDI and range conversions. Runs as a normal binary under CTest.

using sympathetic::FilterType;
using sympathetic::FilterTypeFromName;
using sympathetic::FrequencyToMidi;
using sympathetic::FrequencyToNoteName;
using sympathetic::MidiToFrequency;
using sympathetic::MidiToNoteName;
using sympathetic::NoteToFrequency;
using sympathetic::OscillatorRange;
using sympathetic::ParseNoteName;
using sympathetic::RangeFromFeet;
using sympathetic::RangeMultiplier;
using sympathetic::SnapRange;
using sympathetic::Waveform;
using sympathetic::WaveformFromName;
using sympathetic::WaveformName;

namespace {

bool near(const double a, const double b, const double eps = 1e-9)
{
    return std::abs(a - b) <= eps;
}

}  // namespace

int main()
{
    // Note names.
    assert(ParseNoteName("C4") == 60);
    assert(ParseNoteName("A4") == 69);
    assert(ParseNoteName("C#4") == 61);
    assert(ParseNoteName("Bb3") == 58);
    assert(ParseNoteName("a4") == 69);
    assert(ParseNoteName("C-1") == 0);
    assert(ParseNoteName("G9") == 127);
    assert(ParseNoteName("C10") == 132);

    assert(!ParseNoteName("").has_value());
    assert(!ParseNoteName("C").has_value());
    assert(!ParseNoteName("C#").has_value());
    assert(!ParseNoteName("H4").has_value());
    assert(!ParseNoteName("4C").has_value());
    assert(!ParseNoteName("C4x").has_value());
    assert(!ParseNoteName("C-").has_value());
    assert(!ParseNoteName("C99999").has_value());

    // A4 is exactly the concert pitch, no rounding involved.
    assert(NoteToFrequency("A4") == 440.0);
    assert(NoteToFrequency("A5") == 880.0);
    assert(NoteToFrequency("A3") == 220.0);
    assert(near(NoteToFrequency("C4"), 261.6255653005986, 1e-9));

    // Malformed names fall back to 440 Hz instead of failing.
    assert(NoteToFrequency("not-a-note") == 440.0);
    assert(NoteToFrequency("") == 440.0);

    // MIDI <-> frequency.
    assert(MidiToFrequency(69.0) == 440.0);
    assert(near(MidiToFrequency(81.0), 880.0));
    assert(near(FrequencyToMidi(440.0), 69.0));
    assert(near(FrequencyToMidi(220.0), 57.0));
    assert(FrequencyToMidi(0.0) == 0.0);
    assert(FrequencyToMidi(-10.0) == 0.0);

    // MIDI <-> names.
    assert(MidiToNoteName(60) == "C4");
    assert(MidiToNoteName(61) == "C#4");
    assert(MidiToNoteName(0) == "C-1");
    assert(MidiToNoteName(127) == "G9");
    assert(MidiToNoteName(-5) == "C-1");
    assert(MidiToNoteName(300) == "G9");

    // Every MIDI name parses back to its number.
    for (int note = 0; note <= 127; ++note) {
        assert(ParseNoteName(MidiToNoteName(note)) == note);
    }

    assert(FrequencyToNoteName(440.0) == "A4");
    assert(FrequencyToNoteName(445.0) == "A4");
    assert(FrequencyToNoteName(261.63) == "C4");

    // Range table.
    assert(RangeMultiplier(OscillatorRange::k2) == 4.0);
    assert(RangeMultiplier(OscillatorRange::k4) == 2.0);
    assert(RangeMultiplier(OscillatorRange::k8) == 1.0);
    assert(RangeMultiplier(OscillatorRange::k16) == 0.5);
    assert(RangeMultiplier(OscillatorRange::k32) == 0.25);
    assert(NoteToFrequency("A4") * RangeMultiplier(OscillatorRange::k32) == 110.0);

    assert(RangeFromFeet(16) == OscillatorRange::k16);
    assert(!RangeFromFeet(3).has_value());

    // Off-table values snap to the nearest octave.
    assert(SnapRange(8.0) == OscillatorRange::k8);
    assert(SnapRange(5.0) == OscillatorRange::k4);
    assert(SnapRange(12.0) == OscillatorRange::k16);
    assert(SnapRange(64.0) == OscillatorRange::k32);
    assert(SnapRange(1.0) == OscillatorRange::k2);
    assert(SnapRange(0.0) == OscillatorRange::k2);

    // Names of the enums.
    assert(WaveformFromName("Sawtooth") == Waveform::kSawtooth);
    assert(WaveformFromName("saw") == Waveform::kSawtooth);
    assert(WaveformFromName("SINE") == Waveform::kSine);
    assert(!WaveformFromName("noise").has_value());
    assert(std::string(WaveformName(Waveform::kTriangle)) == "triangle");
    assert(FilterTypeFromName("BandPass") == FilterType::kBandpass);
    assert(!FilterTypeFromName("notch").has_value());

    return 0;
}
