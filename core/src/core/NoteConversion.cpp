#include "core/NoteConversion.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>

#include <juce_core/juce_core.h>

namespace sympathetic {

namespace {

constexpr std::array<const char*, 12> kSharpNoteNames = {
    "C", "C#", "D", "D#", "E", "F", "F#", "G", "G#", "A", "A#", "B",
};

// Semitone offset of the natural note letters relative to C.
std::optional<int> NaturalSemitone(const char letter)
{
    switch (std::toupper(static_cast<unsigned char>(letter))) {
    case 'C': return 0;
    case 'D': return 2;
    case 'E': return 4;
    case 'F': return 5;
    case 'G': return 7;
    case 'A': return 9;
    case 'B': return 11;
    default: return std::nullopt;
    }
}

}  // namespace

std::optional<int> ParseNoteName(const std::string_view note)
{
    if (note.size() < 2) {
        return std::nullopt;
    }

    const auto natural = NaturalSemitone(note[0]);
    if (!natural.has_value()) {
        return std::nullopt;
    }

    std::size_t pos = 1;
    int semitone = *natural;
    if (note[pos] == '#') {
        ++semitone;
        ++pos;
    } else if (note[pos] == 'b') {
        --semitone;
        ++pos;
    }

    bool negative = false;
    if (pos < note.size() && note[pos] == '-') {
        negative = true;
        ++pos;
    }

    if (pos >= note.size()) {
        return std::nullopt;
    }

    int octave = 0;
    for (; pos < note.size(); ++pos) {
        const char ch = note[pos];
        if (std::isdigit(static_cast<unsigned char>(ch)) == 0) {
            return std::nullopt;
        }
        octave = octave * 10 + (ch - '0');
        // No meaningful pitch lives this far out; reject instead of
        // overflowing.
        if (octave > 1000) {
            return std::nullopt;
        }
    }
    if (negative) {
        octave = -octave;
    }

    return (octave + 1) * 12 + semitone;
}

double NoteToFrequency(const std::string_view note)
{
    const auto midi = ParseNoteName(note);
    if (!midi.has_value()) {
        juce::Logger::writeToLog(
            "[sympathetic-core] Invalid note format '" +
            juce::String(std::string(note)) + "', using " +
            juce::String(kDefaultNoteFrequencyHz) + " Hz");
        return kDefaultNoteFrequencyHz;
    }
    return MidiToFrequency(static_cast<double>(*midi));
}

double MidiToFrequency(const double midiNote)
{
    return kConcertPitchHz *
           std::pow(2.0, (midiNote - kConcertPitchMidiNote) / 12.0);
}

double FrequencyToMidi(const double frequencyHz)
{
    if (frequencyHz <= 0.0) {
        return 0.0;
    }
    return kConcertPitchMidiNote +
           12.0 * std::log2(frequencyHz / kConcertPitchHz);
}

std::string MidiToNoteName(const int midiNote)
{
    const int clamped = std::clamp(midiNote, 0, 127);
    const int octave = clamped / 12 - 1;
    return std::string(kSharpNoteNames[static_cast<std::size_t>(clamped % 12)]) +
           std::to_string(octave);
}

std::string FrequencyToNoteName(const double frequencyHz)
{
    const double midi = FrequencyToMidi(frequencyHz);
    return MidiToNoteName(static_cast<int>(std::lround(midi)));
}

}  // namespace sympathetic
