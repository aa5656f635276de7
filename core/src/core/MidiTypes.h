#pragma once

namespace sympathetic {

// Lightweight representation of a MIDI note event, independent from
// JUCE. Hosts translate juce::MidiMessage (or any device API) into this
// and hand it to SynthEngine::handleMidiEvent().
struct MidiNoteEvent {
    int channel{0};          // Logical MIDI channel (0-15 typical).
    int note{0};             // MIDI note number [0, 127].
    float velocity01{0.0F};  // Normalised velocity [0, 1].
    bool is_note_on{true};   // A note-on with zero velocity is a note-off.
};

}  // namespace sympathetic
