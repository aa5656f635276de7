#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace sympathetic {

// Equal-temperament tuning reference.
inline constexpr double kConcertPitchHz = 440.0;
inline constexpr int kConcertPitchMidiNote = 69;

// Frequency used whenever a note name cannot be resolved.
inline constexpr double kDefaultNoteFrequencyHz = kConcertPitchHz;

// Parses a note name such as "C#4", "Bb3" or "a4" into a MIDI note
// number (C4 = 60, A4 = 69). Accepted form is a letter A-G (either
// case), an optional '#' or 'b' accidental and an integer octave,
// which may be negative so that every name produced by
// MidiToNoteName() parses back. Returns std::nullopt when the text
// does not follow that form.
[[nodiscard]] std::optional<int> ParseNoteName(std::string_view note);

// Resolves a note name to its frequency in Hz. Malformed names are not
// an error: a warning is logged and kDefaultNoteFrequencyHz is
// returned.
[[nodiscard]] double NoteToFrequency(std::string_view note);

[[nodiscard]] double MidiToFrequency(double midiNote);

// Inverse of MidiToFrequency() without rounding. Non-positive
// frequencies map to MIDI note 0.
[[nodiscard]] double FrequencyToMidi(double frequencyHz);

// Sharp-based note name for a MIDI note ("C-1" .. "G9"). Values
// outside [0, 127] are clamped.
[[nodiscard]] std::string MidiToNoteName(int midiNote);

// Name of the nearest equal-tempered note.
[[nodiscard]] std::string FrequencyToNoteName(double frequencyHz);

}  // namespace sympathetic
