#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "core/SynthPatch.h"

namespace sympathetic {

// Line-based textual form of a SynthPatch: one `key=value` assignment
// per present field, e.g.
//
//   osc1Waveform=sawtooth
//   osc2Range=16
//   filterCutoff=5000
//   lfoDepth=12.5
//
// Keys use the camelCase names accepted by the sound-design front-ends
// (osc{1,2,3}{Waveform,Range,Detune,Volume}, filter{Attack,Decay,
// Sustain,Release,Cutoff,StartLevel,Emphasis,Contour,Type},
// volume{Attack,Decay,Sustain,Release}, masterVolume, noiseLevel,
// noiseFilterFreq, noiseFilterQ, lfo{Waveform,Frequency,Depth}).
// Values are not clamped here; run ClampPatch() on the result.

// Parses a single assignment into `patch`. Surrounding whitespace is
// ignored. Ranges that are not one of 2/4/8/16/32 snap to the nearest
// legal range.
//
// On success, returns true and clears `error_message` (if non-null).
// On failure `patch` is left untouched, false is returned and a short
// description is written into `error_message` (if provided).
bool ParsePatchAssignment(std::string_view assignment, SynthPatch& patch,
                          std::string* error_message = nullptr);

// One line per present field, in the key order listed above.
[[nodiscard]] std::string SerializePatch(const SynthPatch& patch);

// Every accepted key, in serialization order.
[[nodiscard]] std::vector<std::string> SupportedPatchKeys();

}  // namespace sympathetic
