#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "core/AudioContext.h"
#include "core/Envelope.h"
#include "core/LfoRouter.h"
#include "core/MidiTypes.h"
#include "core/MixerBus.h"
#include "core/NoiseSection.h"
#include "core/SynthPatch.h"
#include "core/SynthSettings.h"

namespace sympathetic {

// Polyphonic three-oscillator subtractive voice engine.
//
// The engine never renders audio. It builds one signal chain per note
// against an AudioContext, schedules time-stamped automation on it and
// tears it down once the release tail is over:
//
//   osc[slot] ─► gain[slot] ─► filter[slot] ─► MixerBus::channel(slot)
//        ▲ detune             ▲ frequency
//        └─ LFO pitch bus     └─ LFO filter bus
//
// At most one voice is active per note key (the note string exactly as
// given). Stopped voices leave the active table immediately but keep
// their nodes until their teardown deadline, which reapFinishedVoices()
// enforces at the start of every note event.
//
// All methods are thread-safe via an internal mutex so that note events
// from input devices and patches from other collaborators can arrive on
// different threads. The AudioContext must outlive the engine.
class SynthEngine {
public:
    // Margin added after the release before oscillators stop and the
    // voice may be torn down.
    static constexpr double kStopGuardSeconds = 0.1;

    // Read-only view of one voice, for hosts and tests.
    struct VoiceSnapshot {
        VoiceId id{0};
        std::string note;
        double frequency{0.0};
        double start_time{0.0};
        float release_time{0.0F};
        std::optional<double> release_start;
        std::optional<double> teardown_deadline;
        std::vector<std::shared_ptr<OscillatorNode>> oscillators;
        std::vector<std::shared_ptr<GainNode>> gains;
        std::vector<std::shared_ptr<FilterNode>> filters;
    };

    explicit SynthEngine(AudioContext& context,
                         const SynthOptions& options = SynthOptions{},
                         const SynthSettings& settings = SynthSettings{});
    ~SynthEngine();

    SynthEngine(const SynthEngine&) = delete;
    SynthEngine& operator=(const SynthEngine&) = delete;

    // --- Note events --------------------------------------------------

    // Starts a voice for `note` at `startTime` (default and lower bound:
    // the context's current time). An active voice under the same key is
    // stopped first. Malformed note names play at 440 Hz.
    void playNote(const std::string& note,
                  std::optional<double> startTime = std::nullopt);

    // Releases the voice for `note`. No-op when the key is not active.
    void stopNote(const std::string& note,
                  std::optional<double> stopTime = std::nullopt);

    void stopAll();

    // Note-on with velocity > 0 plays MidiToNoteName(note); note-off or
    // zero velocity stops it.
    void handleMidiEvent(const MidiNoteEvent& event,
                         std::optional<double> time = std::nullopt);

    // Disconnects and frees every released voice whose teardown deadline
    // has passed. Returns the number of voices freed.
    std::size_t reapFinishedVoices();

    // --- Parameters ---------------------------------------------------
    //
    // Numeric inputs are clamped silently. Only oscillator detune, the
    // mixer, master volume, noise and LFO act on sounding voices; every
    // other edit applies to notes started afterwards.

    // Clamps the patch into its documented domains and applies every
    // present field.
    void applyPatch(const SynthPatch& patch);

    // Returns false for a slot outside [0, kNumOscillators).
    bool updateOscillator(int slot, const OscillatorPatch& patch);
    bool updateMixer(int slot, float volume);
    bool setMixerActive(int slot, bool active);

    void setVolume(float volume);
    void setNoiseLevel(float level);
    void setNoiseFilterFrequency(float frequencyHz);
    void setNoiseFilterQ(float q);
    void setFilterType(FilterType type);

    void updateVolumeEnvelope(const EnvelopePatch& patch);
    void updateFilterEnvelope(const FilterPatch& patch);
    void updateLFO(const LfoPatch& patch);

    // --- Introspection ------------------------------------------------

    [[nodiscard]] std::size_t activeVoiceCount() const;
    // Voices that were stopped but are not torn down yet.
    [[nodiscard]] std::size_t releasingVoiceCount() const;
    [[nodiscard]] bool isNoteActive(const std::string& note) const;
    [[nodiscard]] std::vector<std::string> activeNotes() const;

    // Snapshot of the active voice for `note`.
    [[nodiscard]] std::optional<VoiceSnapshot> voice(const std::string& note) const;
    // Snapshot of any voice still held, active or releasing.
    [[nodiscard]] std::optional<VoiceSnapshot> voiceById(VoiceId id) const;

    [[nodiscard]] SynthSettings settings() const;
    [[nodiscard]] bool noiseGateOpen() const;

    // Output tap when the engine was built with speakers off, nullptr
    // otherwise.
    [[nodiscard]] std::shared_ptr<GainNode> output() const;

    // Shared sections, exposed for metering and inspection.
    [[nodiscard]] const MixerBus& mixer() const noexcept { return *mixer_; }
    [[nodiscard]] const NoiseSection& noise() const noexcept { return *noise_; }
    [[nodiscard]] const LfoRouter& lfo() const noexcept { return *lfo_; }

    [[nodiscard]] AudioContext& context() const noexcept { return context_; }

private:
    struct Voice {
        VoiceId id{0};
        std::string note;
        double frequency{0.0};
        double start_time{0.0};
        // Volume release captured at note-on.
        float release_time{0.0F};
        std::optional<double> release_start;
        std::optional<double> teardown_deadline;

        std::vector<std::shared_ptr<OscillatorNode>> oscillators;
        std::vector<std::shared_ptr<GainNode>> gains;
        std::vector<std::shared_ptr<FilterNode>> filters;

        // One pair per oscillator; index 0 drives the primary chain.
        std::vector<Envelope> volume_envelopes;
        std::vector<Envelope> filter_envelopes;
    };

    [[nodiscard]] double clampedTime(std::optional<double> time) const;

    void playNoteLocked(const std::string& note, double startTime);
    bool stopNoteLocked(const std::string& note, double stopTime);
    std::size_t reapFinishedVoicesLocked(double now);
    void destroyVoiceLocked(Voice& voice);

    void applyPatchLocked(const SynthPatch& patch);
    void updateOscillatorLocked(int slot, const OscillatorPatch& patch);
    void updateVolumeEnvelopeLocked(const EnvelopePatch& patch);
    void updateFilterEnvelopeLocked(const FilterPatch& patch);
    void setVolumeLocked(float volume);
    void setNoiseLevelLocked(float level);
    void setNoiseFilterFrequencyLocked(float frequencyHz);
    void setNoiseFilterQLocked(float q);

    [[nodiscard]] static VoiceSnapshot snapshotOf(const Voice& voice);

    AudioContext& context_;

    mutable std::mutex mutex_;
    SynthSettings settings_;

    std::unique_ptr<MixerBus> mixer_;
    std::unique_ptr<NoiseSection> noise_;
    std::unique_ptr<LfoRouter> lfo_;

    // Arena of every voice still holding nodes.
    std::unordered_map<VoiceId, Voice> voices_;
    // Active note key -> voice in the arena.
    std::unordered_map<std::string, VoiceId> activeNotes_;
    VoiceId nextVoiceId_{1};
};

}  // namespace sympathetic
