#include "core/SynthEngine.h"

#include <algorithm>

#include <juce_core/juce_core.h>

#include "core/NoteConversion.h"

namespace sympathetic {

namespace {

bool ValidSlot(const int slot)
{
    return slot >= 0 && slot < kNumOscillators;
}

void LogEngine(const juce::String& message)
{
    juce::Logger::writeToLog("[sympathetic-core] " + message);
}

}  // namespace

SynthEngine::SynthEngine(AudioContext& context, const SynthOptions& options,
                         const SynthSettings& settings)
    : context_(context), settings_(settings)
{
    mixer_ = std::make_unique<MixerBus>(context_, settings_.mixer, options);
    settings_.master_volume = mixer_->volume();
    for (int slot = 0; slot < kNumOscillators; ++slot) {
        settings_.mixer[static_cast<std::size_t>(slot)] =
            mixer_->channelSettings(slot);
    }

    // Noise joins after the limiter so that it does not pump the voices.
    noise_ = std::make_unique<NoiseSection>(context_, settings_.noise,
                                            mixer_->master());
    settings_.noise = noise_->settings();

    lfo_ = std::make_unique<LfoRouter>(context_, settings_.lfo);

    LogEngine("Engine ready at " + juce::String(context_.sampleRate(), 0) +
              " Hz, speakers " + (options.speakers_on ? "on" : "off"));
}

SynthEngine::~SynthEngine()
{
    const std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [id, voice] : voices_) {
        destroyVoiceLocked(voice);
    }
    voices_.clear();
    activeNotes_.clear();
}

double SynthEngine::clampedTime(const std::optional<double> time) const
{
    const double now = context_.currentTime();
    return std::max(time.value_or(now), now);
}

// ---------------------------------------------------------------------
// Note events

void SynthEngine::playNote(const std::string& note,
                           const std::optional<double> startTime)
{
    const std::lock_guard<std::mutex> lock(mutex_);
    (void)reapFinishedVoicesLocked(context_.currentTime());
    playNoteLocked(note, clampedTime(startTime));
}

void SynthEngine::stopNote(const std::string& note,
                           const std::optional<double> stopTime)
{
    const std::lock_guard<std::mutex> lock(mutex_);
    (void)reapFinishedVoicesLocked(context_.currentTime());
    (void)stopNoteLocked(note, clampedTime(stopTime));
}

void SynthEngine::stopAll()
{
    const std::lock_guard<std::mutex> lock(mutex_);
    const double now = context_.currentTime();
    (void)reapFinishedVoicesLocked(now);

    std::vector<std::string> notes;
    notes.reserve(activeNotes_.size());
    for (const auto& [note, id] : activeNotes_) {
        notes.push_back(note);
    }
    for (const auto& note : notes) {
        (void)stopNoteLocked(note, now);
    }
}

void SynthEngine::handleMidiEvent(const MidiNoteEvent& event,
                                  const std::optional<double> time)
{
    const std::string note = MidiToNoteName(event.note);
    if (event.is_note_on && event.velocity01 > 0.0F) {
        playNote(note, time);
    } else {
        stopNote(note, time);
    }
}

std::size_t SynthEngine::reapFinishedVoices()
{
    const std::lock_guard<std::mutex> lock(mutex_);
    return reapFinishedVoicesLocked(context_.currentTime());
}

void SynthEngine::playNoteLocked(const std::string& note,
                                 const double startTime)
{
    // Never let two voices share a key.
    if (activeNotes_.find(note) != activeNotes_.end()) {
        (void)stopNoteLocked(note, startTime);
    }

    const double frequency = NoteToFrequency(note);
    const EnvelopeSettings filterEnvelope =
        ContourScaledEnvelope(settings_.filter_envelope);

    Voice voice;
    voice.id = nextVoiceId_++;
    voice.note = note;
    voice.frequency = frequency;
    voice.start_time = startTime;
    voice.release_time = settings_.volume_envelope.release;

    for (int slot = 0; slot < kNumOscillators; ++slot) {
        const auto& osc = settings_.oscillators[static_cast<std::size_t>(slot)];

        auto oscillator = context_.createOscillator(
            frequency * RangeMultiplier(osc.range), osc.waveform);
        oscillator->detune().setValue(osc.detune);

        auto gain = context_.createGain(0.0);
        auto filter = context_.createFilter(
            settings_.filter_envelope.filter_type,
            settings_.filter_envelope.cutoff_frequency,
            settings_.filter_envelope.q);

        context_.connect(oscillator, gain);
        context_.connect(gain, filter);
        context_.connect(filter, mixer_->channel(slot));

        // Every automation target needs its own timeline, so each
        // oscillator gets its own pair built from the same settings.
        Envelope volume(settings_.volume_envelope);
        volume.connect(gain, gain->gain());
        Envelope cutoff(filterEnvelope);
        cutoff.connect(filter, filter->frequency());

        (void)volume.trigger(startTime);
        (void)cutoff.trigger(startTime);
        (void)oscillator->start(startTime);

        voice.oscillators.push_back(std::move(oscillator));
        voice.gains.push_back(std::move(gain));
        voice.filters.push_back(std::move(filter));
        voice.volume_envelopes.push_back(std::move(volume));
        voice.filter_envelopes.push_back(std::move(cutoff));
    }

    lfo_->connectVoice(voice.id, voice.oscillators, voice.filters);

    noise_->tuneTo(frequency);
    noise_->openGate();

    LogEngine("noteOn " + juce::String(note) + " (" +
              juce::String(frequency, 2) + " Hz) voice " +
              juce::String(static_cast<juce::int64>(voice.id)));

    activeNotes_[note] = voice.id;
    const VoiceId id = voice.id;
    voices_.emplace(id, std::move(voice));
}

bool SynthEngine::stopNoteLocked(const std::string& note,
                                 const double stopTime)
{
    const auto active = activeNotes_.find(note);
    if (active == activeNotes_.end()) {
        return false;
    }

    auto it = voices_.find(active->second);
    activeNotes_.erase(active);
    if (it == voices_.end()) {
        return false;
    }

    Voice& voice = it->second;
    const double release = voice.release_time;

    for (auto& envelope : voice.volume_envelopes) {
        (void)envelope.triggerRelease(stopTime);
    }
    for (auto& envelope : voice.filter_envelopes) {
        (void)envelope.triggerRelease(stopTime);
    }

    // Direct linear fade on each gain on top of the envelope release.
    for (const auto& gain : voice.gains) {
        AudioParam& param = gain->gain();
        const double current = param.valueAtTime(stopTime);
        param.cancelScheduledValues(stopTime);
        param.setValueAtTime(current, stopTime);
        param.linearRampToValueAtTime(0.0, stopTime + release);
    }

    const double releaseEnd = stopTime + release + kStopGuardSeconds;
    for (const auto& oscillator : voice.oscillators) {
        // An oscillator that already has a stop scheduled keeps it.
        (void)oscillator->stop(releaseEnd);
    }

    voice.release_start = stopTime;
    voice.teardown_deadline = releaseEnd;

    if (activeNotes_.empty()) {
        noise_->closeGate();
    }

    LogEngine("noteOff " + juce::String(note) + " release " +
              juce::String(release, 3) + " s");
    return true;
}

std::size_t SynthEngine::reapFinishedVoicesLocked(const double now)
{
    std::size_t freed = 0;
    for (auto it = voices_.begin(); it != voices_.end();) {
        Voice& voice = it->second;
        if (!voice.teardown_deadline.has_value() ||
            *voice.teardown_deadline > now) {
            ++it;
            continue;
        }
        destroyVoiceLocked(voice);
        it = voices_.erase(it);
        ++freed;
    }
    return freed;
}

void SynthEngine::destroyVoiceLocked(Voice& voice)
{
    (void)lfo_->disconnectVoice(voice.id);

    for (const auto& oscillator : voice.oscillators) {
        context_.disconnect(oscillator);
    }
    for (const auto& gain : voice.gains) {
        context_.disconnect(gain);
    }
    for (const auto& filter : voice.filters) {
        context_.disconnect(filter);
    }
}

// ---------------------------------------------------------------------
// Parameters

void SynthEngine::applyPatch(const SynthPatch& patch)
{
    const SynthPatch clamped = ClampPatch(patch);
    const std::lock_guard<std::mutex> lock(mutex_);
    applyPatchLocked(clamped);
}

void SynthEngine::applyPatchLocked(const SynthPatch& patch)
{
    if (patch.empty()) {
        return;
    }

    for (int slot = 0; slot < kNumOscillators; ++slot) {
        const auto& osc = patch.oscillators[static_cast<std::size_t>(slot)];
        if (!osc.empty()) {
            updateOscillatorLocked(slot, osc);
        }
    }

    if (!patch.filter.empty()) {
        updateFilterEnvelopeLocked(patch.filter);
    }
    if (!patch.volume_envelope.empty()) {
        updateVolumeEnvelopeLocked(patch.volume_envelope);
    }
    if (patch.master_volume.has_value()) {
        setVolumeLocked(*patch.master_volume);
    }

    if (patch.noise.level.has_value()) {
        setNoiseLevelLocked(*patch.noise.level);
    }
    if (patch.noise.filter_frequency.has_value()) {
        setNoiseFilterFrequencyLocked(*patch.noise.filter_frequency);
    }
    if (patch.noise.filter_q.has_value()) {
        setNoiseFilterQLocked(*patch.noise.filter_q);
    }

    if (!patch.lfo.empty()) {
        lfo_->update(patch.lfo);
        settings_.lfo = lfo_->settings();
    }
}

bool SynthEngine::updateOscillator(const int slot, const OscillatorPatch& patch)
{
    if (!ValidSlot(slot)) {
        return false;
    }
    SynthPatch wrapper;
    wrapper.oscillators[static_cast<std::size_t>(slot)] = patch;
    const SynthPatch clamped = ClampPatch(wrapper);

    const std::lock_guard<std::mutex> lock(mutex_);
    updateOscillatorLocked(slot,
                           clamped.oscillators[static_cast<std::size_t>(slot)]);
    return true;
}

void SynthEngine::updateOscillatorLocked(const int slot,
                                         const OscillatorPatch& patch)
{
    auto& osc = settings_.oscillators[static_cast<std::size_t>(slot)];

    if (patch.waveform.has_value()) {
        osc.waveform = *patch.waveform;
    }
    if (patch.range.has_value()) {
        osc.range = *patch.range;
    }
    if (patch.detune.has_value()) {
        osc.detune = *patch.detune;
        // Detune is the one oscillator setting heard on sounding notes.
        for (auto& [id, voice] : voices_) {
            const auto index = static_cast<std::size_t>(slot);
            if (index < voice.oscillators.size()) {
                voice.oscillators[index]->detune().setValue(osc.detune);
            }
        }
    }
    if (patch.volume.has_value()) {
        (void)mixer_->setChannelVolume(slot, *patch.volume);
        settings_.mixer[static_cast<std::size_t>(slot)] =
            mixer_->channelSettings(slot);
    }
}

bool SynthEngine::updateMixer(const int slot, const float volume)
{
    const std::lock_guard<std::mutex> lock(mutex_);
    if (!mixer_->setChannelVolume(slot, volume)) {
        return false;
    }
    settings_.mixer[static_cast<std::size_t>(slot)] =
        mixer_->channelSettings(slot);
    return true;
}

bool SynthEngine::setMixerActive(const int slot, const bool active)
{
    const std::lock_guard<std::mutex> lock(mutex_);
    if (!mixer_->setChannelActive(slot, active)) {
        return false;
    }
    settings_.mixer[static_cast<std::size_t>(slot)] =
        mixer_->channelSettings(slot);
    return true;
}

void SynthEngine::setVolume(const float volume)
{
    const std::lock_guard<std::mutex> lock(mutex_);
    setVolumeLocked(volume);
}

void SynthEngine::setVolumeLocked(const float volume)
{
    mixer_->setVolume(volume);
    settings_.master_volume = mixer_->volume();
}

void SynthEngine::setNoiseLevel(const float level)
{
    const std::lock_guard<std::mutex> lock(mutex_);
    setNoiseLevelLocked(level);
}

void SynthEngine::setNoiseLevelLocked(const float level)
{
    noise_->setLevel(level);
    settings_.noise = noise_->settings();
}

void SynthEngine::setNoiseFilterFrequency(const float frequencyHz)
{
    const std::lock_guard<std::mutex> lock(mutex_);
    setNoiseFilterFrequencyLocked(frequencyHz);
}

void SynthEngine::setNoiseFilterFrequencyLocked(const float frequencyHz)
{
    noise_->setFilterFrequency(frequencyHz);
    settings_.noise = noise_->settings();
}

void SynthEngine::setNoiseFilterQ(const float q)
{
    const std::lock_guard<std::mutex> lock(mutex_);
    setNoiseFilterQLocked(q);
}

void SynthEngine::setNoiseFilterQLocked(const float q)
{
    noise_->setFilterQ(q);
    settings_.noise = noise_->settings();
}

void SynthEngine::setFilterType(const FilterType type)
{
    const std::lock_guard<std::mutex> lock(mutex_);
    settings_.filter_envelope.filter_type = type;
}

void SynthEngine::updateVolumeEnvelope(const EnvelopePatch& patch)
{
    SynthPatch wrapper;
    wrapper.volume_envelope = patch;
    const SynthPatch clamped = ClampPatch(wrapper);

    const std::lock_guard<std::mutex> lock(mutex_);
    updateVolumeEnvelopeLocked(clamped.volume_envelope);
}

void SynthEngine::updateVolumeEnvelopeLocked(const EnvelopePatch& patch)
{
    auto& env = settings_.volume_envelope;
    if (patch.attack.has_value()) {
        env.attack = *patch.attack;
    }
    if (patch.decay.has_value()) {
        env.decay = *patch.decay;
    }
    if (patch.sustain.has_value()) {
        env.sustain = *patch.sustain;
    }
    if (patch.release.has_value()) {
        env.release = *patch.release;
    }
}

void SynthEngine::updateFilterEnvelope(const FilterPatch& patch)
{
    SynthPatch wrapper;
    wrapper.filter = patch;
    const SynthPatch clamped = ClampPatch(wrapper);

    const std::lock_guard<std::mutex> lock(mutex_);
    updateFilterEnvelopeLocked(clamped.filter);
}

void SynthEngine::updateFilterEnvelopeLocked(const FilterPatch& patch)
{
    auto& filter = settings_.filter_envelope;
    const EnvelopePatch& env = patch.envelope;

    if (env.attack.has_value()) {
        filter.attack = *env.attack;
    }
    if (env.decay.has_value()) {
        filter.decay = *env.decay;
    }
    if (env.sustain.has_value()) {
        filter.sustain = *env.sustain;
    }
    if (env.release.has_value()) {
        filter.release = *env.release;
    }
    if (env.start_level.has_value()) {
        filter.start_level = *env.start_level;
    }
    if (patch.cutoff.has_value()) {
        // The envelope peaks at the cutoff.
        filter.cutoff_frequency = *patch.cutoff;
        filter.max_level = *patch.cutoff;
    }
    if (patch.q.has_value()) {
        filter.q = *patch.q;
    }
    if (patch.contour.has_value()) {
        filter.contour = *patch.contour;
    }
    if (patch.filter_type.has_value()) {
        filter.filter_type = *patch.filter_type;
    }
}

void SynthEngine::updateLFO(const LfoPatch& patch)
{
    SynthPatch wrapper;
    wrapper.lfo = patch;
    const SynthPatch clamped = ClampPatch(wrapper);

    const std::lock_guard<std::mutex> lock(mutex_);
    lfo_->update(clamped.lfo);
    settings_.lfo = lfo_->settings();
}

// ---------------------------------------------------------------------
// Introspection

std::size_t SynthEngine::activeVoiceCount() const
{
    const std::lock_guard<std::mutex> lock(mutex_);
    return activeNotes_.size();
}

std::size_t SynthEngine::releasingVoiceCount() const
{
    const std::lock_guard<std::mutex> lock(mutex_);
    return voices_.size() - activeNotes_.size();
}

bool SynthEngine::isNoteActive(const std::string& note) const
{
    const std::lock_guard<std::mutex> lock(mutex_);
    return activeNotes_.find(note) != activeNotes_.end();
}

std::vector<std::string> SynthEngine::activeNotes() const
{
    const std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> notes;
    notes.reserve(activeNotes_.size());
    for (const auto& [note, id] : activeNotes_) {
        notes.push_back(note);
    }
    std::sort(notes.begin(), notes.end());
    return notes;
}

std::optional<SynthEngine::VoiceSnapshot> SynthEngine::voice(
    const std::string& note) const
{
    const std::lock_guard<std::mutex> lock(mutex_);
    const auto active = activeNotes_.find(note);
    if (active == activeNotes_.end()) {
        return std::nullopt;
    }
    const auto it = voices_.find(active->second);
    if (it == voices_.end()) {
        return std::nullopt;
    }
    return snapshotOf(it->second);
}

std::optional<SynthEngine::VoiceSnapshot> SynthEngine::voiceById(
    const VoiceId id) const
{
    const std::lock_guard<std::mutex> lock(mutex_);
    const auto it = voices_.find(id);
    if (it == voices_.end()) {
        return std::nullopt;
    }
    return snapshotOf(it->second);
}

SynthSettings SynthEngine::settings() const
{
    const std::lock_guard<std::mutex> lock(mutex_);
    return settings_;
}

bool SynthEngine::noiseGateOpen() const
{
    const std::lock_guard<std::mutex> lock(mutex_);
    return noise_->gateOpen();
}

std::shared_ptr<GainNode> SynthEngine::output() const
{
    return mixer_->output();
}

SynthEngine::VoiceSnapshot SynthEngine::snapshotOf(const Voice& voice)
{
    VoiceSnapshot snapshot;
    snapshot.id = voice.id;
    snapshot.note = voice.note;
    snapshot.frequency = voice.frequency;
    snapshot.start_time = voice.start_time;
    snapshot.release_time = voice.release_time;
    snapshot.release_start = voice.release_start;
    snapshot.teardown_deadline = voice.teardown_deadline;
    snapshot.oscillators = voice.oscillators;
    snapshot.gains = voice.gains;
    snapshot.filters = voice.filters;
    return snapshot;
}

}  // namespace sympathetic
