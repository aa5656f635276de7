#pragma once

#include <memory>
#include <optional>
#include <string>

#include "core/AudioGraph.h"
#include "core/AudioParam.h"
#include "core/SynthSettings.h"

namespace sympathetic {

// Audio processing substrate seen by the engine. The engine creates,
// connects and schedules nodes through these interfaces and never
// renders audio itself; rendering happens on the substrate's own
// timeline (see AudioGraphContext for the bundled implementation).

class AudioNode {
public:
    virtual ~AudioNode() = default;

    // Context-assigned identifier, unique per context.
    [[nodiscard]] virtual const std::string& id() const = 0;
};

class OscillatorNode : public AudioNode {
public:
    [[nodiscard]] virtual AudioParam& frequency() = 0;

    // Pitch offset in cents, added to `frequency`.
    [[nodiscard]] virtual AudioParam& detune() = 0;

    [[nodiscard]] virtual Waveform waveform() const = 0;
    virtual void setWaveform(Waveform waveform) = 0;

    // Schedules the start. Returns false when the oscillator was
    // already started.
    virtual bool start(double when) = 0;

    // Schedules the stop. Returns false when a stop was already
    // scheduled or the oscillator never started.
    virtual bool stop(double when) = 0;

    [[nodiscard]] virtual std::optional<double> startTime() const = 0;
    [[nodiscard]] virtual std::optional<double> stopTime() const = 0;
};

class GainNode : public AudioNode {
public:
    [[nodiscard]] virtual AudioParam& gain() = 0;
};

class FilterNode : public AudioNode {
public:
    [[nodiscard]] virtual AudioParam& frequency() = 0;
    [[nodiscard]] virtual AudioParam& q() = 0;

    [[nodiscard]] virtual FilterType type() const = 0;
    virtual void setType(FilterType type) = 0;
};

struct CompressorSettings {
    float threshold_db{-24.0F};
    float knee_db{30.0F};
    float ratio{12.0F};
    float attack_seconds{0.003F};
    float release_seconds{0.25F};
};

class CompressorNode : public AudioNode {
public:
    [[nodiscard]] virtual CompressorSettings settings() const = 0;
};

// Looped white-noise buffer.
class NoiseSourceNode : public AudioNode {
public:
    // Returns false when the source was already started.
    virtual bool start(double when) = 0;
    [[nodiscard]] virtual bool started() const = 0;
};

class AudioContext : public Clock {
public:
    ~AudioContext() override = default;

    [[nodiscard]] virtual double sampleRate() const = 0;

    [[nodiscard]] virtual std::shared_ptr<OscillatorNode> createOscillator(
        double frequencyHz, Waveform waveform) = 0;
    [[nodiscard]] virtual std::shared_ptr<GainNode> createGain(
        double initialGain) = 0;
    [[nodiscard]] virtual std::shared_ptr<FilterNode> createFilter(
        FilterType type, double frequencyHz, double q) = 0;
    [[nodiscard]] virtual std::shared_ptr<CompressorNode> createCompressor(
        const CompressorSettings& settings) = 0;
    [[nodiscard]] virtual std::shared_ptr<NoiseSourceNode> createNoise() = 0;

    // Final sink (speakers).
    [[nodiscard]] virtual std::shared_ptr<AudioNode> destination() = 0;

    // Audio edge into a node input.
    virtual void connect(const std::shared_ptr<AudioNode>& from,
                         const std::shared_ptr<AudioNode>& to) = 0;

    // Modulation edge: the output of `from` is added to `param`, which
    // must belong to `owner`.
    virtual void connect(const std::shared_ptr<AudioNode>& from,
                         const std::shared_ptr<AudioNode>& owner,
                         AudioParam& param) = 0;

    // Removes the modulation edge from `from` into `param`. Returns
    // false when no such edge exists.
    virtual bool disconnect(const std::shared_ptr<AudioNode>& from,
                            AudioParam& param) = 0;

    // Removes every edge that starts or ends at `node`, including
    // modulation edges into its parameters.
    virtual void disconnect(const std::shared_ptr<AudioNode>& node) = 0;

    [[nodiscard]] virtual AudioGraph graph() const = 0;
};

}  // namespace sympathetic
