#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "core/AudioContext.h"
#include "core/WaveformHistory.h"

namespace sympathetic {

class RenderNode;

// Reference AudioContext: a mono pull graph rendered one sample at a
// time.
//
// Nodes keep strong references to their inputs and to the sources
// modulating their parameters, so a chain stays alive for as long as
// something downstream (ultimately destination()) pulls from it.
// disconnect(node) cuts every edge touching a node and lets it die once
// the last outside handle is dropped.
//
// Oscillator frequency is `frequency * 2^(detune / 1200)` where both
// params are their automation value plus the sum of their modulators.
// Filters use juce::dsp::StateVariableTPTFilter; for lowpass/highpass
// the Q is read in dB, for bandpass as a plain resonance. Compressors
// use juce::dsp::Compressor, which has a hard knee, so `knee_db` is
// recorded but not applied.
//
// Thread-safety: topology changes and renderBlock() serialise on one
// mutex; automation goes through each AudioParam's own lock.
// currentTime() is lock-free.
class AudioGraphContext : public AudioContext {
public:
    static constexpr int kHistorySize = 1 << 16;

    explicit AudioGraphContext(double sampleRate);
    ~AudioGraphContext() override;

    AudioGraphContext(const AudioGraphContext&) = delete;
    AudioGraphContext& operator=(const AudioGraphContext&) = delete;

    // Clock
    [[nodiscard]] double currentTime() const override;

    // AudioContext
    [[nodiscard]] double sampleRate() const override;

    [[nodiscard]] std::shared_ptr<OscillatorNode> createOscillator(
        double frequencyHz, Waveform waveform) override;
    [[nodiscard]] std::shared_ptr<GainNode> createGain(
        double initialGain) override;
    [[nodiscard]] std::shared_ptr<FilterNode> createFilter(
        FilterType type, double frequencyHz, double q) override;
    [[nodiscard]] std::shared_ptr<CompressorNode> createCompressor(
        const CompressorSettings& settings) override;
    [[nodiscard]] std::shared_ptr<NoiseSourceNode> createNoise() override;

    [[nodiscard]] std::shared_ptr<AudioNode> destination() override;

    void connect(const std::shared_ptr<AudioNode>& from,
                 const std::shared_ptr<AudioNode>& to) override;
    void connect(const std::shared_ptr<AudioNode>& from,
                 const std::shared_ptr<AudioNode>& owner,
                 AudioParam& param) override;
    bool disconnect(const std::shared_ptr<AudioNode>& from,
                    AudioParam& param) override;
    void disconnect(const std::shared_ptr<AudioNode>& node) override;

    [[nodiscard]] AudioGraph graph() const override;

    // Renders `numSamples` of the destination into `out` (may be
    // nullptr to discard) and advances the clock by as much.
    void renderBlock(float* out, int numSamples);

    // Re-prepares every live node for a new rate. Used when a device
    // starts with a rate other than the one given at construction.
    void setSampleRate(double sampleRate);

    // Output of the destination, for meters and tests.
    [[nodiscard]] const WaveformHistory& history() const noexcept
    {
        return history_;
    }

    // Number of live nodes, destination included.
    [[nodiscard]] std::size_t nodeCount() const;

protected:
    [[nodiscard]] std::int64_t framesRendered() const noexcept
    {
        return frames_.load(std::memory_order_acquire);
    }

private:
    [[nodiscard]] std::string nextId(const char* kind);
    void registerNode(const std::shared_ptr<RenderNode>& node);
    [[nodiscard]] std::shared_ptr<RenderNode> findLocked(
        const AudioNode* node) const;
    [[nodiscard]] std::vector<std::shared_ptr<RenderNode>> liveNodesLocked() const;

    mutable std::mutex renderMutex_;

    std::atomic<double> sampleRate_;
    std::atomic<std::int64_t> frames_{0};
    std::uint64_t nextNodeNumber_{1};

    std::shared_ptr<RenderNode> destination_;
    std::vector<std::weak_ptr<RenderNode>> nodes_;

    WaveformHistory history_{kHistorySize};
    std::vector<float> scratch_;
};

}  // namespace sympathetic
