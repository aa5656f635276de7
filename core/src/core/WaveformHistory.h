#pragma once

#include <atomic>
#include <cstddef>
#include <vector>

namespace sympathetic {

// JUCE-free circular mono history of a rendered output, used for
// metering and for inspecting what the engine actually produced.
//
// Single writer (render thread), multiple readers. The writer never
// locks; readers work from a snapshot of the write index, so a reader
// racing the writer may see a few samples of the next block.
class WaveformHistory {
public:
    // `historySize` is in mono samples.
    explicit WaveformHistory(int historySize) noexcept;

    WaveformHistory(const WaveformHistory&) = delete;
    WaveformHistory& operator=(const WaveformHistory&) = delete;

    [[nodiscard]] int historySize() const noexcept { return historySize_; }

    // Interprets `windowSeconds` in the read methods.
    void setSampleRate(double sampleRate) noexcept;

    // Clears the history to silence.
    void reset() noexcept;

    void writeSamples(const float* mono, int numSamples) noexcept;

    // Total number of samples written since the last reset().
    [[nodiscard]] long long samplesWritten() const noexcept;

    // Copies a downsampled view of the last `windowSeconds` into `dst`
    // (`numPoints` values). Missing history reads as zeros.
    void getSnapshot(float* dst, int numPoints,
                     double windowSeconds) const noexcept;

    // Absolute peak over the last `windowSeconds`.
    [[nodiscard]] float peak(double windowSeconds) const noexcept;

private:
    // Number of samples covered by `windowSeconds`, clamped to what is
    // available. Also returns the write index it was computed from.
    [[nodiscard]] int windowSamples(double windowSeconds,
                                    long long& writeIndex) const noexcept;

    const int historySize_;
    std::atomic<long long> writeIndex_{0};
    std::atomic<double> sampleRate_{44100.0};
    std::vector<float> buffer_;
};

}  // namespace sympathetic
