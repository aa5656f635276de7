#include "core/WaveformHistory.h"

#include <algorithm>
#include <cmath>

namespace sympathetic {

WaveformHistory::WaveformHistory(const int historySize) noexcept
    : historySize_(historySize > 0 ? historySize : 0),
      buffer_(static_cast<std::size_t>(historySize_), 0.0F)
{
}

void WaveformHistory::setSampleRate(const double sampleRate) noexcept
{
    const double sr = (sampleRate > 0.0) ? sampleRate : 44100.0;
    sampleRate_.store(sr, std::memory_order_relaxed);
}

void WaveformHistory::reset() noexcept
{
    writeIndex_.store(0, std::memory_order_relaxed);
    std::fill(buffer_.begin(), buffer_.end(), 0.0F);
}

void WaveformHistory::writeSamples(const float* mono,
                                   const int numSamples) noexcept
{
    if (mono == nullptr || numSamples <= 0 || historySize_ <= 0) {
        return;
    }

    const long long base =
        writeIndex_.load(std::memory_order_relaxed);
    for (int i = 0; i < numSamples; ++i) {
        const auto local = static_cast<std::size_t>(
            (base + i) % static_cast<long long>(historySize_));
        buffer_[local] = mono[i];
    }
    writeIndex_.store(base + numSamples, std::memory_order_release);
}

long long WaveformHistory::samplesWritten() const noexcept
{
    return writeIndex_.load(std::memory_order_acquire);
}

int WaveformHistory::windowSamples(const double windowSeconds,
                                   long long& writeIndex) const noexcept
{
    writeIndex = writeIndex_.load(std::memory_order_acquire);
    const long long available =
        std::min<long long>(historySize_, std::max<long long>(writeIndex, 0));
    if (available <= 0) {
        return 0;
    }

    double window = windowSeconds;
    if (window <= 0.0) {
        window = 0.05;  // ~50 ms default.
    }
    const double sr = sampleRate_.load(std::memory_order_relaxed);
    const auto requested = static_cast<long long>(window * sr);
    return static_cast<int>(std::max<long long>(1, std::min(requested, available)));
}

void WaveformHistory::getSnapshot(float* dst, const int numPoints,
                                  const double windowSeconds) const noexcept
{
    if (dst == nullptr || numPoints <= 0) {
        return;
    }

    long long writeIndex = 0;
    const int window = windowSamples(windowSeconds, writeIndex);
    if (window <= 0) {
        std::fill(dst, dst + numPoints, 0.0F);
        return;
    }

    const long long start = writeIndex - window;
    const int points = std::min(numPoints, window);
    const float denom = static_cast<float>(std::max(points - 1, 1));

    for (int i = 0; i < points; ++i) {
        const float t = static_cast<float>(i) / denom;
        const auto offset =
            static_cast<long long>(t * static_cast<float>(window - 1));
        const auto local = static_cast<std::size_t>(
            (start + offset) % static_cast<long long>(historySize_));
        dst[i] = buffer_[local];
    }

    // Pad with the last value when more points than samples are asked.
    for (int i = points; i < numPoints; ++i) {
        dst[i] = dst[points - 1];
    }
}

float WaveformHistory::peak(const double windowSeconds) const noexcept
{
    long long writeIndex = 0;
    const int window = windowSamples(windowSeconds, writeIndex);

    float result = 0.0F;
    for (long long i = writeIndex - window; i < writeIndex; ++i) {
        const auto local = static_cast<std::size_t>(
            i % static_cast<long long>(historySize_));
        result = std::max(result, std::abs(buffer_[local]));
    }
    return result;
}

}  // namespace sympathetic
