#include "OfflineAudioContext.h"

#include <algorithm>
#include <cmath>

namespace sympathetic {

namespace {

// Rendered in chunks so that long advances do not need one big buffer.
constexpr int kChunkSize = 512;

}  // namespace

OfflineAudioContext::OfflineAudioContext(const double sampleRate)
    : AudioGraphContext(sampleRate)
{
}

std::vector<float> OfflineAudioContext::render(const int numSamples)
{
    std::vector<float> out(static_cast<std::size_t>(std::max(numSamples, 0)),
                           0.0F);
    if (!out.empty()) {
        renderBlock(out.data(), numSamples);
    }
    return out;
}

std::vector<float> OfflineAudioContext::renderSeconds(const double seconds)
{
    const auto numSamples =
        static_cast<int>(std::ceil(std::max(seconds, 0.0) * sampleRate()));
    return render(numSamples);
}

float OfflineAudioContext::advance(const double seconds)
{
    auto remaining =
        static_cast<long long>(std::ceil(std::max(seconds, 0.0) * sampleRate()));

    float peak = 0.0F;
    float chunk[kChunkSize];
    while (remaining > 0) {
        const int n = static_cast<int>(std::min<long long>(remaining, kChunkSize));
        renderBlock(chunk, n);
        for (int i = 0; i < n; ++i) {
            peak = std::max(peak, std::abs(chunk[i]));
        }
        remaining -= n;
    }
    return peak;
}

}  // namespace sympathetic
