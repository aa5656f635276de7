#include "AudioDeviceContext.h"

#include <algorithm>

namespace sympathetic {

AudioDeviceContext::AudioDeviceContext() : AudioGraphContext(44100.0)
{
    // Initialise with no inputs and stereo outputs.
    const juce::String audioError =
        deviceManager_.initialiseWithDefaultDevices(/*numInputChannels*/ 0,
                                                    /*numOutputChannels*/ 2);
    if (audioError.isNotEmpty()) {
        juce::Logger::writeToLog(
            "[sympathetic-core] Failed to initialise audio: " + audioError);
        initError_ = true;
        return;
    }

    deviceManager_.addAudioCallback(this);
    juce::Logger::writeToLog("[sympathetic-core] Audio device context initialised.");
}

AudioDeviceContext::~AudioDeviceContext()
{
    shutdown();
}

void AudioDeviceContext::shutdown()
{
    if (isShutdown_) {
        return;
    }
    isShutdown_ = true;

    // No further callbacks once this returns; the device itself is
    // closed by the AudioDeviceManager destructor.
    deviceManager_.removeAudioCallback(this);
}

juce::String AudioDeviceContext::deviceName() const
{
    if (auto* device = deviceManager_.getCurrentAudioDevice()) {
        return device->getName();
    }
    return {};
}

void AudioDeviceContext::audioDeviceAboutToStart(juce::AudioIODevice* device)
{
    const double sr =
        (device != nullptr) ? device->getCurrentSampleRate() : 44100.0;
    const int blockSize =
        (device != nullptr) ? device->getCurrentBufferSizeSamples() : 512;

    setSampleRate(sr > 0.0 ? sr : 44100.0);
    mono_.assign(static_cast<std::size_t>(std::max(blockSize, 1)), 0.0F);
}

void AudioDeviceContext::audioDeviceStopped()
{
}

void AudioDeviceContext::audioDeviceIOCallbackWithContext(
    const float* const* /*inputChannelData*/,
    const int /*numInputChannels*/,
    float* const* outputChannelData,
    const int numOutputChannels,
    const int numSamples,
    const juce::AudioIODeviceCallbackContext& /*context*/)
{
    if (numSamples <= 0) {
        return;
    }
    if (mono_.size() < static_cast<std::size_t>(numSamples)) {
        mono_.resize(static_cast<std::size_t>(numSamples));
    }

    renderBlock(mono_.data(), numSamples);

    for (int ch = 0; ch < numOutputChannels; ++ch) {
        if (outputChannelData[ch] != nullptr) {
            std::copy_n(mono_.data(), numSamples, outputChannelData[ch]);
        }
    }
}

}  // namespace sympathetic
