#include "AudioGraphContext.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

#include <juce_core/juce_core.h>
#include <juce_dsp/juce_dsp.h>

namespace sympathetic {

namespace {

constexpr double kUnset = std::numeric_limits<double>::infinity();
constexpr double kTwoPi = 6.283185307179586;

void LogGraph(const juce::String& message)
{
    juce::Logger::writeToLog("[sympathetic-core] " + message);
}

// One period sample for `phase` in [0, 1). Every shape starts at zero
// (except square) and rises, so a 0 Hz LFO sits at its centre line.
float WaveformSample(const Waveform waveform, const double phase)
{
    switch (waveform) {
    case Waveform::kSine:
        return static_cast<float>(std::sin(kTwoPi * phase));
    case Waveform::kTriangle:
        if (phase < 0.25) {
            return static_cast<float>(4.0 * phase);
        }
        if (phase < 0.75) {
            return static_cast<float>(2.0 - 4.0 * phase);
        }
        return static_cast<float>(4.0 * phase - 4.0);
    case Waveform::kSawtooth: {
        const double shifted = phase + 0.5;
        return static_cast<float>(2.0 * (shifted - std::floor(shifted)) - 1.0);
    }
    case Waveform::kSquare:
        return phase < 0.5 ? 1.0F : -1.0F;
    }
    return 0.0F;
}

juce::dsp::StateVariableTPTFilterType ToJuceFilterType(const FilterType type)
{
    switch (type) {
    case FilterType::kLowpass:
        return juce::dsp::StateVariableTPTFilterType::lowpass;
    case FilterType::kHighpass:
        return juce::dsp::StateVariableTPTFilterType::highpass;
    case FilterType::kBandpass:
        return juce::dsp::StateVariableTPTFilterType::bandpass;
    }
    return juce::dsp::StateVariableTPTFilterType::lowpass;
}

float ResonanceFor(const FilterType type, const double q)
{
    double resonance = q;
    if (type != FilterType::kBandpass) {
        // Peak gain in dB over the Butterworth response.
        resonance = std::pow(10.0, q / 20.0) * juce::MathConstants<double>::sqrt2 * 0.5;
    }
    return static_cast<float>(std::clamp(resonance, 0.1, 40.0));
}

}  // namespace

// ---------------------------------------------------------------------
// Render node base

class RenderNode {
public:
    struct Modulation {
        AudioParam* param{nullptr};
        std::shared_ptr<RenderNode> source;
    };

    RenderNode(const AudioGraphContext& owner, std::string id, const char* kind)
        : owner_(owner), id_(std::move(id)), kind_(kind)
    {
    }

    virtual ~RenderNode() = default;

    RenderNode(const RenderNode&) = delete;
    RenderNode& operator=(const RenderNode&) = delete;

    [[nodiscard]] const AudioGraphContext& owner() const noexcept { return owner_; }
    [[nodiscard]] const std::string& nodeId() const noexcept { return id_; }
    [[nodiscard]] const char* kind() const noexcept { return kind_; }

    void prepare(const double sampleRate)
    {
        sampleRate_ = sampleRate;
        onPrepare(sampleRate);
    }

    // Automation params owned by this node, by name.
    [[nodiscard]] virtual std::vector<std::pair<const char*, AudioParam*>> params()
    {
        return {};
    }

    [[nodiscard]] const char* paramName(const AudioParam& param)
    {
        for (const auto& [name, p] : params()) {
            if (p == &param) {
                return name;
            }
        }
        return nullptr;
    }

    // Output for `frame`, computed once per frame.
    float pull(const std::int64_t frame, const double time)
    {
        if (frame == lastFrame_) {
            return lastValue_;
        }
        lastFrame_ = frame;
        // A feedback loop reads silence instead of recursing.
        lastValue_ = 0.0F;
        lastValue_ = process(frame, time);
        return lastValue_;
    }

    std::vector<std::shared_ptr<RenderNode>> inputs;
    std::vector<Modulation> modulations;

protected:
    virtual void onPrepare(double /*sampleRate*/) {}
    virtual float process(std::int64_t frame, double time) = 0;

    [[nodiscard]] double sampleRate() const noexcept { return sampleRate_; }

    float sumInputs(const std::int64_t frame, const double time)
    {
        float sum = 0.0F;
        for (const auto& input : inputs) {
            sum += input->pull(frame, time);
        }
        return sum;
    }

    double paramValue(const AudioParam& param, const std::int64_t frame,
                      const double time)
    {
        double value = param.valueAtTime(time);
        for (const auto& modulation : modulations) {
            if (modulation.param == &param) {
                value += modulation.source->pull(frame, time);
            }
        }
        return value;
    }

private:
    const AudioGraphContext& owner_;
    const std::string id_;
    const char* const kind_;

    double sampleRate_{44100.0};
    std::int64_t lastFrame_{-1};
    float lastValue_{0.0F};
};

namespace {

// ---------------------------------------------------------------------
// Node implementations

class OscillatorImpl final : public OscillatorNode, public RenderNode {
public:
    OscillatorImpl(const AudioGraphContext& owner, std::string id,
                   const double frequencyHz, const Waveform waveform)
        : RenderNode(owner, std::move(id), "oscillator"),
          frequency_(frequencyHz, owner),
          detune_(0.0, owner),
          waveform_(static_cast<int>(waveform))
    {
    }

    const std::string& id() const override { return nodeId(); }

    AudioParam& frequency() override { return frequency_; }
    AudioParam& detune() override { return detune_; }

    Waveform waveform() const override
    {
        return static_cast<Waveform>(waveform_.load(std::memory_order_relaxed));
    }

    void setWaveform(const Waveform waveform) override
    {
        waveform_.store(static_cast<int>(waveform), std::memory_order_relaxed);
    }

    bool start(const double when) override
    {
        double expected = kUnset;
        return startAt_.compare_exchange_strong(expected, when);
    }

    bool stop(const double when) override
    {
        if (startAt_.load() == kUnset) {
            return false;
        }
        double expected = kUnset;
        return stopAt_.compare_exchange_strong(expected, when);
    }

    std::optional<double> startTime() const override
    {
        const double t = startAt_.load();
        return t == kUnset ? std::nullopt : std::optional<double>(t);
    }

    std::optional<double> stopTime() const override
    {
        const double t = stopAt_.load();
        return t == kUnset ? std::nullopt : std::optional<double>(t);
    }

    std::vector<std::pair<const char*, AudioParam*>> params() override
    {
        return {{"frequency", &frequency_}, {"detune", &detune_}};
    }

protected:
    float process(const std::int64_t frame, const double time) override
    {
        if (time < startAt_.load(std::memory_order_relaxed) ||
            time >= stopAt_.load(std::memory_order_relaxed)) {
            return 0.0F;
        }

        const double cents = paramValue(detune_, frame, time);
        const double hz =
            paramValue(frequency_, frame, time) * std::pow(2.0, cents / 1200.0);

        const float out = WaveformSample(waveform(), phase_);
        phase_ += hz / sampleRate();
        phase_ -= std::floor(phase_);
        return out;
    }

private:
    AudioParam frequency_;
    AudioParam detune_;
    std::atomic<int> waveform_;
    std::atomic<double> startAt_{kUnset};
    std::atomic<double> stopAt_{kUnset};
    double phase_{0.0};
};

class GainImpl final : public GainNode, public RenderNode {
public:
    GainImpl(const AudioGraphContext& owner, std::string id,
             const double initialGain)
        : RenderNode(owner, std::move(id), "gain"), gain_(initialGain, owner)
    {
    }

    const std::string& id() const override { return nodeId(); }
    AudioParam& gain() override { return gain_; }

    std::vector<std::pair<const char*, AudioParam*>> params() override
    {
        return {{"gain", &gain_}};
    }

protected:
    float process(const std::int64_t frame, const double time) override
    {
        const float in = sumInputs(frame, time);
        return in * static_cast<float>(paramValue(gain_, frame, time));
    }

private:
    AudioParam gain_;
};

class FilterImpl final : public FilterNode, public RenderNode {
public:
    FilterImpl(const AudioGraphContext& owner, std::string id,
               const FilterType type, const double frequencyHz,
               const double q)
        : RenderNode(owner, std::move(id), "filter"),
          frequency_(frequencyHz, owner),
          q_(q, owner),
          type_(static_cast<int>(type))
    {
    }

    const std::string& id() const override { return nodeId(); }

    AudioParam& frequency() override { return frequency_; }
    AudioParam& q() override { return q_; }

    FilterType type() const override
    {
        return static_cast<FilterType>(type_.load(std::memory_order_relaxed));
    }

    void setType(const FilterType type) override
    {
        type_.store(static_cast<int>(type), std::memory_order_relaxed);
    }

    std::vector<std::pair<const char*, AudioParam*>> params() override
    {
        return {{"frequency", &frequency_}, {"Q", &q_}};
    }

protected:
    void onPrepare(const double sampleRate) override
    {
        juce::dsp::ProcessSpec spec{};
        spec.sampleRate = sampleRate;
        spec.maximumBlockSize = 1;
        spec.numChannels = 1;
        filter_.prepare(spec);
        filter_.reset();
        lastCutoff_ = -1.0F;
        lastResonance_ = -1.0F;
        lastType_ = -1;
    }

    float process(const std::int64_t frame, const double time) override
    {
        const float in = sumInputs(frame, time);

        const FilterType current = type();
        if (static_cast<int>(current) != lastType_) {
            lastType_ = static_cast<int>(current);
            filter_.setType(ToJuceFilterType(current));
            lastResonance_ = -1.0F;
        }

        // A non-finite parameter value keeps the coefficients already set;
        // feeding it to the filter would poison its state for good.
        const double frequency = paramValue(frequency_, frame, time);
        if (std::isfinite(frequency)) {
            const auto cutoff = static_cast<float>(
                std::clamp(frequency, 10.0, sampleRate() * 0.49));
            if (std::abs(cutoff - lastCutoff_) > 0.01F) {
                lastCutoff_ = cutoff;
                filter_.setCutoffFrequency(cutoff);
            }
        }

        const double q = paramValue(q_, frame, time);
        if (std::isfinite(q)) {
            const float resonance = ResonanceFor(current, q);
            if (std::abs(resonance - lastResonance_) > 1e-4F) {
                lastResonance_ = resonance;
                filter_.setResonance(resonance);
            }
        }

        return filter_.processSample(0, in);
    }

private:
    AudioParam frequency_;
    AudioParam q_;
    std::atomic<int> type_;

    juce::dsp::StateVariableTPTFilter<float> filter_{};
    float lastCutoff_{-1.0F};
    float lastResonance_{-1.0F};
    int lastType_{-1};
};

class CompressorImpl final : public CompressorNode, public RenderNode {
public:
    CompressorImpl(const AudioGraphContext& owner, std::string id,
                   const CompressorSettings& settings)
        : RenderNode(owner, std::move(id), "compressor"), settings_(settings)
    {
    }

    const std::string& id() const override { return nodeId(); }
    CompressorSettings settings() const override { return settings_; }

protected:
    void onPrepare(const double sampleRate) override
    {
        juce::dsp::ProcessSpec spec{};
        spec.sampleRate = sampleRate;
        spec.maximumBlockSize = 1;
        spec.numChannels = 1;
        compressor_.prepare(spec);
        compressor_.setThreshold(settings_.threshold_db);
        compressor_.setRatio(std::max(settings_.ratio, 1.0F));
        compressor_.setAttack(settings_.attack_seconds * 1000.0F);
        compressor_.setRelease(settings_.release_seconds * 1000.0F);
        compressor_.reset();
    }

    float process(const std::int64_t frame, const double time) override
    {
        return compressor_.processSample(0, sumInputs(frame, time));
    }

private:
    const CompressorSettings settings_;
    juce::dsp::Compressor<float> compressor_{};
};

class NoiseImpl final : public NoiseSourceNode, public RenderNode {
public:
    static constexpr double kBufferSeconds = 2.0;

    NoiseImpl(const AudioGraphContext& owner, std::string id)
        : RenderNode(owner, std::move(id), "noise")
    {
    }

    const std::string& id() const override { return nodeId(); }

    bool start(const double when) override
    {
        double expected = kUnset;
        return startAt_.compare_exchange_strong(expected, when);
    }

    bool started() const override { return startAt_.load() != kUnset; }

protected:
    void onPrepare(const double sampleRate) override
    {
        const auto size =
            static_cast<std::size_t>(std::max(1.0, sampleRate * kBufferSeconds));
        if (buffer_.size() == size) {
            return;
        }
        // Fixed seed keeps renders reproducible.
        juce::Random random(0x5eed);
        buffer_.resize(size);
        for (auto& sample : buffer_) {
            sample = random.nextFloat() * 2.0F - 1.0F;
        }
        position_ = 0;
    }

    float process(const std::int64_t /*frame*/, const double time) override
    {
        if (buffer_.empty() || time < startAt_.load(std::memory_order_relaxed)) {
            return 0.0F;
        }
        const float out = buffer_[position_];
        position_ = (position_ + 1) % buffer_.size();
        return out;
    }

private:
    std::atomic<double> startAt_{kUnset};
    std::vector<float> buffer_;
    std::size_t position_{0};
};

class DestinationImpl final : public AudioNode, public RenderNode {
public:
    explicit DestinationImpl(const AudioGraphContext& owner)
        : RenderNode(owner, "destination", "destination")
    {
    }

    const std::string& id() const override { return nodeId(); }

protected:
    float process(const std::int64_t frame, const double time) override
    {
        return sumInputs(frame, time);
    }
};

template <typename Container, typename Predicate>
bool EraseIf(Container& container, Predicate predicate)
{
    const auto it = std::remove_if(container.begin(), container.end(), predicate);
    const bool erased = it != container.end();
    container.erase(it, container.end());
    return erased;
}

}  // namespace

// ---------------------------------------------------------------------
// AudioGraphContext

AudioGraphContext::AudioGraphContext(const double sampleRate)
    : sampleRate_(sampleRate > 0.0 ? sampleRate : 44100.0)
{
    history_.setSampleRate(sampleRate_.load());

    destination_ = std::make_shared<DestinationImpl>(*this);
    destination_->prepare(sampleRate_.load());
    nodes_.push_back(destination_);
}

AudioGraphContext::~AudioGraphContext()
{
    // Break every edge so that chains still referenced from outside do
    // not keep each other alive.
    const std::lock_guard<std::mutex> lock(renderMutex_);
    for (const auto& node : liveNodesLocked()) {
        node->inputs.clear();
        node->modulations.clear();
    }
}

double AudioGraphContext::currentTime() const
{
    return static_cast<double>(frames_.load(std::memory_order_acquire)) /
           sampleRate_.load(std::memory_order_relaxed);
}

double AudioGraphContext::sampleRate() const
{
    return sampleRate_.load(std::memory_order_relaxed);
}

std::string AudioGraphContext::nextId(const char* kind)
{
    return std::string(kind) + "-" + std::to_string(nextNodeNumber_++);
}

void AudioGraphContext::registerNode(const std::shared_ptr<RenderNode>& node)
{
    node->prepare(sampleRate_.load(std::memory_order_relaxed));
    (void)EraseIf(nodes_, [](const std::weak_ptr<RenderNode>& weak) {
        return weak.expired();
    });
    nodes_.push_back(node);
}

std::shared_ptr<OscillatorNode> AudioGraphContext::createOscillator(
    const double frequencyHz, const Waveform waveform)
{
    const std::lock_guard<std::mutex> lock(renderMutex_);
    auto node = std::make_shared<OscillatorImpl>(*this, nextId("osc"),
                                                 frequencyHz, waveform);
    registerNode(node);
    return node;
}

std::shared_ptr<GainNode> AudioGraphContext::createGain(const double initialGain)
{
    const std::lock_guard<std::mutex> lock(renderMutex_);
    auto node = std::make_shared<GainImpl>(*this, nextId("gain"), initialGain);
    registerNode(node);
    return node;
}

std::shared_ptr<FilterNode> AudioGraphContext::createFilter(
    const FilterType type, const double frequencyHz, const double q)
{
    const std::lock_guard<std::mutex> lock(renderMutex_);
    auto node = std::make_shared<FilterImpl>(*this, nextId("filter"), type,
                                             frequencyHz, q);
    registerNode(node);
    return node;
}

std::shared_ptr<CompressorNode> AudioGraphContext::createCompressor(
    const CompressorSettings& settings)
{
    const std::lock_guard<std::mutex> lock(renderMutex_);
    auto node = std::make_shared<CompressorImpl>(*this, nextId("compressor"),
                                                 settings);
    registerNode(node);
    return node;
}

std::shared_ptr<NoiseSourceNode> AudioGraphContext::createNoise()
{
    const std::lock_guard<std::mutex> lock(renderMutex_);
    auto node = std::make_shared<NoiseImpl>(*this, nextId("noise"));
    registerNode(node);
    return node;
}

std::shared_ptr<AudioNode> AudioGraphContext::destination()
{
    return std::dynamic_pointer_cast<AudioNode>(destination_);
}

std::shared_ptr<RenderNode> AudioGraphContext::findLocked(
    const AudioNode* node) const
{
    if (node == nullptr) {
        return nullptr;
    }
    for (const auto& live : liveNodesLocked()) {
        if (dynamic_cast<const AudioNode*>(live.get()) == node) {
            return live;
        }
    }
    return nullptr;
}

std::vector<std::shared_ptr<RenderNode>> AudioGraphContext::liveNodesLocked() const
{
    std::vector<std::shared_ptr<RenderNode>> live;
    live.reserve(nodes_.size());
    for (const auto& weak : nodes_) {
        if (auto node = weak.lock()) {
            live.push_back(std::move(node));
        }
    }
    return live;
}

void AudioGraphContext::connect(const std::shared_ptr<AudioNode>& from,
                                const std::shared_ptr<AudioNode>& to)
{
    const std::lock_guard<std::mutex> lock(renderMutex_);
    auto source = findLocked(from.get());
    auto target = findLocked(to.get());
    if (source == nullptr || target == nullptr) {
        LogGraph("Ignoring connection between nodes of another context");
        return;
    }
    if (std::find(target->inputs.begin(), target->inputs.end(), source) !=
        target->inputs.end()) {
        return;
    }
    target->inputs.push_back(std::move(source));
}

void AudioGraphContext::connect(const std::shared_ptr<AudioNode>& from,
                                const std::shared_ptr<AudioNode>& owner,
                                AudioParam& param)
{
    const std::lock_guard<std::mutex> lock(renderMutex_);
    auto source = findLocked(from.get());
    auto target = findLocked(owner.get());
    if (source == nullptr || target == nullptr) {
        LogGraph("Ignoring modulation between nodes of another context");
        return;
    }
    if (target->paramName(param) == nullptr) {
        LogGraph("Ignoring modulation of a param not owned by " +
                 juce::String(target->nodeId()));
        return;
    }
    for (const auto& modulation : target->modulations) {
        if (modulation.param == &param && modulation.source == source) {
            return;
        }
    }
    target->modulations.push_back(RenderNode::Modulation{&param, std::move(source)});
}

bool AudioGraphContext::disconnect(const std::shared_ptr<AudioNode>& from,
                                   AudioParam& param)
{
    const std::lock_guard<std::mutex> lock(renderMutex_);
    const auto source = findLocked(from.get());
    if (source == nullptr) {
        return false;
    }

    bool removed = false;
    for (const auto& node : liveNodesLocked()) {
        removed |= EraseIf(node->modulations,
                           [&](const RenderNode::Modulation& modulation) {
                               return modulation.param == &param &&
                                      modulation.source == source;
                           });
    }
    return removed;
}

void AudioGraphContext::disconnect(const std::shared_ptr<AudioNode>& node)
{
    const std::lock_guard<std::mutex> lock(renderMutex_);
    const auto target = findLocked(node.get());
    if (target == nullptr) {
        return;
    }

    for (const auto& live : liveNodesLocked()) {
        (void)EraseIf(live->inputs, [&](const std::shared_ptr<RenderNode>& input) {
            return input == target;
        });
        (void)EraseIf(live->modulations,
                      [&](const RenderNode::Modulation& modulation) {
                          return modulation.source == target;
                      });
    }
    target->inputs.clear();
    target->modulations.clear();
}

AudioGraph AudioGraphContext::graph() const
{
    const std::lock_guard<std::mutex> lock(renderMutex_);

    AudioGraph snapshot;
    const auto live = liveNodesLocked();
    for (const auto& node : live) {
        snapshot.AddNode(AudioGraph::Node{node->nodeId(), node->kind()});
    }
    for (const auto& node : live) {
        for (const auto& input : node->inputs) {
            snapshot.AddEdge(AudioGraph::Edge{input->nodeId(), node->nodeId(), {}});
        }
        for (const auto& modulation : node->modulations) {
            const char* name = node->paramName(*modulation.param);
            snapshot.AddEdge(AudioGraph::Edge{modulation.source->nodeId(),
                                              node->nodeId(),
                                              name != nullptr ? name : "param"});
        }
    }
    return snapshot;
}

std::size_t AudioGraphContext::nodeCount() const
{
    const std::lock_guard<std::mutex> lock(renderMutex_);
    return liveNodesLocked().size();
}

void AudioGraphContext::renderBlock(float* out, const int numSamples)
{
    if (numSamples <= 0) {
        return;
    }

    const std::lock_guard<std::mutex> lock(renderMutex_);

    if (scratch_.size() < static_cast<std::size_t>(numSamples)) {
        scratch_.resize(static_cast<std::size_t>(numSamples));
    }

    const double sr = sampleRate_.load(std::memory_order_relaxed);
    const std::int64_t first = frames_.load(std::memory_order_relaxed);
    for (int i = 0; i < numSamples; ++i) {
        const std::int64_t frame = first + i;
        scratch_[static_cast<std::size_t>(i)] =
            destination_->pull(frame, static_cast<double>(frame) / sr);
    }

    history_.writeSamples(scratch_.data(), numSamples);
    if (out != nullptr) {
        std::copy_n(scratch_.data(), numSamples, out);
    }

    frames_.store(first + numSamples, std::memory_order_release);
}

void AudioGraphContext::setSampleRate(const double sampleRate)
{
    if (!(sampleRate > 0.0)) {
        return;
    }

    const std::lock_guard<std::mutex> lock(renderMutex_);
    const double previous = sampleRate_.load(std::memory_order_relaxed);
    if (previous == sampleRate) {
        return;
    }

    // Keep the clock continuous across the change.
    const double now =
        static_cast<double>(frames_.load(std::memory_order_relaxed)) / previous;
    frames_.store(static_cast<std::int64_t>(std::llround(now * sampleRate)),
                  std::memory_order_release);
    sampleRate_.store(sampleRate, std::memory_order_relaxed);

    for (const auto& node : liveNodesLocked()) {
        node->prepare(sampleRate);
    }
    history_.setSampleRate(sampleRate);
    history_.reset();

    LogGraph("Render graph sample rate " + juce::String(sampleRate, 0) + " Hz");
}

}  // namespace sympathetic
