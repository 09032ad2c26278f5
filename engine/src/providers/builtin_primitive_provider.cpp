#include "providers/builtin_primitive_provider.h"

#include "core/engine_config.h"
#include "nodes/source_processors.h"

#include <failsafe/failsafe.hh>

#include <patchwork/dsp/core/db_utils.h>
#include <patchwork/dsp/primitives/biquad.h>
#include <patchwork/dsp/primitives/delay_line.h>
#include <patchwork/dsp/primitives/one_pole.h>
#include <patchwork/dsp/primitives/saturator.h>
#include <patchwork/dsp/primitives/smoother.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <string>

namespace Patchwork::Engine {

std::string_view primitiveTypeName(PrimitiveType type) noexcept {
    switch (type) {
        case PrimitiveType::Gain:           return "gain";
        case PrimitiveType::Delay:          return "delay";
        case PrimitiveType::Biquad:         return "biquad";
        case PrimitiveType::OnePole:        return "one-pole";
        case PrimitiveType::Saturator:      return "saturator";
        case PrimitiveType::Constant:       return "constant";
        case PrimitiveType::Oscillator:     return "oscillator";
        case PrimitiveType::Convolution:    return "convolution";
        case PrimitiveType::BufferPlayback: return "buffer-playback";
    }
    return "unknown";
}

namespace {

using DSP::sampleParam;

// =============================================================================
// Gain
// =============================================================================

class GainProcessor final : public NodeProcessor {
public:
    explicit GainProcessor(float initial)
        : initial_(std::clamp(DSP::detail::sanitize(initial, 1.0f), -kMaxPrimitiveGain, kMaxPrimitiveGain)) {}

    void prepare(double /*sampleRate*/, size_t /*maxBlockSize*/) override {}
    void reset() noexcept override {}

    std::vector<ParameterDescriptor> parameterDescriptors(double /*sampleRate*/) const override {
        return {{"gain", -kMaxPrimitiveGain, kMaxPrimitiveGain, initial_, AutomationRate::ARate}};
    }

    void process(ProcessContext& ctx) noexcept override {
        const AudioBus& in = ctx.inputs[0];
        AudioBus& out = ctx.outputs[0];
        const auto gain = ctx.param(0);
        for (size_t ch = 0; ch < out.numChannels(); ++ch) {
            const float* src = in.channel(ch);
            float* dst = out.channel(ch);
            for (size_t i = 0; i < ctx.numFrames; ++i) {
                dst[i] = (src ? src[i] : 0.0f) * sampleParam(gain, i);
            }
        }
    }

private:
    float initial_;
};

// =============================================================================
// Delay
// =============================================================================

class DelayProcessor final : public NodeProcessor {
public:
    explicit DelayProcessor(float maxDelaySeconds)
        : maxDelaySeconds_(std::clamp(DSP::detail::sanitize(maxDelaySeconds, 1.0f), 0.0f,
                                      kMaxPrimitiveDelaySeconds)) {}

    void prepare(double sampleRate, size_t /*maxBlockSize*/) override {
        sampleRate_ = sampleRate;
        for (auto& line : lines_) line.prepare(sampleRate, maxDelaySeconds_);
    }

    void reset() noexcept override {
        for (auto& line : lines_) line.reset();
    }

    std::vector<ParameterDescriptor> parameterDescriptors(double /*sampleRate*/) const override {
        return {{"delayTime", 0.0f, maxDelaySeconds_, 0.0f, AutomationRate::ARate}};
    }

    void process(ProcessContext& ctx) noexcept override {
        const AudioBus& in = ctx.inputs[0];
        AudioBus& out = ctx.outputs[0];
        const auto delayTime = ctx.param(0);
        const size_t channels = std::min(out.numChannels(), lines_.size());
        const auto sr = static_cast<float>(sampleRate_);
        for (size_t ch = 0; ch < channels; ++ch) {
            const float* src = in.channel(ch);
            float* dst = out.channel(ch);
            auto& line = lines_[ch];
            for (size_t i = 0; i < ctx.numFrames; ++i) {
                line.write(src ? src[i] : 0.0f);
                dst[i] = line.readLinear(sampleParam(delayTime, i) * sr);
            }
        }
    }

private:
    float maxDelaySeconds_;
    double sampleRate_ = 44100.0;
    std::array<DSP::DelayLine, kMaxChannels> lines_;
};

// =============================================================================
// Biquad
// =============================================================================

class BiquadProcessor final : public NodeProcessor {
public:
    BiquadProcessor(DSP::FilterType type, float frequency)
        : type_(type), initialFrequency_(DSP::detail::sanitize(frequency, 1000.0f)) {}

    void prepare(double sampleRate, size_t /*maxBlockSize*/) override {
        sampleRate_ = static_cast<float>(sampleRate);
        initialFrequency_ = std::clamp(initialFrequency_, DSP::kMinFilterFrequency, sampleRate_ * 0.495f);
        lastFrequency_ = -1.0f;
        reset();
    }

    void reset() noexcept override {
        for (auto& filter : filters_) filter.reset();
    }

    std::vector<ParameterDescriptor> parameterDescriptors(double sampleRate) const override {
        return {
            {"frequency", DSP::kMinFilterFrequency, static_cast<float>(sampleRate) * 0.495f, initialFrequency_,
             AutomationRate::KRate},
            {"Q", DSP::kMinQ, DSP::kMaxQ, DSP::kButterworthQ, AutomationRate::KRate},
        };
    }

    void process(ProcessContext& ctx) noexcept override {
        const float frequency = sampleParam(ctx.param(0), 0);
        const float q = sampleParam(ctx.param(1), 0);
        if (frequency != lastFrequency_ || q != lastQ_) {
            const auto coeffs = DSP::BiquadCoefficients::calculate(type_, frequency, q, sampleRate_);
            for (auto& filter : filters_) filter.setCoefficients(coeffs);
            lastFrequency_ = frequency;
            lastQ_ = q;
        }

        const AudioBus& in = ctx.inputs[0];
        AudioBus& out = ctx.outputs[0];
        const size_t channels = std::min(out.numChannels(), filters_.size());
        for (size_t ch = 0; ch < channels; ++ch) {
            const float* src = in.channel(ch);
            float* dst = out.channel(ch);
            std::copy_n(src, ctx.numFrames, dst);
            filters_[ch].processBlock(dst, ctx.numFrames);
        }
    }

private:
    DSP::FilterType type_;
    float initialFrequency_;
    float sampleRate_ = 44100.0f;
    float lastFrequency_ = -1.0f;
    float lastQ_ = -1.0f;
    std::array<DSP::Biquad, kMaxChannels> filters_;
};

// =============================================================================
// OnePole
// =============================================================================

class OnePoleProcessor final : public NodeProcessor {
public:
    explicit OnePoleProcessor(float frequency)
        : initialFrequency_(DSP::detail::sanitize(frequency, 1000.0f)) {}

    void prepare(double sampleRate, size_t /*maxBlockSize*/) override {
        sampleRate_ = static_cast<float>(sampleRate);
        initialFrequency_ = std::clamp(initialFrequency_, 1.0f, sampleRate_ * 0.495f);
        for (auto& filter : filters_) filter.prepare(sampleRate);
    }

    void reset() noexcept override {
        for (auto& filter : filters_) filter.reset();
    }

    std::vector<ParameterDescriptor> parameterDescriptors(double sampleRate) const override {
        return {{"frequency", 1.0f, static_cast<float>(sampleRate) * 0.495f, initialFrequency_,
                 AutomationRate::KRate}};
    }

    void process(ProcessContext& ctx) noexcept override {
        const float frequency = sampleParam(ctx.param(0), 0);
        const AudioBus& in = ctx.inputs[0];
        AudioBus& out = ctx.outputs[0];
        const size_t channels = std::min(out.numChannels(), filters_.size());
        for (size_t ch = 0; ch < channels; ++ch) {
            auto& filter = filters_[ch];
            if (filter.cutoff() != frequency) filter.setCutoff(frequency);
            float* dst = out.channel(ch);
            std::copy_n(in.channel(ch), ctx.numFrames, dst);
            filter.processBlock(dst, ctx.numFrames);
        }
    }

private:
    float initialFrequency_;
    float sampleRate_ = 44100.0f;
    std::array<DSP::OnePoleLP, kMaxChannels> filters_;
};

// =============================================================================
// Saturator
// =============================================================================

class SaturatorProcessor final : public NodeProcessor {
public:
    explicit SaturatorProcessor(float drive)
        : initialDrive_(std::clamp(DSP::detail::sanitize(drive, 1.0f), DSP::kMinSaturatorDrive,
                                   DSP::kMaxSaturatorDrive)) {}

    void prepare(double /*sampleRate*/, size_t /*maxBlockSize*/) override {}
    void reset() noexcept override {}

    std::vector<ParameterDescriptor> parameterDescriptors(double /*sampleRate*/) const override {
        return {{"drive", DSP::kMinSaturatorDrive, DSP::kMaxSaturatorDrive, initialDrive_,
                 AutomationRate::KRate}};
    }

    void process(ProcessContext& ctx) noexcept override {
        saturator_.setDrive(sampleParam(ctx.param(0), 0));
        const AudioBus& in = ctx.inputs[0];
        AudioBus& out = ctx.outputs[0];
        for (size_t ch = 0; ch < out.numChannels(); ++ch) {
            float* dst = out.channel(ch);
            std::copy_n(in.channel(ch), ctx.numFrames, dst);
            saturator_.processBlock(dst, ctx.numFrames);
        }
    }

private:
    float initialDrive_;
    DSP::Saturator saturator_;
};

// =============================================================================
// Constant
// =============================================================================

class ConstantProcessor final : public NodeProcessor {
public:
    explicit ConstantProcessor(float offset)
        : initial_(std::clamp(DSP::detail::sanitize(offset, 1.0f), -kMaxConstantOffset, kMaxConstantOffset)) {}

    void prepare(double /*sampleRate*/, size_t /*maxBlockSize*/) override {}
    void reset() noexcept override {}

    std::vector<ParameterDescriptor> parameterDescriptors(double /*sampleRate*/) const override {
        return {{"offset", -kMaxConstantOffset, kMaxConstantOffset, initial_, AutomationRate::ARate}};
    }

    void process(ProcessContext& ctx) noexcept override {
        const auto offset = ctx.param(0);
        float* dst = ctx.outputs[0].channel(0);
        for (size_t i = 0; i < ctx.numFrames; ++i) dst[i] = sampleParam(offset, i);
    }

private:
    float initial_;
};

} // namespace

// =============================================================================
// BuiltinPrimitiveProvider
// =============================================================================

std::unique_ptr<NodeProcessor> BuiltinPrimitiveProvider::create(PrimitiveType type,
                                                                const PrimitiveOptions& options) {
    switch (type) {
        case PrimitiveType::Gain:       return std::make_unique<GainProcessor>(options.value);
        case PrimitiveType::Delay:      return std::make_unique<DelayProcessor>(options.maxDelaySeconds);
        case PrimitiveType::Biquad:
            return std::make_unique<BiquadProcessor>(options.filterType, options.frequency);
        case PrimitiveType::OnePole:    return std::make_unique<OnePoleProcessor>(options.frequency);
        case PrimitiveType::Saturator:  return std::make_unique<SaturatorProcessor>(options.value);
        case PrimitiveType::Constant:   return std::make_unique<ConstantProcessor>(options.value);
        case PrimitiveType::Oscillator:
            return std::make_unique<OscillatorProcessor>(options.waveform, options.frequency, options.width);
        case PrimitiveType::Convolution:
        case PrimitiveType::BufferPlayback:
            break;
    }
    LOG_DEBUG("provider", "no built-in", primitiveTypeName(type));
    return nullptr;
}

NodeLayout BuiltinPrimitiveProvider::layout(PrimitiveType type) const {
    switch (type) {
        case PrimitiveType::Constant:
        case PrimitiveType::Oscillator:
        case PrimitiveType::BufferPlayback:
            return {0, 1, 0, 1};
        case PrimitiveType::Gain:
        case PrimitiveType::Delay:
        case PrimitiveType::Biquad:
        case PrimitiveType::OnePole:
        case PrimitiveType::Saturator:
        case PrimitiveType::Convolution:
            break;
    }
    return {1, 1, 0, 0};
}

} // namespace Patchwork::Engine
