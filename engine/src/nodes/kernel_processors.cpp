#include "nodes/kernel_processors.h"

#include <algorithm>

namespace Patchwork::Engine {

namespace {

template <size_t N>
std::vector<ParameterDescriptor> toVector(const std::array<ParameterDescriptor, N>& descriptors) {
    return {descriptors.begin(), descriptors.end()};
}

} // namespace

NodeLayout kernelLayout(NodeKind kind) noexcept {
    switch (kind) {
        case NodeKind::SignalMath:
        case NodeKind::Crossfade:
            return {2, 1, 0, 0};
        case NodeKind::Mix2:
            return {2, 2, 1, 1};
        case NodeKind::Mix4:
            return {4, 4, 1, 1};
        case NodeKind::StateVariableFilter:
            return {1, 3, 0, 0};
        case NodeKind::FeedbackOscillator:
        case NodeKind::EnvelopeGenerator:
        case NodeKind::PulseOscillator:
            return {0, 1, 0, 1};
        case NodeKind::Destination:
            return {1, 0, 0, 0};
        case NodeKind::StereoSplitter:
            return {1, 2, 2, 1};
        case NodeKind::StereoMerger:
            return {3, 1, 1, 2};
        case NodeKind::MonoToStereo:
            return {1, 1, 1, 2};
        case NodeKind::Primitive:
        case NodeKind::Effect:
        case NodeKind::Disabled:
            break;
    }
    return {1, 1, 0, 0};
}

// =============================================================================
// SignalMath
// =============================================================================

void SignalMathProcessor::prepare(double /*sampleRate*/, size_t /*maxBlockSize*/) {}

void SignalMathProcessor::process(ProcessContext& ctx) noexcept {
    const AudioBus& a = ctx.inputs[0];
    const AudioBus& b = ctx.inputs[1];
    AudioBus& out = ctx.outputs[0];
    for (size_t ch = 0; ch < out.numChannels(); ++ch) {
        kernel_.processBlock(a.channel(ch), b.channel(ch), out.channel(ch), ctx.numFrames);
    }
}

// =============================================================================
// Crossfade
// =============================================================================

void CrossfadeProcessor::prepare(double /*sampleRate*/, size_t /*maxBlockSize*/) {}

std::vector<ParameterDescriptor> CrossfadeProcessor::parameterDescriptors(double /*sampleRate*/) const {
    return toVector(DSP::Crossfade::parameterDescriptors());
}

void CrossfadeProcessor::process(ProcessContext& ctx) noexcept {
    const AudioBus& a = ctx.inputs[0];
    const AudioBus& b = ctx.inputs[1];
    AudioBus& out = ctx.outputs[0];
    const auto mix = ctx.param(0);
    for (size_t ch = 0; ch < out.numChannels(); ++ch) {
        kernel_.processBlock(a.channel(ch), b.channel(ch), out.channel(ch), mix, ctx.numFrames);
    }
}

// =============================================================================
// Rotation Mixers
// =============================================================================

void Mix2Processor::prepare(double sampleRate, size_t /*maxBlockSize*/) {
    kernel_.prepare(sampleRate);
}

std::vector<ParameterDescriptor> Mix2Processor::parameterDescriptors(double /*sampleRate*/) const {
    return toVector(DSP::RotationMixer2::parameterDescriptors());
}

void Mix2Processor::process(ProcessContext& ctx) noexcept {
    kernel_.processBlock(ctx.inputs[0].channel(0), ctx.inputs[1].channel(0),
                         ctx.outputs[0].channel(0), ctx.outputs[1].channel(0),
                         ctx.param(0), ctx.numFrames);
}

void Mix4Processor::prepare(double sampleRate, size_t /*maxBlockSize*/) {
    kernel_.prepare(sampleRate);
}

std::vector<ParameterDescriptor> Mix4Processor::parameterDescriptors(double /*sampleRate*/) const {
    return toVector(DSP::RotationMixer4::parameterDescriptors());
}

void Mix4Processor::process(ProcessContext& ctx) noexcept {
    std::array<const float*, DSP::RotationMixer4::kNumChannels> inputs{};
    std::array<float*, DSP::RotationMixer4::kNumChannels> outputs{};
    for (size_t c = 0; c < DSP::RotationMixer4::kNumChannels; ++c) {
        inputs[c] = ctx.inputs[c].channel(0);
        outputs[c] = ctx.outputs[c].channel(0);
    }
    kernel_.processBlock(inputs, outputs, ctx.param(0), ctx.param(1), ctx.numFrames);
}

// =============================================================================
// StateVariableFilter
// =============================================================================

void StateVariableFilterProcessor::prepare(double sampleRate, size_t /*maxBlockSize*/) {
    kernel_.prepare(sampleRate);
}

std::vector<ParameterDescriptor> StateVariableFilterProcessor::parameterDescriptors(double sampleRate) const {
    return toVector(DSP::StateVariableFilter::parameterDescriptors(static_cast<float>(sampleRate)));
}

void StateVariableFilterProcessor::process(ProcessContext& ctx) noexcept {
    const AudioBus& in = ctx.inputs[0];
    const size_t channels = std::min(in.numChannels(), DSP::kMaxSVFChannels);

    std::array<const float*, DSP::kMaxSVFChannels> inputs{};
    std::array<float*, DSP::kMaxSVFChannels> lowpass{};
    std::array<float*, DSP::kMaxSVFChannels> highpass{};
    std::array<float*, DSP::kMaxSVFChannels> bandpass{};
    for (size_t ch = 0; ch < channels; ++ch) {
        inputs[ch] = in.channel(ch);
        lowpass[ch] = ctx.outputs[kSVFLowpassOutlet].channel(ch);
        highpass[ch] = ctx.outputs[kSVFHighpassOutlet].channel(ch);
        bandpass[ch] = ctx.outputs[kSVFBandpassOutlet].channel(ch);
    }
    kernel_.processBlock(inputs.data(), lowpass.data(), highpass.data(), bandpass.data(),
                         channels, ctx.numFrames, ctx.param(0), ctx.param(1));
}

// =============================================================================
// FeedbackOscillator
// =============================================================================

void FeedbackOscillatorProcessor::prepare(double sampleRate, size_t /*maxBlockSize*/) {
    kernel_.prepare(sampleRate);
}

std::vector<ParameterDescriptor> FeedbackOscillatorProcessor::parameterDescriptors(double sampleRate) const {
    return toVector(DSP::FeedbackOscillator::parameterDescriptors(static_cast<float>(sampleRate)));
}

void FeedbackOscillatorProcessor::process(ProcessContext& ctx) noexcept {
    kernel_.processBlock(ctx.outputs[0].channel(0), ctx.numFrames, ctx.param(0), ctx.param(1));
}

// =============================================================================
// EnvelopeGenerator
// =============================================================================

void EnvelopeGeneratorProcessor::prepare(double sampleRate, size_t /*maxBlockSize*/) {
    kernel_.prepare(sampleRate);
}

std::vector<ParameterDescriptor> EnvelopeGeneratorProcessor::parameterDescriptors(double /*sampleRate*/) const {
    return toVector(DSP::EnvelopeGenerator::parameterDescriptors());
}

void EnvelopeGeneratorProcessor::process(ProcessContext& ctx) noexcept {
    kernel_.processBlock(ctx.outputs[0].channel(0), ctx.numFrames, ctx.param(0), ctx.param(1),
                         ctx.param(2), ctx.param(3), ctx.param(4), ctx.param(5));
}

} // namespace Patchwork::Engine
