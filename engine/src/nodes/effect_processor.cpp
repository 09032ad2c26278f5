#include "nodes/effect_processor.h"

#include <algorithm>
#include <utility>

namespace Patchwork::Engine {

// =============================================================================
// EffectProcessor
// =============================================================================

EffectProcessor::EffectProcessor(std::unique_ptr<NodeProcessor> wet, size_t channels, DSP::CrossfadeCurve curve)
    : wet_(std::move(wet))
    , channels_(channels)
    , crossfade_(curve)
{
}

void EffectProcessor::prepare(double sampleRate, size_t maxBlockSize) {
    wet_->prepare(sampleRate, maxBlockSize);
    wetOutputs_.clear();
    wetOutputs_.emplace_back(channels_, maxBlockSize);
}

void EffectProcessor::reset() noexcept {
    wet_->reset();
    for (auto& bus : wetOutputs_) bus.clear();
}

std::vector<ParameterDescriptor> EffectProcessor::parameterDescriptors(double sampleRate) const {
    std::vector<ParameterDescriptor> descriptors;
    const auto mix = DSP::Crossfade::parameterDescriptors();
    descriptors.assign(mix.begin(), mix.end());
    const auto wet = wet_->parameterDescriptors(sampleRate);
    descriptors.insert(descriptors.end(), wet.begin(), wet.end());
    return descriptors;
}

void EffectProcessor::process(ProcessContext& ctx) noexcept {
    ProcessContext wetCtx;
    wetCtx.inputs = ctx.inputs;
    wetCtx.outputs = wetOutputs_;
    wetCtx.parameters = ctx.parameters.empty() ? ctx.parameters : ctx.parameters.subspan(1);
    wetCtx.numFrames = ctx.numFrames;
    wetCtx.sampleRate = ctx.sampleRate;
    wetCtx.blockStartTime = ctx.blockStartTime;
    wet_->process(wetCtx);

    const AudioBus& dry = ctx.inputs[0];
    const AudioBus& wetBus = wetOutputs_[0];
    AudioBus& out = ctx.outputs[0];
    const auto mix = ctx.param(0);
    for (size_t ch = 0; ch < out.numChannels(); ++ch) {
        crossfade_.processBlock(dry.channel(ch), wetBus.channel(ch), out.channel(ch), mix, ctx.numFrames);
    }
}

// =============================================================================
// ReverbProcessor
// =============================================================================

void ReverbProcessor::prepare(double sampleRate, size_t maxBlockSize) {
    reverb_.prepare(sampleRate, seed_);
    left_.assign(maxBlockSize, 0.0f);
    right_.assign(maxBlockSize, 0.0f);
}

std::vector<ParameterDescriptor> ReverbProcessor::parameterDescriptors(double /*sampleRate*/) const {
    const auto descriptors = DSP::FDNReverb::parameterDescriptors();
    return {descriptors.begin(), descriptors.end()};
}

void ReverbProcessor::process(ProcessContext& ctx) noexcept {
    DSP::FDNReverbParams params;
    params.decay = DSP::sampleParam(ctx.param(0), 0);
    params.theta = DSP::sampleParam(ctx.param(1), 0);
    params.iota = DSP::sampleParam(ctx.param(2), 0);
    params.dampingHz = DSP::sampleParam(ctx.param(3), 0);
    reverb_.setParams(params);

    const size_t frames = std::min(ctx.numFrames, left_.size());
    const AudioBus& in = ctx.inputs[0];
    const float* inL = in.channel(0);
    const float* inR = in.numChannels() > 1 ? in.channel(1) : inL;
    reverb_.processBlock(inL, inR, left_.data(), right_.data(), frames);

    AudioBus& out = ctx.outputs[0];
    if (out.numChannels() == 1) {
        float* dst = out.channel(0);
        for (size_t i = 0; i < frames; ++i) dst[i] = 0.5f * (left_[i] + right_[i]);
        return;
    }
    for (size_t ch = 0; ch < out.numChannels(); ++ch) {
        const std::vector<float>& src = (ch % 2 == 0) ? left_ : right_;
        std::copy_n(src.begin(), frames, out.channel(ch));
    }
}

// =============================================================================
// DistortionProcessor
// =============================================================================

void DistortionProcessor::prepare(double sampleRate, size_t /*maxBlockSize*/) {
    for (auto& distortion : channels_) distortion.prepare(sampleRate);
}

void DistortionProcessor::reset() noexcept {
    for (auto& distortion : channels_) distortion.reset();
}

std::vector<ParameterDescriptor> DistortionProcessor::parameterDescriptors(double /*sampleRate*/) const {
    const auto descriptors = DSP::Distortion::parameterDescriptors();
    return {descriptors.begin(), descriptors.end()};
}

void DistortionProcessor::process(ProcessContext& ctx) noexcept {
    const AudioBus& in = ctx.inputs[0];
    AudioBus& out = ctx.outputs[0];
    const size_t channels = std::min(out.numChannels(), channels_.size());
    for (size_t ch = 0; ch < channels; ++ch) {
        channels_[ch].processBlock(in.channel(ch), out.channel(ch), ctx.numFrames, ctx.param(0));
    }
}

} // namespace Patchwork::Engine
