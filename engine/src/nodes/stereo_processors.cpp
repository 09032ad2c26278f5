#include "nodes/stereo_processors.h"

namespace Patchwork::Engine {

void StereoSplitterProcessor::process(ProcessContext& ctx) noexcept {
    const AudioBus& in = ctx.inputs[0];
    for (size_t side = 0; side < 2; ++side) {
        const float* src = in.channel(side);
        float* dst = ctx.outputs[side].channel(0);
        for (size_t i = 0; i < ctx.numFrames; ++i) dst[i] = src ? src[i] : 0.0f;
    }
}

void StereoMergerProcessor::process(ProcessContext& ctx) noexcept {
    const float* center = ctx.inputs[kMergerCenterInlet].channel(0);
    AudioBus& out = ctx.outputs[0];
    for (size_t side = 0; side < 2; ++side) {
        const float* src = ctx.inputs[kMergerLeftInlet + side].channel(0);
        float* dst = out.channel(side);
        for (size_t i = 0; i < ctx.numFrames; ++i) {
            dst[i] = (src ? src[i] : 0.0f) + kMergerCenterGain * (center ? center[i] : 0.0f);
        }
    }
}

void MonoToStereoProcessor::process(ProcessContext& ctx) noexcept {
    const float* src = ctx.inputs[0].channel(0);
    AudioBus& out = ctx.outputs[0];
    for (size_t side = 0; side < 2; ++side) {
        float* dst = out.channel(side);
        for (size_t i = 0; i < ctx.numFrames; ++i) dst[i] = src ? src[i] : 0.0f;
    }
}

} // namespace Patchwork::Engine
