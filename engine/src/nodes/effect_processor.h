#pragma once

// ==============================================================================
// Effect Composition - Dry/Wet Wrapper Around a Wet Processor
// ==============================================================================
// An Effect node runs a wet processor and a Crossfade kernel:
//
//   inlet --+-------------------------> crossfade A (dry)
//           +--> wet processor -------> crossfade B (wet)  --> outlet
//
// Parameters: "mix" (a-rate, [0, 1], default 0) followed by the wet
// processor's own parameters. Both paths run every block whatever the mix;
// mix only blends, so feedback and modulation state inside the wet path
// never stalls.
// ==============================================================================

#include "core/engine_config.h"
#include "graph/node_processor.h"

#include <patchwork/dsp/effects/distortion.h>
#include <patchwork/dsp/effects/fdn_reverb.h>
#include <patchwork/dsp/primitives/crossfade.h>

#include <array>
#include <cstdint>
#include <memory>
#include <vector>

namespace Patchwork::Engine {

class EffectProcessor final : public NodeProcessor {
public:
    EffectProcessor(std::unique_ptr<NodeProcessor> wet, size_t channels,
                    DSP::CrossfadeCurve curve = DSP::CrossfadeCurve::Linear);

    void prepare(double sampleRate, size_t maxBlockSize) override;
    void reset() noexcept override;
    void process(ProcessContext& ctx) noexcept override;
    [[nodiscard]] std::vector<ParameterDescriptor> parameterDescriptors(double sampleRate) const override;

    [[nodiscard]] NodeProcessor& wet() const noexcept { return *wet_; }

private:
    std::unique_ptr<NodeProcessor> wet_;
    size_t channels_;
    DSP::Crossfade crossfade_;
    std::vector<AudioBus> wetOutputs_;
};

// =============================================================================
// Wet Processors
// =============================================================================

/// Stereo FDN reverb. Parameters: decay, theta, iota, damping (k-rate).
/// A mono input feeds both reverb inputs; a mono output averages L and R.
class ReverbProcessor final : public NodeProcessor {
public:
    explicit ReverbProcessor(uint32_t seed = DSP::fdn_detail::kDefaultSeed) noexcept : seed_(seed) {}

    void prepare(double sampleRate, size_t maxBlockSize) override;
    void reset() noexcept override { reverb_.reset(); }
    void process(ProcessContext& ctx) noexcept override;
    [[nodiscard]] std::vector<ParameterDescriptor> parameterDescriptors(double sampleRate) const override;

    [[nodiscard]] const DSP::FDNReverb& reverb() const noexcept { return reverb_; }

private:
    uint32_t seed_;
    DSP::FDNReverb reverb_;
    std::vector<float> left_;
    std::vector<float> right_;
};

/// Per-channel tanh waveshaper. Parameter: drive (k-rate).
class DistortionProcessor final : public NodeProcessor {
public:
    void prepare(double sampleRate, size_t maxBlockSize) override;
    void reset() noexcept override;
    void process(ProcessContext& ctx) noexcept override;
    [[nodiscard]] std::vector<ParameterDescriptor> parameterDescriptors(double sampleRate) const override;

private:
    std::array<DSP::Distortion, kMaxChannels> channels_;
};

} // namespace Patchwork::Engine
