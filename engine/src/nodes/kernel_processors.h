#pragma once

// ==============================================================================
// Kernel Processors - NodeProcessor Adapters for the DSP Kernels
// ==============================================================================
// Each adapter owns one Patchwork::DSP kernel, declares the kernel's parameter
// descriptors and maps the node's buses onto the kernel's block call.
//
// | Kernel               | Module                 | Inlets     | Outlets        |
// |----------------------|------------------------|------------|----------------|
// | SignalMath           | signal-math            | A, B       | 1              |
// | Crossfade            | crossfade              | A, B       | 1              |
// | RotationMixer2       | mix-2                  | 2 (mono)   | 2 (mono)       |
// | RotationMixer4       | mix-4                  | 4 (mono)   | 4 (mono)       |
// | StateVariableFilter  | state-variable-filter  | 1          | lp, hp, bp     |
// | FeedbackOscillator   | feedback-oscillator    | none       | 1 (mono)       |
// | EnvelopeGenerator    | envelope-generator     | none       | 1 (mono)       |
//
// Unmarked ports carry the graph channel count.
// ==============================================================================

#include "graph/node.h"
#include "graph/node_processor.h"

#include <patchwork/dsp/primitives/crossfade.h>
#include <patchwork/dsp/primitives/envelope_generator.h>
#include <patchwork/dsp/primitives/feedback_oscillator.h>
#include <patchwork/dsp/primitives/rotation_mixer.h>
#include <patchwork/dsp/primitives/signal_math.h>
#include <patchwork/dsp/primitives/state_variable_filter.h>

#include <array>
#include <string_view>

namespace Patchwork::Engine {

// Module names.
inline constexpr std::string_view kSignalMathModule = "signal-math";
inline constexpr std::string_view kCrossfadeModule = "crossfade";
inline constexpr std::string_view kMix2Module = "mix-2";
inline constexpr std::string_view kMix4Module = "mix-4";
inline constexpr std::string_view kStateVariableFilterModule = "state-variable-filter";
inline constexpr std::string_view kFeedbackOscillatorModule = "feedback-oscillator";
inline constexpr std::string_view kEnvelopeGeneratorModule = "envelope-generator";

inline constexpr std::array<std::string_view, 7> kBuiltinModules = {
    kSignalMathModule, kCrossfadeModule, kMix2Module, kMix4Module,
    kStateVariableFilterModule, kFeedbackOscillatorModule, kEnvelopeGeneratorModule,
};

// SVF outlet indices.
inline constexpr size_t kSVFLowpassOutlet = 0;
inline constexpr size_t kSVFHighpassOutlet = 1;
inline constexpr size_t kSVFBandpassOutlet = 2;

/// Port layout of a kernel, source or stereo routing node.
[[nodiscard]] NodeLayout kernelLayout(NodeKind kind) noexcept;

// =============================================================================
// Adapters
// =============================================================================

class SignalMathProcessor final : public NodeProcessor {
public:
    explicit SignalMathProcessor(DSP::SignalOp op) noexcept : kernel_(op) {}

    void prepare(double sampleRate, size_t maxBlockSize) override;
    void reset() noexcept override {}
    void process(ProcessContext& ctx) noexcept override;

    [[nodiscard]] DSP::SignalOp operation() const noexcept { return kernel_.operation(); }

private:
    DSP::SignalMath kernel_;
};

class CrossfadeProcessor final : public NodeProcessor {
public:
    explicit CrossfadeProcessor(DSP::CrossfadeCurve curve) noexcept : kernel_(curve) {}

    void prepare(double sampleRate, size_t maxBlockSize) override;
    void reset() noexcept override {}
    void process(ProcessContext& ctx) noexcept override;
    [[nodiscard]] std::vector<ParameterDescriptor> parameterDescriptors(double sampleRate) const override;

private:
    DSP::Crossfade kernel_;
};

class Mix2Processor final : public NodeProcessor {
public:
    void prepare(double sampleRate, size_t maxBlockSize) override;
    void reset() noexcept override { kernel_.reset(); }
    void process(ProcessContext& ctx) noexcept override;
    [[nodiscard]] std::vector<ParameterDescriptor> parameterDescriptors(double sampleRate) const override;

private:
    DSP::RotationMixer2 kernel_;
};

class Mix4Processor final : public NodeProcessor {
public:
    void prepare(double sampleRate, size_t maxBlockSize) override;
    void reset() noexcept override { kernel_.reset(); }
    void process(ProcessContext& ctx) noexcept override;
    [[nodiscard]] std::vector<ParameterDescriptor> parameterDescriptors(double sampleRate) const override;

private:
    DSP::RotationMixer4 kernel_;
};

class StateVariableFilterProcessor final : public NodeProcessor {
public:
    void prepare(double sampleRate, size_t maxBlockSize) override;
    void reset() noexcept override { kernel_.reset(); }
    void process(ProcessContext& ctx) noexcept override;
    [[nodiscard]] std::vector<ParameterDescriptor> parameterDescriptors(double sampleRate) const override;

private:
    DSP::StateVariableFilter kernel_;
};

class FeedbackOscillatorProcessor final : public NodeProcessor {
public:
    void prepare(double sampleRate, size_t maxBlockSize) override;
    void reset() noexcept override { kernel_.reset(); }
    void process(ProcessContext& ctx) noexcept override;
    [[nodiscard]] std::vector<ParameterDescriptor> parameterDescriptors(double sampleRate) const override;

private:
    DSP::FeedbackOscillator kernel_;
};

class EnvelopeGeneratorProcessor final : public NodeProcessor {
public:
    explicit EnvelopeGeneratorProcessor(DSP::EnvelopeType type) noexcept : kernel_(type) {}

    void prepare(double sampleRate, size_t maxBlockSize) override;
    void reset() noexcept override { kernel_.reset(); }
    void process(ProcessContext& ctx) noexcept override;
    [[nodiscard]] std::vector<ParameterDescriptor> parameterDescriptors(double sampleRate) const override;

    [[nodiscard]] const DSP::EnvelopeGenerator& kernel() const noexcept { return kernel_; }

private:
    DSP::EnvelopeGenerator kernel_;
};

} // namespace Patchwork::Engine
