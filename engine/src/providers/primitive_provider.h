#pragma once

// ==============================================================================
// PrimitiveProvider - Host Built-In Processing Nodes
// ==============================================================================
// Abstracts the non-kernel building blocks a host supplies: gains, delays,
// filters, constant sources and oscillators. AudioGraph asks the provider for
// a processor and the port layout to build around it. A provider that cannot
// make a type returns nullptr; the graph then substitutes a silent Disabled
// node.
// ==============================================================================

#include "graph/node.h"
#include "graph/node_processor.h"

#include <patchwork/dsp/primitives/biquad.h>
#include <patchwork/dsp/primitives/polyblep_oscillator.h>

#include <cstdint>
#include <memory>
#include <string_view>

namespace Patchwork::Engine {

enum class PrimitiveType : uint8_t {
    Gain,
    Delay,
    Biquad,
    OnePole,
    Saturator,
    Constant,
    Oscillator,
    Convolution,
    BufferPlayback
};

[[nodiscard]] std::string_view primitiveTypeName(PrimitiveType type) noexcept;

/// Construction-time options. Each primitive reads only the fields it uses.
struct PrimitiveOptions {
    float value = 1.0f;                 ///< Gain, Constant offset, Saturator drive
    float maxDelaySeconds = 1.0f;       ///< Delay
    DSP::FilterType filterType = DSP::FilterType::Lowpass;  ///< Biquad
    float frequency = 440.0f;           ///< Biquad, OnePole cutoff, Oscillator
    DSP::OscWaveform waveform = DSP::OscWaveform::Sine;     ///< Oscillator
    float width = 0.0f;                 ///< Oscillator pulse width
};

class PrimitiveProvider {
public:
    virtual ~PrimitiveProvider() = default;

    /// @return a processor, or nullptr if this provider does not support @p type
    [[nodiscard]] virtual std::unique_ptr<NodeProcessor> create(PrimitiveType type,
                                                                const PrimitiveOptions& options) = 0;

    /// Port layout of @p type.
    [[nodiscard]] virtual NodeLayout layout(PrimitiveType type) const = 0;
};

} // namespace Patchwork::Engine
