#pragma once

// ==============================================================================
// BuiltinPrimitiveProvider - Primitives Implemented on the Patchwork DSP Layer
// ==============================================================================
// Default PrimitiveProvider of an AudioGraph.
//
// | Type        | Inlets | Outlets      | Parameters                 |
// |-------------|--------|--------------|----------------------------|
// | Gain        | 1      | 1            | gain (a-rate)              |
// | Delay       | 1      | 1            | delayTime (a-rate)         |
// | Biquad      | 1      | 1            | frequency, Q (k-rate)      |
// | OnePole     | 1      | 1            | frequency (k-rate)         |
// | Saturator   | 1      | 1            | drive (k-rate)             |
// | Constant    | 0      | 1 (mono)     | offset (a-rate)            |
// | Oscillator  | 0      | 1 (mono)     | frequency (a-rate)         |
//
// Oscillator renders PrimitiveOptions::waveform (sine, sawtooth, square,
// triangle, pulse); a pulse also gets a width parameter. It is silent until
// start() and after stop(). Convolution and
// BufferPlayback need sample data this provider has no source for; create()
// returns nullptr for them.
// ==============================================================================

#include "providers/primitive_provider.h"

namespace Patchwork::Engine {

inline constexpr float kMaxPrimitiveGain = 16.0f;
inline constexpr float kMaxConstantOffset = 1.0e5f;
inline constexpr float kMaxPrimitiveDelaySeconds = 10.0f;

class BuiltinPrimitiveProvider final : public PrimitiveProvider {
public:
    [[nodiscard]] std::unique_ptr<NodeProcessor> create(PrimitiveType type,
                                                        const PrimitiveOptions& options) override;

    [[nodiscard]] NodeLayout layout(PrimitiveType type) const override;
};

} // namespace Patchwork::Engine
