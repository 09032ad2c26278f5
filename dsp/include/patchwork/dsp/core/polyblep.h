// ==============================================================================
// Layer 0: Core Utility - PolyBLEP Correction
// ==============================================================================
// 2-point polynomial band-limited step. The return value is subtracted from a
// naive waveform at a rising wrap (sawtooth) and added or subtracted at the
// edges of a square or pulse.
//
// Precondition: 0 < dt < 0.5. Outside [0, dt) and (1 - dt, 1) the correction
// is 0.
// ==============================================================================

#pragma once

namespace Patchwork {
namespace DSP {

/// @param t Phase position in cycles [0, 1)
/// @param dt Phase increment per sample (frequency / sampleRate)
[[nodiscard]] constexpr float polyBlep(float t, float dt) noexcept {
    if (dt <= 0.0f) return 0.0f;
    if (t < dt) {
        const float x = t / dt;
        return -(x - 1.0f) * (x - 1.0f);
    }
    if (t > 1.0f - dt) {
        const float x = (t - 1.0f) / dt;
        return (x + 1.0f) * (x + 1.0f);
    }
    return 0.0f;
}

} // namespace DSP
} // namespace Patchwork
