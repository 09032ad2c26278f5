// ==============================================================================
// Layer 1: DSP Primitive - One-Pole Low-Pass
// ==============================================================================
// 6 dB/oct low-pass: y[n] = y[n-1] + a * (x[n] - y[n-1]),
// a = 1 - exp(-2*pi*fc/fs). Used for high-frequency damping inside feedback
// loops, where its unconditional stability matters more than slope.
// ==============================================================================

#pragma once

#include <algorithm>
#include <cmath>

#include <patchwork/dsp/core/db_utils.h>
#include <patchwork/dsp/core/math_constants.h>

namespace Patchwork {
namespace DSP {

inline constexpr float kOnePoleMinCutoffHz = 1.0f;

class OnePoleLP {
public:
    OnePoleLP() noexcept = default;

    void prepare(double sampleRate) noexcept {
        if (sampleRate <= 0.0) return;
        sampleRate_ = static_cast<float>(sampleRate);
        updateCoefficient();
        reset();
    }

    /// Cutoff is clamped to [1 Hz, 0.495 * fs].
    void setCutoff(float hz) noexcept {
        if (detail::isNaN(hz)) return;
        cutoff_ = std::clamp(hz, kOnePoleMinCutoffHz, sampleRate_ * 0.495f);
        updateCoefficient();
    }

    [[nodiscard]] float process(float input) noexcept {
        if (!detail::isFinite(input)) {
            reset();
            return 0.0f;
        }
        state_ = detail::flushDenormal(state_ + coeff_ * (input - state_));
        return state_;
    }

    void processBlock(float* buffer, size_t numSamples) noexcept {
        for (size_t i = 0; i < numSamples; ++i) buffer[i] = process(buffer[i]);
    }

    void reset() noexcept { state_ = 0.0f; }

    [[nodiscard]] float cutoff() const noexcept { return cutoff_; }
    [[nodiscard]] float coefficient() const noexcept { return coeff_; }

private:
    void updateCoefficient() noexcept {
        coeff_ = 1.0f - std::exp(-kTwoPi * cutoff_ / sampleRate_);
    }

    float sampleRate_ = 44100.0f;
    float cutoff_ = 1000.0f;
    float coeff_ = 0.0f;
    float state_ = 0.0f;
};

} // namespace DSP
} // namespace Patchwork
