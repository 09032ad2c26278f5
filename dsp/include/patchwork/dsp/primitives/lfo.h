// ==============================================================================
// Layer 1: DSP Primitive - Sine LFO
// ==============================================================================
// Low-frequency sine source with a double-precision phase accumulator.
// Output range [-1, 1].
// ==============================================================================

#pragma once

#include <algorithm>
#include <cmath>

#include <patchwork/dsp/core/db_utils.h>
#include <patchwork/dsp/core/math_constants.h>

namespace Patchwork {
namespace DSP {

inline constexpr float kMaxLFOFrequency = 20.0f;

class LFO {
public:
    LFO() noexcept = default;

    void prepare(double sampleRate) noexcept {
        if (sampleRate <= 0.0) return;
        sampleRate_ = sampleRate;
        updateIncrement();
        reset();
    }

    void reset() noexcept { phase_ = initialPhase_; }

    void setFrequency(float hz) noexcept {
        if (detail::isNaN(hz)) return;
        frequency_ = std::clamp(hz, 0.0f, kMaxLFOFrequency);
        updateIncrement();
    }

    /// Starting phase in cycles [0, 1), applied on reset().
    void setPhaseOffset(float cycles) noexcept {
        if (detail::isNaN(cycles)) return;
        initialPhase_ = static_cast<double>(cycles - std::floor(cycles));
    }

    [[nodiscard]] float process() noexcept {
        const float out = static_cast<float>(std::sin(kTwoPiD * phase_));
        phase_ += increment_;
        if (phase_ >= 1.0) phase_ -= 1.0;
        return out;
    }

    [[nodiscard]] float frequency() const noexcept { return frequency_; }
    [[nodiscard]] double sampleRate() const noexcept { return sampleRate_; }

private:
    void updateIncrement() noexcept {
        increment_ = static_cast<double>(frequency_) / sampleRate_;
    }

    double sampleRate_ = 44100.0;
    double phase_ = 0.0;
    double initialPhase_ = 0.0;
    double increment_ = 0.0;
    float frequency_ = 0.0f;
};

} // namespace DSP
} // namespace Patchwork
