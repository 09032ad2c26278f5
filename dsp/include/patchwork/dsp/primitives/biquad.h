// ==============================================================================
// Layer 1: DSP Primitive - Biquad Filter
// ==============================================================================
// Transposed Direct Form II biquad with RBJ cookbook coefficients.
//
// References:
// - Robert Bristow-Johnson, "Audio EQ Cookbook"
// ==============================================================================

#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>

#include <patchwork/dsp/core/db_utils.h>
#include <patchwork/dsp/core/math_constants.h>

namespace Patchwork {
namespace DSP {

inline constexpr float kMinFilterFrequency = 1.0f;
inline constexpr float kMinQ = 0.1f;
inline constexpr float kMaxQ = 30.0f;
inline constexpr float kButterworthQ = 0.7071067811865476f;

/// @brief Supported filter response types.
enum class FilterType : uint8_t {
    Lowpass,   ///< 12 dB/oct lowpass, -3dB at cutoff
    Highpass,  ///< 12 dB/oct highpass, -3dB at cutoff
    Bandpass,  ///< Constant 0 dB peak gain
    Notch      ///< Band-reject filter
};

/// @brief Normalized biquad filter coefficients (a0 = 1 implied).
struct BiquadCoefficients {
    float b0 = 1.0f;
    float b1 = 0.0f;
    float b2 = 0.0f;
    float a1 = 0.0f;
    float a2 = 0.0f;

    /// Calculate coefficients; frequency and Q are clamped to a stable range.
    [[nodiscard]] static BiquadCoefficients calculate(
        FilterType type, float frequency, float Q, float sampleRate) noexcept {
        if (sampleRate <= 0.0f) return {};
        if (detail::isNaN(frequency)) frequency = 1000.0f;
        if (detail::isNaN(Q)) Q = kButterworthQ;

        frequency = std::clamp(frequency, kMinFilterFrequency, sampleRate * 0.495f);
        Q = std::clamp(Q, kMinQ, kMaxQ);

        const float w0 = kTwoPi * frequency / sampleRate;
        const float cosw0 = std::cos(w0);
        const float alpha = std::sin(w0) / (2.0f * Q);

        float b0 = 1.0f, b1 = 0.0f, b2 = 0.0f;
        const float a0 = 1.0f + alpha;
        const float a1 = -2.0f * cosw0;
        const float a2 = 1.0f - alpha;

        switch (type) {
            case FilterType::Lowpass:
                b0 = (1.0f - cosw0) / 2.0f;
                b1 = 1.0f - cosw0;
                b2 = b0;
                break;
            case FilterType::Highpass:
                b0 = (1.0f + cosw0) / 2.0f;
                b1 = -(1.0f + cosw0);
                b2 = b0;
                break;
            case FilterType::Bandpass:
                b0 = alpha;
                b1 = 0.0f;
                b2 = -alpha;
                break;
            case FilterType::Notch:
                b0 = 1.0f;
                b1 = -2.0f * cosw0;
                b2 = 1.0f;
                break;
        }

        return {b0 / a0, b1 / a0, b2 / a0, a1 / a0, a2 / a0};
    }
};

/// @brief Transposed Direct Form II biquad filter.
/// @code
/// y[n] = b0*x[n] + z1[n-1]
/// z1[n] = b1*x[n] - a1*y[n] + z2[n-1]
/// z2[n] = b2*x[n] - a2*y[n]
/// @endcode
class Biquad {
public:
    Biquad() noexcept = default;

    void configure(FilterType type, float frequency, float Q, float sampleRate) noexcept {
        coeffs_ = BiquadCoefficients::calculate(type, frequency, Q, sampleRate);
    }

    void setCoefficients(const BiquadCoefficients& coeffs) noexcept { coeffs_ = coeffs; }

    [[nodiscard]] const BiquadCoefficients& coefficients() const noexcept { return coeffs_; }

    [[nodiscard]] float process(float input) noexcept {
        if (!detail::isFinite(input)) {
            reset();
            return 0.0f;
        }
        const float output = coeffs_.b0 * input + z1_;
        z1_ = detail::flushDenormal(coeffs_.b1 * input - coeffs_.a1 * output + z2_);
        z2_ = detail::flushDenormal(coeffs_.b2 * input - coeffs_.a2 * output);
        return output;
    }

    void processBlock(float* buffer, size_t numSamples) noexcept {
        for (size_t i = 0; i < numSamples; ++i) buffer[i] = process(buffer[i]);
    }

    void reset() noexcept {
        z1_ = 0.0f;
        z2_ = 0.0f;
    }

private:
    BiquadCoefficients coeffs_;
    float z1_ = 0.0f;
    float z2_ = 0.0f;
};

} // namespace DSP
} // namespace Patchwork
