// ==============================================================================
// Layer 1: DSP Kernel - Zero-Delay-Feedback State Variable Filter
// ==============================================================================
// Trapezoidal SVF producing low-pass, high-pass and band-pass simultaneously.
// The instantaneous feedback is solved algebraically each sample, so cutoff
// and resonance can be modulated at audio rate without the warping or
// blow-ups of a naive difference-equation SVF.
//
// Per sample:
//   g  = tan(pi f / fs) / (1 + tan(pi f / fs))
//   r  = 1 / (2 max(Q, eps))
//   a  = 1 / (g^2 + 2 r g + 1)
//   hp = a (x - (g + 2r) s1 - s2)
//   bp = hp g + s1
//   lp = bp g + s2
//   s1 = hp g + bp,  s2 = bp g + lp
//
// Frequency and Q are slewed once per sample and shared by every channel;
// s1/s2 are kept per channel.
// ==============================================================================

#pragma once

#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>
#include <span>

#include <patchwork/dsp/core/db_utils.h>
#include <patchwork/dsp/core/math_constants.h>
#include <patchwork/dsp/core/parameter_descriptor.h>
#include <patchwork/dsp/primitives/smoother.h>

namespace Patchwork {
namespace DSP {

// =============================================================================
// Constants
// =============================================================================

inline constexpr size_t kMaxSVFChannels = 8;
inline constexpr float kSVFMinQ = 1e-5f;
inline constexpr float kSVFMaxQ = kTwoPi;
inline constexpr float kSVFDefaultFrequency = 1000.0f;
inline constexpr float kSVFDefaultQ = kQuarterPi;
inline constexpr float kSVFFrequencySlewPerMs = 30.0f;
inline constexpr float kSVFQSlewPerMs = 0.5f;

/// Outputs of one SVF step.
struct SVFOutputs {
    float lowpass = 0.0f;
    float highpass = 0.0f;
    float bandpass = 0.0f;
};

/// Per-sample coefficients derived from the smoothed frequency and Q.
struct SVFCoefficients {
    float g = 0.0f;
    float r = 0.5f;
    float a = 1.0f;

    [[nodiscard]] static SVFCoefficients calculate(float frequency, float q, float sampleRate) noexcept {
        SVFCoefficients c;
        const float maxFrequency = sampleRate * 0.25f;
        frequency = std::clamp(std::fabs(detail::sanitize(frequency)), 0.0f, maxFrequency);
        q = std::clamp(detail::sanitize(q, kSVFDefaultQ), kSVFMinQ, kSVFMaxQ);

        const float t = std::tan(kPi * frequency / sampleRate);
        c.g = t / (1.0f + t);
        c.r = 1.0f / (2.0f * std::max(q, kSVFMinQ));
        c.a = 1.0f / (c.g * c.g + 2.0f * c.r * c.g + 1.0f);
        return c;
    }
};

class StateVariableFilter {
public:
    // =========================================================================
    // Parameter Surface
    // =========================================================================

    static constexpr std::array<ParameterDescriptor, 2> parameterDescriptors(float sampleRate) noexcept {
        return {{
            {"frequency", 0.0f, sampleRate * 0.25f, kSVFDefaultFrequency, AutomationRate::ARate},
            {"Q", kSVFMinQ, kSVFMaxQ, kSVFDefaultQ, AutomationRate::ARate},
        }};
    }

    // =========================================================================
    // Lifecycle
    // =========================================================================

    void prepare(double sampleRate) noexcept {
        if (sampleRate <= 0.0) return;
        sampleRate_ = static_cast<float>(sampleRate);
        smoothing_.prepare(sampleRate_);
        reset();
    }

    void reset() noexcept {
        s1_.fill(0.0f);
        s2_.fill(0.0f);
        smoothing_.reset();
    }

    // =========================================================================
    // Processing
    // =========================================================================

    /// Slew the parameters one step and return the coefficients for this sample.
    [[nodiscard]] SVFCoefficients advanceParameters(float frequency, float q) noexcept {
        const float f = smoothing_.slew("frequency", frequency, kSVFFrequencySlewPerMs);
        const float res = smoothing_.slew("Q", q, kSVFQSlewPerMs);
        return SVFCoefficients::calculate(f, res, sampleRate_);
    }

    /// Filter one sample on one channel with precomputed coefficients.
    [[nodiscard]] SVFOutputs tick(float x, const SVFCoefficients& c, size_t channel) noexcept {
        if (channel >= kMaxSVFChannels) return {};
        if (!detail::isFinite(x)) x = 0.0f;

        float& s1 = s1_[channel];
        float& s2 = s2_[channel];

        SVFOutputs out;
        out.highpass = c.a * (x - (c.g + 2.0f * c.r) * s1 - s2);
        out.bandpass = out.highpass * c.g + s1;
        out.lowpass = out.bandpass * c.g + s2;

        s1 = detail::flushDenormal(out.highpass * c.g + out.bandpass);
        s2 = detail::flushDenormal(out.bandpass * c.g + out.lowpass);

        if (!detail::isFinite(s1) || !detail::isFinite(s2)) {
            s1 = 0.0f;
            s2 = 0.0f;
            return {};
        }
        return out;
    }

    /// Process a block on up to kMaxSVFChannels channels.
    /// Output arrays may be nullptr when that response is unused.
    void processBlock(const float* const* inputs, float* const* lowpass, float* const* highpass,
                      float* const* bandpass, size_t numChannels, size_t numSamples,
                      std::span<const float> frequency, std::span<const float> q) noexcept {
        numChannels = std::min(numChannels, kMaxSVFChannels);
        for (size_t s = 0; s < numSamples; ++s) {
            const SVFCoefficients c = advanceParameters(sampleParam(frequency, s), sampleParam(q, s));
            for (size_t ch = 0; ch < numChannels; ++ch) {
                const float x = (inputs && inputs[ch]) ? inputs[ch][s] : 0.0f;
                const SVFOutputs y = tick(x, c, ch);
                if (lowpass && lowpass[ch]) lowpass[ch][s] = y.lowpass;
                if (highpass && highpass[ch]) highpass[ch][s] = y.highpass;
                if (bandpass && bandpass[ch]) bandpass[ch][s] = y.bandpass;
            }
        }
    }

    [[nodiscard]] float sampleRate() const noexcept { return sampleRate_; }

private:
    float sampleRate_ = 44100.0f;
    std::array<float, kMaxSVFChannels> s1_{};
    std::array<float, kMaxSVFChannels> s2_{};
    ParameterSmoothing<2> smoothing_;
};

} // namespace DSP
} // namespace Patchwork
