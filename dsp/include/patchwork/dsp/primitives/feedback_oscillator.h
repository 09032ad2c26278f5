// ==============================================================================
// Layer 1: DSP Kernel - Feedback Oscillator
// ==============================================================================
// Self-modulating sine oscillator. The previous output sample, scaled by the
// feedback amount, is added to the phase:
//
//   fb  = feedback * last;  if (feedback < 0) fb = fb * fb
//   s   = sin(2 pi phase + fb)
//   out = last = (s + last) / 2
//
// Positive feedback gives saw-like spectra, negative feedback square-like
// ones; large magnitudes turn chaotic, which is expected.
//
// Phase: phase = frac(tau * f + correction), with tau a local clock in
// seconds. Whenever f changes, correction += tau * (fPrev - f) (mod 1), which
// keeps the phase continuous. Once tau reaches kPhaseRebaseSeconds both are folded:
// correction = frac(tau * f + correction), tau = 0. Both stay bounded over
// arbitrarily long runs and the phase is continuous across the rebase.
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

inline constexpr float kFeedbackOscDefaultFrequency = 440.0f;
inline constexpr float kMaxOscFeedback = 4.0f;
inline constexpr float kFeedbackSlewPerMs = 0.1f;
inline constexpr double kPhaseRebaseSeconds = 1.0;

class FeedbackOscillator {
public:
    static constexpr std::array<ParameterDescriptor, 2> parameterDescriptors(float sampleRate) noexcept {
        return {{
            {"frequency", 0.0f, sampleRate * 0.5f, kFeedbackOscDefaultFrequency, AutomationRate::ARate},
            {"feedback", -kMaxOscFeedback, kMaxOscFeedback, 0.0f, AutomationRate::ARate},
        }};
    }

    // =========================================================================
    // Lifecycle
    // =========================================================================

    void prepare(double sampleRate) noexcept {
        if (sampleRate <= 0.0) return;
        sampleRate_ = sampleRate;
        smoothing_.prepare(static_cast<float>(sampleRate));
        reset();
    }

    void reset() noexcept {
        time_ = 0.0;
        correction_ = 0.0;
        previousFrequency_ = kFeedbackOscDefaultFrequency;
        last_ = 0.0f;
        primed_ = false;
        smoothing_.reset();
    }

    // =========================================================================
    // Processing
    // =========================================================================

    /// Generate one sample.
    /// @param frequency Frequency in Hz, clamped to [0, fs/2]
    /// @param feedback Feedback target, clamped to [-4, 4] and slewed
    [[nodiscard]] float process(float frequency, float feedback) noexcept {
        const double f = std::clamp(static_cast<double>(detail::sanitize(frequency)), 0.0, sampleRate_ * 0.5);
        if (!primed_) {
            previousFrequency_ = f;
            primed_ = true;
        }
        if (f != previousFrequency_) {
            correction_ = wrap(correction_ + time_ * (previousFrequency_ - f));
            previousFrequency_ = f;
        }

        const double phase = wrap(time_ * f + correction_);

        const float fbAmount = smoothing_.slew(
            "feedback", std::clamp(detail::sanitize(feedback), -kMaxOscFeedback, kMaxOscFeedback),
            kFeedbackSlewPerMs);
        float fb = fbAmount * last_;
        if (fbAmount < 0.0f) fb *= fb;

        const float s = static_cast<float>(std::sin(kTwoPiD * phase + static_cast<double>(fb)));
        last_ = detail::flushDenormal(0.5f * (s + last_));

        time_ += 1.0 / sampleRate_;
        if (time_ >= kPhaseRebaseSeconds) {
            correction_ = wrap(time_ * f + correction_);
            time_ = 0.0;
        }
        return last_;
    }

    void processBlock(float* out, size_t numSamples, std::span<const float> frequency,
                      std::span<const float> feedback) noexcept {
        for (size_t i = 0; i < numSamples; ++i) {
            out[i] = process(sampleParam(frequency, i), sampleParam(feedback, i));
        }
    }

    // =========================================================================
    // Query
    // =========================================================================

    /// Current phase in cycles [0, 1)
    [[nodiscard]] double phase() const noexcept { return wrap(time_ * previousFrequency_ + correction_); }
    [[nodiscard]] double localTime() const noexcept { return time_; }
    [[nodiscard]] double phaseCorrection() const noexcept { return correction_; }

private:
    [[nodiscard]] static double wrap(double x) noexcept { return x - std::floor(x); }

    double sampleRate_ = 44100.0;
    double time_ = 0.0;
    double correction_ = 0.0;
    double previousFrequency_ = kFeedbackOscDefaultFrequency;
    float last_ = 0.0f;
    bool primed_ = false;
    ParameterSmoothing<1> smoothing_;
};

} // namespace DSP
} // namespace Patchwork
