// ==============================================================================
// Layer 1: DSP Primitive - Band-Limited Oscillator
// ==============================================================================
// Phase-accumulating oscillator with selectable waveform:
//
//   Sine      sin(2 pi t)
//   Sawtooth  2t - 1, PolyBLEP at the wrap
//   Square    +1 on [0, 0.5), -1 on [0.5, 1), PolyBLEP at both edges
//   Triangle  1 - 4 |frac(t + 0.25) - 0.5|, starts at 0 rising
//   Pulse     +1 on [0, duty), -1 on [duty, 1), PolyBLEP at both edges
//
// The pulse is driven by a width w in [-1, 1] rather than a duty cycle. The
// width is the threshold of a sign waveshaper over a sine (high where
// sin > -w), so duty = 0.5 + asin(w) / pi, clamped to [0.01, 0.99].
// w = 0 is a square wave.
//
// Frequency is clamped to [0, fs/2). The phase runs in double precision.
// ==============================================================================

#pragma once

#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

#include <patchwork/dsp/core/db_utils.h>
#include <patchwork/dsp/core/math_constants.h>
#include <patchwork/dsp/core/parameter_descriptor.h>
#include <patchwork/dsp/core/polyblep.h>
#include <patchwork/dsp/primitives/smoother.h>

namespace Patchwork {
namespace DSP {

inline constexpr float kOscDefaultFrequency = 440.0f;
inline constexpr float kMinPulseDuty = 0.01f;
inline constexpr float kMaxPulseDuty = 0.99f;

enum class OscWaveform : uint8_t {
    Sine = 0,
    Sawtooth,
    Square,
    Triangle,
    Pulse
};

/// Accepts "sine", "sawtooth" / "saw", "square", "triangle", "pulse".
[[nodiscard]] constexpr std::optional<OscWaveform> parseOscWaveform(std::string_view name) noexcept {
    if (name == "sine") return OscWaveform::Sine;
    if (name == "sawtooth" || name == "saw") return OscWaveform::Sawtooth;
    if (name == "square") return OscWaveform::Square;
    if (name == "triangle") return OscWaveform::Triangle;
    if (name == "pulse") return OscWaveform::Pulse;
    return std::nullopt;
}

[[nodiscard]] constexpr std::string_view oscWaveformName(OscWaveform waveform) noexcept {
    switch (waveform) {
        case OscWaveform::Sine:     return "sine";
        case OscWaveform::Sawtooth: return "sawtooth";
        case OscWaveform::Square:   return "square";
        case OscWaveform::Triangle: return "triangle";
        case OscWaveform::Pulse:    return "pulse";
    }
    return "sine";
}

/// Duty cycle of a pulse of width @p width. NaN reads as 0.
[[nodiscard]] inline float pulseDutyFromWidth(float width) noexcept {
    const float w = std::clamp(detail::sanitize(width), -1.0f, 1.0f);
    return std::clamp(0.5f + std::asin(w) / kPi, kMinPulseDuty, kMaxPulseDuty);
}

class PolyBlepOscillator {
public:
    static constexpr std::array<ParameterDescriptor, 2> parameterDescriptors(float sampleRate) noexcept {
        return {{
            {"frequency", 0.0f, sampleRate * 0.5f, kOscDefaultFrequency, AutomationRate::ARate},
            {"width", -1.0f, 1.0f, 0.0f, AutomationRate::ARate},
        }};
    }

    PolyBlepOscillator() noexcept = default;
    explicit PolyBlepOscillator(OscWaveform waveform) noexcept : waveform_(waveform) {}

    void prepare(double sampleRate) noexcept {
        if (sampleRate <= 0.0) return;
        sampleRate_ = sampleRate;
        reset();
    }

    void reset() noexcept { phase_ = 0.0; }

    void setWaveform(OscWaveform waveform) noexcept { waveform_ = waveform; }
    [[nodiscard]] OscWaveform waveform() const noexcept { return waveform_; }

    /// Generate one sample and advance the phase.
    /// @param frequency Hz, clamped to [0, fs/2)
    /// @param width Pulse width in [-1, 1]; read by OscWaveform::Pulse only
    [[nodiscard]] float process(float frequency, float width = 0.0f) noexcept {
        const double nyquist = sampleRate_ * 0.5;
        const double f = std::clamp(static_cast<double>(detail::sanitize(frequency)), 0.0, nyquist);
        // dt must stay below 0.5 for the PolyBLEP window
        const float dt = static_cast<float>(std::min(f / sampleRate_, 0.4999));
        const float t = static_cast<float>(phase_);

        float out = 0.0f;
        switch (waveform_) {
            case OscWaveform::Sine:
                out = static_cast<float>(std::sin(kTwoPiD * phase_));
                break;
            case OscWaveform::Sawtooth:
                out = 2.0f * t - 1.0f - polyBlep(t, dt);
                break;
            case OscWaveform::Square:
                out = pulse(t, dt, 0.5f);
                break;
            case OscWaveform::Triangle: {
                double u = phase_ + 0.25;
                u -= std::floor(u);
                out = static_cast<float>(1.0 - 4.0 * std::fabs(u - 0.5));
                break;
            }
            case OscWaveform::Pulse:
                out = pulse(t, dt, pulseDutyFromWidth(width));
                break;
        }

        phase_ += f / sampleRate_;
        phase_ -= std::floor(phase_);
        return out;
    }

    void processBlock(float* out, size_t numSamples, std::span<const float> frequency,
                      std::span<const float> width = {}) noexcept {
        for (size_t i = 0; i < numSamples; ++i) {
            out[i] = process(sampleParam(frequency, i), sampleParam(width, i));
        }
    }

    /// Current phase in cycles [0, 1)
    [[nodiscard]] double phase() const noexcept { return phase_; }

private:
    [[nodiscard]] static float pulse(float t, float dt, float duty) noexcept {
        float fall = t - duty;
        if (fall < 0.0f) fall += 1.0f;
        const float naive = t < duty ? 1.0f : -1.0f;
        return naive + polyBlep(t, dt) - polyBlep(fall, dt);
    }

    OscWaveform waveform_ = OscWaveform::Sine;
    double sampleRate_ = 44100.0;
    double phase_ = 0.0;
};

} // namespace DSP
} // namespace Patchwork
