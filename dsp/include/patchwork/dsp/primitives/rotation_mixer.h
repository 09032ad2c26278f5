// ==============================================================================
// Layer 1: DSP Kernel - Rotation Mixers
// ==============================================================================
// Energy-conserving mixers built from Givens rotations.
//
// RotationMixer2: [a cos(t) - b sin(t), a sin(t) + b cos(t)]
// RotationMixer4: rotate (0,1) and (2,3) by theta, then the cross pairs
//                 (r0, r2) and (r1, r3) by iota. Outputs are the rotated
//                 (r0, r2) pair followed by the rotated (r1, r3) pair.
//
// Both are orthonormal for every angle, so sum(out^2) == sum(in^2). Inside a
// feedback delay network this leaves loop gain to the explicit decay stage.
//
// Angles are k-rate parameters slewed per sample at kRotationSlewPerMs.
// ==============================================================================

#pragma once

#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>
#include <span>
#include <utility>

#include <patchwork/dsp/core/db_utils.h>
#include <patchwork/dsp/core/math_constants.h>
#include <patchwork/dsp/core/parameter_descriptor.h>
#include <patchwork/dsp/primitives/smoother.h>

namespace Patchwork {
namespace DSP {

/// Angle slew rate in radians per millisecond.
inline constexpr float kRotationSlewPerMs = 0.5f;

/// Rotate the pair (a, b) in place by the angle with the given cos/sin.
inline void rotatePair(float& a, float& b, float cosA, float sinA) noexcept {
    const float a1 = a * cosA - b * sinA;
    const float b1 = a * sinA + b * cosA;
    a = a1;
    b = b1;
}

// =============================================================================
// RotationMixer2
// =============================================================================

class RotationMixer2 {
public:
    static constexpr std::array<ParameterDescriptor, 1> parameterDescriptors() noexcept {
        return {{{"theta", 0.0f, kTwoPi, kQuarterPi, AutomationRate::KRate}}};
    }

    void prepare(double sampleRate) noexcept {
        smoothing_.prepare(static_cast<float>(sampleRate));
    }

    void reset() noexcept { smoothing_.reset(); }

    /// Mix one frame; @p theta is the unsmoothed target angle.
    void process(float& a, float& b, float theta) noexcept {
        const float t = smoothing_.slew("theta", clampAngle(theta), kRotationSlewPerMs);
        rotatePair(a, b, std::cos(t), std::sin(t));
    }

    void processBlock(const float* inA, const float* inB, float* outA, float* outB,
                      std::span<const float> theta, size_t numSamples) noexcept {
        for (size_t i = 0; i < numSamples; ++i) {
            float a = inA ? inA[i] : 0.0f;
            float b = inB ? inB[i] : 0.0f;
            process(a, b, sampleParam(theta, i));
            outA[i] = a;
            outB[i] = b;
        }
    }

    [[nodiscard]] float currentTheta() const noexcept { return smoothing_.current("theta", kQuarterPi); }

private:
    [[nodiscard]] static float clampAngle(float angle) noexcept {
        return std::clamp(detail::sanitize(angle, kQuarterPi), 0.0f, kTwoPi);
    }

    ParameterSmoothing<2> smoothing_;
};

// =============================================================================
// RotationMixer4
// =============================================================================

class RotationMixer4 {
public:
    static constexpr size_t kNumChannels = 4;
    using Frame = std::array<float, kNumChannels>;

    static constexpr std::array<ParameterDescriptor, 2> parameterDescriptors() noexcept {
        return {{
            {"theta", 0.0f, kTwoPi, kQuarterPi, AutomationRate::KRate},
            {"iota", 0.0f, kTwoPi, kQuarterPi, AutomationRate::KRate},
        }};
    }

    void prepare(double sampleRate) noexcept {
        smoothing_.prepare(static_cast<float>(sampleRate));
    }

    void reset() noexcept { smoothing_.reset(); }

    /// Mix one frame in place; angles are unsmoothed targets.
    void process(Frame& x, float theta, float iota) noexcept {
        const float t = smoothing_.slew("theta", clampAngle(theta), kRotationSlewPerMs);
        const float i = smoothing_.slew("iota", clampAngle(iota), kRotationSlewPerMs);

        const float ct = std::cos(t);
        const float st = std::sin(t);
        rotatePair(x[0], x[1], ct, st);
        rotatePair(x[2], x[3], ct, st);

        const float ci = std::cos(i);
        const float si = std::sin(i);
        rotatePair(x[0], x[2], ci, si);
        rotatePair(x[1], x[3], ci, si);

        // Outputs are ordered [rot(r0, r2), rot(r1, r3)]
        std::swap(x[1], x[2]);
    }

    /// @param inputs Four input channels (entries may be nullptr)
    /// @param outputs Four output channels
    void processBlock(const std::array<const float*, kNumChannels>& inputs,
                      const std::array<float*, kNumChannels>& outputs,
                      std::span<const float> theta, std::span<const float> iota,
                      size_t numSamples) noexcept {
        for (size_t s = 0; s < numSamples; ++s) {
            Frame frame{};
            for (size_t c = 0; c < kNumChannels; ++c) {
                frame[c] = inputs[c] ? inputs[c][s] : 0.0f;
            }
            process(frame, sampleParam(theta, s), sampleParam(iota, s));
            for (size_t c = 0; c < kNumChannels; ++c) {
                outputs[c][s] = frame[c];
            }
        }
    }

    [[nodiscard]] float currentTheta() const noexcept { return smoothing_.current("theta", kQuarterPi); }
    [[nodiscard]] float currentIota() const noexcept { return smoothing_.current("iota", kQuarterPi); }

private:
    [[nodiscard]] static float clampAngle(float angle) noexcept {
        return std::clamp(detail::sanitize(angle, kQuarterPi), 0.0f, kTwoPi);
    }

    ParameterSmoothing<2> smoothing_;
};

} // namespace DSP
} // namespace Patchwork
