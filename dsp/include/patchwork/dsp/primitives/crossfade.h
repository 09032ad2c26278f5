// ==============================================================================
// Layer 1: DSP Kernel - Crossfade
// ==============================================================================
// Two-input blend driven by a per-sample position t in [0, 1]:
// - Linear:        a + t (b - a)
// - Smoothstep:    t' = t^2 (3 - 2t), then linear with t'
// - ConstantPower: a cos(t pi/2) + b sin(t pi/2)
//
// t is clamped before the curve is applied; NaN reads as 0.
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
#include <patchwork/dsp/primitives/smoother.h>

namespace Patchwork {
namespace DSP {

enum class CrossfadeCurve : uint8_t {
    Linear = 0,
    Smoothstep,
    ConstantPower
};

/// Accepts "linear", "smoothstep" / "sigmoid", "constant-power" / "sincos".
[[nodiscard]] constexpr std::optional<CrossfadeCurve> parseCrossfadeCurve(std::string_view name) noexcept {
    if (name == "linear") return CrossfadeCurve::Linear;
    if (name == "smoothstep" || name == "sigmoid") return CrossfadeCurve::Smoothstep;
    if (name == "constant-power" || name == "sincos") return CrossfadeCurve::ConstantPower;
    return std::nullopt;
}

/// Blend one sample pair.
[[nodiscard]] inline float crossfade(float a, float b, float t, CrossfadeCurve curve) noexcept {
    t = detail::isNaN(t) ? 0.0f : std::clamp(t, 0.0f, 1.0f);
    switch (curve) {
        case CrossfadeCurve::Linear:
            return a + t * (b - a);
        case CrossfadeCurve::Smoothstep: {
            const float s = t * t * (3.0f - 2.0f * t);
            return a + s * (b - a);
        }
        case CrossfadeCurve::ConstantPower: {
            const float angle = t * kHalfPi;
            return a * std::cos(angle) + b * std::sin(angle);
        }
    }
    return a;
}

class Crossfade {
public:
    static constexpr std::array<ParameterDescriptor, 1> parameterDescriptors() noexcept {
        return {{{"mix", 0.0f, 1.0f, 0.0f, AutomationRate::ARate}}};
    }

    Crossfade() noexcept = default;
    explicit Crossfade(CrossfadeCurve curve) noexcept : curve_(curve) {}

    void setCurve(CrossfadeCurve curve) noexcept { curve_ = curve; }
    [[nodiscard]] CrossfadeCurve curve() const noexcept { return curve_; }

    [[nodiscard]] float process(float a, float b, float mix) const noexcept {
        return crossfade(a, b, mix, curve_);
    }

    /// @param mix Per-sample or single-value mix array
    void processBlock(const float* a, const float* b, float* out,
                      std::span<const float> mix, size_t numSamples) const noexcept {
        for (size_t i = 0; i < numSamples; ++i) {
            out[i] = crossfade(a ? a[i] : 0.0f, b ? b[i] : 0.0f, sampleParam(mix, i), curve_);
        }
    }

private:
    CrossfadeCurve curve_ = CrossfadeCurve::Linear;
};

} // namespace DSP
} // namespace Patchwork
