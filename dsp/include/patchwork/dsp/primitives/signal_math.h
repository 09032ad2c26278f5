// ==============================================================================
// Layer 1: DSP Kernel - Signal Math
// ==============================================================================
// Per-sample arithmetic between two signals A and B. Binary operators combine
// A and B; unary operators (negate, sin, cos, sind, cosd) read A only.
//
// Numeric guards:
// - div returns 0 when |B| < 1e-5
// - non-finite results are replaced with 0
// ==============================================================================

#pragma once

#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

#include <patchwork/dsp/core/db_utils.h>
#include <patchwork/dsp/core/math_constants.h>

namespace Patchwork {
namespace DSP {

inline constexpr float kDivisionEpsilon = 1e-5f;

enum class SignalOp : uint8_t {
    Add = 0,
    Sub,
    Mult,
    Div,
    Min,
    Max,
    Negate,
    Sin,
    Cos,
    SinDegrees,
    CosDegrees
};

namespace signal_math_detail {

struct OpName {
    std::string_view name;
    SignalOp op;
};

inline constexpr std::array<OpName, 11> kOpNames = {{
    {"add", SignalOp::Add},
    {"sub", SignalOp::Sub},
    {"mult", SignalOp::Mult},
    {"div", SignalOp::Div},
    {"min", SignalOp::Min},
    {"max", SignalOp::Max},
    {"negate", SignalOp::Negate},
    {"sin", SignalOp::Sin},
    {"cos", SignalOp::Cos},
    {"sind", SignalOp::SinDegrees},
    {"cosd", SignalOp::CosDegrees},
}};

} // namespace signal_math_detail

/// Look up an operator by its short name ("add", "mult", "sind", ...).
[[nodiscard]] constexpr std::optional<SignalOp> parseSignalOp(std::string_view name) noexcept {
    for (const auto& entry : signal_math_detail::kOpNames) {
        if (entry.name == name) return entry.op;
    }
    return std::nullopt;
}

[[nodiscard]] constexpr std::string_view signalOpName(SignalOp op) noexcept {
    for (const auto& entry : signal_math_detail::kOpNames) {
        if (entry.op == op) return entry.name;
    }
    return "add";
}

[[nodiscard]] constexpr bool isUnary(SignalOp op) noexcept {
    return op == SignalOp::Negate || op == SignalOp::Sin || op == SignalOp::Cos ||
           op == SignalOp::SinDegrees || op == SignalOp::CosDegrees;
}

/// Apply one operator to a pair of samples.
[[nodiscard]] inline float applySignalOp(SignalOp op, float a, float b) noexcept {
    switch (op) {
        case SignalOp::Add:        return a + b;
        case SignalOp::Sub:        return a - b;
        case SignalOp::Mult:       return a * b;
        case SignalOp::Div:        return (std::abs(b) < kDivisionEpsilon) ? 0.0f : a / b;
        case SignalOp::Min:        return std::min(a, b);
        case SignalOp::Max:        return std::max(a, b);
        case SignalOp::Negate:     return -a;
        case SignalOp::Sin:        return std::sin(a);
        case SignalOp::Cos:        return std::cos(a);
        case SignalOp::SinDegrees: return std::sin(a * kDegreesToRadians);
        case SignalOp::CosDegrees: return std::cos(a * kDegreesToRadians);
    }
    return 0.0f;
}

class SignalMath {
public:
    SignalMath() noexcept = default;
    explicit SignalMath(SignalOp op) noexcept : op_(op) {}

    void setOperation(SignalOp op) noexcept { op_ = op; }
    [[nodiscard]] SignalOp operation() const noexcept { return op_; }

    [[nodiscard]] float process(float a, float b) const noexcept {
        if (detail::isNaN(a)) a = 0.0f;
        if (detail::isNaN(b)) b = 0.0f;
        return detail::sanitize(applySignalOp(op_, a, b));
    }

    /// @param a Input A (may be nullptr: reads as 0)
    /// @param b Input B (may be nullptr: reads as 0)
    void processBlock(const float* a, const float* b, float* out, size_t numSamples) const noexcept {
        for (size_t i = 0; i < numSamples; ++i) {
            out[i] = process(a ? a[i] : 0.0f, b ? b[i] : 0.0f);
        }
    }

private:
    SignalOp op_ = SignalOp::Add;
};

} // namespace DSP
} // namespace Patchwork
