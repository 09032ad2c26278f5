// ==============================================================================
// Layer 0: Core Utilities
// db_utils.h - Float Guards and dB/Linear Conversion
// ==============================================================================
// Real-time safe: no allocation, no locks, no exceptions, no I/O.
// Every kernel routes untrusted control and signal values through these
// guards, so a malformed upstream value degrades to silence instead of
// propagating NaN through a feedback loop.
// ==============================================================================

#pragma once

#include <bit>
#include <cmath>
#include <cstdint>

namespace Patchwork {
namespace DSP {

// ==============================================================================
// Constants
// ==============================================================================

/// Floor value for silence/zero gain in decibels (~24-bit dynamic range).
inline constexpr float kSilenceFloorDb = -144.0f;

/// Magnitude below which values are flushed to zero.
inline constexpr float kDenormalThreshold = 1e-15f;

namespace detail {

/// NaN check on the IEEE 754 bit pattern.
/// Survives -ffast-math, where std::isnan may be folded to false.
constexpr bool isNaN(float x) noexcept {
    const auto bits = std::bit_cast<std::uint32_t>(x);
    return ((bits & 0x7F800000u) == 0x7F800000u) && ((bits & 0x007FFFFFu) != 0);
}

/// +/-Inf check on the IEEE 754 bit pattern.
constexpr bool isInf(float x) noexcept {
    const auto bits = std::bit_cast<std::uint32_t>(x);
    return (bits & 0x7FFFFFFFu) == 0x7F800000u;
}

constexpr bool isFinite(float x) noexcept {
    return (std::bit_cast<std::uint32_t>(x) & 0x7F800000u) != 0x7F800000u;
}

/// Flush denormal-range values to zero.
constexpr float flushDenormal(float x) noexcept {
    return (x > -kDenormalThreshold && x < kDenormalThreshold) ? 0.0f : x;
}

/// Replace NaN/Inf with a fallback value.
constexpr float sanitize(float x, float fallback = 0.0f) noexcept {
    return isFinite(x) ? x : fallback;
}

} // namespace detail

// ==============================================================================
// Functions
// ==============================================================================

/// Convert decibels to linear gain.
/// @formula gain = 10^(dB/20)
/// @note NaN input returns 0.0f
[[nodiscard]] inline float dbToGain(float dB) noexcept {
    if (detail::isNaN(dB)) {
        return 0.0f;
    }
    return std::pow(10.0f, dB / 20.0f);
}

/// Convert linear gain to decibels, clamped to kSilenceFloorDb.
/// @note Zero/negative/NaN input returns kSilenceFloorDb
[[nodiscard]] inline float gainToDb(float gain) noexcept {
    if (detail::isNaN(gain) || gain <= 0.0f) {
        return kSilenceFloorDb;
    }
    const float result = 20.0f * std::log10(gain);
    return (result < kSilenceFloorDb) ? kSilenceFloorDb : result;
}

} // namespace DSP
} // namespace Patchwork
