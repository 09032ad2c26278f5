// ==============================================================================
// Layer 0: Core Utility - Math Constants
// ==============================================================================

#pragma once

namespace Patchwork {
namespace DSP {

inline constexpr float kPi = 3.14159265358979323846f;
inline constexpr float kTwoPi = 2.0f * kPi;
inline constexpr float kHalfPi = 0.5f * kPi;

/// Rotation mixers start at an equal blend of each pair.
inline constexpr float kQuarterPi = 0.25f * kPi;

/// Used by the degree variants of signal-math sin and cos.
inline constexpr float kDegreesToRadians = kPi / 180.0f;

/// Phase accumulators run in double precision.
inline constexpr double kTwoPiD = 6.283185307179586476925;

} // namespace DSP
} // namespace Patchwork
