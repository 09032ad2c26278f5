// ==============================================================================
// Layer 0: Core Utilities
// random.h - Seeded Random Source
// ==============================================================================
// Xorshift32 draws the per-line modulation rates and phases of the FDN reverb.
// The same seed always yields the same reverb, which keeps renders
// reproducible across runs and hosts.
// ==============================================================================

#pragma once

#include <cstdint>

namespace Patchwork {
namespace DSP {

/// Substituted for a zero seed, which would lock xorshift at 0.
inline constexpr uint32_t kFallbackRandomSeed = 0x9E3779B9u;

class Xorshift32 {
public:
    explicit constexpr Xorshift32(uint32_t seed = 1) noexcept { reseed(seed); }

    constexpr void reseed(uint32_t seed) noexcept {
        state_ = seed == 0 ? kFallbackRandomSeed : seed;
    }

    /// Next raw value; never 0.
    [[nodiscard]] constexpr uint32_t next() noexcept {
        uint32_t x = state_;
        x ^= x << 13;
        x ^= x >> 17;
        x ^= x << 5;
        state_ = x;
        return x;
    }

    /// [0, 1]
    [[nodiscard]] constexpr float nextUnipolar() noexcept {
        return static_cast<float>(next() >> 8) * kUnit;
    }

    /// [-1, 1]
    [[nodiscard]] constexpr float nextBipolar() noexcept {
        return 2.0f * nextUnipolar() - 1.0f;
    }

    /// [lo, hi]
    [[nodiscard]] constexpr float nextInRange(float lo, float hi) noexcept {
        return lo + (hi - lo) * nextUnipolar();
    }

    [[nodiscard]] constexpr uint32_t state() const noexcept { return state_; }

private:
    // 24 significant bits map exactly onto a float mantissa
    static constexpr float kUnit = 1.0f / 16777215.0f;

    uint32_t state_ = kFallbackRandomSeed;
};

} // namespace DSP
} // namespace Patchwork
