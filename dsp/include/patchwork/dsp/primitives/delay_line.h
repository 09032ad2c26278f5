// ==============================================================================
// Layer 1: DSP Primitive - DelayLine
// ==============================================================================
// Ring buffer behind the FDN reverb lines and the delay primitive. Storage is
// a power of two so the read position wraps with a mask.
//
// Delays are measured from the newest sample: read(0) returns what write()
// stored last. A feedback network therefore reads all of its lines first and
// writes the new line inputs afterwards.
// ==============================================================================

#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <vector>

namespace Patchwork {
namespace DSP {

/// Smallest power of two >= n (1 for n == 0).
inline constexpr size_t nextPowerOf2(size_t n) noexcept {
    size_t result = 1;
    while (result < n) result <<= 1;
    return result;
}

class DelayLine {
public:
    DelayLine() noexcept = default;

    DelayLine(const DelayLine&) = delete;
    DelayLine& operator=(const DelayLine&) = delete;
    DelayLine(DelayLine&&) noexcept = default;
    DelayLine& operator=(DelayLine&&) noexcept = default;

    /// Size the ring for delays up to @p maxDelaySeconds and clear it.
    /// Allocates; call from the control plane.
    void prepare(double sampleRate, float maxDelaySeconds) {
        sampleRate_ = sampleRate;
        const double seconds = std::max(static_cast<double>(maxDelaySeconds), 0.0);
        maxDelay_ = static_cast<size_t>(sampleRate * seconds);
        ring_.assign(nextPowerOf2(maxDelay_ + 1), 0.0f);
        mask_ = ring_.size() - 1;
        newest_ = mask_;
    }

    void reset() noexcept {
        std::fill(ring_.begin(), ring_.end(), 0.0f);
        newest_ = mask_;
    }

    void write(float sample) noexcept {
        if (ring_.empty()) return;
        newest_ = (newest_ + 1) & mask_;
        ring_[newest_] = sample;
    }

    /// Sample @p delaySamples behind the newest one; delays past the
    /// maximum read the maximum.
    [[nodiscard]] float read(size_t delaySamples) const noexcept {
        if (ring_.empty()) return 0.0f;
        return ring_[(newest_ - std::min(delaySamples, maxDelay_)) & mask_];
    }

    /// Fractional read between the two neighbouring integer delays.
    /// Negative and NaN delays read the newest sample.
    [[nodiscard]] float readLinear(float delaySamples) const noexcept {
        const float delay = delaySamples > 0.0f ? std::min(delaySamples, static_cast<float>(maxDelay_)) : 0.0f;
        const auto whole = static_cast<size_t>(delay);
        const float frac = delay - static_cast<float>(whole);
        const float nearer = read(whole);
        if (frac == 0.0f) return nearer;
        return nearer + frac * (read(whole + 1) - nearer);
    }

    [[nodiscard]] size_t maxDelaySamples() const noexcept { return maxDelay_; }
    [[nodiscard]] double sampleRate() const noexcept { return sampleRate_; }

private:
    std::vector<float> ring_;
    size_t mask_ = 0;
    size_t newest_ = 0;
    size_t maxDelay_ = 0;
    double sampleRate_ = 0.0;
};

} // namespace DSP
} // namespace Patchwork
