// ==============================================================================
// Layer 1: DSP Primitive - Saturator
// ==============================================================================
// Memoryless soft limiter y = tanh(drive * x) / makeup. Bounded to [-1, 1]
// for makeup == 1; keeps feedback paths from running away.
// ==============================================================================

#pragma once

#include <algorithm>
#include <cmath>

#include <patchwork/dsp/core/db_utils.h>

namespace Patchwork {
namespace DSP {

inline constexpr float kMinSaturatorDrive = 0.01f;
inline constexpr float kMaxSaturatorDrive = 100.0f;

class Saturator {
public:
    Saturator() noexcept = default;

    void setDrive(float drive) noexcept {
        if (detail::isNaN(drive)) return;
        drive_ = std::clamp(drive, kMinSaturatorDrive, kMaxSaturatorDrive);
    }

    /// Divide the output by tanh(drive) so a full-scale input stays full scale.
    void setCompensated(bool on) noexcept { compensated_ = on; }

    [[nodiscard]] float process(float x) const noexcept {
        if (!detail::isFinite(x)) return 0.0f;
        const float y = std::tanh(drive_ * x);
        return compensated_ ? y / std::tanh(drive_) : y;
    }

    void processBlock(float* buffer, size_t numSamples) const noexcept {
        for (size_t i = 0; i < numSamples; ++i) buffer[i] = process(buffer[i]);
    }

    [[nodiscard]] float drive() const noexcept { return drive_; }

private:
    float drive_ = 1.0f;
    bool compensated_ = false;
};

} // namespace DSP
} // namespace Patchwork
