// ==============================================================================
// Layer 3: Effect - Distortion
// ==============================================================================
// tanh waveshaper, y = tanh(drive * x). The default drive of e matches a
// gentle tube-like curve; the drive parameter is slewed per sample.
// ==============================================================================

#pragma once

#include <array>
#include <cstddef>
#include <span>

#include <patchwork/dsp/core/parameter_descriptor.h>
#include <patchwork/dsp/primitives/saturator.h>
#include <patchwork/dsp/primitives/smoother.h>

namespace Patchwork {
namespace DSP {

inline constexpr float kDefaultDistortionDrive = 2.718281828f;
inline constexpr float kMinDistortionDrive = 0.1f;
inline constexpr float kMaxDistortionDrive = 20.0f;
inline constexpr float kDriveSlewPerMs = 0.05f;

class Distortion {
public:
    static constexpr std::array<ParameterDescriptor, 1> parameterDescriptors() noexcept {
        return {{{"drive", kMinDistortionDrive, kMaxDistortionDrive, kDefaultDistortionDrive,
                  AutomationRate::KRate}}};
    }

    void prepare(double sampleRate) noexcept {
        driveSmoother_.configure(kDriveSlewPerMs, static_cast<float>(sampleRate));
        reset();
    }

    void reset() noexcept { driveSmoother_.reset(); }

    [[nodiscard]] float process(float x, float drive) noexcept {
        saturator_.setDrive(driveSmoother_.process(drive));
        return saturator_.process(x);
    }

    void processBlock(const float* in, float* out, size_t numSamples,
                      std::span<const float> drive) noexcept {
        for (size_t i = 0; i < numSamples; ++i) {
            out[i] = process(in ? in[i] : 0.0f, sampleParam(drive, i));
        }
    }

private:
    Saturator saturator_;
    SlewLimiter driveSmoother_;
};

} // namespace DSP
} // namespace Patchwork
