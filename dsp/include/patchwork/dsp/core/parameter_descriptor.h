// ==============================================================================
// Layer 0: Core Utility - Parameter Descriptor
// ==============================================================================
// Declaration of a kernel control parameter. Hosts use the descriptor to build
// the per-block value array a kernel consumes: blockSize entries for a-rate
// parameters, a single entry for k-rate parameters.
// ==============================================================================

#pragma once

#include <algorithm>
#include <cstdint>
#include <string_view>

namespace Patchwork {
namespace DSP {

/// Update granularity of a control parameter.
enum class AutomationRate : uint8_t {
    ARate,  ///< One value per sample
    KRate   ///< One value per block
};

struct ParameterDescriptor {
    std::string_view name;
    float minValue = 0.0f;
    float maxValue = 1.0f;
    float defaultValue = 0.0f;
    AutomationRate rate = AutomationRate::ARate;

    [[nodiscard]] constexpr float clamp(float value) const noexcept {
        return std::clamp(value, minValue, maxValue);
    }
};

} // namespace DSP
} // namespace Patchwork
