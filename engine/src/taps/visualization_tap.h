#pragma once

// ==============================================================================
// VisualizationTap - Read-Only Observer of a Node Outlet
// ==============================================================================
// Attached with AudioGraph::attachTap(). onBlock() runs on the render plane
// after the observed node has processed, once per block. Implementations must
// be real-time safe and must not modify the bus.
// ==============================================================================

#include "core/audio_bus.h"

#include <cstdint>

namespace Patchwork::Engine {

using TapId = uint32_t;

inline constexpr TapId kInvalidTap = 0;

class VisualizationTap {
public:
    virtual ~VisualizationTap() = default;

    /// @param bus Outlet contents for this block
    /// @param blockStartTime Graph time of the first frame in seconds
    virtual void onBlock(const AudioBus& bus, double blockStartTime) noexcept = 0;
};

} // namespace Patchwork::Engine
