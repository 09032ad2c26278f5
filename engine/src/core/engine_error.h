#pragma once

// ==============================================================================
// EngineError - Control-Plane Error Taxonomy
// ==============================================================================
// Structural errors are reported through the log and a null/false/disabled
// return value; none of them is fatal to a session. Numeric edge cases in
// render code are never reported: kernels clamp or fall back to zero.
// ==============================================================================

#include <cstdint>
#include <string_view>

namespace Patchwork::Engine {

enum class EngineError : uint8_t {
    ConfigurationError,  ///< Unknown kernel/module/operator name, bad options
    ConnectionError,     ///< Missing outlet/inlet, incompatible port kind
    StateError           ///< Kernel parameter used before deferred init
};

[[nodiscard]] constexpr std::string_view errorName(EngineError error) noexcept {
    switch (error) {
        case EngineError::ConfigurationError: return "ConfigurationError:";
        case EngineError::ConnectionError:    return "ConnectionError:";
        case EngineError::StateError:         return "StateError:";
    }
    return "EngineError:";
}

} // namespace Patchwork::Engine
