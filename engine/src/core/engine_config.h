#pragma once

// ==============================================================================
// EngineConfig - Render Graph Configuration
// ==============================================================================
// Sample rate, render block size, output channel count and the module loading
// policy of an AudioGraph. Out-of-range values are clamped by validated().
// ==============================================================================

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace Patchwork::Engine {

inline constexpr double kMinSampleRate = 8000.0;
inline constexpr double kMaxSampleRate = 384000.0;
inline constexpr size_t kMinBlockSize = 1;
inline constexpr size_t kMaxBlockSize = 4096;
inline constexpr size_t kMaxChannels = 8;

/// How built-in kernel modules become available.
enum class ModuleLoading : uint8_t {
    Immediate,  ///< Resolved while the graph is constructed
    Deferred    ///< Resolved by AudioGraph::resolveDeferredModules()
};

// IMPORTANT: Field order matters for C++20 designated initializers.
struct EngineConfig {
    double sampleRate = 44100.0;
    size_t blockSize = 128;
    size_t channels = 2;
    ModuleLoading moduleLoading = ModuleLoading::Immediate;

    /// Copy with every field clamped to its supported range. Each clamp is
    /// logged as a configuration warning.
    [[nodiscard]] EngineConfig validated() const;
};

[[nodiscard]] std::string_view moduleLoadingName(ModuleLoading loading) noexcept;

} // namespace Patchwork::Engine
