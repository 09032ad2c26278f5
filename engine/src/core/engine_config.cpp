#include "core/engine_config.h"
#include "core/engine_error.h"

#include <failsafe/failsafe.hh>

#include <algorithm>
#include <cmath>

namespace Patchwork::Engine {

EngineConfig EngineConfig::validated() const {
    EngineConfig result = *this;

    if (!std::isfinite(sampleRate) || sampleRate < kMinSampleRate || sampleRate > kMaxSampleRate) {
        result.sampleRate = std::isfinite(sampleRate)
            ? std::clamp(sampleRate, kMinSampleRate, kMaxSampleRate)
            : EngineConfig{}.sampleRate;
        LOG_WARN("config", errorName(EngineError::ConfigurationError), "sample rate", sampleRate,
                 "out of range, using", result.sampleRate);
    }

    if (blockSize < kMinBlockSize || blockSize > kMaxBlockSize) {
        result.blockSize = std::clamp(blockSize, kMinBlockSize, kMaxBlockSize);
        LOG_WARN("config", errorName(EngineError::ConfigurationError), "block size", blockSize,
                 "out of range, using", result.blockSize);
    }

    if (channels < 1 || channels > kMaxChannels) {
        result.channels = std::clamp<size_t>(channels, 1, kMaxChannels);
        LOG_WARN("config", errorName(EngineError::ConfigurationError), "channel count", channels,
                 "out of range, using", result.channels);
    }

    return result;
}

std::string_view moduleLoadingName(ModuleLoading loading) noexcept {
    switch (loading) {
        case ModuleLoading::Immediate: return "immediate";
        case ModuleLoading::Deferred:  return "deferred";
    }
    return "unknown";
}

} // namespace Patchwork::Engine
