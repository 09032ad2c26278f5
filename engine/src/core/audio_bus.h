#pragma once

// ==============================================================================
// AudioBus - Multi-Channel Block Buffer
// ==============================================================================
// Planar float storage for one node port: numChannels x numFrames. Buses are
// sized on the control plane; everything else is real-time safe.
//
// Channel adaptation in accumulate()/copyFrom():
// - equal counts: channel by channel
// - mono source: copied into every destination channel
// - mono destination: average of all source channels
// - otherwise: by index, unmatched channels dropped
// ==============================================================================

#include <cstddef>
#include <vector>

namespace Patchwork::Engine {

class AudioBus {
public:
    AudioBus() = default;
    AudioBus(size_t numChannels, size_t numFrames);

    /// Reallocate and zero. Throws on a channel count of 0 or above kMaxChannels.
    void resize(size_t numChannels, size_t numFrames);

    [[nodiscard]] size_t numChannels() const noexcept { return channels_; }
    [[nodiscard]] size_t numFrames() const noexcept { return frames_; }

    [[nodiscard]] float* channel(size_t index) noexcept {
        return index < channels_ ? data_.data() + index * frames_ : nullptr;
    }
    [[nodiscard]] const float* channel(size_t index) const noexcept {
        return index < channels_ ? data_.data() + index * frames_ : nullptr;
    }

    void clear() noexcept;

    /// Add @p source into this bus with channel adaptation.
    void accumulate(const AudioBus& source) noexcept;

    /// Overwrite this bus from @p source with channel adaptation.
    void copyFrom(const AudioBus& source) noexcept;

    void applyGain(float gain) noexcept;

    /// Average over channels at one frame.
    [[nodiscard]] float monoSample(size_t frame) const noexcept;

    /// Largest absolute sample over all channels.
    [[nodiscard]] float peak() const noexcept;

private:
    size_t channels_ = 0;
    size_t frames_ = 0;
    std::vector<float> data_;
};

} // namespace Patchwork::Engine
