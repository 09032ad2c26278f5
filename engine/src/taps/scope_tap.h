#pragma once

// ==============================================================================
// ScopeTap - Oscilloscope Capture
// ==============================================================================
// Keeps the most recent `capacity` mono samples (channel average) of the
// observed outlet in a ring buffer. snapshot() returns them oldest first.
// ==============================================================================

#include "taps/visualization_tap.h"

#include <patchwork/dsp/core/db_utils.h>

#include <cstddef>
#include <cstdint>
#include <vector>

namespace Patchwork::Engine {

class ScopeTap final : public VisualizationTap {
public:
    explicit ScopeTap(size_t capacity = 2048);

    void onBlock(const AudioBus& bus, double blockStartTime) noexcept override;

    /// Captured samples, oldest first. At most capacity() entries.
    [[nodiscard]] std::vector<float> snapshot() const;

    void clear() noexcept;

    [[nodiscard]] size_t capacity() const noexcept { return buffer_.size(); }
    [[nodiscard]] uint64_t samplesCaptured() const noexcept { return captured_; }
    [[nodiscard]] double lastBlockTime() const noexcept { return lastBlockTime_; }
    /// Peak of the most recent block.
    [[nodiscard]] float peak() const noexcept { return peak_; }
    [[nodiscard]] float peakDb() const noexcept { return DSP::gainToDb(peak_); }

private:
    std::vector<float> buffer_;
    size_t writeIndex_ = 0;
    uint64_t captured_ = 0;
    double lastBlockTime_ = 0.0;
    float peak_ = 0.0f;
};

} // namespace Patchwork::Engine
