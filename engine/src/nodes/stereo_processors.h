#pragma once

// ==============================================================================
// Stereo Processors - Channel Routing Nodes
// ==============================================================================
//
// | Node            | Inlets                         | Outlets             |
// |-----------------|--------------------------------|---------------------|
// | stereo-splitter | 1 (stereo)                     | L, R (mono)         |
// | stereo-merger   | C, L, R (mono)                 | 1 (stereo)          |
// | mono-to-stereo  | 1 (mono)                       | 1 (stereo)          |
//
// The merger spreads the center inlet into both sides at half gain:
//   outL = L + 0.5 C,  outR = R + 0.5 C
//
// Inlet buses up- and down-mix whatever is connected: a mono source into the
// splitter lands on both sides, a stereo source into mono-to-stereo is
// averaged first.
// ==============================================================================

#include "graph/node_processor.h"

namespace Patchwork::Engine {

inline constexpr size_t kStereoLeftOutlet = 0;
inline constexpr size_t kStereoRightOutlet = 1;

inline constexpr size_t kMergerCenterInlet = 0;
inline constexpr size_t kMergerLeftInlet = 1;
inline constexpr size_t kMergerRightInlet = 2;

inline constexpr float kMergerCenterGain = 0.5f;

class StereoSplitterProcessor final : public NodeProcessor {
public:
    void prepare(double /*sampleRate*/, size_t /*maxBlockSize*/) override {}
    void reset() noexcept override {}
    void process(ProcessContext& ctx) noexcept override;
};

class StereoMergerProcessor final : public NodeProcessor {
public:
    void prepare(double /*sampleRate*/, size_t /*maxBlockSize*/) override {}
    void reset() noexcept override {}
    void process(ProcessContext& ctx) noexcept override;
};

class MonoToStereoProcessor final : public NodeProcessor {
public:
    void prepare(double /*sampleRate*/, size_t /*maxBlockSize*/) override {}
    void reset() noexcept override {}
    void process(ProcessContext& ctx) noexcept override;
};

} // namespace Patchwork::Engine
