#pragma once

// ==============================================================================
// NodeProcessor - Render Interface of a Node
// ==============================================================================
// Every node variant (kernel, primitive, effect) implements this interface;
// the Node owns exactly one processor once it is initialized.
//
// prepare() runs on the control plane and may allocate. reset() and process()
// run on the render plane: noexcept, no allocation, no locks.
// ==============================================================================

#include "core/audio_bus.h"
#include "parameters/control_parameter.h"

#include <cstddef>
#include <span>
#include <vector>

namespace Patchwork::Engine {

/// Everything a processor sees for one block.
struct ProcessContext {
    std::span<const AudioBus> inputs;
    std::span<AudioBus> outputs;
    std::span<ControlParameter* const> parameters;  ///< In descriptor order
    size_t numFrames = 0;
    double sampleRate = 44100.0;
    double blockStartTime = 0.0;

    /// Block values of parameter @p index (empty if out of range).
    [[nodiscard]] std::span<const float> param(size_t index) const noexcept {
        if (index >= parameters.size() || parameters[index] == nullptr) return {};
        return parameters[index]->blockValues();
    }
};

class NodeProcessor {
public:
    virtual ~NodeProcessor() = default;

    /// Allocate state for the graph's rate and block size.
    virtual void prepare(double sampleRate, size_t maxBlockSize) = 0;

    virtual void reset() noexcept = 0;

    virtual void process(ProcessContext& context) noexcept = 0;

    /// Parameters this processor reads, in ProcessContext::param() order.
    [[nodiscard]] virtual std::vector<ParameterDescriptor> parameterDescriptors(double /*sampleRate*/) const {
        return {};
    }

    /// Schedule a source start. @return false if the processor is not a
    /// schedulable source.
    virtual bool start(double /*when*/) { return false; }

    /// Schedule a source stop. @return false if not schedulable.
    virtual bool stop(double /*when*/) { return false; }
};

} // namespace Patchwork::Engine
