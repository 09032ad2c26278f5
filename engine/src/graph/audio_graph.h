#pragma once

// ==============================================================================
// AudioGraph - Node Ownership, Wiring and Block Rendering
// ==============================================================================
// Owns every node of one processing graph, the edges between them, the
// ModuleRegistry that gates kernel-backed nodes and the primitive provider.
//
// Control plane:
//   - create*() factories return a node that is never null. A configuration
//     error yields a silent NodeKind::Disabled node instead.
//   - connect/disconnect requests come from Node and are validated here.
//   - Every mutation rebuilds the render schedule: a topological order of the
//     nodes (Kahn) in creation order. Nodes on a cycle are appended after the
//     acyclic part and read the previous block's outlet contents.
//
// Render plane:
//   - renderBlock() pulls one block of config().blockSize frames through the
//     schedule into the caller's channel pointers. noexcept; no allocation.
//
// Typical use:
// @code
//   AudioGraph graph({.sampleRate = 48000.0});
//   auto& osc = graph.createFeedbackOscillator();
//   auto& svf = graph.createStateVariableFilter();
//   osc.connect(svf)->connect(graph.destination(), kSVFLowpassOutlet);
//   graph.renderBlock(outputs, 2);
// @endcode
// ==============================================================================

#include "core/engine_config.h"
#include "graph/node.h"
#include "providers/primitive_provider.h"
#include "registry/module_registry.h"
#include "taps/visualization_tap.h"

#include <patchwork/dsp/effects/fdn_reverb.h>
#include <patchwork/dsp/primitives/crossfade.h>
#include <patchwork/dsp/primitives/polyblep_oscillator.h>
#include <patchwork/dsp/primitives/signal_math.h>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace Patchwork::Engine {

class AudioGraph {
public:
    /// @param provider Primitive provider; nullptr selects BuiltinPrimitiveProvider
    explicit AudioGraph(const EngineConfig& config = {}, std::unique_ptr<PrimitiveProvider> provider = nullptr);
    ~AudioGraph();

    AudioGraph(const AudioGraph&) = delete;
    AudioGraph& operator=(const AudioGraph&) = delete;

    // ==========================================================================
    // Configuration
    // ==========================================================================

    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }
    [[nodiscard]] double sampleRate() const noexcept { return config_.sampleRate; }
    [[nodiscard]] size_t blockSize() const noexcept { return config_.blockSize; }
    [[nodiscard]] size_t channels() const noexcept { return config_.channels; }

    /// framesRendered / sampleRate.
    [[nodiscard]] double currentTime() const noexcept;
    [[nodiscard]] uint64_t framesRendered() const noexcept { return framesRendered_; }

    // ==========================================================================
    // Modules
    // ==========================================================================

    [[nodiscard]] ModuleRegistry& modules() noexcept { return registry_; }

    /// Resolve every built-in module held back by ModuleLoading::Deferred.
    /// @return number of modules resolved
    size_t resolveDeferredModules();

    // ==========================================================================
    // Node Factories
    // ==========================================================================

    [[nodiscard]] Node& destination() noexcept { return *nodes_.front(); }

    Node& createSignalMath(DSP::SignalOp op);
    /// Unknown operator names give a Disabled node.
    Node& createSignalMath(std::string_view op);
    Node& createCrossfade(DSP::CrossfadeCurve curve = DSP::CrossfadeCurve::Linear);
    Node& createMix2();
    Node& createMix4();
    Node& createStateVariableFilter();
    Node& createFeedbackOscillator();
    /// Unknown envelope types fall back to ADSR with a warning.
    Node& createEnvelope(std::string_view type = "adsr");

    /// Oscillator of waveform @p shape: "sine", "square", "sawtooth",
    /// "triangle" or "pulse". Unknown shapes give a Disabled node.
    Node& createOscillator(std::string_view shape = "sine", float frequency = DSP::kOscDefaultFrequency);
    /// Pulse oscillator with an a-rate width in [-1, 1]; 0 is a square wave.
    Node& createPulseOscillator(float frequency = DSP::kOscDefaultFrequency, float width = 0.0f);
    /// Stereo inlet to mono L and R outlets.
    Node& createStereoSplitter();
    /// Center, L and R mono inlets to one stereo outlet; center enters both
    /// sides at half gain.
    Node& createStereoMerger();
    /// Mono inlet copied to both channels of a stereo outlet.
    Node& createMonoToStereo();

    /// Dry/wet FDN reverb effect.
    Node& createReverb(uint32_t seed = DSP::fdn_detail::kDefaultSeed);
    /// Dry/wet tanh distortion effect.
    Node& createDistortion();

    Node& createPrimitive(PrimitiveType type, const PrimitiveOptions& options = {});

    /// Create a kernel node by module name. @p variant selects the operator
    /// (signal-math), curve (crossfade) or envelope type. Unknown names give a
    /// Disabled node.
    Node& createKernel(std::string_view module, std::string_view variant = {});

    /// Remove a node and all of its edges. The destination cannot be removed.
    bool removeNode(Node& node);

    [[nodiscard]] Node* findNode(NodeId id) const noexcept;
    [[nodiscard]] size_t nodeCount() const noexcept { return nodes_.size(); }
    [[nodiscard]] size_t edgeCount() const noexcept { return signalEdges_.size() + paramEdges_.size(); }

    /// Node ids in render order.
    [[nodiscard]] std::vector<NodeId> renderOrder() const;

    // ==========================================================================
    // Wiring (called through Node)
    // ==========================================================================

    bool connectNodes(Node& source, size_t outIndex, Node& target, size_t inIndex);
    bool connectParameter(Node& source, size_t outIndex, ControlParameter& parameter);
    size_t disconnectAll(Node& source);
    size_t disconnectNode(Node& source, Node& target);
    size_t disconnectParameter(Node& source, ControlParameter& parameter);

    // ==========================================================================
    // Visualization
    // ==========================================================================

    /// Observe outlet @p outIndex of @p node. On a node without outlets (the
    /// destination) the tap sees inlet 0.
    /// @return tap id, or kInvalidTap on a bad outlet index
    TapId attachTap(Node& node, size_t outIndex, VisualizationTap& tap);
    bool detachTap(TapId id);
    [[nodiscard]] size_t tapCount() const noexcept { return taps_.size(); }

    // ==========================================================================
    // Rendering
    // ==========================================================================

    /// Render one block into @p outputs (numChannels pointers to blockSize()
    /// floats). Destination channels are adapted to numChannels; extra output
    /// channels are zeroed.
    void renderBlock(float* const* outputs, size_t numChannels) noexcept;

private:
    using ProcessorFactory = std::function<std::unique_ptr<NodeProcessor>()>;

    struct SignalEdge {
        Node* source;
        size_t outIndex;
        Node* target;
        size_t inIndex;
    };

    struct ParamEdge {
        Node* source;
        size_t outIndex;
        ControlParameter* parameter;
        Node* owner;
    };

    struct InputLink {
        const AudioBus* source;
        size_t inIndex;
    };

    struct ParamLink {
        const AudioBus* source;
        ControlParameter* parameter;
    };

    struct ScheduledNode {
        Node* node;
        std::vector<InputLink> inputs;
        std::vector<ParamLink> params;
    };

    struct TapEntry {
        TapId id;
        Node* node;
        size_t outIndex;
        VisualizationTap* tap;
    };

    Node& addNode(NodeKind kind, const NodeLayout& layout, std::string_view label = {});
    Node& createDisabled(std::string_view what, const NodeLayout& layout);
    Node& createKernelNode(NodeKind kind, const NodeLayout& layout,
                           std::vector<std::string_view> requiredModules, ProcessorFactory factory);
    void finishInit(NodeId id, const ProcessorFactory& factory);
    Node& createNativeNode(NodeKind kind, std::unique_ptr<NodeProcessor> processor);
    void registerBuiltinModules();

    [[nodiscard]] bool ownsNode(const Node& node) const noexcept;
    [[nodiscard]] Node* parameterOwner(const ControlParameter& parameter) const noexcept;
    void rebuildSchedule();
    void releaseRetiredNodes() noexcept;

    EngineConfig config_;
    std::unique_ptr<PrimitiveProvider> provider_;
    ModuleRegistry registry_;
    std::vector<ModuleRegistry::Resolver> deferredResolvers_;

    std::vector<std::unique_ptr<Node>> nodes_;
    // Removed while notifying their listeners; freed once the notification ends
    std::vector<std::unique_ptr<Node>> retired_;
    std::vector<SignalEdge> signalEdges_;
    std::vector<ParamEdge> paramEdges_;
    std::vector<ScheduledNode> schedule_;
    std::vector<TapEntry> taps_;

    NodeId nextNodeId_ = 0;
    TapId nextTapId_ = 1;
    uint64_t framesRendered_ = 0;
};

} // namespace Patchwork::Engine
