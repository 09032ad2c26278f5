#pragma once

// ==============================================================================
// Node - Graph Vertex
// ==============================================================================
// One class for every node variant; the variant is a NodeKind tag plus the
// NodeProcessor it owns. A node has a fixed set of inlets and outlets (each
// an AudioBus), a ParameterSet, an output gain and a lifecycle:
//
//   Constructed -> PendingInit -> Initialized
//
// Kernel-backed nodes wait in PendingInit until their modules are loaded.
// Then the processor is installed, kernel parameters appear and the Init
// event fires once. Before that the node renders silence and
// kernel parameter access is a StateError.
//
// Nodes are created and destroyed only by their AudioGraph.
//
// Thread Safety: everything except process() and the bus accessors used by
// the renderer is control plane only.
// ==============================================================================

#include "core/audio_bus.h"
#include "graph/node_processor.h"
#include "graph/port.h"
#include "parameters/parameter_set.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Patchwork::Engine {

class AudioGraph;

using NodeId = uint32_t;
using ListenerId = uint32_t;

inline constexpr ListenerId kNoListener = 0;

/// Closed set of node variants.
enum class NodeKind : uint8_t {
    Destination,
    Primitive,
    SignalMath,
    Crossfade,
    Mix2,
    Mix4,
    StateVariableFilter,
    FeedbackOscillator,
    EnvelopeGenerator,
    PulseOscillator,
    StereoSplitter,
    StereoMerger,
    MonoToStereo,
    Effect,
    Disabled
};

[[nodiscard]] std::string_view nodeKindName(NodeKind kind) noexcept;

enum class Lifecycle : uint8_t {
    Constructed,
    PendingInit,
    Initialized
};

/// The only event a node emits.
enum class NodeEvent : uint8_t { Init };

/// Port counts and channel widths. A channel count of 0 means "graph
/// channel count".
struct NodeLayout {
    size_t numInlets = 1;
    size_t numOutlets = 1;
    size_t inletChannels = 0;
    size_t outletChannels = 0;
};

class Node {
public:
    using Listener = std::function<void(Node&)>;

    Node(AudioGraph& graph, NodeId id, NodeKind kind, std::string name, const NodeLayout& layout);
    ~Node();

    Node(const Node&) = delete;
    Node& operator=(const Node&) = delete;

    // ==========================================================================
    // Identity
    // ==========================================================================

    [[nodiscard]] NodeId id() const noexcept { return id_; }
    [[nodiscard]] NodeKind kind() const noexcept { return kind_; }
    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] Lifecycle lifecycle() const noexcept { return lifecycle_; }
    [[nodiscard]] bool isInitialized() const noexcept { return lifecycle_ == Lifecycle::Initialized; }
    [[nodiscard]] AudioGraph& graph() const noexcept { return graph_; }

    // ==========================================================================
    // Ports
    // ==========================================================================

    [[nodiscard]] size_t numInlets() const noexcept { return inlets_.size(); }
    [[nodiscard]] size_t numOutlets() const noexcept { return outlets_.size(); }

    [[nodiscard]] Port inlet(size_t index = 0) noexcept;
    [[nodiscard]] Port outlet(size_t index = 0) noexcept;

    /// Parameter port; invalid (node set, parameter null) if the name is unknown.
    [[nodiscard]] Port paramPort(std::string_view name) noexcept;

    [[nodiscard]] const AudioBus& outputBus(size_t index) const noexcept { return outlets_[index]; }
    [[nodiscard]] AudioBus& inputBus(size_t index) noexcept { return inlets_[index]; }
    [[nodiscard]] const AudioBus& inputBus(size_t index) const noexcept { return inlets_[index]; }

    // ==========================================================================
    // Connections
    // ==========================================================================

    /// Wire outlet @p outIndex to inlet @p inIndex of @p target.
    /// @return @p target for chaining, or nullptr (logged) on failure
    Node* connect(Node& target, size_t outIndex = 0, size_t inIndex = 0);

    /// Add outlet @p outIndex into a control parameter.
    /// @return this, or nullptr (logged) on failure
    Node* connect(ControlParameter& parameter, size_t outIndex = 0);

    /// Dispatch on the port kind. Output ports are rejected.
    Node* connect(const Port& target, size_t outIndex = 0);

    /// Remove every outgoing edge. @return number removed
    size_t disconnect();
    size_t disconnect(Node& target);
    size_t disconnect(ControlParameter& parameter);

    // ==========================================================================
    // Parameters
    // ==========================================================================

    /// Look up a parameter. Before initialization this is a StateError.
    [[nodiscard]] ControlParameter* param(std::string_view name);

    bool set(std::string_view name, float value, double timeConstant = 0.0);
    bool setNormalized(std::string_view name, float normalized, double timeConstant = 0.0);
    [[nodiscard]] std::optional<float> get(std::string_view name) const;

    [[nodiscard]] ParameterSet& parameters() noexcept { return params_; }
    [[nodiscard]] const ParameterSet& parameters() const noexcept { return params_; }
    [[nodiscard]] bool ownsParameter(const ControlParameter* parameter) const noexcept;

    /// Post-processing gain applied to every outlet.
    void scale(float gain);
    [[nodiscard]] float outputGain() const noexcept { return outputGain_; }

    // ==========================================================================
    // Source Scheduling
    // ==========================================================================

    bool start(double when = 0.0);
    bool stop(double when = 0.0);

    // ==========================================================================
    // Events
    // ==========================================================================

    /// Subscribe to @p event. If the node is already initialized the listener
    /// runs immediately; a one-shot listener is then not stored and
    /// kNoListener is returned.
    ListenerId listen(NodeEvent event, Listener listener, bool once = true);
    bool removeListener(ListenerId id);
    void clearListeners() noexcept { listeners_.clear(); }
    [[nodiscard]] size_t listenerCount() const noexcept { return listeners_.size(); }

    /// Invoke every subscriber synchronously, then drop one-shot subscribers.
    /// A listener may remove this node from its graph; the node is then
    /// retired and stays alive until the notification returns.
    void trigger(NodeEvent event);

    [[nodiscard]] bool isNotifying() const noexcept { return notifyDepth_ > 0; }

    // ==========================================================================
    // Graph Internals
    // ==========================================================================

    void beginPendingInit() noexcept;

    /// Install the processor, materialize its parameters and fire Init.
    void completeInit(std::unique_ptr<NodeProcessor> processor);

    /// Mark initialized with no processor (destination, disabled stand-ins).
    void completeInitWithoutProcessor();

    [[nodiscard]] NodeProcessor* processor() const noexcept { return processor_.get(); }

    void clearInputs() noexcept;
    void beginParameterBlock(double startTime, double sampleRate, size_t numFrames) noexcept;
    void endParameterBlock() noexcept;
    void process(double blockStartTime, double sampleRate, size_t numFrames) noexcept;

private:
    struct Subscription {
        ListenerId id;
        NodeEvent event;
        Listener listener;
        bool once;
    };

    AudioGraph& graph_;
    NodeId id_;
    NodeKind kind_;
    std::string name_;
    Lifecycle lifecycle_ = Lifecycle::Constructed;

    std::vector<AudioBus> inlets_;
    std::vector<AudioBus> outlets_;
    ParameterSet params_;
    std::vector<ControlParameter*> paramOrder_;
    std::unique_ptr<NodeProcessor> processor_;
    float outputGain_ = 1.0f;

    void notify(const Listener& listener);

    std::vector<Subscription> listeners_;
    ListenerId nextListenerId_ = 1;
    int notifyDepth_ = 0;
};

} // namespace Patchwork::Engine
