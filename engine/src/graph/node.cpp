#include "graph/node.h"

#include "core/engine_error.h"
#include "graph/audio_graph.h"

#include <failsafe/failsafe.hh>

#include <patchwork/dsp/core/db_utils.h>

#include <algorithm>
#include <utility>

namespace Patchwork::Engine {

std::string_view nodeKindName(NodeKind kind) noexcept {
    switch (kind) {
        case NodeKind::Destination:         return "destination";
        case NodeKind::Primitive:           return "primitive";
        case NodeKind::SignalMath:          return "signal-math";
        case NodeKind::Crossfade:           return "crossfade";
        case NodeKind::Mix2:                return "mix-2";
        case NodeKind::Mix4:                return "mix-4";
        case NodeKind::StateVariableFilter: return "state-variable-filter";
        case NodeKind::FeedbackOscillator:  return "feedback-oscillator";
        case NodeKind::EnvelopeGenerator:   return "envelope-generator";
        case NodeKind::PulseOscillator:     return "pulse-oscillator";
        case NodeKind::StereoSplitter:      return "stereo-splitter";
        case NodeKind::StereoMerger:        return "stereo-merger";
        case NodeKind::MonoToStereo:        return "mono-to-stereo";
        case NodeKind::Effect:              return "effect";
        case NodeKind::Disabled:            return "disabled";
    }
    return "unknown";
}

Node::Node(AudioGraph& graph, NodeId id, NodeKind kind, std::string name, const NodeLayout& layout)
    : graph_(graph)
    , id_(id)
    , kind_(kind)
    , name_(std::move(name))
    , params_(graph.config().blockSize)
{
    const EngineConfig& config = graph.config();
    const size_t inletChannels = layout.inletChannels == 0 ? config.channels : layout.inletChannels;
    const size_t outletChannels = layout.outletChannels == 0 ? config.channels : layout.outletChannels;

    inlets_.reserve(layout.numInlets);
    for (size_t i = 0; i < layout.numInlets; ++i) {
        inlets_.emplace_back(inletChannels, config.blockSize);
    }
    outlets_.reserve(layout.numOutlets);
    for (size_t i = 0; i < layout.numOutlets; ++i) {
        outlets_.emplace_back(outletChannels, config.blockSize);
    }
}

Node::~Node() = default;

// =============================================================================
// Ports
// =============================================================================

Port Node::inlet(size_t index) noexcept {
    Port port;
    port.node = index < inlets_.size() ? this : nullptr;
    port.direction = PortDirection::Input;
    port.kind = PortKind::Signal;
    port.index = index;
    return port;
}

Port Node::outlet(size_t index) noexcept {
    Port port;
    port.node = index < outlets_.size() ? this : nullptr;
    port.direction = PortDirection::Output;
    port.kind = PortKind::Signal;
    port.index = index;
    return port;
}

Port Node::paramPort(std::string_view name) noexcept {
    Port port;
    port.node = this;
    port.direction = PortDirection::Input;
    port.kind = PortKind::Parameter;
    port.parameter = params_.find(name);
    return port;
}

// =============================================================================
// Connections
// =============================================================================

Node* Node::connect(Node& target, size_t outIndex, size_t inIndex) {
    return graph_.connectNodes(*this, outIndex, target, inIndex) ? &target : nullptr;
}

Node* Node::connect(ControlParameter& parameter, size_t outIndex) {
    return graph_.connectParameter(*this, outIndex, parameter) ? this : nullptr;
}

Node* Node::connect(const Port& target, size_t outIndex) {
    if (!target.isValid()) {
        LOG_ERROR("graph", errorName(EngineError::ConnectionError), name_, "-> invalid port");
        return nullptr;
    }
    if (target.direction == PortDirection::Output) {
        LOG_ERROR("graph", errorName(EngineError::ConnectionError), name_,
                  "-> output port of", target.node->name(), "(incompatible port kind)");
        return nullptr;
    }
    if (target.kind == PortKind::Parameter) {
        return connect(*target.parameter, outIndex);
    }
    return connect(*target.node, outIndex, target.index);
}

size_t Node::disconnect() {
    return graph_.disconnectAll(*this);
}

size_t Node::disconnect(Node& target) {
    return graph_.disconnectNode(*this, target);
}

size_t Node::disconnect(ControlParameter& parameter) {
    return graph_.disconnectParameter(*this, parameter);
}

// =============================================================================
// Parameters
// =============================================================================

ControlParameter* Node::param(std::string_view name) {
    ControlParameter* found = params_.find(name);
    if (found == nullptr && !isInitialized()) {
        LOG_WARN("node", errorName(EngineError::StateError), name_, "is not initialized; no parameter", name);
    }
    return found;
}

bool Node::set(std::string_view name, float value, double timeConstant) {
    if (!isInitialized() && !params_.contains(name)) {
        LOG_WARN("node", errorName(EngineError::StateError), name_, "is not initialized; cannot set", name);
        return false;
    }
    return params_.set(name, value, graph_.currentTime(), timeConstant);
}

bool Node::setNormalized(std::string_view name, float normalized, double timeConstant) {
    if (!isInitialized() && !params_.contains(name)) {
        LOG_WARN("node", errorName(EngineError::StateError), name_, "is not initialized; cannot set", name);
        return false;
    }
    return params_.setNormalized(name, normalized, graph_.currentTime(), timeConstant);
}

std::optional<float> Node::get(std::string_view name) const {
    return params_.get(name);
}

bool Node::ownsParameter(const ControlParameter* parameter) const noexcept {
    if (parameter == nullptr) return false;
    for (const auto& owned : params_.all()) {
        if (owned.get() == parameter) return true;
    }
    return false;
}

void Node::scale(float gain) {
    if (DSP::detail::isNaN(gain)) {
        LOG_WARN("node", name_, "ignoring NaN output gain");
        return;
    }
    outputGain_ = gain;
}

// =============================================================================
// Source Scheduling
// =============================================================================

bool Node::start(double when) {
    if (processor_ && processor_->start(when)) return true;
    LOG_WARN("node", name_, "cannot be started");
    return false;
}

bool Node::stop(double when) {
    if (processor_ && processor_->stop(when)) return true;
    LOG_WARN("node", name_, "cannot be stopped");
    return false;
}

// =============================================================================
// Events
// =============================================================================

ListenerId Node::listen(NodeEvent event, Listener listener, bool once) {
    if (!listener) return kNoListener;

    if (isInitialized() && event == NodeEvent::Init) {
        notify(listener);
        if (once) return kNoListener;
    }

    const ListenerId id = nextListenerId_++;
    listeners_.push_back({id, event, std::move(listener), once});
    return id;
}

bool Node::removeListener(ListenerId id) {
    const auto it = std::find_if(listeners_.begin(), listeners_.end(),
                                 [id](const Subscription& s) { return s.id == id; });
    if (it == listeners_.end()) return false;
    listeners_.erase(it);
    return true;
}

void Node::trigger(NodeEvent event) {
    // Listeners may subscribe or unsubscribe while being notified.
    const std::vector<Subscription> snapshot = listeners_;
    for (const auto& subscription : snapshot) {
        if (subscription.event == event) notify(subscription.listener);
    }
    listeners_.erase(std::remove_if(listeners_.begin(), listeners_.end(),
                                    [event](const Subscription& s) { return s.event == event && s.once; }),
                     listeners_.end());
}

void Node::notify(const Listener& listener) {
    struct DepthGuard {
        int& depth;
        explicit DepthGuard(int& d) : depth(d) { ++depth; }
        ~DepthGuard() { --depth; }
    } guard(notifyDepth_);
    listener(*this);
}

// =============================================================================
// Graph Internals
// =============================================================================

void Node::beginPendingInit() noexcept {
    if (lifecycle_ == Lifecycle::Constructed) lifecycle_ = Lifecycle::PendingInit;
}

void Node::completeInit(std::unique_ptr<NodeProcessor> processor) {
    if (isInitialized()) return;

    const EngineConfig& config = graph_.config();
    processor_ = std::move(processor);
    if (processor_) {
        processor_->prepare(config.sampleRate, config.blockSize);
        for (const auto& descriptor : processor_->parameterDescriptors(config.sampleRate)) {
            paramOrder_.push_back(&params_.add(descriptor));
        }
    }

    lifecycle_ = Lifecycle::Initialized;
    LOG_DEBUG("node", name_, "initialized with", paramOrder_.size(), "parameters");
    trigger(NodeEvent::Init);
}

void Node::completeInitWithoutProcessor() {
    completeInit(nullptr);
}

void Node::clearInputs() noexcept {
    for (auto& bus : inlets_) bus.clear();
}

void Node::beginParameterBlock(double startTime, double sampleRate, size_t numFrames) noexcept {
    for (ControlParameter* parameter : paramOrder_) {
        parameter->beginBlock(startTime, sampleRate, numFrames);
    }
}

void Node::endParameterBlock() noexcept {
    for (ControlParameter* parameter : paramOrder_) {
        parameter->endBlock();
    }
}

void Node::process(double blockStartTime, double sampleRate, size_t numFrames) noexcept {
    if (!processor_) {
        for (auto& bus : outlets_) bus.clear();
        return;
    }

    ProcessContext context;
    context.inputs = inlets_;
    context.outputs = outlets_;
    context.parameters = paramOrder_;
    context.numFrames = numFrames;
    context.sampleRate = sampleRate;
    context.blockStartTime = blockStartTime;
    processor_->process(context);

    if (outputGain_ != 1.0f) {
        for (auto& bus : outlets_) bus.applyGain(outputGain_);
    }
}

} // namespace Patchwork::Engine
