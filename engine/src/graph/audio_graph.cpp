#include "graph/audio_graph.h"

#include "core/engine_error.h"
#include "nodes/effect_processor.h"
#include "nodes/kernel_processors.h"
#include "nodes/source_processors.h"
#include "nodes/stereo_processors.h"
#include "providers/builtin_primitive_provider.h"

#include <failsafe/failsafe.hh>

#include <patchwork/dsp/primitives/envelope_generator.h>

#include <algorithm>
#include <functional>
#include <queue>
#include <string>
#include <unordered_map>
#include <utility>

namespace Patchwork::Engine {

AudioGraph::AudioGraph(const EngineConfig& config, std::unique_ptr<PrimitiveProvider> provider)
    : config_(config.validated())
    , provider_(std::move(provider))
{
    if (!provider_) {
        provider_ = std::make_unique<BuiltinPrimitiveProvider>();
    }

    Node& output = addNode(NodeKind::Destination, kernelLayout(NodeKind::Destination));
    output.completeInitWithoutProcessor();

    registerBuiltinModules();
    LOG_INFO("graph", "created:", config_.sampleRate, "Hz,", config_.blockSize, "frames,",
             config_.channels, "channels,", moduleLoadingName(config_.moduleLoading), "module loading");
}

AudioGraph::~AudioGraph() = default;

double AudioGraph::currentTime() const noexcept {
    return static_cast<double>(framesRendered_) / config_.sampleRate;
}

// =============================================================================
// Modules
// =============================================================================

void AudioGraph::registerBuiltinModules() {
    for (std::string_view module : kBuiltinModules) {
        registry_.registerModule(std::string(module), [this](ModuleRegistry::Resolver resolve) {
            if (config_.moduleLoading == ModuleLoading::Immediate) {
                resolve();
            } else {
                deferredResolvers_.push_back(std::move(resolve));
            }
        });
    }
}

size_t AudioGraph::resolveDeferredModules() {
    std::vector<ModuleRegistry::Resolver> resolvers = std::move(deferredResolvers_);
    deferredResolvers_.clear();
    for (auto& resolve : resolvers) {
        resolve();
    }
    if (!resolvers.empty()) {
        LOG_INFO("graph", "resolved", resolvers.size(), "deferred modules");
    }
    return resolvers.size();
}

// =============================================================================
// Node Creation
// =============================================================================

Node& AudioGraph::addNode(NodeKind kind, const NodeLayout& layout, std::string_view label) {
    releaseRetiredNodes();
    const NodeId id = nextNodeId_++;
    std::string name(label.empty() ? nodeKindName(kind) : label);
    name += '#';
    name += std::to_string(id);

    nodes_.push_back(std::make_unique<Node>(*this, id, kind, std::move(name), layout));
    Node& node = *nodes_.back();
    rebuildSchedule();
    LOG_DEBUG("graph", "created", node.name());
    return node;
}

Node& AudioGraph::createDisabled(std::string_view what, const NodeLayout& layout) {
    LOG_ERROR("graph", errorName(EngineError::ConfigurationError), what, "- substituting a disabled node");
    Node& node = addNode(NodeKind::Disabled, layout);
    node.completeInitWithoutProcessor();
    return node;
}

Node& AudioGraph::createKernelNode(NodeKind kind, const NodeLayout& layout,
                                   std::vector<std::string_view> requiredModules, ProcessorFactory factory) {
    Node& node = addNode(kind, layout);
    node.beginPendingInit();

    // One continuation per module; the last one to fire builds the processor.
    const NodeId id = node.id();
    auto remaining = std::make_shared<size_t>(requiredModules.size());
    auto sharedFactory = std::make_shared<ProcessorFactory>(std::move(factory));
    for (std::string_view module : requiredModules) {
        const RequestStatus status = registry_.request(module, [this, id, remaining, sharedFactory]() {
            if (*remaining > 0 && --*remaining == 0) {
                finishInit(id, *sharedFactory);
            }
        });
        if (status == RequestStatus::Queued) {
            LOG_DEBUG("graph", node.name(), "waiting for module", module);
        }
    }
    return node;
}

void AudioGraph::finishInit(NodeId id, const ProcessorFactory& factory) {
    Node* node = findNode(id);
    if (node == nullptr) {
        LOG_DEBUG("graph", "node", id, "was removed before its modules loaded");
        return;
    }
    node->completeInit(factory());
    releaseRetiredNodes();
}

Node& AudioGraph::createSignalMath(DSP::SignalOp op) {
    return createKernelNode(NodeKind::SignalMath, kernelLayout(NodeKind::SignalMath), {kSignalMathModule},
                            [op]() { return std::make_unique<SignalMathProcessor>(op); });
}

Node& AudioGraph::createSignalMath(std::string_view op) {
    const auto parsed = DSP::parseSignalOp(op);
    if (!parsed) {
        return createDisabled("unknown signal-math operator '" + std::string(op) + "'",
                              kernelLayout(NodeKind::SignalMath));
    }
    return createSignalMath(*parsed);
}

Node& AudioGraph::createCrossfade(DSP::CrossfadeCurve curve) {
    return createKernelNode(NodeKind::Crossfade, kernelLayout(NodeKind::Crossfade), {kCrossfadeModule},
                            [curve]() { return std::make_unique<CrossfadeProcessor>(curve); });
}

Node& AudioGraph::createMix2() {
    return createKernelNode(NodeKind::Mix2, kernelLayout(NodeKind::Mix2), {kMix2Module},
                            []() { return std::make_unique<Mix2Processor>(); });
}

Node& AudioGraph::createMix4() {
    return createKernelNode(NodeKind::Mix4, kernelLayout(NodeKind::Mix4), {kMix4Module},
                            []() { return std::make_unique<Mix4Processor>(); });
}

Node& AudioGraph::createStateVariableFilter() {
    return createKernelNode(NodeKind::StateVariableFilter, kernelLayout(NodeKind::StateVariableFilter),
                            {kStateVariableFilterModule},
                            []() { return std::make_unique<StateVariableFilterProcessor>(); });
}

Node& AudioGraph::createFeedbackOscillator() {
    return createKernelNode(NodeKind::FeedbackOscillator, kernelLayout(NodeKind::FeedbackOscillator),
                            {kFeedbackOscillatorModule},
                            []() { return std::make_unique<FeedbackOscillatorProcessor>(); });
}

Node& AudioGraph::createEnvelope(std::string_view type) {
    auto parsed = DSP::parseEnvelopeType(type);
    if (!parsed) {
        LOG_WARN("graph", errorName(EngineError::ConfigurationError), "unknown envelope type", type,
                 "- using adsr");
        parsed = DSP::EnvelopeType::ADSR;
    }
    const DSP::EnvelopeType envelopeType = *parsed;
    return createKernelNode(NodeKind::EnvelopeGenerator, kernelLayout(NodeKind::EnvelopeGenerator),
                            {kEnvelopeGeneratorModule},
                            [envelopeType]() { return std::make_unique<EnvelopeGeneratorProcessor>(envelopeType); });
}

Node& AudioGraph::createNativeNode(NodeKind kind, std::unique_ptr<NodeProcessor> processor) {
    Node& node = addNode(kind, kernelLayout(kind));
    node.completeInit(std::move(processor));
    return node;
}

Node& AudioGraph::createOscillator(std::string_view shape, float frequency) {
    const auto waveform = DSP::parseOscWaveform(shape);
    if (!waveform) {
        return createDisabled("unknown oscillator shape '" + std::string(shape) + "'",
                              provider_->layout(PrimitiveType::Oscillator));
    }
    if (*waveform == DSP::OscWaveform::Pulse) return createPulseOscillator(frequency);

    PrimitiveOptions options;
    options.frequency = frequency;
    options.waveform = *waveform;
    return createPrimitive(PrimitiveType::Oscillator, options);
}

Node& AudioGraph::createPulseOscillator(float frequency, float width) {
    return createNativeNode(NodeKind::PulseOscillator,
                            std::make_unique<OscillatorProcessor>(DSP::OscWaveform::Pulse, frequency, width));
}

Node& AudioGraph::createStereoSplitter() {
    return createNativeNode(NodeKind::StereoSplitter, std::make_unique<StereoSplitterProcessor>());
}

Node& AudioGraph::createStereoMerger() {
    return createNativeNode(NodeKind::StereoMerger, std::make_unique<StereoMergerProcessor>());
}

Node& AudioGraph::createMonoToStereo() {
    return createNativeNode(NodeKind::MonoToStereo, std::make_unique<MonoToStereoProcessor>());
}

Node& AudioGraph::createReverb(uint32_t seed) {
    const size_t channels = config_.channels;
    return createKernelNode(NodeKind::Effect, {1, 1, 0, 0}, {kCrossfadeModule, kMix4Module},
                            [seed, channels]() {
                                return std::make_unique<EffectProcessor>(std::make_unique<ReverbProcessor>(seed),
                                                                         channels);
                            });
}

Node& AudioGraph::createDistortion() {
    const size_t channels = config_.channels;
    return createKernelNode(NodeKind::Effect, {1, 1, 0, 0}, {kCrossfadeModule}, [channels]() {
        return std::make_unique<EffectProcessor>(std::make_unique<DistortionProcessor>(), channels);
    });
}

Node& AudioGraph::createPrimitive(PrimitiveType type, const PrimitiveOptions& options) {
    const NodeLayout layout = provider_->layout(type);
    std::unique_ptr<NodeProcessor> processor = provider_->create(type, options);
    if (!processor) {
        return createDisabled("unsupported primitive '" + std::string(primitiveTypeName(type)) + "'", layout);
    }
    Node& node = addNode(NodeKind::Primitive, layout, primitiveTypeName(type));
    node.completeInit(std::move(processor));
    return node;
}

Node& AudioGraph::createKernel(std::string_view module, std::string_view variant) {
    if (module == kSignalMathModule) return createSignalMath(variant);
    if (module == kCrossfadeModule) {
        if (variant.empty()) return createCrossfade();
        const auto curve = DSP::parseCrossfadeCurve(variant);
        if (!curve) {
            return createDisabled("unknown crossfade curve '" + std::string(variant) + "'",
                                  kernelLayout(NodeKind::Crossfade));
        }
        return createCrossfade(*curve);
    }
    if (module == kMix2Module) return createMix2();
    if (module == kMix4Module) return createMix4();
    if (module == kStateVariableFilterModule) return createStateVariableFilter();
    if (module == kFeedbackOscillatorModule) return createFeedbackOscillator();
    if (module == kEnvelopeGeneratorModule) return createEnvelope(variant.empty() ? "adsr" : variant);

    return createDisabled("unknown kernel module '" + std::string(module) + "'", {1, 1, 0, 0});
}

bool AudioGraph::removeNode(Node& node) {
    if (&node == nodes_.front().get()) {
        LOG_WARN("graph", "the destination node cannot be removed");
        return false;
    }
    if (!ownsNode(node)) {
        LOG_WARN("graph", node.name(), "does not belong to this graph");
        return false;
    }

    Node* target = &node;
    signalEdges_.erase(std::remove_if(signalEdges_.begin(), signalEdges_.end(),
                                      [target](const SignalEdge& e) {
                                          return e.source == target || e.target == target;
                                      }),
                       signalEdges_.end());
    paramEdges_.erase(std::remove_if(paramEdges_.begin(), paramEdges_.end(),
                                     [target](const ParamEdge& e) {
                                         return e.source == target || e.owner == target;
                                     }),
                      paramEdges_.end());
    taps_.erase(std::remove_if(taps_.begin(), taps_.end(),
                               [target](const TapEntry& t) { return t.node == target; }),
                taps_.end());

    LOG_DEBUG("graph", "removing", node.name());
    const auto it = std::find_if(nodes_.begin(), nodes_.end(),
                                 [target](const std::unique_ptr<Node>& n) { return n.get() == target; });
    if (target->isNotifying()) {
        retired_.push_back(std::move(*it));
    }
    nodes_.erase(it);
    rebuildSchedule();
    return true;
}

void AudioGraph::releaseRetiredNodes() noexcept {
    retired_.erase(std::remove_if(retired_.begin(), retired_.end(),
                                  [](const std::unique_ptr<Node>& n) { return !n->isNotifying(); }),
                   retired_.end());
}

Node* AudioGraph::findNode(NodeId id) const noexcept {
    for (const auto& node : nodes_) {
        if (node->id() == id) return node.get();
    }
    return nullptr;
}

bool AudioGraph::ownsNode(const Node& node) const noexcept {
    return std::any_of(nodes_.begin(), nodes_.end(),
                       [&node](const std::unique_ptr<Node>& n) { return n.get() == &node; });
}

Node* AudioGraph::parameterOwner(const ControlParameter& parameter) const noexcept {
    for (const auto& node : nodes_) {
        if (node->ownsParameter(&parameter)) return node.get();
    }
    return nullptr;
}

std::vector<NodeId> AudioGraph::renderOrder() const {
    std::vector<NodeId> order;
    order.reserve(schedule_.size());
    for (const auto& entry : schedule_) order.push_back(entry.node->id());
    return order;
}

// =============================================================================
// Wiring
// =============================================================================

bool AudioGraph::connectNodes(Node& source, size_t outIndex, Node& target, size_t inIndex) {
    const auto error = errorName(EngineError::ConnectionError);
    if (!ownsNode(source) || !ownsNode(target)) {
        LOG_ERROR("graph", error, source.name(), "->", target.name(), "crosses graphs");
        return false;
    }
    if (source.numOutlets() == 0) {
        LOG_ERROR("graph", error, source.name(), "has no outlet");
        return false;
    }
    if (outIndex >= source.numOutlets()) {
        LOG_ERROR("graph", error, source.name(), "has no outlet", outIndex);
        return false;
    }
    if (inIndex >= target.numInlets()) {
        LOG_ERROR("graph", error, target.name(), "has no inlet", inIndex);
        return false;
    }

    const bool duplicate = std::any_of(signalEdges_.begin(), signalEdges_.end(), [&](const SignalEdge& e) {
        return e.source == &source && e.outIndex == outIndex && e.target == &target && e.inIndex == inIndex;
    });
    if (duplicate) {
        LOG_DEBUG("graph", "ignoring duplicate edge", source.name(), "->", target.name());
        return true;
    }

    signalEdges_.push_back({&source, outIndex, &target, inIndex});
    rebuildSchedule();
    LOG_DEBUG("graph", "connected", source.name(), outIndex, "->", target.name(), inIndex);
    return true;
}

bool AudioGraph::connectParameter(Node& source, size_t outIndex, ControlParameter& parameter) {
    const auto error = errorName(EngineError::ConnectionError);
    if (!ownsNode(source)) {
        LOG_ERROR("graph", error, source.name(), "does not belong to this graph");
        return false;
    }
    if (source.numOutlets() == 0) {
        LOG_ERROR("graph", error, source.name(), "has no outlet");
        return false;
    }
    if (outIndex >= source.numOutlets()) {
        LOG_ERROR("graph", error, source.name(), "has no outlet", outIndex);
        return false;
    }
    Node* owner = parameterOwner(parameter);
    if (owner == nullptr) {
        LOG_ERROR("graph", error, "parameter", parameter.name(), "is not owned by a node of this graph");
        return false;
    }

    const bool duplicate = std::any_of(paramEdges_.begin(), paramEdges_.end(), [&](const ParamEdge& e) {
        return e.source == &source && e.outIndex == outIndex && e.parameter == &parameter;
    });
    if (duplicate) {
        LOG_DEBUG("graph", "ignoring duplicate edge", source.name(), "->", parameter.name());
        return true;
    }

    paramEdges_.push_back({&source, outIndex, &parameter, owner});
    rebuildSchedule();
    LOG_DEBUG("graph", "connected", source.name(), outIndex, "->", owner->name(), parameter.name());
    return true;
}

size_t AudioGraph::disconnectAll(Node& source) {
    const size_t before = edgeCount();
    Node* src = &source;
    signalEdges_.erase(std::remove_if(signalEdges_.begin(), signalEdges_.end(),
                                      [src](const SignalEdge& e) { return e.source == src; }),
                       signalEdges_.end());
    paramEdges_.erase(std::remove_if(paramEdges_.begin(), paramEdges_.end(),
                                     [src](const ParamEdge& e) { return e.source == src; }),
                      paramEdges_.end());
    const size_t removed = before - edgeCount();
    if (removed > 0) rebuildSchedule();
    return removed;
}

size_t AudioGraph::disconnectNode(Node& source, Node& target) {
    const size_t before = signalEdges_.size();
    Node* src = &source;
    Node* dst = &target;
    signalEdges_.erase(std::remove_if(signalEdges_.begin(), signalEdges_.end(),
                                      [src, dst](const SignalEdge& e) {
                                          return e.source == src && e.target == dst;
                                      }),
                       signalEdges_.end());
    const size_t removed = before - signalEdges_.size();
    if (removed > 0) rebuildSchedule();
    return removed;
}

size_t AudioGraph::disconnectParameter(Node& source, ControlParameter& parameter) {
    const size_t before = paramEdges_.size();
    Node* src = &source;
    ControlParameter* param = &parameter;
    paramEdges_.erase(std::remove_if(paramEdges_.begin(), paramEdges_.end(),
                                     [src, param](const ParamEdge& e) {
                                         return e.source == src && e.parameter == param;
                                     }),
                      paramEdges_.end());
    const size_t removed = before - paramEdges_.size();
    if (removed > 0) rebuildSchedule();
    return removed;
}

// =============================================================================
// Schedule
// =============================================================================

void AudioGraph::rebuildSchedule() {
    const size_t count = nodes_.size();
    std::unordered_map<const Node*, size_t> index;
    index.reserve(count);
    for (size_t i = 0; i < count; ++i) index.emplace(nodes_[i].get(), i);

    std::vector<std::vector<size_t>> successors(count);
    std::vector<size_t> inDegree(count, 0);
    auto addDependency = [&](const Node* from, const Node* to) {
        const size_t f = index.at(from);
        const size_t t = index.at(to);
        successors[f].push_back(t);
        ++inDegree[t];
    };
    for (const auto& edge : signalEdges_) addDependency(edge.source, edge.target);
    for (const auto& edge : paramEdges_) addDependency(edge.source, edge.owner);

    // Kahn's algorithm; ties resolve in creation order.
    std::priority_queue<size_t, std::vector<size_t>, std::greater<>> ready;
    for (size_t i = 0; i < count; ++i) {
        if (inDegree[i] == 0) ready.push(i);
    }

    std::vector<size_t> order;
    order.reserve(count);
    std::vector<bool> placed(count, false);
    while (!ready.empty()) {
        const size_t current = ready.top();
        ready.pop();
        order.push_back(current);
        placed[current] = true;
        for (size_t next : successors[current]) {
            if (--inDegree[next] == 0) ready.push(next);
        }
    }

    const size_t acyclic = order.size();
    for (size_t i = 0; i < count; ++i) {
        if (!placed[i]) order.push_back(i);
    }
    if (order.size() > acyclic) {
        LOG_DEBUG("graph", order.size() - acyclic, "nodes on feedback cycles read the previous block");
    }

    schedule_.clear();
    schedule_.reserve(count);
    for (size_t i : order) {
        ScheduledNode entry;
        entry.node = nodes_[i].get();
        for (const auto& edge : signalEdges_) {
            if (edge.target == entry.node) {
                entry.inputs.push_back({&edge.source->outputBus(edge.outIndex), edge.inIndex});
            }
        }
        for (const auto& edge : paramEdges_) {
            if (edge.owner == entry.node) {
                entry.params.push_back({&edge.source->outputBus(edge.outIndex), edge.parameter});
            }
        }
        schedule_.push_back(std::move(entry));
    }
}

// =============================================================================
// Visualization
// =============================================================================

TapId AudioGraph::attachTap(Node& node, size_t outIndex, VisualizationTap& tap) {
    if (!ownsNode(node)) {
        LOG_ERROR("graph", errorName(EngineError::ConnectionError), node.name(), "does not belong to this graph");
        return kInvalidTap;
    }
    const bool valid = node.numOutlets() == 0 ? (outIndex == 0 && node.numInlets() > 0)
                                              : outIndex < node.numOutlets();
    if (!valid) {
        LOG_ERROR("graph", errorName(EngineError::ConnectionError), node.name(), "has no outlet", outIndex);
        return kInvalidTap;
    }
    const TapId id = nextTapId_++;
    taps_.push_back({id, &node, outIndex, &tap});
    return id;
}

bool AudioGraph::detachTap(TapId id) {
    const auto it = std::find_if(taps_.begin(), taps_.end(), [id](const TapEntry& t) { return t.id == id; });
    if (it == taps_.end()) return false;
    taps_.erase(it);
    return true;
}

// =============================================================================
// Rendering
// =============================================================================

void AudioGraph::renderBlock(float* const* outputs, size_t numChannels) noexcept {
    const size_t frames = config_.blockSize;
    const double sampleRate = config_.sampleRate;
    const double blockStart = currentTime();

    for (auto& entry : schedule_) {
        Node& node = *entry.node;
        node.clearInputs();
        for (const auto& link : entry.inputs) {
            node.inputBus(link.inIndex).accumulate(*link.source);
        }

        node.beginParameterBlock(blockStart, sampleRate, frames);
        for (const auto& link : entry.params) {
            link.parameter->addModulation(*link.source);
        }
        node.endParameterBlock();

        node.process(blockStart, sampleRate, frames);
    }

    for (const auto& entry : taps_) {
        const AudioBus& bus = entry.node->numOutlets() == 0 ? entry.node->inputBus(0)
                                                            : entry.node->outputBus(entry.outIndex);
        entry.tap->onBlock(bus, blockStart);
    }

    if (outputs != nullptr) {
        const AudioBus& master = destination().inputBus(0);
        const bool downmix = numChannels == 1 && master.numChannels() > 1;
        for (size_t ch = 0; ch < numChannels; ++ch) {
            float* dst = outputs[ch];
            if (dst == nullptr) continue;
            if (downmix) {
                for (size_t i = 0; i < frames; ++i) dst[i] = master.monoSample(i);
                continue;
            }
            const float* src = master.numChannels() == 1 ? master.channel(0) : master.channel(ch);
            if (src != nullptr) {
                std::copy_n(src, frames, dst);
            } else {
                std::fill_n(dst, frames, 0.0f);
            }
        }
    }

    framesRendered_ += frames;
}

} // namespace Patchwork::Engine
