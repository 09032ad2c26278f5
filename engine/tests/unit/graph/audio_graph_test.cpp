// ==============================================================================
// Engine Tests - AudioGraph
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "graph/audio_graph.h"
#include "nodes/kernel_processors.h"
#include "taps/scope_tap.h"

#include <algorithm>
#include <array>
#include <cstdint>
#include <memory>
#include <string_view>
#include <vector>

using namespace Patchwork::Engine;
using Catch::Approx;

namespace {

constexpr size_t kBlock = 32;
constexpr double kSampleRate = 48000.0;

EngineConfig testConfig(size_t channels = 2, ModuleLoading loading = ModuleLoading::Immediate) {
    return EngineConfig{.sampleRate = kSampleRate, .blockSize = kBlock, .channels = channels, .moduleLoading = loading};
}

struct OutputBuffers {
    explicit OutputBuffers(size_t channels)
        : data(channels, std::vector<float>(kBlock, -1.0f)) {
        for (auto& channel : data) ptrs.push_back(channel.data());
    }

    std::vector<std::vector<float>> data;
    std::vector<float*> ptrs;
};

size_t positionOf(const std::vector<NodeId>& order, NodeId id) {
    return static_cast<size_t>(std::find(order.begin(), order.end(), id) - order.begin());
}

/// Provider that supports nothing.
class EmptyProvider final : public PrimitiveProvider {
public:
    std::unique_ptr<NodeProcessor> create(PrimitiveType, const PrimitiveOptions&) override { return nullptr; }
    NodeLayout layout(PrimitiveType) const override { return {1, 1, 0, 0}; }
};

} // namespace

// ==============================================================================
// Construction
// ==============================================================================

TEST_CASE("AudioGraph starts with only the destination", "[audio_graph][engine]") {
    AudioGraph graph;
    REQUIRE(graph.sampleRate() == 44100.0);
    REQUIRE(graph.blockSize() == 128);
    REQUIRE(graph.channels() == 2);
    REQUIRE(graph.nodeCount() == 1);
    REQUIRE(graph.edgeCount() == 0);

    Node& destination = graph.destination();
    REQUIRE(destination.id() == 0);
    REQUIRE(destination.kind() == NodeKind::Destination);
    REQUIRE(destination.isInitialized());
    REQUIRE(destination.numInlets() == 1);
    REQUIRE(destination.numOutlets() == 0);
    REQUIRE(graph.findNode(0) == &destination);
    REQUIRE(graph.findNode(99) == nullptr);
}

TEST_CASE("AudioGraph validates its configuration", "[audio_graph][engine]") {
    AudioGraph graph(EngineConfig{.sampleRate = 1.0, .blockSize = 0, .channels = 99});
    REQUIRE(graph.sampleRate() == kMinSampleRate);
    REQUIRE(graph.blockSize() == kMinBlockSize);
    REQUIRE(graph.channels() == kMaxChannels);
}

// ==============================================================================
// End-to-End Rendering
// ==============================================================================

TEST_CASE("AudioGraph renders max of two constants", "[audio_graph][render][engine]") {
    AudioGraph graph(testConfig());
    Node& three = graph.createPrimitive(PrimitiveType::Constant, {.value = 3.0f});
    Node& four = graph.createPrimitive(PrimitiveType::Constant, {.value = 4.0f});
    Node& max = graph.createSignalMath("max");
    REQUIRE(max.kind() == NodeKind::SignalMath);

    REQUIRE(three.connect(max, 0, 0) == &max);
    REQUIRE(four.connect(max, 0, 1) == &max);
    REQUIRE(max.connect(graph.destination()) == &graph.destination());

    OutputBuffers out(2);
    graph.renderBlock(out.ptrs.data(), 2);
    for (const auto& channel : out.data) {
        for (float s : channel) REQUIRE(s == 4.0f);
    }
}

TEST_CASE("AudioGraph sums fan-in at an inlet", "[audio_graph][render][engine]") {
    AudioGraph graph(testConfig());
    Node& a = graph.createPrimitive(PrimitiveType::Constant, {.value = 0.25f});
    Node& b = graph.createPrimitive(PrimitiveType::Constant, {.value = 0.5f});
    a.connect(graph.destination());
    b.connect(graph.destination());

    OutputBuffers out(2);
    graph.renderBlock(out.ptrs.data(), 2);
    REQUIRE(out.data[0][0] == Approx(0.75f));
    REQUIRE(out.data[1][kBlock - 1] == Approx(0.75f));
}

TEST_CASE("AudioGraph adapts the destination to the output channels", "[audio_graph][render][engine]") {
    SECTION("stereo master down-mixes into a mono output") {
        AudioGraph graph(testConfig());
        Node& constant = graph.createPrimitive(PrimitiveType::Constant, {.value = 0.5f});
        Node& gain = graph.createPrimitive(PrimitiveType::Gain, {.value = 2.0f});
        constant.connect(gain)->connect(graph.destination());

        OutputBuffers out(1);
        graph.renderBlock(out.ptrs.data(), 1);
        REQUIRE(out.data[0][0] == Approx(1.0f));
        REQUIRE(out.data[0][kBlock - 1] == Approx(1.0f));
    }

    SECTION("mono master is copied to every output channel") {
        AudioGraph graph(testConfig(1));
        Node& constant = graph.createPrimitive(PrimitiveType::Constant, {.value = 0.5f});
        constant.connect(graph.destination());

        OutputBuffers out(3);
        graph.renderBlock(out.ptrs.data(), 3);
        for (const auto& channel : out.data) {
            REQUIRE(channel.front() == 0.5f);
            REQUIRE(channel.back() == 0.5f);
        }
    }

    SECTION("output channels beyond the master are zeroed") {
        AudioGraph graph(testConfig(2));
        Node& constant = graph.createPrimitive(PrimitiveType::Constant, {.value = 0.5f});
        constant.connect(graph.destination());

        OutputBuffers out(4);
        graph.renderBlock(out.ptrs.data(), 4);
        REQUIRE(out.data[1][0] == 0.5f);
        REQUIRE(out.data[2][0] == 0.0f);
        REQUIRE(out.data[3][kBlock - 1] == 0.0f);
    }

    SECTION("a null output pointer set still advances time") {
        AudioGraph graph(testConfig());
        graph.renderBlock(nullptr, 0);
        REQUIRE(graph.framesRendered() == kBlock);
    }
}

TEST_CASE("AudioGraph time advances per block", "[audio_graph][render][engine]") {
    AudioGraph graph(testConfig());
    REQUIRE(graph.currentTime() == 0.0);

    OutputBuffers out(2);
    for (int i = 0; i < 3; ++i) graph.renderBlock(out.ptrs.data(), 2);
    REQUIRE(graph.framesRendered() == 3 * kBlock);
    REQUIRE(graph.currentTime() == Approx(3.0 * kBlock / kSampleRate));
}

TEST_CASE("AudioGraph schedules parameter events on graph time", "[audio_graph][render][engine]") {
    AudioGraph graph(testConfig());
    Node& constant = graph.createPrimitive(PrimitiveType::Constant, {.value = 0.0f});
    constant.connect(graph.destination());

    // Frame 40 lies in the second block
    REQUIRE(constant.param("offset")->setValueAtTime(1.0f, 40.5 / kSampleRate));

    OutputBuffers out(2);
    graph.renderBlock(out.ptrs.data(), 2);
    REQUIRE(out.data[0][kBlock - 1] == 0.0f);
    graph.renderBlock(out.ptrs.data(), 2);
    REQUIRE(out.data[0][40 - kBlock] == 0.0f);
    REQUIRE(out.data[0][41 - kBlock] == 1.0f);
}

TEST_CASE("AudioGraph modulates parameters from node outlets", "[audio_graph][render][engine]") {
    AudioGraph graph(testConfig());
    Node& carrier = graph.createPrimitive(PrimitiveType::Constant, {.value = 1.0f});
    Node& modulator = graph.createPrimitive(PrimitiveType::Constant, {.value = 0.5f});
    Node& gain = graph.createPrimitive(PrimitiveType::Gain, {.value = 1.0f});

    carrier.connect(gain);
    REQUIRE(modulator.connect(gain.paramPort("gain")) == &modulator);
    gain.connect(graph.destination());

    OutputBuffers out(2);
    graph.renderBlock(out.ptrs.data(), 2);
    REQUIRE(out.data[0][0] == Approx(1.5f));

    REQUIRE(modulator.disconnect(*gain.param("gain")) == 1);
    graph.renderBlock(out.ptrs.data(), 2);
    REQUIRE(out.data[0][0] == Approx(1.0f));
}

// ==============================================================================
// Schedule
// ==============================================================================

TEST_CASE("AudioGraph orders sources before consumers", "[audio_graph][schedule][engine]") {
    AudioGraph graph(testConfig());
    // Created consumer-first so creation order alone would be wrong
    Node& gain = graph.createPrimitive(PrimitiveType::Gain);
    Node& filter = graph.createStateVariableFilter();
    Node& osc = graph.createFeedbackOscillator();

    osc.connect(filter)->connect(gain)->connect(graph.destination());

    const auto order = graph.renderOrder();
    REQUIRE(order.size() == graph.nodeCount());
    REQUIRE(positionOf(order, osc.id()) < positionOf(order, filter.id()));
    REQUIRE(positionOf(order, filter.id()) < positionOf(order, gain.id()));
    REQUIRE(positionOf(order, gain.id()) < positionOf(order, graph.destination().id()));
}

TEST_CASE("AudioGraph tolerates feedback cycles", "[audio_graph][schedule][engine]") {
    AudioGraph graph(testConfig());
    Node& source = graph.createPrimitive(PrimitiveType::Constant, {.value = 0.5f});
    Node& a = graph.createPrimitive(PrimitiveType::Gain, {.value = 0.5f});
    Node& b = graph.createPrimitive(PrimitiveType::Gain, {.value = 1.0f});

    source.connect(a);
    a.connect(b);
    REQUIRE(b.connect(a) == &a);
    b.connect(graph.destination());

    const auto order = graph.renderOrder();
    REQUIRE(order.size() == graph.nodeCount());

    OutputBuffers out(2);
    for (int i = 0; i < 50; ++i) graph.renderBlock(out.ptrs.data(), 2);
    // y = 0.5 * (0.5 + y) converges to 0.5
    REQUIRE(out.data[0][0] == Approx(0.5f).margin(1e-3));
}

// ==============================================================================
// Wiring Errors
// ==============================================================================

TEST_CASE("AudioGraph rejects invalid connections", "[audio_graph][edge][engine]") {
    AudioGraph graph(testConfig());
    Node& osc = graph.createFeedbackOscillator();
    Node& svf = graph.createStateVariableFilter();

    REQUIRE(osc.connect(svf, 1, 0) == nullptr);
    REQUIRE(osc.connect(svf, 0, 1) == nullptr);
    REQUIRE(graph.destination().connect(svf) == nullptr);
    REQUIRE(graph.edgeCount() == 0);

    SECTION("nodes of another graph") {
        AudioGraph other(testConfig());
        Node& foreign = other.createStateVariableFilter();
        REQUIRE(osc.connect(foreign) == nullptr);
        REQUIRE(osc.connect(*foreign.param("frequency")) == nullptr);
        REQUIRE(graph.edgeCount() == 0);
        REQUIRE(other.edgeCount() == 0);
    }

    SECTION("duplicates succeed without a new edge") {
        REQUIRE(osc.connect(svf) == &svf);
        REQUIRE(osc.connect(svf) == &svf);
        REQUIRE(graph.edgeCount() == 1);
        REQUIRE(osc.connect(*svf.param("Q")) == &osc);
        REQUIRE(osc.connect(*svf.param("Q")) == &osc);
        REQUIRE(graph.edgeCount() == 2);
    }
}

TEST_CASE("AudioGraph removes nodes with their edges", "[audio_graph][engine]") {
    AudioGraph graph(testConfig());
    Node& osc = graph.createFeedbackOscillator();
    Node& svf = graph.createStateVariableFilter();
    osc.connect(svf)->connect(graph.destination());
    osc.connect(*svf.param("frequency"));
    REQUIRE(graph.edgeCount() == 3);

    const NodeId svfId = svf.id();
    REQUIRE(graph.removeNode(svf));
    REQUIRE(graph.findNode(svfId) == nullptr);
    REQUIRE(graph.nodeCount() == 2);
    REQUIRE(graph.edgeCount() == 0);
    REQUIRE(graph.renderOrder().size() == 2);

    REQUIRE_FALSE(graph.removeNode(graph.destination()));
    REQUIRE(graph.nodeCount() == 2);

    OutputBuffers out(2);
    graph.renderBlock(out.ptrs.data(), 2);
    REQUIRE(out.data[0][0] == 0.0f);
}

// ==============================================================================
// Module Loading
// ==============================================================================

TEST_CASE("AudioGraph defers kernel modules on request", "[audio_graph][modules][engine]") {
    AudioGraph graph(testConfig(2, ModuleLoading::Deferred));
    REQUIRE(graph.modules().state(kSignalMathModule) == ModuleState::Loading);

    Node& reverb = graph.createReverb();
    Node& primitive = graph.createPrimitive(PrimitiveType::Gain);
    REQUIRE(reverb.lifecycle() == Lifecycle::PendingInit);
    REQUIRE(primitive.isInitialized());
    REQUIRE(graph.modules().pendingCount(kCrossfadeModule) == 1);
    REQUIRE(graph.modules().pendingCount(kMix4Module) == 1);

    SECTION("resolving initializes waiting nodes") {
        REQUIRE(graph.resolveDeferredModules() == kBuiltinModules.size());
        REQUIRE(reverb.isInitialized());
        REQUIRE(reverb.parameters().names().front() == "mix");
        for (std::string_view module : kBuiltinModules) {
            REQUIRE(graph.modules().isLoaded(module));
        }
    }

    SECTION("a node removed while waiting is skipped") {
        const NodeId id = reverb.id();
        REQUIRE(graph.removeNode(reverb));
        REQUIRE(graph.resolveDeferredModules() == kBuiltinModules.size());
        REQUIRE(graph.findNode(id) == nullptr);
    }
}

TEST_CASE("AudioGraph loads modules immediately by default", "[audio_graph][modules][engine]") {
    AudioGraph graph(testConfig());
    REQUIRE(graph.resolveDeferredModules() == 0);
    REQUIRE(graph.modules().loadedModules().size() == kBuiltinModules.size());
}

// ==============================================================================
// Disabled Fallback
// ==============================================================================

TEST_CASE("AudioGraph substitutes disabled nodes for configuration errors", "[audio_graph][edge][engine]") {
    AudioGraph graph(testConfig());

    SECTION("unknown signal-math operator") {
        Node& node = graph.createSignalMath("pow");
        REQUIRE(node.kind() == NodeKind::Disabled);
        REQUIRE(node.isInitialized());
        REQUIRE(node.numInlets() == 2);
        REQUIRE(node.numOutlets() == 1);
    }

    SECTION("unknown module and crossfade curve") {
        REQUIRE(graph.createKernel("granulator").kind() == NodeKind::Disabled);
        REQUIRE(graph.createKernel(kCrossfadeModule, "cubic").kind() == NodeKind::Disabled);
        REQUIRE(graph.createKernel(kCrossfadeModule).kind() == NodeKind::Crossfade);
        REQUIRE(graph.createKernel(kSignalMathModule, "mult").kind() == NodeKind::SignalMath);
        REQUIRE(graph.createKernel(kEnvelopeGeneratorModule, "ar").kind() == NodeKind::EnvelopeGenerator);
    }

    SECTION("unsupported primitive") {
        Node& node = graph.createPrimitive(PrimitiveType::Convolution);
        REQUIRE(node.kind() == NodeKind::Disabled);
    }

    SECTION("disabled nodes still wire and render silence") {
        Node& source = graph.createPrimitive(PrimitiveType::Constant);
        Node& node = graph.createSignalMath("pow");
        REQUIRE(source.connect(node) == &node);
        REQUIRE(node.connect(graph.destination()) != nullptr);

        OutputBuffers out(2);
        graph.renderBlock(out.ptrs.data(), 2);
        REQUIRE(out.data[0][0] == 0.0f);
    }

    SECTION("provider without primitives") {
        AudioGraph bare(testConfig(), std::make_unique<EmptyProvider>());
        REQUIRE(bare.createPrimitive(PrimitiveType::Gain).kind() == NodeKind::Disabled);
    }
}

TEST_CASE("AudioGraph falls back to adsr for unknown envelope types", "[audio_graph][edge][engine]") {
    AudioGraph graph(testConfig());
    Node& envelope = graph.createEnvelope("adsrr");
    REQUIRE(envelope.kind() == NodeKind::EnvelopeGenerator);
    const auto* processor = dynamic_cast<const EnvelopeGeneratorProcessor*>(envelope.processor());
    REQUIRE(processor != nullptr);
    REQUIRE(processor->kernel().type() == Patchwork::DSP::EnvelopeType::ADSR);
}

// ==============================================================================
// Taps
// ==============================================================================

TEST_CASE("AudioGraph feeds visualization taps", "[audio_graph][taps][engine]") {
    AudioGraph graph(testConfig());
    Node& constant = graph.createPrimitive(PrimitiveType::Constant, {.value = 0.25f});
    constant.connect(graph.destination());

    ScopeTap nodeTap(64);
    ScopeTap masterTap(64);
    const TapId nodeId = graph.attachTap(constant, 0, nodeTap);
    const TapId masterId = graph.attachTap(graph.destination(), 0, masterTap);
    REQUIRE(nodeId != kInvalidTap);
    REQUIRE(masterId != kInvalidTap);
    REQUIRE(graph.attachTap(constant, 1, nodeTap) == kInvalidTap);
    REQUIRE(graph.attachTap(graph.destination(), 1, masterTap) == kInvalidTap);
    REQUIRE(graph.tapCount() == 2);

    OutputBuffers out(2);
    graph.renderBlock(out.ptrs.data(), 2);
    REQUIRE(nodeTap.samplesCaptured() == kBlock);
    REQUIRE(nodeTap.peak() == Approx(0.25f));
    REQUIRE(masterTap.peak() == Approx(0.25f));

    REQUIRE(graph.detachTap(nodeId));
    REQUIRE_FALSE(graph.detachTap(nodeId));
    graph.renderBlock(out.ptrs.data(), 2);
    REQUIRE(nodeTap.samplesCaptured() == kBlock);
    REQUIRE(masterTap.samplesCaptured() == 2 * kBlock);
    REQUIRE(masterTap.lastBlockTime() == Approx(kBlock / kSampleRate));

    SECTION("removing the node drops its taps") {
        REQUIRE(graph.attachTap(constant, 0, nodeTap) != kInvalidTap);
        REQUIRE(graph.tapCount() == 2);
        REQUIRE(graph.removeNode(constant));
        REQUIRE(graph.tapCount() == 1);
    }
}
