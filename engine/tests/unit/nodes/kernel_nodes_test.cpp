// ==============================================================================
// Engine Tests - Kernel Nodes
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "graph/audio_graph.h"
#include "nodes/kernel_processors.h"

#include <patchwork/dsp/core/math_constants.h>

#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

using namespace Patchwork::Engine;
using Catch::Approx;
namespace DSP = Patchwork::DSP;

namespace {

constexpr size_t kBlock = 128;
constexpr double kSampleRate = 48000.0;

EngineConfig testConfig() {
    return EngineConfig{.sampleRate = kSampleRate, .blockSize = kBlock, .channels = 2};
}

void render(AudioGraph& graph, int blocks = 1) {
    for (int i = 0; i < blocks; ++i) graph.renderBlock(nullptr, 0);
}

float lastSample(const Node& node, size_t outlet = 0, size_t channel = 0) {
    return node.outputBus(outlet).channel(channel)[kBlock - 1];
}

float outletPeak(const Node& node, size_t outlet = 0) {
    return node.outputBus(outlet).peak();
}

} // namespace

// ==============================================================================
// Layouts
// ==============================================================================

TEST_CASE("Kernel node layouts", "[kernel_nodes][engine]") {
    AudioGraph graph(testConfig());

    Node& math = graph.createSignalMath(DSP::SignalOp::Add);
    REQUIRE(math.numInlets() == 2);
    REQUIRE(math.numOutlets() == 1);
    REQUIRE(math.outputBus(0).numChannels() == 2);

    Node& mix4 = graph.createMix4();
    REQUIRE(mix4.numInlets() == 4);
    REQUIRE(mix4.numOutlets() == 4);
    REQUIRE(mix4.inputBus(3).numChannels() == 1);

    Node& svf = graph.createStateVariableFilter();
    REQUIRE(svf.numInlets() == 1);
    REQUIRE(svf.numOutlets() == 3);

    Node& osc = graph.createFeedbackOscillator();
    REQUIRE(osc.numInlets() == 0);
    REQUIRE(osc.outputBus(0).numChannels() == 1);
}

// ==============================================================================
// SignalMath and Crossfade
// ==============================================================================

TEST_CASE("SignalMath node applies its operator", "[kernel_nodes][signal_math][engine]") {
    AudioGraph graph(testConfig());
    Node& a = graph.createPrimitive(PrimitiveType::Constant, {.value = 3.0f});
    Node& b = graph.createPrimitive(PrimitiveType::Constant, {.value = 4.0f});

    Node& sub = graph.createSignalMath("sub");
    Node& mult = graph.createSignalMath("mult");
    Node& negate = graph.createSignalMath("negate");
    REQUIRE(sub.parameters().size() == 0);

    for (Node* node : {&sub, &mult}) {
        a.connect(*node, 0, 0);
        b.connect(*node, 0, 1);
    }
    a.connect(negate, 0, 0);

    render(graph);
    REQUIRE(lastSample(sub) == -1.0f);
    REQUIRE(lastSample(sub, 0, 1) == -1.0f);
    REQUIRE(lastSample(mult) == 12.0f);
    REQUIRE(lastSample(negate) == -3.0f);

    const auto* processor = dynamic_cast<const SignalMathProcessor*>(mult.processor());
    REQUIRE(processor != nullptr);
    REQUIRE(processor->operation() == DSP::SignalOp::Mult);
}

TEST_CASE("Crossfade node blends its inlets", "[kernel_nodes][crossfade][engine]") {
    AudioGraph graph(testConfig());
    Node& a = graph.createPrimitive(PrimitiveType::Constant, {.value = 1.0f});
    Node& b = graph.createPrimitive(PrimitiveType::Constant, {.value = -1.0f});
    Node& fade = graph.createCrossfade();
    a.connect(fade, 0, 0);
    b.connect(fade, 0, 1);

    REQUIRE(fade.parameters().names() == std::vector<std::string>{"mix"});
    REQUIRE(fade.get("mix") == 0.0f);

    render(graph);
    REQUIRE(lastSample(fade) == Approx(1.0f));

    REQUIRE(fade.set("mix", 1.0f));
    render(graph);
    REQUIRE(lastSample(fade) == Approx(-1.0f));

    REQUIRE(fade.set("mix", 0.5f));
    render(graph);
    REQUIRE(lastSample(fade) == Approx(0.0f).margin(1e-6));
}

// ==============================================================================
// Rotation Mixers
// ==============================================================================

TEST_CASE("Mix2 node rotates its pair", "[kernel_nodes][mixer][engine]") {
    AudioGraph graph(testConfig());
    Node& one = graph.createPrimitive(PrimitiveType::Constant, {.value = 1.0f});
    Node& mix = graph.createMix2();
    one.connect(mix, 0, 0);

    REQUIRE(mix.parameters().names() == std::vector<std::string>{"theta"});
    REQUIRE(mix.get("theta") == Approx(DSP::kQuarterPi));

    render(graph);
    const float a = lastSample(mix, 0);
    const float b = lastSample(mix, 1);
    REQUIRE(a == Approx(std::cos(DSP::kQuarterPi)).margin(1e-5));
    REQUIRE(b == Approx(std::sin(DSP::kQuarterPi)).margin(1e-5));
    REQUIRE(a * a + b * b == Approx(1.0f).margin(1e-5));
}

TEST_CASE("Mix4 node preserves energy", "[kernel_nodes][mixer][engine]") {
    AudioGraph graph(testConfig());
    Node& one = graph.createPrimitive(PrimitiveType::Constant, {.value = 1.0f});
    Node& mix = graph.createMix4();
    one.connect(mix, 0, 0);

    REQUIRE(mix.parameters().names() == std::vector<std::string>{"theta", "iota"});

    render(graph);
    float energy = 0.0f;
    for (size_t outlet = 0; outlet < 4; ++outlet) {
        const float s = lastSample(mix, outlet);
        REQUIRE(s == Approx(0.5f).margin(1e-5));
        energy += s * s;
    }
    REQUIRE(energy == Approx(1.0f).margin(1e-5));
}

// ==============================================================================
// StateVariableFilter
// ==============================================================================

TEST_CASE("StateVariableFilter node exposes three responses", "[kernel_nodes][svf][engine]") {
    AudioGraph graph(testConfig());
    Node& dc = graph.createPrimitive(PrimitiveType::Constant, {.value = 1.0f});
    Node& svf = graph.createStateVariableFilter();
    dc.connect(svf);

    REQUIRE(svf.parameters().names() == std::vector<std::string>{"frequency", "Q"});
    REQUIRE(svf.param("frequency")->maxValue() == Approx(kSampleRate * 0.25));
    REQUIRE(svf.get("frequency") == Approx(DSP::kSVFDefaultFrequency));

    render(graph, 40);
    for (size_t ch = 0; ch < 2; ++ch) {
        REQUIRE(lastSample(svf, kSVFLowpassOutlet, ch) == Approx(1.0f).margin(1e-3));
        REQUIRE(lastSample(svf, kSVFHighpassOutlet, ch) == Approx(0.0f).margin(1e-3));
        REQUIRE(lastSample(svf, kSVFBandpassOutlet, ch) == Approx(0.0f).margin(1e-3));
    }
}

// ==============================================================================
// Sources
// ==============================================================================

TEST_CASE("FeedbackOscillator node is a bounded source", "[kernel_nodes][oscillator][engine]") {
    AudioGraph graph(testConfig());
    Node& osc = graph.createFeedbackOscillator();
    REQUIRE(osc.get("frequency") == Approx(DSP::kFeedbackOscDefaultFrequency));

    render(graph, 4);
    REQUIRE(outletPeak(osc) > 0.5f);
    REQUIRE(outletPeak(osc) <= 1.0f + 1e-5f);

    SECTION("zero frequency is silent") {
        AudioGraph silentGraph(testConfig());
        Node& silent = silentGraph.createFeedbackOscillator();
        REQUIRE(silent.set("frequency", 0.0f));
        render(silentGraph, 2);
        REQUIRE(outletPeak(silent) == 0.0f);
    }

    SECTION("feedback stays bounded") {
        REQUIRE(osc.set("feedback", 4.0f));
        render(graph, 8);
        REQUIRE(outletPeak(osc) <= 1.0f + 1e-5f);
    }
}

TEST_CASE("EnvelopeGenerator node follows its gate", "[kernel_nodes][envelope][engine]") {
    AudioGraph graph(testConfig());
    Node& envelope = graph.createEnvelope("adsr");
    REQUIRE(envelope.parameters().names() ==
            std::vector<std::string>{"gate", "attack", "decay", "sustain", "release", "shape"});

    const auto* processor = dynamic_cast<const EnvelopeGeneratorProcessor*>(envelope.processor());
    REQUIRE(processor != nullptr);

    render(graph);
    REQUIRE(outletPeak(envelope) == 0.0f);
    REQUIRE(processor->kernel().stage() == DSP::EnvelopeStage::Idle);

    REQUIRE(envelope.set("gate", 1.0f));
    render(graph, 100);
    REQUIRE(processor->kernel().stage() == DSP::EnvelopeStage::Sustain);
    REQUIRE(lastSample(envelope) == Approx(0.5f).margin(0.01));

    REQUIRE(envelope.set("gate", 0.0f));
    render(graph, 20);
    REQUIRE(lastSample(envelope) < 1e-3f);
}

TEST_CASE("EnvelopeGenerator node types", "[kernel_nodes][envelope][engine]") {
    AudioGraph graph(testConfig());
    Node& asr = graph.createEnvelope("ASR");
    const auto* processor = dynamic_cast<const EnvelopeGeneratorProcessor*>(asr.processor());
    REQUIRE(processor != nullptr);
    REQUIRE(processor->kernel().type() == DSP::EnvelopeType::ASR);

    REQUIRE(asr.set("gate", 1.0f));
    render(graph, 20);
    REQUIRE(lastSample(asr) == Approx(1.0f).margin(1e-3));
}
