// ==============================================================================
// Engine Tests - BuiltinPrimitiveProvider
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "graph/audio_graph.h"
#include "providers/builtin_primitive_provider.h"

#include <patchwork/dsp/core/math_constants.h>

#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

using namespace Patchwork::Engine;
using Catch::Approx;

namespace {

constexpr size_t kBlock = 64;
constexpr double kSampleRate = 48000.0;

EngineConfig testConfig() {
    return EngineConfig{.sampleRate = kSampleRate, .blockSize = kBlock, .channels = 2};
}

void render(AudioGraph& graph, int blocks = 1) {
    for (int i = 0; i < blocks; ++i) graph.renderBlock(nullptr, 0);
}

const float* outlet(const Node& node, size_t channel = 0) {
    return node.outputBus(0).channel(channel);
}

} // namespace

TEST_CASE("BuiltinPrimitiveProvider names and layouts", "[provider][engine]") {
    BuiltinPrimitiveProvider provider;
    REQUIRE(primitiveTypeName(PrimitiveType::OnePole) == "one-pole");
    REQUIRE(primitiveTypeName(PrimitiveType::BufferPlayback) == "buffer-playback");

    const NodeLayout constant = provider.layout(PrimitiveType::Constant);
    REQUIRE(constant.numInlets == 0);
    REQUIRE(constant.outletChannels == 1);

    const NodeLayout gain = provider.layout(PrimitiveType::Gain);
    REQUIRE(gain.numInlets == 1);
    REQUIRE(gain.numOutlets == 1);
    REQUIRE(gain.inletChannels == 0);
}

TEST_CASE("BuiltinPrimitiveProvider declines sample-based primitives", "[provider][engine]") {
    BuiltinPrimitiveProvider provider;
    REQUIRE(provider.create(PrimitiveType::Convolution, {}) == nullptr);
    REQUIRE(provider.create(PrimitiveType::BufferPlayback, {}) == nullptr);
    REQUIRE(provider.create(PrimitiveType::Gain, {}) != nullptr);
}

TEST_CASE("Gain primitive", "[provider][engine]") {
    AudioGraph graph(testConfig());
    Node& source = graph.createPrimitive(PrimitiveType::Constant, {.value = 0.5f});
    Node& gain = graph.createPrimitive(PrimitiveType::Gain, {.value = -3.0f});
    source.connect(gain);

    REQUIRE(gain.parameters().names() == std::vector<std::string>{"gain"});
    REQUIRE(gain.param("gain")->rate() == AutomationRate::ARate);
    render(graph);
    REQUIRE(outlet(gain)[0] == Approx(-1.5f));
    REQUIRE(outlet(gain, 1)[kBlock - 1] == Approx(-1.5f));

    SECTION("initial gain is clamped") {
        Node& loud = graph.createPrimitive(PrimitiveType::Gain, {.value = 1000.0f});
        REQUIRE(loud.get("gain") == kMaxPrimitiveGain);
    }
}

TEST_CASE("Constant primitive", "[provider][engine]") {
    AudioGraph graph(testConfig());
    Node& constant = graph.createPrimitive(PrimitiveType::Constant);
    REQUIRE(constant.get("offset") == 1.0f);
    REQUIRE(constant.outputBus(0).numChannels() == 1);

    REQUIRE(constant.set("offset", -2.0f));
    render(graph);
    REQUIRE(outlet(constant)[0] == -2.0f);

    REQUIRE(constant.set("offset", 1.0e9f));
    REQUIRE(constant.get("offset") == kMaxConstantOffset);
}

TEST_CASE("Delay primitive", "[provider][engine]") {
    AudioGraph graph(testConfig());
    Node& step = graph.createPrimitive(PrimitiveType::Constant, {.value = 1.0f});
    Node& delay = graph.createPrimitive(PrimitiveType::Delay, {.maxDelaySeconds = 0.1f});
    step.connect(delay);

    REQUIRE(delay.param("delayTime")->maxValue() == Approx(0.1f));
    REQUIRE(delay.set("delayTime", static_cast<float>(10.0 / kSampleRate)));

    render(graph);
    const float* out = outlet(delay);
    REQUIRE(out[9] == Approx(0.0f).margin(1e-4));
    REQUIRE(out[10] == Approx(1.0f));
    REQUIRE(out[kBlock - 1] == Approx(1.0f));

    SECTION("maximum delay is clamped") {
        Node& huge = graph.createPrimitive(PrimitiveType::Delay, {.maxDelaySeconds = 60.0f});
        REQUIRE(huge.param("delayTime")->maxValue() == kMaxPrimitiveDelaySeconds);
    }
}

TEST_CASE("Filter primitives", "[provider][engine]") {
    AudioGraph graph(testConfig());
    Node& dc = graph.createPrimitive(PrimitiveType::Constant, {.value = 1.0f});
    Node& lowpass = graph.createPrimitive(PrimitiveType::Biquad, {.frequency = 1000.0f});
    Node& highpass = graph.createPrimitive(
        PrimitiveType::Biquad, {.filterType = Patchwork::DSP::FilterType::Highpass, .frequency = 1000.0f});
    Node& onePole = graph.createPrimitive(PrimitiveType::OnePole, {.frequency = 500.0f});
    dc.connect(lowpass);
    dc.connect(highpass);
    dc.connect(onePole);

    REQUIRE(lowpass.parameters().names() == std::vector<std::string>{"frequency", "Q"});
    REQUIRE(lowpass.get("frequency") == 1000.0f);
    REQUIRE(lowpass.param("Q")->rate() == AutomationRate::KRate);
    REQUIRE(onePole.parameters().names() == std::vector<std::string>{"frequency"});

    render(graph, 80);
    REQUIRE(outlet(lowpass)[kBlock - 1] == Approx(1.0f).margin(1e-3));
    REQUIRE(outlet(highpass)[kBlock - 1] == Approx(0.0f).margin(1e-3));
    REQUIRE(outlet(onePole, 1)[kBlock - 1] == Approx(1.0f).margin(1e-3));
}

TEST_CASE("Saturator primitive", "[provider][engine]") {
    AudioGraph graph(testConfig());
    Node& source = graph.createPrimitive(PrimitiveType::Constant, {.value = 0.5f});
    Node& saturator = graph.createPrimitive(PrimitiveType::Saturator, {.value = 2.0f});
    source.connect(saturator);

    REQUIRE(saturator.get("drive") == 2.0f);
    render(graph);
    REQUIRE(outlet(saturator)[0] == Approx(std::tanh(1.0f)));
}

TEST_CASE("Oscillator primitive", "[provider][engine]") {
    AudioGraph graph(testConfig());
    Node& osc = graph.createPrimitive(PrimitiveType::Oscillator, {.frequency = 750.0f});
    REQUIRE(osc.parameters().names() == std::vector<std::string>{"frequency"});

    SECTION("silent until started") {
        render(graph);
        REQUIRE(osc.outputBus(0).peak() == 0.0f);
    }

    SECTION("a started oscillator is a sine") {
        REQUIRE(osc.start());
        render(graph);
        const float* out = outlet(osc);
        // 750 Hz at 48 kHz is 64 samples per cycle
        REQUIRE(out[0] == Approx(0.0f).margin(1e-6));
        REQUIRE(out[16] == Approx(1.0f).margin(1e-4));
        REQUIRE(out[48] == Approx(-1.0f).margin(1e-4));
    }

    SECTION("start and stop times are honoured within a block") {
        REQUIRE(osc.start(7.5 / kSampleRate));
        REQUIRE(osc.stop(39.5 / kSampleRate));
        render(graph);
        const float* out = outlet(osc);
        for (size_t i = 0; i < 8; ++i) REQUIRE(out[i] == 0.0f);
        REQUIRE(out[24] == Approx(1.0f).margin(1e-4));
        for (size_t i = 40; i < kBlock; ++i) REQUIRE(out[i] == 0.0f);
    }
}
