// ==============================================================================
// Engine Tests - Render Plane Allocation
// ==============================================================================
// renderBlock() must not touch the heap once the graph is built.
// ==============================================================================

#include <catch2/catch_test_macros.hpp>

#define PATCHWORK_DEFINE_ALLOCATION_HOOKS
#include "test_helpers/allocation_detector.h"

#include "graph/audio_graph.h"
#include "nodes/kernel_processors.h"
#include "taps/scope_tap.h"

#include <array>
#include <vector>

using namespace Patchwork::Engine;
using TestHelpers::AllocationDetector;

namespace {

constexpr size_t kBlock = 128;

} // namespace

TEST_CASE("renderBlock does not allocate", "[render][realtime][engine]") {
    AudioGraph graph(EngineConfig{.sampleRate = 48000.0, .blockSize = kBlock, .channels = 2});

    Node& osc = graph.createFeedbackOscillator();
    Node& lfo = graph.createPrimitive(PrimitiveType::Oscillator, {.frequency = 2.0f});
    Node& depth = graph.createPrimitive(PrimitiveType::Gain, {.value = 200.0f / 16.0f});
    Node& svf = graph.createStateVariableFilter();
    Node& envelope = graph.createEnvelope("adsr");
    Node& vca = graph.createSignalMath("mult");
    Node& reverb = graph.createReverb();
    Node& distortion = graph.createDistortion();
    Node& delay = graph.createPrimitive(PrimitiveType::Delay, {.maxDelaySeconds = 0.5f});

    REQUIRE(osc.set("frequency", 220.0f));
    REQUIRE(lfo.start());
    lfo.connect(depth)->connect(*svf.param("frequency"));
    osc.connect(svf);
    svf.connect(vca, kSVFLowpassOutlet, 0);
    envelope.connect(vca, 0, 1);
    vca.connect(distortion)->connect(delay)->connect(reverb)->connect(graph.destination());
    REQUIRE(reverb.set("mix", 0.3f));
    REQUIRE(delay.set("delayTime", 0.01f));
    REQUIRE(envelope.set("gate", 1.0f));

    ScopeTap tap(512);
    REQUIRE(graph.attachTap(graph.destination(), 0, tap) != kInvalidTap);

    std::array<std::vector<float>, 2> data{std::vector<float>(kBlock), std::vector<float>(kBlock)};
    std::array<float*, 2> ptrs{data[0].data(), data[1].data()};

    // Warm-up block
    graph.renderBlock(ptrs.data(), 2);

    auto& detector = AllocationDetector::instance();
    detector.startTracking();
    for (int i = 0; i < 16; ++i) {
        graph.renderBlock(ptrs.data(), 2);
    }
    const size_t allocations = detector.stopTracking();

    REQUIRE(allocations == 0);
    REQUIRE(tap.samplesCaptured() == 17 * kBlock);
}
