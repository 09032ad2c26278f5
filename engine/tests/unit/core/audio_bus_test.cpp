// ==============================================================================
// Engine Tests - AudioBus
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "core/audio_bus.h"
#include "core/engine_config.h"


using namespace Patchwork::Engine;
using Catch::Approx;

namespace {

void fill(AudioBus& bus, size_t channel, float value) {
    float* data = bus.channel(channel);
    for (size_t i = 0; i < bus.numFrames(); ++i) data[i] = value;
}

} // namespace

TEST_CASE("AudioBus is zeroed on construction", "[audio_bus][engine]") {
    AudioBus bus(2, 16);
    REQUIRE(bus.numChannels() == 2);
    REQUIRE(bus.numFrames() == 16);
    REQUIRE(bus.peak() == 0.0f);
    REQUIRE(bus.channel(2) == nullptr);
}

TEST_CASE("AudioBus rejects invalid channel counts", "[audio_bus][engine][edge]") {
    AudioBus bus;
    REQUIRE_THROWS(bus.resize(0, 16));
    REQUIRE_THROWS(bus.resize(kMaxChannels + 1, 16));
    REQUIRE_NOTHROW(bus.resize(kMaxChannels, 16));
}

TEST_CASE("AudioBus accumulate adapts channel counts", "[audio_bus][engine]") {
    SECTION("equal counts add channel by channel") {
        AudioBus dst(2, 8);
        AudioBus src(2, 8);
        fill(dst, 0, 1.0f);
        fill(src, 0, 0.5f);
        fill(src, 1, -0.25f);
        dst.accumulate(src);
        REQUIRE(dst.channel(0)[3] == Approx(1.5f));
        REQUIRE(dst.channel(1)[3] == Approx(-0.25f));
    }

    SECTION("mono source spreads to every channel") {
        AudioBus dst(4, 8);
        AudioBus src(1, 8);
        fill(src, 0, 0.75f);
        dst.accumulate(src);
        for (size_t ch = 0; ch < 4; ++ch) REQUIRE(dst.channel(ch)[0] == Approx(0.75f));
    }

    SECTION("mono destination averages") {
        AudioBus dst(1, 8);
        AudioBus src(2, 8);
        fill(src, 0, 1.0f);
        fill(src, 1, 0.0f);
        dst.accumulate(src);
        REQUIRE(dst.channel(0)[5] == Approx(0.5f));
    }

    SECTION("mismatched counts pair by index") {
        AudioBus dst(2, 8);
        AudioBus src(3, 8);
        fill(src, 0, 1.0f);
        fill(src, 1, 2.0f);
        fill(src, 2, 3.0f);
        dst.accumulate(src);
        REQUIRE(dst.channel(0)[0] == Approx(1.0f));
        REQUIRE(dst.channel(1)[0] == Approx(2.0f));
    }

    SECTION("only the common frame range is touched") {
        AudioBus dst(1, 8);
        AudioBus src(1, 4);
        fill(src, 0, 1.0f);
        dst.accumulate(src);
        REQUIRE(dst.channel(0)[3] == 1.0f);
        REQUIRE(dst.channel(0)[4] == 0.0f);
    }
}

TEST_CASE("AudioBus copyFrom overwrites", "[audio_bus][engine]") {
    AudioBus dst(2, 4);
    AudioBus src(1, 4);
    fill(dst, 0, 9.0f);
    fill(src, 0, 0.5f);
    dst.copyFrom(src);
    REQUIRE(dst.channel(0)[0] == Approx(0.5f));
    REQUIRE(dst.channel(1)[0] == Approx(0.5f));
}

TEST_CASE("AudioBus gain, mono sample and peak", "[audio_bus][engine]") {
    AudioBus bus(2, 4);
    fill(bus, 0, 0.5f);
    fill(bus, 1, -1.0f);

    REQUIRE(bus.monoSample(0) == Approx(-0.25f));
    REQUIRE(bus.monoSample(4) == 0.0f);
    REQUIRE(bus.peak() == Approx(1.0f));

    bus.applyGain(2.0f);
    REQUIRE(bus.channel(0)[1] == Approx(1.0f));
    REQUIRE(bus.peak() == Approx(2.0f));

    bus.clear();
    REQUIRE(bus.peak() == 0.0f);
}
