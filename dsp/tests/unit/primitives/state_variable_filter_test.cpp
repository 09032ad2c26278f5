// ==============================================================================
// Layer 1: DSP Kernel Tests - State Variable Filter
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <patchwork/dsp/primitives/state_variable_filter.h>

#include "test_helpers/test_signals.h"

#include <array>
#include <cmath>
#include <limits>
#include <vector>

using namespace Patchwork::DSP;
using Catch::Approx;

namespace {

constexpr double kSampleRate = 48000.0;
constexpr size_t kLength = 8192;

struct Responses {
    std::vector<float> lowpass;
    std::vector<float> highpass;
    std::vector<float> bandpass;
};

Responses run(const std::vector<float>& input, float frequency, float q) {
    StateVariableFilter svf;
    svf.prepare(kSampleRate);

    Responses r{std::vector<float>(input.size()), std::vector<float>(input.size()),
                std::vector<float>(input.size())};
    const float* in[] = {input.data()};
    float* lp[] = {r.lowpass.data()};
    float* hp[] = {r.highpass.data()};
    float* bp[] = {r.bandpass.data()};
    const std::array<float, 1> f{frequency};
    const std::array<float, 1> res{q};
    svf.processBlock(in, lp, hp, bp, 1, input.size(), f, res);
    return r;
}

float tailRms(const std::vector<float>& buffer) {
    const size_t start = buffer.size() / 2;
    return TestHelpers::rmsOf(buffer.data() + start, buffer.size() - start);
}

} // namespace

TEST_CASE("SVFCoefficients follow the prewarped formula", "[svf][layer1]") {
    const auto c = SVFCoefficients::calculate(1000.0f, 0.5f, 48000.0f);
    const float t = std::tan(kPi * 1000.0f / 48000.0f);
    REQUIRE(c.g == Approx(t / (1.0f + t)));
    REQUIRE(c.r == Approx(1.0f));
    REQUIRE(c.a == Approx(1.0f / (c.g * c.g + 2.0f * c.r * c.g + 1.0f)));

    SECTION("frequency is clamped to fs/4") {
        const auto high = SVFCoefficients::calculate(40000.0f, 0.5f, 48000.0f);
        const auto limit = SVFCoefficients::calculate(12000.0f, 0.5f, 48000.0f);
        REQUIRE(high.g == Approx(limit.g));
    }

    SECTION("Q is floored at epsilon") {
        const auto c0 = SVFCoefficients::calculate(1000.0f, 0.0f, 48000.0f);
        REQUIRE(std::isfinite(c0.r));
        REQUIRE(c0.r == Approx(1.0f / (2.0f * kSVFMinQ)));
    }
}

TEST_CASE("SVFCoefficients use the magnitude of a negative frequency", "[svf][layer1][edge]") {
    const auto negative = SVFCoefficients::calculate(-1000.0f, 0.5f, 48000.0f);
    const auto positive = SVFCoefficients::calculate(1000.0f, 0.5f, 48000.0f);
    REQUIRE(negative.g == positive.g);
    REQUIRE(negative.a == positive.a);
    REQUIRE(negative.g > 0.0f);

    const auto below = SVFCoefficients::calculate(-40000.0f, 0.5f, 48000.0f);
    const auto limit = SVFCoefficients::calculate(12000.0f, 0.5f, 48000.0f);
    REQUIRE(below.g == limit.g);
}

TEST_CASE("StateVariableFilter descriptors depend on the sample rate", "[svf][layer1]") {
    const auto descriptors = StateVariableFilter::parameterDescriptors(48000.0f);
    REQUIRE(descriptors[0].name == "frequency");
    REQUIRE(descriptors[0].maxValue == Approx(12000.0f));
    REQUIRE(descriptors[0].rate == AutomationRate::ARate);
    REQUIRE(descriptors[1].name == "Q");
    REQUIRE(descriptors[1].minValue == kSVFMinQ);
}

TEST_CASE("StateVariableFilter DC response", "[svf][layer1]") {
    const auto input = TestHelpers::makeStep(kLength);
    const auto r = run(input, 1000.0f, kSVFDefaultQ);

    REQUIRE(r.lowpass.back() == Approx(1.0f).margin(1e-3f));
    REQUIRE(r.highpass.back() == Approx(0.0f).margin(1e-3f));
    REQUIRE(r.bandpass.back() == Approx(0.0f).margin(1e-3f));
}

TEST_CASE("StateVariableFilter separates low and high frequencies", "[svf][layer1]") {
    const float cutoff = 1000.0f;

    SECTION("100 Hz passes the low-pass and is cut by the high-pass") {
        const auto input = TestHelpers::makeSine(kLength, 100.0f, static_cast<float>(kSampleRate));
        const auto r = run(input, cutoff, kSVFDefaultQ);
        REQUIRE(tailRms(r.lowpass) > 0.6f);
        REQUIRE(tailRms(r.highpass) < 0.05f);
    }

    SECTION("10 kHz passes the high-pass and is cut by the low-pass") {
        const auto input = TestHelpers::makeSine(kLength, 10000.0f, static_cast<float>(kSampleRate));
        const auto r = run(input, cutoff, kSVFDefaultQ);
        REQUIRE(tailRms(r.highpass) > 0.6f);
        REQUIRE(tailRms(r.lowpass) < 0.05f);
    }

    SECTION("band-pass peaks near the cutoff") {
        const auto atCutoff = run(TestHelpers::makeSine(kLength, cutoff, static_cast<float>(kSampleRate)),
                                  cutoff, kSVFDefaultQ);
        const auto farBelow = run(TestHelpers::makeSine(kLength, 50.0f, static_cast<float>(kSampleRate)),
                                  cutoff, kSVFDefaultQ);
        REQUIRE(tailRms(atCutoff.bandpass) > 2.0f * tailRms(farBelow.bandpass));
    }
}

TEST_CASE("StateVariableFilter stays bounded under audio-rate modulation", "[svf][layer1]") {
    StateVariableFilter svf;
    svf.prepare(kSampleRate);
    const auto input = TestHelpers::makeSine(kLength, 220.0f, static_cast<float>(kSampleRate));
    std::vector<float> frequency(kLength);
    for (size_t i = 0; i < kLength; ++i) {
        frequency[i] = 2000.0f + 1800.0f * std::sin(0.05f * static_cast<float>(i));
    }
    const std::array<float, 1> q{kSVFMaxQ};

    std::vector<float> lp(kLength);
    const float* in[] = {input.data()};
    float* lpOut[] = {lp.data()};
    svf.processBlock(in, lpOut, nullptr, nullptr, 1, kLength, frequency, q);

    REQUIRE(TestHelpers::allFinite(lp));
    REQUIRE(TestHelpers::peakOf(lp) < 20.0f);
}

TEST_CASE("StateVariableFilter keeps channel state separate", "[svf][layer1]") {
    StateVariableFilter svf;
    svf.prepare(kSampleRate);
    const auto step = TestHelpers::makeStep(256);
    const std::vector<float> silence(256, 0.0f);
    std::vector<float> lp0(256);
    std::vector<float> lp1(256);

    const float* in[] = {step.data(), silence.data()};
    float* lp[] = {lp0.data(), lp1.data()};
    const std::array<float, 1> f{2000.0f};
    const std::array<float, 1> q{kSVFDefaultQ};
    svf.processBlock(in, lp, nullptr, nullptr, 2, 256, f, q);

    REQUIRE(TestHelpers::peakOf(lp0) > 0.1f);
    REQUIRE(TestHelpers::peakOf(lp1) == 0.0f);
}

TEST_CASE("StateVariableFilter recovers from non-finite input", "[svf][layer1][edge]") {
    StateVariableFilter svf;
    svf.prepare(kSampleRate);
    const auto c = svf.advanceParameters(1000.0f, 0.7f);

    const auto y = svf.tick(std::numeric_limits<float>::quiet_NaN(), c, 0);
    REQUIRE(std::isfinite(y.lowpass));
    REQUIRE(std::isfinite(y.highpass));

    const auto out = svf.tick(1.0f, c, kMaxSVFChannels);
    REQUIRE(out.lowpass == 0.0f);
}
