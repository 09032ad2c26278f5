// ==============================================================================
// Layer 3: Effect - Feedback Delay Network Reverb
// ==============================================================================
// Four-line FDN. Each line:
//
//   gain -> one-pole low-pass (damping) -> LFO-modulated delay -> tanh
//
// All line outputs pass through a RotationMixer4; each mixed output m is scaled
// by the shared decay gain, fed back into a different line and summed in pairs
// into the output buses:
//
//        +--<-- decay * m routed {0->2, 1->3, 2->1, 3->0} ---------<--+
//        |                                                          |
//   L -->+--> line0 --> d0 -+                                       |
//   R -->+--> line1 --> d1 -+--> RotationMixer4 --> m0..m3 --> decay -+
//        +--> line2 --> d2 -+
//        +--> line3 --> d3 -+
//
//   outL = 0.5 decay (m0 + m1),  outR = 0.5 decay (m2 + m3)
//
// Stability: the mixer is orthonormal, the damping filter and the tanh stage
// never increase magnitude, and decay is clamped below 1, so loop gain < 1.
// Line lengths are distinct primes so no short common period colours the tail.
// ==============================================================================

#pragma once

#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <span>

#include <patchwork/dsp/core/db_utils.h>
#include <patchwork/dsp/core/math_constants.h>
#include <patchwork/dsp/core/parameter_descriptor.h>
#include <patchwork/dsp/core/random.h>
#include <patchwork/dsp/primitives/delay_line.h>
#include <patchwork/dsp/primitives/lfo.h>
#include <patchwork/dsp/primitives/one_pole.h>
#include <patchwork/dsp/primitives/rotation_mixer.h>
#include <patchwork/dsp/primitives/saturator.h>
#include <patchwork/dsp/primitives/smoother.h>

namespace Patchwork {
namespace DSP {

// =============================================================================
// Constants
// =============================================================================

namespace fdn_detail {

inline constexpr size_t kNumLines = 4;

/// Base delay per line in milliseconds (distinct primes).
inline constexpr std::array<float, kNumLines> kLineDelaysMs = {29.0f, 37.0f, 71.0f, 97.0f};

/// Feedback destination of each mixer output. A derangement: no output
/// returns to the line it came from.
inline constexpr std::array<size_t, kNumLines> kFeedbackRouting = {2, 3, 1, 0};

inline constexpr float kMaxDecay = 0.99f;
inline constexpr float kDefaultDecay = 0.5f;
inline constexpr float kDefaultDampingHz = 16000.0f;
inline constexpr float kMinDampingHz = 200.0f;
inline constexpr float kMaxDampingHz = 20000.0f;
inline constexpr float kLineGain = 1.0f;
inline constexpr float kModDepthMs = 1.0f;
inline constexpr float kMaxModRateHz = 0.1f;
inline constexpr float kDecaySlewPerMs = 0.01f;
inline constexpr uint32_t kDefaultSeed = 0x5EED1234u;

} // namespace fdn_detail

// =============================================================================
// FDNReverbParams
// =============================================================================

struct FDNReverbParams {
    float decay = fdn_detail::kDefaultDecay;          ///< Loop gain [0, 0.99]
    float theta = kQuarterPi;                         ///< Inner rotation angle [0, 2pi]
    float iota = kQuarterPi;                          ///< Cross rotation angle [0, 2pi]
    float dampingHz = fdn_detail::kDefaultDampingHz;  ///< Line low-pass cutoff
};

// =============================================================================
// FDNReverb
// =============================================================================

class FDNReverb {
public:
    static constexpr size_t kNumLines = fdn_detail::kNumLines;

    static constexpr std::array<ParameterDescriptor, 4> parameterDescriptors() noexcept {
        return {{
            {"decay", 0.0f, fdn_detail::kMaxDecay, fdn_detail::kDefaultDecay, AutomationRate::KRate},
            {"theta", 0.0f, kTwoPi, kQuarterPi, AutomationRate::KRate},
            {"iota", 0.0f, kTwoPi, kQuarterPi, AutomationRate::KRate},
            {"damping", fdn_detail::kMinDampingHz, fdn_detail::kMaxDampingHz,
             fdn_detail::kDefaultDampingHz, AutomationRate::KRate},
        }};
    }

    FDNReverb() noexcept = default;

    // =========================================================================
    // Lifecycle
    // =========================================================================

    /// Allocate delay storage and draw the per-line modulation rates.
    /// Not real-time safe.
    void prepare(double sampleRate, uint32_t seed = fdn_detail::kDefaultSeed) {
        if (sampleRate <= 0.0) return;
        sampleRate_ = sampleRate;

        const float maxDelaySeconds =
            (fdn_detail::kLineDelaysMs.back() + 2.0f * fdn_detail::kModDepthMs) * 0.001f;

        Xorshift32 rng(seed);
        for (size_t i = 0; i < kNumLines; ++i) {
            lines_[i].prepare(sampleRate, maxDelaySeconds);
            baseDelaySamples_[i] = fdn_detail::kLineDelaysMs[i] * 0.001f * static_cast<float>(sampleRate);

            dampers_[i].prepare(sampleRate);
            dampers_[i].setCutoff(params_.dampingHz);

            lfoRates_[i] = rng.nextInRange(0.0f, fdn_detail::kMaxModRateHz);
            lfos_[i].setFrequency(lfoRates_[i]);
            lfos_[i].setPhaseOffset(rng.nextUnipolar());
            lfos_[i].prepare(sampleRate);
        }
        modDepthSamples_ = fdn_detail::kModDepthMs * 0.001f * static_cast<float>(sampleRate);

        mixer_.prepare(sampleRate);
        decaySmoother_.configure(fdn_detail::kDecaySlewPerMs, static_cast<float>(sampleRate));
        prepared_ = true;
        reset();
    }

    void reset() noexcept {
        for (size_t i = 0; i < kNumLines; ++i) {
            lines_[i].reset();
            dampers_[i].reset();
            lfos_[i].reset();
        }
        mixer_.reset();
        decaySmoother_.snapTo(params_.decay);
        lastOutputs_.fill(0.0f);
    }

    // =========================================================================
    // Parameters
    // =========================================================================

    /// Apply new parameters. Values are clamped; NaN fields are ignored.
    void setParams(const FDNReverbParams& params) noexcept {
        if (!detail::isNaN(params.decay)) {
            params_.decay = std::clamp(params.decay, 0.0f, fdn_detail::kMaxDecay);
        }
        if (!detail::isNaN(params.theta)) params_.theta = std::clamp(params.theta, 0.0f, kTwoPi);
        if (!detail::isNaN(params.iota)) params_.iota = std::clamp(params.iota, 0.0f, kTwoPi);
        if (!detail::isNaN(params.dampingHz)) {
            const float damping =
                std::clamp(params.dampingHz, fdn_detail::kMinDampingHz, fdn_detail::kMaxDampingHz);
            if (damping != params_.dampingHz) {
                params_.dampingHz = damping;
                for (auto& damper : dampers_) damper.setCutoff(damping);
            }
        }
        decaySmoother_.setTarget(params_.decay);
    }

    [[nodiscard]] const FDNReverbParams& params() const noexcept { return params_; }

    // =========================================================================
    // Processing
    // =========================================================================

    /// Process one stereo frame.
    void process(float inL, float inR, float& outL, float& outR) noexcept {
        if (!prepared_) {
            outL = 0.0f;
            outR = 0.0f;
            return;
        }
        inL = detail::sanitize(inL);
        inR = detail::sanitize(inR);

        // Read every line before writing (one full loop of delay).
        RotationMixer4::Frame d{};
        for (size_t i = 0; i < kNumLines; ++i) {
            const float mod = lfos_[i].process() * modDepthSamples_;
            const float delay = std::max(baseDelaySamples_[i] + mod - 1.0f, 0.0f);
            d[i] = saturator_.process(lines_[i].readLinear(delay));
        }
        lastOutputs_ = d;

        RotationMixer4::Frame mixed = d;
        mixer_.process(mixed, params_.theta, params_.iota);

        const float decay = decaySmoother_.process();
        for (auto& m : mixed) m *= decay;

        outL = 0.5f * (mixed[0] + mixed[1]);
        outR = 0.5f * (mixed[2] + mixed[3]);

        std::array<float, kNumLines> lineInputs{inL, inR, 0.0f, 0.0f};
        for (size_t k = 0; k < kNumLines; ++k) {
            lineInputs[fdn_detail::kFeedbackRouting[k]] += mixed[k];
        }

        for (size_t i = 0; i < kNumLines; ++i) {
            const float filtered = dampers_[i].process(fdn_detail::kLineGain * lineInputs[i]);
            lines_[i].write(detail::flushDenormal(filtered));
        }
    }

    void processBlock(const float* inL, const float* inR, float* outL, float* outR,
                      size_t numSamples) noexcept {
        for (size_t s = 0; s < numSamples; ++s) {
            process(inL ? inL[s] : 0.0f, inR ? inR[s] : 0.0f, outL[s], outR[s]);
        }
    }

    // =========================================================================
    // Query
    // =========================================================================

    [[nodiscard]] bool isPrepared() const noexcept { return prepared_; }
    [[nodiscard]] float lfoRate(size_t line) const noexcept {
        return line < kNumLines ? lfoRates_[line] : 0.0f;
    }
    [[nodiscard]] float baseDelaySamples(size_t line) const noexcept {
        return line < kNumLines ? baseDelaySamples_[line] : 0.0f;
    }
    /// Post-saturator line outputs from the most recent frame.
    [[nodiscard]] const std::array<float, kNumLines>& lineOutputs() const noexcept { return lastOutputs_; }
    [[nodiscard]] static constexpr std::array<size_t, kNumLines> feedbackRouting() noexcept {
        return fdn_detail::kFeedbackRouting;
    }

private:
    double sampleRate_ = 44100.0;
    bool prepared_ = false;
    FDNReverbParams params_;

    std::array<DelayLine, kNumLines> lines_;
    std::array<OnePoleLP, kNumLines> dampers_;
    std::array<LFO, kNumLines> lfos_;
    std::array<float, kNumLines> lfoRates_{};
    std::array<float, kNumLines> baseDelaySamples_{};
    std::array<float, kNumLines> lastOutputs_{};
    float modDepthSamples_ = 0.0f;

    RotationMixer4 mixer_;
    Saturator saturator_;
    SlewLimiter decaySmoother_;
};

} // namespace DSP
} // namespace Patchwork
