// ==============================================================================
// Layer 1: DSP Kernel - Gate-Driven Envelope Generator
// ==============================================================================
// Five-state envelope (Idle, Attack, Decay, Sustain, Release) driven by a
// per-sample gate signal. Each stage is a one-pole approach toward an
// overshooting target:
//
//   value = value + coef * (target - value)
//   coef  = 1 - exp(-ln((1 + shape) / shape) / durationSamples)
//
// Targets: Attack -> 1 + shape, Decay -> sustain - shape, Release -> -shape.
// Small shape values give a sharp exponential knee, large values approach a
// linear ramp. Completion thresholds:
// - Attack:  value >= 1 (value is clamped to 1)
// - Decay:   value <= sustain + kEnvelopeIdleThreshold
// - Release: value <  kEnvelopeIdleThreshold, then Idle
//
// A rising gate edge enters Attack from the current value (legato retrigger).
// A falling edge enters Release from the current value when the type has a
// release stage. Idle outputs exactly 0.
//
// Stage sets:
// - AR:   attack, then release immediately
// - ASR:  attack, hold at 1 while the gate is high, release
// - ADS:  attack, decay, hold at sustain (gate-off ignored)
// - ADSR: attack, decay, sustain until gate-off, release
// ==============================================================================

#pragma once

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <utility>

#include <patchwork/dsp/core/db_utils.h>
#include <patchwork/dsp/core/parameter_descriptor.h>
#include <patchwork/dsp/primitives/smoother.h>

namespace Patchwork {
namespace DSP {

// =============================================================================
// Constants
// =============================================================================

inline constexpr float kEnvelopeIdleThreshold = 1e-4f;
inline constexpr float kEnvelopeGateThreshold = 0.5f;
inline constexpr float kEnvelopeParamSlewPerMs = 0.01f;
inline constexpr float kMinEnvelopeSeconds = 1e-5f;
inline constexpr float kMaxEnvelopeSeconds = 3.0f;
inline constexpr float kMinEnvelopeShape = 1e-4f;
inline constexpr float kMaxEnvelopeShape = 10.0f;
inline constexpr float kDefaultEnvelopeShape = 0.001f;

// =============================================================================
// Enumerations
// =============================================================================

enum class EnvelopeStage : uint8_t {
    Idle = 0,
    Attack,
    Decay,
    Sustain,
    Release
};

enum class EnvelopeType : uint8_t {
    AR = 0,
    ASR,
    ADS,
    ADSR
};

/// Case-insensitive lookup of "AR", "ASR", "ADS", "ADSR".
[[nodiscard]] inline std::optional<EnvelopeType> parseEnvelopeType(std::string_view name) noexcept {
    constexpr std::array<std::pair<std::string_view, EnvelopeType>, 4> kTypes = {{
        {"AR", EnvelopeType::AR},
        {"ASR", EnvelopeType::ASR},
        {"ADS", EnvelopeType::ADS},
        {"ADSR", EnvelopeType::ADSR},
    }};
    for (const auto& [key, type] : kTypes) {
        if (key.size() != name.size()) continue;
        bool match = true;
        for (size_t i = 0; i < key.size(); ++i) {
            if (std::toupper(static_cast<unsigned char>(name[i])) != key[i]) {
                match = false;
                break;
            }
        }
        if (match) return type;
    }
    return std::nullopt;
}

[[nodiscard]] constexpr bool hasReleaseStage(EnvelopeType type) noexcept {
    return type != EnvelopeType::ADS;
}

[[nodiscard]] constexpr bool hasDecayStage(EnvelopeType type) noexcept {
    return type == EnvelopeType::ADS || type == EnvelopeType::ADSR;
}

/// One-pole coefficient that reaches the stage threshold in @p seconds.
[[nodiscard]] inline float calculateEnvelopeCoefficient(float seconds, float shape, float sampleRate) noexcept {
    const float samples = std::max(seconds * sampleRate, 1.0f);
    shape = std::clamp(shape, kMinEnvelopeShape, kMaxEnvelopeShape);
    return 1.0f - std::exp(-std::log((1.0f + shape) / shape) / samples);
}

// =============================================================================
// EnvelopeGenerator
// =============================================================================

class EnvelopeGenerator {
public:
    static constexpr std::array<ParameterDescriptor, 6> parameterDescriptors() noexcept {
        return {{
            {"gate", 0.0f, 1.0f, 0.0f, AutomationRate::ARate},
            {"attack", kMinEnvelopeSeconds, kMaxEnvelopeSeconds, 0.01f, AutomationRate::KRate},
            {"decay", kMinEnvelopeSeconds, kMaxEnvelopeSeconds, 0.1f, AutomationRate::KRate},
            {"sustain", 0.0f, 1.0f, 0.5f, AutomationRate::KRate},
            {"release", kMinEnvelopeSeconds, kMaxEnvelopeSeconds, 0.01f, AutomationRate::KRate},
            {"shape", kMinEnvelopeShape, kMaxEnvelopeShape, kDefaultEnvelopeShape, AutomationRate::KRate},
        }};
    }

    EnvelopeGenerator() noexcept = default;
    explicit EnvelopeGenerator(EnvelopeType type) noexcept : type_(type) {}

    // =========================================================================
    // Lifecycle
    // =========================================================================

    void prepare(double sampleRate) noexcept {
        if (sampleRate <= 0.0) return;
        sampleRate_ = static_cast<float>(sampleRate);
        smoothing_.prepare(sampleRate_);
        reset();
        recalcCoefficients();
    }

    void reset() noexcept {
        stage_ = EnvelopeStage::Idle;
        value_ = 0.0f;
        gateHigh_ = false;
    }

    void setType(EnvelopeType type) noexcept { type_ = type; }

    // =========================================================================
    // Parameters
    // =========================================================================

    /// Slew the stage parameters one step and recompute the coefficients.
    /// Called once per block with that block's k-rate values.
    void updateParameters(float attackSeconds, float decaySeconds, float sustain,
                          float releaseSeconds, float shape) noexcept {
        attackSeconds_ = smoothing_.slew("attack", clampSeconds(attackSeconds), kEnvelopeParamSlewPerMs);
        decaySeconds_ = smoothing_.slew("decay", clampSeconds(decaySeconds), kEnvelopeParamSlewPerMs);
        sustain_ = smoothing_.slew("sustain", std::clamp(detail::sanitize(sustain, 0.5f), 0.0f, 1.0f),
                                   kEnvelopeParamSlewPerMs);
        releaseSeconds_ = smoothing_.slew("release", clampSeconds(releaseSeconds), kEnvelopeParamSlewPerMs);
        shape_ = smoothing_.slew("shape",
                                 std::clamp(detail::sanitize(shape, kDefaultEnvelopeShape),
                                            kMinEnvelopeShape, kMaxEnvelopeShape),
                                 kEnvelopeParamSlewPerMs);
        recalcCoefficients();
    }

    // =========================================================================
    // Processing
    // =========================================================================

    /// Advance one sample with the given gate level.
    [[nodiscard]] float process(float gate) noexcept {
        processGate(gate);
        if (stage_ == EnvelopeStage::Idle) {
            return 0.0f;
        }
        step();
        return stage_ == EnvelopeStage::Idle ? 0.0f : value_;
    }

    /// Process one block. Parameter arrays follow the descriptor order; the
    /// k-rate ones are read at index 0.
    void processBlock(float* out, size_t numSamples, std::span<const float> gate,
                      std::span<const float> attack, std::span<const float> decay,
                      std::span<const float> sustain, std::span<const float> release,
                      std::span<const float> shape) noexcept {
        updateParameters(sampleParam(attack, 0), sampleParam(decay, 0), sampleParam(sustain, 0),
                         sampleParam(release, 0), sampleParam(shape, 0));
        for (size_t i = 0; i < numSamples; ++i) {
            out[i] = process(sampleParam(gate, i));
        }
    }

    // =========================================================================
    // Query
    // =========================================================================

    [[nodiscard]] EnvelopeStage stage() const noexcept { return stage_; }
    [[nodiscard]] EnvelopeType type() const noexcept { return type_; }
    [[nodiscard]] float value() const noexcept { return stage_ == EnvelopeStage::Idle ? 0.0f : value_; }
    [[nodiscard]] bool isActive() const noexcept { return stage_ != EnvelopeStage::Idle; }

    [[nodiscard]] float attackTime() const noexcept { return attackSeconds_; }
    [[nodiscard]] float decayTime() const noexcept { return decaySeconds_; }
    [[nodiscard]] float sustainLevel() const noexcept { return sustain_; }
    [[nodiscard]] float releaseTime() const noexcept { return releaseSeconds_; }
    [[nodiscard]] float shape() const noexcept { return shape_; }

    [[nodiscard]] float attackCoefficient() const noexcept { return attackCoef_; }
    [[nodiscard]] float decayCoefficient() const noexcept { return decayCoef_; }
    [[nodiscard]] float releaseCoefficient() const noexcept { return releaseCoef_; }

private:
    void recalcCoefficients() noexcept {
        attackCoef_ = calculateEnvelopeCoefficient(attackSeconds_, shape_, sampleRate_);
        decayCoef_ = calculateEnvelopeCoefficient(decaySeconds_, shape_, sampleRate_);
        releaseCoef_ = calculateEnvelopeCoefficient(releaseSeconds_, shape_, sampleRate_);
    }

    [[nodiscard]] static float clampSeconds(float seconds) noexcept {
        return std::clamp(detail::sanitize(seconds, kMinEnvelopeSeconds), kMinEnvelopeSeconds, kMaxEnvelopeSeconds);
    }

    void processGate(float gate) noexcept {
        const bool high = !detail::isNaN(gate) && gate >= kEnvelopeGateThreshold;
        if (high && !gateHigh_) {
            stage_ = EnvelopeStage::Attack;
        } else if (!high && gateHigh_ && hasReleaseStage(type_)) {
            stage_ = EnvelopeStage::Release;
        }
        gateHigh_ = high;
    }

    void step() noexcept {
        switch (stage_) {
            case EnvelopeStage::Attack:
                value_ += attackCoef_ * ((1.0f + shape_) - value_);
                if (value_ >= 1.0f) {
                    value_ = 1.0f;
                    stage_ = afterAttack();
                }
                break;

            case EnvelopeStage::Decay:
                value_ += decayCoef_ * ((sustain_ - shape_) - value_);
                if (value_ <= sustain_ + kEnvelopeIdleThreshold) {
                    stage_ = EnvelopeStage::Sustain;
                }
                break;

            case EnvelopeStage::Sustain:
                value_ = (type_ == EnvelopeType::ASR) ? 1.0f : sustain_;
                break;

            case EnvelopeStage::Release:
                value_ += releaseCoef_ * (-shape_ - value_);
                if (value_ < kEnvelopeIdleThreshold) {
                    value_ = 0.0f;
                    stage_ = EnvelopeStage::Idle;
                }
                break;

            case EnvelopeStage::Idle:
                value_ = 0.0f;
                break;
        }
        value_ = detail::flushDenormal(value_);
    }

    [[nodiscard]] EnvelopeStage afterAttack() const noexcept {
        switch (type_) {
            case EnvelopeType::AR:   return EnvelopeStage::Release;
            case EnvelopeType::ASR:  return EnvelopeStage::Sustain;
            case EnvelopeType::ADS:
            case EnvelopeType::ADSR: return EnvelopeStage::Decay;
        }
        return EnvelopeStage::Decay;
    }

    EnvelopeType type_ = EnvelopeType::ADSR;
    EnvelopeStage stage_ = EnvelopeStage::Idle;
    float value_ = 0.0f;
    bool gateHigh_ = false;

    float sampleRate_ = 44100.0f;
    float attackSeconds_ = 0.01f;
    float decaySeconds_ = 0.1f;
    float sustain_ = 0.5f;
    float releaseSeconds_ = 0.01f;
    float shape_ = kDefaultEnvelopeShape;

    float attackCoef_ = 0.0f;
    float decayCoef_ = 0.0f;
    float releaseCoef_ = 0.0f;

    ParameterSmoothing<5> smoothing_;
};

} // namespace DSP
} // namespace Patchwork
