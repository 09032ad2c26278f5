// ==============================================================================
// Layer 1: DSP Primitive - Parameter Smoothing
// ==============================================================================
// Rate limiting and safe sampling of control values. Control parameters arrive
// once per block (k-rate) or once per sample (a-rate) while the signal path
// runs per sample; every kernel uses these utilities to turn those arrays into
// discontinuity-free per-sample values.
//
// Contents:
// - sampleParam(): safe indexed read of a parameter array
// - SlewLimiter: single-value linear rate limiter
// - ParameterSmoothing: fixed-capacity bank of named slew/one-pole histories
//
// Real-time safe: noexcept, no allocation after construction.
// ==============================================================================

#pragma once

#include <array>
#include <cstddef>
#include <span>
#include <string_view>

#include <patchwork/dsp/core/db_utils.h>

namespace Patchwork {
namespace DSP {

// =============================================================================
// Compiler Compatibility Macros
// =============================================================================

#ifndef PATCHWORK_NOINLINE
#if defined(_MSC_VER)
#define PATCHWORK_NOINLINE __declspec(noinline)
#elif defined(__GNUC__) || defined(__clang__)
#define PATCHWORK_NOINLINE __attribute__((noinline))
#else
#define PATCHWORK_NOINLINE
#endif
#endif

// =============================================================================
// Constants
// =============================================================================

/// Magnitude clamp for infinite inputs to the slew stages.
inline constexpr float kSlewInfinityClamp = 1e10f;

/// Default capacity of a ParameterSmoothing bank.
inline constexpr size_t kDefaultSmoothingSlots = 16;

// =============================================================================
// Helpers
// =============================================================================

/// @brief Convert a rate in units/ms to the maximum change per sample.
/// @param unitsPerMs Maximum change in units per millisecond
/// @param sampleRate Sample rate in Hz
/// @return Maximum delta per sample (never negative)
[[nodiscard]] constexpr float calculateSlewRate(float unitsPerMs, float sampleRate) noexcept {
    if (sampleRate <= 0.0f || unitsPerMs <= 0.0f) return 0.0f;
    return unitsPerMs * (1000.0f / sampleRate);
}

/// @brief Read a parameter array at a sample index.
///
/// Handles a-rate arrays (one value per sample) and k-rate arrays (a single
/// value for the block) transparently: an index past the end holds the last
/// element, an empty array reads as 0.
[[nodiscard]] constexpr float sampleParam(std::span<const float> values, size_t index) noexcept {
    if (values.empty()) return 0.0f;
    return index < values.size() ? values[index] : values.back();
}

// =============================================================================
// SlewLimiter
// =============================================================================

/// @brief Linear rate limiter for a single control value.
///
/// The first target after construction or reset() is adopted immediately,
/// so a parameter does not ramp up from zero on its first block.
class SlewLimiter {
public:
    SlewLimiter() noexcept = default;

    /// @brief Configure the symmetric rate.
    /// @param ratePerMs Maximum change in units per millisecond
    /// @param sampleRate Sample rate in Hz
    void configure(float ratePerMs, float sampleRate) noexcept {
        ratePerMs_ = (ratePerMs > 0.0f) ? ratePerMs : 0.0f;
        sampleRate_ = (sampleRate > 0.0f) ? sampleRate : sampleRate_;
        maxDelta_ = calculateSlewRate(ratePerMs_, sampleRate_);
    }

    /// @brief Set the value to approach.
    /// NaN keeps the previous target. Uses noinline so the NaN check is not
    /// folded away under fast-math.
    PATCHWORK_NOINLINE void setTarget(float target) noexcept {
        if (detail::isNaN(target)) return;
        if (detail::isInf(target)) {
            target = (target > 0.0f) ? kSlewInfinityClamp : -kSlewInfinityClamp;
        }
        target_ = target;
        if (!primed_) {
            current_ = target;
            primed_ = true;
        }
    }

    /// @brief Advance one sample toward the target.
    [[nodiscard]] float process() noexcept {
        const float delta = target_ - current_;
        if (delta > maxDelta_) {
            current_ += maxDelta_;
        } else if (delta < -maxDelta_) {
            current_ -= maxDelta_;
        } else {
            current_ = target_;
        }
        current_ = detail::flushDenormal(current_);
        return current_;
    }

    /// @brief Set target and advance one sample.
    [[nodiscard]] float process(float target) noexcept {
        setTarget(target);
        return process();
    }

    /// @brief Jump to a value with no limiting.
    void snapTo(float value) noexcept {
        if (detail::isNaN(value)) value = 0.0f;
        current_ = value;
        target_ = value;
        primed_ = true;
    }

    /// @brief Forget history; the next target is adopted immediately.
    void reset() noexcept {
        current_ = 0.0f;
        target_ = 0.0f;
        primed_ = false;
    }

    [[nodiscard]] float getCurrentValue() const noexcept { return current_; }
    [[nodiscard]] float getTarget() const noexcept { return target_; }
    [[nodiscard]] float getMaxDeltaPerSample() const noexcept { return maxDelta_; }
    [[nodiscard]] bool isComplete() const noexcept { return current_ == target_; }

private:
    float current_ = 0.0f;
    float target_ = 0.0f;
    float ratePerMs_ = 1.0f;
    float sampleRate_ = 44100.0f;
    float maxDelta_ = calculateSlewRate(1.0f, 44100.0f);
    bool primed_ = false;
};

// =============================================================================
// ParameterSmoothing
// =============================================================================

/// @brief Bank of per-name smoothing histories owned by one kernel.
///
/// Names are looked up by value, so callers pass string literals (the bank
/// stores the view, not a copy). Each name gets one persistent history the
/// first time it is seen; that first call returns its input unchanged.
/// Once all slots are taken, further names pass through unsmoothed.
///
/// @tparam Capacity Maximum number of distinct names
template <size_t Capacity = kDefaultSmoothingSlots>
class ParameterSmoothing {
public:
    ParameterSmoothing() noexcept = default;

    void prepare(float sampleRate) noexcept {
        if (sampleRate > 0.0f) sampleRate_ = sampleRate;
        reset();
    }

    /// @brief Drop all histories.
    void reset() noexcept {
        for (auto& slot : slots_) slot = Slot{};
        used_ = 0;
    }

    /// @brief Bound the change of a named value.
    ///
    /// The step from the stored history to @p value is limited to
    /// +/- maxRatePerMs * (1000 / sampleRate); the bounded result is stored
    /// and returned.
    /// @param name Parameter name (must outlive the bank)
    /// @param value Requested value
    /// @param maxRatePerMs Maximum change in units per millisecond
    [[nodiscard]] float slew(std::string_view name, float value, float maxRatePerMs) noexcept {
        if (detail::isNaN(value)) return current(name);
        value = guard(value);
        Slot* slot = lookup(name, value);
        if (slot == nullptr) return value;

        const float maxDelta = calculateSlewRate(maxRatePerMs, sampleRate_);
        const float delta = value - slot->history;
        if (delta > maxDelta) {
            slot->history += maxDelta;
        } else if (delta < -maxDelta) {
            slot->history -= maxDelta;
        } else {
            slot->history = value;
        }
        slot->history = detail::flushDenormal(slot->history);
        return slot->history;
    }

    /// @brief Slew a value read from a parameter array.
    [[nodiscard]] float slewSample(std::span<const float> values, size_t index,
                                   std::string_view name, float maxRatePerMs) noexcept {
        return slew(name, sampleParam(values, index), maxRatePerMs);
    }

    /// @brief One-pole lag: history = value + factor * (history - value).
    /// @param factor Retention in [0, 1]; 0 follows instantly, 1 freezes
    [[nodiscard]] float onepole(std::string_view name, float value, float factor) noexcept {
        if (detail::isNaN(value)) return current(name);
        value = guard(value);
        Slot* slot = lookup(name, value);
        if (slot == nullptr) return value;

        const float f = (factor < 0.0f) ? 0.0f : (factor > 1.0f ? 1.0f : factor);
        slot->history = detail::flushDenormal(value + f * (slot->history - value));
        return slot->history;
    }

    /// @brief Current history for a name, or @p fallback if unknown.
    [[nodiscard]] float current(std::string_view name, float fallback = 0.0f) const noexcept {
        for (size_t i = 0; i < used_; ++i) {
            if (slots_[i].name == name) return slots_[i].history;
        }
        return fallback;
    }

    [[nodiscard]] size_t size() const noexcept { return used_; }
    [[nodiscard]] static constexpr size_t capacity() noexcept { return Capacity; }
    [[nodiscard]] float sampleRate() const noexcept { return sampleRate_; }

private:
    struct Slot {
        std::string_view name;
        float history = 0.0f;
    };

    [[nodiscard]] static float guard(float value) noexcept {
        if (detail::isInf(value)) return (value > 0.0f) ? kSlewInfinityClamp : -kSlewInfinityClamp;
        return value;
    }

    Slot* lookup(std::string_view name, float initial) noexcept {
        for (size_t i = 0; i < used_; ++i) {
            if (slots_[i].name == name) return &slots_[i];
        }
        if (used_ == Capacity) return nullptr;
        Slot& slot = slots_[used_++];
        slot.name = name;
        slot.history = initial;
        return &slot;
    }

    std::array<Slot, Capacity> slots_{};
    size_t used_ = 0;
    float sampleRate_ = 44100.0f;
};

} // namespace DSP
} // namespace Patchwork
