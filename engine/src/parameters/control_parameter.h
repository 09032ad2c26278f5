#pragma once

// ==============================================================================
// ControlParameter - Automatable, Modulatable Node Parameter
// ==============================================================================
// Holds the intrinsic value of one kernel parameter, its [min, max] range,
// its automation rate and a timeline of scheduled events. Once per block the
// render plane turns that state into a value array:
//
//   beginBlock()    automation values (blockSize entries a-rate, 1 k-rate)
//   addModulation() + every connected signal
//   endBlock()      clamp to [min, max]
//
// Every external write is clamped to [min, max].
//
// Automation events follow the usual audio-graph semantics:
// - setValueAtTime(v, t):        jump to v at t
// - setTargetAtTime(v, t, tau):  v(x) = v + (v0 - v) exp(-(x - t) / tau)
// - cancelScheduledValues(t):    drop every event at or after t
//
// Thread Safety: setters and scheduling are control plane; the block methods
// are real-time safe and never allocate.
// ==============================================================================

#include <patchwork/dsp/core/parameter_descriptor.h>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace Patchwork::Engine {

class AudioBus;

using DSP::AutomationRate;
using DSP::ParameterDescriptor;

class ControlParameter {
public:
    ControlParameter(const ParameterDescriptor& descriptor, size_t blockSize);

    ControlParameter(const ControlParameter&) = delete;
    ControlParameter& operator=(const ControlParameter&) = delete;

    // ==========================================================================
    // Description
    // ==========================================================================

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] float minValue() const noexcept { return min_; }
    [[nodiscard]] float maxValue() const noexcept { return max_; }
    [[nodiscard]] float defaultValue() const noexcept { return default_; }
    [[nodiscard]] AutomationRate rate() const noexcept { return rate_; }

    // ==========================================================================
    // Value
    // ==========================================================================

    /// Intrinsic value (automation only, without modulation inputs).
    [[nodiscard]] float value() const noexcept { return value_; }

    /// Set immediately. Stops a running setTarget approach; later scheduled
    /// events stay.
    void setValue(float value);

    /// Map [0, 1] linearly onto [min, max].
    void setNormalized(float normalized);
    [[nodiscard]] float normalized() const noexcept;

    // ==========================================================================
    // Scheduling
    // ==========================================================================

    /// @return false for a NaN value or negative time
    bool setValueAtTime(float value, double time);

    /// Exponential approach starting at @p startTime. A time constant <= 0
    /// degrades to setValueAtTime.
    bool setTargetAtTime(float target, double startTime, double timeConstant);

    void cancelScheduledValues(double time);

    [[nodiscard]] size_t scheduledEventCount() const noexcept { return events_.size() - nextEvent_; }

    // ==========================================================================
    // Render Plane
    // ==========================================================================

    void beginBlock(double startTime, double sampleRate, size_t numFrames) noexcept;
    void addModulation(const AudioBus& source) noexcept;
    void endBlock() noexcept;

    /// Values of the most recent block.
    [[nodiscard]] std::span<const float> blockValues() const noexcept {
        return {blockValues_.data(), blockLength_};
    }

private:
    enum class EventType : uint8_t { SetValue, SetTarget };

    struct Event {
        EventType type;
        double time;
        float value;
        double timeConstant;
    };

    [[nodiscard]] float clamp(float value) const noexcept;
    void insertEvent(const Event& event);
    void compactEvents();
    float advanceTo(double time) noexcept;

    std::string name_;
    float min_;
    float max_;
    float default_;
    AutomationRate rate_;
    float value_;

    std::vector<Event> events_;
    size_t nextEvent_ = 0;

    bool approaching_ = false;
    float approachTarget_ = 0.0f;
    float approachStartValue_ = 0.0f;
    double approachStartTime_ = 0.0;
    double approachTimeConstant_ = 1.0;

    std::vector<float> blockValues_;
    size_t blockLength_ = 1;
};

} // namespace Patchwork::Engine
