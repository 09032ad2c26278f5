#include "parameters/control_parameter.h"
#include "core/audio_bus.h"

#include <failsafe/failsafe.hh>

#include <patchwork/dsp/core/db_utils.h>

#include <algorithm>
#include <cmath>

namespace Patchwork::Engine {

ControlParameter::ControlParameter(const ParameterDescriptor& descriptor, size_t blockSize)
    : name_(descriptor.name)
    , min_(std::min(descriptor.minValue, descriptor.maxValue))
    , max_(std::max(descriptor.minValue, descriptor.maxValue))
    , default_(std::clamp(descriptor.defaultValue, min_, max_))
    , rate_(descriptor.rate)
    , value_(default_)
    , blockValues_(descriptor.rate == AutomationRate::ARate ? std::max<size_t>(blockSize, 1) : 1, default_)
    , blockLength_(1)
{
}

float ControlParameter::clamp(float value) const noexcept {
    if (DSP::detail::isNaN(value)) return value_;
    return std::clamp(value, min_, max_);
}

// =============================================================================
// Value
// =============================================================================

void ControlParameter::setValue(float value) {
    if (DSP::detail::isNaN(value)) {
        LOG_WARN("params", "ignoring NaN for", name_);
        return;
    }
    value_ = clamp(value);
    approaching_ = false;
}

void ControlParameter::setNormalized(float normalized) {
    if (DSP::detail::isNaN(normalized)) return;
    normalized = std::clamp(normalized, 0.0f, 1.0f);
    setValue(min_ + normalized * (max_ - min_));
}

float ControlParameter::normalized() const noexcept {
    const float range = max_ - min_;
    return range > 0.0f ? (value_ - min_) / range : 0.0f;
}

// =============================================================================
// Scheduling
// =============================================================================

void ControlParameter::compactEvents() {
    if (nextEvent_ == 0) return;
    events_.erase(events_.begin(), events_.begin() + static_cast<std::ptrdiff_t>(nextEvent_));
    nextEvent_ = 0;
}

void ControlParameter::insertEvent(const Event& event) {
    compactEvents();
    const auto pos = std::upper_bound(events_.begin(), events_.end(), event.time,
        [](double time, const Event& e) { return time < e.time; });
    events_.insert(pos, event);
}

bool ControlParameter::setValueAtTime(float value, double time) {
    if (DSP::detail::isNaN(value) || !(time >= 0.0)) {
        LOG_WARN("params", "invalid setValueAtTime on", name_);
        return false;
    }
    insertEvent({EventType::SetValue, time, clamp(value), 0.0});
    return true;
}

bool ControlParameter::setTargetAtTime(float target, double startTime, double timeConstant) {
    if (!(timeConstant > 0.0)) {
        return setValueAtTime(target, startTime);
    }
    if (DSP::detail::isNaN(target) || !(startTime >= 0.0)) {
        LOG_WARN("params", "invalid setTargetAtTime on", name_);
        return false;
    }
    insertEvent({EventType::SetTarget, startTime, clamp(target), timeConstant});
    return true;
}

void ControlParameter::cancelScheduledValues(double time) {
    compactEvents();
    const auto pos = std::lower_bound(events_.begin(), events_.end(), time,
        [](const Event& e, double t) { return e.time < t; });
    events_.erase(pos, events_.end());
    if (approaching_ && approachStartTime_ >= time) {
        approaching_ = false;
    }
}

// =============================================================================
// Render Plane
// =============================================================================

float ControlParameter::advanceTo(double time) noexcept {
    while (nextEvent_ < events_.size() && events_[nextEvent_].time <= time) {
        const Event& event = events_[nextEvent_++];
        if (event.type == EventType::SetValue) {
            value_ = event.value;
            approaching_ = false;
        } else {
            approaching_ = true;
            approachTarget_ = event.value;
            approachStartValue_ = value_;
            approachStartTime_ = event.time;
            approachTimeConstant_ = event.timeConstant;
        }
    }

    if (approaching_) {
        const double elapsed = time - approachStartTime_;
        const float decay = static_cast<float>(std::exp(-elapsed / approachTimeConstant_));
        value_ = clamp(approachTarget_ + (approachStartValue_ - approachTarget_) * decay);
    }
    return value_;
}

void ControlParameter::beginBlock(double startTime, double sampleRate, size_t numFrames) noexcept {
    if (rate_ == AutomationRate::KRate) {
        blockLength_ = 1;
        blockValues_[0] = advanceTo(startTime);
        return;
    }

    blockLength_ = std::min(std::max<size_t>(numFrames, 1), blockValues_.size());
    const double period = sampleRate > 0.0 ? 1.0 / sampleRate : 0.0;
    for (size_t i = 0; i < blockLength_; ++i) {
        blockValues_[i] = advanceTo(startTime + static_cast<double>(i) * period);
    }
}

void ControlParameter::addModulation(const AudioBus& source) noexcept {
    const size_t frames = std::min(blockLength_, source.numFrames());
    for (size_t i = 0; i < frames; ++i) {
        blockValues_[i] += source.monoSample(i);
    }
}

void ControlParameter::endBlock() noexcept {
    for (size_t i = 0; i < blockLength_; ++i) {
        const float v = blockValues_[i];
        blockValues_[i] = DSP::detail::isNaN(v) ? value_ : std::clamp(v, min_, max_);
    }
}

} // namespace Patchwork::Engine
