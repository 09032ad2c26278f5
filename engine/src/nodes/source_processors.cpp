#include "nodes/source_processors.h"

#include <algorithm>
#include <span>

namespace Patchwork::Engine {

// =============================================================================
// SourceSchedule
// =============================================================================

bool SourceSchedule::start(double when) noexcept {
    if (started_) return false;
    startTime_ = std::max(when, 0.0);
    started_ = true;
    return true;
}

bool SourceSchedule::stop(double when) noexcept {
    if (!started_) return false;
    stopTime_ = std::max(when, startTime_);
    return true;
}

// =============================================================================
// OscillatorProcessor
// =============================================================================

OscillatorProcessor::OscillatorProcessor(DSP::OscWaveform waveform, float frequency, float width)
    : oscillator_(waveform),
      initialFrequency_(std::max(DSP::detail::sanitize(frequency, DSP::kOscDefaultFrequency), 0.0f)),
      initialWidth_(std::clamp(DSP::detail::sanitize(width), -1.0f, 1.0f)) {}

void OscillatorProcessor::prepare(double sampleRate, size_t /*maxBlockSize*/) {
    sampleRate_ = sampleRate;
    initialFrequency_ = std::min(initialFrequency_, static_cast<float>(sampleRate * 0.5));
    oscillator_.prepare(sampleRate);
}

std::vector<ParameterDescriptor> OscillatorProcessor::parameterDescriptors(double sampleRate) const {
    std::vector<ParameterDescriptor> descriptors{
        {"frequency", 0.0f, static_cast<float>(sampleRate * 0.5), initialFrequency_, AutomationRate::ARate},
    };
    if (oscillator_.waveform() == DSP::OscWaveform::Pulse) {
        descriptors.push_back({"width", -1.0f, 1.0f, initialWidth_, AutomationRate::ARate});
    }
    return descriptors;
}

void OscillatorProcessor::process(ProcessContext& ctx) noexcept {
    const auto frequency = ctx.param(0);
    const auto width = oscillator_.waveform() == DSP::OscWaveform::Pulse ? ctx.param(1)
                                                                         : std::span<const float>{};
    float* dst = ctx.outputs[0].channel(0);
    const double period = 1.0 / sampleRate_;
    for (size_t i = 0; i < ctx.numFrames; ++i) {
        const double t = ctx.blockStartTime + static_cast<double>(i) * period;
        if (!schedule_.isRunning(t)) {
            dst[i] = 0.0f;
            continue;
        }
        dst[i] = oscillator_.process(DSP::sampleParam(frequency, i), DSP::sampleParam(width, i));
    }
}

} // namespace Patchwork::Engine
