#pragma once

// ==============================================================================
// Source Processors - Scheduled Oscillators
// ==============================================================================
// Inlet-less sources with start(when) / stop(when) scheduling in graph time.
// Outside [start, stop) the outlet is silent and the phase does not advance.
//
// | Node             | Parameters                 | Outlets  |
// |------------------|----------------------------|----------|
// | oscillator       | frequency                  | 1 (mono) |
// | pulse-oscillator | frequency, width [-1, 1]   | 1 (mono) |
// ==============================================================================

#include "graph/node_processor.h"

#include <patchwork/dsp/primitives/polyblep_oscillator.h>

#include <limits>
#include <vector>

namespace Patchwork::Engine {

/// start()/stop() bookkeeping shared by scheduled sources.
class SourceSchedule {
public:
    /// @return false if already started
    bool start(double when) noexcept;
    /// @return false if never started
    bool stop(double when) noexcept;

    [[nodiscard]] bool isRunning(double time) const noexcept {
        return started_ && time >= startTime_ && time < stopTime_;
    }

private:
    bool started_ = false;
    double startTime_ = 0.0;
    double stopTime_ = std::numeric_limits<double>::infinity();
};

class OscillatorProcessor final : public NodeProcessor {
public:
    OscillatorProcessor(DSP::OscWaveform waveform, float frequency, float width = 0.0f);

    void prepare(double sampleRate, size_t maxBlockSize) override;
    void reset() noexcept override { oscillator_.reset(); }
    void process(ProcessContext& ctx) noexcept override;
    [[nodiscard]] std::vector<ParameterDescriptor> parameterDescriptors(double sampleRate) const override;

    bool start(double when) override { return schedule_.start(when); }
    bool stop(double when) override { return schedule_.stop(when); }

    [[nodiscard]] DSP::OscWaveform waveform() const noexcept { return oscillator_.waveform(); }

private:
    DSP::PolyBlepOscillator oscillator_;
    SourceSchedule schedule_;
    float initialFrequency_;
    float initialWidth_;
    double sampleRate_ = 44100.0;
};

} // namespace Patchwork::Engine
