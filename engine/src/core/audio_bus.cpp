#include "core/audio_bus.h"
#include "core/engine_config.h"

#include <failsafe/failsafe.hh>

#include <algorithm>
#include <cmath>

namespace Patchwork::Engine {

AudioBus::AudioBus(size_t numChannels, size_t numFrames) {
    resize(numChannels, numFrames);
}

void AudioBus::resize(size_t numChannels, size_t numFrames) {
    if (numChannels == 0 || numChannels > kMaxChannels) {
        THROW_RUNTIME("AudioBus channel count out of range");
    }
    channels_ = numChannels;
    frames_ = numFrames;
    data_.assign(numChannels * numFrames, 0.0f);
}

void AudioBus::clear() noexcept {
    std::fill(data_.begin(), data_.end(), 0.0f);
}

void AudioBus::accumulate(const AudioBus& source) noexcept {
    const size_t frames = std::min(frames_, source.frames_);
    if (frames == 0) return;

    if (source.channels_ == channels_) {
        for (size_t c = 0; c < channels_; ++c) {
            float* dst = channel(c);
            const float* src = source.channel(c);
            for (size_t i = 0; i < frames; ++i) dst[i] += src[i];
        }
    } else if (source.channels_ == 1) {
        const float* src = source.channel(0);
        for (size_t c = 0; c < channels_; ++c) {
            float* dst = channel(c);
            for (size_t i = 0; i < frames; ++i) dst[i] += src[i];
        }
    } else if (channels_ == 1) {
        float* dst = channel(0);
        for (size_t i = 0; i < frames; ++i) dst[i] += source.monoSample(i);
    } else {
        const size_t common = std::min(channels_, source.channels_);
        for (size_t c = 0; c < common; ++c) {
            float* dst = channel(c);
            const float* src = source.channel(c);
            for (size_t i = 0; i < frames; ++i) dst[i] += src[i];
        }
    }
}

void AudioBus::copyFrom(const AudioBus& source) noexcept {
    clear();
    accumulate(source);
}

void AudioBus::applyGain(float gain) noexcept {
    for (float& sample : data_) sample *= gain;
}

float AudioBus::monoSample(size_t frame) const noexcept {
    if (channels_ == 0 || frame >= frames_) return 0.0f;
    float sum = 0.0f;
    for (size_t c = 0; c < channels_; ++c) sum += data_[c * frames_ + frame];
    return sum / static_cast<float>(channels_);
}

float AudioBus::peak() const noexcept {
    float result = 0.0f;
    for (float sample : data_) result = std::max(result, std::abs(sample));
    return result;
}

} // namespace Patchwork::Engine
