#include "taps/scope_tap.h"

#include <algorithm>

namespace Patchwork::Engine {

ScopeTap::ScopeTap(size_t capacity)
    : buffer_(std::max<size_t>(capacity, 1), 0.0f)
{
}

void ScopeTap::onBlock(const AudioBus& bus, double blockStartTime) noexcept {
    lastBlockTime_ = blockStartTime;
    peak_ = bus.peak();
    for (size_t i = 0; i < bus.numFrames(); ++i) {
        buffer_[writeIndex_] = bus.monoSample(i);
        writeIndex_ = (writeIndex_ + 1) % buffer_.size();
    }
    captured_ += bus.numFrames();
}

std::vector<float> ScopeTap::snapshot() const {
    const size_t count = static_cast<size_t>(std::min<uint64_t>(captured_, buffer_.size()));
    std::vector<float> out;
    out.reserve(count);
    size_t index = (writeIndex_ + buffer_.size() - count) % buffer_.size();
    for (size_t i = 0; i < count; ++i) {
        out.push_back(buffer_[index]);
        index = (index + 1) % buffer_.size();
    }
    return out;
}

void ScopeTap::clear() noexcept {
    std::fill(buffer_.begin(), buffer_.end(), 0.0f);
    writeIndex_ = 0;
    captured_ = 0;
    peak_ = 0.0f;
}

} // namespace Patchwork::Engine
