#include "audio/framer.hpp"
#include <cmath>
#include <stdexcept>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace haptick {
namespace audio {

Framer::Framer(const SampleBuffer& buffer, size_t frameLength)
    : buffer_(buffer),
      frameLength_(frameLength),
      frameCount_(countFrames(buffer.size(), frameLength)),
      window_(hannWindow(frameLength)) {
}

AnalysisFrame Framer::frame(size_t index) const {
    if (index >= frameCount_) {
        throw std::out_of_range("Frame index " + std::to_string(index) +
                                " out of range (" + std::to_string(frameCount_) + " frames)");
    }

    AnalysisFrame result;
    result.index = index;
    result.offset = index * frameLength_;

    const float* start = buffer_.data() + result.offset;
    result.raw.assign(start, start + frameLength_);
    result.windowed.resize(frameLength_);
    for (size_t i = 0; i < frameLength_; ++i) {
        result.windowed[i] = result.raw[i] * window_[i];
    }

    return result;
}

std::vector<AnalysisFrame> Framer::frames() const {
    std::vector<AnalysisFrame> result;
    result.reserve(frameCount_);
    for (size_t i = 0; i < frameCount_; ++i) {
        result.push_back(frame(i));
    }
    return result;
}

size_t Framer::countFrames(size_t sampleCount, size_t frameLength) {
    if (frameLength == 0) {
        return 0;
    }
    return sampleCount / frameLength;
}

std::vector<float> Framer::hannWindow(size_t length) {
    std::vector<float> window(length, 1.0f);
    if (length < 2) {
        return window;
    }

    const double denominator = static_cast<double>(length - 1);
    for (size_t i = 0; i < length; ++i) {
        window[i] = static_cast<float>(0.5 - 0.5 * std::cos(2.0 * M_PI * static_cast<double>(i) / denominator));
    }
    return window;
}

} // namespace audio
} // namespace haptick
