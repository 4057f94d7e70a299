#include "audio/sample_buffer.hpp"
#include "utils/error_handler.hpp"

namespace haptick {
namespace audio {

SampleBuffer::SampleBuffer(std::vector<float> samples, float sampleRate)
    : samples_(std::move(samples)), sampleRate_(sampleRate) {
    if (!(sampleRate_ > 0.0f)) {
        throw utils::AudioSourceUnavailableException(
            "Sample rate must be positive", std::to_string(sampleRate_));
    }
}

double SampleBuffer::duration() const {
    if (sampleRate_ <= 0.0f) {
        return 0.0;
    }
    return static_cast<double>(samples_.size()) / static_cast<double>(sampleRate_);
}

MemoryAudioSource::MemoryAudioSource(SampleBuffer buffer, std::string name)
    : buffer_(std::move(buffer)), name_(std::move(name)) {
}

} // namespace audio
} // namespace haptick
