#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace haptick {
namespace audio {

/**
 * Mono PCM samples at a fixed sample rate. Immutable once constructed.
 */
class SampleBuffer {
public:
    SampleBuffer() = default;

    /**
     * @param samples Mono samples, nominally in [-1, 1]
     * @param sampleRate Sample rate in Hz, must be positive
     * @throws AudioSourceUnavailableException if sampleRate is not positive
     */
    SampleBuffer(std::vector<float> samples, float sampleRate);

    const std::vector<float>& samples() const { return samples_; }
    const float* data() const { return samples_.data(); }
    size_t size() const { return samples_.size(); }
    bool empty() const { return samples_.empty(); }
    float sampleRate() const { return sampleRate_; }

    // sampleCount / sampleRate, in seconds
    double duration() const;

private:
    std::vector<float> samples_;
    float sampleRate_ = 0.0f;
};

/**
 * Boundary to whatever decodes audio (file reader, media demuxer, capture).
 */
class AudioSource {
public:
    virtual ~AudioSource() = default;

    /**
     * Produce the complete mono buffer.
     * @throws AudioSourceUnavailableException when no audio can be provided
     */
    virtual SampleBuffer read() = 0;

    /**
     * Human readable name of the source, used in logs and error details
     */
    virtual std::string describe() const = 0;
};

/**
 * Source wrapping a buffer that is already in memory
 */
class MemoryAudioSource : public AudioSource {
public:
    explicit MemoryAudioSource(SampleBuffer buffer, std::string name = "memory");

    SampleBuffer read() override { return buffer_; }
    std::string describe() const override { return name_; }

private:
    SampleBuffer buffer_;
    std::string name_;
};

} // namespace audio
} // namespace haptick
