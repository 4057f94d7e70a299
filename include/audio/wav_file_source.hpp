#pragma once

#include "audio/sample_buffer.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace haptick {
namespace audio {

enum class WavEncoding {
    PCM_16,
    PCM_24,
    PCM_32,
    FLOAT_32,
    UNKNOWN
};

/**
 * Format fields read from the "fmt " chunk
 */
struct WavFormat {
    WavEncoding encoding = WavEncoding::UNKNOWN;
    uint16_t channels = 0;
    uint32_t sampleRate = 0;
    uint16_t bitsPerSample = 0;
    uint16_t blockAlign = 0;
};

/**
 * Reads a RIFF/WAVE file and down-mixes it to mono.
 *
 * Supported encodings: 16/24/32-bit integer PCM and 32-bit IEEE float,
 * including WAVE_FORMAT_EXTENSIBLE wrappers of those.
 */
class WavFileSource : public AudioSource {
public:
    explicit WavFileSource(std::string path);

    SampleBuffer read() override;
    std::string describe() const override { return path_; }

    /**
     * Decode an in-memory RIFF/WAVE image.
     * @param format Receives the parsed format chunk
     * @throws AudioSourceUnavailableException on malformed or unsupported data
     */
    static std::vector<float> decode(const std::vector<uint8_t>& bytes, WavFormat& format,
                                     const std::string& origin = "");

    // Average interleaved channels into a single channel
    static std::vector<float> downmixToMono(const std::vector<float>& interleaved, uint16_t channels);

private:
    std::string path_;
};

} // namespace audio
} // namespace haptick
