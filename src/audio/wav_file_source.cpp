#include "audio/wav_file_source.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <algorithm>
#include <cstring>
#include <fstream>
#include <iterator>

namespace haptick {
namespace audio {

namespace {

constexpr uint16_t kFormatPcm = 0x0001;
constexpr uint16_t kFormatFloat = 0x0003;
constexpr uint16_t kFormatExtensible = 0xFFFE;

uint16_t readU16(const uint8_t* p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

uint32_t readU32(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

WavEncoding resolveEncoding(uint16_t formatTag, uint16_t bitsPerSample) {
    if (formatTag == kFormatPcm) {
        switch (bitsPerSample) {
            case 16: return WavEncoding::PCM_16;
            case 24: return WavEncoding::PCM_24;
            case 32: return WavEncoding::PCM_32;
            default: return WavEncoding::UNKNOWN;
        }
    }
    if (formatTag == kFormatFloat && bitsPerSample == 32) {
        return WavEncoding::FLOAT_32;
    }
    return WavEncoding::UNKNOWN;
}

float decodeSample(const uint8_t* p, WavEncoding encoding) {
    switch (encoding) {
        case WavEncoding::PCM_16: {
            int16_t value = static_cast<int16_t>(readU16(p));
            return static_cast<float>(value) / 32768.0f;
        }
        case WavEncoding::PCM_24: {
            uint32_t raw = static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
                           (static_cast<uint32_t>(p[2]) << 16);
            if (raw & 0x800000u) {
                raw |= 0xFF000000u; // Sign extend
            }
            return static_cast<float>(static_cast<int32_t>(raw)) / 8388608.0f;
        }
        case WavEncoding::PCM_32: {
            int32_t value = static_cast<int32_t>(readU32(p));
            return static_cast<float>(static_cast<double>(value) / 2147483648.0);
        }
        case WavEncoding::FLOAT_32: {
            uint32_t bits = readU32(p);
            float value;
            std::memcpy(&value, &bits, sizeof(value));
            return value;
        }
        case WavEncoding::UNKNOWN:
            break;
    }
    return 0.0f;
}

} // namespace

WavFileSource::WavFileSource(std::string path)
    : path_(std::move(path)) {
}

SampleBuffer WavFileSource::read() {
    std::ifstream file(path_, std::ios::binary);
    if (!file.is_open()) {
        throw utils::AudioSourceUnavailableException("Failed to open audio file", path_);
    }

    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(file)),
                               std::istreambuf_iterator<char>());
    if (file.bad()) {
        throw utils::AudioSourceUnavailableException("Failed to read audio file", path_);
    }

    WavFormat format;
    std::vector<float> interleaved = decode(bytes, format, path_);
    std::vector<float> mono = downmixToMono(interleaved, format.channels);

    utils::Logger::debug("Loaded " + std::to_string(mono.size()) + " samples at " +
                         std::to_string(format.sampleRate) + " Hz (" +
                         std::to_string(format.channels) + " channel(s)) from " + path_);

    return SampleBuffer(std::move(mono), static_cast<float>(format.sampleRate));
}

std::vector<float> WavFileSource::decode(const std::vector<uint8_t>& bytes, WavFormat& format,
                                         const std::string& origin) {
    if (bytes.size() < 12 || std::memcmp(bytes.data(), "RIFF", 4) != 0 ||
        std::memcmp(bytes.data() + 8, "WAVE", 4) != 0) {
        throw utils::AudioSourceUnavailableException("Not a RIFF/WAVE file", origin);
    }

    bool haveFormat = false;
    const uint8_t* dataChunk = nullptr;
    size_t dataSize = 0;

    size_t pos = 12;
    while (pos + 8 <= bytes.size()) {
        const uint8_t* header = bytes.data() + pos;
        uint32_t chunkSize = readU32(header + 4);
        size_t bodyStart = pos + 8;
        size_t available = bytes.size() - bodyStart;
        size_t bodySize = std::min<size_t>(chunkSize, available);

        if (std::memcmp(header, "fmt ", 4) == 0) {
            if (bodySize < 16) {
                throw utils::AudioSourceUnavailableException("Truncated format chunk", origin);
            }
            const uint8_t* body = bytes.data() + bodyStart;
            uint16_t formatTag = readU16(body);
            format.channels = readU16(body + 2);
            format.sampleRate = readU32(body + 4);
            format.blockAlign = readU16(body + 12);
            format.bitsPerSample = readU16(body + 14);

            if (formatTag == kFormatExtensible && bodySize >= 26) {
                // First two bytes of the SubFormat GUID carry the real format tag
                formatTag = readU16(body + 24);
            }
            format.encoding = resolveEncoding(formatTag, format.bitsPerSample);
            haveFormat = true;
        } else if (std::memcmp(header, "data", 4) == 0) {
            dataChunk = bytes.data() + bodyStart;
            dataSize = bodySize;
        }

        // Chunks are padded to an even size
        pos = bodyStart + chunkSize + (chunkSize & 1u);
    }

    if (!haveFormat) {
        throw utils::AudioSourceUnavailableException("Missing format chunk", origin);
    }
    if (format.encoding == WavEncoding::UNKNOWN) {
        throw utils::AudioSourceUnavailableException(
            "Unsupported WAV encoding", origin + " bits=" + std::to_string(format.bitsPerSample));
    }
    if (format.channels == 0 || format.sampleRate == 0) {
        throw utils::AudioSourceUnavailableException("Invalid channel count or sample rate", origin);
    }
    if (dataChunk == nullptr || dataSize == 0) {
        throw utils::AudioSourceUnavailableException("No audio data", origin);
    }

    const size_t bytesPerSample = format.bitsPerSample / 8;
    const size_t sampleCount = dataSize / bytesPerSample;

    std::vector<float> samples;
    samples.reserve(sampleCount);
    for (size_t i = 0; i < sampleCount; ++i) {
        samples.push_back(decodeSample(dataChunk + i * bytesPerSample, format.encoding));
    }

    return samples;
}

std::vector<float> WavFileSource::downmixToMono(const std::vector<float>& interleaved, uint16_t channels) {
    if (channels <= 1) {
        return interleaved;
    }

    const size_t frames = interleaved.size() / channels;
    if (interleaved.size() % channels != 0) {
        utils::Logger::warn("Interleaved data is not a whole number of frames, dropping the remainder");
    }

    std::vector<float> mono;
    mono.reserve(frames);
    for (size_t frame = 0; frame < frames; ++frame) {
        float sum = 0.0f;
        for (uint16_t ch = 0; ch < channels; ++ch) {
            sum += interleaved[frame * channels + ch];
        }
        mono.push_back(sum / static_cast<float>(channels));
    }

    return mono;
}

} // namespace audio
} // namespace haptick
