#include <gtest/gtest.h>
#include "audio/wav_file_source.hpp"
#include "utils/error_handler.hpp"
#include "../fixtures/test_data_generator.hpp"
#include <filesystem>
#include <memory>

using namespace haptick::audio;
using haptick::utils::AudioSourceUnavailableException;

class WavFileSourceTest : public ::testing::Test {
protected:
    void SetUp() override {
        generator_ = std::make_unique<fixtures::TestDataGenerator>();
        testDir_ = std::filesystem::temp_directory_path() / "haptick_wav_test";
        std::filesystem::create_directories(testDir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(testDir_);
    }

    std::string path(const std::string& name) const {
        return (testDir_ / name).string();
    }

    std::unique_ptr<fixtures::TestDataGenerator> generator_;
    std::filesystem::path testDir_;
};

TEST_F(WavFileSourceTest, ReadsMono16BitPcm) {
    std::vector<float> audio = generator_->generateSine(440.0f, 0.5f, 22050, 0.5f);
    generator_->saveAudioToFile(audio, path("mono.wav"), 22050);

    WavFileSource source(path("mono.wav"));
    SampleBuffer buffer = source.read();

    EXPECT_EQ(source.describe(), path("mono.wav"));
    EXPECT_FLOAT_EQ(buffer.sampleRate(), 22050.0f);
    ASSERT_EQ(buffer.size(), audio.size());
    for (size_t i = 0; i < audio.size(); i += 97) {
        EXPECT_NEAR(buffer.samples()[i], audio[i], 1e-3f) << "sample " << i;
    }
}

TEST_F(WavFileSourceTest, ReadsFloatSamples) {
    std::vector<float> audio = {0.0f, 0.25f, -0.5f, 1.0f};
    generator_->saveAudioToFile(audio, path("float.wav"), 48000, 1, fixtures::WavSampleFormat::FLOAT_32);

    SampleBuffer buffer = WavFileSource(path("float.wav")).read();
    ASSERT_EQ(buffer.size(), 4u);
    for (size_t i = 0; i < audio.size(); ++i) {
        EXPECT_FLOAT_EQ(buffer.samples()[i], audio[i]);
    }
}

TEST_F(WavFileSourceTest, DownmixesStereoToMono) {
    std::vector<float> left(100, 0.5f);
    std::vector<float> right(100, -0.25f);
    generator_->saveAudioToFile(fixtures::TestDataGenerator::interleave(left, right),
                                path("stereo.wav"), 44100, 2, fixtures::WavSampleFormat::FLOAT_32);

    SampleBuffer buffer = WavFileSource(path("stereo.wav")).read();
    ASSERT_EQ(buffer.size(), 100u);
    for (float sample : buffer.samples()) {
        EXPECT_FLOAT_EQ(sample, 0.125f);
    }
}

TEST_F(WavFileSourceTest, DownmixAveragesChannels) {
    auto mono = WavFileSource::downmixToMono({1.0f, 0.0f, 0.5f, 0.5f, -1.0f, 1.0f}, 2);
    ASSERT_EQ(mono.size(), 3u);
    EXPECT_FLOAT_EQ(mono[0], 0.5f);
    EXPECT_FLOAT_EQ(mono[1], 0.5f);
    EXPECT_FLOAT_EQ(mono[2], 0.0f);

    EXPECT_EQ(WavFileSource::downmixToMono({0.1f, 0.2f}, 1).size(), 2u);
}

TEST_F(WavFileSourceTest, MissingFileIsUnavailable) {
    WavFileSource source(path("does_not_exist.wav"));
    try {
        source.read();
        FAIL() << "Expected AudioSourceUnavailableException";
    } catch (const AudioSourceUnavailableException& e) {
        EXPECT_EQ(e.getErrorInfo().category, haptick::utils::ErrorCategory::AUDIO_SOURCE);
        EXPECT_EQ(e.getErrorInfo().details, path("does_not_exist.wav"));
    }
}

TEST_F(WavFileSourceTest, RejectsNonWavBytes) {
    WavFormat format;
    std::vector<uint8_t> garbage = {'O', 'g', 'g', 'S', 0, 0, 0, 0, 0, 0, 0, 0};
    EXPECT_THROW(WavFileSource::decode(garbage, format), AudioSourceUnavailableException);
    EXPECT_THROW(WavFileSource::decode({}, format), AudioSourceUnavailableException);
}

TEST_F(WavFileSourceTest, RejectsHeaderWithoutData) {
    std::vector<uint8_t> bytes = {'R', 'I', 'F', 'F', 4, 0, 0, 0, 'W', 'A', 'V', 'E'};
    WavFormat format;
    EXPECT_THROW(WavFileSource::decode(bytes, format), AudioSourceUnavailableException);
}

TEST_F(WavFileSourceTest, Decodes24BitNegativeSamples) {
    // 44-byte header: mono PCM, 8000 Hz, 24 bits, followed by five samples
    std::vector<uint8_t> bytes = {
        'R', 'I', 'F', 'F', 51, 0, 0, 0, 'W', 'A', 'V', 'E',
        'f', 'm', 't', ' ', 16, 0, 0, 0,
        1, 0, 1, 0, 0x40, 0x1F, 0, 0, 0xC0, 0x5D, 0, 0, 3, 0, 24, 0,
        'd', 'a', 't', 'a', 15, 0, 0, 0,
        0x00, 0x00, 0x80,  // -8388608
        0xFF, 0xFF, 0xFF,  // -1
        0x00, 0x00, 0xC0,  // -4194304
        0xFF, 0xFF, 0x7F,  // 8388607
        0x00, 0x00, 0x40,  // 4194304
    };

    WavFormat format;
    std::vector<float> samples = WavFileSource::decode(bytes, format);

    EXPECT_EQ(format.encoding, WavEncoding::PCM_24);
    ASSERT_EQ(samples.size(), 5u);
    EXPECT_FLOAT_EQ(samples[0], -1.0f);
    EXPECT_FLOAT_EQ(samples[1], -1.0f / 8388608.0f);
    EXPECT_FLOAT_EQ(samples[2], -0.5f);
    EXPECT_FLOAT_EQ(samples[3], 8388607.0f / 8388608.0f);
    EXPECT_FLOAT_EQ(samples[4], 0.5f);
}

TEST_F(WavFileSourceTest, DecodeReportsFormat) {
    generator_->saveAudioToFile(std::vector<float>(10, 0.0f), path("fmt.wav"), 16000);

    WavFileSource source(path("fmt.wav"));
    SampleBuffer buffer = source.read();
    EXPECT_EQ(buffer.size(), 10u);
    EXPECT_DOUBLE_EQ(buffer.duration(), 10.0 / 16000.0);
}

TEST_F(WavFileSourceTest, MemorySourceReturnsItsBuffer) {
    MemoryAudioSource source(SampleBuffer({0.1f, 0.2f, 0.3f}, 8000.0f), "clip");
    EXPECT_EQ(source.describe(), "clip");
    SampleBuffer buffer = source.read();
    EXPECT_EQ(buffer.size(), 3u);
    EXPECT_FLOAT_EQ(buffer.sampleRate(), 8000.0f);
}

TEST_F(WavFileSourceTest, NonPositiveSampleRateRejected) {
    EXPECT_THROW(SampleBuffer({0.1f}, 0.0f), AudioSourceUnavailableException);
    EXPECT_THROW(SampleBuffer({0.1f}, -44100.0f), AudioSourceUnavailableException);
}
