#pragma once

#include "audio/feature_series.hpp"
#include "audio/fft_plan.hpp"
#include "audio/framer.hpp"
#include "audio/sample_buffer.hpp"
#include <cstddef>
#include <vector>

namespace haptick {
namespace audio {

// Configuration for per-frame spectral analysis
struct SpectralAnalyzerConfig {
    size_t frameLength;        // FFT size and hop, power of two
    float rolloffThreshold;    // Energy fraction that defines the rolloff bin
    size_t threads;            // Workers used to analyze frames, 1 = caller thread only

    SpectralAnalyzerConfig()
        : frameLength(512), rolloffThreshold(0.85f), threads(1) {}
};

/**
 * Computes RMS, dominant frequency, spectral rolloff, centroid and bandwidth
 * for every frame of a buffer.
 *
 * Spectra are squared magnitudes |X[k]|^2 over the first frameLength/2 bins.
 * Frames with zero spectral energy report zero for every spectral feature.
 */
class SpectralAnalyzer {
public:
    explicit SpectralAnalyzer(const SpectralAnalyzerConfig& config = SpectralAnalyzerConfig());

    /**
     * Analyze the whole buffer.
     * @return One sequence per feature, frameCount values each (empty buffer: zero values)
     * @throws InvalidFrameSizeException if frameLength is not a power of two or
     *         exceeds the number of samples of a non-empty buffer
     */
    FeatureSeries analyze(const SampleBuffer& buffer) const;

    std::vector<FeatureFrame> analyzeFrames(const SampleBuffer& buffer) const;

    FeatureFrame analyzeFrame(const AnalysisFrame& frame, float sampleRate, FftPlan& plan) const;

    void validateFrameLength(size_t sampleCount) const;

    const SpectralAnalyzerConfig& getConfig() const { return config_; }

    static bool isPowerOfTwo(size_t value);

    // Workers used for `frameCount` frames: min(requested, frameCount, hardware threads), at least 1
    static size_t workerCount(size_t requested, size_t frameCount);

    static float computeRms(const std::vector<float>& samples);
    static float computeDominantFrequency(const std::vector<float>& power, float sampleRate, size_t fftSize);
    static float computeSpectralRolloff(const std::vector<float>& power, float rolloffThreshold = 0.85f);
    static float computeSpectralCentroid(const std::vector<float>& power, float sampleRate, size_t fftSize);
    static float computeSpectralBandwidth(const std::vector<float>& power, float centroidHz,
                                          float sampleRate, size_t fftSize);

private:
    void analyzeRange(const Framer& framer, float sampleRate, size_t first, size_t last,
                      FftPlan& plan, std::vector<FeatureFrame>& out) const;

    SpectralAnalyzerConfig config_;
};

} // namespace audio
} // namespace haptick
