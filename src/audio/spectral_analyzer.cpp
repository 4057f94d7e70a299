#include "audio/spectral_analyzer.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <algorithm>
#include <cmath>
#include <future>
#include <thread>

namespace haptick {
namespace audio {

SpectralAnalyzer::SpectralAnalyzer(const SpectralAnalyzerConfig& config)
    : config_(config) {
}

bool SpectralAnalyzer::isPowerOfTwo(size_t value) {
    return value >= 2 && (value & (value - 1)) == 0;
}

size_t SpectralAnalyzer::workerCount(size_t requested, size_t frameCount) {
    const size_t hardware = std::max(1u, std::thread::hardware_concurrency());
    return std::max<size_t>(1, std::min({requested, frameCount, hardware}));
}

void SpectralAnalyzer::validateFrameLength(size_t sampleCount) const {
    if (!isPowerOfTwo(config_.frameLength)) {
        throw utils::InvalidFrameSizeException("Frame length must be a power of two", config_.frameLength);
    }
    if (sampleCount > 0 && config_.frameLength > sampleCount) {
        throw utils::InvalidFrameSizeException(
            "Frame length exceeds available samples (" + std::to_string(sampleCount) + ")",
            config_.frameLength);
    }
}

FeatureSeries SpectralAnalyzer::analyze(const SampleBuffer& buffer) const {
    return FeatureSeries::fromFrames(analyzeFrames(buffer));
}

std::vector<FeatureFrame> SpectralAnalyzer::analyzeFrames(const SampleBuffer& buffer) const {
    validateFrameLength(buffer.size());

    Framer framer(buffer, config_.frameLength);
    const size_t frameCount = framer.frameCount();
    std::vector<FeatureFrame> frames(frameCount);
    if (frameCount == 0) {
        return frames;
    }

    const size_t workers = workerCount(config_.threads, frameCount);
    utils::Logger::debug("Analyzing " + std::to_string(frameCount) + " frames of " +
                         std::to_string(config_.frameLength) + " samples on " +
                         std::to_string(workers) + " worker(s)");

    if (workers == 1) {
        FftPlan plan(config_.frameLength);
        analyzeRange(framer, buffer.sampleRate(), 0, frameCount, plan, frames);
        return frames;
    }

    // One plan per worker, created up front so planning stays on this thread
    std::vector<FftPlan> plans;
    plans.reserve(workers);
    for (size_t w = 0; w < workers; ++w) {
        plans.emplace_back(config_.frameLength);
    }

    const size_t chunk = (frameCount + workers - 1) / workers;
    std::vector<std::future<void>> tasks;
    tasks.reserve(workers);
    for (size_t w = 0; w < workers; ++w) {
        const size_t first = w * chunk;
        const size_t last = std::min(frameCount, first + chunk);
        if (first >= last) {
            break;
        }
        FftPlan* plan = &plans[w];
        tasks.push_back(std::async(std::launch::async, [this, &framer, &buffer, &frames, plan, first, last]() {
            analyzeRange(framer, buffer.sampleRate(), first, last, *plan, frames);
        }));
    }

    // Wait for every worker before rethrowing so none outlives the plans
    for (auto& task : tasks) {
        task.wait();
    }
    for (auto& task : tasks) {
        task.get();
    }

    return frames;
}

void SpectralAnalyzer::analyzeRange(const Framer& framer, float sampleRate, size_t first, size_t last,
                                    FftPlan& plan, std::vector<FeatureFrame>& out) const {
    for (size_t i = first; i < last; ++i) {
        out[i] = analyzeFrame(framer.frame(i), sampleRate, plan);
    }
}

FeatureFrame SpectralAnalyzer::analyzeFrame(const AnalysisFrame& frame, float sampleRate, FftPlan& plan) const {
    FeatureFrame features;
    features.rms = computeRms(frame.raw);

    std::vector<float> power;
    plan.powerSpectrum(frame.windowed, power);

    const size_t fftSize = plan.size();
    features.dominantFrequencyHz = computeDominantFrequency(power, sampleRate, fftSize);
    features.spectralRolloff = computeSpectralRolloff(power, config_.rolloffThreshold);
    features.spectralCentroidHz = computeSpectralCentroid(power, sampleRate, fftSize);
    features.spectralBandwidthHz = computeSpectralBandwidth(power, features.spectralCentroidHz,
                                                            sampleRate, fftSize);
    return features;
}

float SpectralAnalyzer::computeRms(const std::vector<float>& samples) {
    if (samples.empty()) return 0.0f;

    double sum = 0.0;
    for (float sample : samples) {
        sum += static_cast<double>(sample) * sample;
    }
    return static_cast<float>(std::sqrt(sum / static_cast<double>(samples.size())));
}

float SpectralAnalyzer::computeDominantFrequency(const std::vector<float>& power, float sampleRate, size_t fftSize) {
    if (power.empty() || fftSize == 0) return 0.0f;

    auto maxIt = std::max_element(power.begin(), power.end());
    size_t maxIndex = static_cast<size_t>(std::distance(power.begin(), maxIt));
    return static_cast<float>(maxIndex) * sampleRate / static_cast<float>(fftSize);
}

float SpectralAnalyzer::computeSpectralRolloff(const std::vector<float>& power, float rolloffThreshold) {
    if (power.empty()) return 0.0f;

    double totalEnergy = 0.0;
    for (float value : power) {
        totalEnergy += value;
    }
    if (totalEnergy <= 0.0) return 0.0f;

    const double target = rolloffThreshold * totalEnergy;
    double cumulativeEnergy = 0.0;
    size_t rolloffIndex = power.size() - 1;
    for (size_t k = 0; k < power.size(); ++k) {
        cumulativeEnergy += power[k];
        if (cumulativeEnergy >= target) {
            rolloffIndex = k;
            break;
        }
    }

    return static_cast<float>(rolloffIndex) / static_cast<float>(power.size());
}

float SpectralAnalyzer::computeSpectralCentroid(const std::vector<float>& power, float sampleRate, size_t fftSize) {
    if (power.empty() || fftSize == 0) return 0.0f;

    const double binHz = static_cast<double>(sampleRate) / static_cast<double>(fftSize);
    double weightedSum = 0.0;
    double totalEnergy = 0.0;
    for (size_t k = 0; k < power.size(); ++k) {
        weightedSum += static_cast<double>(k) * binHz * power[k];
        totalEnergy += power[k];
    }

    return totalEnergy > 0.0 ? static_cast<float>(weightedSum / totalEnergy) : 0.0f;
}

float SpectralAnalyzer::computeSpectralBandwidth(const std::vector<float>& power, float centroidHz,
                                                 float sampleRate, size_t fftSize) {
    if (power.empty() || fftSize == 0) return 0.0f;

    const double binHz = static_cast<double>(sampleRate) / static_cast<double>(fftSize);
    double weightedVariance = 0.0;
    double totalEnergy = 0.0;
    for (size_t k = 0; k < power.size(); ++k) {
        const double deviation = static_cast<double>(k) * binHz - centroidHz;
        weightedVariance += deviation * deviation * power[k];
        totalEnergy += power[k];
    }

    return totalEnergy > 0.0 ? static_cast<float>(std::sqrt(weightedVariance / totalEnergy)) : 0.0f;
}

} // namespace audio
} // namespace haptick
