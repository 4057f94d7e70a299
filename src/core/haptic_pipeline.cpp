#include "core/haptic_pipeline.hpp"
#include "audio/spectral_analyzer.hpp"
#include "haptics/event_synthesizer.hpp"
#include "haptics/resampler.hpp"
#include "haptics/smoother.hpp"
#include "haptics/threshold_calibrator.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <chrono>
#include <cmath>
#include <sstream>

namespace haptick {
namespace core {

std::string toString(PipelineStage stage) {
    switch (stage) {
        case PipelineStage::ANALYSIS: return "analysis";
        case PipelineStage::RESAMPLING: return "resampling";
        case PipelineStage::SMOOTHING: return "smoothing";
        case PipelineStage::CALIBRATION: return "calibration";
        case PipelineStage::SYNTHESIS: return "synthesis";
        case PipelineStage::COMPLETE: return "complete";
    }
    return "unknown";
}

HapticPipeline::HapticPipeline(const PipelineConfig& config)
    : config_(config) {
    PipelineConfigManager manager;
    auto validation = manager.validateConfig(config_);
    if (!validation.isValid) {
        std::ostringstream details;
        for (size_t i = 0; i < validation.errors.size(); ++i) {
            details << (i > 0 ? "; " : "") << validation.errors[i];
        }
        throw utils::ConfigurationException("Invalid pipeline configuration", details.str());
    }
    for (const auto& warning : validation.warnings) {
        utils::Logger::warn(warning);
    }
}

void HapticPipeline::checkpoint(PipelineStage stage, float progress) const {
    if (cancellationCheck_ && stage != PipelineStage::COMPLETE && cancellationCheck_()) {
        utils::PipelineCancelledException cancelled(toString(stage));
        utils::ErrorHandler::getInstance().reportError(cancelled.getErrorInfo());
        throw cancelled;
    }
    if (progressCallback_) {
        progressCallback_(stage, progress);
    }
}

audio::FeatureSeries HapticPipeline::analyze(const audio::SampleBuffer& buffer) const {
    utils::ErrorContext context("SpectralAnalyzer");
    audio::FeatureSeries features;
    TRY_WITH_ERROR_HANDLING(features = audio::SpectralAnalyzer(config_.analyzerConfig()).analyze(buffer));
    return features;
}

haptics::HapticStream HapticPipeline::run(const audio::SampleBuffer& buffer) const {
    return run(buffer, buffer.duration());
}

haptics::HapticStream HapticPipeline::run(const audio::SampleBuffer& buffer, double duration) const {
    if (!std::isfinite(duration) || duration < 0.0) {
        throw utils::ConfigurationException("Duration must be a non-negative number of seconds",
                                            std::to_string(duration));
    }
    if (duration * config_.fps > static_cast<double>(haptics::Resampler::MAX_OUTPUT_FRAMES)) {
        throw utils::ConfigurationException("Duration at the configured fps exceeds the output frame limit",
                                            "duration=" + std::to_string(duration) +
                                                " fps=" + std::to_string(config_.fps) + " max=" +
                                                std::to_string(haptics::Resampler::MAX_OUTPUT_FRAMES));
    }

    auto start = std::chrono::steady_clock::now();

    checkpoint(PipelineStage::ANALYSIS, 0.0f);
    audio::FeatureSeries features = analyze(buffer);
    if (features.length() == 0) {
        utils::EmptySeriesException empty("Audio buffer yielded no analysis frames",
                                          audio::FeatureSeries::RMS);
        utils::ErrorHandler::getInstance().reportError(empty.getErrorInfo());
        throw empty;
    }

    const size_t outputFrames = haptics::Resampler::outputFrameCount(duration, config_.fps);

    checkpoint(PipelineStage::RESAMPLING, 0.4f);
    audio::FeatureSeries resampled;
    {
        utils::ErrorContext context("Resampler");
        TRY_WITH_ERROR_HANDLING(resampled = haptics::Resampler::resample(features, outputFrames));
    }

    checkpoint(PipelineStage::SMOOTHING, 0.6f);
    audio::FeatureSeries smoothed;
    {
        utils::ErrorContext context("Smoother");
        TRY_WITH_ERROR_HANDLING(smoothed = haptics::Smoother(config_.windowSize).smooth(resampled));
    }

    checkpoint(PipelineStage::CALIBRATION, 0.7f);
    const float threshold = haptics::ThresholdCalibrator(config_.thresholdK)
                                .calibrate(smoothed.get(audio::FeatureSeries::RMS));

    checkpoint(PipelineStage::SYNTHESIS, 0.8f);
    haptics::HapticStream stream;
    stream.metadata = haptics::HapticMetadata(config_.fps, duration, outputFrames);
    {
        utils::ErrorContext context("EventSynthesizer");
        TRY_WITH_ERROR_HANDLING(stream.events = haptics::EventSynthesizer(config_.synthesizerConfig())
                                                    .synthesize(smoothed, threshold, duration));
    }

    checkpoint(PipelineStage::COMPLETE, 1.0f);

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    utils::Logger::info("Generated " + std::to_string(stream.events.size()) + " haptic events from " +
                        std::to_string(features.length()) + " analysis frames (" +
                        std::to_string(outputFrames) + " output frames, threshold " +
                        std::to_string(threshold) + ") in " + std::to_string(elapsed.count()) + "ms");
    return stream;
}

haptics::HapticStream HapticPipeline::run(audio::AudioSource& source) const {
    audio::SampleBuffer buffer;
    {
        utils::ErrorContext context("AudioSource");
        TRY_WITH_ERROR_HANDLING(buffer = source.read());
    }
    utils::Logger::debug("Read " + std::to_string(buffer.size()) + " samples from " + source.describe());
    return run(buffer);
}

haptics::HapticStream HapticPipeline::process(audio::AudioSource& source, haptics::HapticSink& sink) const {
    haptics::HapticStream stream = run(source);
    {
        utils::ErrorContext context("HapticSink");
        TRY_WITH_ERROR_HANDLING(sink.consume(stream));
    }
    return stream;
}

} // namespace core
} // namespace haptick
