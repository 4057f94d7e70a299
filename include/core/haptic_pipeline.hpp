#pragma once

#include "audio/feature_series.hpp"
#include "audio/sample_buffer.hpp"
#include "core/pipeline_config.hpp"
#include "haptics/haptic_event.hpp"
#include "haptics/haptic_sink.hpp"
#include <functional>
#include <string>
#include <utility>

namespace haptick {
namespace core {

enum class PipelineStage {
    ANALYSIS,
    RESAMPLING,
    SMOOTHING,
    CALIBRATION,
    SYNTHESIS,
    COMPLETE
};

std::string toString(PipelineStage stage);

/**
 * Runs framing, spectral analysis, resampling, smoothing, threshold
 * calibration and event synthesis over one complete buffer.
 *
 * Every invocation is independent: no state is carried between runs and a
 * failure never yields a partial stream.
 */
class HapticPipeline {
public:
    // Called before each stage starts and once on completion, progress in [0, 1]
    using ProgressCallback = std::function<void(PipelineStage stage, float progress)>;
    // Polled between stages; returning true aborts with PipelineCancelledException
    using CancellationCheck = std::function<bool()>;

    /**
     * @throws ConfigurationException if the configuration does not validate
     */
    explicit HapticPipeline(const PipelineConfig& config = PipelineConfig());

    void setProgressCallback(ProgressCallback callback) { progressCallback_ = std::move(callback); }
    void setCancellationCheck(CancellationCheck check) { cancellationCheck_ = std::move(check); }

    /**
     * Per-frame features of the buffer, before resampling
     */
    audio::FeatureSeries analyze(const audio::SampleBuffer& buffer) const;

    // Duration derived from the buffer
    haptics::HapticStream run(const audio::SampleBuffer& buffer) const;

    /**
     * @param duration Output duration in seconds, e.g. the length of the video
     *                 the audio belongs to
     */
    haptics::HapticStream run(const audio::SampleBuffer& buffer, double duration) const;

    haptics::HapticStream run(audio::AudioSource& source) const;

    // Read from source, run, and hand the result to sink
    haptics::HapticStream process(audio::AudioSource& source, haptics::HapticSink& sink) const;

    const PipelineConfig& getConfig() const { return config_; }

private:
    void checkpoint(PipelineStage stage, float progress) const;

    PipelineConfig config_;
    ProgressCallback progressCallback_;
    CancellationCheck cancellationCheck_;
};

} // namespace core
} // namespace haptick
