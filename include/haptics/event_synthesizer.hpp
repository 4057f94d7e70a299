#pragma once

#include "audio/feature_series.hpp"
#include "haptics/haptic_event.hpp"
#include <string>
#include <vector>

namespace haptick {
namespace haptics {

/**
 * Feature compared against the 0.6 / 0.5 cut-offs of the heavy and medium
 * categories, next to RMS.
 */
enum class ClassifierFeature {
    NORMALIZED_CENTROID,   // Spectral centroid divided by its peak over the stream
    ROLLOFF                // Spectral rolloff fraction
};

std::string toString(ClassifierFeature feature);
bool classifierFeatureFromString(const std::string& name, ClassifierFeature& feature);

struct EventSynthesizerConfig {
    int fps;
    bool decimate;             // Keep only even output indices
    float intensityGain;       // intensity = clamp(rms * gain, 0, 1)
    float intensityFloor;      // Fixed minimum intensity, 0 disables it
    ClassifierFeature classifierFeature;

    EventSynthesizerConfig()
        : fps(60), decimate(false), intensityGain(2.0f), intensityFloor(0.0f),
          classifierFeature(ClassifierFeature::NORMALIZED_CENTROID) {}
};

/**
 * Turns smoothed, resampled feature sequences into classified haptic events.
 */
class EventSynthesizer {
public:
    explicit EventSynthesizer(const EventSynthesizerConfig& config = EventSynthesizerConfig());

    /**
     * @param smoothed Resampled and smoothed series; needs rms, spectralCentroid
     *                 and (for ROLLOFF classification) spectralRolloff
     * @param threshold Calibrated intensity gate, events need intensity > threshold
     * @param duration Stream duration in seconds, upper bound for event times
     */
    std::vector<HapticEvent> synthesize(const audio::FeatureSeries& smoothed,
                                        float threshold, double duration) const;

    /**
     * First match wins, all comparisons strict:
     * rms > 0.7 && secondary > 0.6 -> heavy, rms > 0.4 && secondary > 0.5 -> medium,
     * rms > 0.2 -> light, otherwise soft.
     */
    static HapticType classify(float rms, float secondary);

    const EventSynthesizerConfig& getConfig() const { return config_; }

private:
    EventSynthesizerConfig config_;
};

} // namespace haptics
} // namespace haptick
