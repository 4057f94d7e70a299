#include "haptics/event_synthesizer.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <algorithm>

namespace haptick {
namespace haptics {

namespace {

float clampUnit(float value) {
    return std::min(std::max(value, 0.0f), 1.0f);
}

} // namespace

std::string toString(ClassifierFeature feature) {
    switch (feature) {
        case ClassifierFeature::NORMALIZED_CENTROID: return "normalizedCentroid";
        case ClassifierFeature::ROLLOFF: return "rolloff";
    }
    return "normalizedCentroid";
}

bool classifierFeatureFromString(const std::string& name, ClassifierFeature& feature) {
    if (name == "normalizedCentroid") {
        feature = ClassifierFeature::NORMALIZED_CENTROID;
        return true;
    }
    if (name == "rolloff") {
        feature = ClassifierFeature::ROLLOFF;
        return true;
    }
    return false;
}

EventSynthesizer::EventSynthesizer(const EventSynthesizerConfig& config)
    : config_(config) {
    if (config_.fps <= 0) {
        throw utils::ConfigurationException("fps must be positive", "fps=" + std::to_string(config_.fps));
    }
}

HapticType EventSynthesizer::classify(float rms, float secondary) {
    if (rms > 0.7f && secondary > 0.6f) {
        return HapticType::HEAVY;
    } else if (rms > 0.4f && secondary > 0.5f) {
        return HapticType::MEDIUM;
    } else if (rms > 0.2f) {
        return HapticType::LIGHT;
    }
    return HapticType::SOFT;
}

std::vector<HapticEvent> EventSynthesizer::synthesize(const audio::FeatureSeries& smoothed,
                                                      float threshold, double duration) const {
    const auto& rms = smoothed.get(audio::FeatureSeries::RMS);
    const auto& centroid = smoothed.get(audio::FeatureSeries::SPECTRAL_CENTROID);
    const std::vector<float>* rolloff = nullptr;
    if (config_.classifierFeature == ClassifierFeature::ROLLOFF) {
        rolloff = &smoothed.get(audio::FeatureSeries::SPECTRAL_ROLLOFF);
    }

    const size_t frameCount = smoothed.length();
    const float centroidPeak = centroid.empty() ? 0.0f : *std::max_element(centroid.begin(), centroid.end());

    std::vector<HapticEvent> events;
    for (size_t i = 0; i < frameCount; ++i) {
        if (config_.decimate && i % 2 != 0) {
            continue;
        }

        const float intensity = clampUnit(rms[i] * config_.intensityGain);
        if (!(intensity > threshold) || !(intensity > config_.intensityFloor)) {
            continue;
        }

        const float sharpness = centroidPeak > 0.0f ? clampUnit(centroid[i] / centroidPeak) : 0.0f;
        const float secondary = rolloff != nullptr ? (*rolloff)[i] : sharpness;
        const double time = std::min(static_cast<double>(i) / config_.fps, duration);

        events.emplace_back(time, intensity, sharpness, classify(rms[i], secondary));
    }

    utils::Logger::debug("Synthesized " + std::to_string(events.size()) + " events from " +
                         std::to_string(frameCount) + " frames (threshold " +
                         std::to_string(threshold) + ")");
    return events;
}

} // namespace haptics
} // namespace haptick
