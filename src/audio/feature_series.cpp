#include "audio/feature_series.hpp"
#include <stdexcept>

namespace haptick {
namespace audio {

const char* const FeatureSeries::RMS = "rms";
const char* const FeatureSeries::DOMINANT_FREQUENCY = "dominantFrequency";
const char* const FeatureSeries::SPECTRAL_ROLLOFF = "spectralRolloff";
const char* const FeatureSeries::SPECTRAL_CENTROID = "spectralCentroid";
const char* const FeatureSeries::SPECTRAL_BANDWIDTH = "spectralBandwidth";

FeatureSeries FeatureSeries::fromFrames(const std::vector<FeatureFrame>& frames) {
    std::vector<float> rms, dominant, rolloff, centroid, bandwidth;
    rms.reserve(frames.size());
    dominant.reserve(frames.size());
    rolloff.reserve(frames.size());
    centroid.reserve(frames.size());
    bandwidth.reserve(frames.size());

    for (const auto& frame : frames) {
        rms.push_back(frame.rms);
        dominant.push_back(frame.dominantFrequencyHz);
        rolloff.push_back(frame.spectralRolloff);
        centroid.push_back(frame.spectralCentroidHz);
        bandwidth.push_back(frame.spectralBandwidthHz);
    }

    FeatureSeries series;
    series.set(RMS, std::move(rms));
    series.set(DOMINANT_FREQUENCY, std::move(dominant));
    series.set(SPECTRAL_ROLLOFF, std::move(rolloff));
    series.set(SPECTRAL_CENTROID, std::move(centroid));
    series.set(SPECTRAL_BANDWIDTH, std::move(bandwidth));
    return series;
}

void FeatureSeries::set(const std::string& name, std::vector<float> values) {
    auto existing = series_.find(name);
    bool onlySequence = series_.empty() || (series_.size() == 1 && existing != series_.end());

    if (!onlySequence && values.size() != length_) {
        throw std::invalid_argument("Feature '" + name + "' has " + std::to_string(values.size()) +
                                    " values, series length is " + std::to_string(length_));
    }

    length_ = values.size();
    series_[name] = std::move(values);
}

const std::vector<float>& FeatureSeries::get(const std::string& name) const {
    auto it = series_.find(name);
    if (it == series_.end()) {
        throw std::out_of_range("Unknown feature: " + name);
    }
    return it->second;
}

bool FeatureSeries::has(const std::string& name) const {
    return series_.find(name) != series_.end();
}

std::vector<std::string> FeatureSeries::names() const {
    std::vector<std::string> result;
    result.reserve(series_.size());
    for (const auto& entry : series_) {
        result.push_back(entry.first);
    }
    return result;
}

} // namespace audio
} // namespace haptick
