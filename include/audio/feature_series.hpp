#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace haptick {
namespace audio {

/**
 * Scalar features of one analysis frame
 */
struct FeatureFrame {
    float rms;                   // Root mean square of the raw frame samples
    float dominantFrequencyHz;   // Frequency of the strongest bin
    float spectralRolloff;       // Rolloff bin as a fraction of the half spectrum, [0, 1]
    float spectralCentroidHz;    // Energy-weighted mean frequency
    float spectralBandwidthHz;   // Energy-weighted spread around the centroid

    FeatureFrame()
        : rms(0.0f), dominantFrequencyHz(0.0f), spectralRolloff(0.0f),
          spectralCentroidHz(0.0f), spectralBandwidthHz(0.0f) {}
};

/**
 * Named feature sequences of equal length, in frame order
 */
class FeatureSeries {
public:
    static const char* const RMS;
    static const char* const DOMINANT_FREQUENCY;
    static const char* const SPECTRAL_ROLLOFF;
    static const char* const SPECTRAL_CENTROID;
    static const char* const SPECTRAL_BANDWIDTH;

    FeatureSeries() = default;

    static FeatureSeries fromFrames(const std::vector<FeatureFrame>& frames);

    /**
     * Add or replace a sequence.
     * @throws std::invalid_argument if its length differs from the sequences already present
     */
    void set(const std::string& name, std::vector<float> values);

    /**
     * @throws std::out_of_range if no sequence has this name
     */
    const std::vector<float>& get(const std::string& name) const;

    bool has(const std::string& name) const;
    std::vector<std::string> names() const;

    // Common length of every sequence, 0 when the series is empty
    size_t length() const { return length_; }
    size_t featureCount() const { return series_.size(); }
    bool empty() const { return series_.empty(); }

    std::map<std::string, std::vector<float>>::const_iterator begin() const { return series_.begin(); }
    std::map<std::string, std::vector<float>>::const_iterator end() const { return series_.end(); }

private:
    std::map<std::string, std::vector<float>> series_;
    size_t length_ = 0;
};

} // namespace audio
} // namespace haptick
