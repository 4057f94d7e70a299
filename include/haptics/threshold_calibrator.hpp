#pragma once

#include <vector>

namespace haptick {
namespace haptics {

/**
 * Adaptive emission gate: mean + k * stddev of the smoothed RMS sequence,
 * using the population standard deviation.
 */
class ThresholdCalibrator {
public:
    explicit ThresholdCalibrator(float k = 0.5f);

    // 0 for an empty sequence
    float calibrate(const std::vector<float>& rms) const;

    float k() const { return k_; }

    static double mean(const std::vector<float>& values);
    static double populationStdDev(const std::vector<float>& values, double mean);

private:
    float k_;
};

} // namespace haptics
} // namespace haptick
