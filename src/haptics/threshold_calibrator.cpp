#include "haptics/threshold_calibrator.hpp"
#include <cmath>
#include <numeric>

namespace haptick {
namespace haptics {

ThresholdCalibrator::ThresholdCalibrator(float k)
    : k_(k) {
}

float ThresholdCalibrator::calibrate(const std::vector<float>& rms) const {
    if (rms.empty()) {
        return 0.0f;
    }

    const double average = mean(rms);
    const double stdDev = populationStdDev(rms, average);
    return static_cast<float>(average + k_ * stdDev);
}

double ThresholdCalibrator::mean(const std::vector<float>& values) {
    if (values.empty()) return 0.0;
    double sum = std::accumulate(values.begin(), values.end(), 0.0);
    return sum / static_cast<double>(values.size());
}

double ThresholdCalibrator::populationStdDev(const std::vector<float>& values, double mean) {
    if (values.empty()) return 0.0;

    double squaredDifferences = 0.0;
    for (float value : values) {
        const double diff = value - mean;
        squaredDifferences += diff * diff;
    }
    return std::sqrt(squaredDifferences / static_cast<double>(values.size()));
}

} // namespace haptics
} // namespace haptick
