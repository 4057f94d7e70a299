#pragma once

#include "audio/feature_series.hpp"
#include <cstddef>
#include <vector>

namespace haptick {
namespace haptics {

/**
 * Linear interpolation of feature sequences onto a new length.
 *
 * Output index i maps to source index i * (S - 1) / (T - 1); both endpoints
 * are reproduced exactly and T == S is the identity.
 */
class Resampler {
public:
    /**
     * @throws EmptySeriesException if source is empty and targetLength > 0
     */
    static std::vector<float> resample(const std::vector<float>& source, size_t targetLength);

    /**
     * Resample every sequence of `series` to targetLength.
     * @throws EmptySeriesException if the series has no values and targetLength > 0
     */
    static audio::FeatureSeries resample(const audio::FeatureSeries& series, size_t targetLength);

    // Largest haptic frame count a single stream may hold
    static constexpr size_t MAX_OUTPUT_FRAMES = 100000000;

    // Number of output frames for a duration at a given rate: floor(duration * fps),
    // saturated at MAX_OUTPUT_FRAMES
    static size_t outputFrameCount(double durationSeconds, int fps);
};

} // namespace haptics
} // namespace haptick
