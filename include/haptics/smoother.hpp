#pragma once

#include "audio/feature_series.hpp"
#include <cstddef>
#include <vector>

namespace haptick {
namespace haptics {

/**
 * Centered moving average. The window shrinks at the sequence edges
 * (no padding, no wraparound). Applying it twice is not the same as once.
 */
class Smoother {
public:
    explicit Smoother(size_t windowSize = 11);

    std::vector<float> smooth(const std::vector<float>& values) const;
    audio::FeatureSeries smooth(const audio::FeatureSeries& series) const;

    size_t windowSize() const { return windowSize_; }

private:
    size_t windowSize_;
};

} // namespace haptics
} // namespace haptick
