#include "haptics/smoother.hpp"
#include "utils/error_handler.hpp"
#include <algorithm>

namespace haptick {
namespace haptics {

Smoother::Smoother(size_t windowSize)
    : windowSize_(windowSize) {
    if (windowSize_ == 0 || windowSize_ % 2 == 0) {
        throw utils::ConfigurationException("Smoothing window must be odd and positive",
                                            "windowSize=" + std::to_string(windowSize_));
    }
}

std::vector<float> Smoother::smooth(const std::vector<float>& values) const {
    const size_t count = values.size();
    std::vector<float> result(count, 0.0f);
    if (count == 0) {
        return result;
    }

    const size_t halfWindow = windowSize_ / 2;

    // Running prefix sums keep this linear in the sequence length
    std::vector<double> prefix(count + 1, 0.0);
    for (size_t i = 0; i < count; ++i) {
        prefix[i + 1] = prefix[i] + values[i];
    }

    for (size_t i = 0; i < count; ++i) {
        const size_t first = i >= halfWindow ? i - halfWindow : 0;
        const size_t last = std::min(count - 1, i + halfWindow);
        const double sum = prefix[last + 1] - prefix[first];
        result[i] = static_cast<float>(sum / static_cast<double>(last - first + 1));
    }

    return result;
}

audio::FeatureSeries Smoother::smooth(const audio::FeatureSeries& series) const {
    audio::FeatureSeries result;
    for (const auto& entry : series) {
        result.set(entry.first, smooth(entry.second));
    }
    return result;
}

} // namespace haptics
} // namespace haptick
