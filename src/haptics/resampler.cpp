#include "haptics/resampler.hpp"
#include "utils/error_handler.hpp"
#include <cmath>

namespace haptick {
namespace haptics {

std::vector<float> Resampler::resample(const std::vector<float>& source, size_t targetLength) {
    if (targetLength == 0) {
        return {};
    }
    if (source.empty()) {
        throw utils::EmptySeriesException("Cannot resample an empty sequence to " +
                                          std::to_string(targetLength) + " values");
    }

    const size_t sourceLength = source.size();
    std::vector<float> result(targetLength);

    if (targetLength == 1) {
        result[0] = source[0];
        return result;
    }

    const double scale = static_cast<double>(sourceLength - 1) / static_cast<double>(targetLength - 1);
    for (size_t i = 0; i < targetLength; ++i) {
        const double sourceIndex = static_cast<double>(i) * scale;
        size_t lower = static_cast<size_t>(sourceIndex);
        if (lower >= sourceLength - 1) {
            result[i] = source[sourceLength - 1];
            continue;
        }
        const double fraction = sourceIndex - static_cast<double>(lower);
        result[i] = static_cast<float>(source[lower] * (1.0 - fraction) + source[lower + 1] * fraction);
    }

    // Guard the last value against rounding in the index mapping
    result[targetLength - 1] = source[sourceLength - 1];
    return result;
}

audio::FeatureSeries Resampler::resample(const audio::FeatureSeries& series, size_t targetLength) {
    if (targetLength > 0 && (series.empty() || series.length() == 0)) {
        throw utils::EmptySeriesException("Feature series has no frames",
                                          series.empty() ? "" : series.names().front());
    }

    audio::FeatureSeries result;
    for (const auto& entry : series) {
        result.set(entry.first, resample(entry.second, targetLength));
    }
    return result;
}

size_t Resampler::outputFrameCount(double durationSeconds, int fps) {
    if (!(durationSeconds > 0.0) || fps <= 0) {
        return 0;
    }
    // Nudge by a small epsilon so that e.g. 1.0 s * 60 does not floor to 59
    const double frames = std::floor(durationSeconds * fps + 1e-9);
    if (!(frames < static_cast<double>(MAX_OUTPUT_FRAMES))) {
        return MAX_OUTPUT_FRAMES;
    }
    return static_cast<size_t>(frames);
}

} // namespace haptics
} // namespace haptick
