#include "haptics/haptic_event.hpp"
#include "haptics/resampler.hpp"
#include "utils/error_handler.hpp"

namespace haptick {
namespace haptics {

std::string toString(HapticType type) {
    switch (type) {
        case HapticType::HEAVY: return "heavy";
        case HapticType::MEDIUM: return "medium";
        case HapticType::LIGHT: return "light";
        case HapticType::SOFT: return "soft";
    }
    return "soft";
}

HapticType hapticTypeFromString(const std::string& name) {
    if (name == "heavy") return HapticType::HEAVY;
    if (name == "medium") return HapticType::MEDIUM;
    if (name == "light") return HapticType::LIGHT;
    if (name == "soft") return HapticType::SOFT;
    throw utils::SerializationException("Unknown haptic type", name);
}

bool HapticStream::validate(std::vector<std::string>* problems) const {
    bool valid = true;
    auto report = [&](const std::string& problem) {
        valid = false;
        if (problems != nullptr) {
            problems->push_back(problem);
        }
    };

    if (metadata.totalFrames != Resampler::outputFrameCount(metadata.duration, metadata.fps)) {
        report("totalFrames " + std::to_string(metadata.totalFrames) +
               " does not match duration * fps");
    }

    double previousTime = 0.0;
    for (size_t i = 0; i < events.size(); ++i) {
        const HapticEvent& event = events[i];
        const std::string where = "event " + std::to_string(i) + ": ";

        if (event.time < 0.0 || event.time > metadata.duration) {
            report(where + "time " + std::to_string(event.time) + " outside [0, duration]");
        }
        if (i > 0 && event.time < previousTime) {
            report(where + "time goes backwards");
        }
        if (!(event.intensity >= 0.0f && event.intensity <= 1.0f)) {
            report(where + "intensity outside [0, 1]");
        }
        if (!(event.sharpness >= 0.0f && event.sharpness <= 1.0f)) {
            report(where + "sharpness outside [0, 1]");
        }
        previousTime = event.time;
    }

    return valid;
}

std::map<HapticType, size_t> HapticStream::countByType() const {
    std::map<HapticType, size_t> counts = {
        {HapticType::HEAVY, 0}, {HapticType::MEDIUM, 0},
        {HapticType::LIGHT, 0}, {HapticType::SOFT, 0}
    };
    for (const auto& event : events) {
        counts[event.type]++;
    }
    return counts;
}

} // namespace haptics
} // namespace haptick
