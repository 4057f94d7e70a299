#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace haptick {
namespace haptics {

enum class HapticType {
    HEAVY,
    MEDIUM,
    LIGHT,
    SOFT
};

std::string toString(HapticType type);

/**
 * Parse "heavy", "medium", "light" or "soft".
 * @throws SerializationException for any other name
 */
HapticType hapticTypeFromString(const std::string& name);

struct HapticEvent {
    double time;       // Seconds from the start of the audio
    float intensity;   // [0, 1]
    float sharpness;   // [0, 1]
    HapticType type;

    HapticEvent() : time(0.0), intensity(0.0f), sharpness(0.0f), type(HapticType::SOFT) {}
    HapticEvent(double t, float i, float s, HapticType ty)
        : time(t), intensity(i), sharpness(s), type(ty) {}
};

struct HapticMetadata {
    static constexpr int CURRENT_VERSION = 3;

    int version;
    int fps;
    double duration;
    size_t totalFrames;

    HapticMetadata() : version(CURRENT_VERSION), fps(0), duration(0.0), totalFrames(0) {}
    HapticMetadata(int f, double d, size_t frames)
        : version(CURRENT_VERSION), fps(f), duration(d), totalFrames(frames) {}
};

/**
 * Result of one pipeline invocation: metadata plus events sorted by time
 */
struct HapticStream {
    HapticMetadata metadata;
    std::vector<HapticEvent> events;

    /**
     * Check the stream invariants: events inside [0, duration] and sorted,
     * intensity and sharpness in [0, 1], totalFrames == floor(duration * fps).
     * @param problems Receives one line per violation when not null
     */
    bool validate(std::vector<std::string>* problems = nullptr) const;

    std::map<HapticType, size_t> countByType() const;
};

} // namespace haptics
} // namespace haptick
