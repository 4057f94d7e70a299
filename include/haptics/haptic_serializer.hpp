#pragma once

#include "haptics/haptic_event.hpp"
#include <nlohmann/json_fwd.hpp>
#include <string>

namespace haptick {
namespace haptics {

/**
 * JSON form of a HapticStream:
 *
 *   { "metadata": { "version", "fps", "duration", "totalFrames" },
 *     "<eventsKey>": [ { "time", "intensity", "sharpness", "type" }, ... ] }
 *
 * Writing uses "hapticEvents" unless told otherwise; reading accepts
 * "hapticEvents", "events" and "haptic_events".
 */
class HapticSerializer {
public:
    static const char* const DEFAULT_EVENTS_KEY;

    static bool isValidEventsKey(const std::string& key);

    static nlohmann::json toJson(const HapticStream& stream,
                                 const std::string& eventsKey = DEFAULT_EVENTS_KEY);

    /**
     * @throws SerializationException on missing fields, wrong types or unknown haptic types
     */
    static HapticStream fromJson(const nlohmann::json& json);

    static std::string toString(const HapticStream& stream,
                                const std::string& eventsKey = DEFAULT_EVENTS_KEY,
                                int indent = 2);
    static HapticStream parse(const std::string& text);

    static void writeToFile(const HapticStream& stream, const std::string& path,
                            const std::string& eventsKey = DEFAULT_EVENTS_KEY);
    static HapticStream readFromFile(const std::string& path);
};

} // namespace haptics
} // namespace haptick
