#pragma once

#include "haptics/haptic_event.hpp"
#include <string>

namespace haptick {
namespace haptics {

/**
 * Consumer of a finished haptic stream (renderer, device driver, storage)
 */
class HapticSink {
public:
    virtual ~HapticSink() = default;

    virtual void consume(const HapticStream& stream) = 0;
};

/**
 * Persists the stream as JSON at a fixed path
 */
class JsonFileSink : public HapticSink {
public:
    explicit JsonFileSink(std::string path, std::string eventsKey = "hapticEvents");

    void consume(const HapticStream& stream) override;

    const std::string& path() const { return path_; }

    // "<dir>/<stem>.json" for an input such as a video or audio file
    static std::string defaultOutputPath(const std::string& inputPath);

private:
    std::string path_;
    std::string eventsKey_;
};

} // namespace haptics
} // namespace haptick
