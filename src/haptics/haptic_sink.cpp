#include "haptics/haptic_sink.hpp"
#include "haptics/haptic_serializer.hpp"
#include <filesystem>

namespace haptick {
namespace haptics {

JsonFileSink::JsonFileSink(std::string path, std::string eventsKey)
    : path_(std::move(path)), eventsKey_(std::move(eventsKey)) {
}

void JsonFileSink::consume(const HapticStream& stream) {
    HapticSerializer::writeToFile(stream, path_, eventsKey_);
}

std::string JsonFileSink::defaultOutputPath(const std::string& inputPath) {
    std::filesystem::path path(inputPath);
    path.replace_extension(".json");
    return path.string();
}

} // namespace haptics
} // namespace haptick
