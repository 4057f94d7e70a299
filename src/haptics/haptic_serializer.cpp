#include "haptics/haptic_serializer.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace haptick {
namespace haptics {

namespace {

const char* const kAcceptedEventKeys[] = {"hapticEvents", "events", "haptic_events"};

} // namespace

const char* const HapticSerializer::DEFAULT_EVENTS_KEY = "hapticEvents";

bool HapticSerializer::isValidEventsKey(const std::string& key) {
    for (const char* accepted : kAcceptedEventKeys) {
        if (key == accepted) {
            return true;
        }
    }
    return false;
}

nlohmann::json HapticSerializer::toJson(const HapticStream& stream, const std::string& eventsKey) {
    if (!isValidEventsKey(eventsKey)) {
        throw utils::SerializationException("Unsupported events key", eventsKey);
    }

    nlohmann::json events = nlohmann::json::array();
    for (const auto& event : stream.events) {
        events.push_back({
            {"time", event.time},
            {"intensity", event.intensity},
            {"sharpness", event.sharpness},
            {"type", haptics::toString(event.type)}
        });
    }

    return {
        {"metadata", {
            {"version", stream.metadata.version},
            {"fps", stream.metadata.fps},
            {"duration", stream.metadata.duration},
            {"totalFrames", stream.metadata.totalFrames}
        }},
        {eventsKey, std::move(events)}
    };
}

HapticStream HapticSerializer::fromJson(const nlohmann::json& json) {
    HapticStream stream;
    try {
        const auto& metadata = json.at("metadata");
        stream.metadata.version = metadata.value("version", HapticMetadata::CURRENT_VERSION);
        stream.metadata.fps = metadata.at("fps").get<int>();
        stream.metadata.duration = metadata.at("duration").get<double>();
        stream.metadata.totalFrames = metadata.at("totalFrames").get<size_t>();

        const nlohmann::json* events = nullptr;
        for (const char* key : kAcceptedEventKeys) {
            auto it = json.find(key);
            if (it != json.end()) {
                events = &(*it);
                break;
            }
        }
        if (events == nullptr) {
            throw utils::SerializationException("Haptic stream has no event list");
        }

        stream.events.reserve(events->size());
        for (const auto& item : *events) {
            stream.events.emplace_back(item.at("time").get<double>(),
                                       item.at("intensity").get<float>(),
                                       item.at("sharpness").get<float>(),
                                       hapticTypeFromString(item.at("type").get<std::string>()));
        }
    } catch (const nlohmann::json::exception& e) {
        throw utils::SerializationException("Malformed haptic stream", e.what());
    }

    return stream;
}

std::string HapticSerializer::toString(const HapticStream& stream, const std::string& eventsKey, int indent) {
    return toJson(stream, eventsKey).dump(indent);
}

HapticStream HapticSerializer::parse(const std::string& text) {
    nlohmann::json json;
    try {
        json = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw utils::SerializationException("Invalid JSON", e.what());
    }
    return fromJson(json);
}

void HapticSerializer::writeToFile(const HapticStream& stream, const std::string& path,
                                   const std::string& eventsKey) {
    std::filesystem::path filePath(path);
    std::filesystem::path dirPath = filePath.parent_path();

    if (!dirPath.empty() && !std::filesystem::exists(dirPath)) {
        std::error_code ec;
        if (!std::filesystem::create_directories(dirPath, ec)) {
            throw utils::SerializationException("Failed to create output directory",
                                                dirPath.string() + " - " + ec.message());
        }
    }

    std::string text = toString(stream, eventsKey);

    std::ofstream file(path);
    if (!file.is_open()) {
        throw utils::SerializationException("Failed to open file for writing", path);
    }
    file << text << '\n';
    file.close();

    if (file.fail()) {
        throw utils::SerializationException("Failed to write haptic stream", path);
    }

    utils::Logger::info("Haptic stream saved to: " + path + " (" +
                        std::to_string(stream.events.size()) + " events)");
}

HapticStream HapticSerializer::readFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw utils::SerializationException("Failed to open haptic stream", path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse(buffer.str());
}

} // namespace haptics
} // namespace haptick
