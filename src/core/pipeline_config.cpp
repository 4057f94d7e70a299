#include "core/pipeline_config.hpp"
#include "haptics/haptic_serializer.hpp"
#include "utils/logging.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace haptick {
namespace core {

namespace {

size_t parseUnsigned(const std::string& value) {
    if (!value.empty() && value[0] == '-') {
        throw std::invalid_argument("negative value");
    }
    return static_cast<size_t>(std::stoul(value));
}

} // namespace

audio::SpectralAnalyzerConfig PipelineConfig::analyzerConfig() const {
    audio::SpectralAnalyzerConfig config;
    config.frameLength = frameLength;
    config.rolloffThreshold = rolloffThreshold;
    config.threads = analysisThreads;
    return config;
}

haptics::EventSynthesizerConfig PipelineConfig::synthesizerConfig() const {
    haptics::EventSynthesizerConfig config;
    config.fps = fps;
    config.decimate = decimate;
    config.intensityGain = intensityGain;
    config.intensityFloor = intensityFloor;
    config.classifierFeature = classifierFeature;
    return config;
}

void ConfigValidationResult::merge(const ConfigValidationResult& other) {
    for (const auto& error : other.errors) {
        addError(error);
    }
    for (const auto& warning : other.warnings) {
        addWarning(warning);
    }
}

bool PipelineConfigManager::loadFromFile(const std::string& configPath) {
    if (!std::filesystem::exists(configPath)) {
        utils::Logger::info("Configuration file not found: " + configPath + ", using defaults");
        std::lock_guard<std::mutex> lock(configMutex_);
        config_ = PipelineConfig();
        return true;
    }

    std::ifstream file(configPath);
    if (!file.is_open()) {
        utils::Logger::error("Failed to open configuration file: " + configPath);
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    file.close();

    std::string jsonStr = buffer.str();
    if (jsonStr.empty()) {
        utils::Logger::info("Empty configuration file, using defaults");
        std::lock_guard<std::mutex> lock(configMutex_);
        config_ = PipelineConfig();
        return true;
    }

    if (!loadFromJson(jsonStr)) {
        utils::Logger::error("Invalid configuration loaded from: " + configPath);
        return false;
    }

    utils::Logger::info("Pipeline configuration loaded from: " + configPath);
    return true;
}

bool PipelineConfigManager::saveToFile(const std::string& configPath) const {
    std::filesystem::path filePath(configPath);
    std::filesystem::path dirPath = filePath.parent_path();

    if (!dirPath.empty() && !std::filesystem::exists(dirPath)) {
        std::error_code ec;
        if (!std::filesystem::create_directories(dirPath, ec)) {
            utils::Logger::error("Failed to create configuration directory: " + dirPath.string() +
                                 " - " + ec.message());
            return false;
        }
    }

    std::ofstream file(configPath);
    if (!file.is_open()) {
        utils::Logger::error("Failed to open configuration file for writing: " + configPath);
        return false;
    }

    file << exportToJson();
    file.close();

    if (file.fail()) {
        utils::Logger::error("Failed to write configuration file: " + configPath);
        return false;
    }

    utils::Logger::info("Pipeline configuration saved to: " + configPath);
    return true;
}

bool PipelineConfigManager::loadFromJson(const std::string& jsonStr) {
    PipelineConfig newConfig;
    std::string parseError;
    if (!parseJsonConfig(jsonStr, newConfig, parseError)) {
        utils::Logger::error("Failed to parse JSON configuration: " + parseError);
        return false;
    }

    auto validationResult = validateConfig(newConfig);
    if (!validationResult.isValid) {
        utils::Logger::error("Invalid JSON configuration");
        for (const auto& error : validationResult.errors) {
            utils::Logger::error("  Error: " + error);
        }
        return false;
    }

    for (const auto& warning : validationResult.warnings) {
        utils::Logger::warn("  Warning: " + warning);
    }

    std::lock_guard<std::mutex> lock(configMutex_);
    config_ = newConfig;
    return true;
}

std::string PipelineConfigManager::exportToJson() const {
    std::lock_guard<std::mutex> lock(configMutex_);
    return configToJson(config_);
}

PipelineConfig PipelineConfigManager::getConfig() const {
    std::lock_guard<std::mutex> lock(configMutex_);
    return config_;
}

ConfigValidationResult PipelineConfigManager::updateConfig(const PipelineConfig& newConfig) {
    auto validationResult = validateConfig(newConfig);
    if (!validationResult.isValid) {
        return validationResult;
    }

    std::lock_guard<std::mutex> lock(configMutex_);
    config_ = newConfig;
    return validationResult;
}

ConfigValidationResult PipelineConfigManager::updateConfigValue(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(configMutex_);

    ConfigValidationResult result;
    PipelineConfig candidate = config_;
    if (!applyValue(candidate, key, value)) {
        result.addError("Unknown configuration key or malformed value: " + key + "=" + value);
        return result;
    }

    result = validateConfig(candidate);
    if (result.isValid) {
        config_ = candidate;
    }
    return result;
}

ConfigValidationResult PipelineConfigManager::validateConfig(const PipelineConfig& config) const {
    ConfigValidationResult result;
    result.merge(validateAnalysisConfig(config));
    result.merge(validateSmoothingConfig(config));
    result.merge(validateSynthesisConfig(config));
    result.merge(validateOutputConfig(config));
    return result;
}

void PipelineConfigManager::resetToDefaults() {
    std::lock_guard<std::mutex> lock(configMutex_);
    config_ = PipelineConfig();
}

bool PipelineConfigManager::parseJsonConfig(const std::string& jsonStr, PipelineConfig& config, std::string& error) {
    try {
        nlohmann::json j = nlohmann::json::parse(jsonStr);
        if (!j.is_object()) {
            error = "configuration must be a JSON object";
            return false;
        }

        config.fps = j.value("fps", config.fps);
        config.frameLength = j.value("frameLength", config.frameLength);
        config.rolloffThreshold = j.value("rolloffThreshold", config.rolloffThreshold);
        config.analysisThreads = j.value("analysisThreads", config.analysisThreads);
        config.windowSize = j.value("windowSize", config.windowSize);
        config.thresholdK = j.value("thresholdK", config.thresholdK);
        config.decimate = j.value("decimate", config.decimate);
        config.intensityGain = j.value("intensityGain", config.intensityGain);
        config.intensityFloor = j.value("intensityFloor", config.intensityFloor);
        config.eventsKey = j.value("eventsKey", config.eventsKey);
        config.logLevel = j.value("logLevel", config.logLevel);

        if (j.contains("classifierFeature")) {
            std::string feature = j.at("classifierFeature").get<std::string>();
            if (!haptics::classifierFeatureFromString(feature, config.classifierFeature)) {
                error = "unknown classifierFeature '" + feature + "'";
                return false;
            }
        }
    } catch (const nlohmann::json::exception& e) {
        error = e.what();
        return false;
    }

    return true;
}

std::string PipelineConfigManager::configToJson(const PipelineConfig& config) {
    nlohmann::json j = {
        {"fps", config.fps},
        {"frameLength", config.frameLength},
        {"rolloffThreshold", config.rolloffThreshold},
        {"analysisThreads", config.analysisThreads},
        {"windowSize", config.windowSize},
        {"thresholdK", config.thresholdK},
        {"decimate", config.decimate},
        {"intensityGain", config.intensityGain},
        {"intensityFloor", config.intensityFloor},
        {"classifierFeature", haptics::toString(config.classifierFeature)},
        {"eventsKey", config.eventsKey},
        {"logLevel", config.logLevel}
    };
    return j.dump(2);
}

ConfigValidationResult PipelineConfigManager::validateAnalysisConfig(const PipelineConfig& config) const {
    ConfigValidationResult result;

    if (!audio::SpectralAnalyzer::isPowerOfTwo(config.frameLength) || config.frameLength > 65536) {
        result.addError("Frame length must be a power of two between 2 and 65536");
    } else if (config.frameLength > 8192) {
        result.addWarning("Frame length above 8192 gives very coarse time resolution");
    }

    if (!(std::isfinite(config.rolloffThreshold) && config.rolloffThreshold > 0.0f &&
          config.rolloffThreshold <= 1.0f)) {
        result.addError("Rolloff threshold must be in (0.0, 1.0]");
    }

    if (config.analysisThreads < 1) {
        result.addError("Analysis thread count must be at least 1");
    } else if (config.analysisThreads > std::max(1u, std::thread::hardware_concurrency()) * 2) {
        result.addWarning("Analysis thread count is higher than recommended (2x CPU cores)");
    }

    return result;
}

ConfigValidationResult PipelineConfigManager::validateSmoothingConfig(const PipelineConfig& config) const {
    ConfigValidationResult result;

    if (config.windowSize < 1 || config.windowSize % 2 == 0) {
        result.addError("Smoothing window size must be odd and at least 1");
    }

    if (!(std::isfinite(config.thresholdK) && config.thresholdK >= 0.0f)) {
        result.addError("Threshold k must be a finite non-negative number");
    }

    return result;
}

ConfigValidationResult PipelineConfigManager::validateSynthesisConfig(const PipelineConfig& config) const {
    ConfigValidationResult result;

    if (config.fps < 1) {
        result.addError("fps must be at least 1");
    } else if (config.fps > 1000) {
        result.addWarning("fps above 1000 exceeds what haptic actuators can render");
    }

    if (!(std::isfinite(config.intensityGain) && config.intensityGain > 0.0f)) {
        result.addError("Intensity gain must be a finite positive number");
    }

    if (!(std::isfinite(config.intensityFloor) && config.intensityFloor >= 0.0f &&
          config.intensityFloor < 1.0f)) {
        result.addError("Intensity floor must be in [0.0, 1.0)");
    }

    return result;
}

ConfigValidationResult PipelineConfigManager::validateOutputConfig(const PipelineConfig& config) const {
    ConfigValidationResult result;

    if (!haptics::HapticSerializer::isValidEventsKey(config.eventsKey)) {
        result.addError("Events key must be one of hapticEvents, events, haptic_events");
    }

    utils::LogLevel level;
    if (!utils::Logger::parseLevel(config.logLevel, level)) {
        result.addError("Invalid log level: " + config.logLevel);
    }

    return result;
}

bool PipelineConfigManager::applyValue(PipelineConfig& config, const std::string& key, const std::string& value) {
    try {
        if (key == "fps") {
            config.fps = std::stoi(value);
        } else if (key == "frameLength") {
            config.frameLength = parseUnsigned(value);
        } else if (key == "rolloffThreshold") {
            config.rolloffThreshold = std::stof(value);
        } else if (key == "analysisThreads") {
            config.analysisThreads = parseUnsigned(value);
        } else if (key == "windowSize") {
            config.windowSize = parseUnsigned(value);
        } else if (key == "thresholdK") {
            config.thresholdK = std::stof(value);
        } else if (key == "decimate") {
            if (value == "true" || value == "1") {
                config.decimate = true;
            } else if (value == "false" || value == "0") {
                config.decimate = false;
            } else {
                return false;
            }
        } else if (key == "intensityGain") {
            config.intensityGain = std::stof(value);
        } else if (key == "intensityFloor") {
            config.intensityFloor = std::stof(value);
        } else if (key == "classifierFeature") {
            return haptics::classifierFeatureFromString(value, config.classifierFeature);
        } else if (key == "eventsKey") {
            config.eventsKey = value;
        } else if (key == "logLevel") {
            config.logLevel = value;
        } else {
            return false;
        }
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }

    return true;
}

} // namespace core
} // namespace haptick
