#pragma once

#include "audio/spectral_analyzer.hpp"
#include "haptics/event_synthesizer.hpp"
#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

namespace haptick {
namespace core {

/**
 * Options recognized by the analysis pipeline
 */
struct PipelineConfig {
    // Output rate
    int fps = 60;

    // Spectral analysis
    size_t frameLength = 512;
    float rolloffThreshold = 0.85f;
    size_t analysisThreads = 1;

    // Smoothing and gating
    size_t windowSize = 11;
    float thresholdK = 0.5f;

    // Event synthesis
    bool decimate = false;
    float intensityGain = 2.0f;
    float intensityFloor = 0.0f;
    haptics::ClassifierFeature classifierFeature = haptics::ClassifierFeature::NORMALIZED_CENTROID;

    // Output and diagnostics
    std::string eventsKey = "hapticEvents";
    std::string logLevel = "INFO";

    audio::SpectralAnalyzerConfig analyzerConfig() const;
    haptics::EventSynthesizerConfig synthesizerConfig() const;
};

/**
 * Configuration validation result
 */
struct ConfigValidationResult {
    bool isValid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    void addError(const std::string& error) {
        errors.push_back(error);
        isValid = false;
    }

    void addWarning(const std::string& warning) {
        warnings.push_back(warning);
    }

    void merge(const ConfigValidationResult& other);

    bool hasErrors() const { return !errors.empty(); }
    bool hasWarnings() const { return !warnings.empty(); }
};

/**
 * Pipeline Configuration Manager
 * Handles loading, validation and updates of the pipeline options
 */
class PipelineConfigManager {
public:
    PipelineConfigManager() = default;

    /**
     * Load configuration from a JSON file. A missing file keeps the defaults.
     * @return true if loaded (or defaulted) successfully
     */
    bool loadFromFile(const std::string& configPath);

    /**
     * Save configuration to file
     * @return true if saved successfully
     */
    bool saveToFile(const std::string& configPath) const;

    /**
     * Load configuration from a JSON string; keys not present keep their defaults
     * @return true if parsed and valid
     */
    bool loadFromJson(const std::string& jsonStr);

    std::string exportToJson() const;

    PipelineConfig getConfig() const;

    /**
     * Replace the configuration if it validates
     * @return Validation result, the current config is untouched on errors
     */
    ConfigValidationResult updateConfig(const PipelineConfig& newConfig);

    /**
     * Update one option from its textual form, e.g. ("fps", "30")
     * @return Validation result, the change is reverted on errors
     */
    ConfigValidationResult updateConfigValue(const std::string& key, const std::string& value);

    ConfigValidationResult validateConfig(const PipelineConfig& config) const;

    void resetToDefaults();

    static bool parseJsonConfig(const std::string& jsonStr, PipelineConfig& config, std::string& error);
    static std::string configToJson(const PipelineConfig& config);

private:
    mutable std::mutex configMutex_;
    PipelineConfig config_;

    ConfigValidationResult validateAnalysisConfig(const PipelineConfig& config) const;
    ConfigValidationResult validateSmoothingConfig(const PipelineConfig& config) const;
    ConfigValidationResult validateSynthesisConfig(const PipelineConfig& config) const;
    ConfigValidationResult validateOutputConfig(const PipelineConfig& config) const;

    static bool applyValue(PipelineConfig& config, const std::string& key, const std::string& value);
};

} // namespace core
} // namespace haptick
