#include <gtest/gtest.h>
#include "core/pipeline_config.hpp"
#include <cmath>
#include <filesystem>
#include <fstream>
#include <limits>
#include <memory>
#include <nlohmann/json.hpp>

using namespace haptick::core;
using haptick::haptics::ClassifierFeature;

class PipelineConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        configManager = std::make_unique<PipelineConfigManager>();
        testConfigPath = "test_pipeline_config.json";

        if (std::filesystem::exists(testConfigPath)) {
            std::filesystem::remove(testConfigPath);
        }
    }

    void TearDown() override {
        if (std::filesystem::exists(testConfigPath)) {
            std::filesystem::remove(testConfigPath);
        }
    }

    void createTestConfigFile(const std::string& content) {
        std::ofstream file(testConfigPath);
        file << content;
        file.close();
    }

    std::unique_ptr<PipelineConfigManager> configManager;
    std::string testConfigPath;
};

TEST_F(PipelineConfigTest, DefaultConfiguration) {
    PipelineConfig config;

    EXPECT_EQ(config.fps, 60);
    EXPECT_EQ(config.frameLength, 512u);
    EXPECT_FLOAT_EQ(config.rolloffThreshold, 0.85f);
    EXPECT_EQ(config.analysisThreads, 1u);
    EXPECT_EQ(config.windowSize, 11u);
    EXPECT_FLOAT_EQ(config.thresholdK, 0.5f);
    EXPECT_FALSE(config.decimate);
    EXPECT_FLOAT_EQ(config.intensityGain, 2.0f);
    EXPECT_FLOAT_EQ(config.intensityFloor, 0.0f);
    EXPECT_EQ(config.classifierFeature, ClassifierFeature::NORMALIZED_CENTROID);
    EXPECT_EQ(config.eventsKey, "hapticEvents");
    EXPECT_EQ(config.logLevel, "INFO");

    auto result = configManager->validateConfig(config);
    EXPECT_TRUE(result.isValid);
    EXPECT_FALSE(result.hasErrors());
}

TEST_F(PipelineConfigTest, DerivedStageConfigs) {
    PipelineConfig config;
    config.fps = 30;
    config.frameLength = 1024;
    config.analysisThreads = 3;
    config.decimate = true;
    config.intensityFloor = 0.1f;

    auto analyzer = config.analyzerConfig();
    EXPECT_EQ(analyzer.frameLength, 1024u);
    EXPECT_EQ(analyzer.threads, 3u);
    EXPECT_FLOAT_EQ(analyzer.rolloffThreshold, 0.85f);

    auto synthesizer = config.synthesizerConfig();
    EXPECT_EQ(synthesizer.fps, 30);
    EXPECT_TRUE(synthesizer.decimate);
    EXPECT_FLOAT_EQ(synthesizer.intensityFloor, 0.1f);
}

TEST_F(PipelineConfigTest, LoadFromJson) {
    std::string json = R"({
        "fps": 30,
        "frameLength": 1024,
        "windowSize": 5,
        "decimate": true,
        "classifierFeature": "rolloff",
        "eventsKey": "haptic_events"
    })";

    EXPECT_TRUE(configManager->loadFromJson(json));

    auto config = configManager->getConfig();
    EXPECT_EQ(config.fps, 30);
    EXPECT_EQ(config.frameLength, 1024u);
    EXPECT_EQ(config.windowSize, 5u);
    EXPECT_TRUE(config.decimate);
    EXPECT_EQ(config.classifierFeature, ClassifierFeature::ROLLOFF);
    EXPECT_EQ(config.eventsKey, "haptic_events");
    // Keys not present keep their defaults
    EXPECT_FLOAT_EQ(config.thresholdK, 0.5f);
}

TEST_F(PipelineConfigTest, RejectsInvalidJson) {
    EXPECT_FALSE(configManager->loadFromJson("{invalid json"));
    EXPECT_FALSE(configManager->loadFromJson("[1, 2, 3]"));
    EXPECT_FALSE(configManager->loadFromJson(R"({"classifierFeature": "bandwidth"})"));
    EXPECT_FALSE(configManager->loadFromJson(R"({"fps": "sixty"})"));

    // Current configuration is left untouched
    EXPECT_EQ(configManager->getConfig().fps, 60);
}

TEST_F(PipelineConfigTest, RejectsInvalidValues) {
    EXPECT_FALSE(configManager->loadFromJson(R"({"frameLength": 500})"));
    EXPECT_FALSE(configManager->loadFromJson(R"({"windowSize": 10})"));
    EXPECT_FALSE(configManager->loadFromJson(R"({"fps": 0})"));
    EXPECT_FALSE(configManager->loadFromJson(R"({"eventsKey": "pulses"})"));
    EXPECT_FALSE(configManager->loadFromJson(R"({"logLevel": "LOUD"})"));
    EXPECT_FALSE(configManager->loadFromJson(R"({"intensityFloor": 1.0})"));
    EXPECT_FALSE(configManager->loadFromJson(R"({"rolloffThreshold": 0.0})"));
}

TEST_F(PipelineConfigTest, ValidationCollectsEveryError) {
    PipelineConfig config;
    config.frameLength = 300;
    config.windowSize = 4;
    config.fps = -1;
    config.eventsKey = "";

    auto result = configManager->validateConfig(config);
    EXPECT_FALSE(result.isValid);
    EXPECT_EQ(result.errors.size(), 4u);
}

TEST_F(PipelineConfigTest, ValidationWarnings) {
    PipelineConfig config;
    config.fps = 2000;
    config.frameLength = 16384;

    auto result = configManager->validateConfig(config);
    EXPECT_TRUE(result.isValid);
    EXPECT_TRUE(result.hasWarnings());
    EXPECT_EQ(result.warnings.size(), 2u);
}

TEST_F(PipelineConfigTest, LoadFromFile) {
    createTestConfigFile(R"({"fps": 120, "thresholdK": 1.0})");

    EXPECT_TRUE(configManager->loadFromFile(testConfigPath));
    auto config = configManager->getConfig();
    EXPECT_EQ(config.fps, 120);
    EXPECT_FLOAT_EQ(config.thresholdK, 1.0f);
}

TEST_F(PipelineConfigTest, MissingFileKeepsDefaults) {
    EXPECT_TRUE(configManager->loadFromFile("nonexistent_pipeline_config.json"));
    EXPECT_EQ(configManager->getConfig().fps, 60);
}

TEST_F(PipelineConfigTest, SaveAndReload) {
    PipelineConfig config;
    config.fps = 24;
    config.decimate = true;
    config.classifierFeature = ClassifierFeature::ROLLOFF;
    ASSERT_TRUE(configManager->updateConfig(config).isValid);

    EXPECT_TRUE(configManager->saveToFile(testConfigPath));
    EXPECT_TRUE(std::filesystem::exists(testConfigPath));

    PipelineConfigManager reloaded;
    EXPECT_TRUE(reloaded.loadFromFile(testConfigPath));
    auto loaded = reloaded.getConfig();
    EXPECT_EQ(loaded.fps, 24);
    EXPECT_TRUE(loaded.decimate);
    EXPECT_EQ(loaded.classifierFeature, ClassifierFeature::ROLLOFF);
}

TEST_F(PipelineConfigTest, ExportUsesFlatKeys) {
    auto json = nlohmann::json::parse(configManager->exportToJson());
    EXPECT_EQ(json["fps"].get<int>(), 60);
    EXPECT_EQ(json["frameLength"].get<size_t>(), 512u);
    EXPECT_EQ(json["classifierFeature"].get<std::string>(), "normalizedCentroid");
    EXPECT_EQ(json["eventsKey"].get<std::string>(), "hapticEvents");
}

TEST_F(PipelineConfigTest, UpdateConfigValue) {
    auto result = configManager->updateConfigValue("fps", "30");
    EXPECT_TRUE(result.isValid);
    EXPECT_EQ(configManager->getConfig().fps, 30);

    result = configManager->updateConfigValue("decimate", "true");
    EXPECT_TRUE(result.isValid);
    EXPECT_TRUE(configManager->getConfig().decimate);

    result = configManager->updateConfigValue("classifierFeature", "rolloff");
    EXPECT_TRUE(result.isValid);
    EXPECT_EQ(configManager->getConfig().classifierFeature, ClassifierFeature::ROLLOFF);

    result = configManager->updateConfigValue("logLevel", "debug");
    EXPECT_TRUE(result.isValid);
}

TEST_F(PipelineConfigTest, UpdateConfigValueRevertsOnError) {
    EXPECT_FALSE(configManager->updateConfigValue("fps", "abc").isValid);
    EXPECT_FALSE(configManager->updateConfigValue("fps", "-5").isValid);
    EXPECT_FALSE(configManager->updateConfigValue("frameLength", "-512").isValid);
    EXPECT_FALSE(configManager->updateConfigValue("windowSize", "8").isValid);
    EXPECT_FALSE(configManager->updateConfigValue("decimate", "maybe").isValid);
    EXPECT_FALSE(configManager->updateConfigValue("unknownKey", "1").isValid);

    auto config = configManager->getConfig();
    EXPECT_EQ(config.fps, 60);
    EXPECT_EQ(config.frameLength, 512u);
    EXPECT_EQ(config.windowSize, 11u);
    EXPECT_FALSE(config.decimate);
}

TEST_F(PipelineConfigTest, RejectsNonFiniteValues) {
    EXPECT_FALSE(configManager->updateConfigValue("thresholdK", "nan").isValid);
    EXPECT_FALSE(configManager->updateConfigValue("thresholdK", "inf").isValid);
    EXPECT_FALSE(configManager->updateConfigValue("intensityGain", "inf").isValid);
    EXPECT_FALSE(configManager->updateConfigValue("intensityGain", "nan").isValid);
    EXPECT_FALSE(configManager->updateConfigValue("intensityFloor", "nan").isValid);
    EXPECT_FALSE(configManager->updateConfigValue("rolloffThreshold", "nan").isValid);

    auto config = configManager->getConfig();
    EXPECT_TRUE(std::isfinite(config.thresholdK));
    EXPECT_FLOAT_EQ(config.thresholdK, 0.5f);
    EXPECT_TRUE(std::isfinite(config.intensityGain));
    EXPECT_TRUE(std::isfinite(config.intensityFloor));
    EXPECT_TRUE(std::isfinite(config.rolloffThreshold));
}

TEST_F(PipelineConfigTest, ValidationReportsEveryNonFiniteValue) {
    PipelineConfig config;
    config.rolloffThreshold = std::numeric_limits<float>::quiet_NaN();
    config.thresholdK = std::numeric_limits<float>::infinity();
    config.intensityGain = std::numeric_limits<float>::quiet_NaN();
    config.intensityFloor = -std::numeric_limits<float>::infinity();

    auto result = configManager->validateConfig(config);
    EXPECT_FALSE(result.isValid);
    EXPECT_EQ(result.errors.size(), 4u);
    EXPECT_FALSE(configManager->updateConfig(config).isValid);
}

TEST_F(PipelineConfigTest, ResetToDefaults) {
    configManager->updateConfigValue("fps", "90");
    configManager->resetToDefaults();
    EXPECT_EQ(configManager->getConfig().fps, 60);
}
