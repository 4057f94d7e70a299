#include <iostream>
#include <string>
#include <vector>
#include "audio/wav_file_source.hpp"
#include "core/haptic_pipeline.hpp"
#include "core/pipeline_config.hpp"
#include "haptics/haptic_sink.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"

namespace {

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " <input.wav> [options]\n"
              << "Options:\n"
              << "  --output <path>        Output JSON path (default: input with .json extension)\n"
              << "  --config <path>        Load pipeline options from a JSON file\n"
              << "  --fps <n>              Haptic event rate (default: 60)\n"
              << "  --frame-length <n>     FFT frame length, power of two (default: 512)\n"
              << "  --window-size <n>      Smoothing window, odd (default: 11)\n"
              << "  --threshold-k <x>      Gate = mean + k * stddev of RMS (default: 0.5)\n"
              << "  --classifier <name>    normalizedCentroid or rolloff (default: normalizedCentroid)\n"
              << "  --decimate             Keep only every other output frame\n"
              << "  --threads <n>          Spectral analysis workers (default: 1)\n"
              << "  --events-key <key>     hapticEvents, events or haptic_events (default: hapticEvents)\n"
              << "  --log-level <level>    DEBUG, INFO, WARN or ERROR (default: INFO)\n"
              << "  --help, -h             Show this help message\n";
}

} // namespace

int main(int argc, char* argv[]) {
    using namespace haptick;

    utils::Logger::initialize();

    std::string inputPath;
    std::string outputPath;
    std::string configPath;
    std::vector<std::pair<std::string, std::string>> overrides;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        auto next = [&](const std::string& key) -> bool {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << std::endl;
                return false;
            }
            overrides.emplace_back(key, argv[++i]);
            return true;
        };

        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--output" && i + 1 < argc) {
            outputPath = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        } else if (arg == "--decimate") {
            overrides.emplace_back("decimate", "true");
        } else if (arg == "--fps") {
            if (!next("fps")) return 1;
        } else if (arg == "--frame-length") {
            if (!next("frameLength")) return 1;
        } else if (arg == "--window-size") {
            if (!next("windowSize")) return 1;
        } else if (arg == "--threshold-k") {
            if (!next("thresholdK")) return 1;
        } else if (arg == "--classifier") {
            if (!next("classifierFeature")) return 1;
        } else if (arg == "--threads") {
            if (!next("analysisThreads")) return 1;
        } else if (arg == "--events-key") {
            if (!next("eventsKey")) return 1;
        } else if (arg == "--log-level") {
            if (!next("logLevel")) return 1;
        } else if (!arg.empty() && arg[0] != '-' && inputPath.empty()) {
            inputPath = arg;
        } else {
            std::cerr << "Unknown argument: " << arg << std::endl;
            printUsage(argv[0]);
            return 1;
        }
    }

    if (inputPath.empty()) {
        printUsage(argv[0]);
        return 1;
    }

    core::PipelineConfigManager configManager;
    if (!configPath.empty() && !configManager.loadFromFile(configPath)) {
        return 1;
    }

    for (const auto& override : overrides) {
        auto result = configManager.updateConfigValue(override.first, override.second);
        if (!result.isValid) {
            for (const auto& error : result.errors) {
                utils::Logger::error(error);
            }
            return 1;
        }
    }

    core::PipelineConfig config = configManager.getConfig();
    utils::LogLevel level;
    if (utils::Logger::parseLevel(config.logLevel, level)) {
        utils::Logger::setLevel(level);
    }

    if (outputPath.empty()) {
        outputPath = haptics::JsonFileSink::defaultOutputPath(inputPath);
    }

    try {
        core::HapticPipeline pipeline(config);
        pipeline.setProgressCallback([](core::PipelineStage stage, float progress) {
            utils::Logger::debug("Stage " + core::toString(stage) + " (" +
                                 std::to_string(static_cast<int>(progress * 100.0f)) + "%)");
        });

        audio::WavFileSource source(inputPath);
        haptics::JsonFileSink sink(outputPath, config.eventsKey);
        auto stream = pipeline.process(source, sink);

        auto counts = stream.countByType();
        utils::Logger::info("Events by type: heavy=" + std::to_string(counts[haptics::HapticType::HEAVY]) +
                            " medium=" + std::to_string(counts[haptics::HapticType::MEDIUM]) +
                            " light=" + std::to_string(counts[haptics::HapticType::LIGHT]) +
                            " soft=" + std::to_string(counts[haptics::HapticType::SOFT]));
    } catch (const utils::HaptickException& e) {
        utils::Logger::error(std::string("Analysis failed: ") + e.what());
        return 1;
    } catch (const std::exception& e) {
        utils::Logger::error(std::string("Unexpected error: ") + e.what());
        return 1;
    }

    return 0;
}
