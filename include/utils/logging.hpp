#pragma once

#include <string>

namespace haptick {
namespace utils {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

class Logger {
public:
    static void initialize(LogLevel level = LogLevel::INFO);
    static void setLevel(LogLevel level);
    static LogLevel getLevel();

    static void info(const std::string& message);
    static void warn(const std::string& message);
    static void error(const std::string& message);
    static void debug(const std::string& message);

    /**
     * Parse "DEBUG", "INFO", "WARN" or "ERROR" (case-insensitive).
     * @return false if the name is not recognized, level is left untouched
     */
    static bool parseLevel(const std::string& name, LogLevel& level);
    static std::string levelName(LogLevel level);

private:
    static bool initialized_;
    static LogLevel level_;
};

} // namespace utils
} // namespace haptick
