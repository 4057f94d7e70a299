#include "utils/logging.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>

namespace haptick {
namespace utils {

bool Logger::initialized_ = false;
LogLevel Logger::level_ = LogLevel::INFO;

void Logger::initialize(LogLevel level) {
    level_ = level;
    if (!initialized_) {
        initialized_ = true;
        debug("Logger initialized");
    }
}

void Logger::setLevel(LogLevel level) {
    level_ = level;
}

LogLevel Logger::getLevel() {
    return level_;
}

void Logger::info(const std::string& message) {
    if (level_ <= LogLevel::INFO) {
        std::cout << "[INFO] " << message << std::endl;
    }
}

void Logger::warn(const std::string& message) {
    if (level_ <= LogLevel::WARN) {
        std::cout << "[WARN] " << message << std::endl;
    }
}

void Logger::error(const std::string& message) {
    std::cerr << "[ERROR] " << message << std::endl;
}

void Logger::debug(const std::string& message) {
    if (level_ <= LogLevel::DEBUG) {
        std::cout << "[DEBUG] " << message << std::endl;
    }
}

bool Logger::parseLevel(const std::string& name, LogLevel& level) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "DEBUG") {
        level = LogLevel::DEBUG;
    } else if (upper == "INFO") {
        level = LogLevel::INFO;
    } else if (upper == "WARN" || upper == "WARNING") {
        level = LogLevel::WARN;
    } else if (upper == "ERROR") {
        level = LogLevel::ERROR;
    } else {
        return false;
    }
    return true;
}

std::string Logger::levelName(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
    }
    return "INFO";
}

} // namespace utils
} // namespace haptick
