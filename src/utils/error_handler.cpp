#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <algorithm>
#include <random>
#include <sstream>

namespace haptick {
namespace utils {

thread_local std::string ErrorContext::current_context_;

ErrorInfo::ErrorInfo(ErrorCategory cat, ErrorSeverity sev, const std::string& msg,
                     const std::string& det, const std::string& ctx)
    : category(cat), severity(sev), message(msg), details(det), context(ctx),
      timestamp(std::chrono::steady_clock::now()) {

    static thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<> dis(0, 15);

    std::stringstream ss;
    ss << "err_";
    for (int i = 0; i < 8; ++i) {
        ss << std::hex << dis(gen);
    }
    id = ss.str();
}

HaptickException::HaptickException(const ErrorInfo& error_info)
    : error_info_(error_info) {
}

const char* HaptickException::what() const noexcept {
    if (what_message_.empty()) {
        what_message_ = error_info_.message;
        if (!error_info_.details.empty()) {
            what_message_ += ": " + error_info_.details;
        }
    }
    return what_message_.c_str();
}

InvalidFrameSizeException::InvalidFrameSizeException(const std::string& message, size_t frame_length)
    : HaptickException(ErrorInfo(ErrorCategory::INVALID_FRAME_SIZE, ErrorSeverity::ERROR,
                                 message, "frameLength=" + std::to_string(frame_length),
                                 "SpectralAnalyzer")),
      frame_length_(frame_length) {
}

EmptySeriesException::EmptySeriesException(const std::string& message, const std::string& series_name)
    : HaptickException(ErrorInfo(ErrorCategory::EMPTY_SERIES, ErrorSeverity::ERROR,
                                 message, series_name, "Resampler")) {
}

AudioSourceUnavailableException::AudioSourceUnavailableException(const std::string& message,
                                                                 const std::string& source)
    : HaptickException(ErrorInfo(ErrorCategory::AUDIO_SOURCE, ErrorSeverity::ERROR,
                                 message, source, "AudioSource")) {
}

ConfigurationException::ConfigurationException(const std::string& message, const std::string& details)
    : HaptickException(ErrorInfo(ErrorCategory::CONFIGURATION, ErrorSeverity::CRITICAL,
                                 message, details, "Configuration")) {
}

SerializationException::SerializationException(const std::string& message, const std::string& path)
    : HaptickException(ErrorInfo(ErrorCategory::SERIALIZATION, ErrorSeverity::ERROR,
                                 message, path, "Serialization")) {
}

PipelineCancelledException::PipelineCancelledException(const std::string& stage)
    : HaptickException(ErrorInfo(ErrorCategory::PIPELINE, ErrorSeverity::WARNING,
                                 "Pipeline cancelled", "before stage " + stage, stage)) {
}

std::string toString(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::INVALID_FRAME_SIZE: return "InvalidFrameSize";
        case ErrorCategory::EMPTY_SERIES: return "EmptySeries";
        case ErrorCategory::AUDIO_SOURCE: return "AudioSourceUnavailable";
        case ErrorCategory::CONFIGURATION: return "Configuration";
        case ErrorCategory::SERIALIZATION: return "Serialization";
        case ErrorCategory::PIPELINE: return "Pipeline";
        case ErrorCategory::UNKNOWN: return "Unknown";
    }
    return "Unknown";
}

std::string toString(ErrorSeverity severity) {
    switch (severity) {
        case ErrorSeverity::INFO: return "INFO";
        case ErrorSeverity::WARNING: return "WARN";
        case ErrorSeverity::ERROR: return "ERROR";
        case ErrorSeverity::CRITICAL: return "CRITICAL";
    }
    return "ERROR";
}

ErrorHandler& ErrorHandler::getInstance() {
    static ErrorHandler instance;
    return instance;
}

void ErrorHandler::reportError(const ErrorInfo& error) {
    ErrorCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        logError(error);

        error_history_.push_back(error);
        if (error_history_.size() > max_history_size_) {
            error_history_.erase(error_history_.begin());
        }
        callback = error_callback_;
    }

    if (callback) {
        try {
            callback(error);
        } catch (const std::exception& e) {
            Logger::error("Error in error callback: " + std::string(e.what()));
        }
    }
}

void ErrorHandler::reportError(const std::exception& e, const std::string& context) {
    if (const auto* haptick_error = dynamic_cast<const HaptickException*>(&e)) {
        ErrorInfo info = haptick_error->getErrorInfo();
        if (!context.empty()) {
            info.context = context;
        }
        reportError(info);
        return;
    }

    ErrorInfo error(ErrorCategory::UNKNOWN, ErrorSeverity::ERROR, e.what(), "", context);
    reportError(error);
}

void ErrorHandler::setErrorCallback(ErrorCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    error_callback_ = std::move(callback);
}

size_t ErrorHandler::getErrorCount(ErrorCategory category) const {
    std::lock_guard<std::mutex> lock(mutex_);

    if (category == ErrorCategory::UNKNOWN) {
        return error_history_.size();
    }

    return std::count_if(error_history_.begin(), error_history_.end(),
                        [category](const ErrorInfo& error) {
                            return error.category == category;
                        });
}

std::vector<ErrorInfo> ErrorHandler::getRecentErrors(size_t count) const {
    std::lock_guard<std::mutex> lock(mutex_);

    if (error_history_.size() <= count) {
        return error_history_;
    }

    return std::vector<ErrorInfo>(error_history_.end() - count, error_history_.end());
}

void ErrorHandler::clearErrorHistory() {
    std::lock_guard<std::mutex> lock(mutex_);
    error_history_.clear();
}

void ErrorHandler::setMaxHistorySize(size_t max_size) {
    std::lock_guard<std::mutex> lock(mutex_);
    max_history_size_ = std::max<size_t>(1, max_size);
    while (error_history_.size() > max_history_size_) {
        error_history_.erase(error_history_.begin());
    }
}

void ErrorHandler::logError(const ErrorInfo& error) {
    std::stringstream log_message;
    log_message << "[" << error.id << "] " << toString(error.category) << " - " << error.message;

    if (!error.details.empty()) {
        log_message << " | Details: " << error.details;
    }

    if (!error.context.empty()) {
        log_message << " | Context: " << error.context;
    }

    switch (error.severity) {
        case ErrorSeverity::INFO:
            Logger::info(log_message.str());
            break;
        case ErrorSeverity::WARNING:
            Logger::warn(log_message.str());
            break;
        case ErrorSeverity::ERROR:
        case ErrorSeverity::CRITICAL:
            Logger::error(log_message.str());
            break;
    }
}

ErrorContext::ErrorContext(const std::string& context)
    : previous_context_(current_context_) {
    current_context_ = context;
}

ErrorContext::~ErrorContext() {
    current_context_ = previous_context_;
}

std::string ErrorContext::getCurrentContext() {
    return current_context_;
}

} // namespace utils
} // namespace haptick
