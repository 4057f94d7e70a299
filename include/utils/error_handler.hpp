#pragma once

#include <string>
#include <exception>
#include <functional>
#include <chrono>
#include <mutex>
#include <vector>

namespace haptick {
namespace utils {

/**
 * Error severity levels
 */
enum class ErrorSeverity {
    INFO,
    WARNING,
    ERROR,
    CRITICAL
};

/**
 * Error categories, one per failure class a pipeline invocation can raise
 */
enum class ErrorCategory {
    INVALID_FRAME_SIZE,
    EMPTY_SERIES,
    AUDIO_SOURCE,
    CONFIGURATION,
    SERIALIZATION,
    PIPELINE,
    UNKNOWN
};

/**
 * Structured error information
 */
struct ErrorInfo {
    std::string id;
    ErrorCategory category;
    ErrorSeverity severity;
    std::string message;
    std::string details;
    std::string context;
    std::chrono::steady_clock::time_point timestamp;

    ErrorInfo(ErrorCategory cat, ErrorSeverity sev, const std::string& msg,
              const std::string& det = "", const std::string& ctx = "");
};

/**
 * Base exception for every failure surfaced by the library
 */
class HaptickException : public std::exception {
public:
    explicit HaptickException(const ErrorInfo& error_info);
    const char* what() const noexcept override;
    const ErrorInfo& getErrorInfo() const { return error_info_; }

private:
    ErrorInfo error_info_;
    mutable std::string what_message_;
};

/**
 * Frame length is not a power of two or exceeds the available samples
 */
class InvalidFrameSizeException : public HaptickException {
public:
    InvalidFrameSizeException(const std::string& message, size_t frame_length);

    size_t getFrameLength() const { return frame_length_; }

private:
    size_t frame_length_;
};

/**
 * A feature sequence is empty while a nonzero target length was requested
 */
class EmptySeriesException : public HaptickException {
public:
    EmptySeriesException(const std::string& message, const std::string& series_name = "");
};

/**
 * The audio source could not provide a sample buffer
 */
class AudioSourceUnavailableException : public HaptickException {
public:
    AudioSourceUnavailableException(const std::string& message, const std::string& source = "");
};

class ConfigurationException : public HaptickException {
public:
    ConfigurationException(const std::string& message, const std::string& details = "");
};

class SerializationException : public HaptickException {
public:
    SerializationException(const std::string& message, const std::string& path = "");
};

class PipelineCancelledException : public HaptickException {
public:
    explicit PipelineCancelledException(const std::string& stage);
};

std::string toString(ErrorCategory category);
std::string toString(ErrorSeverity severity);

/**
 * Error handler callback type
 */
using ErrorCallback = std::function<void(const ErrorInfo&)>;

/**
 * Central error sink. Failures are recorded and logged here before they
 * propagate to the caller; nothing is retried.
 */
class ErrorHandler {
public:
    static ErrorHandler& getInstance();

    void reportError(const ErrorInfo& error);
    void reportError(const std::exception& e, const std::string& context = "");

    void setErrorCallback(ErrorCallback callback);

    // Error statistics (UNKNOWN counts every category)
    size_t getErrorCount(ErrorCategory category = ErrorCategory::UNKNOWN) const;
    std::vector<ErrorInfo> getRecentErrors(size_t count = 10) const;
    void clearErrorHistory();
    void setMaxHistorySize(size_t max_size);

private:
    ErrorHandler() = default;
    ~ErrorHandler() = default;
    ErrorHandler(const ErrorHandler&) = delete;
    ErrorHandler& operator=(const ErrorHandler&) = delete;

    void logError(const ErrorInfo& error);

    ErrorCallback error_callback_;
    std::vector<ErrorInfo> error_history_;
    size_t max_history_size_ = 1000;

    mutable std::mutex mutex_;
};

/**
 * RAII error context manager. Tags errors reported on this thread with the
 * name of the stage currently running.
 */
class ErrorContext {
public:
    explicit ErrorContext(const std::string& context);
    ~ErrorContext();

    ErrorContext(const ErrorContext&) = delete;
    ErrorContext& operator=(const ErrorContext&) = delete;

    static std::string getCurrentContext();

private:
    std::string previous_context_;

    static thread_local std::string current_context_;
};

/**
 * Utility macros for error handling
 */
#define HANDLE_ERROR(category, severity, message, details) \
    do { \
        ::haptick::utils::ErrorInfo error(category, severity, message, details, \
                       ::haptick::utils::ErrorContext::getCurrentContext()); \
        ::haptick::utils::ErrorHandler::getInstance().reportError(error); \
    } while(0)

#define TRY_WITH_ERROR_HANDLING(operation) \
    try { \
        operation; \
    } catch (const std::exception& e) { \
        ::haptick::utils::ErrorHandler::getInstance().reportError( \
            e, ::haptick::utils::ErrorContext::getCurrentContext()); \
        throw; \
    }

} // namespace utils
} // namespace haptick
