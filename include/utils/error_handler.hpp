#pragma once

#include <string>
#include <exception>
#include <functional>
#include <chrono>
#include <mutex>
#include <vector>

namespace livetranslate {
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
 * Error categories, one per failure class of the service
 */
enum class ErrorCategory {
    INPUT,          // empty or malformed inbound message
    DETECTION,      // statistical language detector failure (absorbed by fallback)
    GENERATION,     // engine error, resource exhaustion, timeout
    PROTOCOL,       // request not allowed in the current session state
    WEBSOCKET,      // transport failure
    MODEL_LOADING,
    CONFIGURATION,  // invalid configuration file or value
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
    std::string session_id;

    ErrorInfo(ErrorCategory cat, ErrorSeverity sev, const std::string& msg,
              const std::string& det = "", const std::string& ctx = "",
              const std::string& sid = "");
};

/**
 * Base exception for everything the service raises itself
 */
class LiveTranslateException : public std::exception {
public:
    explicit LiveTranslateException(const ErrorInfo& error_info);
    const char* what() const noexcept override;
    const ErrorInfo& getErrorInfo() const { return error_info_; }

private:
    ErrorInfo error_info_;
    std::string what_message_;
};

class InputException : public LiveTranslateException {
public:
    explicit InputException(const std::string& message, const std::string& session_id = "");
};

class DetectionException : public LiveTranslateException {
public:
    explicit DetectionException(const std::string& message, const std::string& context = "");
};

class GenerationException : public LiveTranslateException {
public:
    explicit GenerationException(const std::string& message, const std::string& context = "");
};

class ProtocolException : public LiveTranslateException {
public:
    explicit ProtocolException(const std::string& message, const std::string& session_id = "");
};

class WebSocketException : public LiveTranslateException {
public:
    explicit WebSocketException(const std::string& message, const std::string& session_id = "");
};

class ModelLoadingException : public LiveTranslateException {
public:
    explicit ModelLoadingException(const std::string& message, const std::string& model_path = "");
};

class ConfigurationException : public LiveTranslateException {
public:
    explicit ConfigurationException(const std::string& message, const std::string& source = "");
};

using ErrorCallback = std::function<void(const ErrorInfo&)>;

/**
 * Central error sink: logs, keeps a bounded history and notifies a callback
 */
class ErrorHandler {
public:
    static ErrorHandler& getInstance();

    void reportError(const ErrorInfo& error);
    void reportError(const std::exception& e, const std::string& context = "",
                     const std::string& session_id = "");

    void setErrorCallback(ErrorCallback callback);

    // UNKNOWN counts every category
    size_t getErrorCount(ErrorCategory category = ErrorCategory::UNKNOWN) const;
    std::vector<ErrorInfo> getRecentErrors(size_t count = 10) const;
    void clearErrorHistory();

    static std::string categoryToString(ErrorCategory category);

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

} // namespace utils
} // namespace livetranslate
