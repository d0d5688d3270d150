#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <sstream>
#include <iomanip>
#include <random>
#include <algorithm>

namespace livetranslate {
namespace utils {

ErrorInfo::ErrorInfo(ErrorCategory cat, ErrorSeverity sev, const std::string& msg,
                     const std::string& det, const std::string& ctx, const std::string& sid)
    : category(cat), severity(sev), message(msg), details(det), context(ctx),
      timestamp(std::chrono::steady_clock::now()), session_id(sid) {

    static std::mutex id_mutex;
    static std::random_device rd;
    static std::mt19937 gen(rd());
    static std::uniform_int_distribution<> dis(0, 15);

    std::stringstream ss;
    ss << "err_";
    {
        std::lock_guard<std::mutex> lock(id_mutex);
        for (int i = 0; i < 8; ++i) {
            ss << std::hex << dis(gen);
        }
    }
    id = ss.str();
}

LiveTranslateException::LiveTranslateException(const ErrorInfo& error_info)
    : error_info_(error_info), what_message_(error_info.message) {
    if (!error_info_.details.empty()) {
        what_message_ += ": " + error_info_.details;
    }
}

const char* LiveTranslateException::what() const noexcept {
    return what_message_.c_str();
}

InputException::InputException(const std::string& message, const std::string& session_id)
    : LiveTranslateException(ErrorInfo(ErrorCategory::INPUT, ErrorSeverity::WARNING,
                                       message, "", "Input", session_id)) {
}

DetectionException::DetectionException(const std::string& message, const std::string& context)
    : LiveTranslateException(ErrorInfo(ErrorCategory::DETECTION, ErrorSeverity::WARNING,
                                       message, "", context.empty() ? "Detection" : context)) {
}

GenerationException::GenerationException(const std::string& message, const std::string& context)
    : LiveTranslateException(ErrorInfo(ErrorCategory::GENERATION, ErrorSeverity::ERROR,
                                       message, "", context.empty() ? "Generation" : context)) {
}

ProtocolException::ProtocolException(const std::string& message, const std::string& session_id)
    : LiveTranslateException(ErrorInfo(ErrorCategory::PROTOCOL, ErrorSeverity::WARNING,
                                       message, "", "Protocol", session_id)) {
}

WebSocketException::WebSocketException(const std::string& message, const std::string& session_id)
    : LiveTranslateException(ErrorInfo(ErrorCategory::WEBSOCKET, ErrorSeverity::ERROR,
                                       message, "", "WebSocket", session_id)) {
}

ModelLoadingException::ModelLoadingException(const std::string& message, const std::string& model_path)
    : LiveTranslateException(ErrorInfo(ErrorCategory::MODEL_LOADING, ErrorSeverity::CRITICAL,
                                       message, model_path, "ModelLoading")) {
}

ConfigurationException::ConfigurationException(const std::string& message, const std::string& source)
    : LiveTranslateException(ErrorInfo(ErrorCategory::CONFIGURATION, ErrorSeverity::ERROR,
                                       message, source, "Configuration")) {
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

    // Invoked outside the lock so the callback may query the handler
    if (callback) {
        try {
            callback(error);
        } catch (const std::exception& e) {
            Logger::error("Error in error callback: " + std::string(e.what()));
        }
    }
}

void ErrorHandler::reportError(const std::exception& e, const std::string& context,
                               const std::string& session_id) {
    if (const auto* known = dynamic_cast<const LiveTranslateException*>(&e)) {
        ErrorInfo error = known->getErrorInfo();
        if (!context.empty()) {
            error.context = context;
        }
        if (!session_id.empty()) {
            error.session_id = session_id;
        }
        reportError(error);
        return;
    }

    reportError(ErrorInfo(ErrorCategory::UNKNOWN, ErrorSeverity::ERROR, e.what(), "", context, session_id));
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

std::string ErrorHandler::categoryToString(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::INPUT: return "Input";
        case ErrorCategory::DETECTION: return "Detection";
        case ErrorCategory::GENERATION: return "Generation";
        case ErrorCategory::PROTOCOL: return "Protocol";
        case ErrorCategory::WEBSOCKET: return "WebSocket";
        case ErrorCategory::MODEL_LOADING: return "ModelLoading";
        case ErrorCategory::CONFIGURATION: return "Configuration";
        case ErrorCategory::UNKNOWN: return "Unknown";
    }
    return "Unknown";
}

void ErrorHandler::logError(const ErrorInfo& error) {
    std::stringstream log_message;
    log_message << "[" << error.id << "] " << categoryToString(error.category) << " - " << error.message;

    if (!error.details.empty()) {
        log_message << " | Details: " << error.details;
    }

    if (!error.context.empty()) {
        log_message << " | Context: " << error.context;
    }

    if (!error.session_id.empty()) {
        log_message << " | Session: " << error.session_id;
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

} // namespace utils
} // namespace livetranslate
