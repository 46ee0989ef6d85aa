#pragma once

#include <string>
#include <exception>
#include <functional>
#include <chrono>
#include <mutex>
#include <vector>

namespace livenotes {
namespace utils {

enum class ErrorSeverity {
    INFO,
    WARNING,
    ERROR,
    CRITICAL
};

// Which part of the pipeline failed
enum class ErrorCategory {
    WEBSOCKET,
    STT,
    ANALYSIS,
    NETWORK,
    CONFIGURATION,
    UNKNOWN
};

/**
 * One reported failure. The id ("err_" + 8 hex digits) ties log lines to
 * entries in the error history.
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
 * Base exception for everything raised inside the server
 */
class LiveNotesException : public std::exception {
public:
    explicit LiveNotesException(const ErrorInfo& error_info);
    const char* what() const noexcept override;
    const ErrorInfo& getErrorInfo() const { return error_info_; }

private:
    ErrorInfo error_info_;
    mutable std::string what_message_;
};

class STTException : public LiveNotesException {
public:
    STTException(const std::string& message, const std::string& context = "");
};

class AnalysisException : public LiveNotesException {
public:
    AnalysisException(const std::string& message, const std::string& context = "");
};

class ConfigException : public LiveNotesException {
public:
    ConfigException(const std::string& message, const std::string& config_path = "");
};

/**
 * Transport or protocol failure talking to an HTTP endpoint.
 * status_code is 0 when no response was received.
 */
class HttpException : public LiveNotesException {
public:
    HttpException(const std::string& message, long status_code = 0, const std::string& url = "");
    long getStatusCode() const { return status_code_; }

private:
    long status_code_;
};

using ErrorCallback = std::function<void(const ErrorInfo&)>;

/**
 * Process-wide sink for failures the pipeline recovers from. Every report is
 * logged at a level matching its severity and kept in a bounded history.
 */
class ErrorHandler {
public:
    static ErrorHandler& getInstance();

    void reportError(const ErrorInfo& error);
    void reportError(const std::exception& e, const std::string& context = "",
                     const std::string& session_id = "");

    void setErrorCallback(ErrorCallback callback);

    // Error statistics. UNKNOWN counts every category.
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

// Names the operation and session running on this thread for the duration of a scope
class ErrorContext {
public:
    ErrorContext(const std::string& context, const std::string& session_id = "");
    ~ErrorContext();

    static std::string getCurrentContext();
    static std::string getCurrentSessionId();

private:
    std::string previous_context_;
    std::string previous_session_id_;

    static thread_local std::string current_context_;
    static thread_local std::string current_session_id_;
};

} // namespace utils
} // namespace livenotes
