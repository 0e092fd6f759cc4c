#pragma once

#include <chrono>
#include <exception>
#include <functional>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace panelsense {
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
 * Error categories used to classify reported failures
 */
enum class ErrorCategory {
    SESSION,
    DETECTOR,
    INGRESS,
    CONFIGURATION,
    TRANSCRIPTION,
    ASSESSMENT,
    PERSISTENCE,
    WEBSOCKET,
    SYSTEM,
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
 * Base of every exception raised by PanelSense components
 */
class PanelSenseException : public std::exception {
public:
    explicit PanelSenseException(const ErrorInfo& error_info);
    const char* what() const noexcept override;
    const ErrorInfo& getErrorInfo() const { return error_info_; }

    /**
     * Short machine-readable code sent to clients in error messages
     */
    virtual std::string code() const { return "internal"; }

private:
    ErrorInfo error_info_;
    mutable std::string what_message_;
};

// Operation is invalid for the session's current lifecycle state
class SessionStateException : public PanelSenseException {
public:
    SessionStateException(const std::string& message, const std::string& session_id = "");
    std::string code() const override { return "session_state"; }
};

// Detector adapter failed for one frame; contained by the session
class DetectorUnavailableException : public PanelSenseException {
public:
    DetectorUnavailableException(const std::string& message, const std::string& detector = "");
    std::string code() const override { return "detector_unavailable"; }
};

class ConfigurationException : public PanelSenseException {
public:
    ConfigurationException(const std::string& message, const std::string& details = "");
    std::string code() const override { return "configuration"; }
};

class AlreadyOpenException : public PanelSenseException {
public:
    explicit AlreadyOpenException(const std::string& session_id);
    std::string code() const override { return "already_open"; }
};

class NotFoundException : public PanelSenseException {
public:
    NotFoundException(const std::string& what_kind, const std::string& id);
    std::string code() const override { return "not_found"; }
};

class InvalidFrameException : public PanelSenseException {
public:
    InvalidFrameException(const std::string& message, const std::string& session_id = "");
    std::string code() const override { return "invalid_frame"; }
};

class TranscriptionException : public PanelSenseException {
public:
    TranscriptionException(const std::string& message, const std::string& artifact = "");
    std::string code() const override { return "transcription_failed"; }
};

class AssessmentInProgressException : public PanelSenseException {
public:
    AssessmentInProgressException(const std::string& session_id, const std::string& indicator_id);
    std::string code() const override { return "assessment_in_progress"; }
};

/**
 * Error handler callback type
 */
using ErrorCallback = std::function<void(const ErrorInfo&)>;

/**
 * Central error sink. Components that contain a failure locally
 * (dropped frame, failed log persist, skipped indicator) report it here
 * so that it is logged and counted.
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

private:
    ErrorHandler() = default;
    ~ErrorHandler() = default;
    ErrorHandler(const ErrorHandler&) = delete;
    ErrorHandler& operator=(const ErrorHandler&) = delete;

    static void logError(const ErrorInfo& error);

    ErrorCallback error_callback_;
    std::deque<ErrorInfo> error_history_;
    static constexpr size_t max_history_size_ = 1000;

    mutable std::mutex mutex_;
};

std::string errorCategoryToString(ErrorCategory category);

} // namespace utils
} // namespace panelsense
