#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <algorithm>
#include <atomic>
#include <cstdio>
#include <sstream>

namespace panelsense {
namespace utils {

namespace {

// Process-wide, so ids stay unique across handler resets
std::atomic<uint64_t> g_next_error_id{1};

std::string nextErrorId() {
    char buffer[24];
    std::snprintf(buffer, sizeof(buffer), "err-%06llu",
                  static_cast<unsigned long long>(g_next_error_id.fetch_add(1)));
    return buffer;
}

} // namespace

ErrorInfo::ErrorInfo(ErrorCategory cat, ErrorSeverity sev, const std::string& msg,
                     const std::string& det, const std::string& ctx, const std::string& sid)
    : id(nextErrorId()), category(cat), severity(sev), message(msg), details(det), context(ctx),
      timestamp(std::chrono::steady_clock::now()), session_id(sid) {
}

PanelSenseException::PanelSenseException(const ErrorInfo& error_info)
    : error_info_(error_info) {
}

const char* PanelSenseException::what() const noexcept {
    if (what_message_.empty()) {
        what_message_ = error_info_.message;
        if (!error_info_.details.empty()) {
            what_message_ += ": " + error_info_.details;
        }
    }
    return what_message_.c_str();
}

SessionStateException::SessionStateException(const std::string& message, const std::string& session_id)
    : PanelSenseException(ErrorInfo(ErrorCategory::SESSION, ErrorSeverity::WARNING,
                                     message, "", "SessionController", session_id)) {
}

DetectorUnavailableException::DetectorUnavailableException(const std::string& message, const std::string& detector)
    : PanelSenseException(ErrorInfo(ErrorCategory::DETECTOR, ErrorSeverity::WARNING,
                                     message, "", detector.empty() ? "Detector" : detector)) {
}

ConfigurationException::ConfigurationException(const std::string& message, const std::string& details)
    : PanelSenseException(ErrorInfo(ErrorCategory::CONFIGURATION, ErrorSeverity::ERROR,
                                     message, details, "Configuration")) {
}

AlreadyOpenException::AlreadyOpenException(const std::string& session_id)
    : PanelSenseException(ErrorInfo(ErrorCategory::SESSION, ErrorSeverity::WARNING,
                                     "Session already open", session_id, "SessionController", session_id)) {
}

NotFoundException::NotFoundException(const std::string& what_kind, const std::string& id)
    : PanelSenseException(ErrorInfo(ErrorCategory::SESSION, ErrorSeverity::WARNING,
                                     what_kind + " not found", id, "Lookup")) {
}

InvalidFrameException::InvalidFrameException(const std::string& message, const std::string& session_id)
    : PanelSenseException(ErrorInfo(ErrorCategory::INGRESS, ErrorSeverity::WARNING,
                                     message, "", "FrameIngress", session_id)) {
}

TranscriptionException::TranscriptionException(const std::string& message, const std::string& artifact)
    : PanelSenseException(ErrorInfo(ErrorCategory::TRANSCRIPTION, ErrorSeverity::ERROR,
                                     message, artifact, "Transcription")) {
}

AssessmentInProgressException::AssessmentInProgressException(const std::string& session_id,
                                                             const std::string& indicator_id)
    : PanelSenseException(ErrorInfo(ErrorCategory::ASSESSMENT, ErrorSeverity::WARNING,
                                     "Assessment already running", "indicator " + indicator_id,
                                     "AssessmentStore", session_id)) {
}

ErrorHandler& ErrorHandler::getInstance() {
    static ErrorHandler instance;
    return instance;
}

void ErrorHandler::reportError(const ErrorInfo& error) {
    logError(error);

    ErrorCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        error_history_.push_back(error);
        while (error_history_.size() > max_history_size_) {
            error_history_.pop_front();
        }
        callback = error_callback_;
    }

    // Outside the lock so the callback may query the handler
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
    if (auto* known = dynamic_cast<const PanelSenseException*>(&e)) {
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

    ErrorInfo error(ErrorCategory::UNKNOWN, ErrorSeverity::ERROR, e.what(), "", context, session_id);
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
    size_t skip = error_history_.size() > count ? error_history_.size() - count : 0;
    return std::vector<ErrorInfo>(error_history_.begin() + static_cast<std::ptrdiff_t>(skip),
                                  error_history_.end());
}

void ErrorHandler::clearErrorHistory() {
    std::lock_guard<std::mutex> lock(mutex_);
    error_history_.clear();
}

std::string errorCategoryToString(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::SESSION: return "Session";
        case ErrorCategory::DETECTOR: return "Detector";
        case ErrorCategory::INGRESS: return "Ingress";
        case ErrorCategory::CONFIGURATION: return "Configuration";
        case ErrorCategory::TRANSCRIPTION: return "Transcription";
        case ErrorCategory::ASSESSMENT: return "Assessment";
        case ErrorCategory::PERSISTENCE: return "Persistence";
        case ErrorCategory::WEBSOCKET: return "WebSocket";
        case ErrorCategory::SYSTEM: return "System";
        case ErrorCategory::UNKNOWN: return "Unknown";
    }
    return "Unknown";
}

void ErrorHandler::logError(const ErrorInfo& error) {
    std::ostringstream line;
    line << error.id << " " << errorCategoryToString(error.category) << ": " << error.message;
    if (!error.details.empty()) {
        line << " (" << error.details << ")";
    }
    if (!error.context.empty()) {
        line << " in " << error.context;
    }
    if (!error.session_id.empty()) {
        line << " [session " << error.session_id << "]";
    }

    if (error.severity == ErrorSeverity::INFO) {
        Logger::info(line.str());
    } else if (error.severity == ErrorSeverity::WARNING) {
        Logger::warn(line.str());
    } else {
        Logger::error(line.str());
    }
}

} // namespace utils
} // namespace panelsense
