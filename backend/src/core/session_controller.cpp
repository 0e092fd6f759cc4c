#include "core/session_controller.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"

#include <algorithm>
#include <vector>

namespace panelsense {
namespace core {

SessionController::SessionController(SessionDependencies deps, size_t closedRetention)
    : closedRetention_(closedRetention) {
    factory_ = [deps](const std::string& sessionId) {
        return std::make_shared<InterviewSession>(sessionId, deps);
    };
}

SessionController::SessionController(SessionFactory factory, size_t closedRetention)
    : factory_(std::move(factory)), closedRetention_(closedRetention) {
    if (!factory_) {
        throw utils::ConfigurationException("Session factory must not be empty");
    }
}

std::shared_ptr<InterviewSession> SessionController::openSession(const std::string& sessionId) {
    if (sessionId.empty()) {
        throw utils::SessionStateException("Session id must not be empty");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (active_.count(sessionId) > 0) {
        throw utils::AlreadyOpenException(sessionId);
    }

    auto session = factory_(sessionId);
    session->open();
    active_[sessionId] = session;

    if (closed_.erase(sessionId) > 0) {
        closedOrder_.erase(std::remove(closedOrder_.begin(), closedOrder_.end(), sessionId),
                           closedOrder_.end());
        utils::Logger::info("Session " + sessionId + " reopened, previous result dropped");
    }
    return session;
}

std::shared_ptr<InterviewSession> SessionController::lookup(const std::string& sessionId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = active_.find(sessionId);
    if (it != active_.end()) {
        return it->second;
    }
    if (closed_.count(sessionId) > 0) {
        return nullptr;
    }
    throw utils::NotFoundException("session", sessionId);
}

bool SessionController::ingestFrame(const std::string& sessionId, emotion::Modality modality,
                                    std::string_view payload, std::optional<double> clientTimestamp) {
    auto session = lookup(sessionId);
    if (!session) {
        return false;
    }
    return session->ingestFrame(modality, payload, clientTimestamp);
}

bool SessionController::ingestAudioBytes(const std::string& sessionId, const uint8_t* data, size_t size,
                                         std::optional<double> clientTimestamp) {
    auto session = lookup(sessionId);
    if (!session) {
        return false;
    }
    return session->ingestAudioBytes(data, size, clientTimestamp);
}

emotion::EmotionSnapshot SessionController::requestSnapshot(const std::string& sessionId) const {
    auto session = lookup(sessionId);
    if (!session) {
        throw utils::SessionStateException("Session is closed", sessionId);
    }
    return session->requestSnapshot();
}

bool SessionController::retire(const std::string& sessionId, const std::shared_ptr<InterviewSession>& session,
                               const FinalizedSession& result) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = active_.find(sessionId);
    if (it == active_.end() || it->second != session) {
        return false;
    }
    active_.erase(it);

    if (closedRetention_ == 0) {
        return true;
    }
    closed_[sessionId] = result;
    closedOrder_.push_back(sessionId);
    while (closedOrder_.size() > closedRetention_) {
        closed_.erase(closedOrder_.front());
        closedOrder_.pop_front();
    }
    return true;
}

FinalizedSession SessionController::closeSession(const std::string& sessionId) {
    std::shared_ptr<InterviewSession> session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = active_.find(sessionId);
        if (it == active_.end()) {
            auto cached = closed_.find(sessionId);
            if (cached != closed_.end()) {
                return cached->second;
            }
            throw utils::NotFoundException("session", sessionId);
        }
        session = it->second;
    }

    // May block for the drain; registry lock is not held
    FinalizedSession result = session->close();

    FinalizedCallback callback;
    bool first = retire(sessionId, session, result);
    if (first && !result.aborted) {
        std::lock_guard<std::mutex> lock(mutex_);
        callback = finalizedCallback_;
    }
    if (callback) {
        try {
            callback(result);
        } catch (const std::exception& e) {
            utils::ErrorHandler::getInstance().reportError(e, "session finalized callback", sessionId);
        }
    }
    return result;
}

FinalizedSession SessionController::abortSession(const std::string& sessionId) {
    std::shared_ptr<InterviewSession> session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = active_.find(sessionId);
        if (it == active_.end()) {
            auto cached = closed_.find(sessionId);
            if (cached != closed_.end()) {
                return cached->second;
            }
            throw utils::NotFoundException("session", sessionId);
        }
        session = it->second;
    }

    FinalizedSession result = session->abort();
    retire(sessionId, session, result);
    return result;
}

std::shared_ptr<InterviewSession> SessionController::findSession(const std::string& sessionId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = active_.find(sessionId);
    return it != active_.end() ? it->second : nullptr;
}

std::optional<FinalizedSession> SessionController::finalizedResult(const std::string& sessionId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = closed_.find(sessionId);
    if (it == closed_.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t SessionController::activeSessionCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_.size();
}

void SessionController::setFinalizedCallback(FinalizedCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    finalizedCallback_ = std::move(callback);
}

void SessionController::shutdown() {
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : active_) {
            ids.push_back(entry.first);
        }
    }

    for (const auto& id : ids) {
        try {
            abortSession(id);
        } catch (const utils::NotFoundException&) {
            // closed concurrently
        }
    }
    utils::Logger::info("Session controller shut down, aborted " + std::to_string(ids.size()) + " session(s)");
}

} // namespace core
} // namespace panelsense
