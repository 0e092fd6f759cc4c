#pragma once

#include "core/interview_session.hpp"

#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace panelsense {
namespace core {

/**
 * Registry of live interview sessions keyed by session id.
 *
 * Per-session state lives in each InterviewSession; the registry lock
 * only guards the id maps and is never held across a drain.
 * Finalized results of closed sessions are retained (bounded) so a
 * repeated closeSession returns the same artifact.
 */
class SessionController {
public:
    using SessionFactory = std::function<std::shared_ptr<InterviewSession>(const std::string&)>;
    using FinalizedCallback = std::function<void(const FinalizedSession&)>;

    SessionController(SessionDependencies deps, size_t closedRetention);
    SessionController(SessionFactory factory, size_t closedRetention);

    /**
     * Create and open a session. Throws AlreadyOpenException while a
     * session with this id is Open or Closing.
     */
    std::shared_ptr<InterviewSession> openSession(const std::string& sessionId);

    /**
     * Throws NotFoundException for an unknown id. Frames for a closed
     * session are dropped and return false.
     */
    bool ingestFrame(const std::string& sessionId, emotion::Modality modality,
                     std::string_view payload, std::optional<double> clientTimestamp = std::nullopt);

    bool ingestAudioBytes(const std::string& sessionId, const uint8_t* data, size_t size,
                          std::optional<double> clientTimestamp = std::nullopt);

    emotion::EmotionSnapshot requestSnapshot(const std::string& sessionId) const;

    /**
     * Graceful close. The finalized callback fires once per session,
     * after the first successful close. Idempotent.
     */
    FinalizedSession closeSession(const std::string& sessionId);

    // Abrupt disconnect; no finalized callback
    FinalizedSession abortSession(const std::string& sessionId);

    std::shared_ptr<InterviewSession> findSession(const std::string& sessionId) const;
    std::optional<FinalizedSession> finalizedResult(const std::string& sessionId) const;
    size_t activeSessionCount() const;

    void setFinalizedCallback(FinalizedCallback callback);

    // Abort every active session
    void shutdown();

private:
    std::shared_ptr<InterviewSession> lookup(const std::string& sessionId) const;
    bool retire(const std::string& sessionId, const std::shared_ptr<InterviewSession>& session,
                const FinalizedSession& result);

    SessionFactory factory_;
    size_t closedRetention_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<InterviewSession>> active_;
    std::unordered_map<std::string, FinalizedSession> closed_;
    std::deque<std::string> closedOrder_;
    FinalizedCallback finalizedCallback_;
};

} // namespace core
} // namespace panelsense
