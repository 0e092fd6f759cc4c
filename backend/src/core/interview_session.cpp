#include "core/interview_session.hpp"
#include "audio/audio_recorder.hpp"
#include "core/emotion_log_sink.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"

#include <algorithm>
#include <cmath>

namespace panelsense {
namespace core {

std::string sessionStateToString(SessionState state) {
    switch (state) {
        case SessionState::IDLE: return "idle";
        case SessionState::OPEN: return "open";
        case SessionState::CLOSING: return "closing";
        case SessionState::CLOSED: return "closed";
    }
    return "unknown";
}

InterviewSession::InterviewSession(std::string sessionId, SessionDependencies deps)
    : sessionId_(std::move(sessionId))
    , deps_(std::move(deps))
    , recorder_(std::make_shared<audio::AudioRecorder>(
          audio::AudioRecorder::makeArtifactPath(deps_.session.recordingsDir, sessionId_),
          deps_.session.sampleRate))
    , aggregator_(sessionId_, deps_.aggregator)
    , ingress_(sessionId_, deps_.session, recorder_) {
    if (!deps_.facialDetector || !deps_.voiceDetector) {
        throw utils::ConfigurationException("Session requires both emotion detectors", sessionId_);
    }
    if (!deps_.detectorQueue) {
        throw utils::ConfigurationException("Session requires a detector queue", sessionId_);
    }
    utils::Logger::debug("Created session: " + sessionId_);
}

InterviewSession::~InterviewSession() {
    bool open = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        open = state_ == SessionState::OPEN;
    }
    if (open) {
        utils::Logger::warn("Session " + sessionId_ + " destroyed while open, aborting");
        abort();
    }
}

void InterviewSession::open() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != SessionState::IDLE) {
        throw utils::SessionStateException("Cannot open session in state " + sessionStateToString(state_),
                                           sessionId_);
    }

    recorder_->start();
    openedAt_ = std::chrono::steady_clock::now();
    startedAt_ = std::chrono::system_clock::now();
    state_ = SessionState::OPEN;

    utils::Logger::info("Session " + sessionId_ + " opened, recording to " + recorder_->getPath());
}

double InterviewSession::resolveTimestamp(std::optional<double> clientTimestamp) const {
    if (clientTimestamp && std::isfinite(*clientTimestamp)) {
        return *clientTimestamp;
    }
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - openedAt_).count();
}

bool InterviewSession::ingestFrame(emotion::Modality modality, std::string_view payload,
                                   std::optional<double> clientTimestamp) {
    double timestamp = 0.0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == SessionState::IDLE) {
            throw utils::SessionStateException("Session is not open", sessionId_);
        }
        if (state_ != SessionState::OPEN) {
            utils::Logger::debug("Session " + sessionId_ + " is " + sessionStateToString(state_) +
                                 ", dropping " + emotion::modalityToString(modality) + " frame");
            return false;
        }
        timestamp = resolveTimestamp(clientTimestamp);
    }

    if (modality == emotion::Modality::FACIAL) {
        std::optional<emotion::DecodedImage> image;
        {
            std::lock_guard<std::mutex> lock(ingressMutex_);
            image = ingress_.acceptVideo(payload);
        }
        if (!image) {
            return false;
        }
        return dispatchFacial(std::move(*image), timestamp);
    }

    std::optional<emotion::AudioWindow> window;
    {
        std::lock_guard<std::mutex> lock(ingressMutex_);
        window = ingress_.acceptAudio(payload, timestamp);
    }
    if (!window) {
        return false;
    }
    return dispatchVoice(std::move(*window), timestamp);
}

bool InterviewSession::ingestAudioBytes(const uint8_t* data, size_t size,
                                        std::optional<double> clientTimestamp) {
    double timestamp = 0.0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == SessionState::IDLE) {
            throw utils::SessionStateException("Session is not open", sessionId_);
        }
        if (state_ != SessionState::OPEN) {
            return false;
        }
        timestamp = resolveTimestamp(clientTimestamp);
    }

    std::optional<emotion::AudioWindow> window;
    {
        std::lock_guard<std::mutex> lock(ingressMutex_);
        window = ingress_.acceptAudioBytes(data, size, timestamp);
    }
    if (!window) {
        return false;
    }
    return dispatchVoice(std::move(*window), timestamp);
}

bool InterviewSession::tryReserve(emotion::Modality modality, uint64_t& epoch) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != SessionState::OPEN) {
        return false;
    }

    bool& busy = modality == emotion::Modality::FACIAL ? facialBusy_ : voiceBusy_;
    if (busy) {
        dropped_++;
        utils::Logger::debug("Session " + sessionId_ + ": " + emotion::modalityToString(modality) +
                             " detector busy, frame dropped");
        return false;
    }

    busy = true;
    inFlight_++;
    epoch = epoch_;
    return true;
}

bool InterviewSession::dispatchFacial(emotion::DecodedImage image, double timestamp) {
    uint64_t epoch = 0;
    if (!tryReserve(emotion::Modality::FACIAL, epoch)) {
        return false;
    }

    std::weak_ptr<InterviewSession> weak = shared_from_this();
    auto detector = deps_.facialDetector;
    std::string sessionId = sessionId_;

    bool accepted = deps_.detectorQueue->enqueue([weak, detector, sessionId, epoch, timestamp, image = std::move(image)]() {
        std::optional<emotion::Detection> detection;
        try {
            detection = detector->detect(image);
        } catch (const std::exception& e) {
            utils::ErrorHandler::getInstance().reportError(e, "facial detection (" + detector->name() + ")",
                                                           sessionId);
        }
        if (auto self = weak.lock()) {
            self->completeDetection(emotion::Modality::FACIAL, epoch, detection, timestamp);
        }
    }, TaskPriority::NORMAL);

    if (!accepted) {
        // Detector queue already shut down: release the reservation
        completeDetection(emotion::Modality::FACIAL, epoch, std::nullopt, timestamp);
        return false;
    }
    return true;
}

bool InterviewSession::dispatchVoice(emotion::AudioWindow window, double timestamp) {
    uint64_t epoch = 0;
    if (!tryReserve(emotion::Modality::VOICE, epoch)) {
        return false;
    }

    std::weak_ptr<InterviewSession> weak = shared_from_this();
    auto detector = deps_.voiceDetector;
    std::string sessionId = sessionId_;

    bool accepted = deps_.detectorQueue->enqueue([weak, detector, sessionId, epoch, timestamp, window = std::move(window)]() {
        std::optional<emotion::Detection> detection;
        try {
            detection = detector->detect(window);
        } catch (const std::exception& e) {
            utils::ErrorHandler::getInstance().reportError(e, "voice detection (" + detector->name() + ")",
                                                           sessionId);
        }
        if (auto self = weak.lock()) {
            self->completeDetection(emotion::Modality::VOICE, epoch, detection, timestamp);
        }
    }, TaskPriority::NORMAL);

    if (!accepted) {
        // Detector queue already shut down: release the reservation
        completeDetection(emotion::Modality::VOICE, epoch, std::nullopt, timestamp);
        return false;
    }
    return true;
}

void InterviewSession::completeDetection(emotion::Modality modality, uint64_t epoch,
                                         const std::optional<emotion::Detection>& detection,
                                         double timestamp) {
    std::optional<emotion::EmotionSnapshot> snapshot;
    UpdateSink sink;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        (modality == emotion::Modality::FACIAL ? facialBusy_ : voiceBusy_) = false;
        if (inFlight_ > 0) {
            inFlight_--;
        }

        bool live = state_ == SessionState::OPEN || state_ == SessionState::CLOSING;
        if (epoch != epoch_ || !live) {
            utils::Logger::debug("Session " + sessionId_ + ": discarding late " +
                                 emotion::modalityToString(modality) + " detection");
        } else if (detection) {
            auto stored = aggregator_.record(modality, detection->label, detection->confidence, timestamp);
            if (stored) {
                snapshot = aggregator_.snapshot();
                sink = updateSink_;
            }
        }
        drainCv_.notify_all();
    }

    if (snapshot && sink) {
        sink(*snapshot);
    }
}

emotion::EmotionSnapshot InterviewSession::requestSnapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != SessionState::OPEN && state_ != SessionState::CLOSING) {
        throw utils::SessionStateException("Snapshot unavailable in state " + sessionStateToString(state_),
                                           sessionId_);
    }
    return aggregator_.snapshot();
}

FinalizedSession InterviewSession::close() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (state_ == SessionState::IDLE) {
        throw utils::SessionStateException("Cannot close a session that was never opened", sessionId_);
    }
    if (state_ == SessionState::CLOSED) {
        return *finalized_;
    }
    if (state_ == SessionState::CLOSING) {
        closedCv_.wait(lock, [this] { return state_ == SessionState::CLOSED; });
        return *finalized_;
    }

    state_ = SessionState::CLOSING;
    size_t pending = inFlight_;
    auto timeout = std::chrono::milliseconds(deps_.session.drainTimeoutMs) *
                   static_cast<int64_t>(std::max<size_t>(1, pending));
    utils::Logger::info("Session " + sessionId_ + " closing, " + std::to_string(pending) +
                        " detection(s) in flight");

    bool drained = drainCv_.wait_for(lock, timeout, [this] { return inFlight_ == 0; });
    size_t discarded = 0;
    if (!drained) {
        discarded = inFlight_;
        epoch_++;
        utils::Logger::warn("Session " + sessionId_ + ": drain timed out, discarding " +
                            std::to_string(discarded) + " pending detection(s)");
    }
    lock.unlock();

    FinalizedSession result = finalize(false, discarded);

    lock.lock();
    finalized_ = result;
    state_ = SessionState::CLOSED;
    closedCv_.notify_all();

    utils::Logger::info("Session " + sessionId_ + " closed with " + std::to_string(result.sampleCount) +
                        " samples");
    return result;
}

FinalizedSession InterviewSession::abort() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (state_ == SessionState::IDLE) {
        throw utils::SessionStateException("Cannot abort a session that was never opened", sessionId_);
    }
    if (state_ == SessionState::CLOSED) {
        return *finalized_;
    }
    if (state_ == SessionState::CLOSING) {
        closedCv_.wait(lock, [this] { return state_ == SessionState::CLOSED; });
        return *finalized_;
    }

    epoch_++;
    size_t discarded = inFlight_;
    finalized_ = finalize(true, discarded);
    state_ = SessionState::CLOSED;
    closedCv_.notify_all();

    utils::Logger::info("Session " + sessionId_ + " aborted with " + std::to_string(finalized_->sampleCount) +
                        " samples");
    return *finalized_;
}

FinalizedSession InterviewSession::finalize(bool aborted, size_t discarded) {
    FinalizedSession result;
    result.sessionId = sessionId_;
    result.aborted = aborted;
    result.discardedDetections = discarded;
    result.startedAt = startedAt_;

    try {
        result.audioArtifact = recorder_->stop();
    } catch (const std::exception& e) {
        utils::ErrorHandler::getInstance().reportError(e, "finalize recording", sessionId_);
        result.audioArtifact = recorder_->getPath();
    }

    std::vector<emotion::EmotionSample> samples = aggregator_.samples();
    result.sampleCount = samples.size();

    if (deps_.emotionLogSink) {
        try {
            deps_.emotionLogSink->persist(sessionId_, samples);
        } catch (const std::exception& e) {
            utils::Logger::error("Session " + sessionId_ + ": failed to persist emotion log: " + e.what());
            utils::ErrorHandler::getInstance().reportError(e, "persist emotion log", sessionId_);
        }
    }

    result.endedAt = std::chrono::system_clock::now();
    return result;
}

void InterviewSession::setUpdateSink(UpdateSink sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    updateSink_ = std::move(sink);
}

SessionState InterviewSession::getState() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

size_t InterviewSession::inFlightCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return inFlight_;
}

uint64_t InterviewSession::droppedFrames() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}

} // namespace core
} // namespace panelsense
