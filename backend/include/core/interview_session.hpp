#pragma once

#include "core/frame_ingress.hpp"
#include "core/task_queue.hpp"
#include "emotion/emotion_aggregator.hpp"
#include "emotion/emotion_detector.hpp"
#include "utils/config.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace panelsense {
namespace audio {
class AudioRecorder;
}

namespace core {

class EmotionLogSink;

/**
 * Idle -> Open -> Closing -> Closed, plus Open -> Closed on abort.
 */
enum class SessionState {
    IDLE,
    OPEN,
    CLOSING,
    CLOSED
};

std::string sessionStateToString(SessionState state);

/**
 * Result of finalizing a session; handed to batch assessment.
 */
struct FinalizedSession {
    std::string sessionId;
    std::string audioArtifact;
    size_t sampleCount = 0;
    size_t discardedDetections = 0;
    bool aborted = false;
    std::chrono::system_clock::time_point startedAt;
    std::chrono::system_clock::time_point endedAt;
};

/**
 * Collaborators shared by every session of a server
 */
struct SessionDependencies {
    std::shared_ptr<emotion::FacialEmotionDetector> facialDetector;
    std::shared_ptr<emotion::VoiceEmotionDetector> voiceDetector;
    std::shared_ptr<TaskQueue> detectorQueue;
    std::shared_ptr<EmotionLogSink> emotionLogSink;
    utils::SessionSettings session;
    utils::AggregatorSettings aggregator;
};

/**
 * One live interview capture.
 *
 * Frames are decoded on the caller's thread and detection runs on the
 * shared detector queue. Each modality has at most one detection in
 * flight; frames arriving while it is busy are dropped. Results that
 * complete after close() gave up draining are discarded whole.
 */
class InterviewSession : public std::enable_shared_from_this<InterviewSession> {
public:
    using UpdateSink = std::function<void(const emotion::EmotionSnapshot&)>;

    InterviewSession(std::string sessionId, SessionDependencies deps);
    ~InterviewSession();

    InterviewSession(const InterviewSession&) = delete;
    InterviewSession& operator=(const InterviewSession&) = delete;

    /**
     * Idle -> Open. Starts the audio recording.
     * Throws SessionStateException when not Idle.
     */
    void open();

    /**
     * Route one video or audio payload. Never blocks on detection.
     * Returns true when a detection was dispatched.
     * Frames are dropped silently in Closing/Closed; Idle throws
     * SessionStateException. Bad payloads throw InvalidFrameException.
     */
    bool ingestFrame(emotion::Modality modality, std::string_view payload,
                     std::optional<double> clientTimestamp = std::nullopt);

    // Binary PCM16 audio chunk
    bool ingestAudioBytes(const uint8_t* data, size_t size,
                          std::optional<double> clientTimestamp = std::nullopt);

    /**
     * Valid in Open and Closing, otherwise SessionStateException.
     */
    emotion::EmotionSnapshot requestSnapshot() const;

    /**
     * Open -> Closing -> Closed. Drains in-flight detections within
     * drainTimeout per call, persists the emotion log and finalizes the
     * recording. Idempotent: later calls return the same result, and a
     * call racing an ongoing close waits for it.
     */
    FinalizedSession close();

    /**
     * Open -> Closed without draining, for abrupt disconnects.
     * The recording and emotion log are still flushed.
     */
    FinalizedSession abort();

    void setUpdateSink(UpdateSink sink);

    SessionState getState() const;
    const std::string& getSessionId() const { return sessionId_; }
    const emotion::EmotionAggregator& aggregator() const { return aggregator_; }

    size_t inFlightCount() const;
    uint64_t droppedFrames() const;

private:
    bool dispatchFacial(emotion::DecodedImage image, double timestamp);
    bool dispatchVoice(emotion::AudioWindow window, double timestamp);
    bool tryReserve(emotion::Modality modality, uint64_t& epoch);
    void completeDetection(emotion::Modality modality, uint64_t epoch,
                           const std::optional<emotion::Detection>& detection, double timestamp);
    double resolveTimestamp(std::optional<double> clientTimestamp) const;
    FinalizedSession finalize(bool aborted, size_t discarded);

    std::string sessionId_;
    SessionDependencies deps_;
    std::shared_ptr<audio::AudioRecorder> recorder_;
    emotion::EmotionAggregator aggregator_;

    // Guards ingress_ so audio is recorded in arrival order
    std::mutex ingressMutex_;
    FrameIngress ingress_;

    mutable std::mutex mutex_;
    std::condition_variable drainCv_;
    std::condition_variable closedCv_;
    SessionState state_ = SessionState::IDLE;
    bool facialBusy_ = false;
    bool voiceBusy_ = false;
    size_t inFlight_ = 0;
    uint64_t epoch_ = 0;
    uint64_t dropped_ = 0;
    std::optional<FinalizedSession> finalized_;
    UpdateSink updateSink_;

    std::chrono::steady_clock::time_point openedAt_;
    std::chrono::system_clock::time_point startedAt_;
};

} // namespace core
} // namespace panelsense
