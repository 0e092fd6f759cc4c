#pragma once

#include "assessment/assessment_types.hpp"
#include "emotion/emotion_types.hpp"
#include <nlohmann/json.hpp>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace panelsense {
namespace core {

// Message types
enum class MessageType {
    UNKNOWN,
    // Client to Server
    VIDEO_FRAME,
    AUDIO_CHUNK,
    GET_SNAPSHOT,
    SET_INDICATORS,
    END_SESSION,
    PING,
    // Server to Client
    SESSION_OPENED,
    EMOTION_UPDATE,
    SNAPSHOT,
    SESSION_CLOSED,
    ASSESSMENT_READY,
    ERROR,
    PONG
};

// Base message class
class Message {
public:
    explicit Message(MessageType type) : type_(type) {}
    virtual ~Message() = default;

    MessageType getType() const { return type_; }
    virtual std::string serialize() const = 0;

protected:
    MessageType type_;
};

// Client to Server Messages
class VideoFrameMessage : public Message {
public:
    VideoFrameMessage() : Message(MessageType::VIDEO_FRAME) {}
    VideoFrameMessage(const std::string& frame, std::optional<double> timestamp = std::nullopt)
        : Message(MessageType::VIDEO_FRAME), frame_(frame), timestamp_(timestamp) {}

    const std::string& getFrame() const { return frame_; }
    std::optional<double> getTimestamp() const { return timestamp_; }

    void setFrame(const std::string& frame) { frame_ = frame; }
    void setTimestamp(std::optional<double> timestamp) { timestamp_ = timestamp; }

    std::string serialize() const override;

private:
    std::string frame_;
    std::optional<double> timestamp_;
};

class AudioChunkMessage : public Message {
public:
    AudioChunkMessage() : Message(MessageType::AUDIO_CHUNK) {}
    AudioChunkMessage(const std::string& audio, std::optional<double> timestamp = std::nullopt)
        : Message(MessageType::AUDIO_CHUNK), audio_(audio), timestamp_(timestamp) {}

    const std::string& getAudio() const { return audio_; }
    std::optional<double> getTimestamp() const { return timestamp_; }

    void setAudio(const std::string& audio) { audio_ = audio; }
    void setTimestamp(std::optional<double> timestamp) { timestamp_ = timestamp; }

    std::string serialize() const override;

private:
    std::string audio_;
    std::optional<double> timestamp_;
};

class GetSnapshotMessage : public Message {
public:
    GetSnapshotMessage() : Message(MessageType::GET_SNAPSHOT) {}
    std::string serialize() const override;
};

class SetIndicatorsMessage : public Message {
public:
    SetIndicatorsMessage() : Message(MessageType::SET_INDICATORS) {}
    explicit SetIndicatorsMessage(std::vector<assessment::Indicator> indicators)
        : Message(MessageType::SET_INDICATORS), indicators_(std::move(indicators)) {}

    const std::vector<assessment::Indicator>& getIndicators() const { return indicators_; }
    void setIndicators(std::vector<assessment::Indicator> indicators) { indicators_ = std::move(indicators); }

    std::string serialize() const override;

private:
    std::vector<assessment::Indicator> indicators_;
};

class EndSessionMessage : public Message {
public:
    EndSessionMessage() : Message(MessageType::END_SESSION) {}
    std::string serialize() const override;
};

class PingMessage : public Message {
public:
    PingMessage() : Message(MessageType::PING) {}
    std::string serialize() const override;
};

// Server to Client Messages
class SessionOpenedMessage : public Message {
public:
    explicit SessionOpenedMessage(const std::string& sessionId)
        : Message(MessageType::SESSION_OPENED), sessionId_(sessionId) {}

    const std::string& getSessionId() const { return sessionId_; }
    std::string serialize() const override;

private:
    std::string sessionId_;
};

/**
 * Pushed whenever a detection is accepted; bursts are coalesced.
 */
class EmotionUpdateMessage : public Message {
public:
    explicit EmotionUpdateMessage(const emotion::EmotionSnapshot& snapshot)
        : Message(MessageType::EMOTION_UPDATE), snapshot_(snapshot) {}

    const emotion::EmotionSnapshot& getSnapshot() const { return snapshot_; }
    std::string serialize() const override;

private:
    emotion::EmotionSnapshot snapshot_;
};

// Reply to get_snapshot
class SnapshotMessage : public Message {
public:
    explicit SnapshotMessage(const emotion::EmotionSnapshot& snapshot)
        : Message(MessageType::SNAPSHOT), snapshot_(snapshot) {}

    const emotion::EmotionSnapshot& getSnapshot() const { return snapshot_; }
    std::string serialize() const override;

private:
    emotion::EmotionSnapshot snapshot_;
};

class SessionClosedMessage : public Message {
public:
    SessionClosedMessage(const std::string& sessionId, const std::string& audioArtifact, size_t sampleCount)
        : Message(MessageType::SESSION_CLOSED), sessionId_(sessionId), audioArtifact_(audioArtifact),
          sampleCount_(sampleCount) {}

    const std::string& getSessionId() const { return sessionId_; }
    const std::string& getAudioArtifact() const { return audioArtifact_; }
    size_t getSampleCount() const { return sampleCount_; }

    std::string serialize() const override;

private:
    std::string sessionId_;
    std::string audioArtifact_;
    size_t sampleCount_;
};

class AssessmentReadyMessage : public Message {
public:
    explicit AssessmentReadyMessage(const assessment::Assessment& assessment)
        : Message(MessageType::ASSESSMENT_READY), assessment_(assessment) {}

    const assessment::Assessment& getAssessment() const { return assessment_; }
    std::string serialize() const override;

private:
    assessment::Assessment assessment_;
};

class ErrorMessage : public Message {
public:
    ErrorMessage() : Message(MessageType::ERROR) {}
    ErrorMessage(const std::string& message, const std::string& code = "")
        : Message(MessageType::ERROR), message_(message), code_(code) {}

    const std::string& getMessage() const { return message_; }
    const std::string& getCode() const { return code_; }

    void setMessage(const std::string& message) { message_ = message; }
    void setCode(const std::string& code) { code_ = code; }

    std::string serialize() const override;

private:
    std::string message_;
    std::string code_;
};

class PongMessage : public Message {
public:
    PongMessage() : Message(MessageType::PONG) {}
    std::string serialize() const override;
};

// Message factory and parser
class MessageProtocol {
public:
    /**
     * Parse an inbound client message. Returns nullptr for malformed
     * JSON, an unknown type or a message missing required fields.
     */
    static std::unique_ptr<Message> parseMessage(const std::string& json);
    static MessageType getMessageType(const std::string& json);

    static nlohmann::json snapshotToJson(const emotion::EmotionSnapshot& snapshot);
    static nlohmann::json indicatorToJson(const assessment::Indicator& indicator);

    static std::string messageTypeToString(MessageType type);

    /**
     * Indicator ids arrive as strings or whole numbers; 42 and 42.0 both
     * become "42". Fractional, non-finite or out-of-range numbers and
     * other JSON types yield std::nullopt.
     */
    static std::optional<std::string> indicatorIdFromJson(const nlohmann::json& value);

private:
    static MessageType stringToMessageType(const std::string& typeStr);
    static std::optional<double> optionalNumber(const nlohmann::json& data, const std::string& key);
    static std::optional<assessment::Indicator> parseIndicator(const nlohmann::json& item);
};

} // namespace core
} // namespace panelsense
