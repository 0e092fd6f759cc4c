#pragma once

#include "emotion/emotion_detector.hpp"
#include "utils/config.hpp"

#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace panelsense {
namespace audio {
class AudioRecorder;
}

namespace core {

/**
 * Validates and decodes inbound media for one session.
 *
 * Video: base64 or data-URL image payloads, accepted when they carry
 * JPEG/PNG/WebP magic bytes; only every Nth valid frame is forwarded.
 * Audio: PCM16 chunks are appended to the session recording in arrival
 * order; every Nth chunk yields a voice window over the most recent
 * audio.
 *
 * Not thread-safe; the owning session serializes calls.
 */
class FrameIngress {
public:
    FrameIngress(std::string sessionId, const utils::SessionSettings& settings,
                 std::shared_ptr<audio::AudioRecorder> recorder);

    /**
     * Returns the decoded image when the frame should go to the facial
     * detector, std::nullopt when skipped by the stride.
     * Throws InvalidFrameException for an undecodable or oversize payload.
     */
    std::optional<emotion::DecodedImage> acceptVideo(std::string_view payload);

    /**
     * Base64 PCM16 chunk. Returns a voice window when the chunk stride
     * is reached. Throws InvalidFrameException for malformed audio.
     */
    std::optional<emotion::AudioWindow> acceptAudio(std::string_view base64Payload, double timestampSeconds);

    // Raw PCM16 bytes, e.g. from a binary WebSocket frame
    std::optional<emotion::AudioWindow> acceptAudioBytes(const uint8_t* data, size_t size, double timestampSeconds);

    static emotion::DecodedImage decodeImage(std::string_view payload, size_t maxBytes);
    static std::optional<std::string> detectImageFormat(const std::vector<uint8_t>& bytes);

    uint64_t videoFramesAccepted() const { return videoFrames_; }
    uint64_t audioChunksAccepted() const { return audioChunks_; }

private:
    std::string sessionId_;
    utils::SessionSettings settings_;
    std::shared_ptr<audio::AudioRecorder> recorder_;

    uint64_t videoFrames_ = 0;
    uint64_t audioChunks_ = 0;
    size_t windowCapacity_;
    std::deque<int16_t> recentAudio_;
};

} // namespace core
} // namespace panelsense
