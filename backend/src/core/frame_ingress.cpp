#include "core/frame_ingress.hpp"
#include "audio/audio_recorder.hpp"
#include "audio/audio_utils.hpp"
#include "utils/base64.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"

#include <algorithm>

namespace panelsense {
namespace core {

FrameIngress::FrameIngress(std::string sessionId, const utils::SessionSettings& settings,
                           std::shared_ptr<audio::AudioRecorder> recorder)
    : sessionId_(std::move(sessionId)), settings_(settings), recorder_(std::move(recorder)) {
    windowCapacity_ = static_cast<size_t>(std::max(1.0, settings_.voiceWindowSeconds * settings_.sampleRate));
}

std::optional<std::string> FrameIngress::detectImageFormat(const std::vector<uint8_t>& bytes) {
    if (bytes.size() >= 3 && bytes[0] == 0xFF && bytes[1] == 0xD8 && bytes[2] == 0xFF) {
        return std::string("jpeg");
    }
    static const uint8_t kPng[] = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A};
    if (bytes.size() >= sizeof(kPng) && std::equal(std::begin(kPng), std::end(kPng), bytes.begin())) {
        return std::string("png");
    }
    if (bytes.size() >= 12 && std::equal(bytes.begin(), bytes.begin() + 4, "RIFF") &&
        std::equal(bytes.begin() + 8, bytes.begin() + 12, "WEBP")) {
        return std::string("webp");
    }
    return std::nullopt;
}

emotion::DecodedImage FrameIngress::decodeImage(std::string_view payload, size_t maxBytes) {
    if (payload.empty()) {
        throw utils::InvalidFrameException("Empty video frame");
    }

    // data:image/jpeg;base64,<data>
    if (payload.substr(0, 5) == "data:") {
        size_t comma = payload.find(',');
        if (comma == std::string_view::npos) {
            throw utils::InvalidFrameException("Malformed data URL");
        }
        payload = payload.substr(comma + 1);
    }

    // base64 expands by 4/3
    if (payload.size() / 4 * 3 > maxBytes) {
        throw utils::InvalidFrameException("Video frame exceeds " + std::to_string(maxBytes) + " bytes");
    }

    auto decoded = utils::decodeBase64(payload);
    if (!decoded || decoded->empty()) {
        throw utils::InvalidFrameException("Video frame is not valid base64");
    }

    auto format = detectImageFormat(*decoded);
    if (!format) {
        throw utils::InvalidFrameException("Unsupported image format");
    }

    emotion::DecodedImage image;
    image.bytes = std::move(*decoded);
    image.format = *format;
    return image;
}

std::optional<emotion::DecodedImage> FrameIngress::acceptVideo(std::string_view payload) {
    emotion::DecodedImage image = decodeImage(payload, settings_.maxFrameBytes);

    uint64_t index = videoFrames_++;
    if (index % static_cast<uint64_t>(settings_.videoFrameStride) != 0) {
        return std::nullopt;
    }
    return image;
}

std::optional<emotion::AudioWindow> FrameIngress::acceptAudio(std::string_view base64Payload,
                                                              double timestampSeconds) {
    if (base64Payload.size() / 4 * 3 > settings_.maxFrameBytes) {
        throw utils::InvalidFrameException("Audio chunk exceeds " + std::to_string(settings_.maxFrameBytes) + " bytes");
    }
    auto decoded = utils::decodeBase64(base64Payload);
    if (!decoded) {
        throw utils::InvalidFrameException("Audio chunk is not valid base64");
    }
    return acceptAudioBytes(decoded->data(), decoded->size(), timestampSeconds);
}

std::optional<emotion::AudioWindow> FrameIngress::acceptAudioBytes(const uint8_t* data, size_t size,
                                                                   double timestampSeconds) {
    if (size == 0) {
        throw utils::InvalidFrameException("Empty audio chunk");
    }
    if (size > settings_.maxFrameBytes) {
        throw utils::InvalidFrameException("Audio chunk exceeds " + std::to_string(settings_.maxFrameBytes) + " bytes");
    }

    auto samples = audio::decodePCM16(data, size);
    if (!samples) {
        throw utils::InvalidFrameException("Audio chunk has an odd byte count");
    }

    if (recorder_) {
        recorder_->write(*samples);
    }

    recentAudio_.insert(recentAudio_.end(), samples->begin(), samples->end());
    while (recentAudio_.size() > windowCapacity_) {
        recentAudio_.pop_front();
    }

    uint64_t count = ++audioChunks_;
    if (count % static_cast<uint64_t>(settings_.voiceChunkStride) != 0) {
        return std::nullopt;
    }

    emotion::AudioWindow window;
    window.sampleRate = settings_.sampleRate;
    window.samples.reserve(recentAudio_.size());
    for (int16_t s : recentAudio_) {
        window.samples.push_back(audio::convertSampleToFloat(s));
    }
    window.startSeconds = std::max(0.0, timestampSeconds - window.durationSeconds());
    return window;
}

} // namespace core
} // namespace panelsense
