#include "audio/audio_recorder.hpp"
#include "audio/audio_utils.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"

#include <chrono>
#include <filesystem>

namespace panelsense {
namespace audio {

AudioRecorder::AudioRecorder(std::string path, int sampleRate)
    : path_(std::move(path)), sampleRate_(sampleRate) {
}

AudioRecorder::~AudioRecorder() {
    try {
        stop();
    } catch (const std::exception& e) {
        utils::Logger::error("Failed to finalize recording " + path_ + ": " + e.what());
    }
}

std::string AudioRecorder::makeArtifactPath(const std::string& directory, const std::string& sessionId) {
    auto epoch = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    std::filesystem::path path = std::filesystem::path(directory) /
                                 (sessionId + "_" + std::to_string(epoch) + ".wav");
    return path.string();
}

void AudioRecorder::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (recording_ || finalized_) {
        return;
    }

    std::filesystem::path path(path_);
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
    }

    file_.open(path_, std::ios::binary | std::ios::trunc);
    if (!file_.is_open()) {
        throw utils::PanelSenseException(utils::ErrorInfo(
            utils::ErrorCategory::PERSISTENCE, utils::ErrorSeverity::ERROR,
            "Failed to open recording file", path_, "AudioRecorder"));
    }

    auto header = buildWavHeader(0, sampleRate_, 1);
    file_.write(reinterpret_cast<const char*>(header.data()), static_cast<std::streamsize>(header.size()));
    recording_ = true;
    utils::Logger::info("Recording audio to " + path_);
}

void AudioRecorder::write(const std::vector<int16_t>& samples) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!recording_ || samples.empty()) {
        return;
    }

    std::vector<uint8_t> bytes;
    bytes.reserve(samples.size() * 2);
    for (int16_t s : samples) {
        uint16_t raw = static_cast<uint16_t>(s);
        bytes.push_back(static_cast<uint8_t>(raw & 0xFF));
        bytes.push_back(static_cast<uint8_t>(raw >> 8));
    }
    file_.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    samplesWritten_ += samples.size();
}

std::string AudioRecorder::stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (finalized_) {
        return path_;
    }
    finalized_ = true;

    if (!recording_) {
        return path_;
    }
    recording_ = false;

    const uint32_t dataBytes = static_cast<uint32_t>(samplesWritten_ * 2);
    auto header = buildWavHeader(dataBytes, sampleRate_, 1);
    file_.seekp(0, std::ios::beg);
    file_.write(reinterpret_cast<const char*>(header.data()), static_cast<std::streamsize>(header.size()));
    file_.close();

    if (file_.fail()) {
        throw utils::PanelSenseException(utils::ErrorInfo(
            utils::ErrorCategory::PERSISTENCE, utils::ErrorSeverity::ERROR,
            "Failed to finalize recording file", path_, "AudioRecorder"));
    }

    utils::Logger::info("Recording saved: " + path_ + " (" +
                        std::to_string(static_cast<double>(samplesWritten_) / sampleRate_) + "s)");
    return path_;
}

bool AudioRecorder::isRecording() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return recording_;
}

uint64_t AudioRecorder::samplesWritten() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return samplesWritten_;
}

} // namespace audio
} // namespace panelsense
