#include "core/emotion_log_sink.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"

#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>

namespace panelsense {
namespace core {

JsonFileEmotionLogSink::JsonFileEmotionLogSink(std::string directory, double minConfidence)
    : directory_(std::move(directory)), minConfidence_(minConfidence) {
}

std::string JsonFileEmotionLogSink::pathFor(const std::string& sessionId) const {
    return (std::filesystem::path(directory_) / (sessionId + ".json")).string();
}

void JsonFileEmotionLogSink::persist(const std::string& sessionId,
                                     const std::vector<emotion::EmotionSample>& samples) {
    nlohmann::json j;
    j["session_id"] = sessionId;
    j["samples"] = nlohmann::json::array();

    size_t kept = 0;
    for (const auto& sample : samples) {
        if (sample.confidence <= minConfidence_) {
            continue;
        }
        j["samples"].push_back({
            {"timestamp", sample.timestampSeconds},
            {"modality", emotion::modalityToString(sample.modality)},
            {"label", sample.label},
            {"confidence", sample.confidence}
        });
        kept++;
    }

    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        throw utils::PanelSenseException(utils::ErrorInfo(
            utils::ErrorCategory::PERSISTENCE, utils::ErrorSeverity::ERROR,
            "Failed to create emotion log directory", ec.message(), "EmotionLogSink", sessionId));
    }

    const std::string path = pathFor(sessionId);
    std::ofstream file(path, std::ios::trunc);
    if (!file.is_open()) {
        throw utils::PanelSenseException(utils::ErrorInfo(
            utils::ErrorCategory::PERSISTENCE, utils::ErrorSeverity::ERROR,
            "Failed to open emotion log file", path, "EmotionLogSink", sessionId));
    }
    file << j.dump(2);
    file.close();
    if (file.fail()) {
        throw utils::PanelSenseException(utils::ErrorInfo(
            utils::ErrorCategory::PERSISTENCE, utils::ErrorSeverity::ERROR,
            "Failed to write emotion log file", path, "EmotionLogSink", sessionId));
    }

    utils::Logger::info("Saved " + std::to_string(kept) + " of " + std::to_string(samples.size()) +
                        " emotion samples to " + path);
}

} // namespace core
} // namespace panelsense
