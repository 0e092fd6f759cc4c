#include "assessment/transcription_service.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>
#include <sstream>

namespace panelsense {
namespace assessment {

std::string SidecarTranscriptionService::sidecarPath(const std::string& artifactRef) {
    return artifactRef + ".transcript.json";
}

Transcript SidecarTranscriptionService::parse(const std::string& jsonContent, const std::string& artifactRef) {
    Transcript transcript;

    try {
        nlohmann::json j = nlohmann::json::parse(jsonContent);
        if (!j.is_object() || !j.contains("segments") || !j["segments"].is_array()) {
            throw utils::TranscriptionException("Transcript has no segments array", artifactRef);
        }

        for (const auto& item : j["segments"]) {
            TranscriptSegment segment;
            segment.speaker = item.value("speaker", std::string());
            segment.text = item.value("text", std::string());
            segment.startSeconds = item.value("start", 0.0);
            segment.endSeconds = item.value("end", segment.startSeconds);
            if (segment.text.find_first_not_of(" \t\r\n") == std::string::npos) {
                continue;
            }
            transcript.push_back(std::move(segment));
        }
    } catch (const nlohmann::json::exception& e) {
        throw utils::TranscriptionException(std::string("Malformed transcript: ") + e.what(), artifactRef);
    }

    if (transcript.empty()) {
        throw utils::TranscriptionException("Transcript is empty", artifactRef);
    }

    std::stable_sort(transcript.begin(), transcript.end(),
                     [](const TranscriptSegment& a, const TranscriptSegment& b) {
                         return a.startSeconds < b.startSeconds;
                     });
    return transcript;
}

Transcript SidecarTranscriptionService::transcribe(const std::string& artifactRef) {
    std::string path = sidecarPath(artifactRef);
    std::ifstream file(path);
    if (!file.is_open()) {
        throw utils::TranscriptionException("Transcript not available: " + path, artifactRef);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    Transcript transcript = parse(buffer.str(), artifactRef);
    utils::Logger::info("Loaded transcript with " + std::to_string(transcript.size()) +
                        " segments for " + artifactRef);
    return transcript;
}

} // namespace assessment
} // namespace panelsense
