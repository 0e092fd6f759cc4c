#include "utils/config.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <nlohmann/json.hpp>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <regex>
#include <sstream>

namespace panelsense {
namespace utils {

Config Config::load(const std::string& configPath) {
    if (!std::filesystem::exists(configPath)) {
        Logger::warn("Configuration file not found: " + configPath + ", using defaults");
        return Config();
    }

    std::ifstream file(configPath);
    if (!file.is_open()) {
        throw ConfigurationException("Failed to open configuration file", configPath);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string content = buffer.str();

    if (content.find_first_not_of(" \t\r\n") == std::string::npos) {
        Logger::warn("Empty configuration file " + configPath + ", using defaults");
        return Config();
    }

    Config config = fromJson(content);
    Logger::info("Configuration loaded from: " + configPath);
    return config;
}

Config Config::fromJson(const std::string& jsonContent) {
    Config config;

    try {
        nlohmann::json j = nlohmann::json::parse(jsonContent);
        if (!j.is_object()) {
            throw ConfigurationException("Configuration root must be an object");
        }

        if (j.contains("server")) {
            const auto& s = j["server"];
            config.server_.port = s.value("port", config.server_.port);
            config.server_.detectorThreads = s.value("detector_threads", config.server_.detectorThreads);
            config.server_.controlThreads = s.value("control_threads", config.server_.controlThreads);
        }

        if (j.contains("logging")) {
            config.logLevel_ = j["logging"].value("level", config.logLevel_);
        }

        if (j.contains("session")) {
            const auto& s = j["session"];
            auto& out = config.session_;
            out.drainTimeoutMs = s.value("drain_timeout_ms", out.drainTimeoutMs);
            out.videoFrameStride = s.value("video_frame_stride", out.videoFrameStride);
            out.voiceChunkStride = s.value("voice_chunk_stride", out.voiceChunkStride);
            out.voiceWindowSeconds = s.value("voice_window_seconds", out.voiceWindowSeconds);
            out.sampleRate = s.value("sample_rate", out.sampleRate);
            out.maxFrameBytes = s.value("max_frame_bytes", out.maxFrameBytes);
            out.recordingsDir = s.value("recordings_dir", out.recordingsDir);
            out.emotionLogDir = s.value("emotion_log_dir", out.emotionLogDir);
            out.emotionLogMinConfidence = s.value("emotion_log_min_confidence", out.emotionLogMinConfidence);
            out.closedSessionRetention = s.value("closed_session_retention", out.closedSessionRetention);
        }

        if (j.contains("aggregator")) {
            const auto& a = j["aggregator"];
            auto& out = config.aggregator_;
            out.windowSeconds = a.value("window_seconds", out.windowSeconds);
            out.maxWindowSamples = a.value("max_window_samples", out.maxWindowSamples);

            std::string policy = a.value("empty_window_policy", std::string("stable"));
            if (policy == "stable") {
                out.emptyWindowPolicy = EmptyWindowPolicy::STABLE;
            } else if (policy == "undefined") {
                out.emptyWindowPolicy = EmptyWindowPolicy::UNDEFINED;
            } else {
                throw ConfigurationException("Unknown empty_window_policy", policy);
            }
        }

        if (j.contains("assessment")) {
            const auto& a = j["assessment"];
            auto& out = config.assessment_;
            out.topK = a.value("top_k", out.topK);
            out.relevanceThreshold = a.value("relevance_threshold", out.relevanceThreshold);
            out.exactMatchRelevance = a.value("exact_match_relevance", out.exactMatchRelevance);
            out.noEvidenceScore = a.value("no_evidence_score", out.noEvidenceScore);
            out.minSpanChars = a.value("min_span_chars", out.minSpanChars);
            out.introMaxChars = a.value("intro_max_chars", out.introMaxChars);
            out.interviewerSpeakers = a.value("interviewer_speakers", out.interviewerSpeakers);
            out.introPatterns = a.value("intro_patterns", out.introPatterns);
            out.evidenceSeparator = a.value("evidence_separator", out.evidenceSeparator);
            out.retainedSessions = a.value("retained_sessions", out.retainedSessions);
        }

        if (j.contains("scoring")) {
            const auto& s = j["scoring"];
            config.scoring_.aiWeight = s.value("ai_weight", config.scoring_.aiWeight);
            config.scoring_.manualWeight = s.value("manual_weight", config.scoring_.manualWeight);
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigurationException("Invalid configuration JSON", e.what());
    }

    config.validate();
    return config;
}

void Config::validate() const {
    if (server_.port <= 0 || server_.port > 65535) {
        throw ConfigurationException("server.port out of range", std::to_string(server_.port));
    }
    if (server_.detectorThreads == 0 || server_.controlThreads == 0) {
        throw ConfigurationException("server thread counts must be positive");
    }
    if (session_.drainTimeoutMs < 0) {
        throw ConfigurationException("session.drain_timeout_ms must not be negative");
    }
    if (session_.videoFrameStride < 1 || session_.voiceChunkStride < 1) {
        throw ConfigurationException("session strides must be at least 1");
    }
    if (session_.sampleRate <= 0 || !(session_.voiceWindowSeconds > 0.0)) {
        throw ConfigurationException("session audio settings must be positive");
    }
    if (session_.emotionLogMinConfidence < 0.0 || session_.emotionLogMinConfidence > 1.0) {
        throw ConfigurationException("session.emotion_log_min_confidence must be within [0,1]");
    }
    if (!(aggregator_.windowSeconds > 0.0) || aggregator_.maxWindowSamples == 0) {
        throw ConfigurationException("aggregator window must be positive");
    }
    if (assessment_.topK == 0) {
        throw ConfigurationException("assessment.top_k must be positive");
    }
    if (assessment_.relevanceThreshold < 0.0 || assessment_.relevanceThreshold > 1.0 ||
        assessment_.exactMatchRelevance < 0.0 || assessment_.exactMatchRelevance > 1.0) {
        throw ConfigurationException("assessment relevance values must be within [0,1]");
    }
    // Indicators without evidence keep a low baseline, never zero
    if (!(assessment_.noEvidenceScore > 0.0) || assessment_.noEvidenceScore > 100.0) {
        throw ConfigurationException("assessment.no_evidence_score must be within (0,100]",
                                     std::to_string(assessment_.noEvidenceScore));
    }
    if (assessment_.retainedSessions == 0) {
        throw ConfigurationException("assessment.retained_sessions must be positive");
    }
    for (const auto& pattern : assessment_.introPatterns) {
        try {
            std::regex compiled(pattern, std::regex::icase);
        } catch (const std::regex_error& e) {
            throw ConfigurationException("Invalid intro pattern", pattern + " (" + e.what() + ")");
        }
    }
    if (scoring_.aiWeight < 0.0 || scoring_.manualWeight < 0.0 ||
        std::abs(scoring_.aiWeight + scoring_.manualWeight - 100.0) > 1e-6) {
        throw ConfigurationException("scoring weights must be non-negative and sum to 100",
                                     std::to_string(scoring_.aiWeight) + "/" +
                                     std::to_string(scoring_.manualWeight));
    }
}

} // namespace utils
} // namespace panelsense
