#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace panelsense {
namespace utils {

struct ServerSettings {
    int port = 8080;
    size_t detectorThreads = 4;
    size_t controlThreads = 2;
};

struct SessionSettings {
    // Drain budget per in-flight detector call during close()
    int drainTimeoutMs = 300;
    // Forward every Nth accepted video frame to the facial detector
    int videoFrameStride = 1;
    // Run voice detection once every N audio chunks
    int voiceChunkStride = 5;
    double voiceWindowSeconds = 1.0;
    int sampleRate = 16000;
    size_t maxFrameBytes = 4 * 1024 * 1024;
    std::string recordingsDir = "recordings";
    std::string emotionLogDir = "emotion_logs";
    double emotionLogMinConfidence = 0.5;
    size_t closedSessionRetention = 256;
};

/**
 * What stability() reports when no sample falls inside the window
 */
enum class EmptyWindowPolicy {
    STABLE,     // 1.0, no contradicting evidence
    UNDEFINED   // no value
};

struct AggregatorSettings {
    double windowSeconds = 30.0;
    size_t maxWindowSamples = 100;
    EmptyWindowPolicy emptyWindowPolicy = EmptyWindowPolicy::STABLE;
};

struct AssessmentSettings {
    size_t topK = 3;
    double relevanceThreshold = 0.5;
    double exactMatchRelevance = 0.95;
    double noEvidenceScore = 10.0;
    size_t minSpanChars = 15;
    size_t introMaxChars = 50;
    std::vector<std::string> interviewerSpeakers = {"interviewer"};
    std::vector<std::string> introPatterns = {
        "^hello", "^hi\\b", "^good (morning|afternoon|evening)",
        "^my name is", "^thank you$", "^thanks$", "^nice to meet you"
    };
    std::string evidenceSeparator = " | ";
    // Finalized sessions whose indicators, scores and last run stay in memory
    size_t retainedSessions = 1024;
};

struct ScoringSettings {
    double aiWeight = 60.0;
    double manualWeight = 40.0;
};

class Config {
public:
    /**
     * Load configuration from a JSON file. A missing or empty file yields
     * defaults. Malformed JSON or out-of-range values throw
     * ConfigurationException.
     */
    static Config load(const std::string& configPath);
    static Config fromJson(const std::string& jsonContent);
    static Config defaults() { return Config(); }

    int getPort() const { return server_.port; }
    std::string getLogLevel() const { return logLevel_; }

    const ServerSettings& server() const { return server_; }
    const SessionSettings& session() const { return session_; }
    const AggregatorSettings& aggregator() const { return aggregator_; }
    const AssessmentSettings& assessment() const { return assessment_; }
    const ScoringSettings& scoring() const { return scoring_; }

private:
    Config() = default;

    void validate() const;

    ServerSettings server_;
    SessionSettings session_;
    AggregatorSettings aggregator_;
    AssessmentSettings assessment_;
    ScoringSettings scoring_;
    std::string logLevel_ = "INFO";
};

} // namespace utils
} // namespace panelsense
