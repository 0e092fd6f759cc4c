#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace panelsense {
namespace assessment {

/**
 * Interviewer-defined trait scored from the transcript.
 * keywords are matched verbatim (case-insensitive) in addition to the
 * indicator name.
 */
struct Indicator {
    std::string id;
    std::string name;
    std::string description;
    double weight = 1.0;
    std::vector<std::string> keywords;
};

struct TranscriptSegment {
    std::string speaker;
    std::string text;
    double startSeconds = 0.0;
    double endSeconds = 0.0;
};

using Transcript = std::vector<TranscriptSegment>;

/**
 * One quoted piece of candidate speech supporting an indicator
 */
struct EvidenceSpan {
    std::string text;
    double startSeconds = 0.0;
    double relevance = 0.0;
    bool exactMatch = false;
};

/**
 * One row per (session, indicator). The combined score is never stored;
 * it is derived from the current weights when read.
 */
struct Assessment {
    std::string sessionId;
    std::string indicatorId;
    double aiScore = 0.0;
    std::optional<double> manualScore;
    std::vector<EvidenceSpan> evidence;     // ranked, at most top-K
    std::string evidenceText;               // evidence joined with the separator, or the sentinel
    std::string reasoning;
    std::chrono::system_clock::time_point updatedAt;
};

extern const char* const kNoEvidenceSentinel;

/**
 * Join span texts with the separator; the sentinel when there are none.
 */
std::string formatEvidence(const std::vector<EvidenceSpan>& spans, const std::string& separator);

/**
 * Throws ConfigurationException for an empty or duplicate id or a
 * weight that is not strictly positive.
 */
void validateIndicators(const std::vector<Indicator>& indicators);

} // namespace assessment
} // namespace panelsense
