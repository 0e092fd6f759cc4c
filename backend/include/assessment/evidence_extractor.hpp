#pragma once

#include "assessment/assessment_types.hpp"
#include "assessment/similarity_model.hpp"
#include "utils/config.hpp"

#include <memory>
#include <regex>
#include <string>
#include <vector>

namespace panelsense {
namespace assessment {

struct ExtractionResult {
    double aiScore = 0.0;
    std::vector<EvidenceSpan> evidence;     // top-K, ranked
    std::string evidenceText;
    std::string reasoning;
    size_t qualifyingSpans = 0;
    size_t exactMatches = 0;
};

/**
 * Hybrid exact + semantic evidence search over the candidate's side of a
 * transcript. Pure function of (transcript, indicator, settings, model),
 * so re-running on an unchanged transcript yields the same result.
 */
class SemanticEvidenceExtractor {
public:
    SemanticEvidenceExtractor(std::shared_ptr<SemanticSimilarityModel> model,
                              const utils::AssessmentSettings& settings = utils::AssessmentSettings());

    ExtractionResult extract(const Transcript& transcript, const Indicator& indicator) const;

    /**
     * Candidate sentences with their segment start times, intro greetings
     * removed unless that would remove everything.
     */
    std::vector<EvidenceSpan> candidateSpans(const Transcript& transcript) const;

    static std::vector<std::string> splitSentences(const std::string& text);

    const utils::AssessmentSettings& getSettings() const { return settings_; }

private:
    bool isInterviewer(const std::string& speaker) const;
    bool isIntro(const std::string& sentence) const;
    bool mentions(const std::string& lowered, const Indicator& indicator) const;
    double score(size_t qualifying, double topRelevance, size_t exactMatches) const;
    std::string reasoningFor(const Indicator& indicator, const ExtractionResult& result,
                             double topRelevance) const;

    std::shared_ptr<SemanticSimilarityModel> model_;
    utils::AssessmentSettings settings_;
    std::vector<std::regex> introPatterns_;
};

} // namespace assessment
} // namespace panelsense
