#include "assessment/evidence_extractor.hpp"
#include "assessment/score_combiner.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace panelsense {
namespace assessment {

namespace {

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string trim(const std::string& text) {
    size_t start = text.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(" \t\r\n");
    return text.substr(start, end - start + 1);
}

std::string formatSeconds(double seconds) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(1) << seconds << "s";
    return out.str();
}

} // namespace

SemanticEvidenceExtractor::SemanticEvidenceExtractor(std::shared_ptr<SemanticSimilarityModel> model,
                                                     const utils::AssessmentSettings& settings)
    : model_(std::move(model)), settings_(settings) {
    if (!model_) {
        throw utils::ConfigurationException("Evidence extractor requires a similarity model");
    }
    for (const auto& pattern : settings_.introPatterns) {
        try {
            introPatterns_.emplace_back(pattern, std::regex::ECMAScript | std::regex::icase);
        } catch (const std::regex_error& e) {
            throw utils::ConfigurationException("Invalid intro pattern", pattern + " (" + e.what() + ")");
        }
    }
}

std::vector<std::string> SemanticEvidenceExtractor::splitSentences(const std::string& text) {
    std::vector<std::string> sentences;
    std::string current;

    for (char c : text) {
        if (c == '.' || c == '!' || c == '?') {
            std::string sentence = trim(current);
            if (!sentence.empty()) {
                sentences.push_back(sentence);
            }
            current.clear();
        } else {
            current.push_back(c);
        }
    }

    std::string tail = trim(current);
    if (!tail.empty()) {
        sentences.push_back(tail);
    }
    return sentences;
}

bool SemanticEvidenceExtractor::isInterviewer(const std::string& speaker) const {
    std::string lowered = toLower(trim(speaker));
    if (lowered.empty()) {
        return false;
    }
    for (const auto& name : settings_.interviewerSpeakers) {
        if (lowered == toLower(name)) {
            return true;
        }
    }
    return false;
}

bool SemanticEvidenceExtractor::isIntro(const std::string& sentence) const {
    if (sentence.size() >= settings_.introMaxChars) {
        return false;
    }
    std::string lowered = toLower(sentence);
    for (const auto& pattern : introPatterns_) {
        if (std::regex_search(lowered, pattern)) {
            return true;
        }
    }
    return false;
}

std::vector<EvidenceSpan> SemanticEvidenceExtractor::candidateSpans(const Transcript& transcript) const {
    std::vector<EvidenceSpan> all;
    for (const auto& segment : transcript) {
        if (isInterviewer(segment.speaker)) {
            continue;
        }
        for (auto& sentence : splitSentences(segment.text)) {
            if (sentence.size() <= settings_.minSpanChars) {
                continue;
            }
            EvidenceSpan span;
            span.text = std::move(sentence);
            span.startSeconds = segment.startSeconds;
            all.push_back(std::move(span));
        }
    }

    std::vector<EvidenceSpan> filtered;
    for (const auto& span : all) {
        if (!isIntro(span.text)) {
            filtered.push_back(span);
        }
    }

    // A transcript that is nothing but greetings is still assessed
    if (filtered.empty()) {
        return all;
    }
    return filtered;
}

bool SemanticEvidenceExtractor::mentions(const std::string& lowered, const Indicator& indicator) const {
    std::string name = toLower(trim(indicator.name));
    if (name.size() >= 3 && lowered.find(name) != std::string::npos) {
        return true;
    }
    for (const auto& keyword : indicator.keywords) {
        std::string needle = toLower(trim(keyword));
        if (!needle.empty() && lowered.find(needle) != std::string::npos) {
            return true;
        }
    }
    return false;
}

double SemanticEvidenceExtractor::score(size_t qualifying, double topRelevance, size_t exactMatches) const {
    double countScore = std::min(50.0, 20.0 + std::log(static_cast<double>(qualifying) + 1.0) * 15.0);
    double relevanceScore = std::clamp((topRelevance - 0.5) * 100.0 + 30.0, 30.0, 60.0);
    double exactBonus = std::min(15.0, 8.0 * static_cast<double>(exactMatches));
    return ScoreCombiner::roundToTenth(std::clamp(countScore + relevanceScore + exactBonus, 0.0, 100.0));
}

std::string SemanticEvidenceExtractor::reasoningFor(const Indicator& indicator, const ExtractionResult& result,
                                                    double topRelevance) const {
    const char* tier = "Weak";
    if (result.aiScore >= 75.0) {
        tier = "Strong";
    } else if (result.aiScore >= 55.0) {
        tier = "Adequate";
    } else if (result.aiScore >= 35.0) {
        tier = "Limited";
    }

    std::ostringstream out;
    out << tier << " evidence of " << indicator.name << ": " << result.qualifyingSpans
        << " relevant statement(s), top relevance " << std::fixed << std::setprecision(1)
        << topRelevance * 100.0 << "%";
    if (result.exactMatches > 0) {
        out << ", " << result.exactMatches << " direct mention(s)";
    }
    out << ". Driven by ";
    for (size_t i = 0; i < result.evidence.size(); ++i) {
        if (i > 0) {
            out << "; ";
        }
        out << "[" << formatSeconds(result.evidence[i].startSeconds) << "] \"" << result.evidence[i].text << "\"";
    }
    out << ".";
    return out.str();
}

ExtractionResult SemanticEvidenceExtractor::extract(const Transcript& transcript, const Indicator& indicator) const {
    ExtractionResult result;
    std::vector<EvidenceSpan> spans = candidateSpans(transcript);

    if (spans.empty()) {
        result.aiScore = settings_.noEvidenceScore;
        result.evidenceText = kNoEvidenceSentinel;
        result.reasoning = "No candidate speech in the transcript to assess " + indicator.name + ".";
        return result;
    }

    std::string query = indicator.name;
    if (!indicator.description.empty()) {
        query += ": " + indicator.description;
    }

    std::vector<std::string> texts;
    texts.reserve(spans.size());
    for (const auto& span : spans) {
        texts.push_back(span.text);
    }
    std::vector<double> similarities = model_->similarities(query, texts);

    std::vector<EvidenceSpan> qualifying;
    for (size_t i = 0; i < spans.size(); ++i) {
        EvidenceSpan span = spans[i];
        double semantic = i < similarities.size() && std::isfinite(similarities[i])
                              ? std::clamp(similarities[i], 0.0, 1.0) : 0.0;
        span.exactMatch = mentions(toLower(span.text), indicator);
        span.relevance = span.exactMatch ? std::max(semantic, settings_.exactMatchRelevance) : semantic;
        if (span.relevance >= settings_.relevanceThreshold) {
            qualifying.push_back(std::move(span));
        }
    }

    if (qualifying.empty()) {
        result.aiScore = settings_.noEvidenceScore;
        result.evidenceText = kNoEvidenceSentinel;
        result.reasoning = "No candidate statement relates to " + indicator.name + ".";
        utils::Logger::debug("No evidence for indicator " + indicator.id);
        return result;
    }

    std::stable_sort(qualifying.begin(), qualifying.end(), [](const EvidenceSpan& a, const EvidenceSpan& b) {
        if (a.relevance != b.relevance) {
            return a.relevance > b.relevance;
        }
        if (a.startSeconds != b.startSeconds) {
            return a.startSeconds < b.startSeconds;
        }
        return a.text < b.text;
    });

    result.qualifyingSpans = qualifying.size();
    result.exactMatches = static_cast<size_t>(std::count_if(
        qualifying.begin(), qualifying.end(), [](const EvidenceSpan& s) { return s.exactMatch; }));

    double topRelevance = qualifying.front().relevance;
    result.aiScore = score(result.qualifyingSpans, topRelevance, result.exactMatches);

    size_t keep = std::min(settings_.topK, qualifying.size());
    result.evidence.assign(qualifying.begin(), qualifying.begin() + static_cast<std::ptrdiff_t>(keep));
    result.evidenceText = formatEvidence(result.evidence, settings_.evidenceSeparator);
    result.reasoning = reasoningFor(indicator, result, topRelevance);

    utils::Logger::debug("Indicator " + indicator.id + ": " + std::to_string(result.qualifyingSpans) +
                         " qualifying spans, score " + std::to_string(result.aiScore));
    return result;
}

} // namespace assessment
} // namespace panelsense
