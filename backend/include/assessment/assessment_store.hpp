#pragma once

#include "assessment/assessment_types.hpp"

#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace panelsense {
namespace assessment {

/**
 * In-memory hand-off point to the persistence collaborator.
 *
 * Holds at most one Assessment per (session, indicator). AI results and
 * manual scores are written independently: an AI upsert overwrites
 * score, evidence and reasoning but never the manual score.
 */
class AssessmentStore {
public:
    using Key = std::pair<std::string, std::string>;

    /**
     * Exclusive right to re-assess one (session, indicator) pair.
     * Released on destruction.
     */
    class Lease {
    public:
        Lease(Lease&& other) noexcept;
        Lease& operator=(Lease&& other) noexcept;
        ~Lease();

        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;

        const Key& key() const { return key_; }

    private:
        friend class AssessmentStore;
        Lease(AssessmentStore* store, Key key);
        void release();

        AssessmentStore* store_;
        Key key_;
    };

    /**
     * Replace the session's ordered indicator list.
     * Throws ConfigurationException for invalid indicators.
     */
    void setIndicators(const std::string& sessionId, std::vector<Indicator> indicators);
    std::vector<Indicator> indicators(const std::string& sessionId) const;
    bool hasIndicators(const std::string& sessionId) const;

    void recordArtifact(const std::string& sessionId, const std::string& artifactRef);
    std::optional<std::string> artifact(const std::string& sessionId) const;

    /**
     * Throws AssessmentInProgressException when the pair is already leased.
     */
    Lease acquire(const std::string& sessionId, const std::string& indicatorId);
    bool isLeased(const std::string& sessionId, const std::string& indicatorId) const;

    Assessment upsertAiResult(const std::string& sessionId, const std::string& indicatorId, double aiScore,
                              std::vector<EvidenceSpan> evidence, std::string evidenceText,
                              std::string reasoning);

    /**
     * Drop the AI score, evidence and reasoning of one pair. The manual
     * score is kept. Returns false when there was no AI result.
     */
    bool clearAiResult(const std::string& sessionId, const std::string& indicatorId);

    /**
     * Store an interviewer score in [0,100]; std::nullopt clears it.
     * Throws NotFoundException for an indicator the session does not
     * have, ConfigurationException for an out-of-range score.
     */
    void setManualScore(const std::string& sessionId, const std::string& indicatorId,
                        std::optional<double> score);
    std::optional<double> manualScore(const std::string& sessionId, const std::string& indicatorId) const;

    // AI assessment with the current manual score merged in
    std::optional<Assessment> find(const std::string& sessionId, const std::string& indicatorId) const;
    std::vector<Assessment> forSession(const std::string& sessionId) const;

    size_t size() const;

    /**
     * Erase everything held for the session. Refused (returns false)
     * while any of its pairs is leased.
     */
    bool forgetSession(const std::string& sessionId);
    bool knowsSession(const std::string& sessionId) const;

private:
    void release(const Key& key);

    mutable std::mutex mutex_;
    std::map<std::string, std::vector<Indicator>> indicators_;
    std::map<std::string, std::string> artifacts_;
    std::map<Key, Assessment> assessments_;
    std::map<Key, double> manualScores_;
    std::set<Key> leased_;
};

} // namespace assessment
} // namespace panelsense
