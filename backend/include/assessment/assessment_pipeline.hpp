#pragma once

#include "assessment/assessment_store.hpp"
#include "assessment/evidence_extractor.hpp"
#include "assessment/score_combiner.hpp"
#include "assessment/transcription_service.hpp"
#include "core/task_queue.hpp"

#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace panelsense {
namespace assessment {

enum class RunStatus {
    COMPLETED,
    FAILED
};

enum class IndicatorStatus {
    ASSESSED,
    NOT_ASSESSED
};

std::string runStatusToString(RunStatus status);
std::string indicatorStatusToString(IndicatorStatus status);

struct IndicatorOutcome {
    std::string indicatorId;
    IndicatorStatus status = IndicatorStatus::NOT_ASSESSED;
    std::string error;
    std::optional<Assessment> assessment;
};

/**
 * Terminal status of one batch run. A FAILED run produced no scores and
 * cleared the ones earlier runs left behind.
 */
struct AssessmentReport {
    std::string sessionId;
    std::string artifactRef;
    RunStatus status = RunStatus::COMPLETED;
    std::string error;
    std::vector<IndicatorOutcome> indicators;
};

struct IndicatorSummary {
    Indicator indicator;
    std::optional<double> aiScore;
    std::optional<double> manualScore;
    std::optional<double> combinedScore;
    std::string evidence;
    std::string reasoning;
};

/**
 * Read-time view of a session's assessments; combined scores use the
 * weights current at the time of the call.
 */
struct AssessmentSummary {
    std::string sessionId;
    ScoringWeights weights;
    std::vector<IndicatorSummary> indicators;
    std::optional<double> overall;
    std::optional<AssessmentReport> lastRun;
    bool running = false;
};

/**
 * Batch path: finalized recording -> transcript -> per-indicator
 * evidence and score -> store.
 *
 * Leases for every indicator of the session are taken before any work
 * starts, so a re-assessment of a pair already being assessed is
 * rejected with AssessmentInProgressException.
 */
class AssessmentPipeline {
public:
    using ReadyCallback = std::function<void(const Assessment&)>;

    AssessmentPipeline(std::shared_ptr<TranscriptionService> transcription,
                       std::shared_ptr<SemanticEvidenceExtractor> extractor,
                       std::shared_ptr<AssessmentStore> store,
                       std::shared_ptr<ScoringWeightsProvider> weights,
                       std::shared_ptr<core::TaskQueue> controlQueue = nullptr);

    /**
     * Assess synchronously on the calling thread.
     */
    AssessmentReport run(const std::string& sessionId, const std::string& artifactRef);

    /**
     * Take the leases on the calling thread, then assess on the control
     * queue. Throws PanelSenseException if the queue has been shut down.
     * The queue's workers must be stopped before the pipeline is destroyed.
     */
    std::future<AssessmentReport> submit(const std::string& sessionId, const std::string& artifactRef);

    AssessmentSummary summarize(const std::string& sessionId) const;
    std::optional<AssessmentReport> lastReport(const std::string& sessionId) const;

    /**
     * Drop the session's last run and everything the store holds for it.
     * Returns false while an assessment of the session is still queued or
     * running; nothing is dropped then.
     */
    bool forget(const std::string& sessionId);

    // Fires once per indicator that was assessed
    void setAssessmentReadyCallback(ReadyCallback callback);

private:
    using Leases = std::vector<AssessmentStore::Lease>;

    Leases acquireAll(const std::string& sessionId, const std::vector<Indicator>& indicators);
    AssessmentReport execute(const std::string& sessionId, const std::string& artifactRef,
                             const std::vector<Indicator>& indicators);
    void remember(const AssessmentReport& report);

    std::shared_ptr<TranscriptionService> transcription_;
    std::shared_ptr<SemanticEvidenceExtractor> extractor_;
    std::shared_ptr<AssessmentStore> store_;
    std::shared_ptr<ScoringWeightsProvider> weights_;
    std::shared_ptr<core::TaskQueue> controlQueue_;

    mutable std::mutex mutex_;
    ReadyCallback readyCallback_;
    std::map<std::string, AssessmentReport> reports_;
    std::map<std::string, int> running_;
};

} // namespace assessment
} // namespace panelsense
