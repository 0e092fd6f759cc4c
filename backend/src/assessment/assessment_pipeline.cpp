#include "assessment/assessment_pipeline.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"

namespace panelsense {
namespace assessment {

std::string runStatusToString(RunStatus status) {
    return status == RunStatus::COMPLETED ? "completed" : "failed";
}

std::string indicatorStatusToString(IndicatorStatus status) {
    return status == IndicatorStatus::ASSESSED ? "assessed" : "not_assessed";
}

AssessmentPipeline::AssessmentPipeline(std::shared_ptr<TranscriptionService> transcription,
                                       std::shared_ptr<SemanticEvidenceExtractor> extractor,
                                       std::shared_ptr<AssessmentStore> store,
                                       std::shared_ptr<ScoringWeightsProvider> weights,
                                       std::shared_ptr<core::TaskQueue> controlQueue)
    : transcription_(std::move(transcription))
    , extractor_(std::move(extractor))
    , store_(std::move(store))
    , weights_(std::move(weights))
    , controlQueue_(std::move(controlQueue)) {
    if (!transcription_ || !extractor_ || !store_ || !weights_) {
        throw utils::ConfigurationException("Assessment pipeline is missing a collaborator");
    }
}

void AssessmentPipeline::setAssessmentReadyCallback(ReadyCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    readyCallback_ = std::move(callback);
}

AssessmentPipeline::Leases AssessmentPipeline::acquireAll(const std::string& sessionId,
                                                          const std::vector<Indicator>& indicators) {
    Leases leases;
    leases.reserve(indicators.size());
    for (const auto& indicator : indicators) {
        // Earlier leases are released by unwinding if one is taken
        leases.push_back(store_->acquire(sessionId, indicator.id));
    }
    return leases;
}

AssessmentReport AssessmentPipeline::run(const std::string& sessionId, const std::string& artifactRef) {
    std::vector<Indicator> indicators = store_->indicators(sessionId);
    Leases leases = acquireAll(sessionId, indicators);
    return execute(sessionId, artifactRef, indicators);
}

std::future<AssessmentReport> AssessmentPipeline::submit(const std::string& sessionId,
                                                         const std::string& artifactRef) {
    std::vector<Indicator> indicators = store_->indicators(sessionId);
    auto leases = std::make_shared<Leases>(acquireAll(sessionId, indicators));

    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_[sessionId]++;
    }

    auto job = [this, sessionId, artifactRef, indicators, leases]() {
        AssessmentReport report = execute(sessionId, artifactRef, indicators);
        leases->clear();
        return report;
    };

    if (!controlQueue_) {
        std::promise<AssessmentReport> promise;
        promise.set_value(job());
        return promise.get_future();
    }

    auto promise = std::make_shared<std::promise<AssessmentReport>>();
    std::future<AssessmentReport> result = promise->get_future();
    bool accepted = controlQueue_->enqueue([job, promise]() {
        try {
            promise->set_value(job());
        } catch (const std::exception&) {
            promise->set_exception(std::current_exception());
        }
    }, core::TaskPriority::HIGH);

    if (!accepted) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = running_.find(sessionId);
            if (it != running_.end() && --it->second <= 0) {
                running_.erase(it);
            }
        }
        throw utils::PanelSenseException(utils::ErrorInfo(utils::ErrorCategory::ASSESSMENT,
                                                          utils::ErrorSeverity::ERROR,
                                                          "Assessment queue is shut down", "", "",
                                                          sessionId));
    }
    return result;
}

AssessmentReport AssessmentPipeline::execute(const std::string& sessionId, const std::string& artifactRef,
                                             const std::vector<Indicator>& indicators) {
    AssessmentReport report;
    report.sessionId = sessionId;
    report.artifactRef = artifactRef;

    utils::Logger::info("Assessing session " + sessionId + " (" + std::to_string(indicators.size()) +
                        " indicator(s)) from " + artifactRef);

    Transcript transcript;
    try {
        transcript = transcription_->transcribe(artifactRef);
    } catch (const std::exception& e) {
        report.status = RunStatus::FAILED;
        report.error = e.what();
        for (const auto& indicator : indicators) {
            IndicatorOutcome outcome;
            outcome.indicatorId = indicator.id;
            outcome.error = "transcription failed";
            store_->clearAiResult(sessionId, indicator.id);
            report.indicators.push_back(std::move(outcome));
        }
        utils::Logger::error("Assessment of session " + sessionId + " failed: " + report.error);
        utils::ErrorHandler::getInstance().reportError(e, "batch transcription", sessionId);
        remember(report);
        return report;
    }

    ReadyCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callback = readyCallback_;
    }

    for (const auto& indicator : indicators) {
        IndicatorOutcome outcome;
        outcome.indicatorId = indicator.id;

        try {
            ExtractionResult extracted = extractor_->extract(transcript, indicator);
            outcome.assessment = store_->upsertAiResult(sessionId, indicator.id, extracted.aiScore,
                                                       std::move(extracted.evidence),
                                                       std::move(extracted.evidenceText),
                                                       std::move(extracted.reasoning));
            outcome.status = IndicatorStatus::ASSESSED;
        } catch (const std::exception& e) {
            outcome.error = e.what();
            store_->clearAiResult(sessionId, indicator.id);
            utils::Logger::warn("Indicator " + indicator.id + " not assessed: " + outcome.error);
            utils::ErrorHandler::getInstance().reportError(
                utils::ErrorInfo(utils::ErrorCategory::ASSESSMENT, utils::ErrorSeverity::WARNING,
                                 "Indicator extraction failed", e.what(), indicator.id, sessionId));
        }

        if (outcome.assessment && callback) {
            try {
                callback(*outcome.assessment);
            } catch (const std::exception& e) {
                utils::ErrorHandler::getInstance().reportError(e, "assessment ready callback", sessionId);
            }
        }
        report.indicators.push_back(std::move(outcome));
    }

    report.status = RunStatus::COMPLETED;
    utils::Logger::info("Assessment of session " + sessionId + " completed");
    remember(report);
    return report;
}

void AssessmentPipeline::remember(const AssessmentReport& report) {
    std::lock_guard<std::mutex> lock(mutex_);
    reports_[report.sessionId] = report;
    auto it = running_.find(report.sessionId);
    if (it != running_.end() && --it->second <= 0) {
        running_.erase(it);
    }
}

std::optional<AssessmentReport> AssessmentPipeline::lastReport(const std::string& sessionId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = reports_.find(sessionId);
    if (it == reports_.end()) {
        return std::nullopt;
    }
    return it->second;
}

AssessmentSummary AssessmentPipeline::summarize(const std::string& sessionId) const {
    AssessmentSummary summary;
    summary.sessionId = sessionId;
    summary.weights = weights_->current();
    summary.lastRun = lastReport(sessionId);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        summary.running = running_.count(sessionId) > 0;
    }

    std::vector<Indicator> indicators = store_->indicators(sessionId);
    std::map<std::string, double> combined;

    for (const auto& indicator : indicators) {
        IndicatorSummary item;
        item.indicator = indicator;
        item.manualScore = store_->manualScore(sessionId, indicator.id);

        auto assessment = store_->find(sessionId, indicator.id);
        if (assessment) {
            item.aiScore = assessment->aiScore;
            item.combinedScore = ScoreCombiner::combine(assessment->aiScore, item.manualScore, summary.weights);
            item.evidence = assessment->evidenceText;
            item.reasoning = assessment->reasoning;
            combined[indicator.id] = *item.combinedScore;
        }
        summary.indicators.push_back(std::move(item));
    }

    if (!summary.lastRun || summary.lastRun->status != RunStatus::FAILED) {
        summary.overall = ScoreCombiner::overall(combined, indicators);
    }
    return summary;
}

bool AssessmentPipeline::forget(const std::string& sessionId) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_.count(sessionId) > 0 || !store_->forgetSession(sessionId)) {
        return false;
    }
    reports_.erase(sessionId);
    return true;
}

} // namespace assessment
} // namespace panelsense
