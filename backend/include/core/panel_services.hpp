#pragma once

#include "assessment/assessment_pipeline.hpp"
#include "assessment/assessment_store.hpp"
#include "assessment/score_combiner.hpp"
#include "core/session_controller.hpp"
#include "core/task_queue.hpp"
#include "utils/config.hpp"

#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace panelsense {
namespace core {

/**
 * Everything the server runs on, wired from configuration: the detector
 * and control queues with their worker pools, the session registry and
 * the batch assessment path.
 *
 * A graceful close records the session's audio artifact and schedules a
 * batch assessment when indicators are attached. Only the most recent
 * assessment.retained_sessions finalized sessions keep their store
 * entries and last run.
 */
class PanelServices {
public:
    /**
     * startWorkers=false leaves both queues undrained so callers can run
     * tasks by hand.
     */
    explicit PanelServices(const utils::Config& config, bool startWorkers = true);

    // Same wiring with caller-supplied detectors and collaborators
    PanelServices(const utils::Config& config, SessionDependencies deps,
                  std::shared_ptr<assessment::TranscriptionService> transcription,
                  std::shared_ptr<assessment::SemanticSimilarityModel> similarity,
                  bool startWorkers = true);

    ~PanelServices();

    PanelServices(const PanelServices&) = delete;
    PanelServices& operator=(const PanelServices&) = delete;

    /**
     * Abort open sessions and stop the worker pools. Idempotent.
     */
    void stop();

    // Run blocking work (close drain, assessment) off the network thread
    void runInBackground(std::function<void()> work);

    SessionController& controller() { return *controller_; }
    const SessionController& controller() const { return *controller_; }
    std::shared_ptr<assessment::AssessmentStore> store() const { return store_; }
    std::shared_ptr<assessment::ScoringWeightsProvider> weights() const { return weights_; }
    std::shared_ptr<assessment::AssessmentPipeline> pipeline() const { return pipeline_; }
    std::shared_ptr<TaskQueue> detectorQueue() const { return detectorQueue_; }
    std::shared_ptr<TaskQueue> controlQueue() const { return controlQueue_; }

private:
    void wire(const utils::Config& config, SessionDependencies deps,
              std::shared_ptr<assessment::TranscriptionService> transcription,
              std::shared_ptr<assessment::SemanticSimilarityModel> similarity,
              bool startWorkers);
    void onSessionFinalized(const FinalizedSession& result);
    void retain(const std::string& sessionId);

    std::shared_ptr<TaskQueue> detectorQueue_;
    std::shared_ptr<TaskQueue> controlQueue_;
    std::unique_ptr<ThreadPool> detectorPool_;
    std::unique_ptr<ThreadPool> controlPool_;

    std::shared_ptr<assessment::AssessmentStore> store_;
    std::shared_ptr<assessment::ScoringWeightsProvider> weights_;
    std::shared_ptr<assessment::AssessmentPipeline> pipeline_;
    std::unique_ptr<SessionController> controller_;

    std::mutex retainedMutex_;
    std::deque<std::string> retained_;
    size_t retainedLimit_ = 0;
    bool stopped_ = false;
};

} // namespace core
} // namespace panelsense
