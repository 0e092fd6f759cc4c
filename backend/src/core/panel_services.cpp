#include "core/panel_services.hpp"
#include "assessment/evidence_extractor.hpp"
#include "assessment/similarity_model.hpp"
#include "assessment/transcription_service.hpp"
#include "core/emotion_log_sink.hpp"
#include "emotion/heuristic_facial_detector.hpp"
#include "emotion/prosodic_voice_detector.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"

namespace panelsense {
namespace core {

PanelServices::PanelServices(const utils::Config& config, bool startWorkers) {
    SessionDependencies deps;
    deps.facialDetector = std::make_shared<emotion::HeuristicFacialEmotionDetector>();
    deps.voiceDetector = std::make_shared<emotion::ProsodicVoiceEmotionDetector>();
    deps.emotionLogSink = std::make_shared<JsonFileEmotionLogSink>(config.session().emotionLogDir,
                                                                   config.session().emotionLogMinConfidence);

    wire(config, std::move(deps),
         std::make_shared<assessment::SidecarTranscriptionService>(),
         std::make_shared<assessment::LexicalSimilarityModel>(),
         startWorkers);
}

PanelServices::PanelServices(const utils::Config& config, SessionDependencies deps,
                             std::shared_ptr<assessment::TranscriptionService> transcription,
                             std::shared_ptr<assessment::SemanticSimilarityModel> similarity,
                             bool startWorkers) {
    wire(config, std::move(deps), std::move(transcription), std::move(similarity), startWorkers);
}

PanelServices::~PanelServices() {
    stop();
}

void PanelServices::wire(const utils::Config& config, SessionDependencies deps,
                         std::shared_ptr<assessment::TranscriptionService> transcription,
                         std::shared_ptr<assessment::SemanticSimilarityModel> similarity,
                         bool startWorkers) {
    detectorQueue_ = std::make_shared<TaskQueue>("detector");
    controlQueue_ = std::make_shared<TaskQueue>("control");

    deps.detectorQueue = detectorQueue_;
    deps.session = config.session();
    deps.aggregator = config.aggregator();

    store_ = std::make_shared<assessment::AssessmentStore>();
    retainedLimit_ = config.assessment().retainedSessions;

    assessment::ScoringWeights initial;
    initial.aiWeight = config.scoring().aiWeight;
    initial.manualWeight = config.scoring().manualWeight;
    weights_ = std::make_shared<assessment::ScoringWeightsProvider>(initial);

    auto extractor = std::make_shared<assessment::SemanticEvidenceExtractor>(std::move(similarity),
                                                                            config.assessment());
    pipeline_ = std::make_shared<assessment::AssessmentPipeline>(std::move(transcription), std::move(extractor),
                                                                store_, weights_, controlQueue_);

    controller_ = std::make_unique<SessionController>(std::move(deps), config.session().closedSessionRetention);
    controller_->setFinalizedCallback([this](const FinalizedSession& result) {
        onSessionFinalized(result);
    });

    if (startWorkers) {
        detectorPool_ = std::make_unique<ThreadPool>(config.server().detectorThreads);
        detectorPool_->start(detectorQueue_);
        controlPool_ = std::make_unique<ThreadPool>(config.server().controlThreads);
        controlPool_->start(controlQueue_);
    }

    utils::Logger::info("Services ready: " + std::to_string(config.server().detectorThreads) +
                        " detector worker(s), " + std::to_string(config.server().controlThreads) +
                        " control worker(s)");
}

void PanelServices::onSessionFinalized(const FinalizedSession& result) {
    store_->recordArtifact(result.sessionId, result.audioArtifact);
    retain(result.sessionId);

    if (!store_->hasIndicators(result.sessionId)) {
        utils::Logger::info("Session " + result.sessionId + " has no indicators, skipping assessment");
        return;
    }

    try {
        pipeline_->submit(result.sessionId, result.audioArtifact);
    } catch (const utils::PanelSenseException& e) {
        utils::ErrorHandler::getInstance().reportError(e, "schedule assessment", result.sessionId);
    }
}

void PanelServices::retain(const std::string& sessionId) {
    std::lock_guard<std::mutex> lock(retainedMutex_);
    retained_.push_back(sessionId);

    // Oldest first; a session still being assessed is retried on the next close
    auto it = retained_.begin();
    while (retained_.size() > retainedLimit_ && it != retained_.end() - 1) {
        if (pipeline_->forget(*it)) {
            utils::Logger::debug("Dropped assessment state of session " + *it);
            it = retained_.erase(it);
        } else {
            ++it;
        }
    }
}

void PanelServices::runInBackground(std::function<void()> work) {
    if (!controlQueue_->enqueue(std::move(work), TaskPriority::HIGH)) {
        utils::Logger::warn("Control queue stopped, background work dropped");
    }
}

void PanelServices::stop() {
    if (stopped_) {
        return;
    }
    stopped_ = true;

    controller_->shutdown();

    if (detectorPool_) {
        detectorPool_->stop();
    }
    if (controlPool_) {
        controlPool_->stop();
    }
    detectorQueue_->shutdown();
    controlQueue_->shutdown();
    utils::Logger::info("Services stopped");
}

} // namespace core
} // namespace panelsense
