#include "core/admin_api.hpp"
#include "core/message_protocol.hpp"
#include "core/panel_services.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"

#include <nlohmann/json.hpp>

namespace panelsense {
namespace core {

namespace {

ApiResponse jsonResponse(int status, const nlohmann::json& body) {
    ApiResponse response;
    response.status = status;
    response.body = body.dump();
    return response;
}

ApiResponse errorResponse(int status, const std::string& message, const std::string& code) {
    return jsonResponse(status, {{"error", message}, {"code", code}});
}

nlohmann::json optionalNumber(const std::optional<double>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

nlohmann::json weightsToJson(const assessment::ScoringWeights& weights) {
    return {{"ai_weight", weights.aiWeight}, {"manual_weight", weights.manualWeight}};
}

nlohmann::json reportToJson(const assessment::AssessmentReport& report) {
    nlohmann::json indicators = nlohmann::json::array();
    for (const auto& outcome : report.indicators) {
        nlohmann::json item = {
            {"indicator_id", outcome.indicatorId},
            {"status", assessment::indicatorStatusToString(outcome.status)}
        };
        if (!outcome.error.empty()) {
            item["error"] = outcome.error;
        }
        indicators.push_back(item);
    }

    nlohmann::json out = {
        {"status", assessment::runStatusToString(report.status)},
        {"indicators", indicators}
    };
    if (!report.error.empty()) {
        out["error"] = report.error;
    }
    return out;
}

} // namespace

std::string ApiResponse::statusLine() const {
    switch (status) {
        case 200: return "200 OK";
        case 202: return "202 Accepted";
        case 400: return "400 Bad Request";
        case 404: return "404 Not Found";
        case 409: return "409 Conflict";
        case 422: return "422 Unprocessable Entity";
        default: return "500 Internal Server Error";
    }
}

AdminApi::AdminApi(PanelServices& services) : services_(services) {
}

ApiResponse AdminApi::fromException(const std::exception& error) {
    if (dynamic_cast<const nlohmann::json::exception*>(&error)) {
        return errorResponse(400, std::string("Invalid JSON body: ") + error.what(), "invalid_request");
    }
    if (dynamic_cast<const utils::NotFoundException*>(&error)) {
        return errorResponse(404, error.what(), "not_found");
    }
    if (dynamic_cast<const utils::AssessmentInProgressException*>(&error)) {
        return errorResponse(409, error.what(), "assessment_in_progress");
    }
    if (auto* known = dynamic_cast<const utils::PanelSenseException*>(&error)) {
        int status = known->code() == "configuration" ? 422 : 400;
        if (known->code() == "internal") {
            status = 500;
        }
        return errorResponse(status, known->getErrorInfo().message, known->code());
    }

    utils::Logger::error(std::string("Unhandled error in admin API: ") + error.what());
    return errorResponse(500, "Internal server error", "internal");
}

ApiResponse AdminApi::health() const {
    return jsonResponse(200, {
        {"status", "ok"},
        {"activeSessions", services_.controller().activeSessionCount()}
    });
}

ApiResponse AdminApi::getScoringWeights() const {
    return jsonResponse(200, weightsToJson(services_.weights()->current()));
}

ApiResponse AdminApi::putScoringWeights(const std::string& body) {
    try {
        nlohmann::json j = nlohmann::json::parse(body);
        if (!j.contains("ai_weight") || !j.contains("manual_weight")) {
            return errorResponse(400, "ai_weight and manual_weight are required", "invalid_request");
        }

        assessment::ScoringWeights weights;
        weights.aiWeight = j.at("ai_weight").get<double>();
        weights.manualWeight = j.at("manual_weight").get<double>();
        services_.weights()->update(weights);

        return jsonResponse(200, weightsToJson(services_.weights()->current()));
    } catch (const std::exception& e) {
        return fromException(e);
    }
}

ApiResponse AdminApi::putManualScore(const std::string& sessionId, const std::string& body) {
    try {
        nlohmann::json j = nlohmann::json::parse(body);
        if (!j.contains("indicator_id") || !j.contains("score")) {
            return errorResponse(400, "indicator_id and score are required", "invalid_request");
        }

        auto parsedId = MessageProtocol::indicatorIdFromJson(j.at("indicator_id"));
        if (!parsedId) {
            return errorResponse(400, "indicator_id must be a string or a whole number", "invalid_request");
        }
        const std::string& indicatorId = *parsedId;

        std::optional<double> score;
        if (!j.at("score").is_null()) {
            score = j.at("score").get<double>();
        }
        services_.store()->setManualScore(sessionId, indicatorId, score);

        auto weights = services_.weights()->current();
        auto assessment = services_.store()->find(sessionId, indicatorId);
        nlohmann::json out = {
            {"session_id", sessionId},
            {"indicator_id", indicatorId},
            {"manual_score", optionalNumber(score)},
            {"combined_score", nullptr}
        };
        if (assessment) {
            out["combined_score"] = assessment::ScoreCombiner::combine(assessment->aiScore, score, weights);
        }
        return jsonResponse(200, out);
    } catch (const std::exception& e) {
        return fromException(e);
    }
}

ApiResponse AdminApi::postAssessment(const std::string& sessionId) {
    try {
        auto artifact = services_.store()->artifact(sessionId);
        if (!artifact) {
            throw utils::NotFoundException("finalized session", sessionId);
        }
        if (!services_.store()->hasIndicators(sessionId)) {
            throw utils::ConfigurationException("Session has no indicators to assess", sessionId);
        }

        services_.pipeline()->submit(sessionId, *artifact);
        utils::Logger::info("Re-assessment of session " + sessionId + " queued");
        return jsonResponse(202, {{"session_id", sessionId}, {"status", "accepted"}});
    } catch (const std::exception& e) {
        return fromException(e);
    }
}

ApiResponse AdminApi::getAssessment(const std::string& sessionId) const {
    try {
        if (!services_.store()->hasIndicators(sessionId) && !services_.store()->artifact(sessionId)) {
            throw utils::NotFoundException("session", sessionId);
        }

        assessment::AssessmentSummary summary = services_.pipeline()->summarize(sessionId);

        nlohmann::json indicators = nlohmann::json::array();
        for (const auto& item : summary.indicators) {
            indicators.push_back({
                {"indicator_id", item.indicator.id},
                {"name", item.indicator.name},
                {"weight", item.indicator.weight},
                {"ai_score", optionalNumber(item.aiScore)},
                {"manual_score", optionalNumber(item.manualScore)},
                {"combined_score", optionalNumber(item.combinedScore)},
                {"evidence", item.aiScore ? nlohmann::json(item.evidence) : nlohmann::json(nullptr)},
                {"reasoning", item.aiScore ? nlohmann::json(item.reasoning) : nlohmann::json(nullptr)}
            });
        }

        nlohmann::json out = {
            {"session_id", summary.sessionId},
            {"weights", weightsToJson(summary.weights)},
            {"indicators", indicators},
            {"overall_score", optionalNumber(summary.overall)},
            {"running", summary.running},
            {"last_run", summary.lastRun ? reportToJson(*summary.lastRun) : nlohmann::json(nullptr)}
        };
        auto artifact = services_.store()->artifact(sessionId);
        out["audio_artifact"] = artifact ? nlohmann::json(*artifact) : nlohmann::json(nullptr);

        return jsonResponse(200, out);
    } catch (const std::exception& e) {
        return fromException(e);
    }
}

} // namespace core
} // namespace panelsense
