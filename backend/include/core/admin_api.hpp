#pragma once

#include <exception>
#include <string>

namespace panelsense {
namespace core {

class PanelServices;

struct ApiResponse {
    int status = 200;
    std::string body;

    std::string statusLine() const;
};

/**
 * HTTP administrative surface, independent of the transport.
 * Bodies are JSON; failures map to 400 (bad input), 404 (unknown
 * session or indicator), 409 (assessment in progress) and 422
 * (rejected configuration).
 */
class AdminApi {
public:
    explicit AdminApi(PanelServices& services);

    ApiResponse health() const;

    ApiResponse getScoringWeights() const;
    ApiResponse putScoringWeights(const std::string& body);

    ApiResponse putManualScore(const std::string& sessionId, const std::string& body);

    // 202 once the run is queued
    ApiResponse postAssessment(const std::string& sessionId);
    ApiResponse getAssessment(const std::string& sessionId) const;

    static ApiResponse fromException(const std::exception& error);

private:
    PanelServices& services_;
};

} // namespace core
} // namespace panelsense
