#include "assessment/score_combiner.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"

#include <cmath>

namespace panelsense {
namespace assessment {

void ScoringWeights::validate() const {
    if (!std::isfinite(aiWeight) || !std::isfinite(manualWeight)) {
        throw utils::ConfigurationException("Scoring weights must be finite");
    }
    if (aiWeight < 0.0 || manualWeight < 0.0) {
        throw utils::ConfigurationException("Scoring weights must not be negative",
                                            "ai=" + std::to_string(aiWeight) +
                                            " manual=" + std::to_string(manualWeight));
    }
    if (std::fabs(aiWeight + manualWeight - 100.0) > 1e-9) {
        throw utils::ConfigurationException("Scoring weights must sum to 100",
                                            "ai=" + std::to_string(aiWeight) +
                                            " manual=" + std::to_string(manualWeight));
    }
}

ScoringWeightsProvider::ScoringWeightsProvider(const ScoringWeights& initial) {
    initial.validate();
    weights_ = std::make_shared<const ScoringWeights>(initial);
}

ScoringWeights ScoringWeightsProvider::current() const {
    return *std::atomic_load(&weights_);
}

void ScoringWeightsProvider::update(const ScoringWeights& weights) {
    weights.validate();
    std::atomic_store(&weights_, std::make_shared<const ScoringWeights>(weights));
    utils::Logger::info("Scoring weights updated: ai=" + std::to_string(weights.aiWeight) +
                        " manual=" + std::to_string(weights.manualWeight));
}

double ScoreCombiner::roundToTenth(double value) {
    return std::round(value * 10.0) / 10.0;
}

double ScoreCombiner::combine(double aiScore, std::optional<double> manualScore, const ScoringWeights& weights) {
    if (!manualScore || *manualScore <= 0.0) {
        return aiScore;
    }
    return roundToTenth(aiScore * weights.aiWeight / 100.0 + *manualScore * weights.manualWeight / 100.0);
}

std::optional<double> ScoreCombiner::overall(const std::map<std::string, double>& indicatorScores,
                                             const std::vector<Indicator>& indicators) {
    double weightedSum = 0.0;
    double weightTotal = 0.0;

    for (const auto& indicator : indicators) {
        auto it = indicatorScores.find(indicator.id);
        if (it == indicatorScores.end()) {
            continue;
        }
        weightedSum += it->second * indicator.weight;
        weightTotal += indicator.weight;
    }

    if (weightTotal <= 0.0) {
        return std::nullopt;
    }
    return roundToTenth(weightedSum / weightTotal);
}

} // namespace assessment
} // namespace panelsense
