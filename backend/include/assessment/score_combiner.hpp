#pragma once

#include "assessment/assessment_types.hpp"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace panelsense {
namespace assessment {

/**
 * Blend of AI and manual scores, in percent. Both >= 0, sum == 100.
 */
struct ScoringWeights {
    double aiWeight = 60.0;
    double manualWeight = 40.0;

    // Throws ConfigurationException
    void validate() const;
};

/**
 * Holder of the process-wide weights. Readers always observe a whole
 * pair; an update swaps the pair atomically or not at all.
 */
class ScoringWeightsProvider {
public:
    explicit ScoringWeightsProvider(const ScoringWeights& initial = ScoringWeights());

    ScoringWeights current() const;

    /**
     * Replace the pair. Throws ConfigurationException and keeps the
     * previous weights when the new pair is invalid.
     */
    void update(const ScoringWeights& weights);

private:
    std::shared_ptr<const ScoringWeights> weights_;
};

class ScoreCombiner {
public:
    /**
     * Manual scores that are absent or <= 0 count as not entered and the
     * AI score is returned unchanged. Otherwise the weighted blend,
     * rounded to one decimal.
     */
    static double combine(double aiScore, std::optional<double> manualScore, const ScoringWeights& weights);

    /**
     * Indicator-weighted mean of the available scores. Indicators without
     * a score are left out of both sums; no scored indicator gives
     * std::nullopt.
     */
    static std::optional<double> overall(const std::map<std::string, double>& indicatorScores,
                                         const std::vector<Indicator>& indicators);

    static double roundToTenth(double value);
};

} // namespace assessment
} // namespace panelsense
