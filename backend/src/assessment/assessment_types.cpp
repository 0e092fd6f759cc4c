#include "assessment/assessment_types.hpp"
#include "utils/error_handler.hpp"

#include <cmath>
#include <unordered_set>

namespace panelsense {
namespace assessment {

const char* const kNoEvidenceSentinel = "no specific evidence found in the transcript";

std::string formatEvidence(const std::vector<EvidenceSpan>& spans, const std::string& separator) {
    if (spans.empty()) {
        return kNoEvidenceSentinel;
    }

    std::string joined;
    for (size_t i = 0; i < spans.size(); ++i) {
        if (i > 0) {
            joined += separator;
        }
        joined += spans[i].text;
    }
    return joined;
}

void validateIndicators(const std::vector<Indicator>& indicators) {
    std::unordered_set<std::string> seen;
    for (const auto& indicator : indicators) {
        if (indicator.id.empty()) {
            throw utils::ConfigurationException("Indicator id must not be empty", indicator.name);
        }
        if (!std::isfinite(indicator.weight) || indicator.weight <= 0.0) {
            throw utils::ConfigurationException("Indicator weight must be greater than 0",
                                                indicator.id + " weight=" + std::to_string(indicator.weight));
        }
        if (!seen.insert(indicator.id).second) {
            throw utils::ConfigurationException("Duplicate indicator id", indicator.id);
        }
    }
}

} // namespace assessment
} // namespace panelsense
