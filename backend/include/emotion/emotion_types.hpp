#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace panelsense {
namespace emotion {

/**
 * Detection channel
 */
enum class Modality {
    FACIAL,
    VOICE
};

/**
 * One accepted detection. Immutable once recorded.
 */
struct EmotionSample {
    std::string sessionId;
    double timestampSeconds = 0.0;
    Modality modality = Modality::FACIAL;
    std::string label;
    double confidence = 0.0;    // always within [0,1]
};

/**
 * Live view of one modality.
 *  - label/confidence: the latest sample, not an average
 *  - dominantLabel/stability: consistency over the rolling window
 */
struct ModalitySnapshot {
    std::optional<std::string> label;
    std::optional<std::string> dominantLabel;
    std::optional<double> confidence;
    std::optional<double> stability;
    size_t sampleCount = 0;
};

struct EmotionSnapshot {
    ModalitySnapshot facial;
    ModalitySnapshot voice;
};

std::string modalityToString(Modality modality);
std::optional<Modality> modalityFromString(const std::string& name);

} // namespace emotion
} // namespace panelsense
