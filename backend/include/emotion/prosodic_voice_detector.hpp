#pragma once

#include "emotion/emotion_detector.hpp"

namespace panelsense {
namespace emotion {

/**
 * Arousal / valence reading of one audio window.
 */
struct VoiceAffect {
    double arousal = 0.0;      // -1 (calm) .. 1 (excited)
    double valence = 0.0;      // -1 (negative) .. 1 (positive)
    double confidence = 0.0;   // 0 .. 1, vocal assertiveness
    std::string label;
};

/**
 * Rule-based voice emotion detector over prosodic features.
 * Labels: confident, nervous, excited, calm, tired, neutral.
 */
class ProsodicVoiceEmotionDetector : public VoiceEmotionDetector {
public:
    static constexpr double kMinWindowSeconds = 0.1;

    std::optional<Detection> detect(const AudioWindow& window) override;
    std::string name() const override { return "prosodic-voice"; }

    static VoiceAffect classify(const ProsodicFeatures& features);
};

} // namespace emotion
} // namespace panelsense
