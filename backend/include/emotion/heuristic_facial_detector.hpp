#pragma once

#include "emotion/emotion_detector.hpp"

namespace panelsense {
namespace emotion {

/**
 * Deterministic stand-in for the external facial model. The label and
 * confidence are derived from a digest of the frame bytes, so the same
 * frame always yields the same detection. Frames too small to hold a
 * face yield no detection.
 */
class HeuristicFacialEmotionDetector : public FacialEmotionDetector {
public:
    static constexpr size_t kMinFaceBytes = 64;

    HeuristicFacialEmotionDetector();

    std::optional<Detection> detect(const DecodedImage& image) override;
    std::string name() const override { return "heuristic-facial"; }

    static const std::vector<std::string>& labels();
};

} // namespace emotion
} // namespace panelsense
