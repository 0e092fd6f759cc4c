#include "emotion/heuristic_facial_detector.hpp"
#include "utils/logging.hpp"

namespace panelsense {
namespace emotion {

namespace {

uint64_t fnv1a(const std::vector<uint8_t>& bytes) {
    uint64_t hash = 1469598103934665603ULL;
    for (uint8_t b : bytes) {
        hash ^= b;
        hash *= 1099511628211ULL;
    }
    return hash;
}

} // namespace

HeuristicFacialEmotionDetector::HeuristicFacialEmotionDetector() {
    utils::Logger::warn("Using heuristic facial emotion detector; no facial model is configured");
}

const std::vector<std::string>& HeuristicFacialEmotionDetector::labels() {
    static const std::vector<std::string> kLabels = {"happy", "neutral", "sad", "angry", "surprise"};
    return kLabels;
}

std::optional<Detection> HeuristicFacialEmotionDetector::detect(const DecodedImage& image) {
    if (image.bytes.size() < kMinFaceBytes) {
        return std::nullopt;
    }

    uint64_t digest = fnv1a(image.bytes);
    const auto& all = labels();

    Detection detection;
    detection.label = all[digest % all.size()];
    // 0.70 .. 0.95 in steps of 0.01
    detection.confidence = 0.70 + static_cast<double>((digest >> 16) % 26) / 100.0;
    return detection;
}

} // namespace emotion
} // namespace panelsense
