#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace panelsense {
namespace emotion {

/**
 * Image bytes that passed ingress validation
 */
struct DecodedImage {
    std::vector<uint8_t> bytes;
    std::string format;     // "jpeg", "png" or "webp"
};

/**
 * Mono float audio in [-1, 1]
 */
struct AudioWindow {
    std::vector<float> samples;
    int sampleRate = 16000;
    double startSeconds = 0.0;

    double durationSeconds() const {
        return sampleRate > 0 ? static_cast<double>(samples.size()) / sampleRate : 0.0;
    }
};

struct Detection {
    std::string label;
    double confidence = 0.0;
};

/**
 * Facial emotion classifier for a single decoded frame.
 * detect() returns std::nullopt when no face is present and throws
 * DetectorUnavailableException when the underlying model fails.
 */
class FacialEmotionDetector {
public:
    virtual ~FacialEmotionDetector() = default;
    virtual std::optional<Detection> detect(const DecodedImage& image) = 0;
    virtual std::string name() const = 0;
};

/**
 * Voice emotion classifier for one audio window.
 * detect() returns std::nullopt when the window holds no usable speech
 * and throws DetectorUnavailableException when the model fails.
 */
class VoiceEmotionDetector {
public:
    virtual ~VoiceEmotionDetector() = default;
    virtual std::optional<Detection> detect(const AudioWindow& window) = 0;
    virtual std::string name() const = 0;
};

/**
 * Prosodic features extracted from audio for emotion detection
 */
struct ProsodicFeatures {
    float pitch_mean = 0.0f;        // Average fundamental frequency (Hz)
    float pitch_std = 0.0f;         // Pitch variation
    float energy_mean = 0.0f;       // RMS energy
    float energy_std = 0.0f;        // Frame energy variation
    float speaking_rate = 0.0f;     // Words per minute estimate
    size_t voiced_frames = 0;
};

/**
 * Prosodic feature extractor for voice emotion detection
 */
class ProsodicFeatureExtractor {
public:
    explicit ProsodicFeatureExtractor(int sample_rate = 16000);
    ~ProsodicFeatureExtractor();

    ProsodicFeatures extractFeatures(const std::vector<float>& audio_data) const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace emotion
} // namespace panelsense
