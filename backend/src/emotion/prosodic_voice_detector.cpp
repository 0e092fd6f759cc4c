#include "emotion/prosodic_voice_detector.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace panelsense {
namespace emotion {

class ProsodicFeatureExtractor::Impl {
public:
    explicit Impl(int sample_rate) : sample_rate_(sample_rate) {}

    ProsodicFeatures extractFeatures(const std::vector<float>& audio_data) const {
        ProsodicFeatures features;

        if (audio_data.empty()) {
            return features;
        }

        features.energy_mean = calculateRMSEnergy(audio_data.data(), audio_data.size());

        auto frame_energies = frameEnergies(audio_data);
        features.energy_std = calculateStdDev(frame_energies);

        auto pitch_values = estimatePitch(audio_data);
        features.voiced_frames = pitch_values.size();
        if (!pitch_values.empty()) {
            features.pitch_mean = calculateMean(pitch_values);
            features.pitch_std = calculateStdDev(pitch_values);
        }

        features.speaking_rate = estimateSpeakingRate(frame_energies, audio_data.size());
        return features;
    }

private:
    static constexpr size_t kEnergyFrame = 512;
    static constexpr size_t kPitchFrame = 1024;
    static constexpr size_t kPitchHop = 512;
    static constexpr float kSilenceRms = 0.01f;
    static constexpr float kMinVoicing = 0.3f;

    int sample_rate_;

    static float calculateRMSEnergy(const float* data, size_t size) {
        if (size == 0) {
            return 0.0f;
        }
        float sum_squares = 0.0f;
        for (size_t i = 0; i < size; ++i) {
            sum_squares += data[i] * data[i];
        }
        return std::sqrt(sum_squares / size);
    }

    static float calculateMean(const std::vector<float>& values) {
        if (values.empty()) {
            return 0.0f;
        }
        return std::accumulate(values.begin(), values.end(), 0.0f) / values.size();
    }

    static float calculateStdDev(const std::vector<float>& values) {
        if (values.size() < 2) {
            return 0.0f;
        }
        float mean = calculateMean(values);
        float sq = 0.0f;
        for (float v : values) {
            sq += (v - mean) * (v - mean);
        }
        return std::sqrt(sq / values.size());
    }

    static std::vector<float> frameEnergies(const std::vector<float>& audio_data) {
        std::vector<float> energies;
        for (size_t i = 0; i < audio_data.size(); i += kEnergyFrame) {
            size_t len = std::min(kEnergyFrame, audio_data.size() - i);
            energies.push_back(calculateRMSEnergy(audio_data.data() + i, len));
        }
        return energies;
    }

    std::vector<float> estimatePitch(const std::vector<float>& audio_data) const {
        std::vector<float> pitch_values;
        if (audio_data.size() < kPitchFrame) {
            float pitch = estimateFramePitch(audio_data.data(), audio_data.size());
            if (pitch > 0.0f) {
                pitch_values.push_back(pitch);
            }
            return pitch_values;
        }

        for (size_t i = 0; i + kPitchFrame <= audio_data.size(); i += kPitchHop) {
            float pitch = estimateFramePitch(audio_data.data() + i, kPitchFrame);
            if (pitch > 0.0f) {
                pitch_values.push_back(pitch);
            }
        }
        return pitch_values;
    }

    // Normalized autocorrelation over the 80-500 Hz period range.
    // Returns 0 for silent or unvoiced frames.
    float estimateFramePitch(const float* frame, size_t size) const {
        if (calculateRMSEnergy(frame, size) < kSilenceRms) {
            return 0.0f;
        }

        const int min_period = sample_rate_ / 500;
        const int max_period = sample_rate_ / 80;

        float energy = 0.0f;
        for (size_t i = 0; i < size; ++i) {
            energy += frame[i] * frame[i];
        }

        float max_correlation = 0.0f;
        int best_period = 0;

        for (int period = std::max(1, min_period);
             period < max_period && period < static_cast<int>(size) / 2; ++period) {
            float correlation = 0.0f;
            for (size_t i = 0; i + period < size; ++i) {
                correlation += frame[i] * frame[i + period];
            }
            correlation /= energy;

            if (correlation > max_correlation) {
                max_correlation = correlation;
                best_period = period;
            }
        }

        if (best_period == 0 || max_correlation < kMinVoicing) {
            return 0.0f;
        }
        return static_cast<float>(sample_rate_) / best_period;
    }

    float estimateSpeakingRate(const std::vector<float>& frame_energies, size_t sample_count) const {
        if (frame_energies.size() < 3 || sample_rate_ <= 0) {
            return 0.0f;
        }

        // Energy peaks approximate syllables
        int peak_count = 0;
        float threshold = calculateMean(frame_energies) * 0.7f;

        for (size_t i = 1; i + 1 < frame_energies.size(); ++i) {
            if (frame_energies[i] > threshold &&
                frame_energies[i] > frame_energies[i - 1] &&
                frame_energies[i] > frame_energies[i + 1]) {
                peak_count++;
            }
        }

        float duration_seconds = static_cast<float>(sample_count) / sample_rate_;
        float syllables_per_second = peak_count / duration_seconds;

        // ~2.5 syllables per word
        return syllables_per_second * 60.0f / 2.5f;
    }
};

ProsodicFeatureExtractor::ProsodicFeatureExtractor(int sample_rate)
    : impl_(std::make_unique<Impl>(sample_rate)) {
}

ProsodicFeatureExtractor::~ProsodicFeatureExtractor() = default;

ProsodicFeatures ProsodicFeatureExtractor::extractFeatures(const std::vector<float>& audio_data) const {
    return impl_->extractFeatures(audio_data);
}

VoiceAffect ProsodicVoiceEmotionDetector::classify(const ProsodicFeatures& features) {
    // Normalized around typical conversational speech
    const double pitch_norm = (features.pitch_mean - 150.0) / 100.0;
    const double pitch_var_norm = features.pitch_std / 30.0;
    const double energy_norm = features.energy_mean / 0.05;
    const double tempo_norm = (features.speaking_rate - 120.0) / 30.0;

    const double steadiness = 1.0 - std::min(pitch_var_norm, 1.0);

    VoiceAffect affect;
    affect.arousal = std::clamp(0.4 * pitch_norm + 0.3 * energy_norm + 0.3 * tempo_norm, -1.0, 1.0);
    affect.valence = std::clamp(0.5 * steadiness + 0.3 * std::min(energy_norm, 1.0) - 0.2 * std::abs(pitch_norm),
                                -1.0, 1.0);
    affect.confidence = std::clamp(0.5 * std::min(energy_norm, 1.0) + 0.3 * steadiness +
                                   0.2 * (1.0 - std::abs(tempo_norm)),
                                   0.0, 1.0);

    if (affect.arousal > 0.3 && affect.valence > 0.2) {
        affect.label = "confident";
    } else if (affect.arousal > 0.5 && affect.valence < 0.0) {
        affect.label = "nervous";
    } else if (affect.arousal > 0.5 && affect.valence > 0.0) {
        affect.label = "excited";
    } else if (affect.arousal < -0.3) {
        affect.label = affect.valence > 0.0 ? "calm" : "tired";
    } else {
        affect.label = "neutral";
    }

    return affect;
}

std::optional<Detection> ProsodicVoiceEmotionDetector::detect(const AudioWindow& window) {
    if (window.sampleRate <= 0) {
        throw utils::DetectorUnavailableException("Invalid sample rate " + std::to_string(window.sampleRate),
                                                  name());
    }
    if (window.durationSeconds() < kMinWindowSeconds) {
        return std::nullopt;
    }

    ProsodicFeatureExtractor extractor(window.sampleRate);
    ProsodicFeatures features = extractor.extractFeatures(window.samples);
    if (features.voiced_frames == 0) {
        return std::nullopt;
    }

    VoiceAffect affect = classify(features);
    utils::Logger::debug("Voice affect " + affect.label + " arousal=" + std::to_string(affect.arousal) +
                         " valence=" + std::to_string(affect.valence));

    Detection detection;
    detection.label = affect.label;
    detection.confidence = affect.confidence;
    return detection;
}

} // namespace emotion
} // namespace panelsense
