#pragma once

#include "emotion/emotion_types.hpp"
#include "utils/config.hpp"

#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace panelsense {
namespace emotion {

/**
 * Per-session rolling emotion state.
 *
 * Keeps an append-only log of every accepted sample plus a bounded
 * per-modality window used for stability. Stability over a window is
 * the share of samples carrying the modal label; the window is anchored
 * on the modality's latest sample so a quiet detector keeps its last
 * known stability instead of decaying.
 *
 * Thread-safe: record() is called from detector workers while snapshot()
 * is called from the network thread.
 */
class EmotionAggregator {
public:
    explicit EmotionAggregator(std::string sessionId,
                               const utils::AggregatorSettings& settings = utils::AggregatorSettings());

    EmotionAggregator(const EmotionAggregator&) = delete;
    EmotionAggregator& operator=(const EmotionAggregator&) = delete;

    /**
     * Append one sample. Confidence is clamped to [0,1]; a timestamp
     * earlier than the modality's latest sample is raised to it so the
     * per-modality order is preserved.
     * Returns the stored sample, or std::nullopt when the input is
     * rejected (empty label or non-finite confidence/timestamp).
     */
    std::optional<EmotionSample> record(Modality modality, const std::string& label,
                                        double confidence, double timestampSeconds);

    std::optional<double> stability(Modality modality, double windowSeconds) const;
    std::optional<double> stability(Modality modality) const;

    // Modal label of the current window; ties go to the most recent label
    std::optional<std::string> dominantLabel(Modality modality, double windowSeconds) const;

    EmotionSnapshot snapshot() const;

    std::vector<EmotionSample> samples() const;
    size_t sampleCount() const;
    size_t sampleCount(Modality modality) const;

    const std::string& getSessionId() const { return sessionId_; }
    const utils::AggregatorSettings& getSettings() const { return settings_; }

private:
    struct ModalityState {
        std::deque<EmotionSample> window;
        size_t total = 0;
    };

    struct WindowStats {
        size_t total = 0;
        size_t modalCount = 0;
        std::string modalLabel;
    };

    const ModalityState& state(Modality modality) const;
    ModalityState& state(Modality modality);
    WindowStats computeWindow(const ModalityState& state, double windowSeconds) const;
    ModalitySnapshot buildModalitySnapshot(const ModalityState& state) const;

    std::string sessionId_;
    utils::AggregatorSettings settings_;

    mutable std::mutex mutex_;
    std::vector<EmotionSample> log_;
    ModalityState facial_;
    ModalityState voice_;
};

} // namespace emotion
} // namespace panelsense
