#include "emotion/emotion_aggregator.hpp"
#include "utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <unordered_map>

namespace panelsense {
namespace emotion {

EmotionAggregator::EmotionAggregator(std::string sessionId, const utils::AggregatorSettings& settings)
    : sessionId_(std::move(sessionId)), settings_(settings) {
    if (settings_.maxWindowSamples == 0) {
        settings_.maxWindowSamples = 1;
    }
}

const EmotionAggregator::ModalityState& EmotionAggregator::state(Modality modality) const {
    return modality == Modality::FACIAL ? facial_ : voice_;
}

EmotionAggregator::ModalityState& EmotionAggregator::state(Modality modality) {
    return modality == Modality::FACIAL ? facial_ : voice_;
}

std::optional<EmotionSample> EmotionAggregator::record(Modality modality, const std::string& label,
                                                       double confidence, double timestampSeconds) {
    if (label.empty() || !std::isfinite(confidence) || !std::isfinite(timestampSeconds)) {
        utils::Logger::debug("Rejected emotion sample for session " + sessionId_ +
                             " (" + modalityToString(modality) + ")");
        return std::nullopt;
    }

    EmotionSample sample;
    sample.sessionId = sessionId_;
    sample.modality = modality;
    sample.label = label;
    sample.confidence = std::clamp(confidence, 0.0, 1.0);
    sample.timestampSeconds = timestampSeconds;

    std::lock_guard<std::mutex> lock(mutex_);
    ModalityState& s = state(modality);

    if (!s.window.empty() && sample.timestampSeconds < s.window.back().timestampSeconds) {
        sample.timestampSeconds = s.window.back().timestampSeconds;
    }

    log_.push_back(sample);
    s.window.push_back(sample);
    s.total++;
    while (s.window.size() > settings_.maxWindowSamples) {
        s.window.pop_front();
    }

    return sample;
}

EmotionAggregator::WindowStats EmotionAggregator::computeWindow(const ModalityState& s,
                                                                double windowSeconds) const {
    WindowStats stats;
    if (s.window.empty()) {
        return stats;
    }

    const double latest = s.window.back().timestampSeconds;
    const double cutoff = latest - std::max(0.0, windowSeconds);

    std::unordered_map<std::string, size_t> counts;
    // Rank of first appearance when walking backwards; lower is more recent
    std::unordered_map<std::string, size_t> recency;

    for (auto it = s.window.rbegin(); it != s.window.rend(); ++it) {
        if (it->timestampSeconds < cutoff) {
            break;
        }
        counts[it->label]++;
        recency.emplace(it->label, stats.total);
        stats.total++;
    }

    for (const auto& entry : counts) {
        bool better = entry.second > stats.modalCount;
        if (!better && entry.second == stats.modalCount && !stats.modalLabel.empty()) {
            better = recency[entry.first] < recency[stats.modalLabel];
        }
        if (better) {
            stats.modalCount = entry.second;
            stats.modalLabel = entry.first;
        }
    }

    return stats;
}

std::optional<double> EmotionAggregator::stability(Modality modality, double windowSeconds) const {
    std::lock_guard<std::mutex> lock(mutex_);
    WindowStats stats = computeWindow(state(modality), windowSeconds);

    if (stats.total == 0) {
        if (settings_.emptyWindowPolicy == utils::EmptyWindowPolicy::STABLE) {
            return 1.0;
        }
        return std::nullopt;
    }

    return static_cast<double>(stats.modalCount) / static_cast<double>(stats.total);
}

std::optional<double> EmotionAggregator::stability(Modality modality) const {
    return stability(modality, settings_.windowSeconds);
}

std::optional<std::string> EmotionAggregator::dominantLabel(Modality modality, double windowSeconds) const {
    std::lock_guard<std::mutex> lock(mutex_);
    WindowStats stats = computeWindow(state(modality), windowSeconds);
    if (stats.total == 0) {
        return std::nullopt;
    }
    return stats.modalLabel;
}

ModalitySnapshot EmotionAggregator::buildModalitySnapshot(const ModalityState& s) const {
    ModalitySnapshot snap;
    snap.sampleCount = s.total;

    WindowStats stats = computeWindow(s, settings_.windowSeconds);
    if (stats.total == 0) {
        if (settings_.emptyWindowPolicy == utils::EmptyWindowPolicy::STABLE) {
            snap.stability = 1.0;
        }
        return snap;
    }

    const EmotionSample& latest = s.window.back();
    snap.label = latest.label;
    snap.confidence = latest.confidence;
    snap.dominantLabel = stats.modalLabel;
    snap.stability = static_cast<double>(stats.modalCount) / static_cast<double>(stats.total);
    return snap;
}

EmotionSnapshot EmotionAggregator::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    EmotionSnapshot snap;
    snap.facial = buildModalitySnapshot(facial_);
    snap.voice = buildModalitySnapshot(voice_);
    return snap;
}

std::vector<EmotionSample> EmotionAggregator::samples() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return log_;
}

size_t EmotionAggregator::sampleCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return log_.size();
}

size_t EmotionAggregator::sampleCount(Modality modality) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state(modality).total;
}

} // namespace emotion
} // namespace panelsense
