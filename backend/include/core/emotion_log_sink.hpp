#pragma once

#include "emotion/emotion_types.hpp"

#include <string>
#include <vector>

namespace panelsense {
namespace core {

/**
 * Durable destination for a session's emotion log, written once at close.
 */
class EmotionLogSink {
public:
    virtual ~EmotionLogSink() = default;

    /**
     * Throws on failure; the session logs the failure and still closes.
     */
    virtual void persist(const std::string& sessionId,
                         const std::vector<emotion::EmotionSample>& samples) = 0;
};

/**
 * Writes <directory>/<sessionId>.json. Samples whose confidence does not
 * exceed minConfidence are left out of the file.
 */
class JsonFileEmotionLogSink : public EmotionLogSink {
public:
    JsonFileEmotionLogSink(std::string directory, double minConfidence);

    void persist(const std::string& sessionId,
                 const std::vector<emotion::EmotionSample>& samples) override;

    std::string pathFor(const std::string& sessionId) const;

private:
    std::string directory_;
    double minConfidence_;
};

} // namespace core
} // namespace panelsense
